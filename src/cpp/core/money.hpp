#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

#include "core/errors.hpp"

// Fixed-point amount in minor units (two decimal places). Prices never pass through floating point.
class Money
{
   public:
    static constexpr size_t SCALE_DIGITS = 2;
    static constexpr std::int64_t SCALE = 100;

    Money() = default;

    // Accepts "12", "12.5", "12.50", "-3.25". More than two fractional digits are accepted only when
    // the extra digits are zeros, so a value is never rounded silently.
    static Money fromString(std::string const& text)
    {
        if (text.empty())
            throw InvalidInput("Empty monetary amount");

        size_t pos = 0;
        bool negative = false;
        if (text[pos] == '-' || text[pos] == '+')
        {
            negative = text[pos] == '-';
            ++pos;
        }

        std::int64_t whole = 0;
        size_t int_digits = 0;
        for (; pos < text.size() && text[pos] >= '0' && text[pos] <= '9'; ++pos, ++int_digits)
        {
            if (whole > (std::numeric_limits<std::int64_t>::max() / SCALE - 10) / 10)
                throw InvalidInput("Monetary amount out of range: " + text);
            whole = whole * 10 + (text[pos] - '0');
        }

        std::int64_t fraction = 0;
        size_t frac_digits = 0;
        if (pos < text.size() && text[pos] == '.')
        {
            ++pos;
            for (; pos < text.size() && text[pos] >= '0' && text[pos] <= '9'; ++pos, ++frac_digits)
            {
                int digit = text[pos] - '0';
                if (frac_digits < SCALE_DIGITS)
                    fraction = fraction * 10 + digit;
                else if (digit != 0)
                    throw InvalidInput("Monetary amount has more than two decimal places: " + text);
            }
        }

        if (pos != text.size() || (int_digits == 0 && frac_digits == 0))
            throw InvalidInput("Malformed monetary amount: " + text);

        for (size_t i = frac_digits; i < SCALE_DIGITS; ++i)
            fraction *= 10;

        std::int64_t minor = whole * SCALE + fraction;
        return Money(negative ? -minor : minor);
    }

    std::int64_t minorUnits() const { return minor_; }
    bool isNegative() const { return minor_ < 0; }

    std::string toString() const
    {
        std::int64_t abs_minor = minor_ < 0 ? -minor_ : minor_;
        std::string fraction = std::to_string(abs_minor % SCALE);
        if (fraction.size() < SCALE_DIGITS)
            fraction.insert(0, SCALE_DIGITS - fraction.size(), '0');
        return (minor_ < 0 ? "-" : "") + std::to_string(abs_minor / SCALE) + "." + fraction;
    }

    Money operator+(Money const& other) const { return Money(minor_ + other.minor_); }
    Money& operator+=(Money const& other)
    {
        minor_ += other.minor_;
        return *this;
    }

    bool operator==(Money const& other) const { return minor_ == other.minor_; }
    bool operator!=(Money const& other) const { return minor_ != other.minor_; }
    bool operator<(Money const& other) const { return minor_ < other.minor_; }

   private:
    explicit Money(std::int64_t minor) : minor_(minor) {}

    std::int64_t minor_{};
};
