#pragma once

#include <date/date.h>

#include <chrono>
#include <optional>
#include <sstream>
#include <string>

#include "core/route_types.hpp"

namespace time_utils
{

inline date::sys_seconds toSysSeconds(Timestamp t) { return date::sys_seconds{std::chrono::seconds{t}}; }

inline Timestamp toTimestamp(date::sys_seconds tp) { return tp.time_since_epoch().count(); }

namespace detail
{

template <typename TimePoint>
bool parseExact(std::string const& text, char const* format, TimePoint& tp)
{
    std::istringstream in(text);
    in >> date::parse(format, tp);
    return !in.fail() && in.peek() == std::char_traits<char>::eof();
}

}  // namespace detail

// "YYYY-MM-DD" with two-digit month and day.
inline std::optional<date::sys_days> parseIsoDate(std::string const& text)
{
    if (text.size() != 10 || text[4] != '-' || text[7] != '-')
        return std::nullopt;
    date::sys_days day;
    if (!detail::parseExact(text, "%Y-%m-%d", day))
        return std::nullopt;
    return day;
}

// "YYYY-MM-DDTHH:MM[:SS][Z|+HH:MM|-HH:MM]". A timestamp without a zone designator is local time at
// default_offset_minutes east of UTC.
inline std::optional<Timestamp> parseIsoDateTime(std::string const& text, int default_offset_minutes)
{
    if (text.size() < 16 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') ||
        text[13] != ':')
        return std::nullopt;

    std::string normalized = text;
    normalized[10] = 'T';
    const bool has_seconds = normalized.size() >= 19 && normalized[16] == ':';
    const size_t clock_end = has_seconds ? 19 : 16;
    std::string clock = normalized.substr(0, clock_end);
    std::string zone = normalized.substr(clock_end);
    std::string format = has_seconds ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H:%M";

    if (zone.empty() || zone == "Z")
    {
        date::local_seconds local;
        if (!detail::parseExact(clock, format.c_str(), local))
            return std::nullopt;
        std::chrono::minutes offset{zone.empty() ? default_offset_minutes : 0};
        return toTimestamp(date::sys_seconds{local.time_since_epoch() - offset});
    }

    if (zone[0] != '+' && zone[0] != '-')
        return std::nullopt;

    // sys_time parsing applies the %Ez offset.
    date::sys_seconds utc;
    if (!detail::parseExact(normalized, (format + "%Ez").c_str(), utc))
        return std::nullopt;
    return toTimestamp(utc);
}

// Local calendar day at offset_minutes east of UTC, as an absolute half-open window.
inline TimeWindow localDayWindow(date::sys_days day, int offset_minutes)
{
    date::sys_seconds begin = date::sys_seconds{day} - std::chrono::minutes{offset_minutes};
    return TimeWindow{toTimestamp(begin), toTimestamp(begin + date::days{1})};
}

inline std::string formatIsoUtc(Timestamp t) { return date::format("%Y-%m-%dT%H:%M:%SZ", toSysSeconds(t)); }

}  // namespace time_utils
