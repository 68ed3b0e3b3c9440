#pragma once

#include <string>

#include "app/spdlog_tmp.hpp"
#include "core/errors.hpp"
#include "core/route_types.hpp"

enum class RankCriterion
{
    Price,
    Duration
};

inline std::string toString(RankCriterion criterion)
{
    return criterion == RankCriterion::Price ? "price" : "duration";
}

// Connection constraints. Passed into every search explicitly.
struct SearchConfig
{
    int min_connection_minutes{45};
    int max_connection_minutes{720};

    Seconds minConnection() const { return static_cast<Seconds>(min_connection_minutes) * SECONDS_PER_MINUTE; }
    Seconds maxConnection() const { return static_cast<Seconds>(max_connection_minutes) * SECONDS_PER_MINUTE; }

    void validate() const
    {
        if (min_connection_minutes < 0 || max_connection_minutes < min_connection_minutes)
        {
            logger_->error("Invalid connection window [{}, {}] minutes", min_connection_minutes, max_connection_minutes);
            throw InvalidInput("Connection window must satisfy 0 <= min <= max");
        }
    }
};

struct SearchQuery
{
    AirportCode origin;
    AirportCode destination;
    TimeWindow departure_window;
    RankCriterion criterion{RankCriterion::Price};
    int limit{20};
    int offset{0};

    void validate() const
    {
        if (origin.empty() || destination.empty())
            throw InvalidQuery("Origin and destination airport codes are required");
        if (origin == destination)
            throw InvalidQuery("Origin and destination must differ: " + origin);
        if (departure_window.end <= departure_window.begin)
            throw InvalidQuery("Departure window is empty");
        if (limit <= 0)
            throw InvalidQuery("Limit must be positive, got " + std::to_string(limit));
        if (offset < 0)
            throw InvalidQuery("Offset must be non-negative, got " + std::to_string(offset));
    }
};
