#pragma once

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

using FlightId = std::string;
using AirportCode = std::string;
using FlightIdList = std::vector<FlightId>;
using FlightIdSet = std::unordered_set<FlightId>;

// Seconds since the Unix epoch, UTC.
using Timestamp = std::int64_t;
using Seconds = std::int64_t;

constexpr Seconds SECONDS_PER_MINUTE = 60;
constexpr Seconds SECONDS_PER_DAY = 24 * 60 * 60;

// Half-open interval [begin, end).
struct TimeWindow
{
    Timestamp begin{};
    Timestamp end{};

    bool contains(Timestamp t) const { return begin <= t && t < end; }
};
