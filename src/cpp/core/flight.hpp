#pragma once

#include <string>

#include "core/money.hpp"
#include "core/route_types.hpp"

enum class FlightStatus
{
    Scheduled,
    Completed,
    Cancelled
};

inline std::string toString(FlightStatus status)
{
    switch (status)
    {
        case FlightStatus::Scheduled:
            return "scheduled";
        case FlightStatus::Completed:
            return "completed";
        case FlightStatus::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

struct Airport
{
    AirportCode code;
    std::string name;
    std::string closest_big_city;
    int utc_offset_minutes{};
};

struct Flight
{
    FlightId id;
    AirportCode origin;
    AirportCode destination;
    Timestamp departure{};
    Timestamp arrival{};
    Money price{};
    bool bookable{true};
    FlightStatus status{FlightStatus::Scheduled};

    bool isSearchable() const { return status == FlightStatus::Scheduled && bookable; }
    Seconds duration() const { return arrival - departure; }
};
