#pragma once

#include <vector>

#include "core/flight.hpp"
#include "core/route_types.hpp"

// One or two legs from origin to destination. Legs are copies of the catalog snapshot, so a route
// outlives the index it was found in.
class Route
{
   public:
    std::vector<Flight> legs;

    Route() = default;
    explicit Route(Flight const& direct) : legs{direct} {}
    Route(Flight const& first, Flight const& second) : legs{first, second} {}

    Money totalPrice() const
    {
        Money total;
        for (auto const& leg : legs)
            total += leg.price;
        return total;
    }

    Seconds totalDuration() const { return legs.back().arrival - legs.front().departure; }
    int transferCount() const { return static_cast<int>(legs.size()) - 1; }
    Timestamp departure() const { return legs.front().departure; }

    // Only meaningful when transferCount() == 1.
    Seconds layover() const { return legs.size() < 2 ? 0 : legs[1].departure - legs[0].arrival; }

    AirportCode const& transferAirport() const { return legs.front().destination; }

    FlightIdList legIds() const
    {
        FlightIdList ids;
        ids.reserve(legs.size());
        for (auto const& leg : legs)
            ids.push_back(leg.id);
        return ids;
    }

    bool sameLegs(Route const& other) const
    {
        if (legs.size() != other.legs.size())
            return false;
        for (size_t i = 0; i < legs.size(); ++i)
        {
            if (legs[i].id != other.legs[i].id)
                return false;
        }
        return true;
    }

    bool operator==(Route const& other) const { return sameLegs(other); }
    bool operator!=(Route const& other) const { return !sameLegs(other); }
};

struct RoutePage
{
    std::vector<Route> routes;
    size_t total_count{};
};
