#pragma once

#include <string>
#include <vector>

#include "core/flight.hpp"
#include "core/flight_catalog.hpp"
#include "core/money.hpp"
#include "core/search_query.hpp"
#include "core/time_utils.hpp"

namespace fixtures
{

// "HH:MM" on 2024-05-01 UTC, or "+N HH:MM" for N days later.
inline Timestamp at(std::string const& hhmm)
{
    date::sys_days day = date::year{2024} / date::May / 1;
    std::string clock = hhmm;
    if (clock[0] == '+')
    {
        size_t space = clock.find(' ');
        day += date::days{std::stoi(clock.substr(1, space - 1))};
        clock = clock.substr(space + 1);
    }
    date::sys_seconds t = date::sys_seconds{day} + std::chrono::hours{std::stoi(clock.substr(0, 2))} +
                          std::chrono::minutes{std::stoi(clock.substr(3, 2))};
    return time_utils::toTimestamp(t);
}

inline Flight flight(std::string const& id,
                     std::string const& origin,
                     std::string const& destination,
                     std::string const& departure,
                     std::string const& arrival,
                     std::string const& price = "100.00")
{
    Flight f;
    f.id = id;
    f.origin = origin;
    f.destination = destination;
    f.departure = at(departure);
    f.arrival = at(arrival);
    f.price = Money::fromString(price);
    return f;
}

inline TimeWindow may1() { return time_utils::localDayWindow(date::year{2024} / date::May / 1, 0); }

inline SearchQuery query(std::string const& origin,
                         std::string const& destination,
                         RankCriterion criterion = RankCriterion::Price,
                         int limit = 20,
                         int offset = 0)
{
    SearchQuery q;
    q.origin = origin;
    q.destination = destination;
    q.departure_window = may1();
    q.criterion = criterion;
    q.limit = limit;
    q.offset = offset;
    return q;
}

inline SearchConfig config(int min_minutes = 30, int max_minutes = 720)
{
    SearchConfig c;
    c.min_connection_minutes = min_minutes;
    c.max_connection_minutes = max_minutes;
    return c;
}

inline FlightCatalog catalog(std::vector<Flight> flights)
{
    FlightCatalog c;
    c.flights = std::move(flights);
    return c;
}

}  // namespace fixtures
