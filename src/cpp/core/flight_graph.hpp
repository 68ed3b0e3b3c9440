#pragma once
#include <algorithm>
#include <unordered_map>
#include <vector>

#include "app/spdlog_tmp.hpp"
#include "core/errors.hpp"
#include "core/flight.hpp"
#include "core/route_types.hpp"

using FlightList = std::vector<Flight>;

// Read-only adjacency index over one request's flight snapshot: airport -> departures ordered by
// (departure, id).
class FlightGraph
{
   public:
    using const_iterator = FlightList::const_iterator;

    struct Range
    {
        const_iterator first;
        const_iterator last;

        const_iterator begin() const { return first; }
        const_iterator end() const { return last; }
        bool empty() const { return first == last; }
        size_t size() const { return static_cast<size_t>(last - first); }
    };

    const TimeWindow window;

    FlightGraph(FlightList const& flights, TimeWindow window) : window(window)
    {
        validateFlights_(flights);
        initDepartures_(flights);
        sortDepartures_();
        logger_->debug("Indexed {} of {} flights over {} airports", num_flights_, flights.size(), known_airports_.size());
    }

    bool contains(AirportCode const& airport) const { return known_airports_.count(airport) != 0; }

    // All indexed departures from the airport; empty for an airport without outgoing flights.
    Range departures(AirportCode const& airport) const
    {
        auto it = departures_.find(airport);
        if (it == departures_.end())
            return Range{empty_.end(), empty_.end()};
        return Range{it->second.begin(), it->second.end()};
    }

    // Departures from the airport with t_min <= departure <= t_max.
    Range departures(AirportCode const& airport, Timestamp t_min, Timestamp t_max) const
    {
        auto it = departures_.find(airport);
        if (it == departures_.end() || t_max < t_min)
            return Range{empty_.end(), empty_.end()};

        auto const& schedule = it->second;
        auto lower = std::lower_bound(schedule.begin(),
                                      schedule.end(),
                                      t_min,
                                      [](Flight const& f, Timestamp t) { return f.departure < t; });
        auto upper = std::upper_bound(
            lower, schedule.end(), t_max, [](Timestamp t, Flight const& f) { return t < f.departure; });
        return Range{lower, upper};
    }

    size_t numFlights() const { return num_flights_; }
    size_t numAirports() const { return known_airports_.size(); }

   private:
    std::unordered_map<AirportCode, FlightList> departures_{};
    std::unordered_set<AirportCode> known_airports_{};
    FlightList empty_{};
    size_t num_flights_{};

    void validateFlights_(FlightList const& flights)
    {
        FlightIdSet seen;
        for (auto const& flight : flights)
        {
            if (flight.id.empty())
            {
                logger_->error("Flight with empty identifier in snapshot");
                throw InvalidInput("Flight identifier must not be empty");
            }
            if (!seen.insert(flight.id).second)
            {
                logger_->error("Flight {} appears more than once in the snapshot", flight.id);
                throw InvalidInput("Duplicate flight identifier: " + flight.id);
            }
            if (flight.origin.empty() || flight.destination.empty())
            {
                logger_->error("Flight {} has an empty airport code", flight.id);
                throw InvalidInput("Flight " + flight.id + " has an empty airport code");
            }
            if (flight.arrival <= flight.departure)
            {
                logger_->error("Flight {} arrives at {} before departing at {}", flight.id, flight.arrival, flight.departure);
                throw InvalidInput("Flight " + flight.id + " must arrive strictly after departure");
            }
            if (flight.price.isNegative())
            {
                logger_->error("Flight {} has negative price {}", flight.id, flight.price.toString());
                throw InvalidInput("Flight " + flight.id + " has a negative price");
            }
        }
    }

    void initDepartures_(FlightList const& flights)
    {
        for (auto const& flight : flights)
        {
            if (!flight.isSearchable() || !window.contains(flight.departure))
                continue;

            departures_[flight.origin].push_back(flight);
            known_airports_.insert(flight.origin);
            known_airports_.insert(flight.destination);
            ++num_flights_;
        }
    }

    void sortDepartures_()
    {
        for (auto& [_, schedule] : departures_)
        {
            std::sort(schedule.begin(),
                      schedule.end(),
                      [](Flight const& f1, Flight const& f2)
                      {
                          if (f1.departure != f2.departure)
                              return f1.departure < f2.departure;
                          return f1.id < f2.id;
                      });
        }
    }
};
