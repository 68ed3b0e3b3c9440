#pragma once
#include <optional>
#include <vector>

#include "core/flight.hpp"
#include "core/route_types.hpp"

// Source of flight snapshots for a search. Implementations may block (database, cache); the search
// core only requires that a returned snapshot be internally consistent.
class FlightCatalogReader
{
   public:
    virtual ~FlightCatalogReader() = default;

    // Flights departing within the window. Implementations should already drop cancelled and
    // unbookable flights, but the core filters again.
    virtual std::vector<Flight> loadCandidateFlights(TimeWindow const& window) const = 0;
};

class FlightCatalog : public FlightCatalogReader
{
   public:
    std::vector<Airport> airports;
    std::vector<Flight> flights;

    std::vector<Flight> loadCandidateFlights(TimeWindow const& window) const override
    {
        std::vector<Flight> result;
        for (auto const& flight : flights)
        {
            if (flight.isSearchable() && window.contains(flight.departure))
                result.push_back(flight);
        }
        return result;
    }

    std::optional<Airport> findAirport(AirportCode const& code) const
    {
        for (auto const& airport : airports)
        {
            if (airport.code == code)
                return airport;
        }
        return std::nullopt;
    }
};
