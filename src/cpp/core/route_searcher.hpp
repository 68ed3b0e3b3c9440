#pragma once
#include <vector>

#include "app/spdlog_tmp.hpp"
#include "core/errors.hpp"
#include "core/flight_graph.hpp"
#include "core/route.hpp"
#include "core/search_query.hpp"

// Enumerates every feasible route with at most one transfer. Depth is fixed at two legs, so instead of a
// priority-queue relaxation the search is two layered passes: direct flights, then connections through
// each airport reachable by a first leg.
class RouteSearcher
{
    SearchConfig config_;

    size_t num_direct_{};
    size_t num_connecting_{};
    size_t num_first_legs_{};

    void directPass_(FlightGraph const& graph, SearchQuery const& query, std::vector<Route>& routes)
    {
        for (Flight const& flight : firstLegs_(graph, query))
        {
            if (flight.destination != query.destination)
                continue;
            routes.emplace_back(flight);
            ++num_direct_;
        }
    }

    void connectingPass_(FlightGraph const& graph, SearchQuery const& query, std::vector<Route>& routes)
    {
        for (Flight const& first : firstLegs_(graph, query))
        {
            AirportCode const& transfer = first.destination;
            if (transfer == query.origin || transfer == query.destination)
                continue;
            ++num_first_legs_;

            auto candidates = graph.departures(
                transfer, first.arrival + config_.minConnection(), first.arrival + config_.maxConnection());
            for (Flight const& second : candidates)
            {
                if (second.destination != query.destination)
                    continue;
                if (second.id == first.id)
                    continue;
                routes.emplace_back(first, second);
                ++num_connecting_;
            }
        }
    }

    FlightGraph::Range firstLegs_(FlightGraph const& graph, SearchQuery const& query) const
    {
        // The window is half-open, the graph range is closed.
        return graph.departures(query.origin, query.departure_window.begin, query.departure_window.end - 1);
    }

    void checkAirports_(FlightGraph const& graph, SearchQuery const& query) const
    {
        for (auto const* code : {&query.origin, &query.destination})
        {
            if (!graph.contains(*code))
            {
                logger_->error("Airport {} has no flights in the searched window", *code);
                throw UnknownAirport("Unknown airport: " + *code);
            }
        }
    }

   public:
    RouteSearcher() = default;
    explicit RouteSearcher(SearchConfig const& config) : config_(config) { config_.validate(); }

    void clear()
    {
        num_direct_ = 0;
        num_connecting_ = 0;
        num_first_legs_ = 0;
    }

    std::vector<Route> search(FlightGraph const& graph, SearchQuery const& query)
    {
        clear();
        if (query.origin == query.destination)
            throw InvalidQuery("Origin and destination must differ: " + query.origin);
        checkAirports_(graph, query);

        std::vector<Route> routes;
        directPass_(graph, query, routes);
        connectingPass_(graph, query, routes);

        logger_->debug("{} -> {}: {} direct, {} connecting via {} first legs",
                       query.origin,
                       query.destination,
                       num_direct_,
                       num_connecting_,
                       num_first_legs_);
        return routes;
    }

    size_t numDirect() const { return num_direct_; }
    size_t numConnecting() const { return num_connecting_; }
};
