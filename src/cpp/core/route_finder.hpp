#pragma once
#include <algorithm>
#include <utility>
#include <vector>

#include "app/spdlog_tmp.hpp"
#include "core/flight_catalog.hpp"
#include "core/flight_graph.hpp"
#include "core/route.hpp"
#include "core/route_ranker.hpp"
#include "core/route_searcher.hpp"
#include "core/search_query.hpp"
#include "core/time_utils.hpp"

// findRoutes: catalog snapshot -> index -> two-pass search -> ranked page. Holds no per-request state,
// so one finder may serve concurrent requests if its reader can.
class RouteFinder
{
    FlightCatalogReader const& reader_;
    const SearchConfig config_;

    // Second legs may depart up to maxConnection() after the latest first-leg arrival, which can lie
    // well past the departure window. Loads that tail and widens load_window to cover it.
    void loadConnections_(FlightList& flights, SearchQuery const& query, TimeWindow& load_window) const
    {
        Timestamp latest_arrival = load_window.begin;
        for (auto const& f : flights)
        {
            if (f.origin == query.origin && f.isSearchable() && query.departure_window.contains(f.departure))
                latest_arrival = std::max(latest_arrival, f.arrival);
        }

        // The connection bound is inclusive, the window is half-open.
        Timestamp end = latest_arrival + config_.maxConnection() + 1;
        if (end <= load_window.end)
            return;

        auto tail = reader_.loadCandidateFlights(TimeWindow{load_window.end, end});
        logger_->debug("Loaded {} connection candidates departing before {}", tail.size(), time_utils::formatIsoUtc(end));
        for (auto& f : tail)
        {
            if (f.departure >= load_window.end)
                flights.push_back(std::move(f));
        }
        load_window.end = end;
    }

   public:
    RouteFinder(FlightCatalogReader const& reader, SearchConfig const& config) : reader_(reader), config_(config)
    {
        config_.validate();
    }

    RoutePage findRoutes(SearchQuery const& query) const
    {
        query.validate();

        TimeWindow load_window = query.departure_window;
        auto flights = reader_.loadCandidateFlights(load_window);
        loadConnections_(flights, query, load_window);
        logger_->info("Searching {} -> {} by {} over {} candidate flights",
                      query.origin,
                      query.destination,
                      toString(query.criterion),
                      flights.size());

        FlightGraph graph(flights, load_window);
        RouteSearcher searcher(config_);
        auto routes = searcher.search(graph, query);

        RoutePage result = RouteRanker(query.criterion).page(std::move(routes), query.limit, query.offset);
        logger_->info("Found {} routes, returning {}", result.total_count, result.routes.size());
        return result;
    }
};
