#pragma once

#include "app/spdlog_tmp.hpp"
#include "core/flight_catalog.hpp"

// Periodic job that closes flights which have already departed. Runs independently of searches; the
// search core only ever reads Flight::status.
class FlightCompletionJob
{
   public:
    static size_t run(FlightCatalog& catalog, Timestamp now)
    {
        size_t completed = 0;
        for (auto& flight : catalog.flights)
        {
            if (flight.status != FlightStatus::Scheduled || flight.departure >= now)
                continue;
            logger_->debug("Flight {}: {} -> {}", flight.id, toString(flight.status), toString(FlightStatus::Completed));
            flight.status = FlightStatus::Completed;
            ++completed;
        }
        logger_->info("Marked {} departed flights as completed", completed);
        return completed;
    }
};
