#pragma once

#include <stdexcept>
#include <string>
#include <utility>

class RouteSearchError : public std::runtime_error
{
   public:
    RouteSearchError(std::string kind, std::string const& message) :
            std::runtime_error(message), kind_(std::move(kind))
    {
    }

    std::string const& kind() const { return kind_; }

   private:
    std::string kind_;
};

// Malformed or semantically invalid request (origin == destination, non-positive limit, ...).
class InvalidQuery : public RouteSearchError
{
   public:
    explicit InvalidQuery(std::string const& message) : RouteSearchError("invalid_query", message) {}
};

// Airport code not present in the index for the queried window.
class UnknownAirport : public RouteSearchError
{
   public:
    explicit UnknownAirport(std::string const& message) : RouteSearchError("unknown_airport", message) {}
};

// Upstream data integrity problem: duplicate flight ids, arrival not after departure, bad documents.
class InvalidInput : public RouteSearchError
{
   public:
    explicit InvalidInput(std::string const& message) : RouteSearchError("invalid_input", message) {}
};
