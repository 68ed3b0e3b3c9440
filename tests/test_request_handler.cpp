#include "core/request_handler.hpp"

#include <rapidjson/document.h>

#include <string>

#include "core/catalog_parser.hpp"
#include "test_fixtures.hpp"
#include "test_harness.hpp"

namespace
{

FlightCatalog kyivCatalog()
{
    Airport kbp{"KBP", "Boryspil", "Kyiv", 180};
    Airport ods{"ODS", "Odesa", "Odesa", 180};
    Airport lwo{"LWO", "Lviv", "Lviv", 180};

    // Times are UTC; local departure day 2024-05-01 starts at 2024-04-30T21:00Z.
    std::vector<Flight> flights = {
        fixtures::flight("PS101", "KBP", "LWO", "05:00", "06:10", "129.99"),
        fixtures::flight("PS201", "KBP", "ODS", "04:00", "05:20", "40.00"),
        fixtures::flight("PS202", "ODS", "LWO", "06:10", "07:30", "35.50"),
        fixtures::flight("PS999", "KBP", "LWO", "+1 05:00", "+1 06:10", "10.00"),
    };
    FlightCatalog catalog;
    catalog.airports = {kbp, ods, lwo};
    catalog.flights = flights;
    return catalog;
}

}  // namespace

int test_request_handler()
{
    int failures = 0;

    auto params = RouteRequestHandler::parseQueryString("?origin=kbp&destination=LWO&date=2024-05-01&limit=5");
    CHECK(params.size() == 4);
    CHECK(params["origin"] == "kbp");
    CHECK(params["limit"] == "5");
    CHECK(RouteRequestHandler::urlDecode("New+York%2C%20NY") == "New York, NY");
    CHECK(RouteRequestHandler::urlDecode("100%") == "100%");
    CHECK(RouteRequestHandler::parseQueryString("a=1&&b").size() == 2);

    auto catalog = kyivCatalog();
    RouteRequestHandler handler(catalog, fixtures::config(30));

    {
        auto query = handler.buildQuery(RouteRequestHandler::parseQueryString(
            "origin=kbp&destination=lwo&date=2024-05-01&criterion=duration&offset=1"));
        CHECK(query.origin == "KBP");
        CHECK(query.destination == "LWO");
        CHECK(query.criterion == RankCriterion::Duration);
        CHECK(query.limit == RouteRequestHandler::DEFAULT_LIMIT);
        CHECK(query.offset == 1);
        CHECK(query.departure_window.begin == fixtures::at("00:00") - 3 * 3600);
        CHECK(query.departure_window.end == fixtures::at("+1 00:00") - 3 * 3600);
    }

    {
        auto response = handler.handle("origin=KBP&destination=LWO&date=2024-05-01&criterion=price");
        CHECK(response.status == 200);

        rapidjson::Document doc;
        doc.Parse(response.body.c_str());
        CHECK(!doc.HasParseError());
        CHECK(doc.IsObject() && doc.HasMember("total_count") && doc["total_count"].GetUint64() == 2);
        if (doc.IsObject() && doc.HasMember("routes") && doc["routes"].Size() == 2)
        {
            auto const& first = doc["routes"][0u];
            CHECK(std::string(first["total_price"].GetString()) == "75.50");
            CHECK(first["transfer_count"].GetInt() == 1);
            CHECK(std::string(first["transfer_airport"].GetString()) == "ODS");
            CHECK(first["layover_minutes"].GetInt64() == 50);
            CHECK(first["total_duration_minutes"].GetInt64() == 210);
            CHECK(first["flight_ids"].Size() == 2);
            CHECK(std::string(first["legs"][0u]["departure"].GetString()) == "2024-05-01T04:00:00Z");

            auto const& second = doc["routes"][1u];
            CHECK(std::string(second["flight_ids"][0u].GetString()) == "PS101");
            CHECK(second["transfer_count"].GetInt() == 0);
            CHECK(!second.HasMember("layover_minutes"));
        }
        else
        {
            CHECK(false);
        }
    }

    {
        auto response = handler.handle("origin=KBP&destination=KBP&date=2024-05-01");
        CHECK(response.status == 400);
        CHECK(response.body.find("\"invalid_query\"") != std::string::npos);

        CHECK(handler.handle("origin=KBP&destination=LWO").status == 400);
        CHECK(handler.handle("origin=KBP&destination=LWO&date=01.05.2024").status == 400);
        CHECK(handler.handle("origin=KBP&destination=LWO&date=2024-05-01&criterion=comfort").status == 400);
        CHECK(handler.handle("origin=KBP&destination=LWO&date=2024-05-01&limit=0").status == 400);
        CHECK(handler.handle("origin=KBP&destination=LWO&date=2024-05-01&limit=ten").status == 400);
        CHECK(handler.handle("origin=KBP&destination=LWO&date=2024-05-01&offset=-3").status == 400);
    }

    {
        auto response = handler.handle("origin=IEV&destination=LWO&date=2024-05-01");
        CHECK(response.status == 404);
        CHECK(response.body.find("\"unknown_airport\"") != std::string::npos);
        CHECK(handler.handle("origin=KBP&destination=HRK&date=2024-05-01").status == 404);
    }

    // A catalog without an airport directory reads every time as UTC, and so does the date.
    {
        auto flights_only = CatalogParser::parse_from_string(
            R"({"flights": [{"id": "PS101", "origin": "KBP", "destination": "LWO",
                 "departure": "2024-05-01T08:00", "arrival": "2024-05-01T09:10", "price": "95.00"}]})");
        CHECK(flights_only.airports.empty());
        RouteRequestHandler utc_handler(flights_only, fixtures::config(30));

        auto query = utc_handler.buildQuery(
            RouteRequestHandler::parseQueryString("origin=KBP&destination=LWO&date=2024-05-01"));
        CHECK(query.departure_window.begin == fixtures::may1().begin);
        CHECK(query.departure_window.end == fixtures::may1().end);

        auto response = utc_handler.handle("origin=KBP&destination=LWO&date=2024-05-01");
        CHECK(response.status == 200);
        CHECK(response.body.find("\"total_count\":1") != std::string::npos);
        CHECK(utc_handler.handle("origin=IEV&destination=LWO&date=2024-05-01").status == 404);
    }

    {
        auto response = handler.handle("origin=KBP&destination=LWO&date=2024-05-01&offset=10");
        CHECK(response.status == 200);
        CHECK(response.body == R"({"total_count":2,"routes":[]})");
    }

    {
        auto broken = kyivCatalog();
        auto duplicate = broken.flights.front();
        broken.flights.push_back(duplicate);
        RouteRequestHandler broken_handler(broken, fixtures::config(30));
        auto response = broken_handler.handle("origin=KBP&destination=LWO&date=2024-05-01");
        CHECK(response.status == 500);
        CHECK(response.body.find("\"invalid_input\"") != std::string::npos);
    }

    return failures;
}
