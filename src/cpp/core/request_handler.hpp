#pragma once
#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_map>

#include "app/spdlog_tmp.hpp"
#include "core/catalog_parser.hpp"
#include "core/errors.hpp"
#include "core/flight_catalog.hpp"
#include "core/route_finder.hpp"
#include "core/search_query.hpp"
#include "core/time_utils.hpp"

using QueryParams = std::unordered_map<std::string, std::string>;

struct HttpResponse
{
    int status{200};
    std::string body;
};

// GET /routes: translates transport parameters into a SearchQuery and the ranked page into JSON.
class RouteRequestHandler
{
   public:
    static constexpr int DEFAULT_LIMIT = 20;

    RouteRequestHandler(FlightCatalog const& catalog, SearchConfig const& config) :
            catalog_(catalog), finder_(catalog, config)
    {
    }

    HttpResponse handle(std::string const& query_string) const { return handle(parseQueryString(query_string)); }

    HttpResponse handle(QueryParams const& params) const
    {
        try
        {
            auto query = buildQuery(params);
            auto page = finder_.findRoutes(query);
            return HttpResponse{200, RouteSerializer::serialize_page(page)};
        }
        catch (InvalidQuery const& e)
        {
            logger_->warn("Rejected query: {}", e.what());
            return HttpResponse{400, RouteSerializer::serialize_error(e)};
        }
        catch (UnknownAirport const& e)
        {
            logger_->warn("Unknown airport: {}", e.what());
            return HttpResponse{404, RouteSerializer::serialize_error(e)};
        }
        catch (InvalidInput const& e)
        {
            logger_->error("Flight data integrity problem: {}", e.what());
            return HttpResponse{500, RouteSerializer::serialize_error(e)};
        }
    }

    SearchQuery buildQuery(QueryParams const& params) const
    {
        SearchQuery query;
        query.origin = upper_(require_(params, "origin"));
        query.destination = upper_(require_(params, "destination"));
        if (query.origin == query.destination)
            throw InvalidQuery("Origin and destination must differ: " + query.origin);

        std::string date = require_(params, "date");
        auto days = time_utils::parseIsoDate(date);
        if (!days)
            throw InvalidQuery("Malformed date, expected YYYY-MM-DD: " + date);

        // Unlisted airports keep UTC, as in the catalog. Whether the origin is known at all is decided
        // by the search over the indexed flights.
        auto origin = catalog_.findAirport(query.origin);
        int offset_minutes = origin ? origin->utc_offset_minutes : 0;
        query.departure_window = time_utils::localDayWindow(*days, offset_minutes);

        std::string criterion = optional_(params, "criterion", "price");
        if (criterion == "price")
            query.criterion = RankCriterion::Price;
        else if (criterion == "duration")
            query.criterion = RankCriterion::Duration;
        else
            throw InvalidQuery("Unknown ranking criterion: " + criterion);

        query.limit = integer_(params, "limit", DEFAULT_LIMIT);
        query.offset = integer_(params, "offset", 0);
        return query;
    }

    static QueryParams parseQueryString(std::string const& query_string)
    {
        QueryParams result;
        size_t pos = query_string.empty() || query_string[0] != '?' ? 0 : 1;
        while (pos < query_string.size())
        {
            size_t amp = query_string.find('&', pos);
            std::string pair =
                query_string.substr(pos, (amp == std::string::npos) ? std::string::npos : amp - pos);
            if (!pair.empty())
            {
                size_t eq = pair.find('=');
                std::string key = urlDecode(pair.substr(0, eq));
                std::string val = (eq == std::string::npos) ? "" : urlDecode(pair.substr(eq + 1));
                result[key] = val;
            }
            if (amp == std::string::npos)
                break;
            pos = amp + 1;
        }
        return result;
    }

    static std::string urlDecode(std::string const& s)
    {
        auto hex = [](char c) -> int
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'A' && c <= 'F')
                return 10 + (c - 'A');
            if (c >= 'a' && c <= 'f')
                return 10 + (c - 'a');
            return -1;
        };

        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i)
        {
            if (s[i] == '+')
            {
                out.push_back(' ');
            }
            else if (s[i] == '%' && i + 2 < s.size() && hex(s[i + 1]) >= 0 && hex(s[i + 2]) >= 0)
            {
                out.push_back(static_cast<char>((hex(s[i + 1]) << 4) | hex(s[i + 2])));
                i += 2;
            }
            else
            {
                out.push_back(s[i]);
            }
        }
        return out;
    }

   private:
    FlightCatalog const& catalog_;
    RouteFinder finder_;

    static std::string require_(QueryParams const& params, std::string const& name)
    {
        auto it = params.find(name);
        if (it == params.end() || it->second.empty())
            throw InvalidQuery("Missing query parameter: " + name);
        return it->second;
    }

    static std::string optional_(QueryParams const& params, std::string const& name, std::string const& fallback)
    {
        auto it = params.find(name);
        return (it == params.end() || it->second.empty()) ? fallback : it->second;
    }

    static int integer_(QueryParams const& params, std::string const& name, int fallback)
    {
        std::string text = optional_(params, name, "");
        if (text.empty())
            return fallback;
        size_t used = 0;
        int value = 0;
        try
        {
            value = std::stoi(text, &used);
        }
        catch (std::logic_error const&)
        {
            throw InvalidQuery("Query parameter " + name + " must be an integer: " + text);
        }
        if (used != text.size())
            throw InvalidQuery("Query parameter " + name + " must be an integer: " + text);
        return value;
    }

    static std::string upper_(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
        return s;
    }
};
