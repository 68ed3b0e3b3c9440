#pragma once
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <sstream>
#include <string>
#include <unordered_map>

#include "app/spdlog_tmp.hpp"
#include "core/errors.hpp"
#include "core/flight_catalog.hpp"
#include "core/money.hpp"
#include "core/route.hpp"
#include "core/search_query.hpp"
#include "core/time_utils.hpp"

struct AppConfig
{
    SearchConfig search{};
    spdlog::level::level_enum log_level{spdlog::level::info};
};

namespace json_detail
{

// Documents are parsed with numbers kept as text, so prices reach Money without a double in between.
constexpr unsigned PARSE_FLAGS = rapidjson::kParseNumbersAsStringsFlag;

inline std::string readFile(std::string const& filepath)
{
    std::ifstream input_file(filepath);
    if (!input_file.is_open())
    {
        logger_->error("Cannot open JSON file {}", filepath);
        throw InvalidInput("Cannot open JSON file: " + filepath);
    }

    std::stringstream buffer;
    buffer << input_file.rdbuf();
    return buffer.str();
}

inline void parseDocument(rapidjson::Document& doc, std::string const& content, std::string const& what)
{
    doc.Parse<PARSE_FLAGS>(content.c_str());
    if (doc.HasParseError())
    {
        logger_->error("{}: JSON parse error at offset {}", what, doc.GetErrorOffset());
        throw InvalidInput(what + ": JSON parse error");
    }
    if (!doc.IsObject())
        throw InvalidInput(what + ": top level value must be an object");
}

inline rapidjson::Value const* member(rapidjson::Value const& obj, char const* name)
{
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || it->value.IsNull())
        return nullptr;
    return &it->value;
}

inline std::string requireString(rapidjson::Value const& obj, char const* name, std::string const& where)
{
    auto const* value = member(obj, name);
    if (value == nullptr || !value->IsString())
        throw InvalidInput(where + ": missing string field '" + name + "'");
    return std::string(value->GetString(), value->GetStringLength());
}

inline std::string optionalString(rapidjson::Value const& obj, char const* name, std::string const& fallback)
{
    auto const* value = member(obj, name);
    if (value == nullptr)
        return fallback;
    if (!value->IsString())
        throw InvalidInput(std::string("Field '") + name + "' must be a string");
    return std::string(value->GetString(), value->GetStringLength());
}

inline long long toInteger(std::string const& text, std::string const& where)
{
    try
    {
        size_t used = 0;
        long long result = std::stoll(text, &used);
        if (used != text.size())
            throw InvalidInput(where + ": not an integer: " + text);
        return result;
    }
    catch (std::logic_error const&)
    {
        throw InvalidInput(where + ": not an integer: " + text);
    }
}

// Numbers arrive as strings because of PARSE_FLAGS.
inline long long optionalInteger(rapidjson::Value const& obj, char const* name, long long fallback, std::string const& where)
{
    auto const* value = member(obj, name);
    if (value == nullptr)
        return fallback;
    if (!value->IsString())
        throw InvalidInput(where + ": field '" + name + "' must be a number");
    return toInteger(value->GetString(), where + "." + name);
}

}  // namespace json_detail

class CatalogParser
{
   public:
    static FlightCatalog parse_from_json(std::string const& filepath)
    {
        return parse_from_string(json_detail::readFile(filepath));
    }

    static FlightCatalog parse_from_string(std::string const& json_content)
    {
        using namespace json_detail;

        rapidjson::Document j;
        parseDocument(j, json_content, "Flight catalog");

        FlightCatalog catalog;
        std::unordered_map<AirportCode, int> offsets;

        // airports
        if (auto const* airports = member(j, "airports"))
        {
            if (!airports->IsArray())
                throw InvalidInput("Flight catalog: 'airports' must be an array");
            for (auto const& a : airports->GetArray())
            {
                Airport airport;
                airport.code = requireString(a, "code", "airport");
                airport.name = optionalString(a, "name", airport.code);
                airport.closest_big_city = optionalString(a, "closest_big_city", "");
                airport.utc_offset_minutes =
                    static_cast<int>(optionalInteger(a, "utc_offset_minutes", 0, "airport " + airport.code));
                if (!offsets.emplace(airport.code, airport.utc_offset_minutes).second)
                {
                    logger_->error("Airport {} is listed twice", airport.code);
                    throw InvalidInput("Duplicate airport code: " + airport.code);
                }
                catalog.airports.push_back(std::move(airport));
            }
        }

        // flights
        auto const* flights = member(j, "flights");
        if (flights == nullptr || !flights->IsArray())
            throw InvalidInput("Flight catalog: 'flights' array is required");

        auto offsetOf = [&offsets](AirportCode const& code)
        {
            auto it = offsets.find(code);
            return it == offsets.end() ? 0 : it->second;
        };

        FlightIdSet ids;
        for (auto const& f : flights->GetArray())
        {
            Flight flight;
            flight.id = requireString(f, "id", "flight");
            if (!ids.insert(flight.id).second)
            {
                logger_->error("Flight {} is listed twice", flight.id);
                throw InvalidInput("Duplicate flight id: " + flight.id);
            }
            std::string where = "flight " + flight.id;
            flight.origin = requireString(f, "origin", where);
            flight.destination = requireString(f, "destination", where);
            flight.departure = parseTimestamp_(requireString(f, "departure", where), offsetOf(flight.origin), where);
            flight.arrival = parseTimestamp_(requireString(f, "arrival", where), offsetOf(flight.destination), where);
            flight.price = Money::fromString(requireString(f, "price", where));
            flight.status = parseStatus_(optionalString(f, "status", "scheduled"), where);

            if (auto const* bookable = member(f, "bookable"))
            {
                if (!bookable->IsBool())
                    throw InvalidInput(where + ": 'bookable' must be a boolean");
                flight.bookable = bookable->GetBool();
            }
            else
            {
                flight.bookable = optionalInteger(f, "seats_available", 1, where) > 0;
            }

            catalog.flights.push_back(std::move(flight));
        }

        logger_->info("Parsed {} airports and {} flights", catalog.airports.size(), catalog.flights.size());
        return catalog;
    }

   private:
    static Timestamp parseTimestamp_(std::string const& text, int default_offset_minutes, std::string const& where)
    {
        auto ts = time_utils::parseIsoDateTime(text, default_offset_minutes);
        if (!ts)
        {
            logger_->error("{}: malformed timestamp '{}'", where, text);
            throw InvalidInput(where + ": malformed timestamp " + text);
        }
        return *ts;
    }

    static FlightStatus parseStatus_(std::string const& text, std::string const& where)
    {
        if (text == "scheduled")
            return FlightStatus::Scheduled;
        if (text == "completed")
            return FlightStatus::Completed;
        if (text == "cancelled")
            return FlightStatus::Cancelled;
        throw InvalidInput(where + ": unknown status " + text);
    }
};

class ConfigParser
{
   public:
    static AppConfig parse_from_json(std::string const& filepath)
    {
        return parse_from_string(json_detail::readFile(filepath));
    }

    static AppConfig parse_from_string(std::string const& json_content)
    {
        using namespace json_detail;

        rapidjson::Document j;
        parseDocument(j, json_content, "Config");

        AppConfig config;
        auto& search = config.search;
        search.min_connection_minutes =
            static_cast<int>(optionalInteger(j, "min_connection_minutes", search.min_connection_minutes, "config"));
        search.max_connection_minutes =
            static_cast<int>(optionalInteger(j, "max_connection_minutes", search.max_connection_minutes, "config"));
        search.validate();

        std::string level = optionalString(j, "log_level", "info");
        config.log_level = spdlog::level::from_str(level);
        if (config.log_level == spdlog::level::off && level != "off")
            throw InvalidInput("Unknown log level: " + level);

        return config;
    }
};

class RouteSerializer
{
   public:
    static std::string serialize_page(RoutePage const& page)
    {
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

        writer.StartObject();
        writer.Key("total_count");
        writer.Uint64(page.total_count);
        writer.Key("routes");
        writer.StartArray();
        for (auto const& route : page.routes)
        {
            writeRoute_(writer, route);
        }
        writer.EndArray();
        writer.EndObject();

        return buffer.GetString();
    }

    static std::string serialize_error(RouteSearchError const& error)
    {
        rapidjson::Document doc;
        doc.SetObject();
        rapidjson::Document::AllocatorType& allocator = doc.GetAllocator();

        doc.AddMember("error", rapidjson::Value().SetString(error.kind().c_str(), allocator), allocator);
        doc.AddMember("message", rapidjson::Value().SetString(error.what(), allocator), allocator);

        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
        return buffer.GetString();
    }

   private:
    using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

    static void writeString_(JsonWriter& writer, std::string const& s)
    {
        writer.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
    }

    static void writeMoney_(JsonWriter& writer, Money const& m)
    {
        std::string text = m.toString();
        writer.String(text.c_str(), static_cast<rapidjson::SizeType>(text.size()));
    }

    static void writeRoute_(JsonWriter& writer, Route const& route)
    {
        writer.StartObject();

        writer.Key("flight_ids");
        writer.StartArray();
        for (auto const& leg : route.legs)
            writeString_(writer, leg.id);
        writer.EndArray();

        writer.Key("legs");
        writer.StartArray();
        for (auto const& leg : route.legs)
        {
            writer.StartObject();
            writer.Key("flight_id");
            writeString_(writer, leg.id);
            writer.Key("origin");
            writeString_(writer, leg.origin);
            writer.Key("destination");
            writeString_(writer, leg.destination);
            writer.Key("departure");
            writeString_(writer, time_utils::formatIsoUtc(leg.departure));
            writer.Key("arrival");
            writeString_(writer, time_utils::formatIsoUtc(leg.arrival));
            writer.Key("price");
            writeMoney_(writer, leg.price);
            writer.EndObject();
        }
        writer.EndArray();

        writer.Key("total_price");
        writeMoney_(writer, route.totalPrice());
        writer.Key("total_duration_minutes");
        writer.Int64(route.totalDuration() / SECONDS_PER_MINUTE);
        writer.Key("transfer_count");
        writer.Int(route.transferCount());
        if (route.transferCount() == 1)
        {
            writer.Key("transfer_airport");
            writeString_(writer, route.transferAirport());
            writer.Key("layover_minutes");
            writer.Int64(route.layover() / SECONDS_PER_MINUTE);
        }

        writer.EndObject();
    }
};
