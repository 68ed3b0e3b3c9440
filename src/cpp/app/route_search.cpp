#include <iostream>
#include <string>

#include "app/spdlog_tmp.hpp"
#include "core/catalog_parser.hpp"
#include "core/request_handler.hpp"

int main(int argc, char* argv[])
{
    if (argc != 4)
    {
        std::cerr << "Usage: route_search <catalog_json_path> <config_json_path> <query_string>" << std::endl;
        std::cerr << "  e.g. route_search flights.json config.json "
                     "'origin=KBP&destination=LWO&date=2024-05-01&criterion=price&limit=10&offset=0'"
                  << std::endl;
        return 1;
    }

    initLogger();

    std::string catalog_path = argv[1];
    std::string config_path = argv[2];
    std::string query_string = argv[3];

    try
    {
        auto config = ConfigParser::parse_from_json(config_path);
        logger_->set_level(config.log_level);

        auto catalog = CatalogParser::parse_from_json(catalog_path);
        std::cerr << "Parsed successfully from: " << catalog_path << std::endl;

        RouteRequestHandler handler(catalog, config.search);
        auto response = handler.handle(query_string);

        std::cout << response.body << std::endl;
        return response.status == 200 ? 0 : 2;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Route search failed: " << e.what() << std::endl;
        return 1;
    }
}
