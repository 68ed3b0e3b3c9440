#include <iostream>

#include "app/spdlog_tmp.hpp"

int test_money();
int test_time_utils();
int test_flight_graph();
int test_route_searcher();
int test_route_ranker();
int test_route_finder();
int test_catalog_parser();
int test_request_handler();
int test_completion_job();

int main()
{
    initLogger(spdlog::level::warn);

    int fails = 0;

    fails += test_money();
    fails += test_time_utils();
    fails += test_flight_graph();
    fails += test_route_searcher();
    fails += test_route_ranker();
    fails += test_route_finder();
    fails += test_catalog_parser();
    fails += test_request_handler();
    fails += test_completion_job();

    if (fails == 0)
    {
        std::cout << "[routesearch_tests] ALL PASS\n";
        return 0;
    }

    std::cerr << "[routesearch_tests] FAILS=" << fails << "\n";
    return 1;
}
