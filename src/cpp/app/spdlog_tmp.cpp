#include "app/spdlog_tmp.hpp"

std::shared_ptr<spdlog::logger> logger_;

void initLogger(spdlog::level::level_enum level)
{
    logger_ = spdlog::get("console");
    if (!logger_)
        logger_ = spdlog::stderr_color_mt("console");
    logger_->set_level(level);
}
