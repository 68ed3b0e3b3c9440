#pragma once

#include "include/pch.hpp"

void initLogger(spdlog::level::level_enum level = spdlog::level::info);
