// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/core/logging.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

namespace livecap::core {

void init_logging(spdlog::level::level_enum level) noexcept {
    try {
        auto logger = spdlog::get("livecap");
        if (!logger) {
            logger = spdlog::stderr_color_mt("livecap");
        }
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_level(level);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to set up logging: " << e.what() << std::endl;
    }
}

} // namespace livecap::core
