/*
 * Logging setup - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <winpipe/util/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace winpipe {

void init_logging(bool debug) {
    auto logger = spdlog::get("winpipe");
    if (!logger) logger = spdlog::stderr_color_mt("winpipe");
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_default_logger(logger);
}

} // namespace winpipe
