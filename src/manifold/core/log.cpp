// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace manifold::log {

void init(spdlog::level::level_enum level) noexcept {
    try {
        auto logger = spdlog::get(std::string(LOGGER_NAME));
        if (!logger) {
            logger = spdlog::stderr_color_mt(std::string(LOGGER_NAME));
            logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
            spdlog::set_default_logger(logger);
        }
        logger->set_level(level);

        auto curl = spdlog::get(std::string(CURL_LOGGER_NAME));
        if (!curl) {
            curl = spdlog::stderr_color_mt(std::string(CURL_LOGGER_NAME));
            curl->set_pattern("[%H:%M:%S.%e] [curl] %v");
        }
        // libcurl chatter only shows up in debug runs
        curl->set_level(level <= spdlog::level::debug ? spdlog::level::debug : spdlog::level::off);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Logger initialisation failed: {}", e.what());
    }
}

spdlog::level::level_enum level_from_name(std::string_view name) noexcept {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> curl_logger() noexcept {
    return spdlog::get(std::string(CURL_LOGGER_NAME));
}

} // namespace manifold::log
