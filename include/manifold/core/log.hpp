// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace manifold::log {

constexpr std::string_view LOGGER_NAME = "manifold";
constexpr std::string_view CURL_LOGGER_NAME = "libcurl";

// Create the stderr loggers and make "manifold" the spdlog default.
// Safe to call more than once; later calls only change the level.
void init(spdlog::level::level_enum level = spdlog::level::info) noexcept;

// Parse "trace", "debug", "info", "warn", "error", "off"; unknown names map to info
[[nodiscard]] spdlog::level::level_enum level_from_name(std::string_view name) noexcept;

// Logger that receives libcurl verbose output (null before init)
[[nodiscard]] std::shared_ptr<spdlog::logger> curl_logger() noexcept;

} // namespace manifold::log
