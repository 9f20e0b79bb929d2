// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <manifold/core/config.hpp>
#include <manifold/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace manifold::core {

// Runtime settings. Defaults come from config.hpp; a JSON file and then the
// command line override them.
struct ClientConfig {
    std::string destination{"."};
    std::vector<std::string> priorities;           // Lower-cased tags; empty = environment default
    bool fallback{true};                           // Try the next endpoint when one is unreachable
    std::string s3_endpoint{DEFAULT_S3_ENDPOINT};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::string log_level{"info"};
    bool quiet{false};

    // Read a JSON object such as
    //   {"destination": "out", "priorities": "S3,HTTP", "fallback": false,
    //    "s3_endpoint": "https://s3.amazonaws.com/{bucket}",
    //    "connect_timeout": 10, "log_level": "debug", "quiet": true}
    // Keys that are absent keep their current value. "priorities" may be a
    // comma-joined string or an array of strings.
    [[nodiscard]] std::error_code merge_json(std::string_view json_text) noexcept;

    [[nodiscard]] static std::expected<ClientConfig, std::error_code>
    load(std::string_view path) noexcept;
};

} // namespace manifold::core
