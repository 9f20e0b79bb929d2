// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/core/client_config.hpp>
#include <manifold/core/endpoint_selector.hpp>
#include <manifold/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace manifold::core {

std::error_code ClientConfig::merge_json(std::string_view json_text) noexcept {
    try {
        auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return make_error_code(TransferErrc::invalid_config);
        }

        if (j.contains("destination")) {
            destination = j["destination"].get<std::string>();
        }

        if (j.contains("priorities")) {
            const auto& p = j["priorities"];
            if (p.is_string()) {
                priorities = parse_priorities(p.get<std::string>());
            } else if (p.is_array()) {
                std::string joined;
                for (const auto& tag : p) {
                    joined += tag.get<std::string>();
                    joined += ',';
                }
                priorities = parse_priorities(joined);
            } else {
                return make_error_code(TransferErrc::invalid_config);
            }
        }

        if (j.contains("fallback")) {
            fallback = j["fallback"].get<bool>();
        }

        if (j.contains("s3_endpoint")) {
            s3_endpoint = j["s3_endpoint"].get<std::string>();
        }

        if (j.contains("connect_timeout")) {
            connect_timeout_sec = j["connect_timeout"].get<std::uint32_t>();
        }

        if (j.contains("log_level")) {
            log_level = j["log_level"].get<std::string>();
        }

        if (j.contains("quiet")) {
            quiet = j["quiet"].get<bool>();
        }

        return {};
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return make_error_code(TransferErrc::invalid_config);
    } catch (const std::exception&) {
        return make_error_code(TransferErrc::invalid_config);
    }
}

std::expected<ClientConfig, std::error_code>
ClientConfig::load(std::string_view path) noexcept {
    try {
        std::ifstream file(std::string(path), std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        std::ostringstream ss;
        ss << file.rdbuf();

        ClientConfig config;
        if (auto ec = config.merge_json(ss.str())) {
            return std::unexpected(ec);
        }
        return config;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

} // namespace manifold::core
