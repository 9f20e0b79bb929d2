// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/core/manifest.hpp>
#include <manifold/core/endpoint_selector.hpp>
#include <manifold/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>

namespace manifold::core {

namespace {

std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        auto tab = line.find('\t', start);
        if (tab == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return fields;
}

std::optional<std::uint64_t> parse_size(std::string_view s) noexcept {
    if (s.empty()) return std::nullopt;
    std::uint64_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return value;
}

} // namespace

std::expected<Manifest, std::error_code> parse_manifest_json(std::string_view text) noexcept {
    try {
        // ordered_json keeps entries in document order
        auto j = nlohmann::ordered_json::parse(text);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(TransferErrc::invalid_manifest));
        }

        Manifest manifest;
        manifest.reserve(j.size());
        for (const auto& [id, item] : j.items()) {
            if (!item.is_object()) {
                return std::unexpected(make_error_code(TransferErrc::invalid_manifest));
            }

            FileEntry entry;
            entry.id = id;

            if (item.contains("urls")) {
                const auto& urls = item["urls"];
                if (urls.is_string()) {
                    entry.urls = split_urls(urls.get<std::string>());
                } else if (urls.is_array()) {
                    for (const auto& u : urls) {
                        entry.urls.push_back(u.get<std::string>());
                    }
                }
            }

            if (item.contains("md5")) {
                entry.checksum = item["md5"].get<std::string>();
            } else if (item.contains("checksum")) {
                entry.checksum = item["checksum"].get<std::string>();
            }

            if (item.contains("size") && item["size"].is_number_unsigned()) {
                entry.size = item["size"].get<std::uint64_t>();
            }

            manifest.push_back(std::move(entry));
        }
        return manifest;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid JSON manifest: {}", e.what());
        return std::unexpected(make_error_code(TransferErrc::invalid_manifest));
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(TransferErrc::invalid_manifest));
    }
}

std::expected<Manifest, std::error_code> parse_manifest_tsv(std::string_view text) noexcept {
    try {
        std::map<std::string, std::size_t> columns;
        Manifest manifest;
        std::size_t line_no = 0;

        std::size_t start = 0;
        while (start < text.size()) {
            auto end = text.find('\n', start);
            if (end == std::string_view::npos) end = text.size();
            auto line = text.substr(start, end - start);
            start = end + 1;
            ++line_no;

            if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
            if (line.empty()) continue;

            auto fields = split_fields(line);

            if (columns.empty()) {
                for (std::size_t i = 0; i < fields.size(); ++i) {
                    columns[std::string(fields[i])] = i;
                }
                if (!columns.contains("file_id") || !columns.contains("md5") || !columns.contains("urls")) {
                    spdlog::error("Manifest header must name file_id, md5 and urls");
                    return std::unexpected(make_error_code(TransferErrc::invalid_manifest));
                }
                continue;
            }

            auto field = [&](const char* name) -> std::string_view {
                auto it = columns.find(name);
                if (it == columns.end() || it->second >= fields.size()) return {};
                return fields[it->second];
            };

            FileEntry entry;
            entry.id = std::string(field("file_id"));
            if (entry.id.empty()) {
                spdlog::error("Manifest line {} has no file_id", line_no);
                return std::unexpected(make_error_code(TransferErrc::invalid_manifest));
            }
            entry.checksum = std::string(field("md5"));
            entry.urls = split_urls(field("urls"));
            entry.size = parse_size(field("size"));
            manifest.push_back(std::move(entry));
        }

        if (columns.empty()) {
            return std::unexpected(make_error_code(TransferErrc::invalid_manifest));
        }
        return manifest;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(TransferErrc::invalid_manifest));
    }
}

std::expected<Manifest, std::error_code> load_manifest(std::string_view path) noexcept {
    std::string text;
    try {
        std::ifstream file(std::string(path), std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        text = ss.str();
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }

    auto first = text.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && text[first] == '{') {
        return parse_manifest_json(text);
    }
    return parse_manifest_tsv(text);
}

} // namespace manifold::core
