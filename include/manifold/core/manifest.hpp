// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <manifold/core/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace manifold::core {

// One logical file: its candidate endpoints and the MD5 of its contents
struct FileEntry {
    std::string id;
    std::vector<std::string> urls;
    std::string checksum;
    std::optional<std::uint64_t> size;
};

// Entries in the order they appear in the source document
using Manifest = std::vector<FileEntry>;

// {"<id>": {"urls": "s3://a/b,http://c/b", "md5": "...", "size": 123}, ...}
// "urls" may also be an array; "checksum" is accepted for "md5".
[[nodiscard]] std::expected<Manifest, std::error_code> parse_manifest_json(std::string_view text) noexcept;

// Tab-separated with a header row naming at least file_id, md5 and urls
[[nodiscard]] std::expected<Manifest, std::error_code> parse_manifest_tsv(std::string_view text) noexcept;

// Picks the JSON or TSV reader from the file contents
[[nodiscard]] std::expected<Manifest, std::error_code> load_manifest(std::string_view path) noexcept;

} // namespace manifold::core
