// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <manifold/core/config.hpp>
#include <string>
#include <string_view>
#include <expected>
#include <system_error>

namespace manifold::core {

// Streaming MD5 of on-disk files. The file is read in fixed chunks and never
// held in memory as a whole.
class ChecksumVerifier {
public:
    explicit ChecksumVerifier(std::size_t chunk_size = CHECKSUM_CHUNK_SIZE) noexcept
        : chunk_size_(chunk_size == 0 ? CHECKSUM_CHUNK_SIZE : chunk_size) {}

    // Lower-case hex digest of the file contents
    [[nodiscard]] std::expected<std::string, std::error_code>
    digest(std::string_view path) const noexcept;

    // True when the digest equals expected_hex (compared case-insensitively).
    // An unreadable file never verifies.
    [[nodiscard]] bool verify(std::string_view path, std::string_view expected_hex) const noexcept;

private:
    std::size_t chunk_size_;
};

} // namespace manifold::core
