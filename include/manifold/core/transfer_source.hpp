// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <manifold/core/error.hpp>
#include <manifold/core/url.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace manifold::core {

struct ClientConfig;

using Block = std::vector<std::byte>;

// Where the bytes of one remote file come from. The download loop only sees
// this interface; protocol differences stay inside the implementations.
class TransferSource {
public:
    virtual ~TransferSource() = default;

    // Connect and position the source at byte `offset`
    [[nodiscard]] virtual std::error_code open(std::uint64_t offset) noexcept = 0;

    // Total size of the remote file in bytes (valid after open)
    [[nodiscard]] virtual std::uint64_t size() const noexcept = 0;

    // Bytes [start, end] (inclusive, clipped to the file). An empty block
    // means the source is exhausted.
    [[nodiscard]] virtual std::expected<Block, std::error_code>
    fetch_range(std::uint64_t start, std::uint64_t end) noexcept = 0;

    // URL used for logging
    [[nodiscard]] virtual std::string describe() const = 0;
};

// StreamSource for http/https/ftp, ObjectSource for s3.
// Other schemes fail with TransferErrc::unsupported_protocol.
[[nodiscard]] std::expected<std::unique_ptr<TransferSource>, std::error_code>
make_source(const Url& url, const ClientConfig& config) noexcept;

} // namespace manifold::core
