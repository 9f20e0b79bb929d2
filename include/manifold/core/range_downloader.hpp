// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <manifold/core/checksum.hpp>
#include <manifold/core/config.hpp>
#include <manifold/core/transfer_source.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace manifold::core {

enum class TransferStatus : std::uint8_t {
    completed,        // Verified and promoted to the destination
    already_complete, // Destination existed, nothing transferred
    checksum_failed,  // Bytes on disk do not match; partial file kept
    source_error,     // Open or read failed; partial file kept as resume point
    write_failed,     // Local disk error
};

[[nodiscard]] std::string_view to_string(TransferStatus status) noexcept;

// Per-block observation
struct TransferProgress {
    std::uint64_t bytes_written{0};
    std::uint64_t total_bytes{0};   // 0 when the source does not know
    std::uint64_t resumed_from{0};
    double percent{0.0};
};

using ProgressCallback = std::function<void(const TransferProgress&)>;

struct TransferOutcome {
    TransferStatus status{TransferStatus::source_error};
    std::error_code error;
    std::string destination;
    std::uint64_t resumed_from{0};
    std::uint64_t bytes_written{0};
    std::uint64_t total_bytes{0};

    [[nodiscard]] bool ok() const noexcept {
        return status == TransferStatus::completed || status == TransferStatus::already_complete;
    }
};

// Copies one source into "<destination>.partial" block by block, resuming
// from whatever the partial file already holds, then verifies and promotes.
class RangeDownloader {
public:
    explicit RangeDownloader(std::size_t block_size = BLOCK_SIZE,
                             ChecksumVerifier verifier = ChecksumVerifier{}) noexcept;

    void callback(ProgressCallback cb) noexcept { callback_ = std::move(cb); }

    [[nodiscard]] TransferOutcome download(TransferSource& source,
                                           std::string_view destination,
                                           std::string_view expected_checksum) noexcept;

    // bytes_written * 100 / total, or 0 when total is unknown
    [[nodiscard]] static double percent(std::uint64_t bytes_written, std::uint64_t total) noexcept;

    [[nodiscard]] std::size_t block_size() const noexcept { return block_size_; }

private:
    void notify(const TransferProgress& progress) const noexcept;

    std::size_t block_size_;
    ChecksumVerifier verifier_;
    ProgressCallback callback_;
};

} // namespace manifold::core
