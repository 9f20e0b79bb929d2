// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/core/range_downloader.hpp>
#include <manifold/disk/partial_file.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>

namespace manifold::core {

std::string_view to_string(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::completed:        return "completed";
        case TransferStatus::already_complete: return "already complete";
        case TransferStatus::checksum_failed:  return "checksum failed";
        case TransferStatus::source_error:     return "source error";
        case TransferStatus::write_failed:     return "write failed";
        default:                               return "unknown";
    }
}

RangeDownloader::RangeDownloader(std::size_t block_size, ChecksumVerifier verifier) noexcept
    : block_size_(block_size == 0 ? BLOCK_SIZE : block_size)
    , verifier_(verifier) {}

double RangeDownloader::percent(std::uint64_t bytes_written, std::uint64_t total) noexcept {
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(bytes_written) * 100.0 / static_cast<double>(total);
}

void RangeDownloader::notify(const TransferProgress& progress) const noexcept {
    if (!callback_) return;
    try {
        callback_(progress);
    } catch (const std::exception& e) {
        spdlog::warn("Progress callback threw: {}", e.what());
    }
}

TransferOutcome RangeDownloader::download(TransferSource& source,
                                          std::string_view destination,
                                          std::string_view expected_checksum) noexcept {
    TransferOutcome outcome;
    outcome.destination = std::string(destination);

    // Existing final files are trusted as-is
    std::error_code fs_ec;
    if (std::filesystem::exists(outcome.destination, fs_ec)) {
        spdlog::info("{} already exists, skipping", outcome.destination);
        outcome.status = TransferStatus::already_complete;
        return outcome;
    }

    disk::PartialFile partial(outcome.destination);
    std::uint64_t bytes_written = partial.existing_size();
    outcome.resumed_from = bytes_written;

    // Bytes already on disk count as written even when nothing new arrives
    outcome.bytes_written = bytes_written;

    if (auto ec = source.open(bytes_written)) {
        outcome.status = TransferStatus::source_error;
        outcome.error = ec;
        return outcome;
    }

    const std::uint64_t total = source.size();
    outcome.total_bytes = total;

    if (total > 0 && bytes_written > total) {
        spdlog::error("{} holds {} bytes but {} has only {}", partial.path(), bytes_written, source.describe(), total);
        outcome.status = TransferStatus::source_error;
        outcome.error = make_error_code(TransferErrc::invalid_range);
        outcome.bytes_written = bytes_written;
        return outcome;
    }

    if (auto ec = partial.open()) {
        spdlog::error("Cannot open {}: {}", partial.path(), ec.message());
        outcome.status = TransferStatus::write_failed;
        outcome.error = ec;
        return outcome;
    }

    if (bytes_written > 0) {
        spdlog::info("Resuming {} at byte {} of {}", outcome.destination, bytes_written, total);
    } else {
        spdlog::info("Downloading {} ({} bytes) from {}", outcome.destination, total, source.describe());
    }

    TransferProgress progress;
    progress.total_bytes = total;
    progress.resumed_from = bytes_written;

    while (true) {
        auto block = source.fetch_range(bytes_written, bytes_written + block_size_ - 1);
        if (!block) {
            // Appended bytes stay on disk as the next resume point
            outcome.status = TransferStatus::source_error;
            outcome.error = block.error();
            outcome.bytes_written = bytes_written;
            partial.close();
            return outcome;
        }
        if (block->empty()) {
            break;
        }
        if (total > 0 && bytes_written + block->size() > total) {
            spdlog::error("{} sent more than its reported {} bytes", source.describe(), total);
            outcome.status = TransferStatus::source_error;
            outcome.error = make_error_code(TransferErrc::invalid_range);
            outcome.bytes_written = bytes_written;
            partial.close();
            return outcome;
        }

        if (auto ec = partial.append(block->data(), block->size())) {
            spdlog::error("Write to {} failed: {}", partial.path(), ec.message());
            outcome.status = TransferStatus::write_failed;
            outcome.error = ec;
            outcome.bytes_written = bytes_written;
            partial.close();
            return outcome;
        }

        bytes_written += block->size();
        progress.bytes_written = bytes_written;
        progress.percent = percent(bytes_written, total);
        notify(progress);
    }

    outcome.bytes_written = bytes_written;

    // Data must reach the disk before the rename publishes it
    if (auto ec = partial.flush()) {
        spdlog::error("Cannot flush {}: {}", partial.path(), ec.message());
        outcome.status = TransferStatus::write_failed;
        outcome.error = ec;
        partial.close();
        return outcome;
    }
    partial.close();

    if (!verifier_.verify(partial.path(), expected_checksum)) {
        spdlog::error("MD5 check failed for {}", outcome.destination);
        outcome.status = TransferStatus::checksum_failed;
        outcome.error = make_error_code(TransferErrc::checksum_mismatch);
        return outcome;
    }

    if (auto ec = partial.promote()) {
        spdlog::error("Cannot move {} into place: {}", partial.path(), ec.message());
        outcome.status = TransferStatus::write_failed;
        outcome.error = ec;
        return outcome;
    }

    spdlog::debug("Verified and promoted {}", outcome.destination);
    outcome.status = TransferStatus::completed;
    return outcome;
}

} // namespace manifold::core
