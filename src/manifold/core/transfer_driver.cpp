// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/core/transfer_driver.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>

namespace manifold::core {

namespace {

EntryStatus entry_status(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::completed:        return EntryStatus::completed;
        case TransferStatus::already_complete: return EntryStatus::already_complete;
        case TransferStatus::checksum_failed:  return EntryStatus::checksum_failed;
        case TransferStatus::write_failed:     return EntryStatus::write_failed;
        case TransferStatus::source_error:
        default:                               return EntryStatus::source_error;
    }
}

} // namespace

std::string_view to_string(EntryStatus status) noexcept {
    switch (status) {
        case EntryStatus::completed:        return "completed";
        case EntryStatus::already_complete: return "already complete";
        case EntryStatus::no_endpoint:      return "no valid endpoint";
        case EntryStatus::checksum_failed:  return "checksum failed";
        case EntryStatus::source_error:     return "source error";
        case EntryStatus::write_failed:     return "write failed";
        default:                            return "unknown";
    }
}

std::size_t TransferReport::count(EntryStatus status) const noexcept {
    return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(),
        [status](const EntryReport& e) { return e.status == status; }));
}

bool TransferReport::ok() const noexcept {
    return std::all_of(entries.begin(), entries.end(), [](const EntryReport& e) {
        return e.status == EntryStatus::completed
            || e.status == EntryStatus::already_complete
            || e.status == EntryStatus::no_endpoint;
    });
}

//=============================================================================
// TransferDriver
//=============================================================================

TransferDriver::TransferDriver(ClientConfig config,
                               EndpointSelector& selector,
                               RangeDownloader& downloader,
                               SourceFactory factory)
    : config_(std::move(config))
    , selector_(selector)
    , downloader_(downloader)
    , factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = [cfg = config_](const Url& url) { return make_source(url, cfg); };
    }
}

std::expected<std::string, std::error_code>
TransferDriver::destination_for(std::string_view directory, const Url& url) {
    auto name = url.filename();
    if (!name) {
        return std::unexpected(name.error());
    }
    return (std::filesystem::path(directory) / *name).string();
}

TransferReport TransferDriver::run(const Manifest& manifest) noexcept {
    TransferReport report;
    report.entries.reserve(manifest.size());

    for (const auto& entry : manifest) {
        report.entries.push_back(transfer(entry));
    }

    spdlog::info("{} entries: {} completed, {} already complete, {} without endpoint, {} failed",
                 report.entries.size(),
                 report.count(EntryStatus::completed),
                 report.count(EntryStatus::already_complete),
                 report.count(EntryStatus::no_endpoint),
                 report.count(EntryStatus::checksum_failed)
                     + report.count(EntryStatus::source_error)
                     + report.count(EntryStatus::write_failed));
    return report;
}

EntryReport TransferDriver::transfer(const FileEntry& entry) noexcept {
    EntryReport report;
    report.id = entry.id;

    try {
        auto candidates = selector_.rank(entry.urls, config_.priorities);
        if (candidates.empty()) {
            spdlog::warn("No valid URL found for file ID: {}", entry.id);
            report.status = EntryStatus::no_endpoint;
            report.error = make_error_code(TransferErrc::no_endpoint);
            return report;
        }

        for (const auto& candidate : candidates) {
            report.url = candidate;
            report.attempted.push_back(candidate);

            if (on_attempt_) {
                on_attempt_(entry, candidate);
            }

            auto url = Url::parse(candidate);
            if (!url) {
                spdlog::error("Endpoint {} for {} is not a valid URL", candidate, entry.id);
                report.status = EntryStatus::source_error;
                report.error = url.error();
                if (!config_.fallback) break;
                continue;
            }

            auto destination = destination_for(config_.destination, *url);
            if (!destination) {
                spdlog::error("Endpoint {} for {} does not name a file", candidate, entry.id);
                report.status = EntryStatus::source_error;
                report.error = destination.error();
                if (!config_.fallback) break;
                continue;
            }

            auto source = factory_(*url);
            if (!source) {
                spdlog::error("Cannot transfer {} from {}: {}", entry.id, candidate, source.error().message());
                report.status = EntryStatus::source_error;
                report.error = source.error();
                if (!config_.fallback) break;
                continue;
            }

            auto outcome = downloader_.download(**source, *destination, entry.checksum);
            report.status = entry_status(outcome.status);
            report.error = outcome.error;
            report.outcome = std::move(outcome);

            // Only fall back when this endpoint delivered nothing new
            const bool no_progress = report.outcome.bytes_written <= report.outcome.resumed_from;
            if (report.status == EntryStatus::source_error && config_.fallback && no_progress) {
                spdlog::warn("Endpoint {} for {} failed ({}), trying the next one",
                             candidate, entry.id, report.error.message());
                continue;
            }
            break;
        }
    } catch (const std::exception& e) {
        spdlog::error("Transfer of {} aborted: {}", entry.id, e.what());
        report.status = EntryStatus::source_error;
        report.error = make_error_code(TransferErrc::network_error);
    }

    return report;
}

} // namespace manifold::core
