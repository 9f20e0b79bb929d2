// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <manifold/core/client_config.hpp>
#include <manifold/core/endpoint_selector.hpp>
#include <manifold/core/manifest.hpp>
#include <manifold/core/range_downloader.hpp>
#include <manifold/core/transfer_source.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace manifold::core {

enum class EntryStatus : std::uint8_t {
    completed,
    already_complete,
    no_endpoint,      // No candidate URL matched a priority tag; skipped
    checksum_failed,
    source_error,     // Every tried endpoint was unreachable or unusable
    write_failed,
};

[[nodiscard]] std::string_view to_string(EntryStatus status) noexcept;

struct EntryReport {
    std::string id;
    EntryStatus status{EntryStatus::source_error};
    std::string url;                    // Endpoint of the last attempt
    std::vector<std::string> attempted; // Every endpoint tried, in order
    std::error_code error;
    TransferOutcome outcome;
};

struct TransferReport {
    std::vector<EntryReport> entries;

    [[nodiscard]] std::size_t count(EntryStatus status) const noexcept;

    // Nothing failed; skipped entries without an endpoint do not count as failures
    [[nodiscard]] bool ok() const noexcept;
};

using SourceFactory =
    std::function<std::expected<std::unique_ptr<TransferSource>, std::error_code>(const Url&)>;

// Walks a manifest one entry at a time: select endpoint, download, report.
// A failing entry never stops the run.
class TransferDriver {
public:
    using EntryCallback = std::function<void(const FileEntry&, const std::string& url)>;

    // Without a factory, sources come from make_source(url, config)
    TransferDriver(ClientConfig config,
                   EndpointSelector& selector,
                   RangeDownloader& downloader,
                   SourceFactory factory = {});

    [[nodiscard]] TransferReport run(const Manifest& manifest) noexcept;

    [[nodiscard]] EntryReport transfer(const FileEntry& entry) noexcept;

    // Called before each endpoint attempt
    void on_attempt(EntryCallback cb) noexcept { on_attempt_ = std::move(cb); }

    // "<directory>/<last path segment of url>"; invalid_url when the URL
    // names no file
    [[nodiscard]] static std::expected<std::string, std::error_code>
    destination_for(std::string_view directory, const Url& url);

    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }

private:
    ClientConfig config_;
    EndpointSelector& selector_;
    RangeDownloader& downloader_;
    SourceFactory factory_;
    EntryCallback on_attempt_;
};

} // namespace manifold::core
