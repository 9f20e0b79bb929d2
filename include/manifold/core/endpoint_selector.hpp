// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <manifold/core/cloud_probe.hpp>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace manifold::core {

// Protocol tags, highest priority first
inline constexpr std::array<std::string_view, 4> CLOUD_PRIORITIES = {"s3", "http", "ftp", "fasp"};
inline constexpr std::array<std::string_view, 4> DEFAULT_PRIORITIES = {"http", "ftp", "s3", "fasp"};

// Split "S3, HTTP,ftp" into lower-cased tags, dropping empty items
[[nodiscard]] std::vector<std::string> parse_priorities(std::string_view csv);

// Split a comma-joined URL list, trimming blanks
[[nodiscard]] std::vector<std::string> split_urls(std::string_view csv);

// Demo data was published under a bucket layout that does not exist.
// Maps s3://<bucket>/<a>/<b>/.../<w>/<x>/<y>/<z> containing "HMDEMO" to
// s3://<bucket>/DEMO/<b>/<w>/<x>/<y>/<z>; every other URL is returned as is.
[[nodiscard]] std::string rewrite_legacy_bucket(std::string_view url);

class EndpointSelector {
public:
    explicit EndpointSelector(CloudProbe& probe) noexcept : probe_(probe) {}

    // Priorities to use for a request; an empty list becomes the default
    // order for the current environment
    [[nodiscard]] std::vector<std::string> effective_priorities(const std::vector<std::string>& priorities);

    // Every candidate matching some tag, ordered tag-major then by position
    // in `urls`. Each entry has already been through the legacy rewrite.
    [[nodiscard]] std::vector<std::string> rank(const std::vector<std::string>& urls,
                                                const std::vector<std::string>& priorities);

    // First ranked candidate, or nullopt when nothing matches
    [[nodiscard]] std::optional<std::string> select(const std::vector<std::string>& urls,
                                                    const std::vector<std::string>& priorities);

    // Does `url` use the protocol named by `tag`? ("http" also covers https)
    [[nodiscard]] static bool matches(std::string_view url, std::string_view tag) noexcept;

private:
    CloudProbe& probe_;
};

} // namespace manifold::core
