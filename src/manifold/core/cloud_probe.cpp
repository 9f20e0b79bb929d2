// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/core/cloud_probe.hpp>
#include <manifold/core/http_session.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace manifold::core {

InstanceMetadataProbe::InstanceMetadataProbe(std::string url,
                                             std::chrono::milliseconds timeout,
                                             std::uint32_t retries)
    : url_(std::move(url))
    , timeout_(timeout)
    , retries_(retries) {}

bool InstanceMetadataProbe::in_cloud() noexcept {
    if (cached_) {
        return *cached_;
    }

    // The metadata address is link-local; connecting is bounded by the same timeout
    auto connect_sec = static_cast<std::uint32_t>(
        std::max<std::int64_t>(1, std::chrono::duration_cast<std::chrono::seconds>(timeout_).count()));
    HttpSession session(connect_sec);

    // Any reply from the link-local address means the service exists;
    // IMDSv2-only instances answer 401 to a tokenless request
    bool found = false;
    for (std::uint32_t attempt = 0; attempt <= retries_ && !found; ++attempt) {
        auto response = session.exchange(url_, timeout_);
        if (response && response->status_code > 0) {
            spdlog::debug("Instance metadata answered HTTP {}", response->status_code);
            found = true;
        } else if (!response) {
            spdlog::debug("Instance metadata attempt {} failed: {}", attempt + 1, response.error().message());
        }
    }

    spdlog::debug("Instance metadata {}", found ? "available: running on EC2" : "unavailable");
    cached_ = found;
    return found;
}

} // namespace manifold::core
