// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <manifold/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace manifold::core {

// Answers "are we running inside the cloud that hosts the object store?"
class CloudProbe {
public:
    virtual ~CloudProbe() = default;
    [[nodiscard]] virtual bool in_cloud() noexcept = 0;
};

// Queries the EC2 instance-metadata service with a short timeout.
// The answer is cached after the first call.
class InstanceMetadataProbe final : public CloudProbe {
public:
    explicit InstanceMetadataProbe(std::string url = std::string(INSTANCE_METADATA_URL),
                                   std::chrono::milliseconds timeout = INSTANCE_METADATA_TIMEOUT,
                                   std::uint32_t retries = INSTANCE_METADATA_RETRIES);

    [[nodiscard]] bool in_cloud() noexcept override;

private:
    std::string url_;
    std::chrono::milliseconds timeout_;
    std::uint32_t retries_;
    std::optional<bool> cached_;
};

// Fixed answer, for callers that already know (and for tests)
class StaticCloudProbe final : public CloudProbe {
public:
    explicit StaticCloudProbe(bool in_cloud) noexcept : in_cloud_(in_cloud) {}
    [[nodiscard]] bool in_cloud() noexcept override { return in_cloud_; }

private:
    bool in_cloud_;
};

} // namespace manifold::core
