// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <manifold/core/http_session.hpp>
#include <manifold/core/transfer_source.hpp>
#include <string>
#include <string_view>

namespace manifold::core {

// Keyed object in a public S3 bucket. Every fetch is an independent ranged
// GET; no stream is held open between blocks.
class ObjectSource final : public TransferSource {
public:
    ObjectSource(Url url, std::string endpoint_template, std::uint32_t connect_timeout_sec);

    [[nodiscard]] std::error_code open(std::uint64_t offset) noexcept override;
    [[nodiscard]] std::uint64_t size() const noexcept override { return size_; }
    [[nodiscard]] std::expected<Block, std::error_code>
    fetch_range(std::uint64_t start, std::uint64_t end) noexcept override;
    [[nodiscard]] std::string describe() const override { return url_.full(); }

    // HTTPS URL of the object: endpoint template with {bucket} substituted,
    // followed by the percent-encoded key
    [[nodiscard]] std::string object_url() const;

    [[nodiscard]] static std::string encode_key(std::string_view key);

private:
    Url url_;
    std::string endpoint_template_;
    HttpSession session_;
    std::string target_; // object_url(), fixed at open
    std::uint64_t size_{0};
    bool opened_{false};
};

} // namespace manifold::core
