// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <manifold/core/error.hpp>
#include <string>
#include <string_view>
#include <expected>

namespace manifold::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }
    [[nodiscard]] const std::string& fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]

    // s3://bucket/key addressing
    [[nodiscard]] bool is_object_storage() const noexcept { return scheme_ == "s3"; }
    [[nodiscard]] const std::string& bucket() const noexcept { return host_; }
    [[nodiscard]] std::string key() const;

    // Last path segment. Empty, "." and ".." do not name a file and fail
    // with invalid_url.
    [[nodiscard]] std::expected<std::string, std::error_code> filename() const;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

} // namespace manifold::core
