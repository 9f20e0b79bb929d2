// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <manifold/core/config.hpp>
#include <manifold/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace manifold::core {

// Response status and headers (header names lower-cased)
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;
    std::uint64_t content_length{0};
    std::optional<std::uint64_t> total_length; // From "Content-Range: bytes a-b/total"
    std::vector<std::byte> body;
};

// Parse the total from a Content-Range value ("bytes 0-99/1234" or "bytes */1234")
[[nodiscard]] std::optional<std::uint64_t> parse_content_range_total(std::string_view value) noexcept;

// Fill content_length and total_length from headers
void apply_response_headers(HttpResponse& response) noexcept;

namespace detail {

// Common easy-handle setup shared with StreamSource: redirects, timeouts,
// TLS verification, header capture into *response and debug logging.
void configure_handle(void* curl, std::uint32_t connect_timeout_sec, HttpResponse* response) noexcept;

// Last response code seen on the handle (HTTP status or FTP reply code)
[[nodiscard]] std::int32_t response_code(void* curl) noexcept;

// Map a CURLcode to a transfer error
[[nodiscard]] std::error_code error_from_curl(int curl_code) noexcept;

} // namespace detail

// Blocking request helper over one reusable libcurl easy handle.
// Successive requests to the same host reuse the connection.
class HttpSession {
public:
    explicit HttpSession(std::uint32_t connect_timeout_sec = CONNECTION_TIMEOUT_SEC);
    ~HttpSession();

    // Non-copyable, movable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) noexcept;
    HttpSession& operator=(HttpSession&&) noexcept;

    // HEAD request. A non-zero timeout bounds the whole request.
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url,
         std::chrono::milliseconds timeout = std::chrono::milliseconds{0}) noexcept;

    // GET request; size > 0 asks for bytes [offset, offset + size - 1].
    // The body is returned in memory, so callers keep ranges small.
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const std::string& url,
        std::uint64_t offset = 0,
        std::uint64_t size = 0,
        std::chrono::milliseconds timeout = std::chrono::milliseconds{0}) noexcept;

    // GET that succeeds for any HTTP reply, error statuses included; only
    // transport failures (refused, unreachable, timed out) are errors
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    exchange(const std::string& url,
             std::chrono::milliseconds timeout = std::chrono::milliseconds{0}) noexcept;

    [[nodiscard]] std::uint32_t connect_timeout() const noexcept { return connect_timeout_sec_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    perform(const std::string& url, bool head_only,
            std::uint64_t offset, std::uint64_t size,
            std::chrono::milliseconds timeout,
            bool check_status = true) noexcept;

    void* handle_{nullptr}; // CURL*
    std::uint32_t connect_timeout_sec_;
};

} // namespace manifold::core
