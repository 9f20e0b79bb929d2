// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <manifold/core/http_session.hpp>
#include <manifold/core/transfer_source.hpp>
#include <string>

namespace manifold::core {

// Generic byte stream (http, https, ftp). One request is opened with
// "Range: bytes=<offset>-" and the body is then read sequentially; blocks are
// never re-requested. The transfer is driven through the libcurl multi
// interface so the body can be pulled a block at a time.
class StreamSource final : public TransferSource {
public:
    StreamSource(Url url, std::uint32_t connect_timeout_sec);
    ~StreamSource() override;

    StreamSource(const StreamSource&) = delete;
    StreamSource& operator=(const StreamSource&) = delete;

    [[nodiscard]] std::error_code open(std::uint64_t offset) noexcept override;
    [[nodiscard]] std::uint64_t size() const noexcept override { return size_; }

    // `start` must equal the current stream position
    [[nodiscard]] std::expected<Block, std::error_code>
    fetch_range(std::uint64_t start, std::uint64_t end) noexcept override;

    [[nodiscard]] std::string describe() const override { return url_.full(); }

private:
    static std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept;

    // Run the multi handle once, waiting up to a second for socket activity
    void pump() noexcept;

    [[nodiscard]] std::size_t available() const noexcept { return buffer_.size() - consumed_; }
    [[nodiscard]] bool is_http() const noexcept { return url_.scheme() == "http" || url_.scheme() == "https"; }

    // Offset at or past the end (HTTP 416): confirm the size with a HEAD
    [[nodiscard]] std::error_code settle_unsatisfiable(std::uint64_t offset) noexcept;

    void release() noexcept;

    Url url_;
    std::uint32_t connect_timeout_sec_;
    void* easy_{nullptr};   // CURL*
    void* multi_{nullptr};  // CURLM*
    std::string range_;
    HttpResponse response_;

    Block buffer_;
    std::size_t consumed_{0};
    bool paused_{false};
    bool done_{false};
    int result_{0};         // CURLcode once done_

    std::uint64_t position_{0};
    std::uint64_t size_{0};
};

} // namespace manifold::core
