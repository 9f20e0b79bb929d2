// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/core/stream_source.hpp>
#include <manifold/core/config.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <utility>

namespace manifold::core {

StreamSource::StreamSource(Url url, std::uint32_t connect_timeout_sec)
    : url_(std::move(url))
    , connect_timeout_sec_(connect_timeout_sec) {}

StreamSource::~StreamSource() {
    release();
}

void StreamSource::release() noexcept {
    auto* multi = static_cast<CURLM*>(multi_);
    auto* easy = static_cast<CURL*>(easy_);
    if (multi && easy) {
        curl_multi_remove_handle(multi, easy);
    }
    if (easy) {
        curl_easy_cleanup(easy);
    }
    if (multi) {
        curl_multi_cleanup(multi);
    }
    easy_ = nullptr;
    multi_ = nullptr;
}

std::size_t StreamSource::write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* self = static_cast<StreamSource*>(userdata);
    std::size_t bytes = size * nmemb;

    // Reader is far behind: let curl hold the data until we unpause
    if (self->available() >= STREAM_BUFFER_LIMIT) {
        self->paused_ = true;
        return CURL_WRITEFUNC_PAUSE;
    }

    try {
        // Drop what the reader already took before growing the buffer
        if (self->consumed_ > 0) {
            self->buffer_.erase(self->buffer_.begin(),
                                self->buffer_.begin() + static_cast<std::ptrdiff_t>(self->consumed_));
            self->consumed_ = 0;
        }
        const std::size_t offset = self->buffer_.size();
        self->buffer_.resize(offset + bytes);
        std::memcpy(self->buffer_.data() + offset, ptr, bytes);
    } catch (const std::bad_alloc&) {
        return 0; // aborts the transfer with CURLE_WRITE_ERROR
    }
    return bytes;
}

void StreamSource::pump() noexcept {
    auto* multi = static_cast<CURLM*>(multi_);

    int running = 0;
    CURLMcode mc = curl_multi_perform(multi, &running);
    if (mc != CURLM_OK) {
        done_ = true;
        result_ = CURLE_RECV_ERROR;
        return;
    }

    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi, &queued)) {
        if (msg->msg == CURLMSG_DONE) {
            done_ = true;
            result_ = msg->data.result;
        }
    }

    if (!done_ && running > 0) {
        curl_multi_poll(multi, nullptr, 0, 1000, nullptr);
    }
}

std::error_code StreamSource::open(std::uint64_t offset) noexcept {
    release();
    buffer_.clear();
    consumed_ = 0;
    paused_ = false;
    done_ = false;
    result_ = CURLE_OK;
    response_ = HttpResponse{};
    position_ = offset;
    size_ = 0;

    auto* easy = curl_easy_init();
    auto* multi = curl_multi_init();
    easy_ = easy;
    multi_ = multi;
    if (!easy || !multi) {
        release();
        return make_error_code(TransferErrc::network_error);
    }

    const std::string target = url_.full();
    detail::configure_handle(easy, connect_timeout_sec_, &response_);
    curl_easy_setopt(easy, CURLOPT_URL, target.c_str());
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, this);

    if (offset > 0) {
        // "Range: bytes=<offset>-" for HTTP, REST <offset> for FTP
        range_ = std::to_string(offset) + "-";
        curl_easy_setopt(easy, CURLOPT_RANGE, range_.c_str());
    }

    if (curl_multi_add_handle(multi, easy) != CURLM_OK) {
        release();
        return make_error_code(TransferErrc::network_error);
    }

    spdlog::debug("Opening stream {} at byte {}", target, offset);

    // Wait for the first body bytes (headers are complete by then) or the end
    while (available() == 0 && !done_) {
        pump();
    }

    const auto status = detail::response_code(easy);

    if (is_http() && status == 416) {
        return settle_unsatisfiable(offset);
    }
    if (done_ && result_ != CURLE_OK) {
        auto ec = detail::error_from_curl(result_);
        spdlog::error("Cannot open {}: {} ({})", target, ec.message(), curl_easy_strerror(static_cast<CURLcode>(result_)));
        return ec;
    }
    if (is_http()) {
        if (auto ec = error_from_http_status(status)) {
            spdlog::error("Cannot open {}: HTTP {}", target, status);
            return ec;
        }
        if (offset > 0 && status != 206) {
            // Server ignored the range; appending this body would corrupt the partial file
            spdlog::error("Server for {} does not honour byte ranges (HTTP {})", target, status);
            return make_error_code(TransferErrc::resume_failed);
        }
    }

    apply_response_headers(response_);
    if (response_.total_length) {
        size_ = *response_.total_length;
    } else if (response_.content_length > 0) {
        size_ = response_.content_length + offset;
    } else {
        curl_off_t cl = -1;
        if (curl_easy_getinfo(easy, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK && cl >= 0) {
            size_ = static_cast<std::uint64_t>(cl) + offset;
        }
    }
    return {};
}

std::error_code StreamSource::settle_unsatisfiable(std::uint64_t offset) noexcept {
    release();
    done_ = true;

    HttpSession session(connect_timeout_sec_);
    auto head = session.head(url_.full());
    if (!head) {
        return head.error();
    }
    if (head->content_length != offset) {
        spdlog::error("Resume offset {} is past the end of {} ({} bytes)", offset, url_.full(), head->content_length);
        return make_error_code(TransferErrc::invalid_range);
    }
    // Everything is already on disk; the stream is simply empty
    size_ = head->content_length;
    return {};
}

std::expected<Block, std::error_code>
StreamSource::fetch_range(std::uint64_t start, std::uint64_t end) noexcept {
    if (start != position_ || end < start) {
        return std::unexpected(make_error_code(TransferErrc::invalid_range));
    }

    const std::uint64_t wanted = end - start + 1;
    while (available() < wanted && !done_) {
        if (paused_) {
            paused_ = false;
            curl_easy_pause(static_cast<CURL*>(easy_), CURLPAUSE_CONT);
        }
        pump();
    }

    if (available() == 0) {
        if (done_ && result_ != CURLE_OK) {
            spdlog::error("Stream {} failed at byte {}: {}", url_.full(), position_,
                          curl_easy_strerror(static_cast<CURLcode>(result_)));
            return std::unexpected(detail::error_from_curl(result_));
        }
        return Block{};
    }

    const auto n = static_cast<std::size_t>(std::min<std::uint64_t>(wanted, available()));
    try {
        auto first = buffer_.begin() + static_cast<std::ptrdiff_t>(consumed_);
        Block block(first, first + static_cast<std::ptrdiff_t>(n));
        consumed_ += n;
        position_ += n;
        return block;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }
}

} // namespace manifold::core
