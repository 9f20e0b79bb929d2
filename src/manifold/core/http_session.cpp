// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/core/http_session.hpp>
#include <manifold/core/log.hpp>
#include <curl/curl.h>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <new>
#include <utility>

namespace manifold::core {

namespace {

// Header callback: keeps only the headers of the last response in a redirect chain
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) noexcept {
    std::size_t total = size * nitems;
    auto* response = static_cast<HttpResponse*>(userdata);
    if (!response) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        response->headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    try {
        std::string lower_name;
        lower_name.reserve(name.size());
        for (char c : name) {
            lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        response->headers[lower_name] = std::string(value);
    } catch (const std::bad_alloc&) {
        return 0; // aborts the transfer with CURLE_WRITE_ERROR
    }
    return total;
}

int debug_callback(CURL*, curl_infotype type, char* data, std::size_t size, void* userptr) {
    auto* logger = static_cast<spdlog::logger*>(userptr);
    if (!logger) return 0;

    std::string_view text(data, size);
    while (!text.empty() && (text.back() == '\r' || text.back() == '\n')) {
        text.remove_suffix(1);
    }
    switch (type) {
        case CURLINFO_TEXT:       logger->debug("* {}", text); break;
        case CURLINFO_HEADER_OUT: logger->debug("> {}", text); break;
        case CURLINFO_HEADER_IN:  logger->debug("< {}", text); break;
        default: break;
    }
    return 0;
}

std::size_t body_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) noexcept {
    auto* body = static_cast<std::vector<std::byte>*>(userdata);
    std::size_t total = size * nitems;
    try {
        const std::size_t offset = body->size();
        body->resize(offset + total);
        std::memcpy(body->data() + offset, ptr, total);
    } catch (const std::bad_alloc&) {
        return 0; // aborts the transfer with CURLE_WRITE_ERROR
    }
    return total;
}

bool is_http(const std::string& url) noexcept {
    return url.size() >= 4
        && std::tolower(static_cast<unsigned char>(url[0])) == 'h'
        && std::tolower(static_cast<unsigned char>(url[1])) == 't'
        && std::tolower(static_cast<unsigned char>(url[2])) == 't'
        && std::tolower(static_cast<unsigned char>(url[3])) == 'p';
}

} // namespace

std::optional<std::uint64_t> parse_content_range_total(std::string_view value) noexcept {
    auto slash = value.rfind('/');
    if (slash == std::string_view::npos || slash + 1 >= value.size()) {
        return std::nullopt;
    }
    auto total = value.substr(slash + 1);
    if (total == "*") {
        return std::nullopt;
    }
    std::uint64_t result = 0;
    for (char c : total) {
        if (c < '0' || c > '9') return std::nullopt;
        result = result * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return result;
}

void apply_response_headers(HttpResponse& response) noexcept {
    auto cl_it = response.headers.find("content-length");
    if (cl_it != response.headers.end() && !cl_it->second.empty()) {
        char* end = nullptr;
        unsigned long long val = std::strtoull(cl_it->second.c_str(), &end, 10);
        response.content_length = (end == cl_it->second.c_str() + cl_it->second.size())
            ? static_cast<std::uint64_t>(val) : 0;
    }

    auto cr_it = response.headers.find("content-range");
    if (cr_it != response.headers.end()) {
        response.total_length = parse_content_range_total(cr_it->second);
    }
}

namespace detail {

void configure_handle(void* handle, std::uint32_t connect_timeout_sec, HttpResponse* response) noexcept {
    auto* curl = static_cast<CURL*>(handle);

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, response);

    auto logger = log::curl_logger();
    if (logger && logger->should_log(spdlog::level::debug)) {
        curl_easy_setopt(curl, CURLOPT_DEBUGFUNCTION, debug_callback);
        curl_easy_setopt(curl, CURLOPT_DEBUGDATA, logger.get());
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }
}

std::int32_t response_code(void* handle) noexcept {
    long code = 0;
    curl_easy_getinfo(static_cast<CURL*>(handle), CURLINFO_RESPONSE_CODE, &code);
    return static_cast<std::int32_t>(code);
}

std::error_code error_from_curl(int curl_code) noexcept {
    switch (static_cast<CURLcode>(curl_code)) {
        case CURLE_OK:                      return {};
        case CURLE_UNSUPPORTED_PROTOCOL:    return make_error_code(TransferErrc::unsupported_protocol);
        case CURLE_URL_MALFORMAT:           return make_error_code(TransferErrc::invalid_url);
        case CURLE_OPERATION_TIMEDOUT:      return make_error_code(TransferErrc::timeout);
        case CURLE_REMOTE_FILE_NOT_FOUND:   return make_error_code(TransferErrc::not_found);
        case CURLE_REMOTE_ACCESS_DENIED:
        case CURLE_LOGIN_DENIED:            return make_error_code(TransferErrc::permission_denied);
        case CURLE_RANGE_ERROR:
        case CURLE_BAD_DOWNLOAD_RESUME:     return make_error_code(TransferErrc::resume_failed);
        default:                            return make_error_code(TransferErrc::network_error);
    }
}

} // namespace detail

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(std::uint32_t connect_timeout_sec)
    : connect_timeout_sec_(connect_timeout_sec) {}

HttpSession::~HttpSession() {
    if (handle_) {
        curl_easy_cleanup(static_cast<CURL*>(handle_));
    }
}

HttpSession::HttpSession(HttpSession&& other) noexcept
    : handle_(std::exchange(other.handle_, nullptr))
    , connect_timeout_sec_(other.connect_timeout_sec_) {}

HttpSession& HttpSession::operator=(HttpSession&& other) noexcept {
    if (this != &other) {
        if (handle_) {
            curl_easy_cleanup(static_cast<CURL*>(handle_));
        }
        handle_ = std::exchange(other.handle_, nullptr);
        connect_timeout_sec_ = other.connect_timeout_sec_;
    }
    return *this;
}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url, std::chrono::milliseconds timeout) noexcept {
    return perform(url, true, 0, 0, timeout);
}

std::expected<HttpResponse, std::error_code>
HttpSession::get(const std::string& url,
                 std::uint64_t offset,
                 std::uint64_t size,
                 std::chrono::milliseconds timeout) noexcept {
    return perform(url, false, offset, size, timeout);
}

std::expected<HttpResponse, std::error_code>
HttpSession::exchange(const std::string& url, std::chrono::milliseconds timeout) noexcept {
    return perform(url, false, 0, 0, timeout, false);
}

std::expected<HttpResponse, std::error_code>
HttpSession::perform(const std::string& url, bool head_only,
                     std::uint64_t offset, std::uint64_t size,
                     std::chrono::milliseconds timeout,
                     bool check_status) noexcept {
    if (!handle_) {
        handle_ = curl_easy_init();
        if (!handle_) {
            return std::unexpected(make_error_code(TransferErrc::network_error));
        }
    } else {
        // Keeps the live connection and caches, drops previous options
        curl_easy_reset(static_cast<CURL*>(handle_));
    }
    auto* curl = static_cast<CURL*>(handle_);

    HttpResponse response{};
    try {
        detail::configure_handle(curl, connect_timeout_sec_, &response);
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());

        if (timeout.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        }

        std::string range;
        if (head_only) {
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        } else {
            if (size > 0) {
                range = std::to_string(offset) + "-" + std::to_string(offset + size - 1);
                curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
            }
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, body_callback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        }

        CURLcode result = curl_easy_perform(curl);
        response.status_code = detail::response_code(curl);

        if (result != CURLE_OK) {
            return std::unexpected(detail::error_from_curl(result));
        }
        if (check_status && is_http(url)) {
            if (auto ec = error_from_http_status(response.status_code)) {
                return std::unexpected(ec);
            }
        }

        apply_response_headers(response);
        if (!head_only && response.content_length == 0) {
            response.content_length = response.body.size();
        }
        if (head_only && response.content_length == 0) {
            // FTP and some servers only report the size through curl
            curl_off_t cl = -1;
            if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK && cl > 0) {
                response.content_length = static_cast<std::uint64_t>(cl);
            }
        }
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }

    return response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace manifold::core
