// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/core/object_source.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace manifold::core {

ObjectSource::ObjectSource(Url url, std::string endpoint_template, std::uint32_t connect_timeout_sec)
    : url_(std::move(url))
    , endpoint_template_(std::move(endpoint_template))
    , session_(connect_timeout_sec) {}

std::string ObjectSource::encode_key(std::string_view key) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(key.size());
    for (unsigned char c : key) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
                       || c == '-' || c == '_' || c == '.' || c == '~' || c == '/';
        if (unreserved) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0f];
        }
    }
    return out;
}

std::string ObjectSource::object_url() const {
    std::string endpoint = endpoint_template_;
    constexpr std::string_view placeholder = "{bucket}";
    auto pos = endpoint.find(placeholder);
    if (pos != std::string::npos) {
        endpoint.replace(pos, placeholder.size(), url_.bucket());
    } else {
        // Path-style endpoint without a placeholder
        if (!endpoint.ends_with('/')) endpoint += '/';
        endpoint += url_.bucket();
    }
    if (endpoint.ends_with('/')) endpoint.pop_back();
    return endpoint + "/" + encode_key(url_.key());
}

std::error_code ObjectSource::open(std::uint64_t offset) noexcept {
    opened_ = false;
    try {
        if (url_.key().empty()) {
            return make_error_code(TransferErrc::invalid_url);
        }
        target_ = object_url();
    } catch (const std::bad_alloc&) {
        return make_error_code(TransferErrc::network_error);
    }

    auto head = session_.head(target_);
    if (!head) {
        spdlog::error("Cannot reach object {} ({}): {}", url_.full(), target_, head.error().message());
        return head.error();
    }

    size_ = head->content_length;
    opened_ = true;
    spdlog::debug("Object {} is {} bytes, resuming at {}", url_.full(), size_, offset);
    return {};
}

std::expected<Block, std::error_code>
ObjectSource::fetch_range(std::uint64_t start, std::uint64_t end) noexcept {
    if (!opened_) {
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }
    if (start >= size_) {
        return Block{};
    }
    if (end < start) {
        return std::unexpected(make_error_code(TransferErrc::invalid_range));
    }

    end = std::min(end, size_ - 1);
    const std::uint64_t wanted = end - start + 1;

    auto response = session_.get(target_, start, wanted);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->body.size() != wanted) {
        spdlog::warn("Range {}-{} of {} returned {} bytes", start, end, url_.full(), response->body.size());
        return std::unexpected(make_error_code(TransferErrc::invalid_range));
    }
    return std::move(response->body);
}

} // namespace manifold::core
