// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/core/endpoint_selector.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace manifold::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

std::vector<std::string> parse_priorities(std::string_view csv) {
    std::vector<std::string> tags;
    for (auto item : split(csv, ',')) {
        item = trim(item);
        if (!item.empty()) {
            tags.push_back(to_lower(item));
        }
    }
    return tags;
}

std::vector<std::string> split_urls(std::string_view csv) {
    std::vector<std::string> urls;
    for (auto item : split(csv, ',')) {
        item = trim(item);
        if (!item.empty()) {
            urls.emplace_back(item);
        }
    }
    return urls;
}

std::string rewrite_legacy_bucket(std::string_view url) {
    constexpr std::string_view marker = "HMDEMO";
    if (!to_lower(url.substr(0, 5)).starts_with("s3://") || url.find(marker) == std::string_view::npos) {
        return std::string(url);
    }

    // ["s3:", "", bucket, a, b, ..., w, x, y, z]
    auto parts = split(url, '/');
    if (parts.size() < 5) {
        return std::string(url);
    }

    std::string fixed = "s3://";
    fixed += parts[2];
    fixed += "/DEMO/";
    fixed += parts[4];
    for (std::size_t i = parts.size() - 4; i < parts.size(); ++i) {
        fixed += '/';
        fixed += parts[i];
    }
    spdlog::debug("Rewrote legacy bucket URL {} -> {}", url, fixed);
    return fixed;
}

bool EndpointSelector::matches(std::string_view url, std::string_view tag) noexcept {
    if (tag.empty() || url.size() < tag.size()) {
        return false;
    }
    for (std::size_t i = 0; i < tag.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(url[i])) != std::tolower(static_cast<unsigned char>(tag[i]))) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> EndpointSelector::effective_priorities(const std::vector<std::string>& priorities) {
    if (!priorities.empty()) {
        return priorities;
    }
    const bool cloud = probe_.in_cloud();
    const auto& order = cloud ? CLOUD_PRIORITIES : DEFAULT_PRIORITIES;
    spdlog::debug("No priorities given, using the {} default order", cloud ? "in-cloud" : "standard");
    return {order.begin(), order.end()};
}

std::vector<std::string> EndpointSelector::rank(const std::vector<std::string>& urls,
                                                const std::vector<std::string>& priorities) {
    std::vector<std::string> ranked;
    std::vector<bool> taken(urls.size(), false);

    for (const auto& tag : effective_priorities(priorities)) {
        for (std::size_t i = 0; i < urls.size(); ++i) {
            if (!taken[i] && matches(urls[i], tag)) {
                taken[i] = true;
                ranked.push_back(rewrite_legacy_bucket(urls[i]));
            }
        }
    }
    return ranked;
}

std::optional<std::string> EndpointSelector::select(const std::vector<std::string>& urls,
                                                    const std::vector<std::string>& priorities) {
    auto ranked = rank(urls, priorities);
    if (ranked.empty()) {
        return std::nullopt;
    }
    return std::move(ranked.front());
}

} // namespace manifold::core
