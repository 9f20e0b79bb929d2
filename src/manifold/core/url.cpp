// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace manifold::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }

    url.scheme_.reserve(scheme_end);
    for (std::size_t i = 0; i < scheme_end; ++i) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }

    auto rest_start = scheme_end + 3; // Skip "://"

    auto path_start = url_str.find('/', rest_start);
    if (path_start == std::string_view::npos) {
        path_start = url_str.length();
    }

    // Object keys may legitimately contain '?' and '#'
    const bool keyed = url.scheme_ == "s3";

    auto query_start = keyed ? std::string_view::npos : url_str.find('?', rest_start);
    if (query_start == std::string_view::npos) {
        query_start = url_str.length();
    }

    auto fragment_start = keyed ? std::string_view::npos : url_str.find('#', rest_start);
    if (fragment_start == std::string_view::npos) {
        fragment_start = url_str.length();
    }

    // host_end is at the first of: /, ?, #, or end
    auto host_end = std::min({path_start, query_start, fragment_start, url_str.length()});

    // Skip userinfo (user:pass@host)
    std::size_t authority_start = rest_start;
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto bracket_start = url_str.find('[', authority_start);
    if (bracket_start != std::string_view::npos && bracket_start < host_end) {
        // IPv6 literal [::1]:port
        auto bracket_end = url_str.find(']', bracket_start);
        if (bracket_end == std::string_view::npos || bracket_end >= host_end) {
            return std::unexpected(make_error_code(TransferErrc::invalid_url));
        }
        url.host_ = std::string(url_str.substr(bracket_start, bracket_end - bracket_start + 1));
        if (bracket_end + 1 < host_end && url_str[bracket_end + 1] == ':') {
            url.port_ = std::string(url_str.substr(bracket_end + 2, host_end - bracket_end - 2));
        }
    } else {
        auto colon_pos = url_str.find(':', authority_start);
        if (colon_pos != std::string_view::npos && colon_pos < host_end) {
            url.host_ = std::string(url_str.substr(authority_start, colon_pos - authority_start));
            url.port_ = std::string(url_str.substr(colon_pos + 1, host_end - colon_pos - 1));
        } else {
            url.host_ = std::string(url_str.substr(authority_start, host_end - authority_start));
        }
    }

    if (path_start < url_str.length() && path_start < std::min(query_start, fragment_start)) {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    if (query_start < url_str.length() && query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    if (fragment_start < url_str.length()) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }

    return url;
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::string Url::key() const {
    // Path without the leading '/'
    return path_.size() > 1 ? path_.substr(1) : std::string{};
}

std::expected<std::string, std::error_code> Url::filename() const {
    auto last_slash = path_.rfind('/');
    auto name = last_slash == std::string::npos ? path_ : path_.substr(last_slash + 1);
    if (name.empty() || name == "." || name == "..") {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }
    return name;
}

} // namespace manifold::core
