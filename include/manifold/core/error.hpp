// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace manifold::core {

enum class TransferErrc {
    success = 0,
    network_error,
    timeout,
    not_found,
    server_error,
    permission_denied,
    invalid_url,
    invalid_range,
    unsupported_protocol,
    resume_failed,
    checksum_mismatch,
    no_endpoint,
    invalid_manifest,
    invalid_config,
};

namespace detail {

struct TransferErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "manifold::transfer";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<TransferErrc>(ev)) {
            case TransferErrc::success:              return "Success";
            case TransferErrc::network_error:        return "Network error";
            case TransferErrc::timeout:              return "Operation timed out";
            case TransferErrc::not_found:            return "Resource not found (404)";
            case TransferErrc::server_error:         return "Server error (5xx)";
            case TransferErrc::permission_denied:    return "Permission denied";
            case TransferErrc::invalid_url:          return "Invalid URL";
            case TransferErrc::invalid_range:        return "Invalid byte range";
            case TransferErrc::unsupported_protocol: return "Unsupported protocol";
            case TransferErrc::resume_failed:        return "Resume failed";
            case TransferErrc::checksum_mismatch:    return "Checksum mismatch";
            case TransferErrc::no_endpoint:          return "No valid endpoint";
            case TransferErrc::invalid_manifest:     return "Invalid manifest";
            case TransferErrc::invalid_config:       return "Invalid configuration";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::TransferErrcCategory& transfer_errc_category() noexcept {
    static detail::TransferErrcCategory category;
    return category;
}

inline std::error_code make_error_code(TransferErrc e) noexcept {
    return {static_cast<int>(e), transfer_errc_category()};
}

// Map an HTTP status to a transfer error; 2xx and 3xx map to success
[[nodiscard]] std::error_code error_from_http_status(long status) noexcept;

} // namespace manifold::core

namespace std {

template<>
struct is_error_code_enum<manifold::core::TransferErrc> : true_type {};

} // namespace std
