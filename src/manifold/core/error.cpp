// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/core/error.hpp>

namespace manifold::core {

std::error_code error_from_http_status(long status) noexcept {
    if (status < 400) {
        return {};
    }
    if (status == 404 || status == 410) {
        return make_error_code(TransferErrc::not_found);
    }
    if (status == 401 || status == 403) {
        return make_error_code(TransferErrc::permission_denied);
    }
    if (status == 416) {
        return make_error_code(TransferErrc::invalid_range);
    }
    if (status == 408) {
        return make_error_code(TransferErrc::timeout);
    }
    if (status >= 500) {
        return make_error_code(TransferErrc::server_error);
    }
    return make_error_code(TransferErrc::network_error);
}

} // namespace manifold::core
