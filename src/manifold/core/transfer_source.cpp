// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/core/transfer_source.hpp>
#include <manifold/core/client_config.hpp>
#include <manifold/core/object_source.hpp>
#include <manifold/core/stream_source.hpp>

namespace manifold::core {

std::expected<std::unique_ptr<TransferSource>, std::error_code>
make_source(const Url& url, const ClientConfig& config) noexcept {
    try {
        const auto& scheme = url.scheme();
        if (scheme == "http" || scheme == "https" || scheme == "ftp") {
            return std::make_unique<StreamSource>(url, config.connect_timeout_sec);
        }
        if (url.is_object_storage()) {
            return std::make_unique<ObjectSource>(url, config.s3_endpoint, config.connect_timeout_sec);
        }
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }
    return std::unexpected(make_error_code(TransferErrc::unsupported_protocol));
}

} // namespace manifold::core
