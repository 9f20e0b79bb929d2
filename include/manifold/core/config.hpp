// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <string_view>

namespace manifold::core {

constexpr std::size_t BLOCK_SIZE = 8192;                            // Bytes per copy-loop iteration
constexpr std::size_t CHECKSUM_CHUNK_SIZE = 4096;                   // Bytes per digest update

constexpr std::string_view PARTIAL_SUFFIX = ".partial";

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 60;
constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

// Cap on body bytes buffered ahead of the reader in a stream source
constexpr std::size_t STREAM_BUFFER_LIMIT = 256 * 1024;

// EC2 instance metadata, used only to pick the default priority order
constexpr std::string_view INSTANCE_METADATA_URL = "http://169.254.169.254/latest/meta-data/";
constexpr std::chrono::milliseconds INSTANCE_METADATA_TIMEOUT{500};
constexpr std::uint32_t INSTANCE_METADATA_RETRIES = 1;

// Anonymous public S3 access; {bucket} is substituted
constexpr std::string_view DEFAULT_S3_ENDPOINT = "https://{bucket}.s3.amazonaws.com";

} // namespace manifold::core
