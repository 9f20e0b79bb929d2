// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <manifold/disk/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>

namespace manifold::disk {

// Staging file for an in-flight transfer: "<destination>.partial".
// Opened in append mode and never truncated; its size is the resume cursor.
class PartialFile {
public:
    explicit PartialFile(std::string destination);
    ~PartialFile();

    // Non-copyable, movable
    PartialFile(const PartialFile&) = delete;
    PartialFile& operator=(const PartialFile&) = delete;
    PartialFile(PartialFile&& other) noexcept;
    PartialFile& operator=(PartialFile&& other) noexcept;

    // "<destination>.partial"
    [[nodiscard]] static std::string path_for(std::string_view destination);

    // Bytes already on disk (0 when the partial file does not exist)
    [[nodiscard]] std::uint64_t existing_size() const noexcept;

    // Open for appending, creating the file if needed
    [[nodiscard]] std::error_code open() noexcept;

    // Append the whole buffer (retries short writes)
    [[nodiscard]] std::error_code append(const void* data, std::size_t size) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    // Atomically rename the partial file onto the destination
    [[nodiscard]] std::error_code promote() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& destination() const noexcept { return destination_; }

private:
    std::string destination_;
    std::string path_;
    int fd_{-1};
};

} // namespace manifold::disk
