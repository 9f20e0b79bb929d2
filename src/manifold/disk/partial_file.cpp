// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/disk/partial_file.hpp>
#include <manifold/core/config.hpp>
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace manifold::disk {

std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:        return make_error_code(DiskErrc::invalid_path);
        default:            return make_error_code(fallback);
    }
}

//=============================================================================
// PartialFile
//=============================================================================

PartialFile::PartialFile(std::string destination)
    : destination_(std::move(destination))
    , path_(path_for(destination_)) {}

PartialFile::~PartialFile() {
    close();
}

PartialFile::PartialFile(PartialFile&& other) noexcept
    : destination_(std::move(other.destination_))
    , path_(std::move(other.path_))
    , fd_(std::exchange(other.fd_, -1)) {}

PartialFile& PartialFile::operator=(PartialFile&& other) noexcept {
    if (this != &other) {
        close();
        destination_ = std::move(other.destination_);
        path_ = std::move(other.path_);
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

std::string PartialFile::path_for(std::string_view destination) {
    std::string result(destination);
    result += core::PARTIAL_SUFFIX;
    return result;
}

std::uint64_t PartialFile::existing_size() const noexcept {
    struct stat st{};
    if (::stat(path_.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return 0;
    }
    return static_cast<std::uint64_t>(st.st_size);
}

std::error_code PartialFile::open() noexcept {
    if (fd_ >= 0) {
        return {};
    }
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

std::error_code PartialFile::append(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::write_error);
    }

    const auto* p = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::write(fd_, p, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return from_errno(errno, DiskErrc::write_error);
        }
        p += n;
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code PartialFile::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::write_error);
    }
    if (::fsync(fd_) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

void PartialFile::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::error_code PartialFile::promote() noexcept {
    close();
    if (std::rename(path_.c_str(), destination_.c_str()) != 0) {
        return from_errno(errno, DiskErrc::rename_failed);
    }
    return {};
}

} // namespace manifold::disk
