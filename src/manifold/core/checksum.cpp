// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/core/checksum.hpp>
#include <manifold/disk/error.hpp>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <fstream>
#include <memory>
#include <vector>

namespace manifold::core {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string to_hex(const unsigned char* data, unsigned int len) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0f];
    }
    return out;
}

} // namespace

std::expected<std::string, std::error_code>
ChecksumVerifier::digest(std::string_view path) const noexcept {
    try {
        std::ifstream file(std::string(path), std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        MdCtxPtr ctx(EVP_MD_CTX_new());
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }

        std::vector<char> buffer(chunk_size_);
        while (file) {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto got = file.gcount();
            if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
                return std::unexpected(make_error_code(disk::DiskErrc::read_error));
            }
        }
        if (file.bad()) {
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }

        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int md_len = 0;
        if (EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }
        return to_hex(md, md_len);
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

bool ChecksumVerifier::verify(std::string_view path, std::string_view expected_hex) const noexcept {
    auto actual = digest(path);
    if (!actual) {
        spdlog::warn("Cannot checksum {}: {}", path, actual.error().message());
        return false;
    }
    if (actual->size() != expected_hex.size()) {
        return false;
    }
    for (std::size_t i = 0; i < expected_hex.size(); ++i) {
        auto want = static_cast<char>(std::tolower(static_cast<unsigned char>(expected_hex[i])));
        if ((*actual)[i] != want) {
            return false;
        }
    }
    return true;
}

} // namespace manifold::core
