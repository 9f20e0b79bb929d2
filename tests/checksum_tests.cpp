// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <manifold/core/checksum.hpp>
#include <manifold/disk/error.hpp>
#include "test_support.hpp"

using namespace manifold::core;
using namespace manifold::test;

TEST_CASE("ChecksumVerifier::digest", "[checksum]") {
    TempDir dir;
    ChecksumVerifier verifier;

    SECTION("Empty file") {
        write_file(dir.file("empty"), "");
        auto md5 = verifier.digest(dir.file("empty"));
        REQUIRE(md5.has_value());
        CHECK(*md5 == MD5_EMPTY);
    }

    SECTION("Short content") {
        write_file(dir.file("abc"), "abc");
        CHECK(verifier.digest(dir.file("abc")).value() == MD5_ABC);
    }

    SECTION("Chunk size does not change the digest") {
        write_file(dir.file("fox"), "The quick brown fox jumps over the lazy dog");
        for (std::size_t chunk : {1u, 3u, 7u, 43u, 4096u}) {
            ChecksumVerifier small(chunk);
            CHECK(small.digest(dir.file("fox")).value() == MD5_FOX);
        }
    }

    SECTION("Content larger than one chunk") {
        std::string big(3 * CHECKSUM_CHUNK_SIZE + 17, 'x');
        write_file(dir.file("big"), big);
        ChecksumVerifier one_shot(big.size());
        CHECK(verifier.digest(dir.file("big")).value() == one_shot.digest(dir.file("big")).value());
    }

    SECTION("Missing file") {
        auto md5 = verifier.digest(dir.file("nope"));
        REQUIRE(!md5.has_value());
        CHECK(md5.error() == manifold::disk::DiskErrc::file_not_found);
    }
}

TEST_CASE("ChecksumVerifier::verify", "[checksum]") {
    TempDir dir;
    ChecksumVerifier verifier;
    write_file(dir.file("abc"), "abc");

    CHECK(verifier.verify(dir.file("abc"), MD5_ABC));
    CHECK(verifier.verify(dir.file("abc"), "900150983CD24FB0D6963F7D28E17F72"));
    CHECK(!verifier.verify(dir.file("abc"), MD5_EMPTY));
    CHECK(!verifier.verify(dir.file("abc"), ""));
    CHECK(!verifier.verify(dir.file("abc"), "90015098"));
    CHECK(!verifier.verify(dir.file("missing"), MD5_ABC));
}
