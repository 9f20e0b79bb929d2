// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <manifold/core/transfer_driver.hpp>
#include <manifold/disk/partial_file.hpp>
#include "test_support.hpp"
#include <map>

using namespace manifold::core;
using namespace manifold::test;

namespace {

const std::string FOX = "The quick brown fox jumps over the lazy dog";

// Serves named endpoints from memory and records which were asked for
struct FakeNetwork {
    std::map<std::string, std::string> files;            // full URL -> contents
    std::map<std::string, std::error_code> open_errors;  // full URL -> failure on open
    std::map<std::string, std::uint64_t> fail_after;     // full URL -> break mid-stream
    std::vector<std::string> requested;

    SourceFactory factory() {
        return [this](const Url& url) -> std::expected<std::unique_ptr<TransferSource>, std::error_code> {
            auto full = url.full();
            requested.push_back(full);
            if (url.scheme() == "fasp") {
                return std::unexpected(make_error_code(TransferErrc::unsupported_protocol));
            }
            auto it = files.find(full);
            auto source = std::make_unique<MemorySource>(it == files.end() ? std::string{} : it->second, full);
            if (it == files.end()) {
                source->open_error = make_error_code(TransferErrc::not_found);
            }
            if (auto e = open_errors.find(full); e != open_errors.end()) {
                source->open_error = e->second;
            }
            if (auto f = fail_after.find(full); f != fail_after.end()) {
                source->fail_after = f->second;
            }
            return source;
        };
    }
};

FileEntry entry(std::string id, std::vector<std::string> urls, std::string_view md5) {
    return FileEntry{std::move(id), std::move(urls), std::string(md5), std::nullopt};
}

} // namespace

TEST_CASE("TransferDriver::destination_for", "[driver]") {
    CHECK(TransferDriver::destination_for("out", *Url::parse("s3://b/DEMO/x/f.bam")) == "out/f.bam");
    CHECK(TransferDriver::destination_for(".", *Url::parse("http://h/a/b.txt?x=1")) == "./b.txt");
    CHECK(!TransferDriver::destination_for("out", *Url::parse("http://h/a/..")).has_value());
    CHECK(!TransferDriver::destination_for("out", *Url::parse("http://h/dir/")).has_value());
}

TEST_CASE("TransferDriver - manifest run", "[driver]") {
    TempDir dir;
    FakeNetwork net;
    net.files["http://h/fox.txt"] = FOX;
    net.files["s3://bucket/abc.txt"] = "abc";

    StaticCloudProbe probe(false);
    EndpointSelector selector(probe);
    RangeDownloader downloader(8);
    ClientConfig config;
    config.destination = dir.path().string();
    TransferDriver driver(config, selector, downloader, net.factory());

    Manifest manifest = {
        entry("fox", {"ftp://mirror/fox.txt", "http://h/fox.txt"}, MD5_FOX),
        entry("nothing", {"gopher://old/x"}, MD5_ABC),
        entry("abc", {"s3://bucket/abc.txt"}, MD5_ABC),
    };

    SECTION("Entries complete independently, in order") {
        auto report = driver.run(manifest);
        REQUIRE(report.entries.size() == 3);
        CHECK(report.entries[0].id == "fox");
        CHECK(report.entries[0].status == EntryStatus::completed);
        CHECK(report.entries[0].url == "http://h/fox.txt");
        CHECK(report.entries[1].status == EntryStatus::no_endpoint);
        CHECK(report.entries[1].attempted.empty());
        CHECK(report.entries[2].status == EntryStatus::completed);
        CHECK(report.ok());
        CHECK(report.count(EntryStatus::completed) == 2);
        CHECK(read_file(dir.file("fox.txt")) == FOX);
        CHECK(read_file(dir.file("abc.txt")) == "abc");
    }

    SECTION("A second run is a no-op") {
        REQUIRE(driver.run(manifest).ok());

        auto again = driver.run(manifest);
        CHECK(again.ok());
        CHECK(again.count(EntryStatus::already_complete) == 2);
        CHECK(read_file(dir.file("fox.txt")) == FOX);
    }

    SECTION("Attempt callback sees each endpoint") {
        std::vector<std::string> attempts;
        driver.on_attempt([&](const FileEntry& e, const std::string& url) { attempts.push_back(e.id + " " + url); });
        (void)driver.run(manifest);
        CHECK(attempts == std::vector<std::string>{"fox http://h/fox.txt", "abc s3://bucket/abc.txt"});
    }
}

TEST_CASE("TransferDriver - entry without a matching endpoint is skipped", "[driver]") {
    TempDir dir;
    FakeNetwork net;
    StaticCloudProbe probe(false);
    EndpointSelector selector(probe);
    RangeDownloader downloader;
    ClientConfig config;
    config.destination = dir.path().string();
    config.priorities = parse_priorities("S3,HTTP");
    TransferDriver driver(config, selector, downloader, net.factory());

    auto report = driver.run({entry("a", {"ftp://x/a"}, MD5_ABC)});

    REQUIRE(report.entries.size() == 1);
    CHECK(report.entries[0].status == EntryStatus::no_endpoint);
    CHECK(report.entries[0].error == TransferErrc::no_endpoint);
    CHECK(report.ok());
    CHECK(net.requested.empty());
    CHECK(std::filesystem::is_empty(dir.path()));
}

TEST_CASE("TransferDriver - one failing entry does not stop the run", "[driver]") {
    TempDir dir;
    FakeNetwork net;
    net.files["http://h/good.txt"] = "abc";

    StaticCloudProbe probe(false);
    EndpointSelector selector(probe);
    RangeDownloader downloader;
    ClientConfig config;
    config.destination = dir.path().string();
    TransferDriver driver(config, selector, downloader, net.factory());

    auto report = driver.run({
        entry("bad", {"http://h/missing.txt"}, MD5_ABC),
        entry("corrupt", {"http://h/good.txt"}, MD5_FOX),
        entry("good", {"https://h/other.txt", "http://h/good.txt"}, MD5_ABC),
    });

    REQUIRE(report.entries.size() == 3);
    CHECK(report.entries[0].status == EntryStatus::source_error);
    CHECK(report.entries[0].error == TransferErrc::not_found);
    CHECK(report.entries[1].status == EntryStatus::checksum_failed);
    CHECK(report.entries[2].status == EntryStatus::completed);
    CHECK(report.entries[2].attempted.size() == 2);
    CHECK(!report.ok());
}

TEST_CASE("TransferDriver - endpoint fallback", "[driver]") {
    TempDir dir;
    FakeNetwork net;
    net.files["http://down/fox.txt"] = FOX;
    net.open_errors["http://down/fox.txt"] = make_error_code(TransferErrc::timeout);
    net.files["ftp://up/fox.txt"] = FOX;

    StaticCloudProbe probe(false);
    EndpointSelector selector(probe);
    RangeDownloader downloader(8);
    ClientConfig config;
    config.destination = dir.path().string();

    const auto fox = entry("fox", {"ftp://up/fox.txt", "http://down/fox.txt"}, MD5_FOX);

    SECTION("Unreachable endpoint falls through to the next tag") {
        TransferDriver driver(config, selector, downloader, net.factory());
        auto report = driver.transfer(fox);
        CHECK(report.status == EntryStatus::completed);
        CHECK(report.attempted == std::vector<std::string>{"http://down/fox.txt", "ftp://up/fox.txt"});
        CHECK(report.url == "ftp://up/fox.txt");
    }

    SECTION("Unsupported protocol falls through") {
        config.priorities = {"fasp", "ftp"};
        TransferDriver driver(config, selector, downloader, net.factory());
        auto report = driver.transfer(entry("fox", {"fasp://x/fox.txt", "ftp://up/fox.txt"}, MD5_FOX));
        CHECK(report.status == EntryStatus::completed);
        CHECK(report.attempted.size() == 2);
    }

    SECTION("Disabled fallback stops at the first endpoint") {
        config.fallback = false;
        TransferDriver driver(config, selector, downloader, net.factory());
        auto report = driver.transfer(fox);
        CHECK(report.status == EntryStatus::source_error);
        CHECK(report.error == TransferErrc::timeout);
        CHECK(report.attempted.size() == 1);
    }

    SECTION("Resumed transfer falls back when the first endpoint cannot open") {
        write_file(manifold::disk::PartialFile::path_for(dir.file("fox.txt")), FOX.substr(0, 10));
        net.open_errors["http://down/fox.txt"] = make_error_code(TransferErrc::resume_failed);
        TransferDriver driver(config, selector, downloader, net.factory());

        auto report = driver.transfer(fox);
        CHECK(report.status == EntryStatus::completed);
        CHECK(report.attempted == std::vector<std::string>{"http://down/fox.txt", "ftp://up/fox.txt"});
        CHECK(report.outcome.resumed_from == 10);
        CHECK(read_file(dir.file("fox.txt")) == FOX);
    }

    SECTION("Endpoint that names no file falls through") {
        TransferDriver driver(config, selector, downloader, net.factory());
        auto report = driver.transfer(entry("fox", {"http://evil/fox/..", "ftp://up/fox.txt"}, MD5_FOX));
        CHECK(report.status == EntryStatus::completed);
        CHECK(report.attempted.size() == 2);
        CHECK(net.requested == std::vector<std::string>{"ftp://up/fox.txt"});
        CHECK(read_file(dir.file("fox.txt")) == FOX);
    }

    SECTION("No fallback after bytes arrived") {
        net.open_errors.clear();
        net.fail_after["http://down/fox.txt"] = 16;
        TransferDriver driver(config, selector, downloader, net.factory());

        auto report = driver.transfer(fox);
        CHECK(report.status == EntryStatus::source_error);
        CHECK(report.attempted.size() == 1);
        CHECK(report.outcome.bytes_written == 16);

        // The next run resumes from the partial file
        net.fail_after.clear();
        auto retry = driver.transfer(fox);
        CHECK(retry.status == EntryStatus::completed);
        CHECK(retry.outcome.resumed_from == 16);
        CHECK(read_file(dir.file("fox.txt")) == FOX);
    }
}
