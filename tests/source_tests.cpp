// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <manifold/core/client_config.hpp>
#include <manifold/core/http_session.hpp>
#include <manifold/core/object_source.hpp>
#include <manifold/core/stream_source.hpp>
#include <curl/curl.h>

using namespace manifold::core;

TEST_CASE("parse_content_range_total", "[http]") {
    CHECK(parse_content_range_total("bytes 0-99/1234") == 1234u);
    CHECK(parse_content_range_total("bytes */500") == 500u);
    CHECK(!parse_content_range_total("bytes 0-99/*").has_value());
    CHECK(!parse_content_range_total("bytes 0-99").has_value());
    CHECK(!parse_content_range_total("bytes 0-99/12x").has_value());
}

TEST_CASE("apply_response_headers", "[http]") {
    HttpResponse r;
    r.headers["content-length"] = "100";
    r.headers["content-range"] = "bytes 900-999/1000";
    r.headers["accept-ranges"] = "bytes";
    r.headers["content-type"] = "application/octet-stream";
    apply_response_headers(r);

    CHECK(r.content_length == 100);
    CHECK(r.total_length == 1000u);

    HttpResponse bare;
    bare.headers["content-length"] = "12abc";
    apply_response_headers(bare);
    CHECK(bare.content_length == 0);
    CHECK(!bare.total_length.has_value());
}

TEST_CASE("error_from_http_status", "[http]") {
    CHECK(!error_from_http_status(200));
    CHECK(!error_from_http_status(206));
    CHECK(error_from_http_status(404) == TransferErrc::not_found);
    CHECK(error_from_http_status(410) == TransferErrc::not_found);
    CHECK(error_from_http_status(403) == TransferErrc::permission_denied);
    CHECK(error_from_http_status(416) == TransferErrc::invalid_range);
    CHECK(error_from_http_status(408) == TransferErrc::timeout);
    CHECK(error_from_http_status(503) == TransferErrc::server_error);
    CHECK(error_from_http_status(400) == TransferErrc::network_error);
}

TEST_CASE("detail::error_from_curl", "[http]") {
    CHECK(!detail::error_from_curl(CURLE_OK));
    CHECK(detail::error_from_curl(CURLE_OPERATION_TIMEDOUT) == TransferErrc::timeout);
    CHECK(detail::error_from_curl(CURLE_UNSUPPORTED_PROTOCOL) == TransferErrc::unsupported_protocol);
    CHECK(detail::error_from_curl(CURLE_COULDNT_CONNECT) == TransferErrc::network_error);
}

TEST_CASE("ObjectSource::object_url", "[object]") {
    auto url = *Url::parse("s3://my-bucket/DEMO/run 1/a+b.bam");

    SECTION("Virtual-hosted template") {
        ObjectSource source(url, "https://{bucket}.s3.amazonaws.com", 5);
        CHECK(source.object_url() == "https://my-bucket.s3.amazonaws.com/DEMO/run%201/a%2Bb.bam");
        CHECK(source.describe() == "s3://my-bucket/DEMO/run 1/a+b.bam");
    }

    SECTION("Path-style endpoint") {
        ObjectSource source(url, "http://localhost:9000/", 5);
        CHECK(source.object_url() == "http://localhost:9000/my-bucket/DEMO/run%201/a%2Bb.bam");
    }

    SECTION("Key encoding") {
        CHECK(ObjectSource::encode_key("a/b_c-d.e~f") == "a/b_c-d.e~f");
        CHECK(ObjectSource::encode_key("x?y#z") == "x%3Fy%23z");
    }
}

TEST_CASE("make_source picks the source by scheme", "[source]") {
    ClientConfig config;

    auto http = make_source(*Url::parse("https://h/f"), config);
    REQUIRE(http.has_value());
    CHECK(dynamic_cast<StreamSource*>(http->get()) != nullptr);

    auto ftp = make_source(*Url::parse("ftp://h/f"), config);
    REQUIRE(ftp.has_value());
    CHECK(dynamic_cast<StreamSource*>(ftp->get()) != nullptr);

    auto s3 = make_source(*Url::parse("s3://b/k"), config);
    REQUIRE(s3.has_value());
    CHECK(dynamic_cast<ObjectSource*>(s3->get()) != nullptr);

    auto fasp = make_source(*Url::parse("fasp://h/f"), config);
    REQUIRE(!fasp.has_value());
    CHECK(fasp.error() == TransferErrc::unsupported_protocol);
}
