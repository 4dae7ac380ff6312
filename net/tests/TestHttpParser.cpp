/**
 * @file TestHttpParser.cpp
 * @brief Unit tests for net::HttpParser and HTTP message helpers.
 */

#include <catch2/catch_test_macros.hpp>

#include "gpo/net/HttpParser.hpp"

namespace gpo::net {

TEST_CASE("HttpParser parses a request split across reads", "[net][http]")
{
    HttpParser parser;

    auto partial = parser.feed("POST /shortest?trace=1 HTTP/1.1\r\nHost: localhost\r\nContent-Le");
    REQUIRE(partial.has_value());
    REQUIRE_FALSE(*partial);

    partial = parser.feed("ngth: 7\r\nContent-Type: application/json\r\n\r\n{\"a\":");
    REQUIRE(partial.has_value());
    REQUIRE_FALSE(*partial);

    auto complete = parser.feed("1}");
    REQUIRE(complete.has_value());
    REQUIRE(*complete);

    const HttpRequest request = parser.take();
    REQUIRE(request.method == "POST");
    REQUIRE(request.target == "/shortest?trace=1");
    REQUIRE(request.path == "/shortest");
    REQUIRE(request.version == "HTTP/1.1");
    REQUIRE(request.body == "{\"a\":1}");
    REQUIRE(request.header("content-type").value() == "application/json");
    REQUIRE(request.keepAlive());
    REQUIRE_FALSE(parser.hasBufferedData());
}

TEST_CASE("HttpParser keeps pipelined requests", "[net][http]")
{
    HttpParser parser;
    auto ready = parser.feed("GET /health HTTP/1.1\r\n\r\nGET /health HTTP/1.0\r\nConnection: keep-alive\r\n\r\n");
    REQUIRE(ready.has_value());
    REQUIRE(*ready);

    const HttpRequest first = parser.take();
    REQUIRE(first.version == "HTTP/1.1");
    REQUIRE(parser.hasBufferedData());

    auto next = parser.feed({});
    REQUIRE(next.has_value());
    REQUIRE(*next);
    const HttpRequest second = parser.take();
    REQUIRE(second.version == "HTTP/1.0");
    REQUIRE(second.keepAlive());
}

TEST_CASE("HttpParser rejects malformed requests", "[net][http]")
{
    const auto reject = [](std::string_view raw) {
        HttpParser parser;
        auto result = parser.feed(raw);
        REQUIRE_FALSE(result.has_value());
        return result.error().code();
    };

    REQUIRE(reject("GARBAGE\r\n\r\n") == core::ErrorCode::kProtocolViolation);
    REQUIRE(reject("GET shortest HTTP/1.1\r\n\r\n") == core::ErrorCode::kProtocolViolation);
    REQUIRE(reject("GET / HTTP/2.0\r\n\r\n") == core::ErrorCode::kProtocolViolation);
    REQUIRE(reject("GET / HTTP/1.1\r\nno colon here\r\n\r\n") == core::ErrorCode::kProtocolViolation);
    REQUIRE(reject("POST / HTTP/1.1\r\nContent-Length: ten\r\n\r\n") == core::ErrorCode::kProtocolViolation);
    REQUIRE(reject("POST / HTTP/1.1\r\nContent-Length: 2\r\nContent-Length: 3\r\n\r\n") ==
            core::ErrorCode::kProtocolViolation);
    REQUIRE(reject("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n") == core::ErrorCode::kProtocolViolation);
}

TEST_CASE("HttpParser enforces size limits", "[net][http]")
{
    SECTION("body")
    {
        HttpParser parser{1024, 16};
        auto result = parser.feed("POST / HTTP/1.1\r\nContent-Length: 17\r\n\r\n");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kPayloadTooLarge);
    }

    SECTION("head")
    {
        HttpParser parser{64, 16};
        auto result = parser.feed("GET / HTTP/1.1\r\nX-Padding: " + std::string(100, 'x'));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kPayloadTooLarge);
    }
}

TEST_CASE("HttpResponse serializes status line and framing headers", "[net][http]")
{
    HttpResponse response = HttpResponse::json(404, "{}");
    response.setHeader("content-type", "application/problem+json");

    const std::string wire = response.serialize(false);
    REQUIRE(wire.starts_with("HTTP/1.1 404 Not Found\r\n"));
    REQUIRE(wire.find("content-type: application/problem+json\r\n") == std::string::npos);
    REQUIRE(wire.find("Content-Type: application/problem+json\r\n") != std::string::npos);
    REQUIRE(wire.find("Content-Length: 2\r\n") != std::string::npos);
    REQUIRE(wire.find("Connection: close\r\n") != std::string::npos);
    REQUIRE(wire.ends_with("\r\n\r\n{}"));
}

} // namespace gpo::net
