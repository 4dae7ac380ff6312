/**
 * @file TestHttpServer.cpp
 * @brief Routing and loopback tests for net::HttpServer.
 */

#include <catch2/catch_test_macros.hpp>

#include "gpo/net/HttpServer.hpp"
#include "gpo/net/TcpSocket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <stdexcept>
#include <thread>

namespace gpo::net {

namespace {

HttpRequest makeRequest(std::string method, std::string path)
{
    HttpRequest request;
    request.method  = std::move(method);
    request.path    = path;
    request.target  = std::move(path);
    request.version = "HTTP/1.1";
    return request;
}

ServerOptions loopbackOptions()
{
    ServerOptions options;
    options.port    = 0;
    options.workers = 2;
    return options;
}

TcpStream connectTo(core::u16 port)
{
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd >= 0);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    REQUIRE(::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0);

    TcpStream stream{fd, "server"};
    REQUIRE(stream.setTimeout(std::chrono::milliseconds{2000}).has_value());
    return stream;
}

std::string readUntilClosed(TcpStream &stream)
{
    std::string out;
    std::array<char, 1024> chunk{};
    for (;;)
    {
        auto received = stream.receive(chunk);
        if (!received || *received == 0)
            break;
        out.append(chunk.data(), *received);
    }
    return out;
}

} // anonymous namespace

TEST_CASE("HttpServer dispatch maps unknown paths and methods", "[net][server]")
{
    HttpServer server{loopbackOptions()};
    server.route("POST", "/shortest", [](const HttpRequest &request) {
        HttpResponse response;
        response.body = "echo:" + request.body;
        return response;
    });
    server.route("GET", "/explode", [](const HttpRequest &) -> HttpResponse {
        throw std::runtime_error{"boom"};
    });

    auto ok = makeRequest("POST", "/shortest");
    ok.body = "x";
    REQUIRE(server.dispatch(ok).status == 200);
    REQUIRE(server.dispatch(ok).body == "echo:x");

    REQUIRE(server.dispatch(makeRequest("GET", "/missing")).status == 404);

    const HttpResponse wrongMethod = server.dispatch(makeRequest("GET", "/shortest"));
    REQUIRE(wrongMethod.status == 405);
    bool hasAllow = false;
    for (const auto &[name, value] : wrongMethod.headers)
        hasAllow = hasAllow || (name == "Allow" && value == "POST");
    REQUIRE(hasAllow);

    REQUIRE(server.dispatch(makeRequest("GET", "/explode")).status == 500);
}

TEST_CASE("HttpServer uses the installed error responder", "[net][server]")
{
    HttpServer server{loopbackOptions()};
    server.setErrorResponder([](core::u16 status, std::string_view message) {
        return HttpResponse::json(status, "{\"error\":\"" + std::string{message} + "\"}");
    });

    const HttpResponse response = server.dispatch(makeRequest("GET", "/nope"));
    REQUIRE(response.status == 404);
    REQUIRE(response.body == "{\"error\":\"no route for /nope\"}");
}

TEST_CASE("HttpServer serves requests over loopback", "[net][server]")
{
    HttpServer server{loopbackOptions()};
    server.route("POST", "/echo", [](const HttpRequest &request) {
        return HttpResponse::json(200, request.body);
    });
    REQUIRE(server.start().has_value());
    REQUIRE(server.running());
    REQUIRE(server.port() != 0);

    SECTION("single request")
    {
        TcpStream client = connectTo(server.port());
        REQUIRE(client.sendAll("POST /echo HTTP/1.1\r\nContent-Length: 4\r\nConnection: close\r\n\r\n[42]").has_value());

        const std::string reply = readUntilClosed(client);
        REQUIRE(reply.starts_with("HTTP/1.1 200 OK\r\n"));
        REQUIRE(reply.find("Content-Type: application/json\r\n") != std::string::npos);
        REQUIRE(reply.ends_with("\r\n\r\n[42]"));
    }

    SECTION("pipelined requests on one connection")
    {
        TcpStream client = connectTo(server.port());
        REQUIRE(client.sendAll("POST /echo HTTP/1.1\r\nContent-Length: 1\r\n\r\nA"
                               "POST /echo HTTP/1.1\r\nContent-Length: 1\r\nConnection: close\r\n\r\nB")
                    .has_value());

        const std::string reply = readUntilClosed(client);
        const auto first  = reply.find("\r\n\r\nA");
        const auto second = reply.find("\r\n\r\nB");
        REQUIRE(first != std::string::npos);
        REQUIRE(second != std::string::npos);
        REQUIRE(first < second);
    }

    SECTION("malformed request")
    {
        TcpStream client = connectTo(server.port());
        REQUIRE(client.sendAll("NOT HTTP\r\n\r\n").has_value());
        const std::string reply = readUntilClosed(client);
        REQUIRE(reply.starts_with("HTTP/1.1 400 Bad Request\r\n"));
    }

    server.stop();
    REQUIRE_FALSE(server.running());
}

TEST_CASE("HttpServer stop releases a waiting thread", "[net][server]")
{
    HttpServer server{loopbackOptions()};
    REQUIRE(server.start().has_value());

    std::thread stopper{[&server] {
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        server.stop();
    }};
    server.wait();
    stopper.join();
    REQUIRE_FALSE(server.running());
}

} // namespace gpo::net
