// Warden HTTP Forwarder Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <zlib.h>

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../../src/gateway/forwarder.hpp"
#include "../../src/http/parser.hpp"
#include "test_support.hpp"

using namespace warden;
using namespace warden::gateway;
using namespace std::chrono_literals;

namespace {

/// Inbound request parsed from raw bytes; the views stay valid with the fixture
struct ParsedRequest {
    std::vector<uint8_t> raw;
    http::Request request;

    explicit ParsedRequest(std::string_view text) : raw(text.begin(), text.end()) {
        http::Parser parser;
        auto [result, consumed] = parser.parse_request(raw, request);
        REQUIRE(result == http::ParseResult::Complete);
        (void)consumed;
    }
};

struct ForwarderFixture {
    control::BackendConfig backend;
    control::ProxyConfig proxy;
    control::ProxyMetrics metrics;

    explicit ForwarderFixture(uint16_t port) {
        backend.host = "127.0.0.1";
        backend.port = port;
        proxy.upstream_timeout_ms = 3000;
    }

    Forwarder forwarder() { return Forwarder(backend, proxy, &metrics); }
};

std::string gzip(std::string_view input) {
    z_stream stream{};
    REQUIRE(deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8,
                         Z_DEFAULT_STRATEGY) == Z_OK);
    std::string output(deflateBound(&stream, input.size()) + 32, '\0');
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());
    REQUIRE(deflate(&stream, Z_FINISH) == Z_STREAM_END);
    output.resize(stream.total_out);
    deflateEnd(&stream);
    return output;
}

size_t count_headers(const ProxyResponse& response, std::string_view name) {
    size_t count = 0;
    for (const auto& [key, value] : response.headers) {
        if (http::header_name_equals(key, name)) {
            ++count;
        }
    }
    return count;
}

}  // namespace

TEST_CASE("Backend response is relayed", "[gateway][forwarder]") {
    testing::LoopbackServer backend([](int fd) {
        (void)testing::read_request(fd);
        testing::write_all(fd,
                           "HTTP/1.1 201 Created\r\n"
                           "Content-Type: application/json\r\n"
                           "Set-Cookie: a=1\r\n"
                           "Set-Cookie: b=2\r\n"
                           "X-Request-Id: abc\r\n"
                           "Connection: keep-alive\r\n"
                           "Content-Length: 15\r\n"
                           "\r\n"
                           "{\"status\":\"ok\"}");
    });

    ForwarderFixture fixture(backend.port());
    ParsedRequest inbound("GET /api/items HTTP/1.1\r\nHost: localhost:5000\r\n\r\n");

    auto response = fixture.forwarder().forward(inbound.request);

    REQUIRE(response.status == 201);
    REQUIRE(response.reason == "Created");
    REQUIRE(response.body_view() == R"({"status":"ok"})");
    REQUIRE(response.get_header("content-type") == "application/json");
    REQUIRE(response.get_header("X-Request-Id") == "abc");
    REQUIRE(count_headers(response, "Set-Cookie") == 2);
    REQUIRE(count_headers(response, "Content-Length") == 0);
    REQUIRE(count_headers(response, "Connection") == 0);
    REQUIRE(fixture.metrics.snapshot().proxy_errors == 0);
}

TEST_CASE("Request is rewritten for the backend", "[gateway][forwarder]") {
    std::mutex mutex;
    std::string seen;
    testing::LoopbackServer backend([&](int fd) {
        auto request = testing::read_request(fd);
        {
            std::lock_guard<std::mutex> lock(mutex);
            seen = request;
        }
        testing::respond(fd, 200, "ok");
    });

    ForwarderFixture fixture(backend.port());
    ParsedRequest inbound(
        "POST /api/orders?page=2&sort=desc HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "X-Trace: 1\r\n"
        "Accept: text/plain\r\n"
        "Accept: application/json\r\n"
        "Cookie: session=abc123\r\n"
        "Cookie: theme=dark; lang=en\r\n"
        "Connection: keep-alive\r\n"
        "Expect: 100-continue\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n");

    auto response = fixture.forwarder().forward(inbound.request);
    REQUIRE(response.status == 200);

    std::lock_guard<std::mutex> lock(mutex);
    std::string expected_host = "Host: 127.0.0.1:" + std::to_string(backend.port()) + "\r\n";

    REQUIRE(seen.starts_with("POST /api/orders?page=2&sort=desc HTTP/1.1\r\n"));
    REQUIRE(seen.find(expected_host) != std::string::npos);
    REQUIRE(seen.find("example.com") == std::string::npos);
    REQUIRE(seen.find("X-Trace: 1\r\n") != std::string::npos);
    REQUIRE(seen.find("Accept: text/plain\r\nAccept: application/json\r\n") !=
            std::string::npos);
    REQUIRE(seen.find("Cookie: session=abc123\r\nCookie: theme=dark; lang=en\r\n") !=
            std::string::npos);
    REQUIRE(seen.find("Connection: close\r\n") != std::string::npos);
    REQUIRE(seen.find("keep-alive") == std::string::npos);
    REQUIRE(seen.find("Expect") == std::string::npos);
    REQUIRE(seen.find("chunked") == std::string::npos);
    REQUIRE(seen.find("Content-Length: 11\r\n") != std::string::npos);
    REQUIRE(seen.ends_with("\r\n\r\nhello world"));
}

TEST_CASE("Every method is forwarded", "[gateway][forwarder]") {
    testing::LoopbackServer backend([](int fd) {
        auto request = testing::read_request(fd);
        std::string method = request.substr(0, request.find(' '));
        if (method == "HEAD") {
            testing::write_all(fd,
                               "HTTP/1.1 200 OK\r\nX-Method: HEAD\r\nContent-Length: 42\r\n\r\n");
            return;
        }
        testing::respond(fd, 200, method, "X-Method: " + method + "\r\n");
    });

    ForwarderFixture fixture(backend.port());
    auto forwarder = fixture.forwarder();

    for (std::string method : {"GET", "POST", "PUT", "DELETE", "PATCH", "OPTIONS"}) {
        ParsedRequest inbound(method + " /resource HTTP/1.1\r\nHost: x\r\nContent-Length: 0\r\n\r\n");
        auto response = forwarder.forward(inbound.request);
        REQUIRE(response.status == 200);
        REQUIRE(response.get_header("X-Method") == method);
        REQUIRE(response.body_view() == method);
    }

    SECTION("HEAD responses carry no body") {
        ParsedRequest inbound("HEAD /resource HTTP/1.1\r\nHost: x\r\n\r\n");
        auto response = forwarder.forward(inbound.request);
        REQUIRE(response.status == 200);
        REQUIRE(response.get_header("X-Method") == "HEAD");
        REQUIRE(response.body.empty());
    }
}

TEST_CASE("Redirects are relayed, not followed", "[gateway][forwarder]") {
    testing::LoopbackServer backend([](int fd) {
        (void)testing::read_request(fd);
        testing::respond(fd, 302, "", "Location: /login\r\n");
    });

    ForwarderFixture fixture(backend.port());
    ParsedRequest inbound("GET /dashboard HTTP/1.1\r\nHost: x\r\n\r\n");

    auto response = fixture.forwarder().forward(inbound.request);

    REQUIRE(response.status == 302);
    REQUIRE(response.get_header("Location") == "/login");
    REQUIRE(backend.connections() == 1);
}

TEST_CASE("Backend errors become 502 responses", "[gateway][forwarder]") {
    SECTION("nothing listening, for every method") {
        ForwarderFixture fixture(testing::unused_port());
        auto forwarder = fixture.forwarder();

        for (std::string method : {"GET", "POST", "PUT", "DELETE", "PATCH", "HEAD", "OPTIONS"}) {
            ParsedRequest inbound(method + " /api HTTP/1.1\r\nHost: x\r\n\r\n");
            auto response = forwarder.forward(inbound.request);

            REQUIRE(response.status == 502);
            REQUIRE(response.body_view().starts_with("Proxy error: "));
            REQUIRE(response.get_header("Content-Type").starts_with("text/plain"));
        }
        REQUIRE(fixture.metrics.snapshot().proxy_errors == 7);
    }

    SECTION("backend closes without answering") {
        testing::LoopbackServer backend([](int fd) { (void)testing::read_request(fd); });
        ForwarderFixture fixture(backend.port());
        ParsedRequest inbound("GET / HTTP/1.1\r\nHost: x\r\n\r\n");

        auto response = fixture.forwarder().forward(inbound.request);
        REQUIRE(response.status == 502);
        REQUIRE(response.body_view().find("without a response") != std::string_view::npos);
    }

    SECTION("backend answers garbage") {
        testing::LoopbackServer backend([](int fd) {
            (void)testing::read_request(fd);
            testing::write_all(fd, "NOT HTTP AT ALL\r\n\r\n");
        });
        ForwarderFixture fixture(backend.port());
        ParsedRequest inbound("GET / HTTP/1.1\r\nHost: x\r\n\r\n");

        REQUIRE(fixture.forwarder().forward(inbound.request).status == 502);
    }

    SECTION("backend is too slow") {
        testing::LoopbackServer backend([](int fd) {
            (void)testing::read_request(fd);
            std::this_thread::sleep_for(1s);
        });
        ForwarderFixture fixture(backend.port());
        fixture.proxy.upstream_timeout_ms = 200;
        ParsedRequest inbound("GET / HTTP/1.1\r\nHost: x\r\n\r\n");

        auto started = std::chrono::steady_clock::now();
        auto response = fixture.forwarder().forward(inbound.request);

        REQUIRE(response.status == 502);
        REQUIRE(std::chrono::steady_clock::now() - started < 900ms);
    }
}

TEST_CASE("Encoded backend bodies are relayed decoded", "[gateway][forwarder]") {
    std::string json = R"([{"symbol":"AAPL","price":189.5},{"symbol":"MSFT","price":411.2}])";
    std::string compressed = gzip(json);

    testing::LoopbackServer backend([&](int fd) {
        (void)testing::read_request(fd);
        testing::respond(fd, 200, compressed,
                         "Content-Type: application/json\r\nContent-Encoding: gzip\r\n"
                         "Vary: Accept-Encoding\r\n");
    });

    ForwarderFixture fixture(backend.port());
    ParsedRequest inbound("GET /quotes HTTP/1.1\r\nHost: x\r\nAccept-Encoding: gzip\r\n\r\n");

    auto response = fixture.forwarder().forward(inbound.request);

    REQUIRE(response.status == 200);
    REQUIRE(response.body_view() == json);
    REQUIRE(count_headers(response, "Content-Encoding") == 0);
    REQUIRE(response.get_header("Vary") == "Accept-Encoding");
}

TEST_CASE("Bodies in unknown codings are relayed as sent", "[gateway][forwarder]") {
    std::string payload("\x1f\x9d\x90\x41\x00\x03", 6);

    testing::LoopbackServer backend([&](int fd) {
        (void)testing::read_request(fd);
        testing::respond(fd, 200, payload, "Content-Encoding: compress\r\n");
    });

    ForwarderFixture fixture(backend.port());
    ParsedRequest inbound("GET /archive HTTP/1.1\r\nHost: x\r\n\r\n");

    auto response = fixture.forwarder().forward(inbound.request);

    REQUIRE(response.status == 200);
    REQUIRE(response.body_view() == payload);
    REQUIRE(count_headers(response, "Content-Encoding") == 0);
    REQUIRE(fixture.metrics.snapshot().proxy_errors == 0);
}

TEST_CASE("Corrupt encoded bodies become 502", "[gateway][forwarder]") {
    testing::LoopbackServer backend([](int fd) {
        (void)testing::read_request(fd);
        testing::respond(fd, 200, "definitely not gzip", "Content-Encoding: gzip\r\n");
    });

    ForwarderFixture fixture(backend.port());
    ParsedRequest inbound("GET /quotes HTTP/1.1\r\nHost: x\r\n\r\n");

    auto response = fixture.forwarder().forward(inbound.request);

    REQUIRE(response.status == 502);
    REQUIRE(response.body_view().starts_with("Proxy error: "));
    REQUIRE(fixture.metrics.snapshot().proxy_errors == 1);
}

TEST_CASE("Response framing variants", "[gateway][forwarder]") {
    SECTION("chunked body") {
        testing::LoopbackServer backend([](int fd) {
            (void)testing::read_request(fd);
            testing::write_all(fd,
                               "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                               "4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n");
        });
        ForwarderFixture fixture(backend.port());
        ParsedRequest inbound("GET / HTTP/1.1\r\nHost: x\r\n\r\n");

        auto response = fixture.forwarder().forward(inbound.request);
        REQUIRE(response.body_view() == "Wikipedia");
        REQUIRE(count_headers(response, "Transfer-Encoding") == 0);
    }

    SECTION("body delimited by connection close") {
        testing::LoopbackServer backend([](int fd) {
            (void)testing::read_request(fd);
            testing::write_all(fd, "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n\r\nuntil eof");
        });
        ForwarderFixture fixture(backend.port());
        ParsedRequest inbound("GET / HTTP/1.1\r\nHost: x\r\n\r\n");

        auto response = fixture.forwarder().forward(inbound.request);
        REQUIRE(response.status == 200);
        REQUIRE(response.body_view() == "until eof");
    }

    SECTION("interim 100 Continue is skipped") {
        testing::LoopbackServer backend([](int fd) {
            (void)testing::read_request(fd);
            testing::write_all(fd, "HTTP/1.1 100 Continue\r\n\r\n");
            testing::respond(fd, 200, "final");
        });
        ForwarderFixture fixture(backend.port());
        ParsedRequest inbound("PUT /upload HTTP/1.1\r\nHost: x\r\nContent-Length: 2\r\n\r\nhi");

        auto response = fixture.forwarder().forward(inbound.request);
        REQUIRE(response.status == 200);
        REQUIRE(response.body_view() == "final");
    }
}

TEST_CASE("Backend request serialization", "[gateway][forwarder]") {
    SECTION("GET without body has no Content-Length") {
        ParsedRequest inbound("GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n");
        auto text = Forwarder::build_backend_request(inbound.request, "127.0.0.1", 5001);

        REQUIRE(text == "GET /health HTTP/1.1\r\n"
                        "Host: 127.0.0.1:5001\r\n"
                        "Connection: close\r\n"
                        "\r\n");
    }

    SECTION("empty POST declares a zero length") {
        ParsedRequest inbound("POST /logout HTTP/1.1\r\nHost: localhost\r\nContent-Length: 0\r\n\r\n");
        auto text = Forwarder::build_backend_request(inbound.request, "127.0.0.1", 5001);
        REQUIRE(text.find("Content-Length: 0\r\n") != std::string::npos);
    }

    SECTION("absolute-form target") {
        ParsedRequest inbound("GET http://example.com/a/b?c=d HTTP/1.1\r\nHost: example.com\r\n\r\n");
        auto text = Forwarder::build_backend_request(inbound.request, "127.0.0.1", 5001);
        REQUIRE(text.starts_with("GET /a/b?c=d HTTP/1.1\r\n"));
    }

    SECTION("proxy error body") {
        auto response = Forwarder::proxy_error("connection refused");
        REQUIRE(response.status == 502);
        REQUIRE(response.reason == "Bad Gateway");
        REQUIRE(response.body_view() == "Proxy error: connection refused");
    }

    SECTION("excluded response headers") {
        REQUIRE(is_excluded_response_header("Content-Encoding"));
        REQUIRE(is_excluded_response_header("content-length"));
        REQUIRE(is_excluded_response_header("TRANSFER-ENCODING"));
        REQUIRE(is_excluded_response_header("Connection"));
        REQUIRE_FALSE(is_excluded_response_header("Content-Type"));
        REQUIRE_FALSE(is_excluded_response_header("Set-Cookie"));
    }
}
