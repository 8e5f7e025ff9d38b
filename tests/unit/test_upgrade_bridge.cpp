/*
 * Copyright 2025 Warden Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Warden Upgrade Bridge Tests

#include <sys/socket.h>
#include <unistd.h>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../../src/gateway/upgrade_bridge.hpp"
#include "../../src/http/parser.hpp"
#include "../../src/http/websocket.hpp"
#include "test_support.hpp"

using namespace warden;
using namespace warden::gateway;
using namespace warden::http;
using namespace std::chrono_literals;

namespace {

constexpr const char* kClientHandshake =
    "GET /ws?token=abc HTTP/1.1\r\n"
    "Host: localhost:5000\r\n"
    "Upgrade: websocket\r\n"
    "Connection: Upgrade\r\n"
    "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
    "Sec-WebSocket-Version: 13\r\n"
    "Origin: http://localhost:5000\r\n"
    "Cookie: session=42\r\n"
    "\r\n";

struct ParsedHandshake {
    std::vector<uint8_t> raw;
    Request request;

    explicit ParsedHandshake(std::string_view text) : raw(text.begin(), text.end()) {
        Parser parser;
        auto [result, consumed] = parser.parse_request(raw, request);
        REQUIRE(result == ParseResult::Complete);
        (void)consumed;
    }
};

Message text_message(std::string_view payload) {
    Message message;
    message.opcode = WebSocketOpcode::TEXT;
    message.payload.assign(payload.begin(), payload.end());
    return message;
}

std::string text(const Message& message) {
    return std::string(message.payload.begin(), message.payload.end());
}

/// Answer a client handshake on `fd`; returns the raw request.
/// Runs on backend threads, so no assertions here.
std::string accept_handshake(int fd) {
    std::string raw = testing::read_request(fd);
    std::vector<uint8_t> bytes(raw.begin(), raw.end());

    Parser parser;
    Request request;
    auto [result, consumed] = parser.parse_request(bytes, request);
    (void)consumed;
    if (result != ParseResult::Complete) {
        return {};
    }

    auto key = request.get_header("Sec-WebSocket-Key");
    testing::write_all(fd, WebSocketUtils::create_upgrade_response(
                               WebSocketUtils::compute_accept_key(key)));
    return raw;
}

/// Read the 101 head the bridge sends to the inbound client
std::string read_response_head(int fd) {
    std::string head;
    char c;
    while (!head.ends_with("\r\n\r\n")) {
        if (::recv(fd, &c, 1, 0) != 1) {
            break;
        }
        head.push_back(c);
    }
    return head;
}

/// Backend that echoes every message with a prefix and records its handshake
struct EchoBackend {
    std::mutex mutex;
    std::string handshake;
    std::atomic<int> sessions_closed{0};
    std::atomic<uint16_t> close_code{0};
    testing::LoopbackServer server;

    EchoBackend()
        : server([this](int fd) {
              std::string raw = accept_handshake(fd);
              if (raw.empty()) {
                  return;
              }
              {
                  std::lock_guard<std::mutex> lock(mutex);
                  handshake = raw;
              }

              // The channel owns its descriptor; the server closes the original
              WebSocketChannel channel(::dup(fd), WebSocketChannel::Role::Server, 1 << 20);
              Message message;
              while (channel.receive(message)) {
                  if (text(message) == "bye") {
                      channel.close(4000, "backend done");
                      break;
                  }
                  if (!channel.send(text_message("echo:" + text(message)))) {
                      break;
                  }
              }
              close_code.store(channel.peer_close_code());
              sessions_closed.fetch_add(1);
          }) {}
};

struct BridgeFixture {
    control::BackendConfig backend;
    control::ProxyConfig proxy;
    control::ProxyMetrics metrics;
    int client_fd = -1;
    int bridge_fd = -1;

    explicit BridgeFixture(uint16_t port) {
        backend.host = "127.0.0.1";
        backend.port = port;
        proxy.upstream_timeout_ms = 2000;
        proxy.backend_upgrade_path = "/socket";

        int fds[2];
        REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0);
        client_fd = fds[0];
        bridge_fd = fds[1];
        REQUIRE(!core::set_socket_timeouts(client_fd, 5000ms));
    }

    /// Run UpgradeBridge::handle on its own thread
    std::future<void> start(const Request& request, std::vector<uint8_t> leftover = {}) {
        return std::async(std::launch::async, [this, &request, leftover]() mutable {
            UpgradeBridge bridge(backend, proxy, &metrics);
            bridge.handle(bridge_fd, request, std::move(leftover));
        });
    }
};

}  // namespace

TEST_CASE("Messages are relayed both ways in order", "[gateway][bridge]") {
    EchoBackend backend;
    BridgeFixture fixture(backend.server.port());
    ParsedHandshake inbound(kClientHandshake);

    auto session = fixture.start(inbound.request);

    std::string head = read_response_head(fixture.client_fd);
    REQUIRE(head.starts_with("HTTP/1.1 101"));
    REQUIRE(head.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=") != std::string::npos);

    {
        WebSocketChannel client(fixture.client_fd, WebSocketChannel::Role::Client, 1 << 20);

        for (std::string payload : {"one", "two", "three"}) {
            REQUIRE(client.send(text_message(payload)));
        }

        Message reply;
        for (std::string expected : {"echo:one", "echo:two", "echo:three"}) {
            REQUIRE(client.receive(reply));
            REQUIRE(text(reply) == expected);
        }

        client.close(WebSocketCloseCode::NORMAL_CLOSURE);

        // Close handshake completes and the bridge winds down
        REQUIRE_FALSE(client.receive(reply));
        REQUIRE(session.wait_for(3s) == std::future_status::ready);
    }

    REQUIRE(testing::eventually([&] { return backend.sessions_closed.load() == 1; }));
    REQUIRE(backend.close_code.load() == WebSocketCloseCode::NORMAL_CLOSURE);

    // Backend saw the fixed path with the client's query and headers
    {
        std::lock_guard<std::mutex> lock(backend.mutex);
        REQUIRE(backend.handshake.starts_with("GET /socket?token=abc HTTP/1.1\r\n"));
        REQUIRE(backend.handshake.find("Cookie: session=42\r\n") != std::string::npos);
        REQUIRE(backend.handshake.find("Origin: http://localhost:5000\r\n") != std::string::npos);
        REQUIRE(backend.handshake.find("dGhlIHNhbXBsZSBub25jZQ==") == std::string::npos);
    }

    auto snap = fixture.metrics.snapshot();
    REQUIRE(snap.total_sessions == 1);
    REQUIRE(snap.active_sessions == 0);
    REQUIRE(snap.failed_sessions == 0);
    REQUIRE(snap.messages_relayed == 6);
}

TEST_CASE("Backend close reaches the client", "[gateway][bridge]") {
    EchoBackend backend;
    BridgeFixture fixture(backend.server.port());
    ParsedHandshake inbound(kClientHandshake);

    auto session = fixture.start(inbound.request);
    REQUIRE(read_response_head(fixture.client_fd).starts_with("HTTP/1.1 101"));

    WebSocketChannel client(fixture.client_fd, WebSocketChannel::Role::Client, 1 << 20);
    REQUIRE(client.send(text_message("bye")));

    Message reply;
    REQUIRE_FALSE(client.receive(reply));
    REQUIRE(client.peer_close_code() == 4000);
    REQUIRE(session.wait_for(3s) == std::future_status::ready);
}

TEST_CASE("Client socket loss tears down the backend side", "[gateway][bridge]") {
    EchoBackend backend;
    BridgeFixture fixture(backend.server.port());
    ParsedHandshake inbound(kClientHandshake);

    auto session = fixture.start(inbound.request);
    REQUIRE(read_response_head(fixture.client_fd).starts_with("HTTP/1.1 101"));

    // Drop the connection without a close frame
    ::close(fixture.client_fd);

    REQUIRE(session.wait_for(3s) == std::future_status::ready);
    REQUIRE(testing::eventually([&] { return backend.sessions_closed.load() == 1; }));
    REQUIRE(backend.close_code.load() == WebSocketCloseCode::GOING_AWAY);
}

TEST_CASE("Frames pipelined behind the handshake are relayed", "[gateway][bridge]") {
    EchoBackend backend;
    BridgeFixture fixture(backend.server.port());
    ParsedHandshake inbound(kClientHandshake);

    auto early = WebSocketUtils::create_frame(WebSocketOpcode::TEXT,
                                              std::vector<uint8_t>{'e', 'a', 'r', 'l', 'y'}, true);
    auto session = fixture.start(inbound.request, early);
    REQUIRE(read_response_head(fixture.client_fd).starts_with("HTTP/1.1 101"));

    WebSocketChannel client(fixture.client_fd, WebSocketChannel::Role::Client, 1 << 20);
    Message reply;
    REQUIRE(client.receive(reply));
    REQUIRE(text(reply) == "echo:early");

    client.close(WebSocketCloseCode::NORMAL_CLOSURE);
    REQUIRE(session.wait_for(3s) == std::future_status::ready);
}

TEST_CASE("Backend dial failure closes the client with 1011", "[gateway][bridge]") {
    SECTION("nothing listening") {
        BridgeFixture fixture(testing::unused_port());
        ParsedHandshake inbound(kClientHandshake);

        auto session = fixture.start(inbound.request);
        REQUIRE(read_response_head(fixture.client_fd).starts_with("HTTP/1.1 101"));

        WebSocketChannel client(fixture.client_fd, WebSocketChannel::Role::Client, 1 << 20);
        Message reply;
        REQUIRE_FALSE(client.receive(reply));
        REQUIRE(client.peer_close_code() == WebSocketCloseCode::INTERNAL_SERVER_ERROR);
        REQUIRE(session.wait_for(3s) == std::future_status::ready);

        auto snap = fixture.metrics.snapshot();
        REQUIRE(snap.failed_sessions == 1);
        REQUIRE(snap.active_sessions == 0);
    }

    SECTION("backend refuses the upgrade") {
        testing::LoopbackServer backend([](int fd) {
            (void)testing::read_request(fd);
            testing::respond(fd, 404, "no websocket here");
        });
        BridgeFixture fixture(backend.port());
        ParsedHandshake inbound(kClientHandshake);

        auto session = fixture.start(inbound.request);
        REQUIRE(read_response_head(fixture.client_fd).starts_with("HTTP/1.1 101"));

        WebSocketChannel client(fixture.client_fd, WebSocketChannel::Role::Client, 1 << 20);
        Message reply;
        REQUIRE_FALSE(client.receive(reply));
        REQUIRE(client.peer_close_code() == WebSocketCloseCode::INTERNAL_SERVER_ERROR);
        REQUIRE(session.wait_for(3s) == std::future_status::ready);
    }
}

TEST_CASE("Upgrade helpers", "[gateway][bridge]") {
    SECTION("426 for plain requests") {
        auto response = UpgradeBridge::upgrade_required();
        REQUIRE(response.status == 426);
        REQUIRE(response.get_header("Upgrade") == "websocket");
        REQUIRE_FALSE(response.body.empty());
    }

    SECTION("upgrade detection") {
        ParsedHandshake upgrade(kClientHandshake);
        REQUIRE(UpgradeBridge::is_upgrade(upgrade.request));

        ParsedHandshake plain("GET /ws HTTP/1.1\r\nHost: localhost\r\n\r\n");
        REQUIRE_FALSE(UpgradeBridge::is_upgrade(plain.request));
    }

    SECTION("backend handshake") {
        ParsedHandshake inbound(
            "GET /ws?room=7 HTTP/1.1\r\n"
            "Host: localhost:5000\r\n"
            "Upgrade: websocket\r\n"
            "Connection: keep-alive, Upgrade\r\n"
            "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
            "Sec-WebSocket-Version: 13\r\n"
            "Sec-WebSocket-Protocol: chat\r\n"
            "Sec-WebSocket-Extensions: permessage-deflate\r\n"
            "\r\n");

        auto text = UpgradeBridge::build_backend_handshake(inbound.request, "127.0.0.1", 5001,
                                                           "/ws", "AAAAAAAAAAAAAAAAAAAAAA==");

        REQUIRE(text.starts_with("GET /ws?room=7 HTTP/1.1\r\n"));
        REQUIRE(text.find("Host: 127.0.0.1:5001\r\n") != std::string::npos);
        REQUIRE(text.find("Upgrade: websocket\r\n") != std::string::npos);
        REQUIRE(text.find("Connection: Upgrade\r\n") != std::string::npos);
        REQUIRE(text.find("Sec-WebSocket-Key: AAAAAAAAAAAAAAAAAAAAAA==\r\n") != std::string::npos);
        REQUIRE(text.find("Sec-WebSocket-Protocol: chat\r\n") != std::string::npos);
        REQUIRE(text.find("permessage-deflate") == std::string::npos);
        REQUIRE(text.find("localhost:5000") == std::string::npos);
        REQUIRE(text.ends_with("\r\n\r\n"));
    }
}
