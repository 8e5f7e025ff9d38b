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

// Warden Upgrade Bridge - Implementation

#include "upgrade_bridge.hpp"

#include <fmt/format.h>

#include <condition_variable>
#include <functional>
#include <mutex>
#include <system_error>
#include <thread>

#include "../core/logging.hpp"
#include "../core/socket.hpp"
#include "../http/parser.hpp"
#include "../http/websocket.hpp"

namespace warden::gateway {

namespace {

constexpr size_t kHandshakeReadChunkSize = 4096;
constexpr size_t kMaxHandshakeSize = 64 * 1024;

/// Handshake headers the bridge writes itself
bool is_handshake_header(std::string_view name) noexcept {
    return http::header_name_equals(name, "Host") || http::header_name_equals(name, "Upgrade") ||
           http::header_name_equals(name, "Connection") ||
           http::header_name_equals(name, "Sec-WebSocket-Key") ||
           http::header_name_equals(name, "Sec-WebSocket-Version") ||
           http::header_name_equals(name, "Sec-WebSocket-Extensions") ||
           http::header_name_equals(name, "Content-Length") ||
           http::header_name_equals(name, "Transfer-Encoding");
}

/// Close codes that may be sent on the wire (RFC 6455 §7.4.1)
uint16_t sendable_close_code(uint16_t code, uint16_t fallback) noexcept {
    if (code == 0 || code == http::WebSocketCloseCode::NO_STATUS_RECEIVED ||
        code == http::WebSocketCloseCode::ABNORMAL_CLOSURE || code == 1015 || code < 1000 ||
        code >= 5000) {
        return fallback;
    }
    return code;
}

}  // namespace

UpgradeBridge::UpgradeBridge(const control::BackendConfig& backend,
                             const control::ProxyConfig& proxy, control::ProxyMetrics* metrics)
    : host_(backend.host),
      port_(backend.port),
      backend_path_(proxy.backend_upgrade_path),
      connect_timeout_(proxy.upstream_timeout_ms),
      max_message_size_(proxy.max_message_size),
      metrics_(metrics) {}

bool UpgradeBridge::is_upgrade(const http::Request& request) {
    return http::WebSocketUtils::is_valid_upgrade_request(request);
}

ProxyResponse UpgradeBridge::upgrade_required() {
    ProxyResponse response;
    response.status = static_cast<uint16_t>(http::StatusCode::UpgradeRequired);
    response.reason = std::string(http::to_reason_phrase(response.status));
    response.headers.emplace_back("Upgrade", "websocket");
    response.headers.emplace_back("Content-Type", "text/plain; charset=utf-8");

    std::string_view body = "Expected a WebSocket upgrade request";
    response.body.assign(body.begin(), body.end());
    return response;
}

std::string UpgradeBridge::build_backend_handshake(const http::Request& request,
                                                   std::string_view host, uint16_t port,
                                                   std::string_view path, std::string_view key) {
    std::string req;
    req.reserve(512);

    req += "GET ";
    req += path;
    if (!request.query.empty()) {
        req += "?";
        req += request.query;
    }
    req += " HTTP/1.1\r\n";
    req += fmt::format("Host: {}:{}\r\n", host, port);
    req += "Upgrade: websocket\r\n";
    req += "Connection: Upgrade\r\n";
    req += "Sec-WebSocket-Key: ";
    req += key;
    req += "\r\n";
    req += "Sec-WebSocket-Version: 13\r\n";

    // Forward other headers from client (Cookie, Origin, Sec-WebSocket-Protocol, ...)
    for (const auto& header : request.headers) {
        if (is_handshake_header(header.name)) {
            continue;
        }
        req += header.name;
        req += ": ";
        req += header.value;
        req += "\r\n";
    }
    req += "\r\n";

    return req;
}

int UpgradeBridge::dial_backend(const http::Request& request, std::vector<uint8_t>& leftover,
                                std::string& error) const {
    std::error_code ec;
    int backend_fd = core::connect_to_backend(host_, port_, connect_timeout_, ec);
    if (backend_fd < 0) {
        error = fmt::format("cannot connect to {}:{}: {}", host_, port_, ec.message());
        return -1;
    }

    auto fail = [&](std::string message) {
        error = std::move(message);
        core::close_fd(backend_fd);
        return -1;
    };

    if ((ec = core::set_socket_timeouts(backend_fd, connect_timeout_))) {
        return fail(fmt::format("cannot configure backend socket: {}", ec.message()));
    }

    std::string key = http::WebSocketUtils::generate_client_key();
    std::string handshake = build_backend_handshake(request, host_, port_, backend_path_, key);
    if ((ec = core::send_all(backend_fd, handshake))) {
        return fail(fmt::format("cannot send upgrade request: {}", ec.message()));
    }

    http::Parser parser;
    http::Response response;
    std::vector<uint8_t> buffer;
    uint8_t chunk[kHandshakeReadChunkSize];

    while (true) {
        ssize_t n = core::recv_some(backend_fd, chunk, ec);
        if (n < 0) {
            return fail(fmt::format("no upgrade response: {}", ec.message()));
        }
        if (n == 0) {
            return fail("backend closed the connection during the handshake");
        }
        buffer.insert(buffer.end(), chunk, chunk + n);

        auto [result, consumed] = parser.parse_response(std::span<const uint8_t>(buffer), response);
        if (result == http::ParseResult::Error) {
            return fail(fmt::format("malformed upgrade response: {}", parser.error_message()));
        }
        if (result == http::ParseResult::Incomplete) {
            if (buffer.size() > kMaxHandshakeSize) {
                return fail("upgrade response too large");
            }
            continue;
        }

        if (!http::WebSocketUtils::is_valid_upgrade_response(response, key)) {
            return fail(fmt::format("backend answered {} {} instead of a WebSocket upgrade",
                                    response.status, response.reason_phrase));
        }

        // Frames the backend sent right behind its 101
        leftover.assign(buffer.begin() + static_cast<std::ptrdiff_t>(consumed), buffer.end());
        break;
    }

    // Sessions have no idle timeout
    if ((ec = core::set_socket_timeouts(backend_fd, std::chrono::milliseconds{0}))) {
        return fail(fmt::format("cannot configure backend socket: {}", ec.message()));
    }

    return backend_fd;
}

void UpgradeBridge::handle(int client_fd, const http::Request& request,
                           std::vector<uint8_t> leftover) {
    auto* logger = logging::get_logger();

    // Accept the inbound side first
    std::string accept_key =
        http::WebSocketUtils::compute_accept_key(request.get_header("Sec-WebSocket-Key"));
    std::string upgrade_response = http::WebSocketUtils::create_upgrade_response(accept_key);

    if (auto ec = core::set_socket_timeouts(client_fd, std::chrono::milliseconds{0})) {
        LOG_WARNING(logger, "WebSocket upgrade on fd={} failed: {}", client_fd, ec.message());
        core::close_fd(client_fd);
        return;
    }
    if (auto ec = core::send_all(client_fd, upgrade_response)) {
        LOG_DEBUG(logger, "WebSocket client fd={} gone before 101: {}", client_fd, ec.message());
        core::close_fd(client_fd);
        return;
    }

    if (metrics_) {
        metrics_->record_session_start();
    }

    std::vector<uint8_t> backend_leftover;
    std::string error;
    int backend_fd = dial_backend(request, backend_leftover, error);
    if (backend_fd < 0) {
        LOG_ERROR(logger, "WebSocket bridge to backend {}:{}{} failed: {}", host_, port_,
                  backend_path_, error);
        WebSocketChannel inbound(client_fd, WebSocketChannel::Role::Server, max_message_size_);
        inbound.close(http::WebSocketCloseCode::INTERNAL_SERVER_ERROR, "backend unavailable");
        inbound.shutdown();
        if (metrics_) {
            metrics_->record_session_failure();
            metrics_->record_session_end();
        }
        return;
    }

    LOG_DEBUG(logger, "WebSocket session opened: client fd={} backend fd={}", client_fd,
              backend_fd);

    UpgradeSession session{
        WebSocketChannel(client_fd, WebSocketChannel::Role::Server, max_message_size_,
                         std::move(leftover)),
        WebSocketChannel(backend_fd, WebSocketChannel::Role::Client, max_message_size_,
                         std::move(backend_leftover))};
    auto started = std::chrono::steady_clock::now();

    run_session(session);

    if (metrics_) {
        metrics_->record_session_end();
    }
    LOG_DEBUG(logger, "WebSocket session closed after {} ms",
              std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::steady_clock::now() - started)
                  .count());
}

void UpgradeBridge::run_session(UpgradeSession& session) {
    auto& inbound = session.inbound;
    auto& outbound = session.outbound;
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;

    auto pump = [&](WebSocketChannel& from, WebSocketChannel& to) {
        try {
            Message message;
            while (from.receive(message)) {
                if (!to.send(message)) {
                    break;
                }
                if (metrics_) {
                    metrics_->record_message_relayed();
                }
            }
        } catch (const std::exception& e) {
            LOG_ERROR(logging::get_logger(), "WebSocket relay fd={} -> fd={} aborted: {}",
                      from.fd(), to.fd(), e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            done = true;
        }
        cv.notify_all();
    };

    std::thread client_to_backend;
    std::thread backend_to_client;
    try {
        client_to_backend = std::thread(pump, std::ref(inbound), std::ref(outbound));
        backend_to_client = std::thread(pump, std::ref(outbound), std::ref(inbound));
    } catch (const std::system_error& e) {
        LOG_ERROR(logging::get_logger(), "Cannot start WebSocket relay threads: {}", e.what());
        std::lock_guard<std::mutex> lock(mutex);
        done = true;
    }

    // Wait for the first loop to finish
    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&] { return done; });
    }

    // Pass a received close code on to the other side
    uint16_t from_client = inbound.peer_close_code();
    uint16_t from_backend = outbound.peer_close_code();
    outbound.close(sendable_close_code(from_client, http::WebSocketCloseCode::GOING_AWAY));
    inbound.close(sendable_close_code(from_backend, http::WebSocketCloseCode::GOING_AWAY));

    inbound.shutdown();
    outbound.shutdown();

    if (client_to_backend.joinable()) {
        client_to_backend.join();
    }
    if (backend_to_client.joinable()) {
        backend_to_client.join();
    }
}

}  // namespace warden::gateway
