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

// Warden Upgrade Bridge - Header
// Joins an inbound WebSocket to a backend WebSocket and relays messages both ways.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "../control/config.hpp"
#include "../control/metrics.hpp"
#include "../http/http.hpp"
#include "forwarder.hpp"
#include "ws_channel.hpp"

namespace warden::gateway {

/// One bridged connection. Lives until either side closes or fails.
struct UpgradeSession {
    WebSocketChannel inbound;   // External client, server role
    WebSocketChannel outbound;  // Backend, client role
};

/// WebSocket upgrade bridge.
///
/// The inbound handshake is accepted before the backend is dialed. Each
/// session runs two relay threads; when either stops, both channels are
/// closed and the handling thread joins them.
class UpgradeBridge {
public:
    UpgradeBridge(const control::BackendConfig& backend, const control::ProxyConfig& proxy,
                  control::ProxyMetrics* metrics = nullptr);

    /// Request carries a complete RFC 6455 client handshake
    [[nodiscard]] static bool is_upgrade(const http::Request& request);

    /// 426 Upgrade Required (with "Upgrade: websocket") for plain requests on the upgrade path
    [[nodiscard]] static ProxyResponse upgrade_required();

    /// Run one session to completion. Takes ownership of `client_fd`.
    /// `leftover` holds bytes the client sent after its handshake.
    /// Precondition: is_upgrade(request).
    void handle(int client_fd, const http::Request& request, std::vector<uint8_t> leftover);

    /// Backend handshake for `request` against `path` with a fresh client key
    [[nodiscard]] static std::string build_backend_handshake(const http::Request& request,
                                                             std::string_view host, uint16_t port,
                                                             std::string_view path,
                                                             std::string_view key);

    /// Relay until either side stops, then tear both down (used by handle())
    void run_session(UpgradeSession& session);

private:
    /// Returns the connected backend fd, or -1 with `error` set
    [[nodiscard]] int dial_backend(const http::Request& request, std::vector<uint8_t>& leftover,
                                   std::string& error) const;

    std::string host_;
    uint16_t port_;
    std::string backend_path_;
    std::chrono::milliseconds connect_timeout_;
    uint64_t max_message_size_;
    control::ProxyMetrics* metrics_;
};

}  // namespace warden::gateway
