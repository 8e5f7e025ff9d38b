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

// Warden HTTP Forwarder - Header
// Replays an inbound request against the backend and relays its answer.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../control/config.hpp"
#include "../control/metrics.hpp"
#include "../http/http.hpp"

namespace warden::gateway {

/// Response relayed to the client (owns its data, outlives the backend buffer)
struct ProxyResponse {
    uint16_t status = 200;
    std::string reason;
    std::vector<std::pair<std::string, std::string>> headers;  // Order and duplicates kept
    std::vector<uint8_t> body;

    /// First header value with this name (case-insensitive), empty if absent
    [[nodiscard]] std::string_view get_header(std::string_view name) const noexcept;

    [[nodiscard]] std::string_view body_view() const noexcept {
        return {reinterpret_cast<const char*>(body.data()), body.size()};
    }
};

/// content-encoding, content-length, transfer-encoding, connection
[[nodiscard]] bool is_excluded_response_header(std::string_view name) noexcept;

/// Forwards plain HTTP requests to the backend, one fresh connection each
class Forwarder {
public:
    Forwarder(const control::BackendConfig& backend, const control::ProxyConfig& proxy,
              control::ProxyMetrics* metrics = nullptr);

    /// Forward `request` and return what the client should see.
    /// Never throws for transport problems; those become 502 responses.
    [[nodiscard]] ProxyResponse forward(const http::Request& request) const;

    /// Serialize `request` for the backend at host:port (Host replaced,
    /// framing headers re-derived, Connection: close)
    [[nodiscard]] static std::string build_backend_request(const http::Request& request,
                                                           std::string_view host, uint16_t port);

    /// 502 with "Proxy error: <diagnostic>" as a text/plain body
    [[nodiscard]] static ProxyResponse proxy_error(std::string_view diagnostic);

private:
    [[nodiscard]] bool receive_backend_response(int backend_fd,
                                                std::chrono::steady_clock::time_point deadline,
                                                bool head_request, http::Response& response,
                                                std::vector<uint8_t>& buffer,
                                                std::string& error) const;

    std::string host_;
    uint16_t port_;
    std::chrono::milliseconds timeout_;
    uint64_t max_response_size_;
    control::ProxyMetrics* metrics_;
};

}  // namespace warden::gateway
