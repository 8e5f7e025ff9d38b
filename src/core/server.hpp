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

// Warden Server - Header
// External listener: accepts clients and routes each request to the
// forwarder or the upgrade bridge.

#pragma once

#include <quill/Logger.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#include "../control/config.hpp"
#include "../control/metrics.hpp"
#include "../gateway/forwarder.hpp"
#include "../gateway/upgrade_bridge.hpp"
#include "../http/parser.hpp"
#include "containers.hpp"

namespace warden::core {

/// Process-wide run flags, flipped by the SIGINT/SIGTERM handler
extern std::atomic<bool> g_server_running;
extern std::atomic<bool> g_graceful_shutdown;

/// HTTP/1.x front server. One handler thread per accepted connection.
class Server {
public:
    Server(const control::Config& config, const gateway::Forwarder& forwarder,
           gateway::UpgradeBridge& bridge, control::ProxyMetrics& metrics);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Bind and listen
    [[nodiscard]] std::error_code start();

    /// Accept loop; returns once stop() is called or g_server_running clears
    void run();

    /// Stop accepting (safe from any thread)
    void stop() noexcept;

    /// Wait up to `timeout` for handler threads to finish. Returns true if all did.
    bool drain(std::chrono::milliseconds timeout);

    /// Shut down every client socket still open (wakes blocked handlers)
    void close_active_connections();

    /// Port actually bound (useful with listen_port 0)
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    [[nodiscard]] size_t active_connections() const noexcept {
        return active_.load(std::memory_order_acquire);
    }

    /// Serialize a response. Content-Length and Connection are always ours.
    [[nodiscard]] static std::string build_response(const gateway::ProxyResponse& response,
                                                    bool keep_alive, bool head_request);

private:
    void handle_connection(int client_fd, std::string remote_ip);

    /// Serve requests until the connection ends or is bridged to a WebSocket session
    void serve_connection(int client_fd, const std::string& remote_ip);

    [[nodiscard]] bool send_response(int client_fd, const gateway::ProxyResponse& response,
                                     bool keep_alive, bool head_request);

    [[nodiscard]] bool running() const noexcept {
        return running_.load(std::memory_order_acquire) &&
               g_server_running.load(std::memory_order_acquire);
    }

    const control::Config& config_;
    const gateway::Forwarder& forwarder_;
    gateway::UpgradeBridge& bridge_;
    control::ProxyMetrics& metrics_;
    quill::Logger* logger_;

    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};

    // Handler thread bookkeeping
    std::atomic<size_t> active_{0};
    std::mutex active_mutex_;
    std::condition_variable active_cv_;
    fast_set<int> active_fds_;
};

}  // namespace warden::core
