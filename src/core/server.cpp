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

// Warden Server - Implementation

#include "server.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <thread>
#include <tuple>

#include "logging.hpp"
#include "socket.hpp"

namespace warden::core {

std::atomic<bool> g_server_running{true};
std::atomic<bool> g_graceful_shutdown{false};

namespace {

constexpr int kAcceptPollTimeoutMs = 100;
constexpr size_t kClientReadChunkSize = 16 * 1024;
constexpr std::string_view kContinueResponse = "HTTP/1.1 100 Continue\r\n\r\n";

gateway::ProxyResponse simple_response(http::StatusCode status, std::string_view body) {
    gateway::ProxyResponse response;
    response.status = static_cast<uint16_t>(status);
    response.reason = std::string(http::to_reason_phrase(status));
    response.headers.emplace_back("Content-Type", "text/plain; charset=utf-8");
    response.body.assign(body.begin(), body.end());
    return response;
}

/// Status codes whose responses never carry a body (RFC 9110 §6.4.1)
bool is_bodiless_status(uint16_t status) noexcept {
    return (status >= 100 && status < 200) || status == 204 || status == 304;
}

}  // namespace

Server::Server(const control::Config& config, const gateway::Forwarder& forwarder,
               gateway::UpgradeBridge& bridge, control::ProxyMetrics& metrics)
    : config_(config),
      forwarder_(forwarder),
      bridge_(bridge),
      metrics_(metrics),
      logger_(logging::get_logger()) {}

Server::~Server() {
    stop();
    // Handler threads hold references to this server
    close_active_connections();
    std::unique_lock<std::mutex> lock(active_mutex_);
    active_cv_.wait(lock, [this] { return active_.load(std::memory_order_acquire) == 0; });
    lock.unlock();

    close_fd(listen_fd_);
    listen_fd_ = -1;
}

std::error_code Server::start() {
    listen_fd_ = create_listening_socket(config_.server.listen_address,
                                         config_.server.listen_port,
                                         static_cast<int>(config_.server.backlog));
    if (listen_fd_ < 0) {
        return std::error_code(errno, std::system_category());
    }

    port_ = get_local_port(listen_fd_);
    running_.store(true, std::memory_order_release);

    LOG_INFO(logger_, "Listening on {}:{}", config_.server.listen_address, port_);
    return {};
}

void Server::stop() noexcept {
    running_.store(false, std::memory_order_release);
}

void Server::run() {
    while (running()) {
        pollfd pfd{listen_fd_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, kAcceptPollTimeoutMs);
        if (ready <= 0) {
            // Timeout or EINTR from the shutdown signal; re-check the flags
            continue;
        }

        sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int client_fd = ::accept4(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr),
                                  &addr_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR &&
                errno != ECONNABORTED) {
                LOG_WARNING(logger_, "accept() failed: {}",
                            std::error_code(errno, std::system_category()).message());
            }
            continue;
        }

        int opt = 1;
        ::setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

        char ip_buf[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip_buf, sizeof(ip_buf));

        {
            std::lock_guard<std::mutex> lock(active_mutex_);
            active_fds_.insert(client_fd);
            active_.fetch_add(1, std::memory_order_acq_rel);
        }

        try {
            std::thread(&Server::handle_connection, this, client_fd, std::string(ip_buf)).detach();
        } catch (const std::system_error& e) {
            LOG_ERROR(logger_, "Cannot start handler thread for {}: {}", ip_buf, e.what());
            close_fd(client_fd);
            std::lock_guard<std::mutex> lock(active_mutex_);
            active_fds_.erase(client_fd);
            active_.fetch_sub(1, std::memory_order_acq_rel);
        }
    }
}

bool Server::drain(std::chrono::milliseconds timeout) {
    size_t active = active_.load(std::memory_order_acquire);
    if (active == 0) {
        return true;
    }

    LOG_INFO(logger_, "Draining {} active connections (timeout: {}ms)...", active,
             timeout.count());

    std::unique_lock<std::mutex> lock(active_mutex_);
    bool drained = active_cv_.wait_for(
        lock, timeout, [this] { return active_.load(std::memory_order_acquire) == 0; });

    if (!drained) {
        LOG_WARNING(logger_, "Drain timeout: {} connections still active",
                    active_.load(std::memory_order_acquire));
    }
    return drained;
}

void Server::close_active_connections() {
    std::lock_guard<std::mutex> lock(active_mutex_);
    for (int fd : active_fds_) {
        shutdown_socket(fd);
    }
}

void Server::handle_connection(int client_fd, std::string remote_ip) {
    metrics_.record_connection();

    try {
        serve_connection(client_fd, remote_ip);
    } catch (const std::exception& e) {
        LOG_ERROR(logger_, "Connection from {} failed: {}", remote_ip, e.what());
    }

    // drain() and ~Server() may return once active_ reaches zero, so nothing
    // of this server is touched after the decrement
    std::lock_guard<std::mutex> lock(active_mutex_);
    active_fds_.erase(client_fd);
    close_fd(client_fd);
    metrics_.record_connection_close();
    active_cv_.notify_all();
    active_.fetch_sub(1, std::memory_order_acq_rel);
}

void Server::serve_connection(int client_fd, const std::string& remote_ip) {
    if (auto ec = set_socket_timeouts(client_fd,
                                      std::chrono::milliseconds(config_.server.read_timeout))) {
        LOG_WARNING(logger_, "Cannot set timeouts for {}: {}", remote_ip, ec.message());
        return;
    }

    std::vector<uint8_t> buffer;
    http::Parser parser;
    http::Request request;
    bool continue_sent = false;
    uint8_t chunk[kClientReadChunkSize];

    while (running()) {
        auto result = http::ParseResult::Incomplete;
        size_t consumed = 0;
        if (!buffer.empty()) {
            std::tie(result, consumed) =
                parser.parse_request(std::span<const uint8_t>(buffer), request);
        }

        if (result == http::ParseResult::Error) {
            LOG_DEBUG(logger_, "Malformed request from {}: {}", remote_ip, parser.error_message());
            (void)send_response(client_fd,
                                simple_response(http::StatusCode::BadRequest, "Bad Request"),
                                false, false);
            return;
        }

        if (result == http::ParseResult::Incomplete) {
            if (buffer.size() > config_.server.max_request_size) {
                (void)send_response(
                    client_fd,
                    simple_response(http::StatusCode::PayloadTooLarge, "Request too large"), false,
                    false);
                return;
            }

            // Client waits for permission before sending the body
            if (!continue_sent && parser.headers_complete() &&
                http::header_value_contains(request.get_header("Expect"), "100-continue")) {
                if (send_all(client_fd, kContinueResponse)) {
                    return;
                }
                continue_sent = true;
            }

            std::error_code ec;
            ssize_t n = recv_some(client_fd, chunk, ec);
            if (n <= 0) {
                // Closed, idle timeout, or shut down during drain
                return;
            }
            metrics_.record_bytes_received(static_cast<uint64_t>(n));
            buffer.insert(buffer.end(), chunk, chunk + n);
            continue;
        }

        // Complete request
        continue_sent = false;
        auto start_time = std::chrono::steady_clock::now();
        std::string correlation_id = logging::generate_correlation_id();
        bool head_request = request.method == http::Method::HEAD;
        bool keep_alive = request.keep_alive() && running();

        if (request.path == config_.proxy.upgrade_path &&
            gateway::UpgradeBridge::is_upgrade(request)) {
            // The rest of the buffer is already WebSocket traffic
            std::vector<uint8_t> leftover(buffer.begin() + static_cast<std::ptrdiff_t>(consumed),
                                          buffer.end());
            if (config_.logging.log_requests) {
                LOG_REQUEST(logger_, request.method_name, request.path, 101, 0, remote_ip,
                            correlation_id);
            }
            // The session closes its own descriptor; ours stays tracked (and
            // reachable by close_active_connections) until the session ends
            int session_fd = ::fcntl(client_fd, F_DUPFD_CLOEXEC, 0);
            if (session_fd < 0) {
                LOG_ERROR(logger_, "Cannot hand WebSocket connection from {} to the bridge: {}",
                          remote_ip, std::error_code(errno, std::system_category()).message());
                return;
            }
            bridge_.handle(session_fd, request, std::move(leftover));
            return;
        }

        gateway::ProxyResponse response;
        if (request.path == config_.proxy.upgrade_path) {
            response = gateway::UpgradeBridge::upgrade_required();
        } else {
            response = forwarder_.forward(request);
        }

        bool sent = send_response(client_fd, response, keep_alive, head_request);

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time);
        metrics_.record_request();
        metrics_.record_status_code(response.status);
        metrics_.record_latency(duration);

        if (config_.logging.log_requests) {
            LOG_REQUEST(logger_, request.method_name, request.path, response.status,
                        duration.count(), remote_ip, correlation_id);
        }

        if (!sent || !keep_alive) {
            return;
        }

        // Pipelined bytes stay for the next round
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(consumed));
    }
}

std::string Server::build_response(const gateway::ProxyResponse& response, bool keep_alive,
                                   bool head_request) {
    bool bodiless = is_bodiless_status(response.status);
    size_t body_size = (head_request || bodiless) ? 0 : response.body.size();

    std::string response_str;
    size_t estimated_size = 200 + body_size;
    for (const auto& [name, value] : response.headers) {
        estimated_size += name.size() + value.size() + 4;  // ": \r\n"
    }
    response_str.reserve(estimated_size);

    // Status line with reason phrase
    response_str += "HTTP/1.1 ";
    response_str += std::to_string(response.status);
    response_str += " ";
    if (response.reason.empty()) {
        response_str += http::to_reason_phrase(response.status);
    } else {
        response_str += response.reason;
    }
    response_str += "\r\n";

    // Forward all headers except the ones we add ourselves
    for (const auto& [name, value] : response.headers) {
        if (http::header_name_equals(name, "Content-Length") ||
            http::header_name_equals(name, "Connection")) {
            continue;
        }
        response_str += name;
        response_str += ": ";
        response_str += value;
        response_str += "\r\n";
    }

    // HEAD answers describe a body they do not carry; omit a misleading length
    if (!head_request && !bodiless) {
        response_str += "Content-Length: ";
        response_str += std::to_string(body_size);
        response_str += "\r\n";
    }

    if (keep_alive) {
        response_str += "Connection: keep-alive\r\n";
    } else {
        response_str += "Connection: close\r\n";
    }
    response_str += "\r\n";

    if (body_size > 0) {
        response_str.append(reinterpret_cast<const char*>(response.body.data()), body_size);
    }

    return response_str;
}

bool Server::send_response(int client_fd, const gateway::ProxyResponse& response,
                           bool keep_alive, bool head_request) {
    std::string response_str = build_response(response, keep_alive, head_request);

    if (auto ec = send_all(client_fd, response_str)) {
        LOG_DEBUG(logger_, "Client fd={} went away mid-response: {}", client_fd, ec.message());
        return false;
    }
    metrics_.record_bytes_sent(response_str.size());
    return true;
}

}  // namespace warden::core
