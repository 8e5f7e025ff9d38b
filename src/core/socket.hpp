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

// Warden Socket Utilities - Header

#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace warden::core {

/// Create non-blocking listening socket (port 0 picks an ephemeral port)
[[nodiscard]] int create_listening_socket(std::string_view address, uint16_t port,
                                          int backlog = 128);

/// Port a bound socket is listening on (0 on failure)
[[nodiscard]] uint16_t get_local_port(int fd) noexcept;

/// Blocking TCP connect bounded by `timeout`. Host may be an IPv4 literal or a name.
/// Returns the connected fd (blocking mode, TCP_NODELAY) or -1 with `ec` set.
[[nodiscard]] int connect_to_backend(const std::string& host, uint16_t port,
                                     std::chrono::milliseconds timeout, std::error_code& ec);

[[nodiscard]] std::error_code set_nonblocking(int fd);
[[nodiscard]] std::error_code set_blocking(int fd);

/// SO_RCVTIMEO and SO_SNDTIMEO (0 disables the timeout)
[[nodiscard]] std::error_code set_socket_timeouts(int fd, std::chrono::milliseconds timeout);

/// Write the whole buffer, retrying partial writes and EINTR. Never raises SIGPIPE.
[[nodiscard]] std::error_code send_all(int fd, std::span<const uint8_t> data);
[[nodiscard]] std::error_code send_all(int fd, std::string_view data);

/// recv() with EINTR retry. Returns bytes read, 0 on orderly close, -1 with `ec` set.
[[nodiscard]] ssize_t recv_some(int fd, std::span<uint8_t> buffer, std::error_code& ec);

/// Half-close both directions so a thread blocked in recv() on this fd wakes up
void shutdown_socket(int fd) noexcept;

void close_fd(int fd);

}  // namespace warden::core
