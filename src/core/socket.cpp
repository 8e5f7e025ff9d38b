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

// Warden Socket Utilities - Implementation

#include "socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>

namespace warden::core {

namespace {

std::error_code last_error() {
    return std::error_code(errno, std::system_category());
}

// Resolve IPv4 literal first, fall back to getaddrinfo
std::error_code resolve_ipv4(const std::string& host, uint16_t port, sockaddr_in& addr) {
    addr = sockaddr_in{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) {
        return {};
    }

    addrinfo hints{};
    addrinfo* result = nullptr;
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || !result) {
        return std::make_error_code(std::errc::host_unreachable);
    }

    addr = *reinterpret_cast<sockaddr_in*>(result->ai_addr);
    addr.sin_port = htons(port);
    freeaddrinfo(result);
    return {};
}

}  // namespace

int create_listening_socket(std::string_view address, uint16_t port, int backlog) {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return -1;
    }

    // SO_REUSEADDR - allows binding to same address immediately after restart
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        close_fd(fd);
        return -1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    std::string addr_str{address};
    if (inet_pton(AF_INET, addr_str.c_str(), &addr.sin_addr) <= 0) {
        close_fd(fd);
        return -1;
    }

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close_fd(fd);
        return -1;
    }

    if (listen(fd, backlog) < 0) {
        close_fd(fd);
        return -1;
    }

    // Accept loop polls, so the listener itself never blocks
    if (auto ec = set_nonblocking(fd); ec) {
        close_fd(fd);
        return -1;
    }

    return fd;
}

uint16_t get_local_port(int fd) noexcept {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

int connect_to_backend(const std::string& host, uint16_t port, std::chrono::milliseconds timeout,
                       std::error_code& ec) {
    sockaddr_in addr{};
    if (ec = resolve_ipv4(host, port, addr); ec) {
        return -1;
    }

    int sockfd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sockfd < 0) {
        ec = last_error();
        return -1;
    }

    // Non-blocking connect so the deadline applies to the handshake too
    if (ec = set_nonblocking(sockfd); ec) {
        close_fd(sockfd);
        return -1;
    }

    int result = connect(sockfd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (result < 0 && errno != EINPROGRESS) {
        ec = last_error();
        close_fd(sockfd);
        return -1;
    }

    if (result < 0) {
        pollfd pfd{sockfd, POLLOUT, 0};
        int ready;
        do {
            ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (ready < 0 && errno == EINTR);

        if (ready == 0) {
            ec = std::make_error_code(std::errc::timed_out);
            close_fd(sockfd);
            return -1;
        }
        if (ready < 0) {
            ec = last_error();
            close_fd(sockfd);
            return -1;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            ec = last_error();
            close_fd(sockfd);
            return -1;
        }
        if (so_error != 0) {
            ec = std::error_code(so_error, std::system_category());
            close_fd(sockfd);
            return -1;
        }
    }

    if (ec = set_blocking(sockfd); ec) {
        close_fd(sockfd);
        return -1;
    }

    // Disable Nagle: request/response and message relays are latency bound
    int flag = 1;
    setsockopt(sockfd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(int));

    ec.clear();
    return sockfd;
}

std::error_code set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return last_error();
    }

    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return last_error();
    }

    return {};
}

std::error_code set_blocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return last_error();
    }

    if (fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) < 0) {
        return last_error();
    }

    return {};
}

std::error_code set_socket_timeouts(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        return last_error();
    }
    if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        return last_error();
    }
    return {};
}

std::error_code send_all(int fd, std::span<const uint8_t> data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return last_error();
        }
        sent += static_cast<size_t>(n);
    }
    return {};
}

std::error_code send_all(int fd, std::string_view data) {
    return send_all(fd, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()),
                                                 data.size()));
}

ssize_t recv_some(int fd, std::span<uint8_t> buffer, std::error_code& ec) {
    while (true) {
        ssize_t n = recv(fd, buffer.data(), buffer.size(), 0);
        if (n >= 0) {
            ec.clear();
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            ec = std::make_error_code(std::errc::timed_out);
        } else {
            ec = last_error();
        }
        return -1;
    }
}

void shutdown_socket(int fd) noexcept {
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void close_fd(int fd) {
    if (fd >= 0) {
        close(fd);
    }
}

}  // namespace warden::core
