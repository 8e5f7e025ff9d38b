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

// Warden Readiness Monitor - Implementation

#include "readiness.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <vector>

#include "../core/logging.hpp"
#include "../core/socket.hpp"
#include "../http/parser.hpp"
#include "backend_process.hpp"

namespace warden::runtime {

namespace {

constexpr std::chrono::milliseconds kReadSlice{200};

char to_lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

}  // namespace

bool matches_readiness_phrase(std::string_view line, std::string_view phrase) noexcept {
    if (phrase.empty() || phrase.size() > line.size()) {
        return false;
    }
    auto it = std::search(line.begin(), line.end(), phrase.begin(), phrase.end(),
                          [](char a, char b) { return to_lower(a) == to_lower(b); });
    return it != line.end();
}

bool probe_http(const std::string& host, uint16_t port, std::string_view path,
                std::chrono::milliseconds timeout) {
    std::error_code ec;
    int fd = core::connect_to_backend(host, port, timeout, ec);
    if (fd < 0) {
        return false;
    }

    bool ok = false;
    if (!core::set_socket_timeouts(fd, timeout)) {
        std::string request = fmt::format(
            "GET {} HTTP/1.1\r\nHost: {}:{}\r\nConnection: close\r\nUser-Agent: warden-probe\r\n\r\n",
            path, host, port);

        if (!core::send_all(fd, request)) {
            http::Parser parser;
            http::Response response;
            std::vector<uint8_t> buffer;
            uint8_t chunk[4096];

            // Only the status line and headers matter
            while (true) {
                ssize_t n = core::recv_some(fd, chunk, ec);
                if (n <= 0) {
                    break;
                }
                buffer.insert(buffer.end(), chunk, chunk + n);
                auto [result, consumed] = parser.parse_response(buffer, response);
                (void)consumed;
                if (result == http::ParseResult::Error) {
                    break;
                }
                if (result == http::ParseResult::Complete || parser.headers_complete()) {
                    ok = response.status >= 200 && response.status < 300;
                    break;
                }
            }
        }
    }

    core::close_fd(fd);
    return ok;
}

ReadinessMonitor::ReadinessMonitor(std::string phrase) : phrase_(std::move(phrase)) {}

ReadinessMonitor::~ReadinessMonitor() {
    request_stop();
    join();
}

void ReadinessMonitor::start(BackendProcess& process) {
    thread_ = std::thread([this, &process] { run(process); });
}

bool ReadinessMonitor::mark_ready() noexcept {
    bool expected = false;
    if (!ready_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
    }
    cv_.notify_all();
    return true;
}

bool ReadinessMonitor::wait_until_ready(std::chrono::milliseconds poll_interval,
                                        std::chrono::milliseconds ceiling,
                                        const std::function<bool()>& probe) {
    auto deadline = std::chrono::steady_clock::now() + ceiling;

    while (!is_ready()) {
        if (probe && probe()) {
            mark_ready();
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }

        auto slice = std::min<std::chrono::steady_clock::duration>(poll_interval, deadline - now);
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, slice, [this] { return is_ready(); });
    }
    return true;
}

void ReadinessMonitor::request_stop() noexcept {
    stopping_.store(true, std::memory_order_release);
}

void ReadinessMonitor::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ReadinessMonitor::run(BackendProcess& process) {
    auto* logger = logging::get_logger();
    std::string line;

    while (true) {
        ReadStatus status = process.read_line(line, kReadSlice);

        if (status == ReadStatus::Line) {
            LOG_INFO(logger, "[backend] {}", line);
            if (!is_ready() && matches_readiness_phrase(line, phrase_)) {
                if (mark_ready()) {
                    LOG_INFO(logger, "Backend signalled readiness");
                }
            }
            continue;
        }

        if (status == ReadStatus::Timeout) {
            if (stopping_.load(std::memory_order_acquire) && !process.running()) {
                break;
            }
            continue;
        }

        // Output closed: wait for the child itself
        while (!process.reap(false)) {
            if (stopping_.load(std::memory_order_acquire)) {
                // terminate() in the controller reaps it
                return;
            }
            std::this_thread::sleep_for(kReadSlice);
        }
        break;
    }

    exited_.store(true, std::memory_order_release);

    auto code = process.exit_code();
    if (stopping_.load(std::memory_order_acquire)) {
        LOG_INFO(logger, "Backend process {} stopped (exit code {})", process.pid(),
                 code.value_or(-1));
    } else {
        LOG_WARNING(logger, "Backend process {} exited with code {}, it will not be restarted",
                    process.pid(), code.value_or(-1));
    }
}

}  // namespace warden::runtime
