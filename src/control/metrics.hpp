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

// Warden Metrics - Header
// Lock-free proxy counters shared by all connection handler threads

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace warden::control {

/// Metrics snapshot at a point in time
struct MetricsSnapshot {
    // Forwarded requests
    uint64_t total_requests = 0;
    uint64_t proxy_errors = 0;  // Transport failures answered with 502

    // Client connections
    uint64_t active_connections = 0;
    uint64_t total_connections = 0;

    // Latency metrics (microseconds)
    uint64_t total_latency_us = 0;
    uint64_t min_latency_us = 0;
    uint64_t max_latency_us = 0;

    // Bandwidth metrics (bytes)
    uint64_t bytes_received = 0;
    uint64_t bytes_sent = 0;

    // HTTP status code counters
    uint64_t status_2xx = 0;
    uint64_t status_3xx = 0;
    uint64_t status_4xx = 0;
    uint64_t status_5xx = 0;

    // Upgrade sessions
    uint64_t active_sessions = 0;
    uint64_t total_sessions = 0;
    uint64_t failed_sessions = 0;  // Backend dial failed after inbound accept
    uint64_t messages_relayed = 0;

    [[nodiscard]] double error_rate() const noexcept {
        if (total_requests == 0) return 0.0;
        return static_cast<double>(proxy_errors) / static_cast<double>(total_requests);
    }

    [[nodiscard]] double avg_latency_us() const noexcept {
        if (total_requests == 0) return 0.0;
        return static_cast<double>(total_latency_us) / static_cast<double>(total_requests);
    }
};

/// Process-wide proxy metrics (relaxed atomics, safe from any thread)
class ProxyMetrics {
public:
    ProxyMetrics() = default;
    ~ProxyMetrics() = default;

    // Non-copyable, non-movable (std::atomic is not movable)
    ProxyMetrics(const ProxyMetrics&) = delete;
    ProxyMetrics& operator=(const ProxyMetrics&) = delete;
    ProxyMetrics(ProxyMetrics&&) = delete;
    ProxyMetrics& operator=(ProxyMetrics&&) = delete;

    void record_request() noexcept { total_requests_.fetch_add(1, std::memory_order_relaxed); }

    void record_proxy_error() noexcept { proxy_errors_.fetch_add(1, std::memory_order_relaxed); }

    void record_connection() noexcept {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
        active_connections_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_connection_close() noexcept {
        active_connections_.fetch_sub(1, std::memory_order_relaxed);
    }

    /// Record request latency
    void record_latency(std::chrono::microseconds latency) noexcept {
        uint64_t latency_us = static_cast<uint64_t>(latency.count());

        total_latency_us_.fetch_add(latency_us, std::memory_order_relaxed);

        uint64_t current_min = min_latency_us_.load(std::memory_order_relaxed);
        while (latency_us < current_min || current_min == 0) {
            if (min_latency_us_.compare_exchange_weak(current_min, latency_us,
                                                      std::memory_order_relaxed,
                                                      std::memory_order_relaxed)) {
                break;
            }
        }

        uint64_t current_max = max_latency_us_.load(std::memory_order_relaxed);
        while (latency_us > current_max) {
            if (max_latency_us_.compare_exchange_weak(current_max, latency_us,
                                                      std::memory_order_relaxed,
                                                      std::memory_order_relaxed)) {
                break;
            }
        }
    }

    void record_bytes_received(uint64_t bytes) noexcept {
        bytes_received_.fetch_add(bytes, std::memory_order_relaxed);
    }

    void record_bytes_sent(uint64_t bytes) noexcept {
        bytes_sent_.fetch_add(bytes, std::memory_order_relaxed);
    }

    void record_status_code(uint16_t status_code) noexcept {
        if (status_code >= 200 && status_code < 300) {
            status_2xx_.fetch_add(1, std::memory_order_relaxed);
        } else if (status_code >= 300 && status_code < 400) {
            status_3xx_.fetch_add(1, std::memory_order_relaxed);
        } else if (status_code >= 400 && status_code < 500) {
            status_4xx_.fetch_add(1, std::memory_order_relaxed);
        } else if (status_code >= 500 && status_code < 600) {
            status_5xx_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void record_session_start() noexcept {
        total_sessions_.fetch_add(1, std::memory_order_relaxed);
        active_sessions_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_session_end() noexcept {
        active_sessions_.fetch_sub(1, std::memory_order_relaxed);
    }

    void record_session_failure() noexcept {
        failed_sessions_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_message_relayed() noexcept {
        messages_relayed_.fetch_add(1, std::memory_order_relaxed);
    }

    /// Get current metrics snapshot
    [[nodiscard]] MetricsSnapshot snapshot() const noexcept {
        MetricsSnapshot snap;

        snap.total_requests = total_requests_.load(std::memory_order_relaxed);
        snap.proxy_errors = proxy_errors_.load(std::memory_order_relaxed);

        snap.active_connections = active_connections_.load(std::memory_order_relaxed);
        snap.total_connections = total_connections_.load(std::memory_order_relaxed);

        snap.total_latency_us = total_latency_us_.load(std::memory_order_relaxed);
        snap.min_latency_us = min_latency_us_.load(std::memory_order_relaxed);
        snap.max_latency_us = max_latency_us_.load(std::memory_order_relaxed);

        snap.bytes_received = bytes_received_.load(std::memory_order_relaxed);
        snap.bytes_sent = bytes_sent_.load(std::memory_order_relaxed);

        snap.status_2xx = status_2xx_.load(std::memory_order_relaxed);
        snap.status_3xx = status_3xx_.load(std::memory_order_relaxed);
        snap.status_4xx = status_4xx_.load(std::memory_order_relaxed);
        snap.status_5xx = status_5xx_.load(std::memory_order_relaxed);

        snap.active_sessions = active_sessions_.load(std::memory_order_relaxed);
        snap.total_sessions = total_sessions_.load(std::memory_order_relaxed);
        snap.failed_sessions = failed_sessions_.load(std::memory_order_relaxed);
        snap.messages_relayed = messages_relayed_.load(std::memory_order_relaxed);

        return snap;
    }

private:
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> proxy_errors_{0};

    std::atomic<uint64_t> active_connections_{0};
    std::atomic<uint64_t> total_connections_{0};

    std::atomic<uint64_t> total_latency_us_{0};
    std::atomic<uint64_t> min_latency_us_{0};
    std::atomic<uint64_t> max_latency_us_{0};

    std::atomic<uint64_t> bytes_received_{0};
    std::atomic<uint64_t> bytes_sent_{0};

    std::atomic<uint64_t> status_2xx_{0};
    std::atomic<uint64_t> status_3xx_{0};
    std::atomic<uint64_t> status_4xx_{0};
    std::atomic<uint64_t> status_5xx_{0};

    std::atomic<uint64_t> active_sessions_{0};
    std::atomic<uint64_t> total_sessions_{0};
    std::atomic<uint64_t> failed_sessions_{0};
    std::atomic<uint64_t> messages_relayed_{0};
};

}  // namespace warden::control
