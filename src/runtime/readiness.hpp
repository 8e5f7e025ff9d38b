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

// Warden Readiness Monitor - Header
// Drains backend output, echoes it to the log and flips a one-shot ready flag.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace warden::runtime {

class BackendProcess;

/// Case-insensitive substring match of `phrase` in `line` (empty phrase never matches)
[[nodiscard]] bool matches_readiness_phrase(std::string_view line,
                                            std::string_view phrase) noexcept;

/// One GET to http://host:port<path>; true on a 2xx answer within `timeout`
[[nodiscard]] bool probe_http(const std::string& host, uint16_t port, std::string_view path,
                              std::chrono::milliseconds timeout);

/// Watches a backend's output stream on a background thread.
///
/// The ready flag goes false -> true at most once and never resets.
class ReadinessMonitor {
public:
    explicit ReadinessMonitor(std::string phrase);
    ~ReadinessMonitor();

    ReadinessMonitor(const ReadinessMonitor&) = delete;
    ReadinessMonitor& operator=(const ReadinessMonitor&) = delete;

    /// Start consuming `process` output. `process` must outlive join().
    void start(BackendProcess& process);

    /// Flip the flag. Returns true only for the call that performed the flip.
    bool mark_ready() noexcept;

    [[nodiscard]] bool is_ready() const noexcept { return ready_.load(std::memory_order_acquire); }

    /// True once the backend output closed and the child was reaped
    [[nodiscard]] bool backend_exited() const noexcept {
        return exited_.load(std::memory_order_acquire);
    }

    /// Check the flag every `poll_interval` until `ceiling` elapses.
    /// `probe`, when set, runs once per interval and marks ready on success.
    [[nodiscard]] bool wait_until_ready(std::chrono::milliseconds poll_interval,
                                        std::chrono::milliseconds ceiling,
                                        const std::function<bool()>& probe = {});

    /// Ask the monitor thread to stop; backend exit after this is expected
    void request_stop() noexcept;

    /// Wait for the monitor thread
    void join();

private:
    void run(BackendProcess& process);

    std::string phrase_;
    std::atomic<bool> ready_{false};
    std::atomic<bool> exited_{false};
    std::atomic<bool> stopping_{false};

    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
};

}  // namespace warden::runtime
