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

// Warden Backend Process - Header
// Owns the supervised backend child: spawn, combined output stream, termination.

#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

#include "../control/config.hpp"

namespace warden::runtime {

/// Outcome of a timed read_line()
enum class ReadStatus : uint8_t {
    Line,     // A full line (or the unterminated tail at EOF) was produced
    Timeout,  // No complete line within the timeout
    Eof       // Output closed and fully drained
};

/// Handle to a running backend process.
///
/// stdout and stderr of the child share one pipe, read back line by line.
/// The child leads its own process group so signals reach anything it spawns.
class BackendProcess {
public:
    /// Spawn `config.command` in `config.working_directory` with the parent
    /// environment, `config.environment`, and `<port_env>=<port>`.
    /// Returns std::nullopt with `ec` set when the program cannot be started.
    [[nodiscard]] static std::optional<BackendProcess> start(const control::BackendConfig& config,
                                                             std::error_code& ec);

    ~BackendProcess();

    BackendProcess(const BackendProcess&) = delete;
    BackendProcess& operator=(const BackendProcess&) = delete;
    BackendProcess(BackendProcess&& other) noexcept;
    BackendProcess& operator=(BackendProcess&& other) noexcept;

    /// Block until the next output line (trailing "\n" or "\r\n" removed).
    /// Returns false once the output is closed and drained.
    [[nodiscard]] bool read_line(std::string& line);

    /// Same as read_line() but gives up after `timeout`
    [[nodiscard]] ReadStatus read_line(std::string& line, std::chrono::milliseconds timeout);

    /// SIGTERM the process group, SIGKILL after `grace`, reap the child
    void terminate(std::chrono::milliseconds grace);

    /// Reap the child if it has exited. With `block`, wait until it does.
    /// Returns true once the child has been reaped.
    bool reap(bool block = false);

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    /// Exit status once reaped (128 + signal number for a signalled child)
    [[nodiscard]] std::optional<int> exit_code() const;

    [[nodiscard]] bool running() const;

private:
    BackendProcess(pid_t pid, int output_fd) noexcept;

    pid_t pid_ = -1;
    int output_fd_ = -1;
    std::string pending_;  // Output read past the last returned line
    bool eof_ = false;

    // Reaping happens from both the monitor thread and the controller
    std::unique_ptr<std::mutex> state_mutex_;
    bool reaped_ = false;
    int exit_code_ = 0;
};

}  // namespace warden::runtime
