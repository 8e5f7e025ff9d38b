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

// Warden Backend Process - Implementation

#include "backend_process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>

extern char** environ;

namespace warden::runtime {

namespace {

constexpr std::chrono::milliseconds kReapPollInterval{20};

/// Build "KEY=VALUE" entries: parent environment, then overrides
std::vector<std::string> build_environment(const control::BackendConfig& config) {
    core::fast_map<std::string, std::string> overrides = config.environment;
    overrides[config.port_env] = fmt::format("{}", config.port);

    std::vector<std::string> entries;
    for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
        std::string_view entry{*env};
        auto eq = entry.find('=');
        std::string key{entry.substr(0, eq)};
        if (overrides.contains(key)) {
            continue;
        }
        entries.emplace_back(entry);
    }
    for (const auto& [key, value] : overrides) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

void close_if_open(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

}  // namespace

BackendProcess::BackendProcess(pid_t pid, int output_fd) noexcept
    : pid_(pid), output_fd_(output_fd), state_mutex_(std::make_unique<std::mutex>()) {}

BackendProcess::BackendProcess(BackendProcess&& other) noexcept
    : pid_(other.pid_),
      output_fd_(other.output_fd_),
      pending_(std::move(other.pending_)),
      eof_(other.eof_),
      state_mutex_(std::move(other.state_mutex_)),
      reaped_(other.reaped_),
      exit_code_(other.exit_code_) {
    other.pid_ = -1;
    other.output_fd_ = -1;
    other.reaped_ = true;
}

BackendProcess& BackendProcess::operator=(BackendProcess&& other) noexcept {
    if (this != &other) {
        if (pid_ > 0 && !reaped_) {
            terminate(std::chrono::milliseconds{0});
        }
        close_if_open(output_fd_);

        pid_ = other.pid_;
        output_fd_ = other.output_fd_;
        pending_ = std::move(other.pending_);
        eof_ = other.eof_;
        state_mutex_ = std::move(other.state_mutex_);
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;

        other.pid_ = -1;
        other.output_fd_ = -1;
        other.reaped_ = true;
    }
    return *this;
}

BackendProcess::~BackendProcess() {
    if (pid_ > 0 && state_mutex_ && running()) {
        terminate(std::chrono::milliseconds{2000});
    }
    close_if_open(output_fd_);
}

std::optional<BackendProcess> BackendProcess::start(const control::BackendConfig& config,
                                                    std::error_code& ec) {
    ec.clear();

    if (config.command.empty() || config.command.front().empty()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return std::nullopt;
    }

    // Everything the child needs is prepared before fork()
    std::vector<std::string> env_entries = build_environment(config);
    std::vector<char*> envp;
    envp.reserve(env_entries.size() + 1);
    for (auto& entry : env_entries) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::vector<std::string> args = config.command;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const char* workdir =
        config.working_directory.empty() ? nullptr : config.working_directory.c_str();

    int output_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (::pipe2(output_pipe, O_CLOEXEC) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return std::nullopt;
    }
    if (::pipe2(status_pipe, O_CLOEXEC) < 0) {
        ec = std::error_code(errno, std::generic_category());
        close_if_open(output_pipe[0]);
        close_if_open(output_pipe[1]);
        return std::nullopt;
    }

    int dev_null = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    pid_t pid = ::fork();
    if (pid < 0) {
        ec = std::error_code(errno, std::generic_category());
        close_if_open(output_pipe[0]);
        close_if_open(output_pipe[1]);
        close_if_open(status_pipe[0]);
        close_if_open(status_pipe[1]);
        close_if_open(dev_null);
        return std::nullopt;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls until exec
        ::setpgid(0, 0);

        sigset_t mask;
        sigemptyset(&mask);
        ::sigprocmask(SIG_SETMASK, &mask, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        if (dev_null >= 0) {
            ::dup2(dev_null, STDIN_FILENO);
        }
        ::dup2(output_pipe[1], STDOUT_FILENO);
        ::dup2(output_pipe[1], STDERR_FILENO);

        int err = 0;
        if (workdir != nullptr && ::chdir(workdir) < 0) {
            err = errno;
        } else {
            environ = envp.data();
            ::execvp(argv[0], argv.data());
            err = errno;
        }

        // Exec failed: report errno through the close-on-exec status pipe
        ssize_t written = ::write(status_pipe[1], &err, sizeof(err));
        (void)written;
        ::_exit(127);
    }

    // Parent
    ::setpgid(pid, pid);
    close_if_open(output_pipe[1]);
    close_if_open(status_pipe[1]);
    close_if_open(dev_null);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_if_open(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        // exec never happened; collect the child
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_if_open(output_pipe[0]);
        ec = std::error_code(child_errno, std::generic_category());
        return std::nullopt;
    }

    return BackendProcess(pid, output_pipe[0]);
}

bool BackendProcess::read_line(std::string& line) {
    while (true) {
        ReadStatus status = read_line(line, std::chrono::milliseconds{-1});
        if (status == ReadStatus::Line) {
            return true;
        }
        if (status == ReadStatus::Eof) {
            return false;
        }
    }
}

ReadStatus BackendProcess::read_line(std::string& line, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto newline = pending_.find('\n');
        if (newline != std::string::npos) {
            line.assign(pending_, 0, newline);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            pending_.erase(0, newline + 1);
            return ReadStatus::Line;
        }

        if (eof_ || output_fd_ < 0) {
            if (!pending_.empty()) {
                line = std::move(pending_);
                pending_.clear();
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                return ReadStatus::Line;
            }
            return ReadStatus::Eof;
        }

        int wait_ms = -1;
        if (timeout.count() >= 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return ReadStatus::Timeout;
            }
            wait_ms = static_cast<int>(remaining.count());
        }

        pollfd pfd{output_fd_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            eof_ = true;
            continue;
        }
        if (ready == 0) {
            return ReadStatus::Timeout;
        }

        char buffer[4096];
        ssize_t n = ::read(output_fd_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            eof_ = true;
        } else if (n == 0) {
            eof_ = true;
        } else {
            pending_.append(buffer, static_cast<size_t>(n));
        }
    }
}

bool BackendProcess::reap(bool block) {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(*state_mutex_);
            if (reaped_ || pid_ <= 0) {
                return true;
            }

            int status = 0;
            pid_t result = ::waitpid(pid_, &status, WNOHANG);
            if (result == pid_) {
                reaped_ = true;
                if (WIFEXITED(status)) {
                    exit_code_ = WEXITSTATUS(status);
                } else if (WIFSIGNALED(status)) {
                    exit_code_ = 128 + WTERMSIG(status);
                }
                return true;
            }
            if (result < 0 && errno != EINTR) {
                // ECHILD: nothing left to wait for
                reaped_ = true;
                exit_code_ = -1;
                return true;
            }
        }

        if (!block) {
            return false;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

void BackendProcess::terminate(std::chrono::milliseconds grace) {
    if (pid_ <= 0) {
        return;
    }

    // The leader may already be gone while its group still runs
    ::kill(-pid_, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(false)) {
            break;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }

    // Group members may outlive the leader; make sure nothing keeps running
    ::kill(-pid_, SIGKILL);
    reap(true);
}

std::optional<int> BackendProcess::exit_code() const {
    if (!state_mutex_) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(*state_mutex_);
    if (!reaped_ || pid_ <= 0) {
        return std::nullopt;
    }
    return exit_code_;
}

bool BackendProcess::running() const {
    if (!state_mutex_ || pid_ <= 0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(*state_mutex_);
    return !reaped_;
}

}  // namespace warden::runtime
