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

// Warden Runtime Orchestrator - Implementation

#include "orchestrator.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <chrono>
#include <functional>
#include <string>
#include <system_error>

#include "../control/metrics.hpp"
#include "../core/logging.hpp"
#include "../core/server.hpp"
#include "../gateway/forwarder.hpp"
#include "../gateway/upgrade_bridge.hpp"
#include "backend_process.hpp"
#include "readiness.hpp"

namespace warden::runtime {

namespace {

constexpr std::chrono::milliseconds kProbeTimeout{1000};

void log_metrics_summary(quill::Logger* logger, const control::MetricsSnapshot& snap) {
    LOG_INFO(logger,
             "Served {} requests ({} proxy errors, avg latency {:.0f}us), "
             "{} connections, {} WebSocket sessions ({} failed, {} messages relayed)",
             snap.total_requests, snap.proxy_errors, snap.avg_latency_us(),
             snap.total_connections, snap.total_sessions, snap.failed_sessions,
             snap.messages_relayed);
}

}  // namespace

int run(const control::Config& config) {
    auto* logger = logging::get_logger();

    // Phase 1: launch the backend
    std::string command_line = fmt::format("{}", fmt::join(config.backend.command, " "));
    LOG_INFO(logger, "Starting backend: {} (port {})", command_line, config.backend.port);

    std::error_code ec;
    auto process = BackendProcess::start(config.backend, ec);
    if (!process) {
        LOG_ERROR(logger, "Failed to start backend process '{}': {}", command_line, ec.message());
        return 1;
    }
    LOG_INFO(logger, "Backend process started (pid {})", process->pid());

    // Phase 2: wait for readiness, then serve regardless
    ReadinessMonitor monitor(config.readiness.phrase);
    monitor.start(*process);

    std::function<bool()> probe;
    if (!config.readiness.probe_path.empty()) {
        probe = [&config] {
            return probe_http(config.backend.host, config.backend.port,
                              config.readiness.probe_path, kProbeTimeout);
        };
    }

    auto ready_timeout = std::chrono::milliseconds(config.readiness.timeout_ms);
    if (monitor.wait_until_ready(std::chrono::milliseconds(config.readiness.poll_interval_ms),
                                 ready_timeout, probe)) {
        LOG_INFO(logger, "Backend ready on {}:{}", config.backend.host, config.backend.port);
    } else {
        LOG_WARNING(logger,
                    "Backend did not report readiness within {}ms, starting proxy anyway",
                    ready_timeout.count());
    }
    if (monitor.backend_exited()) {
        LOG_WARNING(logger, "Backend is not running; requests will be answered with 502");
    }

    // Phase 3: serve
    control::ProxyMetrics metrics;
    gateway::Forwarder forwarder(config.backend, config.proxy, &metrics);
    gateway::UpgradeBridge bridge(config.backend, config.proxy, &metrics);

    int exit_status = 0;
    {
        core::Server server(config, forwarder, bridge, metrics);
        if (auto err = server.start()) {
            LOG_ERROR(logger, "Failed to listen on {}:{}: {}", config.server.listen_address,
                      config.server.listen_port, err.message());
            exit_status = 1;
        } else {
            LOG_INFO(logger, "Proxying {}:{} -> {}:{} (upgrade path {})",
                     config.server.listen_address, server.port(), config.backend.host,
                     config.backend.port, config.proxy.upgrade_path);

            server.run();

            // Phase 4: drain
            LOG_INFO(logger, "Shutting down...");
            if (!server.drain(std::chrono::milliseconds(config.server.shutdown_timeout))) {
                server.close_active_connections();
            }
        }
        // ~Server waits for the remaining handler threads
    }

    // Phase 5: stop the backend
    monitor.request_stop();
    process->terminate(std::chrono::milliseconds(config.backend.shutdown_grace_ms));
    monitor.join();

    log_metrics_summary(logger, metrics.snapshot());
    return exit_status;
}

}  // namespace warden::runtime
