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

// Warden Supervising Proxy - Main Entry Point
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "core/server.hpp"
#include "runtime/orchestrator.hpp"

namespace {

void print_usage(const char* program) {
    fprintf(stderr,
            "Usage: %s [--config <config.json>] [-- <backend command> [args...]]\n"
            "\n"
            "Starts the backend command, waits until it reports readiness and\n"
            "proxies HTTP and WebSocket traffic to it.\n",
            program);
}

}  // namespace

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        warden::core::g_graceful_shutdown = true;
        warden::core::g_server_running = false;
    }
}

int main(int argc, char* argv[]) {
    printf("Warden v0.1.0\n");
    printf("Supervising reverse proxy with WebSocket bridging\n\n");

    std::optional<std::string> config_path;
    std::vector<std::string> command_override;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else if (arg == "--") {
            for (++i; i < argc; ++i) {
                command_override.emplace_back(argv[i]);
            }
        } else {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    warden::control::Config config;
    if (config_path) {
        printf("Loading configuration from %s...\n", config_path->c_str());
        auto loaded = warden::control::ConfigLoader::load_from_file(*config_path);
        if (!loaded) {
            fprintf(stderr, "Failed to load configuration\n");
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    }

    auto applied = warden::control::ConfigLoader::apply_env_overrides(
        config, [](const char* name) { return std::getenv(name); });
    for (const auto& name : applied) {
        printf("Using %s from the environment\n", name.c_str());
    }
    if (!command_override.empty()) {
        config.backend.command = std::move(command_override);
    }

    auto validation = warden::control::ConfigLoader::validate(config);
    if (validation.has_errors()) {
        fprintf(stderr, "Configuration validation errors:\n");
        for (const auto& error : validation.errors) {
            fprintf(stderr, "  - %s\n", error.c_str());
        }
        return EXIT_FAILURE;
    }
    if (!validation.warnings.empty()) {
        printf("Configuration warnings:\n");
        for (const auto& warning : validation.warnings) {
            printf("  - %s\n", warning.c_str());
        }
    }

    warden::logging::init_logging_system();
    warden::logging::init_logger(config.logging);

    // Install signal handlers for graceful shutdown
    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal

    int status = warden::runtime::run(config);

    warden::logging::shutdown_logging();
    printf("Warden stopped.\n");
    return status == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
