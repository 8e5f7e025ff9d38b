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

// Warden Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"

namespace warden::control {

/// Front-facing listener configuration
struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 5000;
    uint32_t backlog = 128;

    // Timeouts (milliseconds)
    uint32_t read_timeout = 60000;      // Idle keep-alive connection
    uint32_t shutdown_timeout = 30000;  // Connection drain on SIGTERM

    uint32_t max_request_size = 10485760;  // 10MB (headers + body)
};

/// Supervised backend process configuration
struct BackendConfig {
    std::vector<std::string> command = {"npx", "tsx", "server/index.ts"};
    std::string working_directory = ".";
    std::string host = "127.0.0.1";
    uint16_t port = 5001;
    std::string port_env = "PORT";  // Variable that carries `port` to the child
    core::fast_map<std::string, std::string> environment = {{"NODE_ENV", "development"}};
    uint32_t shutdown_grace_ms = 5000;  // SIGTERM to SIGKILL
};

/// Backend readiness detection
struct ReadinessConfig {
    std::string phrase = "serving on port";  // Case-insensitive substring of an output line
    uint32_t poll_interval_ms = 1000;
    uint32_t timeout_ms = 30000;
    std::string probe_path;  // Optional HTTP probe, e.g. "/health" (empty = disabled)
};

/// Forwarding and upgrade bridging
struct ProxyConfig {
    uint32_t upstream_timeout_ms = 30000;
    std::string upgrade_path = "/ws";          // Inbound path handled by the upgrade bridge
    std::string backend_upgrade_path = "/ws";  // Fixed backend path the bridge dials
    uint64_t max_response_size = 104857600;    // 100MB
    uint64_t max_message_size = 16777216;      // 16MB per WebSocket message
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";  // debug, info, warning, error
    std::string format = "text";  // json, text (file output only)
    std::string output;           // Log directory; empty logs to the console
    bool log_requests = true;

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Warden configuration
struct Config {
    ServerConfig server;
    BackendConfig backend;
    ReadinessConfig readiness;
    ProxyConfig proxy;
    LogConfig logging;

    std::optional<std::string> description;
};

// Custom from_json/to_json so partial configs fall back to defaults

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.listen_address = j.value("listen_address", std::string("0.0.0.0"));
    s.listen_port = j.value("listen_port", uint16_t(5000));
    s.backlog = j.value("backlog", 128u);
    s.read_timeout = j.value("read_timeout", 60000u);
    s.shutdown_timeout = j.value("shutdown_timeout", 30000u);
    s.max_request_size = j.value("max_request_size", 10485760u);
}

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"backlog", s.backlog},
                       {"read_timeout", s.read_timeout},
                       {"shutdown_timeout", s.shutdown_timeout},
                       {"max_request_size", s.max_request_size}};
}

inline void from_json(const nlohmann::json& j, BackendConfig& b) {
    b.command = j.value("command", std::vector<std::string>{"npx", "tsx", "server/index.ts"});
    b.working_directory = j.value("working_directory", std::string("."));
    b.host = j.value("host", std::string("127.0.0.1"));
    b.port = j.value("port", uint16_t(5001));
    b.port_env = j.value("port_env", std::string("PORT"));
    b.shutdown_grace_ms = j.value("shutdown_grace_ms", 5000u);

    // An explicit environment object replaces the default entries
    if (j.contains("environment")) {
        b.environment.clear();
        for (const auto& [key, value] : j.at("environment").items()) {
            b.environment[key] = value.get<std::string>();
        }
    }
}

inline void to_json(nlohmann::json& j, const BackendConfig& b) {
    nlohmann::json env = nlohmann::json::object();
    for (const auto& [key, value] : b.environment) {
        env[key] = value;
    }
    j = nlohmann::json{{"command", b.command},
                       {"working_directory", b.working_directory},
                       {"host", b.host},
                       {"port", b.port},
                       {"port_env", b.port_env},
                       {"environment", env},
                       {"shutdown_grace_ms", b.shutdown_grace_ms}};
}

inline void from_json(const nlohmann::json& j, ReadinessConfig& r) {
    r.phrase = j.value("phrase", std::string("serving on port"));
    r.poll_interval_ms = j.value("poll_interval_ms", 1000u);
    r.timeout_ms = j.value("timeout_ms", 30000u);
    r.probe_path = j.value("probe_path", std::string());
}

inline void to_json(nlohmann::json& j, const ReadinessConfig& r) {
    j = nlohmann::json{{"phrase", r.phrase},
                       {"poll_interval_ms", r.poll_interval_ms},
                       {"timeout_ms", r.timeout_ms},
                       {"probe_path", r.probe_path}};
}

inline void from_json(const nlohmann::json& j, ProxyConfig& p) {
    p.upstream_timeout_ms = j.value("upstream_timeout_ms", 30000u);
    p.upgrade_path = j.value("upgrade_path", std::string("/ws"));
    p.backend_upgrade_path = j.value("backend_upgrade_path", std::string("/ws"));
    p.max_response_size = j.value("max_response_size", uint64_t(104857600));
    p.max_message_size = j.value("max_message_size", uint64_t(16777216));
}

inline void to_json(nlohmann::json& j, const ProxyConfig& p) {
    j = nlohmann::json{{"upstream_timeout_ms", p.upstream_timeout_ms},
                       {"upgrade_path", p.upgrade_path},
                       {"backend_upgrade_path", p.backend_upgrade_path},
                       {"max_response_size", p.max_response_size},
                       {"max_message_size", p.max_message_size}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string());
    l.log_requests = j.value("log_requests", true);
    l.rotation = j.value("rotation", LogConfig::RotationConfig{});
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"log_requests", l.log_requests},
                       {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, Config& c) {
    c.server = j.value("server", ServerConfig{});
    c.backend = j.value("backend", BackendConfig{});
    c.readiness = j.value("readiness", ReadinessConfig{});
    c.proxy = j.value("proxy", ProxyConfig{});
    c.logging = j.value("logging", LogConfig{});
    if (j.contains("description")) {
        c.description = j.at("description").get<std::string>();
    }
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{{"server", c.server},
                       {"backend", c.backend},
                       {"readiness", c.readiness},
                       {"proxy", c.proxy},
                       {"logging", c.logging}};
    if (c.description) {
        j["description"] = *c.description;
    }
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Environment lookup used for overrides (returns nullptr when unset)
using EnvLookup = std::function<const char*(const char*)>;

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string. Parses only; call validate() once
    /// environment overrides have been applied.
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Apply WARDEN_* environment variables on top of file/default values.
    /// Returns the names of variables that were applied.
    static std::vector<std::string> apply_env_overrides(Config& config, const EnvLookup& lookup);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

/// Split a command line on whitespace (no quoting rules)
[[nodiscard]] std::vector<std::string> split_command(std::string_view command);

}  // namespace warden::control
