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

// Warden Configuration - Implementation

#include "config.hpp"

#include <arpa/inet.h>

#include <cctype>
#include <charconv>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace warden::control {

namespace {

bool parse_port(std::string_view value, uint16_t& out) {
    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), port);
    if (ec != std::errc{} || ptr != value.data() + value.size() || port == 0 || port > 65535) {
        return false;
    }
    out = static_cast<uint16_t>(port);
    return true;
}

bool is_known_level(const std::string& level) {
    return level == "debug" || level == "info" || level == "warning" || level == "warn" ||
           level == "error";
}

}  // namespace

std::vector<std::string> split_command(std::string_view command) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < command.size()) {
        while (pos < command.size() && std::isspace(static_cast<unsigned char>(command[pos]))) {
            ++pos;
        }
        size_t start = pos;
        while (pos < command.size() && !std::isspace(static_cast<unsigned char>(command[pos]))) {
            ++pos;
        }
        if (pos > start) {
            parts.emplace_back(command.substr(start, pos - start));
        }
    }
    return parts;
}

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open configuration file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    try {
        auto j = nlohmann::json::parse(json);
        return j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Server
    if (config.server.listen_port == 0) {
        result.add_error("Server listen_port must be > 0");
    }

    in_addr addr{};
    if (inet_pton(AF_INET, config.server.listen_address.c_str(), &addr) != 1) {
        result.add_error("Server listen_address '" + config.server.listen_address +
                         "' is not an IPv4 address");
    }

    if (config.server.max_request_size == 0) {
        result.add_error("Server max_request_size must be > 0");
    }

    if (config.server.read_timeout == 0) {
        result.add_error("Server read_timeout must be > 0");
    }

    // Backend
    if (config.backend.command.empty() || config.backend.command.front().empty()) {
        result.add_error("Backend command cannot be empty");
    }

    if (config.backend.host.empty()) {
        result.add_error("Backend host cannot be empty");
    }

    if (config.backend.port == 0) {
        result.add_error("Backend port must be > 0");
    }

    if (config.backend.port == config.server.listen_port) {
        result.add_error("Backend port " + std::to_string(config.backend.port) +
                         " collides with the listen port");
    }

    if (config.backend.port_env.empty()) {
        result.add_error("Backend port_env cannot be empty");
    }

    if (config.backend.environment.contains(config.backend.port_env)) {
        result.add_warning("Backend environment sets '" + config.backend.port_env +
                           "', it is overridden with the backend port");
    }

    // Readiness
    if (config.readiness.phrase.empty() && config.readiness.probe_path.empty()) {
        result.add_error("Readiness needs a phrase or a probe_path");
    }

    if (config.readiness.poll_interval_ms == 0) {
        result.add_error("Readiness poll_interval_ms must be > 0");
    }

    if (config.readiness.timeout_ms < config.readiness.poll_interval_ms) {
        result.add_warning("Readiness timeout_ms is shorter than poll_interval_ms");
    }

    if (!config.readiness.probe_path.empty() && config.readiness.probe_path.front() != '/') {
        result.add_error("Readiness probe_path must start with '/'");
    }

    // Proxy
    if (config.proxy.upstream_timeout_ms == 0) {
        result.add_error("Proxy upstream_timeout_ms must be > 0");
    }

    if (config.proxy.upgrade_path.empty() || config.proxy.upgrade_path.front() != '/') {
        result.add_error("Proxy upgrade_path must start with '/'");
    }

    if (config.proxy.backend_upgrade_path.empty() ||
        config.proxy.backend_upgrade_path.front() != '/') {
        result.add_error("Proxy backend_upgrade_path must start with '/'");
    }

    if (config.proxy.max_response_size == 0) {
        result.add_error("Proxy max_response_size must be > 0");
    }

    if (config.proxy.max_message_size == 0) {
        result.add_error("Proxy max_message_size must be > 0");
    }

    // Logging
    if (!is_known_level(config.logging.level)) {
        result.add_error("Unknown logging level '" + config.logging.level + "'");
    }

    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("Unknown logging format '" + config.logging.format + "'");
    }

    if (config.logging.output.empty() && config.logging.format == "json") {
        result.add_warning("JSON log format only applies to file output");
    }

    return result;
}

std::vector<std::string> ConfigLoader::apply_env_overrides(Config& config,
                                                           const EnvLookup& lookup) {
    std::vector<std::string> applied;

    auto get = [&](const char* name) -> std::optional<std::string_view> {
        const char* value = lookup ? lookup(name) : nullptr;
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string_view(value);
    };

    if (auto v = get("WARDEN_LISTEN_ADDRESS")) {
        config.server.listen_address = std::string(*v);
        applied.emplace_back("WARDEN_LISTEN_ADDRESS");
    }

    if (auto v = get("WARDEN_PORT")) {
        if (parse_port(*v, config.server.listen_port)) {
            applied.emplace_back("WARDEN_PORT");
        } else {
            fprintf(stderr, "Ignoring invalid WARDEN_PORT=%.*s\n", static_cast<int>(v->size()),
                    v->data());
        }
    }

    if (auto v = get("WARDEN_BACKEND_PORT")) {
        if (parse_port(*v, config.backend.port)) {
            applied.emplace_back("WARDEN_BACKEND_PORT");
        } else {
            fprintf(stderr, "Ignoring invalid WARDEN_BACKEND_PORT=%.*s\n",
                    static_cast<int>(v->size()), v->data());
        }
    }

    if (auto v = get("WARDEN_BACKEND_COMMAND")) {
        auto command = split_command(*v);
        if (!command.empty()) {
            config.backend.command = std::move(command);
            applied.emplace_back("WARDEN_BACKEND_COMMAND");
        }
    }

    if (auto v = get("WARDEN_BACKEND_WORKDIR")) {
        config.backend.working_directory = std::string(*v);
        applied.emplace_back("WARDEN_BACKEND_WORKDIR");
    }

    if (auto v = get("WARDEN_READY_PHRASE")) {
        config.readiness.phrase = std::string(*v);
        applied.emplace_back("WARDEN_READY_PHRASE");
    }

    if (auto v = get("WARDEN_LOG_LEVEL")) {
        config.logging.level = std::string(*v);
        applied.emplace_back("WARDEN_LOG_LEVEL");
    }

    return applied;
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

}  // namespace warden::control
