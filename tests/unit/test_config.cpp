// Warden Configuration Layer Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

#include "../../src/control/config.hpp"

using namespace warden::control;

namespace {

bool contains_message(const std::vector<std::string>& messages, std::string_view needle) {
    for (const auto& message : messages) {
        if (message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Environment backed by a map instead of the process environment
struct FakeEnv {
    std::map<std::string, std::string> vars;

    EnvLookup lookup() const {
        return [this](const char* name) -> const char* {
            auto it = vars.find(name);
            return it == vars.end() ? nullptr : it->second.c_str();
        };
    }
};

}  // namespace

TEST_CASE("Config defaults", "[control][config]") {
    Config config;

    REQUIRE(config.server.listen_address == "0.0.0.0");
    REQUIRE(config.server.listen_port == 5000);
    REQUIRE(config.backend.host == "127.0.0.1");
    REQUIRE(config.backend.port == 5001);
    REQUIRE(config.backend.port_env == "PORT");
    REQUIRE(config.backend.command == std::vector<std::string>{"npx", "tsx", "server/index.ts"});
    REQUIRE(config.backend.environment.at("NODE_ENV") == "development");
    REQUIRE(config.readiness.phrase == "serving on port");
    REQUIRE(config.readiness.poll_interval_ms == 1000);
    REQUIRE(config.readiness.timeout_ms == 30000);
    REQUIRE(config.proxy.upgrade_path == "/ws");
    REQUIRE(config.proxy.backend_upgrade_path == "/ws");
    REQUIRE_FALSE(config.description.has_value());

    auto result = ConfigLoader::validate(config);
    REQUIRE(result.valid);
    REQUIRE(result.errors.empty());
}

TEST_CASE("Config JSON serialization", "[control][config]") {
    Config config;
    config.server.listen_port = 8080;
    config.description = "dev proxy";

    std::string json = ConfigLoader::to_json(config);
    REQUIRE_FALSE(json.empty());
    REQUIRE(json.find("\"listen_port\": 8080") != std::string::npos);
    REQUIRE(json.find("\"phrase\": \"serving on port\"") != std::string::npos);
    REQUIRE(json.find("\"description\": \"dev proxy\"") != std::string::npos);

    // Serialized output loads back into an equivalent config
    auto reloaded = ConfigLoader::load_from_json(json);
    REQUIRE(reloaded.has_value());
    REQUIRE(reloaded->server.listen_port == 8080);
    REQUIRE(reloaded->backend.environment.at("NODE_ENV") == "development");
    REQUIRE(reloaded->description.value_or("") == "dev proxy");
}

TEST_CASE("Config JSON deserialization", "[control][config]") {
    SECTION("partial config keeps defaults") {
        auto config = ConfigLoader::load_from_json(R"({
            "server": { "listen_port": 9000 },
            "readiness": { "phrase": "listening" }
        })");

        REQUIRE(config.has_value());
        REQUIRE(config->server.listen_port == 9000);
        REQUIRE(config->server.listen_address == "0.0.0.0");
        REQUIRE(config->readiness.phrase == "listening");
        REQUIRE(config->readiness.timeout_ms == 30000);
        REQUIRE(config->backend.port == 5001);
    }

    SECTION("explicit environment replaces the default entries") {
        auto config = ConfigLoader::load_from_json(R"({
            "backend": {
                "command": ["node", "dist/index.js"],
                "port": 7001,
                "environment": { "NODE_ENV": "production", "API_KEY": "x" }
            }
        })");

        REQUIRE(config.has_value());
        REQUIRE(config->backend.command == std::vector<std::string>{"node", "dist/index.js"});
        REQUIRE(config->backend.port == 7001);
        REQUIRE(config->backend.environment.size() == 2);
        REQUIRE(config->backend.environment.at("NODE_ENV") == "production");
        REQUIRE(config->backend.environment.at("API_KEY") == "x");
    }

    SECTION("empty object yields defaults") {
        auto config = ConfigLoader::load_from_json("{}");
        REQUIRE(config.has_value());
        REQUIRE(config->server.listen_port == 5000);
        REQUIRE(config->logging.level == "info");
    }

    SECTION("malformed JSON is rejected") {
        REQUIRE_FALSE(ConfigLoader::load_from_json("{ not json").has_value());
        REQUIRE_FALSE(ConfigLoader::load_from_json(R"({"server": {"listen_port": "abc"}})")
                          .has_value());
    }
}

TEST_CASE("Config load from file", "[control][config]") {
    auto path = std::filesystem::temp_directory_path() / "warden_test_config.json";
    {
        std::ofstream out(path);
        out << R"({ "server": { "listen_port": 5100 }, "backend": { "port": 5101 } })";
    }

    auto config = ConfigLoader::load_from_file(path.string());
    std::filesystem::remove(path);

    REQUIRE(config.has_value());
    REQUIRE(config->server.listen_port == 5100);
    REQUIRE(config->backend.port == 5101);

    REQUIRE_FALSE(ConfigLoader::load_from_file("/nonexistent/warden.json").has_value());
}

TEST_CASE("Config validation errors", "[control][config][validation]") {
    Config config;

    SECTION("listener") {
        config.server.listen_port = 0;
        config.server.listen_address = "localhost";

        auto result = ConfigLoader::validate(config);
        REQUIRE(result.has_errors());
        REQUIRE(contains_message(result.errors, "listen_port"));
        REQUIRE(contains_message(result.errors, "not an IPv4 address"));
    }

    SECTION("backend port collides with the listen port") {
        config.backend.port = config.server.listen_port;

        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(contains_message(result.errors, "collides"));
    }

    SECTION("empty backend command") {
        config.backend.command.clear();
        REQUIRE(contains_message(ConfigLoader::validate(config).errors, "command"));

        config.backend.command = {""};
        REQUIRE(contains_message(ConfigLoader::validate(config).errors, "command"));
    }

    SECTION("readiness needs a phrase or a probe") {
        config.readiness.phrase.clear();
        REQUIRE(contains_message(ConfigLoader::validate(config).errors, "phrase"));

        config.readiness.probe_path = "/health";
        REQUIRE(ConfigLoader::validate(config).valid);

        config.readiness.probe_path = "health";
        REQUIRE(contains_message(ConfigLoader::validate(config).errors, "probe_path"));
    }

    SECTION("upgrade paths must be absolute") {
        config.proxy.upgrade_path = "ws";
        config.proxy.backend_upgrade_path = "";

        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "upgrade_path"));
        REQUIRE(contains_message(result.errors, "backend_upgrade_path"));
    }

    SECTION("zero limits") {
        config.server.max_request_size = 0;
        config.proxy.max_response_size = 0;
        config.proxy.max_message_size = 0;
        config.proxy.upstream_timeout_ms = 0;

        auto result = ConfigLoader::validate(config);
        REQUIRE(result.errors.size() == 4);
    }

    SECTION("logging") {
        config.logging.level = "verbose";
        config.logging.format = "xml";

        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "level"));
        REQUIRE(contains_message(result.errors, "format"));
    }
}

TEST_CASE("Config validation warnings", "[control][config][validation]") {
    Config config;
    config.backend.environment["PORT"] = "9999";
    config.readiness.timeout_ms = 500;
    config.logging.format = "json";

    auto result = ConfigLoader::validate(config);
    REQUIRE(result.valid);
    REQUIRE(result.warnings.size() == 3);
    REQUIRE(contains_message(result.warnings, "overridden"));
    REQUIRE(contains_message(result.warnings, "poll_interval_ms"));
    REQUIRE(contains_message(result.warnings, "file output"));
}

TEST_CASE("Environment overrides", "[control][config][env]") {
    Config config;
    FakeEnv env;

    SECTION("all supported variables") {
        env.vars = {{"WARDEN_LISTEN_ADDRESS", "127.0.0.1"},
                    {"WARDEN_PORT", "8000"},
                    {"WARDEN_BACKEND_PORT", "8001"},
                    {"WARDEN_BACKEND_COMMAND", "node  server.js --inspect"},
                    {"WARDEN_BACKEND_WORKDIR", "/srv/app"},
                    {"WARDEN_READY_PHRASE", "ready"},
                    {"WARDEN_LOG_LEVEL", "debug"}};

        auto applied = ConfigLoader::apply_env_overrides(config, env.lookup());

        REQUIRE(applied.size() == 7);
        REQUIRE(config.server.listen_address == "127.0.0.1");
        REQUIRE(config.server.listen_port == 8000);
        REQUIRE(config.backend.port == 8001);
        REQUIRE(config.backend.command ==
                std::vector<std::string>{"node", "server.js", "--inspect"});
        REQUIRE(config.backend.working_directory == "/srv/app");
        REQUIRE(config.readiness.phrase == "ready");
        REQUIRE(config.logging.level == "debug");
    }

    SECTION("unset and empty variables are ignored") {
        env.vars = {{"WARDEN_PORT", ""}};

        auto applied = ConfigLoader::apply_env_overrides(config, env.lookup());

        REQUIRE(applied.empty());
        REQUIRE(config.server.listen_port == 5000);
    }

    SECTION("invalid ports are ignored") {
        env.vars = {{"WARDEN_PORT", "70000"}, {"WARDEN_BACKEND_PORT", "80a"}};

        auto applied = ConfigLoader::apply_env_overrides(config, env.lookup());

        REQUIRE(applied.empty());
        REQUIRE(config.server.listen_port == 5000);
        REQUIRE(config.backend.port == 5001);
    }

    SECTION("whitespace-only command keeps the configured one") {
        env.vars = {{"WARDEN_BACKEND_COMMAND", "   "}};

        auto applied = ConfigLoader::apply_env_overrides(config, env.lookup());

        REQUIRE(applied.empty());
        REQUIRE(config.backend.command.size() == 3);
    }

    SECTION("null lookup") {
        REQUIRE(ConfigLoader::apply_env_overrides(config, EnvLookup{}).empty());
    }
}

TEST_CASE("Command splitting", "[control][config]") {
    REQUIRE(split_command("npx tsx server/index.ts") ==
            std::vector<std::string>{"npx", "tsx", "server/index.ts"});
    REQUIRE(split_command("  node\tapp.js \n") == std::vector<std::string>{"node", "app.js"});
    REQUIRE(split_command("").empty());
    REQUIRE(split_command("   ").empty());
}
