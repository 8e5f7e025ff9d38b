// Warden Orchestrator Unit Tests
// Exit status and serving behaviour of runtime::run()

#include <unistd.h>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <future>
#include <string>
#include <vector>

#include "../../src/core/server.hpp"
#include "../../src/runtime/orchestrator.hpp"
#include "test_support.hpp"

using namespace warden;
using namespace std::chrono_literals;

namespace {

control::Config make_config(uint16_t listen_port, uint16_t backend_port) {
    control::Config config;
    config.server.listen_address = "127.0.0.1";
    config.server.listen_port = listen_port;
    config.server.read_timeout = 2000;
    config.server.shutdown_timeout = 1000;
    config.backend.command = {"/bin/sh", "-c", "echo compiling; sleep 30"};
    config.backend.working_directory = "/tmp";
    config.backend.port = backend_port;
    config.backend.shutdown_grace_ms = 1000;
    config.readiness.poll_interval_ms = 50;
    config.readiness.timeout_ms = 300;
    config.proxy.upstream_timeout_ms = 2000;
    config.logging.log_requests = false;
    return config;
}

/// Restores the process-wide run flags a test flips
struct RunFlagsGuard {
    ~RunFlagsGuard() {
        core::g_server_running = true;
        core::g_graceful_shutdown = false;
    }
};

/// Same effect as SIGTERM; lets a pending run() return even when a check fails
struct ShutdownOnExit {
    ~ShutdownOnExit() {
        core::g_graceful_shutdown = true;
        core::g_server_running = false;
    }
};

}  // namespace

TEST_CASE("Backend launch failure exits with status 1", "[runtime][orchestrator]") {
    auto config = make_config(testing::unused_port(), testing::unused_port());

    SECTION("missing program") {
        config.backend.command = {"/nonexistent/warden-backend"};
        REQUIRE(runtime::run(config) == 1);
    }

    SECTION("missing working directory") {
        config.backend.working_directory = "/nonexistent/warden-workdir";
        REQUIRE(runtime::run(config) == 1);
    }
}

TEST_CASE("Listener bind failure exits with status 1", "[runtime][orchestrator]") {
    testing::LoopbackServer occupied([](int) {});
    auto config = make_config(occupied.port(), testing::unused_port());

    REQUIRE(runtime::run(config) == 1);
}

TEST_CASE("Proxy serves after a readiness timeout", "[runtime][orchestrator]") {
    RunFlagsGuard guard;

    testing::LoopbackServer backend([](int fd) {
        std::string request = testing::read_request(fd);
        if (request.starts_with("GET /health ")) {
            testing::respond(fd, 200, R"({"status":"ok"})", "Content-Type: application/json\r\n");
        } else {
            testing::respond(fd, 404, "missing");
        }
    });

    // The script never prints the readiness phrase
    uint16_t listen_port = testing::unused_port();
    auto config = make_config(listen_port, backend.port());

    auto started = std::chrono::steady_clock::now();
    auto status = std::async(std::launch::async, [&config] { return runtime::run(config); });
    ShutdownOnExit shutdown_on_exit;

    int fd = -1;
    REQUIRE(testing::eventually(
        [&] {
            fd = testing::connect_loopback(listen_port);
            return fd >= 0;
        },
        5000ms));
    REQUIRE(std::chrono::steady_clock::now() - started >= 300ms);

    testing::write_all(fd, "GET /health HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");
    std::vector<uint8_t> buffer;
    auto response = testing::read_response(fd, buffer);
    ::close(fd);

    REQUIRE(response.has_value());
    REQUIRE(response->status == 200);
    REQUIRE(response->body == R"({"status":"ok"})");

    core::g_graceful_shutdown = true;
    core::g_server_running = false;

    REQUIRE(status.wait_for(10s) == std::future_status::ready);
    REQUIRE(status.get() == 0);
}
