// Warden Readiness Monitor Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "../../src/runtime/backend_process.hpp"
#include "../../src/runtime/readiness.hpp"
#include "test_support.hpp"

using namespace warden;
using namespace warden::runtime;
using namespace std::chrono_literals;

namespace {

BackendProcess start_script(const std::string& script) {
    control::BackendConfig config;
    config.command = {"/bin/sh", "-c", script};
    config.working_directory = "/tmp";
    config.port = 5902;

    std::error_code ec;
    auto process = BackendProcess::start(config, ec);
    REQUIRE(process.has_value());
    return std::move(*process);
}

}  // namespace

TEST_CASE("Readiness phrase matching", "[runtime][readiness]") {
    REQUIRE(matches_readiness_phrase("10:42:01 AM [express] serving on port 5001",
                                     "serving on port"));
    REQUIRE(matches_readiness_phrase("SERVING ON PORT 5001", "serving on port"));
    REQUIRE(matches_readiness_phrase("serving on port", "Serving On Port"));

    REQUIRE_FALSE(matches_readiness_phrase("serving on", "serving on port"));
    REQUIRE_FALSE(matches_readiness_phrase("compiling...", "serving on port"));
    REQUIRE_FALSE(matches_readiness_phrase("", "serving on port"));
    REQUIRE_FALSE(matches_readiness_phrase("anything", ""));
}

TEST_CASE("Ready flag flips exactly once", "[runtime][readiness]") {
    ReadinessMonitor monitor("ready");
    REQUIRE_FALSE(monitor.is_ready());

    std::atomic<int> flips{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (monitor.mark_ready()) {
                flips.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(flips.load() == 1);
    REQUIRE(monitor.is_ready());
    REQUIRE_FALSE(monitor.mark_ready());
    REQUIRE(monitor.is_ready());
}

TEST_CASE("Backend output phrase makes the proxy ready", "[runtime][readiness]") {
    auto process = start_script("echo compiling; sleep 1; echo 'serving on port 5902'; sleep 30");
    ReadinessMonitor monitor("serving on port");
    monitor.start(process);

    auto started = std::chrono::steady_clock::now();
    REQUIRE(monitor.wait_until_ready(100ms, 5000ms));
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed >= 900ms);
    REQUIRE(elapsed < 3000ms);
    REQUIRE(monitor.is_ready());
    REQUIRE_FALSE(monitor.backend_exited());

    monitor.request_stop();
    process.terminate(1000ms);
    monitor.join();
    REQUIRE_FALSE(process.running());
}

TEST_CASE("Readiness wait gives up at the ceiling", "[runtime][readiness]") {
    auto process = start_script("echo still starting; sleep 30");
    ReadinessMonitor monitor("serving on port");
    monitor.start(process);

    auto started = std::chrono::steady_clock::now();
    REQUIRE_FALSE(monitor.wait_until_ready(100ms, 500ms));
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed >= 500ms);
    REQUIRE(elapsed < 2000ms);
    REQUIRE_FALSE(monitor.is_ready());

    monitor.request_stop();
    process.terminate(1000ms);
    monitor.join();
}

TEST_CASE("Backend exit is observed", "[runtime][readiness]") {
    auto process = start_script("echo crashing; exit 2");
    ReadinessMonitor monitor("serving on port");
    monitor.start(process);

    REQUIRE(testing::eventually([&] { return monitor.backend_exited(); }));
    REQUIRE_FALSE(monitor.is_ready());
    REQUIRE(process.exit_code() == 2);

    monitor.join();
}

TEST_CASE("HTTP probe", "[runtime][readiness][probe]") {
    SECTION("2xx answer is ready") {
        testing::LoopbackServer backend([](int fd) {
            auto request = testing::read_request(fd);
            if (request.starts_with("GET /health HTTP/1.1")) {
                testing::respond(fd, 200, R"({"status":"ok"})",
                                 "Content-Type: application/json\r\n");
            } else {
                testing::respond(fd, 404, "not found");
            }
        });

        REQUIRE(probe_http("127.0.0.1", backend.port(), "/health", 1000ms));
        REQUIRE_FALSE(probe_http("127.0.0.1", backend.port(), "/other", 1000ms));
    }

    SECTION("nothing listening") {
        REQUIRE_FALSE(probe_http("127.0.0.1", testing::unused_port(), "/health", 500ms));
    }

    SECTION("probe marks the monitor ready") {
        testing::LoopbackServer backend([](int fd) {
            (void)testing::read_request(fd);
            testing::respond(fd, 204, "");
        });

        ReadinessMonitor monitor("serving on port");
        uint16_t port = backend.port();
        REQUIRE(monitor.wait_until_ready(50ms, 2000ms, [port] {
            return probe_http("127.0.0.1", port, "/", 500ms);
        }));
        REQUIRE(monitor.is_ready());
    }
}
