#include <catch2/catch_test_macros.hpp>
#include "../src/api_server.hpp"
#include <chrono>
#include <memory>
#include <thread>

using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

struct Fixture {
    std::shared_ptr<HistoryLog> history = std::make_shared<HistoryLog>();
    std::shared_ptr<ReadCache> cache = std::make_shared<ReadCache>(history);
    std::shared_ptr<HealthMonitor> health = std::make_shared<HealthMonitor>();
};

} // namespace

TEST_CASE("A listener that cannot bind is reported as failed", "[api_server]") {
    Fixture f;
    ApiServer server("256.0.0.1", 8080, f.cache, f.health);

    server.start();
    REQUIRE(eventually([&]() { return server.has_failed(); }));

    server.stop();
    REQUIRE_FALSE(server.is_running());
}

TEST_CASE("A clean stop is not a failure", "[api_server]") {
    Fixture f;
    // port 0 lets the kernel pick a free one
    ApiServer server("127.0.0.1", 0, f.cache, f.health);

    server.start();
    std::this_thread::sleep_for(100ms);
    REQUIRE_FALSE(server.has_failed());

    server.stop();
    REQUIRE_FALSE(server.has_failed());
}
