#include <catch2/catch_test_macros.hpp>
#include "../src/history_log.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

HistoryEntry entry_at(int64_t ts) {
    HistoryEntry e;
    e.verdict.timestamp_ms = ts;
    e.btc_price = 60000.0 + static_cast<double>(ts);
    return e;
}

} // namespace

TEST_CASE("History ring buffer", "[history_log]") {
    HistoryLog log;

    SECTION("Starts empty") {
        REQUIRE(log.size() == 0);
        REQUIRE(log.snapshot().empty());
        REQUIRE(log.capacity() == 50);
    }

    SECTION("Keeps insertion order below capacity") {
        for (int i = 1; i <= 10; ++i) log.append(entry_at(i));

        auto entries = log.snapshot();
        REQUIRE(entries.size() == 10);
        REQUIRE(entries.front().verdict.timestamp_ms == 1);
        REQUIRE(entries.back().verdict.timestamp_ms == 10);
    }

    SECTION("51 appends evict only the first") {
        for (int i = 1; i <= 51; ++i) log.append(entry_at(i));

        auto entries = log.snapshot();
        REQUIRE(log.size() == 50);
        REQUIRE(entries.size() == 50);
        for (std::size_t i = 0; i < entries.size(); ++i) {
            REQUIRE(entries[i].verdict.timestamp_ms == static_cast<int64_t>(i) + 2);
        }
    }

    SECTION("Many wraps keep the newest entries in order") {
        for (int i = 1; i <= 237; ++i) log.append(entry_at(i));

        auto entries = log.snapshot();
        REQUIRE(entries.size() == 50);
        REQUIRE(entries.front().verdict.timestamp_ms == 188);
        REQUIRE(entries.back().verdict.timestamp_ms == 237);
    }

    SECTION("latest returns the most recent, oldest first") {
        for (int i = 1; i <= 60; ++i) log.append(entry_at(i));

        auto last3 = log.latest(3);
        REQUIRE(last3.size() == 3);
        REQUIRE(last3[0].verdict.timestamp_ms == 58);
        REQUIRE(last3[2].verdict.timestamp_ms == 60);

        REQUIRE(log.latest(0).empty());
        REQUIRE(log.latest(500).size() == 50);
    }
}

TEST_CASE("History capacity must be positive", "[history_log]") {
    REQUIRE_THROWS_AS(HistoryLog(0), std::invalid_argument);

    HistoryLog one(1);
    one.append(entry_at(1));
    one.append(entry_at(2));
    REQUIRE(one.snapshot().size() == 1);
    REQUIRE(one.snapshot().front().verdict.timestamp_ms == 2);
}

TEST_CASE("History snapshots stay consistent under concurrent appends", "[history_log]") {
    HistoryLog log(50);
    std::atomic<bool> done{false};
    std::atomic<int> bad_snapshots{0};

    std::thread writer([&]() {
        for (int i = 1; i <= 5000; ++i) log.append(entry_at(i));
        done = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            while (!done) {
                auto entries = log.snapshot();
                if (entries.size() > 50) bad_snapshots++;
                // a consistent view is strictly consecutive
                for (std::size_t i = 1; i < entries.size(); ++i) {
                    if (entries[i].verdict.timestamp_ms != entries[i - 1].verdict.timestamp_ms + 1) {
                        bad_snapshots++;
                        break;
                    }
                }
            }
        });
    }

    writer.join();
    for (auto& t : readers) t.join();

    REQUIRE(bad_snapshots == 0);
    REQUIRE(log.snapshot().back().verdict.timestamp_ms == 5000);
}
