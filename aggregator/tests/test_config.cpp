#include <catch2/catch_test_macros.hpp>
#include "../src/config.hpp"
#include <cstdlib>
#include <stdexcept>

TEST_CASE("Configuration from environment", "[config]") {
    SECTION("Defaults are valid") {
        unsetenv("REFRESH_INTERVAL_SECONDS");
        unsetenv("UP_THRESHOLD");
        unsetenv("LIQ_CONTRARIAN");

        Config cfg = Config::from_env();
        REQUIRE(cfg.refresh_interval_seconds == 45);
        REQUIRE(cfg.history_capacity == 50);
        REQUIRE(cfg.engine.up_threshold == 0.3);
        REQUIRE(cfg.evaluators.weights.funding == 1.5);
        REQUIRE(cfg.evaluators.weights.news == 0.5);
        REQUIRE_FALSE(cfg.evaluators.liq_contrarian);
        REQUIRE(cfg.max_share_price == 0.55);
        REQUIRE_NOTHROW(cfg.validate());
    }

    SECTION("Overrides are read") {
        setenv("UP_THRESHOLD", "0.5", 1);
        setenv("LIQ_CONTRARIAN", "1", 1);

        Config cfg = Config::from_env();
        REQUIRE(cfg.engine.up_threshold == 0.5);
        REQUIRE(cfg.evaluators.liq_contrarian);

        unsetenv("UP_THRESHOLD");
        unsetenv("LIQ_CONTRARIAN");
    }

    SECTION("Unparsable numbers fall back to defaults") {
        setenv("REFRESH_INTERVAL_SECONDS", "soon", 1);
        Config cfg = Config::from_env();
        REQUIRE(cfg.refresh_interval_seconds == 45);
        unsetenv("REFRESH_INTERVAL_SECONDS");
    }

    SECTION("Out of range values are rejected") {
        Config cfg = Config::from_env();
        cfg.refresh_interval_seconds = 1;
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);

        cfg = Config::from_env();
        cfg.engine.down_threshold = 0.0;
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);

        cfg = Config::from_env();
        cfg.evaluators.weights.order_book = -1.0;
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
    }
}
