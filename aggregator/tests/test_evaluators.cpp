#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/evaluators.hpp"
#include <stdexcept>

using Catch::Approx;

namespace {

template <typename T>
SourceSnapshot ok_snapshot(const std::string& source, T payload) {
    return SourceSnapshot::ok(source, std::move(payload), 1000);
}

SourceSnapshot failed_snapshot(const std::string& source) {
    return SourceSnapshot::failed(source, FetchError{FetchErrorKind::Timeout, "slow"}, 1000);
}

FundingData funding(double rate) {
    FundingData f;
    f.current_rate = rate;
    return f;
}

LiquidationData liquidations(double long_usd, double short_usd) {
    LiquidationData l;
    l.long_usd = long_usd;
    l.short_usd = short_usd;
    l.total_usd = long_usd + short_usd;
    return l;
}

OrderBookWalls walls(double bid, double ask) {
    OrderBookWalls w;
    w.bid_wall_volume = bid;
    w.ask_wall_volume = ask;
    w.has_ratio = ask > 0.0;
    w.wall_ratio = ask > 0.0 ? bid / ask : 0.0;
    return w;
}

LongShortData long_short(double ratio) {
    LongShortData ls;
    ls.current_ratio = ratio;
    return ls;
}

NewsSummary news(double avg) {
    NewsSummary n;
    n.avg_score = avg;
    return n;
}

} // namespace

TEST_CASE("Failed or missing sources produce no vote", "[evaluators]") {
    SignalEvaluator evaluator;

    REQUIRE_FALSE(evaluator.evaluate_funding(nullptr).has_value());

    auto failed = failed_snapshot(source_names::kFunding);
    REQUIRE_FALSE(evaluator.evaluate_funding(&failed).has_value());

    // wrong payload type for the evaluator
    auto wrong = ok_snapshot(source_names::kFunding, news(0.5));
    REQUIRE_FALSE(evaluator.evaluate_funding(&wrong).has_value());

    REQUIRE(evaluator.evaluate_all(SnapshotMap{}).empty());
}

TEST_CASE("Funding rate evaluator", "[evaluators]") {
    SignalEvaluator evaluator;

    SECTION("Extreme positive funding votes DOWN") {
        auto snap = ok_snapshot(source_names::kFunding, funding(0.0002));
        auto r = evaluator.evaluate_funding(&snap);
        REQUIRE(r.has_value());
        REQUIRE(r->direction == SignalDirection::Down);
        REQUIRE(r->strength == Approx(2.0 / 3.0));
        REQUIRE(r->weight == 1.5);
    }

    SECTION("Strength saturates at 1") {
        auto snap = ok_snapshot(source_names::kFunding, funding(0.0008));
        auto r = evaluator.evaluate_funding(&snap);
        REQUIRE(r->direction == SignalDirection::Down);
        REQUIRE(r->strength == 1.0);
    }

    SECTION("Extreme negative funding votes UP") {
        auto snap = ok_snapshot(source_names::kFunding, funding(-0.00015));
        auto r = evaluator.evaluate_funding(&snap);
        REQUIRE(r->direction == SignalDirection::Up);
        REQUIRE(r->strength == Approx(0.5));
    }

    SECTION("Normal funding is NEUTRAL with strength 0") {
        auto snap = ok_snapshot(source_names::kFunding, funding(0.00005));
        auto r = evaluator.evaluate_funding(&snap);
        REQUIRE(r.has_value());
        REQUIRE(r->direction == SignalDirection::Neutral);
        REQUIRE(r->strength == 0.0);
        REQUIRE(r->weight == 1.5);
    }
}

TEST_CASE("Liquidation evaluator", "[evaluators]") {
    SECTION("Dominant long liquidations vote DOWN by default") {
        SignalEvaluator evaluator;
        auto snap = ok_snapshot(source_names::kLiquidations, liquidations(300000, 100000));
        auto r = evaluator.evaluate_liquidations(&snap);
        REQUIRE(r->direction == SignalDirection::Down);
        REQUIRE(r->strength == Approx(2.0 / 3.0));
    }

    SECTION("Dominant short liquidations vote UP") {
        SignalEvaluator evaluator;
        auto snap = ok_snapshot(source_names::kLiquidations, liquidations(100000, 200000));
        auto r = evaluator.evaluate_liquidations(&snap);
        REQUIRE(r->direction == SignalDirection::Up);
        REQUIRE(r->strength == Approx(1.0 / 3.0));
    }

    SECTION("Contrarian reading flips the direction") {
        EvaluatorConfig config;
        config.liq_contrarian = true;
        SignalEvaluator evaluator(config);
        auto snap = ok_snapshot(source_names::kLiquidations, liquidations(300000, 100000));
        auto r = evaluator.evaluate_liquidations(&snap);
        REQUIRE(r->direction == SignalDirection::Up);
    }

    SECTION("One-sided liquidations are fully dominant") {
        SignalEvaluator evaluator;
        auto snap = ok_snapshot(source_names::kLiquidations, liquidations(50000, 0));
        auto r = evaluator.evaluate_liquidations(&snap);
        REQUIRE(r->direction == SignalDirection::Down);
        REQUIRE(r->strength == 1.0);
    }

    SECTION("No liquidations is NEUTRAL") {
        SignalEvaluator evaluator;
        auto snap = ok_snapshot(source_names::kLiquidations, liquidations(0, 0));
        auto r = evaluator.evaluate_liquidations(&snap);
        REQUIRE(r->direction == SignalDirection::Neutral);
        REQUIRE(r->strength == 0.0);
    }

    SECTION("Balanced liquidations are NEUTRAL") {
        SignalEvaluator evaluator;
        auto snap = ok_snapshot(source_names::kLiquidations, liquidations(120000, 100000));
        auto r = evaluator.evaluate_liquidations(&snap);
        REQUIRE(r->direction == SignalDirection::Neutral);
    }
}

TEST_CASE("Order book evaluator", "[evaluators]") {
    SignalEvaluator evaluator;

    SECTION("Bid wall votes UP") {
        auto snap = ok_snapshot(source_names::kOrderBook, walls(20.0, 10.0));
        auto r = evaluator.evaluate_order_book(&snap);
        REQUIRE(r->direction == SignalDirection::Up);
        REQUIRE(r->strength == Approx(0.5));
        REQUIRE(r->weight == 1.0);
    }

    SECTION("Ask wall votes DOWN") {
        auto snap = ok_snapshot(source_names::kOrderBook, walls(6.0, 10.0));
        auto r = evaluator.evaluate_order_book(&snap);
        REQUIRE(r->direction == SignalDirection::Down);
        REQUIRE(r->strength == Approx(0.8));
    }

    SECTION("Empty ask side with bids is a full UP") {
        auto snap = ok_snapshot(source_names::kOrderBook, walls(5.0, 0.0));
        auto r = evaluator.evaluate_order_book(&snap);
        REQUIRE(r->direction == SignalDirection::Up);
        REQUIRE(r->strength == 1.0);
    }

    SECTION("Balanced walls are NEUTRAL") {
        auto snap = ok_snapshot(source_names::kOrderBook, walls(10.0, 9.0));
        auto r = evaluator.evaluate_order_book(&snap);
        REQUIRE(r->direction == SignalDirection::Neutral);
    }
}

TEST_CASE("Long/short ratio evaluator", "[evaluators]") {
    SignalEvaluator evaluator;

    auto crowded_longs = ok_snapshot(source_names::kLongShortRatio, long_short(3.0));
    auto r = evaluator.evaluate_long_short(&crowded_longs);
    REQUIRE(r->direction == SignalDirection::Down);
    REQUIRE(r->strength == Approx(0.5));
    REQUIRE(r->weight == 0.5);

    auto crowded_shorts = ok_snapshot(source_names::kLongShortRatio, long_short(0.6));
    r = evaluator.evaluate_long_short(&crowded_shorts);
    REQUIRE(r->direction == SignalDirection::Up);
    REQUIRE(r->strength == Approx(0.8));

    auto normal = ok_snapshot(source_names::kLongShortRatio, long_short(1.4));
    r = evaluator.evaluate_long_short(&normal);
    REQUIRE(r->direction == SignalDirection::Neutral);
}

TEST_CASE("News evaluator", "[evaluators]") {
    SignalEvaluator evaluator;

    auto bullish = ok_snapshot(source_names::kNews, news(0.35));
    auto r = evaluator.evaluate_news(&bullish);
    REQUIRE(r->direction == SignalDirection::Up);
    REQUIRE(r->strength == Approx(0.35));

    auto bearish = ok_snapshot(source_names::kNews, news(-0.2));
    r = evaluator.evaluate_news(&bearish);
    REQUIRE(r->direction == SignalDirection::Down);
    REQUIRE(r->strength == Approx(0.2));

    auto flat = ok_snapshot(source_names::kNews, news(0.05));
    r = evaluator.evaluate_news(&flat);
    REQUIRE(r->direction == SignalDirection::Neutral);
}

TEST_CASE("evaluate_all runs in canonical order and skips failures", "[evaluators]") {
    SignalEvaluator evaluator;
    SnapshotMap snapshots;
    snapshots.emplace(source_names::kNews, ok_snapshot(source_names::kNews, news(0.0)));
    snapshots.emplace(source_names::kFunding, ok_snapshot(source_names::kFunding, funding(0.0002)));
    snapshots.emplace(source_names::kOrderBook, failed_snapshot(source_names::kOrderBook));
    snapshots.emplace(source_names::kLiquidations,
                      ok_snapshot(source_names::kLiquidations, liquidations(1, 1)));

    auto results = evaluator.evaluate_all(snapshots);

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].source == source_names::kFunding);
    REQUIRE(results[1].source == source_names::kLiquidations);
    REQUIRE(results[2].source == source_names::kNews);
}

TEST_CASE("Evaluator config validation", "[evaluators]") {
    EvaluatorConfig config;
    REQUIRE_NOTHROW(config.validate());

    config.weights.news = 0.0;
    REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);

    config = EvaluatorConfig{};
    config.wall_ask_strong = 1.2;
    REQUIRE_THROWS_AS(SignalEvaluator(config), std::invalid_argument);
}
