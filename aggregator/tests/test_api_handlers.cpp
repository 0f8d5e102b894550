#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/api_handlers.hpp"
#include "../src/util.hpp"

using Catch::Approx;

namespace {

std::shared_ptr<const CacheState> sample_state(int64_t updated_ms) {
    auto state = std::make_shared<CacheState>();
    state->cycle_id = 7;
    state->last_updated_ms = updated_ms;
    state->btc_price = 64000.0;

    SubSignalResult funding;
    funding.source = source_names::kFunding;
    funding.direction = SignalDirection::Up;
    funding.strength = 1.0;
    funding.weight = 1.5;
    funding.explanation = "Funding -0.0300% - shorts crowded, risk of squeeze up";

    SubSignalResult news;
    news.source = source_names::kNews;
    news.direction = SignalDirection::Down;
    news.strength = 0.2;
    news.weight = 0.5;

    state->verdict.direction = VerdictDirection::Up;
    state->verdict.confidence = 0.7;
    state->verdict.contributing_signals = {funding, news};
    state->verdict.up_count = 1;
    state->verdict.down_count = 1;
    state->verdict.timestamp_ms = updated_ms;

    state->odds.has_value = true;
    state->odds.share_price = 0.5;
    state->odds.potential_payout = 2.0;

    LiquidationData liqs;
    for (int i = 0; i < 20; ++i) {
        LiquidationEvent ev;
        ev.side = "long";
        ev.time_ms = 1000 - i;
        liqs.recent_events.push_back(ev);
    }
    state->snapshots.emplace(source_names::kLiquidations,
                             SourceSnapshot::ok(source_names::kLiquidations, liqs, updated_ms));

    FundingData f;
    f.current_rate = -0.0003;
    state->snapshots.emplace(source_names::kFunding,
                             SourceSnapshot::ok(source_names::kFunding, f, updated_ms));

    state->snapshots.emplace(source_names::kOpenInterest,
        SourceSnapshot::failed(source_names::kOpenInterest,
                               FetchError{FetchErrorKind::Timeout, "no response"}, updated_ms));

    NewsSummary summary;
    summary.overall_sentiment = "neutral";
    summary.headlines.resize(14);
    state->snapshots.emplace(source_names::kNews,
                             SourceSnapshot::ok(source_names::kNews, summary, updated_ms));

    PredictionMarket market;
    market.question = "Bitcoin Up or Down?";
    market.outcomes.push_back(MarketOutcome{"Up", "u1", 0.5});
    state->snapshots.emplace(source_names::kPolymarket,
                             SourceSnapshot::ok(source_names::kPolymarket, market, updated_ms));
    return state;
}

} // namespace

TEST_CASE("Handlers before the first refresh", "[api]") {
    ReadCache cache(std::make_shared<HistoryLog>());
    HealthMonitor monitor;

    for (const auto& response : {api::dashboard_data(cache, 0), api::signal(cache),
                                 api::derivatives(cache), api::news(cache),
                                 api::polymarket(cache), api::bet_suggestion(cache)}) {
        REQUIRE(response.status == 503);
        REQUIRE(response.body["error"] == "Data not yet available. Please wait for first refresh.");
    }

    auto history = api::signal_history(cache, "");
    REQUIRE(history.status == 200);
    REQUIRE(history.body["count"] == 0);

    auto health = api::health(cache, monitor, 0);
    REQUIRE(health.status == 503);
    REQUIRE(health.body["populated"] == false);
    REQUIRE(health.body["cache_age_seconds"].is_null());
}

TEST_CASE("Handlers over a published state", "[api]") {
    const int64_t updated = 1700000000000;
    auto history = std::make_shared<HistoryLog>();
    ReadCache cache(history);
    cache.publish(sample_state(updated));

    SECTION("Dashboard data carries the cache age") {
        auto r = api::dashboard_data(cache, updated + 12340);
        REQUIRE(r.status == 200);
        REQUIRE(r.body["cache_age_seconds"].get<double>() == Approx(12.3));
        REQUIRE(r.body["data"]["cycle_id"] == 7);
        REQUIRE(r.body["data"]["final_signal"]["direction"] == "UP");
        REQUIRE(r.body["data"]["sources"]["open_interest"] == "down");
        REQUIRE(r.body["data"]["wall_strength"].is_null());
    }

    SECTION("Signal view") {
        auto r = api::signal(cache);
        REQUIRE(r.status == 200);
        REQUIRE(r.body["btc_price"] == 64000.0);
        REQUIRE(r.body["signals"]["funding"]["signal"] == "UP");
        REQUIRE(r.body["signals"]["news"]["signal"] == "DOWN");
        REQUIRE(r.body["odds_value"]["potential_payout"] == 2.0);
    }

    SECTION("Derivatives trims events and nulls failed sources") {
        auto r = api::derivatives(cache);
        REQUIRE(r.status == 200);
        REQUIRE(r.body["liquidations"]["recent_events"].size() == api::kMaxLiquidationEvents);
        REQUIRE(r.body["funding"]["current_rate"] == -0.0003);
        REQUIRE(r.body["open_interest"].is_null());
        REQUIRE(r.body["long_short_ratio"].is_null());
    }

    SECTION("News trims headlines") {
        auto r = api::news(cache);
        REQUIRE(r.body["headlines"].size() == api::kMaxHeadlines);
    }

    SECTION("Polymarket outcomes are keyed by label") {
        auto r = api::polymarket(cache);
        REQUIRE(r.body["outcomes"]["Up"]["price"] == 0.5);
    }

    SECTION("Bet suggestion") {
        auto r = api::bet_suggestion(cache);
        REQUIRE(r.body["up_attributes_count"] == 1);
        REQUIRE(r.body["down_attributes_count"] == 1);
        REQUIRE(r.body["polymarket_line"]["question"] == "Bitcoin Up or Down?");
        REQUIRE(r.body["timestamp"] == util::to_iso8601(updated));
    }

    SECTION("Health") {
        HealthMonitor monitor;
        monitor.record_source(source_names::kFunding, true);
        monitor.record_source(source_names::kOpenInterest, false, "timeout");
        auto r = api::health(cache, monitor, updated + 1000);
        REQUIRE(r.status == 200);
        REQUIRE(r.body["status"] == "ok");
        REQUIRE(r.body["sources"]["open_interest"] == "down");
        REQUIRE(r.body["last_errors"]["open_interest"] == "timeout");
        REQUIRE(r.body["cache_age_seconds"] == 1.0);
    }

    SECTION("Health drops the last error once a source recovers") {
        HealthMonitor monitor;
        monitor.record_source(source_names::kOpenInterest, false, "timeout");
        monitor.record_source(source_names::kOpenInterest, true);
        auto r = api::health(cache, monitor, updated + 1000);
        REQUIRE(r.body["sources"]["open_interest"] == "up");
        REQUIRE_FALSE(r.body["last_errors"].contains("open_interest"));
    }
}

TEST_CASE("Signal history limit", "[api]") {
    auto history = std::make_shared<HistoryLog>();
    ReadCache cache(history);
    for (int i = 1; i <= 5; ++i) {
        HistoryEntry e;
        e.verdict.timestamp_ms = i * 1000;
        e.signal_directions[source_names::kFunding] = SignalDirection::Up;
        history->append(e);
    }

    auto all = api::signal_history(cache, "");
    REQUIRE(all.body["count"] == 5);

    auto last2 = api::signal_history(cache, "2");
    REQUIRE(last2.status == 200);
    REQUIRE(last2.body["count"] == 2);
    REQUIRE(last2.body["history"][0]["timestamp"] == util::to_iso8601(4000));
    REQUIRE(last2.body["history"][1]["signals"]["funding"] == "UP");

    REQUIRE(api::signal_history(cache, "0").status == 400);
    REQUIRE(api::signal_history(cache, "-3").status == 400);
    REQUIRE(api::signal_history(cache, "ten").status == 400);
    REQUIRE(api::signal_history(cache, "5x").status == 400);
    REQUIRE(api::signal_history(cache, " 5").status == 400);
    REQUIRE(api::signal_history(cache, "+5").status == 400);
}
