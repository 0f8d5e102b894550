#include "api_handlers.hpp"
#include "serialize.hpp"
#include "util.hpp"
#include <cctype>
#include <limits>

namespace api {

namespace {

ApiResponse unpopulated(const CacheUnpopulatedError& e) {
    return {503, {{"error", e.what()}}};
}

template <typename T>
const T* find_payload(const CacheState& state, const std::string& source) {
    auto it = state.snapshots.find(source);
    return it == state.snapshots.end() ? nullptr : it->second.get<T>();
}

template <typename T>
nlohmann::json payload_or_null(const CacheState& state, const std::string& source) {
    const T* p = find_payload<T>(state, source);
    return p ? nlohmann::json(*p) : nlohmann::json(nullptr);
}

double cache_age_seconds(const CacheState& state, int64_t now_ms) {
    return util::round_to((now_ms - state.last_updated_ms) / 1000.0, 1);
}

nlohmann::json derivatives_json(const CacheState& state) {
    nlohmann::json liquidations = nullptr;
    if (const auto* liqs = find_payload<LiquidationData>(state, source_names::kLiquidations)) {
        LiquidationData trimmed = *liqs;
        if (trimmed.recent_events.size() > kMaxLiquidationEvents) {
            trimmed.recent_events.resize(kMaxLiquidationEvents);
        }
        liquidations = trimmed;
    }

    return {
        {"funding", payload_or_null<FundingData>(state, source_names::kFunding)},
        {"open_interest", payload_or_null<OpenInterestData>(state, source_names::kOpenInterest)},
        {"long_short_ratio", payload_or_null<LongShortData>(state, source_names::kLongShortRatio)},
        {"liquidations", liquidations}
    };
}

nlohmann::json news_json(const CacheState& state) {
    const auto* summary = find_payload<NewsSummary>(state, source_names::kNews);
    if (!summary) {
        return nlohmann::json::object();
    }
    NewsSummary trimmed = *summary;
    if (trimmed.headlines.size() > kMaxHeadlines) {
        trimmed.headlines.resize(kMaxHeadlines);
    }
    return trimmed;
}

nlohmann::json polymarket_json(const CacheState& state) {
    const auto* market = find_payload<PredictionMarket>(state, source_names::kPolymarket);
    return market ? nlohmann::json(*market) : nlohmann::json::object();
}

nlohmann::json btc_price_json(const CacheState& state) {
    return state.btc_price ? nlohmann::json(*state.btc_price) : nlohmann::json(nullptr);
}

} // namespace

ApiResponse dashboard_data(const ReadCache& cache, int64_t now_ms) {
    try {
        auto state = cache.require();

        nlohmann::json data = {
            {"cycle_id", state->cycle_id},
            {"timestamp", util::to_iso8601(state->last_updated_ms)},
            {"btc_price", btc_price_json(*state)},
            {"wall_strength", payload_or_null<OrderBookWalls>(*state, source_names::kOrderBook)},
            {"signals", serialize::signals_by_source(state->verdict)},
            {"final_signal", state->verdict},
            {"odds_value", state->odds},
            {"derivatives", derivatives_json(*state)},
            {"polymarket", polymarket_json(*state)},
            {"news", news_json(*state)},
            {"sources", serialize::source_status(state->snapshots)}
        };

        return {200, {{"data", data}, {"cache_age_seconds", cache_age_seconds(*state, now_ms)}}};
    } catch (const CacheUnpopulatedError& e) {
        return unpopulated(e);
    }
}

ApiResponse signal(const ReadCache& cache) {
    try {
        auto state = cache.require();
        return {200, {
            {"btc_price", btc_price_json(*state)},
            {"final_signal", state->verdict},
            {"odds_value", state->odds},
            {"signals", serialize::signals_by_source(state->verdict)}
        }};
    } catch (const CacheUnpopulatedError& e) {
        return unpopulated(e);
    }
}

ApiResponse derivatives(const ReadCache& cache) {
    try {
        return {200, derivatives_json(*cache.require())};
    } catch (const CacheUnpopulatedError& e) {
        return unpopulated(e);
    }
}

ApiResponse news(const ReadCache& cache) {
    try {
        return {200, news_json(*cache.require())};
    } catch (const CacheUnpopulatedError& e) {
        return unpopulated(e);
    }
}

ApiResponse polymarket(const ReadCache& cache) {
    try {
        return {200, polymarket_json(*cache.require())};
    } catch (const CacheUnpopulatedError& e) {
        return unpopulated(e);
    }
}

ApiResponse bet_suggestion(const ReadCache& cache) {
    try {
        auto state = cache.require();
        const auto* market = find_payload<PredictionMarket>(*state, source_names::kPolymarket);

        return {200, {
            {"final_signal", state->verdict},
            {"up_attributes_count", state->verdict.up_count},
            {"down_attributes_count", state->verdict.down_count},
            {"odds_value", state->odds},
            {"polymarket_line", market ? nlohmann::json(*market) : nlohmann::json(nullptr)},
            {"timestamp", util::to_iso8601(state->verdict.timestamp_ms)}
        }};
    } catch (const CacheUnpopulatedError& e) {
        return unpopulated(e);
    }
}

ApiResponse signal_history(const ReadCache& cache, const std::string& limit_param) {
    std::size_t limit = std::numeric_limits<std::size_t>::max();

    if (!limit_param.empty()) {
        // stoll alone would accept leading whitespace and a '+' sign
        if (!std::isdigit(static_cast<unsigned char>(limit_param[0]))) {
            return {400, {{"error", "limit must be a positive integer"}}};
        }
        std::size_t used = 0;
        long long parsed = 0;
        try {
            parsed = std::stoll(limit_param, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used != limit_param.size() || parsed <= 0) {
            return {400, {{"error", "limit must be a positive integer"}}};
        }
        limit = static_cast<std::size_t>(parsed);
    }

    auto entries = cache.get_history(limit);
    return {200, {{"history", entries}, {"count", entries.size()}}};
}

ApiResponse health(const ReadCache& cache, const HealthMonitor& monitor, int64_t now_ms) {
    auto state = cache.get();
    auto body = monitor.to_json();

    body["populated"] = state != nullptr;
    if (state) {
        body["status"] = "ok";
        body["last_updated"] = util::to_iso8601(state->last_updated_ms);
        body["cache_age_seconds"] = cache_age_seconds(*state, now_ms);
    } else {
        body["status"] = "warming_up";
        body["last_updated"] = nullptr;
        body["cache_age_seconds"] = nullptr;
    }

    return {state ? 200 : 503, body};
}

} // namespace api
