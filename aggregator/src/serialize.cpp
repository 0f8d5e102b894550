#include "serialize.hpp"
#include "util.hpp"

namespace {

nlohmann::json optional_number(const std::optional<double>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

double r3(double v) {
    return util::round_to(v, 3);
}

} // namespace

void to_json(nlohmann::json& j, const PriceTicker& v) {
    j = {{"last", v.last}};
}

void to_json(nlohmann::json& j, const OrderBookWalls& v) {
    j = {
        {"bid_wall_volume", v.bid_wall_volume},
        {"ask_wall_volume", v.ask_wall_volume},
        {"wall_ratio", v.has_ratio ? nlohmann::json(v.wall_ratio) : nlohmann::json(nullptr)},
        {"mid_price", v.mid_price}
    };
}

void to_json(nlohmann::json& j, const FundingPoint& v) {
    j = {{"rate", v.rate}, {"time", v.time_ms}};
}

void to_json(nlohmann::json& j, const FundingData& v) {
    j = {
        {"current_rate", v.current_rate},
        {"next_funding_time", v.next_funding_time_ms},
        {"recent_rates", v.recent}
    };
}

void to_json(nlohmann::json& j, const OpenInterestData& v) {
    j = {{"oi_contracts", v.oi_contracts}, {"oi_btc", v.oi_btc}, {"timestamp", v.timestamp_ms}};
}

void to_json(nlohmann::json& j, const RatioPoint& v) {
    j = {{"timestamp", v.timestamp_ms}, {"ratio", v.ratio}};
}

void to_json(nlohmann::json& j, const LongShortData& v) {
    j = {{"current_ratio", v.current_ratio}, {"history", v.history}};
}

void to_json(nlohmann::json& j, const LiquidationEvent& v) {
    j = {
        {"side", v.side},
        {"price", v.price},
        {"size_btc", v.size_btc},
        {"value_usd", v.value_usd},
        {"time", v.time_ms}
    };
}

void to_json(nlohmann::json& j, const LiquidationData& v) {
    j = {
        {"long_liquidation_usd", v.long_usd},
        {"short_liquidation_usd", v.short_usd},
        {"long_count", v.long_count},
        {"short_count", v.short_count},
        {"total_usd", v.total_usd},
        {"recent_events", v.recent_events}
    };
}

void to_json(nlohmann::json& j, const HeadlineSentiment& v) {
    j = {
        {"score", v.score},
        {"label", v.label},
        {"polarity", v.polarity},
        {"bullish_keywords", v.bullish_keywords},
        {"bearish_keywords", v.bearish_keywords}
    };
}

void to_json(nlohmann::json& j, const Headline& v) {
    j = {
        {"title", v.title},
        {"source", v.source},
        {"published_at", v.published_at},
        {"url", v.url},
        {"sentiment", v.sentiment}
    };
}

void to_json(nlohmann::json& j, const NewsSummary& v) {
    j = {
        {"overall_sentiment", v.overall_sentiment},
        {"avg_score", v.avg_score},
        {"bullish_count", v.bullish_count},
        {"bearish_count", v.bearish_count},
        {"neutral_count", v.neutral_count},
        {"headlines", v.headlines}
    };
}

void to_json(nlohmann::json& j, const MarketOutcome& v) {
    j = {{"token_id", v.token_id}, {"price", optional_number(v.price)}};
}

void to_json(nlohmann::json& j, const PredictionMarket& v) {
    // outcomes keyed by label ("Up", "Down")
    nlohmann::json outcomes = nlohmann::json::object();
    for (const auto& outcome : v.outcomes) {
        outcomes[outcome.label] = outcome;
    }
    j = {
        {"question", v.question},
        {"end_date", v.end_date},
        {"slug", v.slug},
        {"outcomes", outcomes}
    };
}

void to_json(nlohmann::json& j, const FetchError& v) {
    j = {{"kind", to_string(v.kind)}, {"message", v.message}};
}

void to_json(nlohmann::json& j, const SourceSnapshot& v) {
    j = {
        {"source", v.source()},
        {"ok", v.is_ok()},
        {"timestamp", util::to_iso8601(v.timestamp_ms())}
    };
    if (v.is_ok()) {
        j["data"] = serialize::payload(*v.payload());
    } else {
        j["error"] = v.error();
    }
}

void to_json(nlohmann::json& j, const SubSignalResult& v) {
    j = {
        {"source", v.source},
        {"signal", to_string(v.direction)},
        {"strength", r3(v.strength)},
        {"weight", v.weight},
        {"detail", v.explanation}
    };
}

void to_json(nlohmann::json& j, const Verdict& v) {
    j = {
        {"direction", to_string(v.direction)},
        {"confidence", r3(v.confidence)},
        {"weighted_score", r3(v.weighted_score)},
        {"normalized_score", r3(v.normalized_score)},
        {"total_available_weight", v.total_available_weight},
        {"up_signals", v.up_count},
        {"down_signals", v.down_count},
        {"neutral_signals", v.neutral_count},
        {"insufficient_data", v.insufficient_data},
        {"timestamp", util::to_iso8601(v.timestamp_ms)}
    };
}

void to_json(nlohmann::json& j, const OddsValue& v) {
    j = {
        {"has_value", v.has_value},
        {"share_price", optional_number(v.share_price)},
        {"potential_payout", optional_number(v.potential_payout)},
        {"detail", v.detail}
    };
}

void to_json(nlohmann::json& j, const HistoryEntry& v) {
    nlohmann::json signals = nlohmann::json::object();
    for (const auto& [source, direction] : v.signal_directions) {
        signals[source] = to_string(direction);
    }
    j = {
        {"timestamp", util::to_iso8601(v.verdict.timestamp_ms)},
        {"btc_price", optional_number(v.btc_price)},
        {"direction", to_string(v.verdict.direction)},
        {"confidence", r3(v.verdict.confidence)},
        {"weighted_score", r3(v.verdict.weighted_score)},
        {"normalized_score", r3(v.verdict.normalized_score)},
        {"signals", signals}
    };
}

namespace serialize {

nlohmann::json payload(const SnapshotPayload& payload) {
    return std::visit([](const auto& p) { return nlohmann::json(p); }, payload);
}

nlohmann::json signals_by_source(const Verdict& verdict) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& signal : verdict.contributing_signals) {
        out[signal.source] = signal;
    }
    return out;
}

nlohmann::json source_status(const SnapshotMap& snapshots) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, snapshot] : snapshots) {
        out[name] = snapshot.is_ok() ? "up" : "down";
    }
    return out;
}

} // namespace serialize
