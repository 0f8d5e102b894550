#include "evaluators.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <cmath>
#include <stdexcept>

namespace {

const SourceSnapshot* find_snapshot(const SnapshotMap& snapshots, const std::string& name) {
    auto it = snapshots.find(name);
    return it == snapshots.end() ? nullptr : &it->second;
}

void require_positive(double value, const char* name) {
    if (!(value > 0.0)) {
        throw std::invalid_argument(fmt::format("{} must be > 0 (got {})", name, value));
    }
}

} // namespace

void EvaluatorConfig::validate() const {
    require_positive(weights.funding, "weight.funding");
    require_positive(weights.liquidations, "weight.liquidations");
    require_positive(weights.order_book, "weight.order_book");
    require_positive(weights.long_short, "weight.long_short");
    require_positive(weights.news, "weight.news");

    require_positive(funding_high, "funding_high");
    if (!(funding_low < 0.0)) {
        throw std::invalid_argument("funding_low must be < 0");
    }
    if (!(funding_full_scale >= 1.0)) {
        throw std::invalid_argument("funding_full_scale must be >= 1");
    }
    if (!(liq_dominance_ratio > 1.0)) {
        throw std::invalid_argument("liq_dominance_ratio must be > 1");
    }
    if (!(wall_bid_strong > 1.0) || !(wall_ask_strong > 0.0 && wall_ask_strong < 1.0)) {
        throw std::invalid_argument("wall thresholds must satisfy 0 < ask < 1 < bid");
    }
    if (!(ls_high > 2.0) || !(ls_low > 0.0 && ls_low < 1.0)) {
        throw std::invalid_argument("long/short thresholds must satisfy 0 < low < 1 and high > 2");
    }
    if (!(news_bullish > 0.0) || !(news_bearish < 0.0)) {
        throw std::invalid_argument("news thresholds must straddle 0");
    }
}

SignalEvaluator::SignalEvaluator(const EvaluatorConfig& config)
    : config_(config) {
    config_.validate();
}

SubSignalResult SignalEvaluator::make_result(const std::string& source, SignalDirection direction,
                                             double strength, double weight,
                                             std::string explanation) const {
    SubSignalResult result;
    result.source = source;
    result.strength = util::clamp(strength, 0.0, 1.0);
    result.direction = result.strength > 0.0 ? direction : SignalDirection::Neutral;
    if (result.direction == SignalDirection::Neutral) {
        result.strength = 0.0;
    }
    result.weight = weight;
    result.explanation = std::move(explanation);
    return result;
}

std::optional<SubSignalResult> SignalEvaluator::evaluate_funding(const SourceSnapshot* snapshot) const {
    const FundingData* data = snapshot ? snapshot->get<FundingData>() : nullptr;
    if (!data) return std::nullopt;

    const double rate = data->current_rate;
    const double w = config_.weights.funding;

    if (rate >= config_.funding_high) {
        double strength = std::min(1.0, rate / (config_.funding_high * config_.funding_full_scale));
        return make_result(source_names::kFunding, SignalDirection::Down, strength, w,
            fmt::format("Funding {:.4f}% - longs crowded, risk of pullback", rate * 100.0));
    }
    if (rate <= config_.funding_low) {
        double strength = std::min(1.0, std::abs(rate) /
                                        (std::abs(config_.funding_low) * config_.funding_full_scale));
        return make_result(source_names::kFunding, SignalDirection::Up, strength, w,
            fmt::format("Funding {:.4f}% - shorts crowded, risk of squeeze up", rate * 100.0));
    }
    return make_result(source_names::kFunding, SignalDirection::Neutral, 0.0, w,
        fmt::format("Funding {:.4f}% - within normal range", rate * 100.0));
}

std::optional<SubSignalResult> SignalEvaluator::evaluate_liquidations(const SourceSnapshot* snapshot) const {
    const LiquidationData* data = snapshot ? snapshot->get<LiquidationData>() : nullptr;
    if (!data) return std::nullopt;

    const double w = config_.weights.liquidations;
    const double long_usd = data->long_usd;
    const double short_usd = data->short_usd;

    if (data->total_usd <= 0.0) {
        return make_result(source_names::kLiquidations, SignalDirection::Neutral, 0.0, w,
                           "No recent liquidations");
    }

    // A side with zero volume against a non-zero other side is maximally dominant
    auto dominance = [](double side, double other) {
        if (other <= 0.0) return side > 0.0 ? HUGE_VAL : 0.0;
        return side / other;
    };

    const double long_ratio = dominance(long_usd, short_usd);
    const double short_ratio = dominance(short_usd, long_usd);

    if (long_ratio >= config_.liq_dominance_ratio) {
        double strength = std::min(1.0, (long_ratio - 1.0) / 3.0);
        if (config_.liq_contrarian) {
            return make_result(source_names::kLiquidations, SignalDirection::Up, strength, w,
                fmt::format("Long liqs ${:.0f} vs short ${:.0f} - longs flushed, bounce likely",
                            long_usd, short_usd));
        }
        return make_result(source_names::kLiquidations, SignalDirection::Down, strength, w,
            fmt::format("Long liqs ${:.0f} vs short ${:.0f} - long liquidations dominant, downside continuation",
                        long_usd, short_usd));
    }
    if (short_ratio >= config_.liq_dominance_ratio) {
        double strength = std::min(1.0, (short_ratio - 1.0) / 3.0);
        if (config_.liq_contrarian) {
            return make_result(source_names::kLiquidations, SignalDirection::Down, strength, w,
                fmt::format("Short liqs ${:.0f} vs long ${:.0f} - shorts squeezed, pullback likely",
                            short_usd, long_usd));
        }
        return make_result(source_names::kLiquidations, SignalDirection::Up, strength, w,
            fmt::format("Short liqs ${:.0f} vs long ${:.0f} - short squeeze in progress",
                        short_usd, long_usd));
    }
    return make_result(source_names::kLiquidations, SignalDirection::Neutral, 0.0, w,
        fmt::format("Liquidations balanced - long ${:.0f} vs short ${:.0f}", long_usd, short_usd));
}

std::optional<SubSignalResult> SignalEvaluator::evaluate_order_book(const SourceSnapshot* snapshot) const {
    const OrderBookWalls* walls = snapshot ? snapshot->get<OrderBookWalls>() : nullptr;
    if (!walls) return std::nullopt;

    const double w = config_.weights.order_book;

    if (!walls->has_ratio) {
        if (walls->bid_wall_volume > 0.0) {
            return make_result(source_names::kOrderBook, SignalDirection::Up, 1.0, w,
                fmt::format("No asks in band, bids {:.2f} - support below", walls->bid_wall_volume));
        }
        return make_result(source_names::kOrderBook, SignalDirection::Neutral, 0.0, w,
                           "Order book band empty");
    }

    const double ratio = walls->wall_ratio;
    if (ratio >= config_.wall_bid_strong) {
        double strength = std::min(1.0, (ratio - 1.0) / 2.0);
        return make_result(source_names::kOrderBook, SignalDirection::Up, strength, w,
            fmt::format("Bid wall dominant - bids {:.2f} vs asks {:.2f} (ratio {:.2f}) - support below",
                        walls->bid_wall_volume, walls->ask_wall_volume, ratio));
    }
    if (ratio <= config_.wall_ask_strong) {
        double strength = std::min(1.0, (1.0 - ratio) / 0.5);
        return make_result(source_names::kOrderBook, SignalDirection::Down, strength, w,
            fmt::format("Ask wall dominant - bids {:.2f} vs asks {:.2f} (ratio {:.2f}) - resistance above",
                        walls->bid_wall_volume, walls->ask_wall_volume, ratio));
    }
    return make_result(source_names::kOrderBook, SignalDirection::Neutral, 0.0, w,
                       fmt::format("Walls balanced - ratio {:.2f}", ratio));
}

std::optional<SubSignalResult> SignalEvaluator::evaluate_long_short(const SourceSnapshot* snapshot) const {
    const LongShortData* data = snapshot ? snapshot->get<LongShortData>() : nullptr;
    if (!data) return std::nullopt;

    const double ratio = data->current_ratio;
    const double w = config_.weights.long_short;

    if (ratio >= config_.ls_high) {
        double strength = std::min(1.0, (ratio - 2.0) / 2.0);
        return make_result(source_names::kLongShortRatio, SignalDirection::Down, strength, w,
            fmt::format("L/S ratio {:.2f} - longs very crowded (contrarian bearish)", ratio));
    }
    if (ratio <= config_.ls_low) {
        double strength = std::min(1.0, (1.0 - ratio) / 0.5);
        return make_result(source_names::kLongShortRatio, SignalDirection::Up, strength, w,
            fmt::format("L/S ratio {:.2f} - shorts very crowded (contrarian bullish)", ratio));
    }
    return make_result(source_names::kLongShortRatio, SignalDirection::Neutral, 0.0, w,
                       fmt::format("L/S ratio {:.2f} - within normal range", ratio));
}

std::optional<SubSignalResult> SignalEvaluator::evaluate_news(const SourceSnapshot* snapshot) const {
    const NewsSummary* news = snapshot ? snapshot->get<NewsSummary>() : nullptr;
    if (!news) return std::nullopt;

    const double score = news->avg_score;
    const double w = config_.weights.news;

    if (score > config_.news_bullish) {
        return make_result(source_names::kNews, SignalDirection::Up, std::min(1.0, score), w,
            fmt::format("News sentiment bullish (score: {:.3f}) - {} bullish, {} bearish headlines",
                        score, news->bullish_count, news->bearish_count));
    }
    if (score < config_.news_bearish) {
        return make_result(source_names::kNews, SignalDirection::Down, std::min(1.0, -score), w,
            fmt::format("News sentiment bearish (score: {:.3f}) - {} bullish, {} bearish headlines",
                        score, news->bullish_count, news->bearish_count));
    }
    return make_result(source_names::kNews, SignalDirection::Neutral, 0.0, w,
                       fmt::format("News sentiment neutral (score: {:.3f})", score));
}

std::vector<SubSignalResult> SignalEvaluator::evaluate_all(const SnapshotMap& snapshots) const {
    std::vector<SubSignalResult> results;
    auto push = [&results](std::optional<SubSignalResult> r) {
        if (r) results.push_back(std::move(*r));
    };

    push(evaluate_funding(find_snapshot(snapshots, source_names::kFunding)));
    push(evaluate_liquidations(find_snapshot(snapshots, source_names::kLiquidations)));
    push(evaluate_order_book(find_snapshot(snapshots, source_names::kOrderBook)));
    push(evaluate_long_short(find_snapshot(snapshots, source_names::kLongShortRatio)));
    push(evaluate_news(find_snapshot(snapshots, source_names::kNews)));

    return results;
}
