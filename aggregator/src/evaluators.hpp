#pragma once

#include "types.hpp"
#include <optional>
#include <vector>

// Fixed per-signal weights in the weighted vote
struct SignalWeights {
    double funding = 1.5;
    double liquidations = 1.5;
    double order_book = 1.0;
    double long_short = 0.5;
    double news = 0.5;
};

struct EvaluatorConfig {
    SignalWeights weights;

    // Funding rate per 8h settlement
    double funding_high = 0.0001;
    double funding_low = -0.0001;
    double funding_full_scale = 3.0;   // strength 1 at threshold * full_scale

    // One side liquidated this many times the other
    double liq_dominance_ratio = 1.5;
    bool liq_contrarian = false;

    // Bid/ask wall volume ratio
    double wall_bid_strong = 1.3;
    double wall_ask_strong = 0.77;

    // Long/short account ratio
    double ls_high = 2.5;
    double ls_low = 0.7;

    // Aggregated headline score
    double news_bullish = 0.1;
    double news_bearish = -0.1;

    // Throws std::invalid_argument on an out-of-range field
    void validate() const;
};

// Maps one source snapshot to one directional vote. A failed or missing
// snapshot yields std::nullopt so that it carries no weight.
class SignalEvaluator {
public:
    explicit SignalEvaluator(const EvaluatorConfig& config = EvaluatorConfig());

    std::optional<SubSignalResult> evaluate_funding(const SourceSnapshot* snapshot) const;
    std::optional<SubSignalResult> evaluate_liquidations(const SourceSnapshot* snapshot) const;
    std::optional<SubSignalResult> evaluate_order_book(const SourceSnapshot* snapshot) const;
    std::optional<SubSignalResult> evaluate_long_short(const SourceSnapshot* snapshot) const;
    std::optional<SubSignalResult> evaluate_news(const SourceSnapshot* snapshot) const;

    // Runs all five evaluators, in canonical source order
    std::vector<SubSignalResult> evaluate_all(const SnapshotMap& snapshots) const;

    const EvaluatorConfig& config() const { return config_; }

private:
    EvaluatorConfig config_;

    SubSignalResult make_result(const std::string& source, SignalDirection direction,
                                double strength, double weight, std::string explanation) const;
};
