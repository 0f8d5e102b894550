#include "decision_engine.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

// Summation order, so the score does not depend on the order signals arrive in
int source_rank(const std::string& source) {
    static const std::string kOrder[] = {
        source_names::kFunding,
        source_names::kLiquidations,
        source_names::kOrderBook,
        source_names::kLongShortRatio,
        source_names::kNews,
    };
    for (int i = 0; i < 5; ++i) {
        if (kOrder[i] == source) return i;
    }
    return 5;
}

} // namespace

void EngineThresholds::validate() const {
    if (!(up_threshold > 0.0 && up_threshold <= 1.0)) {
        throw std::invalid_argument("up_threshold must be in (0, 1]");
    }
    if (!(down_threshold > 0.0 && down_threshold <= 1.0)) {
        throw std::invalid_argument("down_threshold must be in (0, 1]");
    }
}

DecisionEngine::DecisionEngine(const EngineThresholds& thresholds)
    : thresholds_(thresholds) {
    thresholds_.validate();
}

int DecisionEngine::direction_sign(SignalDirection d) {
    switch (d) {
        case SignalDirection::Up: return 1;
        case SignalDirection::Down: return -1;
        case SignalDirection::Neutral: return 0;
    }
    return 0;
}

Verdict DecisionEngine::decide(std::vector<SubSignalResult> signals, int64_t timestamp_ms) const {
    std::stable_sort(signals.begin(), signals.end(),
                     [](const SubSignalResult& a, const SubSignalResult& b) {
                         int ra = source_rank(a.source);
                         int rb = source_rank(b.source);
                         if (ra != rb) return ra < rb;
                         return a.source < b.source;
                     });

    Verdict verdict;
    verdict.timestamp_ms = timestamp_ms;

    double weighted_score = 0.0;
    double total_weight = 0.0;

    for (const auto& s : signals) {
        weighted_score += s.weight * s.strength * direction_sign(s.direction);
        total_weight += s.weight;

        switch (s.direction) {
            case SignalDirection::Up: verdict.up_count++; break;
            case SignalDirection::Down: verdict.down_count++; break;
            case SignalDirection::Neutral: verdict.neutral_count++; break;
        }
    }

    verdict.weighted_score = weighted_score;
    verdict.total_available_weight = total_weight;
    verdict.contributing_signals = std::move(signals);

    if (!(total_weight > 0.0)) {
        verdict.direction = VerdictDirection::Skip;
        verdict.confidence = 0.0;
        verdict.normalized_score = 0.0;
        verdict.insufficient_data = true;
        return verdict;
    }

    const double normalized = weighted_score / total_weight;
    verdict.normalized_score = normalized;

    if (normalized >= thresholds_.up_threshold) {
        verdict.direction = VerdictDirection::Up;
    } else if (normalized <= -thresholds_.down_threshold) {
        verdict.direction = VerdictDirection::Down;
    } else {
        verdict.direction = VerdictDirection::Skip;
    }

    if (verdict.direction != VerdictDirection::Skip) {
        verdict.confidence = std::min(1.0, std::abs(normalized));
        return verdict;
    }

    // |normalized| is below the threshold on its side. Rescaling onto the lower
    // threshold keeps a SKIP under every directional confidence.
    const double side = normalized >= 0.0 ? thresholds_.up_threshold : thresholds_.down_threshold;
    const double lowest = std::min(thresholds_.up_threshold, thresholds_.down_threshold);
    verdict.confidence = std::abs(normalized) * lowest / side;
    return verdict;
}
