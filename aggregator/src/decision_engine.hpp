#pragma once

#include "types.hpp"
#include <vector>

struct EngineThresholds {
    double up_threshold = 0.3;     // normalized score >= +up   -> UP
    double down_threshold = 0.3;   // normalized score <= -down -> DOWN

    // Throws std::invalid_argument unless both lie in (0, 1]
    void validate() const;
};

// Weighted-voting engine. Stateless apart from its thresholds, so two engines
// with different thresholds can be run over the same signals and compared.
class DecisionEngine {
public:
    explicit DecisionEngine(const EngineThresholds& thresholds = EngineThresholds());

    // signals: one entry per source that produced a result this cycle.
    // Failed sources are absent, not NEUTRAL.
    Verdict decide(std::vector<SubSignalResult> signals, int64_t timestamp_ms) const;

    const EngineThresholds& thresholds() const { return thresholds_; }

    static int direction_sign(SignalDirection d);

private:
    EngineThresholds thresholds_;
};
