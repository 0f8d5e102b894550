#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>

// JSON views of the domain types, found by nlohmann::json through ADL.
// Scores are rounded to 3 places; the in-memory values are not.

void to_json(nlohmann::json& j, const PriceTicker& v);
void to_json(nlohmann::json& j, const OrderBookWalls& v);
void to_json(nlohmann::json& j, const FundingPoint& v);
void to_json(nlohmann::json& j, const FundingData& v);
void to_json(nlohmann::json& j, const OpenInterestData& v);
void to_json(nlohmann::json& j, const RatioPoint& v);
void to_json(nlohmann::json& j, const LongShortData& v);
void to_json(nlohmann::json& j, const LiquidationEvent& v);
void to_json(nlohmann::json& j, const LiquidationData& v);
void to_json(nlohmann::json& j, const HeadlineSentiment& v);
void to_json(nlohmann::json& j, const Headline& v);
void to_json(nlohmann::json& j, const NewsSummary& v);
void to_json(nlohmann::json& j, const MarketOutcome& v);
void to_json(nlohmann::json& j, const PredictionMarket& v);

void to_json(nlohmann::json& j, const FetchError& v);
void to_json(nlohmann::json& j, const SourceSnapshot& v);
void to_json(nlohmann::json& j, const SubSignalResult& v);
void to_json(nlohmann::json& j, const Verdict& v);
void to_json(nlohmann::json& j, const OddsValue& v);
void to_json(nlohmann::json& j, const HistoryEntry& v);

namespace serialize {
    nlohmann::json payload(const SnapshotPayload& payload);

    // {source: sub-signal} for the signals that made it into the verdict
    nlohmann::json signals_by_source(const Verdict& verdict);

    // {source: "up"|"down"}
    nlohmann::json source_status(const SnapshotMap& snapshots);
}
