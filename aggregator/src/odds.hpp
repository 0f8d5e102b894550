#pragma once

#include "types.hpp"

constexpr double kDefaultMaxSharePrice = 0.55;

// Whether the prediction market pays enough for the verdict's side.
// market may be null when the polymarket source failed this cycle.
OddsValue check_odds_value(const Verdict& verdict, const PredictionMarket* market,
                           double max_share_price = kDefaultMaxSharePrice);
