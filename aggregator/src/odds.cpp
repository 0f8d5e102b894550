#include "odds.hpp"
#include "util.hpp"
#include <fmt/format.h>

OddsValue check_odds_value(const Verdict& verdict, const PredictionMarket* market,
                           double max_share_price) {
    OddsValue odds;

    if (!market) {
        odds.detail = "No Polymarket data";
        return odds;
    }

    std::string side;
    switch (verdict.direction) {
        case VerdictDirection::Up: side = "Up"; break;
        case VerdictDirection::Down: side = "Down"; break;
        case VerdictDirection::Skip:
            odds.detail = "Signal is SKIP, no bet";
            return odds;
    }

    const auto* outcome = market->find_outcome(side);
    if (!outcome || !outcome->price) {
        odds.detail = "No price for target outcome";
        return odds;
    }

    const double price = *outcome->price;
    const std::string direction = to_string(verdict.direction);
    odds.share_price = price;

    if (!(price > 0.0)) {
        odds.detail = fmt::format("{} shares quoted at ${:.2f}, not tradable", direction, price);
        return odds;
    }

    if (price <= max_share_price) {
        const double payout = 1.0 / price;
        odds.has_value = true;
        odds.potential_payout = util::round_to(payout, 2);
        odds.detail = fmt::format("{} shares at ${:.2f} -> {:.2f}x payout if correct",
                                  direction, price, payout);
    } else {
        odds.detail = fmt::format("{} shares at ${:.2f}, too expensive (max ${:.2f})",
                                  direction, price, max_share_price);
    }
    return odds;
}
