#include "polymarket_client.hpp"
#include "json_util.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>

namespace {

bool is_btc_question(const std::string& lowered) {
    return lowered.find("btc") != std::string::npos ||
           lowered.find("bitcoin") != std::string::npos;
}

bool is_up_or_down(const std::string& question) {
    return util::to_lower(question).find("up or down") != std::string::npos;
}

} // namespace

PolymarketSource::PolymarketSource(const std::string& base_url, std::shared_ptr<HttpClient> http,
                                   Clock now_ms)
    : base_url_(base_url)
    , http_(std::move(http))
    , now_ms_(now_ms ? std::move(now_ms) : Clock(util::current_timestamp_ms)) {}

FetchResult PolymarketSource::fetch(std::chrono::milliseconds timeout) {
    auto response = http_->get_json(base_url_ + "/markets",
                                    {{"limit", "100"},
                                     {"active", "true"},
                                     {"closed", "false"},
                                     {"tag_slug", "bitcoin"},
                                     {"order", "volume24hr"},
                                     {"ascending", "false"}},
                                    timeout);
    if (!response.json) {
        return FetchResult::failure(response.error.kind, response.error.message);
    }
    return parse(*response.json, now_ms_());
}

PredictionMarket PolymarketSource::to_market(const nlohmann::json& market) {
    PredictionMarket pm;
    pm.question = market.value("question", std::string());
    pm.end_date = market.value("endDate", std::string());
    pm.slug = market.value("slug", std::string());

    const auto token_ids = json_util::maybe_embedded_array(
        market.value("clobTokenIds", nlohmann::json("[]")));
    const auto labels = json_util::maybe_embedded_array(
        market.value("outcomes", nlohmann::json("[]")));
    const auto prices = json_util::maybe_embedded_array(
        market.value("outcomePrices", nlohmann::json("[]")));

    const std::size_t n = std::max(token_ids.size(), labels.size());
    for (std::size_t i = 0; i < n; ++i) {
        MarketOutcome outcome;
        outcome.label = i < labels.size() ? labels[i].get<std::string>()
                                          : fmt::format("Outcome {}", i);
        if (i < token_ids.size()) {
            outcome.token_id = token_ids[i].get<std::string>();
        }
        if (i < prices.size()) {
            outcome.price = json_util::to_double(prices[i]);
        }
        pm.outcomes.push_back(std::move(outcome));
    }
    return pm;
}

FetchResult PolymarketSource::parse(const nlohmann::json& body, int64_t now_ms) {
    try {
        const nlohmann::json* markets = &body;
        if (body.is_object() && body.contains("data")) {
            markets = &body["data"];
        }
        if (!markets->is_array()) {
            return FetchResult::failure(FetchErrorKind::Malformed, "markets reply is not a list");
        }

        std::vector<const nlohmann::json*> candidates;
        for (const auto& market : *markets) {
            const std::string question = util::to_lower(market.value("question", std::string()));
            if (!is_btc_question(question)) continue;

            if (market.contains("endDate") && market["endDate"].is_string()) {
                auto end_ms = util::parse_iso8601_ms(market["endDate"].get<std::string>());
                if (!end_ms) continue;
                if (*end_ms < now_ms) continue;
            }
            candidates.push_back(&market);
        }

        if (candidates.empty()) {
            return FetchResult::failure(FetchErrorKind::Malformed, "no active BTC market");
        }

        // stable, so the API's volume ordering survives within each group
        std::stable_sort(candidates.begin(), candidates.end(),
                         [](const nlohmann::json* a, const nlohmann::json* b) {
                             return is_up_or_down(a->value("question", std::string())) &&
                                    !is_up_or_down(b->value("question", std::string()));
                         });

        auto chosen = to_market(*candidates.front());
        spdlog::debug("Polymarket: {} candidates, chose '{}'", candidates.size(), chosen.question);
        return FetchResult::success(std::move(chosen));
    } catch (const std::exception& e) {
        return FetchResult::failure(FetchErrorKind::Malformed,
                                    fmt::format("polymarket: {}", e.what()));
    }
}
