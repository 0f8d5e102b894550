#pragma once

#include "source_client.hpp"
#include "http_client.hpp"
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>

// Polymarket Gamma API market discovery. Picks the highest-volume active
// BTC market, preferring "Up or Down" questions, and carries its outcome
// prices for the odds check.
class PolymarketSource : public SourceClient {
public:
    using Clock = std::function<int64_t()>;

    PolymarketSource(const std::string& base_url, std::shared_ptr<HttpClient> http,
                     Clock now_ms = nullptr);

    const std::string& name() const override { return source_names::kPolymarket; }
    FetchResult fetch(std::chrono::milliseconds timeout) override;

    // Markets ending before now_ms or not about BTC are discarded
    static FetchResult parse(const nlohmann::json& body, int64_t now_ms);

    static PredictionMarket to_market(const nlohmann::json& market);

private:
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
    Clock now_ms_;
};
