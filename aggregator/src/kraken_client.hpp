#pragma once

#include "source_client.hpp"
#include "http_client.hpp"
#include <memory>
#include <optional>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

// price level: (price, volume)
using BookLevel = std::pair<double, double>;

// Sums bid and ask volume within band_pct of the mid price.
// Returns std::nullopt when either side of the book is empty.
std::optional<OrderBookWalls> compute_wall_strength(const std::vector<BookLevel>& bids,
                                                    const std::vector<BookLevel>& asks,
                                                    double band_pct);

// Kraken public ticker, XBT/USD last trade price
class KrakenPriceSource : public SourceClient {
public:
    KrakenPriceSource(const std::string& base_url, std::shared_ptr<HttpClient> http);

    const std::string& name() const override { return source_names::kPrice; }
    FetchResult fetch(std::chrono::milliseconds timeout) override;

    static FetchResult parse(const nlohmann::json& body);

private:
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
};

// Kraken public depth, reduced to bid/ask wall volume near the mid
class KrakenOrderBookSource : public SourceClient {
public:
    KrakenOrderBookSource(const std::string& base_url, std::shared_ptr<HttpClient> http,
                          double band_pct = 0.01, int depth = 100);

    const std::string& name() const override { return source_names::kOrderBook; }
    FetchResult fetch(std::chrono::milliseconds timeout) override;

    static FetchResult parse(const nlohmann::json& body, double band_pct);

private:
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
    double band_pct_;
    int depth_;
};
