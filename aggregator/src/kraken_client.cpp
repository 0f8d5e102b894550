#include "kraken_client.hpp"
#include "json_util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <stdexcept>

namespace {

const std::string kPair = "XBTUSD";

// Kraken wraps every payload as {"error": [...], "result": {"<pair>": {...}}}
// with a pair key that differs from the requested one (XXBTZUSD).
const nlohmann::json& first_pair(const nlohmann::json& body) {
    if (body.contains("error") && body["error"].is_array() && !body["error"].empty()) {
        throw std::invalid_argument("kraken error: " + body["error"][0].dump());
    }
    const auto& result = body.at("result");
    if (!result.is_object() || result.empty()) {
        throw std::invalid_argument("kraken result is empty");
    }
    return result.begin().value();
}

std::vector<BookLevel> parse_levels(const nlohmann::json& side) {
    std::vector<BookLevel> out;
    if (!side.is_array()) return out;
    out.reserve(side.size());
    for (const auto& level : side) {
        out.emplace_back(json_util::to_double(level.at(0)), json_util::to_double(level.at(1)));
    }
    return out;
}

} // namespace

std::optional<OrderBookWalls> compute_wall_strength(const std::vector<BookLevel>& bids,
                                                    const std::vector<BookLevel>& asks,
                                                    double band_pct) {
    if (bids.empty() || asks.empty()) {
        return std::nullopt;
    }

    OrderBookWalls walls;
    walls.mid_price = (bids.front().first + asks.front().first) / 2.0;

    const double lower = walls.mid_price * (1.0 - band_pct);
    const double upper = walls.mid_price * (1.0 + band_pct);

    for (const auto& [price, volume] : bids) {
        if (price >= lower) walls.bid_wall_volume += volume;
    }
    for (const auto& [price, volume] : asks) {
        if (price <= upper) walls.ask_wall_volume += volume;
    }

    if (walls.ask_wall_volume > 0.0) {
        walls.wall_ratio = walls.bid_wall_volume / walls.ask_wall_volume;
        walls.has_ratio = true;
    }
    return walls;
}

KrakenPriceSource::KrakenPriceSource(const std::string& base_url, std::shared_ptr<HttpClient> http)
    : base_url_(base_url), http_(std::move(http)) {}

FetchResult KrakenPriceSource::fetch(std::chrono::milliseconds timeout) {
    auto response = http_->get_json(base_url_ + "/0/public/Ticker", {{"pair", kPair}}, timeout);
    if (!response.json) {
        return FetchResult::failure(response.error.kind, response.error.message);
    }
    return parse(*response.json);
}

FetchResult KrakenPriceSource::parse(const nlohmann::json& body) {
    try {
        const auto& ticker = first_pair(body);
        PriceTicker price;
        price.last = json_util::to_double(ticker.at("c").at(0));
        if (!(price.last > 0.0)) {
            return FetchResult::failure(FetchErrorKind::Malformed,
                                        fmt::format("non-positive price {}", price.last));
        }
        return FetchResult::success(price);
    } catch (const std::exception& e) {
        return FetchResult::failure(FetchErrorKind::Malformed,
                                    fmt::format("ticker: {}", e.what()));
    }
}

KrakenOrderBookSource::KrakenOrderBookSource(const std::string& base_url,
                                             std::shared_ptr<HttpClient> http,
                                             double band_pct, int depth)
    : base_url_(base_url), http_(std::move(http)), band_pct_(band_pct), depth_(depth) {}

FetchResult KrakenOrderBookSource::fetch(std::chrono::milliseconds timeout) {
    auto response = http_->get_json(base_url_ + "/0/public/Depth",
                                    {{"pair", kPair}, {"count", std::to_string(depth_)}},
                                    timeout);
    if (!response.json) {
        return FetchResult::failure(response.error.kind, response.error.message);
    }
    return parse(*response.json, band_pct_);
}

FetchResult KrakenOrderBookSource::parse(const nlohmann::json& body, double band_pct) {
    try {
        const auto& book = first_pair(body);
        auto bids = parse_levels(book.at("bids"));
        auto asks = parse_levels(book.at("asks"));

        auto walls = compute_wall_strength(bids, asks, band_pct);
        if (!walls) {
            return FetchResult::failure(FetchErrorKind::Malformed, "order book has an empty side");
        }

        spdlog::debug("Order book: mid={:.2f} bid_wall={:.3f} ask_wall={:.3f}",
                      walls->mid_price, walls->bid_wall_volume, walls->ask_wall_volume);
        return FetchResult::success(*walls);
    } catch (const std::exception& e) {
        return FetchResult::failure(FetchErrorKind::Malformed,
                                    fmt::format("depth: {}", e.what()));
    }
}
