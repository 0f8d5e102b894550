#include "okx_client.hpp"
#include "json_util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

namespace {

const std::string kInstId = "BTC-USDT-SWAP";

const nlohmann::json& data_array(const nlohmann::json& body) {
    if (body.contains("code")) {
        const auto& code = body["code"];
        bool ok = code.is_string() ? code.get<std::string>() == "0"
                                   : (code.is_number() && code.get<int>() == 0);
        if (!ok) {
            throw std::invalid_argument(fmt::format("okx code {} {}", code.dump(),
                                                    body.value("msg", std::string())));
        }
    }
    const auto& data = body.at("data");
    if (!data.is_array()) {
        throw std::invalid_argument("okx data is not an array");
    }
    return data;
}

FetchResult transport_failure(const JsonResponse& response) {
    return FetchResult::failure(response.error.kind, response.error.message);
}

} // namespace

// ---- Funding ----

OkxFundingSource::OkxFundingSource(const std::string& base_url, std::shared_ptr<HttpClient> http)
    : base_url_(base_url), http_(std::move(http)) {}

FetchResult OkxFundingSource::fetch(std::chrono::milliseconds timeout) {
    const auto started = std::chrono::steady_clock::now();

    auto current = http_->get_json(base_url_ + "/api/v5/public/funding-rate",
                                   {{"instId", kInstId}}, timeout);
    if (!current.json) {
        return transport_failure(current);
    }

    // both requests share one timeout budget
    const auto remaining = timeout - std::chrono::duration_cast<std::chrono::milliseconds>(
                                         std::chrono::steady_clock::now() - started);
    if (remaining.count() <= 0) {
        spdlog::warn("No time left for funding history");
        return parse(*current.json, nullptr);
    }

    auto history = http_->get_json(base_url_ + "/api/v5/public/funding-rate-history",
                                   {{"instId", kInstId}, {"limit", "10"}}, remaining);
    if (!history.json) {
        spdlog::warn("Funding history unavailable: {}", history.error.message);
        return parse(*current.json, nullptr);
    }
    return parse(*current.json, &*history.json);
}

FetchResult OkxFundingSource::parse(const nlohmann::json& current, const nlohmann::json* history) {
    FundingData funding;
    try {
        const auto& data = data_array(current);
        if (data.empty()) {
            return FetchResult::failure(FetchErrorKind::Malformed, "no funding rate in reply");
        }
        funding.current_rate = json_util::to_double(data[0].at("fundingRate"));
        funding.next_funding_time_ms = json_util::to_int64(data[0].at("fundingTime"));
    } catch (const std::exception& e) {
        return FetchResult::failure(FetchErrorKind::Malformed,
                                    fmt::format("funding-rate: {}", e.what()));
    }

    if (history) {
        try {
            for (const auto& item : data_array(*history)) {
                FundingPoint point;
                point.rate = json_util::to_double(item.at("fundingRate"));
                point.time_ms = json_util::to_int64(item.at("fundingTime"));
                funding.recent.push_back(point);
            }
        } catch (const std::exception& e) {
            spdlog::warn("Ignoring malformed funding history: {}", e.what());
            funding.recent.clear();
        }
    }

    return FetchResult::success(funding);
}

// ---- Open interest ----

OkxOpenInterestSource::OkxOpenInterestSource(const std::string& base_url,
                                             std::shared_ptr<HttpClient> http)
    : base_url_(base_url), http_(std::move(http)) {}

FetchResult OkxOpenInterestSource::fetch(std::chrono::milliseconds timeout) {
    auto response = http_->get_json(base_url_ + "/api/v5/public/open-interest",
                                    {{"instType", "SWAP"}, {"instId", kInstId}}, timeout);
    if (!response.json) {
        return transport_failure(response);
    }
    return parse(*response.json);
}

FetchResult OkxOpenInterestSource::parse(const nlohmann::json& body) {
    try {
        const auto& data = data_array(body);
        if (data.empty()) {
            return FetchResult::failure(FetchErrorKind::Malformed, "no open interest in reply");
        }
        OpenInterestData oi;
        oi.oi_contracts = json_util::to_double(data[0].at("oi"));
        oi.oi_btc = json_util::to_double(data[0].at("oiCcy"));
        oi.timestamp_ms = json_util::to_int64(data[0].at("ts"));
        return FetchResult::success(oi);
    } catch (const std::exception& e) {
        return FetchResult::failure(FetchErrorKind::Malformed,
                                    fmt::format("open-interest: {}", e.what()));
    }
}

// ---- Long/short account ratio ----

OkxLongShortSource::OkxLongShortSource(const std::string& base_url,
                                       std::shared_ptr<HttpClient> http)
    : base_url_(base_url), http_(std::move(http)) {}

FetchResult OkxLongShortSource::fetch(std::chrono::milliseconds timeout) {
    auto response = http_->get_json(
        base_url_ + "/api/v5/rubik/stat/contracts/long-short-account-ratio",
        {{"ccy", "BTC"}, {"period", "1H"}}, timeout);
    if (!response.json) {
        return transport_failure(response);
    }
    return parse(*response.json);
}

FetchResult OkxLongShortSource::parse(const nlohmann::json& body) {
    try {
        const auto& data = data_array(body);
        if (data.empty()) {
            return FetchResult::failure(FetchErrorKind::Malformed, "no long/short ratio in reply");
        }

        // rows are [ts, ratio], newest first
        LongShortData ls;
        const std::size_t n = std::min(data.size(), kHistoryPoints);
        for (std::size_t i = 0; i < n; ++i) {
            RatioPoint point;
            point.timestamp_ms = json_util::to_int64(data[i].at(0));
            point.ratio = json_util::to_double(data[i].at(1));
            ls.history.push_back(point);
        }
        ls.current_ratio = ls.history.front().ratio;
        return FetchResult::success(ls);
    } catch (const std::exception& e) {
        return FetchResult::failure(FetchErrorKind::Malformed,
                                    fmt::format("long-short-ratio: {}", e.what()));
    }
}

// ---- Liquidations ----

OkxLiquidationSource::OkxLiquidationSource(const std::string& base_url,
                                           std::shared_ptr<HttpClient> http)
    : base_url_(base_url), http_(std::move(http)) {}

FetchResult OkxLiquidationSource::fetch(std::chrono::milliseconds timeout) {
    auto response = http_->get_json(
        base_url_ + "/api/v5/public/liquidation-orders",
        {{"instType", "SWAP"}, {"uly", "BTC-USDT"}, {"state", "filled"}}, timeout);
    if (!response.json) {
        return transport_failure(response);
    }
    return parse(*response.json);
}

FetchResult OkxLiquidationSource::parse(const nlohmann::json& body) {
    try {
        LiquidationData liqs;
        std::vector<LiquidationEvent> events;

        for (const auto& batch : data_array(body)) {
            if (!batch.contains("details")) continue;
            for (const auto& detail : batch["details"]) {
                LiquidationEvent ev;
                ev.price = json_util::to_double(detail.at("bkPx"));
                ev.size_btc = json_util::to_double(detail.at("sz"));
                ev.value_usd = ev.price * ev.size_btc;
                ev.side = detail.value("posSide", std::string());
                ev.time_ms = json_util::to_int64(detail.at("ts"));

                if (ev.side == "long") {
                    liqs.long_usd += ev.value_usd;
                    liqs.long_count++;
                } else if (ev.side == "short") {
                    liqs.short_usd += ev.value_usd;
                    liqs.short_count++;
                }
                events.push_back(std::move(ev));
            }
        }

        liqs.total_usd = liqs.long_usd + liqs.short_usd;

        std::stable_sort(events.begin(), events.end(),
                         [](const LiquidationEvent& a, const LiquidationEvent& b) {
                             return a.time_ms > b.time_ms;
                         });
        if (events.size() > kMaxEvents) {
            events.resize(kMaxEvents);
        }
        liqs.recent_events = std::move(events);

        return FetchResult::success(liqs);
    } catch (const std::exception& e) {
        return FetchResult::failure(FetchErrorKind::Malformed,
                                    fmt::format("liquidation-orders: {}", e.what()));
    }
}
