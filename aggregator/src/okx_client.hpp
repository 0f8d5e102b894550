#pragma once

#include "source_client.hpp"
#include "http_client.hpp"
#include <memory>
#include <nlohmann/json.hpp>

// OKX public derivatives data for the BTC-USDT perpetual swap.
// Every OKX v5 reply is {"code": "0", "msg": "", "data": [...]}.

class OkxFundingSource : public SourceClient {
public:
    OkxFundingSource(const std::string& base_url, std::shared_ptr<HttpClient> http);

    const std::string& name() const override { return source_names::kFunding; }

    // The history request is best effort; only the current rate is required
    FetchResult fetch(std::chrono::milliseconds timeout) override;

    // history may be null when that request failed
    static FetchResult parse(const nlohmann::json& current, const nlohmann::json* history);

private:
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
};

class OkxOpenInterestSource : public SourceClient {
public:
    OkxOpenInterestSource(const std::string& base_url, std::shared_ptr<HttpClient> http);

    const std::string& name() const override { return source_names::kOpenInterest; }
    FetchResult fetch(std::chrono::milliseconds timeout) override;

    static FetchResult parse(const nlohmann::json& body);

private:
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
};

class OkxLongShortSource : public SourceClient {
public:
    static constexpr std::size_t kHistoryPoints = 12;   // hourly

    OkxLongShortSource(const std::string& base_url, std::shared_ptr<HttpClient> http);

    const std::string& name() const override { return source_names::kLongShortRatio; }
    FetchResult fetch(std::chrono::milliseconds timeout) override;

    static FetchResult parse(const nlohmann::json& body);

private:
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
};

class OkxLiquidationSource : public SourceClient {
public:
    static constexpr std::size_t kMaxEvents = 20;

    OkxLiquidationSource(const std::string& base_url, std::shared_ptr<HttpClient> http);

    const std::string& name() const override { return source_names::kLiquidations; }
    FetchResult fetch(std::chrono::milliseconds timeout) override;

    static FetchResult parse(const nlohmann::json& body);

private:
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
};
