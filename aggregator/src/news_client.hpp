#pragma once

#include "source_client.hpp"
#include "http_client.hpp"
#include <memory>
#include <nlohmann/json.hpp>

// CryptoCompare BTC headlines, each scored by sentiment::score_headline
class NewsSource : public SourceClient {
public:
    static constexpr std::size_t kDefaultLimit = 10;

    NewsSource(const std::string& base_url, std::shared_ptr<HttpClient> http,
               std::size_t limit = kDefaultLimit);

    const std::string& name() const override { return source_names::kNews; }
    FetchResult fetch(std::chrono::milliseconds timeout) override;

    static FetchResult parse(const nlohmann::json& body, std::size_t limit);

private:
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
    std::size_t limit_;
};
