#include "news_client.hpp"
#include "json_util.hpp"
#include "sentiment.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

NewsSource::NewsSource(const std::string& base_url, std::shared_ptr<HttpClient> http,
                       std::size_t limit)
    : base_url_(base_url), http_(std::move(http)), limit_(limit) {}

FetchResult NewsSource::fetch(std::chrono::milliseconds timeout) {
    auto response = http_->get_json(base_url_ + "/data/v2/news/",
                                    {{"categories", "BTC"}, {"lang", "EN"}, {"sortOrder", "latest"}},
                                    timeout);
    if (!response.json) {
        return FetchResult::failure(response.error.kind, response.error.message);
    }
    return parse(*response.json, limit_);
}

FetchResult NewsSource::parse(const nlohmann::json& body, std::size_t limit) {
    try {
        if (!body.contains("Data") || !body["Data"].is_array() || body["Data"].empty()) {
            return FetchResult::failure(FetchErrorKind::Malformed, "no headlines in reply");
        }

        std::vector<Headline> headlines;
        for (const auto& item : body["Data"]) {
            if (headlines.size() >= limit) break;

            Headline h;
            h.title = item.value("title", std::string());
            h.url = item.value("url", std::string());
            h.source = item.value("source", std::string("Unknown"));
            if (item.contains("source_info") && item["source_info"].is_object()) {
                h.source = item["source_info"].value("name", h.source);
            }
            if (item.contains("published_on")) {
                h.published_at = json_util::to_int64(item["published_on"]);
            }
            h.sentiment = sentiment::score_headline(h.title, item.value("body", std::string()));
            headlines.push_back(std::move(h));
        }

        auto summary = sentiment::summarize(std::move(headlines));
        spdlog::debug("News: {} headlines, avg={:.3f} ({})",
                      summary.headlines.size(), summary.avg_score, summary.overall_sentiment);
        return FetchResult::success(std::move(summary));
    } catch (const std::exception& e) {
        return FetchResult::failure(FetchErrorKind::Malformed, fmt::format("news: {}", e.what()));
    }
}
