#pragma once

#include "read_cache.hpp"
#include "health.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

// Read-only views over the published CacheState. None of these fetch or
// block on a refresh; before the first publish they answer 503.
namespace api {

constexpr std::size_t kMaxLiquidationEvents = 10;
constexpr std::size_t kMaxHeadlines = 10;

ApiResponse dashboard_data(const ReadCache& cache, int64_t now_ms);
ApiResponse signal(const ReadCache& cache);
ApiResponse derivatives(const ReadCache& cache);
ApiResponse news(const ReadCache& cache);
ApiResponse polymarket(const ReadCache& cache);
ApiResponse bet_suggestion(const ReadCache& cache);

// limit_param is the raw ?limit= value, empty for "all"
ApiResponse signal_history(const ReadCache& cache, const std::string& limit_param);

ApiResponse health(const ReadCache& cache, const HealthMonitor& monitor, int64_t now_ms);

} // namespace api
