#include "config.hpp"
#include "http_client.hpp"
#include "kraken_client.hpp"
#include "okx_client.hpp"
#include "news_client.hpp"
#include "polymarket_client.hpp"
#include "evaluators.hpp"
#include "decision_engine.hpp"
#include "history_log.hpp"
#include "read_cache.hpp"
#include "health.hpp"
#include "refresh_coordinator.hpp"
#include "api_server.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <curl/curl.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("btc_signals", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

// One HttpClient per source: a curl easy handle must not be shared between
// the threads the coordinator fetches on
std::vector<std::shared_ptr<SourceClient>> build_sources(const Config& config) {
    auto http = []() { return std::make_shared<HttpClient>(); };

    return {
        std::make_shared<KrakenPriceSource>(config.kraken_base, http()),
        std::make_shared<KrakenOrderBookSource>(config.kraken_base, http(), config.wall_band_pct),
        std::make_shared<OkxFundingSource>(config.okx_base, http()),
        std::make_shared<OkxOpenInterestSource>(config.okx_base, http()),
        std::make_shared<OkxLongShortSource>(config.okx_base, http()),
        std::make_shared<OkxLiquidationSource>(config.okx_base, http()),
        std::make_shared<NewsSource>(config.news_base, http()),
        std::make_shared<PolymarketSource>(config.polymarket_base, http()),
    };
}

int main() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        return 1;
    }

    int exit_code = 0;

    try {
        // Load configuration
        Config config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();

        spdlog::info("Starting {} on {}:{}",
                     config.service_name, config.listen_addr, config.listen_port);

        // Initialize components
        auto history = std::make_shared<HistoryLog>(static_cast<std::size_t>(config.history_capacity));
        auto cache = std::make_shared<ReadCache>(history);
        auto health = std::make_shared<HealthMonitor>();

        SignalEvaluator evaluator(config.evaluators);
        DecisionEngine engine(config.engine);

        RefreshOptions options;
        options.interval = std::chrono::seconds(config.refresh_interval_seconds);
        options.source_timeout = std::chrono::milliseconds(config.source_timeout_ms);
        options.max_share_price = config.max_share_price;

        RefreshCoordinator coordinator(build_sources(config), evaluator, engine,
                                       cache, history, health, options);
        ApiServer api_server(config.listen_addr, config.listen_port, cache, health);

        // Register signal handlers
        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);

        coordinator.start();
        api_server.start();

        while (!shutdown_requested && !api_server.has_failed()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (api_server.has_failed()) {
            spdlog::error("API server is down, stopping");
            exit_code = 1;
        } else {
            spdlog::info("Shutdown requested, stopping");
        }

        // Graceful shutdown
        api_server.stop();
        coordinator.stop();

        spdlog::info("Shutdown complete");

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        exit_code = 1;
    }

    curl_global_cleanup();
    return exit_code;
}
