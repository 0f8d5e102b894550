#include "config.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <stdexcept>

namespace {

void require_range(const char* name, int value, int lo, int hi) {
    if (value < lo || value > hi) {
        throw std::runtime_error(fmt::format("{} must be in [{}, {}] (got {})", name, lo, hi, value));
    }
}

} // namespace

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 5124);

    cfg.service_name = get_env("SERVICE_NAME", "aggregator");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    cfg.refresh_interval_seconds = get_env_int("REFRESH_INTERVAL_SECONDS", 45);
    cfg.source_timeout_ms = get_env_int("SOURCE_TIMEOUT_MS", 10000);
    cfg.history_capacity = get_env_int("HISTORY_CAPACITY", 50);

    cfg.engine.up_threshold = get_env_double("UP_THRESHOLD", 0.3);
    cfg.engine.down_threshold = get_env_double("DOWN_THRESHOLD", 0.3);

    auto& ev = cfg.evaluators;
    ev.weights.funding = get_env_double("WEIGHT_FUNDING", 1.5);
    ev.weights.liquidations = get_env_double("WEIGHT_LIQUIDATIONS", 1.5);
    ev.weights.order_book = get_env_double("WEIGHT_ORDER_BOOK", 1.0);
    ev.weights.long_short = get_env_double("WEIGHT_LONG_SHORT", 0.5);
    ev.weights.news = get_env_double("WEIGHT_NEWS", 0.5);

    ev.funding_high = get_env_double("FUNDING_HIGH", 0.0001);
    ev.funding_low = get_env_double("FUNDING_LOW", -0.0001);
    ev.liq_dominance_ratio = get_env_double("LIQ_DOMINANCE_RATIO", 1.5);
    ev.liq_contrarian = get_env_int("LIQ_CONTRARIAN", 0) != 0;
    ev.wall_bid_strong = get_env_double("WALL_BID_STRONG", 1.3);
    ev.wall_ask_strong = get_env_double("WALL_ASK_STRONG", 0.77);
    ev.ls_high = get_env_double("LS_HIGH", 2.5);
    ev.ls_low = get_env_double("LS_LOW", 0.7);
    ev.news_bullish = get_env_double("NEWS_BULLISH", 0.1);
    ev.news_bearish = get_env_double("NEWS_BEARISH", -0.1);

    cfg.wall_band_pct = get_env_double("WALL_BAND_PCT", 0.01);
    cfg.max_share_price = get_env_double("MAX_SHARE_PRICE", 0.55);

    cfg.kraken_base = get_env("KRAKEN_BASE", "https://api.kraken.com");
    cfg.okx_base = get_env("OKX_BASE", "https://www.okx.com");
    cfg.news_base = get_env("NEWS_BASE", "https://min-api.cryptocompare.com");
    cfg.polymarket_base = get_env("POLYMARKET_BASE", "https://gamma-api.polymarket.com");

    return cfg;
}

void Config::validate() const {
    require_range("LISTEN_PORT", listen_port, 1, 65535);
    require_range("REFRESH_INTERVAL_SECONDS", refresh_interval_seconds, 5, 3600);
    require_range("SOURCE_TIMEOUT_MS", source_timeout_ms, 100, 120000);
    require_range("HISTORY_CAPACITY", history_capacity, 1, 10000);

    if (!(wall_band_pct > 0.0 && wall_band_pct < 1.0)) {
        throw std::runtime_error("WALL_BAND_PCT must be in (0, 1)");
    }
    if (!(max_share_price > 0.0 && max_share_price < 1.0)) {
        throw std::runtime_error("MAX_SHARE_PRICE must be in (0, 1)");
    }

    try {
        engine.validate();
        evaluators.validate();
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Refresh: every {}s, source timeout {}ms, history {}",
                 refresh_interval_seconds, source_timeout_ms, history_capacity);
    spdlog::info("  Thresholds: up={}, down={}", engine.up_threshold, engine.down_threshold);
    spdlog::info("  Weights: funding={}, liquidations={}, order_book={}, long_short={}, news={}",
                 evaluators.weights.funding, evaluators.weights.liquidations,
                 evaluators.weights.order_book, evaluators.weights.long_short,
                 evaluators.weights.news);
    spdlog::info("  Liquidation reading: {}", evaluators.liq_contrarian ? "contrarian" : "continuation");
}
