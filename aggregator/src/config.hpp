#pragma once

#include "decision_engine.hpp"
#include "evaluators.hpp"
#include <string>
#include <cstdlib>

struct Config {
    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    // Refresh cycle
    int refresh_interval_seconds;
    int source_timeout_ms;
    int history_capacity;

    // Decision rule and per-signal thresholds
    EngineThresholds engine;
    EvaluatorConfig evaluators;
    double wall_band_pct;
    double max_share_price;

    // Upstream endpoints
    std::string kraken_base;
    std::string okx_base;
    std::string news_base;
    std::string polymarket_base;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
};
