#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

class HealthMonitor {
public:
    HealthMonitor();

    void set_loop_status(const std::string& status);
    void record_source(const std::string& source, bool ok, const std::string& error = "");
    void record_cycle_completed(int64_t finished_at_ms);
    void record_cycle_skipped();

    std::string loop_status() const;
    uint64_t cycles_completed() const;
    uint64_t cycles_skipped() const;

    nlohmann::json to_json() const;

private:
    struct SourceHealth {
        bool up = false;
        std::string last_error;
    };

    mutable std::mutex mutex_;
    std::string loop_status_;
    std::map<std::string, SourceHealth> sources_;
    uint64_t cycles_completed_ = 0;
    uint64_t cycles_skipped_ = 0;
    int64_t last_cycle_ms_ = 0;
};
