#include "health.hpp"
#include "util.hpp"

HealthMonitor::HealthMonitor()
    : loop_status_("idle") {}

void HealthMonitor::set_loop_status(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_status_ = status;
}

void HealthMonitor::record_source(const std::string& source, bool ok, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = sources_[source];
    entry.up = ok;
    entry.last_error = ok ? std::string() : error;
}

void HealthMonitor::record_cycle_completed(int64_t finished_at_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    cycles_completed_++;
    last_cycle_ms_ = finished_at_ms;
}

void HealthMonitor::record_cycle_skipped() {
    std::lock_guard<std::mutex> lock(mutex_);
    cycles_skipped_++;
}

std::string HealthMonitor::loop_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loop_status_;
}

uint64_t HealthMonitor::cycles_completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cycles_completed_;
}

uint64_t HealthMonitor::cycles_skipped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cycles_skipped_;
}

nlohmann::json HealthMonitor::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json sources_json = nlohmann::json::object();
    nlohmann::json errors_json = nlohmann::json::object();
    for (const auto& [name, health] : sources_) {
        sources_json[name] = health.up ? "up" : "down";
        if (!health.last_error.empty()) {
            errors_json[name] = health.last_error;
        }
    }

    return {
        {"loop", loop_status_},
        {"cycles", {
            {"completed", cycles_completed_},
            {"skipped", cycles_skipped_},
            {"last_finished", last_cycle_ms_ > 0 ? nlohmann::json(util::to_iso8601(last_cycle_ms_))
                                                 : nlohmann::json(nullptr)}
        }},
        {"sources", sources_json},
        {"last_errors", errors_json}
    };
}
