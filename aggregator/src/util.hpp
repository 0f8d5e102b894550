#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>

namespace util {
    std::string current_iso8601();
    std::string to_iso8601(int64_t timestamp_ms);
    int64_t current_timestamp_ms();

    // Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and "Z"
    std::optional<int64_t> parse_iso8601_ms(const std::string& text);

    std::string to_lower(std::string s);
    double round_to(double value, int decimals);
    double clamp(double value, double lo, double hi);
}
