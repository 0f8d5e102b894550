#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>

namespace util {

std::string current_iso8601() {
    return to_iso8601(current_timestamp_ms());
}

std::string to_iso8601(int64_t timestamp_ms) {
    std::time_t secs = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::optional<int64_t> parse_iso8601_ms(const std::string& text) {
    std::tm tm_utc{};
    std::istringstream ss(text.substr(0, 19));
    ss >> std::get_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(timegm(&tm_utc)) * 1000;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

double clamp(double value, double lo, double hi) {
    return std::max(lo, std::min(hi, value));
}

} // namespace util
