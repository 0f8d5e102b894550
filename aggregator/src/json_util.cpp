#include "json_util.hpp"
#include <stdexcept>

namespace json_util {

double to_double(const nlohmann::json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        size_t used = 0;
        double out = std::stod(s, &used);
        if (used != s.size()) {
            throw std::invalid_argument("trailing characters in number: " + s);
        }
        return out;
    }
    throw std::invalid_argument("expected number, got " + std::string(value.type_name()));
}

int64_t to_int64(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number()) {
        return static_cast<int64_t>(value.get<double>());
    }
    if (value.is_string()) {
        return std::stoll(value.get_ref<const std::string&>());
    }
    throw std::invalid_argument("expected integer, got " + std::string(value.type_name()));
}

nlohmann::json maybe_embedded_array(const nlohmann::json& value) {
    if (value.is_array()) {
        return value;
    }
    if (value.is_string()) {
        auto parsed = nlohmann::json::parse(value.get_ref<const std::string&>());
        if (parsed.is_array()) {
            return parsed;
        }
    }
    return nlohmann::json::array();
}

} // namespace json_util
