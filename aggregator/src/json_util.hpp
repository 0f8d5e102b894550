#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

// Exchange APIs send numbers both as JSON numbers and as decimal strings.
// Both helpers throw std::invalid_argument on anything else.
namespace json_util {
    double to_double(const nlohmann::json& value);
    int64_t to_int64(const nlohmann::json& value);

    // Gamma API encodes some arrays as JSON text inside a string
    nlohmann::json maybe_embedded_array(const nlohmann::json& value);
}
