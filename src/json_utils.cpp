#include "panelayout/json_utils.hpp"

#include <cmath>
#include <limits>

namespace panelayout {

    std::optional<std::string> optional_string_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key)) {
            return std::nullopt;
        }
        const auto& value = obj.at(key);
        if (!value.is_string()) {
            return std::nullopt;
        }
        auto str = value.get<std::string>();
        if (str.empty()) {
            return std::nullopt;
        }
        return str;
    }

    std::optional<float> optional_float_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key) || !obj.at(key).is_number()) {
            return std::nullopt;
        }
        const auto value = obj.at(key).get<double>();
        if (!std::isfinite(value) || std::fabs(value) > std::numeric_limits<float>::max()) {
            return std::nullopt;
        }
        return static_cast<float>(value);
    }

    std::optional<bool> optional_bool_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key) || !obj.at(key).is_boolean()) {
            return std::nullopt;
        }
        return obj.at(key).get<bool>();
    }

}
