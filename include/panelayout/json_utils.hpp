#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace panelayout {

    // Present, non-null and non-empty strings only.
    std::optional<std::string> optional_string_field(const nlohmann::json& obj, const char* key);
    // Numbers that fit in a float; larger magnitudes read as absent.
    std::optional<float>       optional_float_field(const nlohmann::json& obj, const char* key);
    std::optional<bool>        optional_bool_field(const nlohmann::json& obj, const char* key);

}
