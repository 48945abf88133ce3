#include "panelayout/config.hpp"

#include <cstdint>
#include <exception>
#include <limits>
#include <utility>

#include <nlohmann/json.hpp>

#include "panelayout/json_utils.hpp"

namespace panelayout {

    namespace {

        void set_error(std::string* error, std::string message) {
            if (!error) {
                return;
            }
            *error = std::move(message);
        }

        bool read_bool(const nlohmann::json& root, const char* key, std::optional<bool>* out, std::string* error) {
            if (!root.contains(key)) {
                return true;
            }
            const auto value = optional_bool_field(root, key);
            if (!value) {
                set_error(error, std::string("config ") + key + " must be boolean");
                return false;
            }
            *out = value;
            return true;
        }

        // Checked before narrowing so 2^32 + 1 cannot wrap into range.
        std::optional<int> positive_int(const nlohmann::json& value) {
            constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<int>::max());
            if (value.is_number_unsigned()) {
                const auto raw = value.get<std::uint64_t>();
                if (raw == 0 || raw > kMax) {
                    return std::nullopt;
                }
                return static_cast<int>(raw);
            }
            if (!value.is_number_integer()) {
                return std::nullopt;
            }
            const auto raw = value.get<std::int64_t>();
            if (raw <= 0 || static_cast<std::uint64_t>(raw) > kMax) {
                return std::nullopt;
            }
            return static_cast<int>(raw);
        }

    } // namespace

    LayoutConfig apply_overrides(const LayoutConfig& base, const LayoutConfigOverrides& overrides) {
        LayoutConfig merged = base;
        if (overrides.debug_logging) {
            merged.debug_logging = *overrides.debug_logging;
        }
        if (overrides.wrap_focus) {
            merged.wrap_focus = *overrides.wrap_focus;
        }
        if (overrides.quick_slot_count) {
            merged.quick_slot_count = *overrides.quick_slot_count;
        }
        if (overrides.default_direction) {
            merged.default_direction = *overrides.default_direction;
        }
        return merged;
    }

    std::optional<LayoutConfigOverrides> layout_config_overrides_from_json(std::string_view json_text, std::string* error) {
        if (error) {
            error->clear();
        }
        try {
            const auto root = nlohmann::json::parse(json_text.begin(), json_text.end(), nullptr, false);
            if (root.is_discarded()) {
                set_error(error, "config invalid json");
                return std::nullopt;
            }
            if (!root.is_object()) {
                set_error(error, "config root must be object");
                return std::nullopt;
            }

            LayoutConfigOverrides overrides;
            if (!read_bool(root, "debug_logging", &overrides.debug_logging, error)) {
                return std::nullopt;
            }
            if (!read_bool(root, "wrap_focus", &overrides.wrap_focus, error)) {
                return std::nullopt;
            }
            if (root.contains("quick_slot_count")) {
                const auto count = positive_int(root.at("quick_slot_count"));
                if (!count) {
                    set_error(error, "config quick_slot_count must be positive integer");
                    return std::nullopt;
                }
                overrides.quick_slot_count = count;
            }
            if (root.contains("default_direction")) {
                const auto name      = optional_string_field(root, "default_direction");
                const auto direction = name ? parse_split_direction(*name) : std::nullopt;
                if (!direction) {
                    set_error(error, "config default_direction is invalid");
                    return std::nullopt;
                }
                overrides.default_direction = direction;
            }
            return overrides;
        } catch (const std::exception& exc) {
            set_error(error, std::string("config decode failed: ") + exc.what());
            return std::nullopt;
        }
    }

} // namespace panelayout
