#ifndef PANELAYOUT_CONFIG_HPP
#define PANELAYOUT_CONFIG_HPP

#include <optional>
#include <string>
#include <string_view>

#include "panelayout/split_tree.hpp"

namespace panelayout {

    struct LayoutConfig {
        bool           debug_logging     = false;
        bool           wrap_focus        = true;
        int            quick_slot_count  = 9;
        SplitDirection default_direction = SplitDirection::kVertical;
    };

    struct LayoutConfigOverrides {
        std::optional<bool>           debug_logging;
        std::optional<bool>           wrap_focus;
        std::optional<int>            quick_slot_count;
        std::optional<SplitDirection> default_direction;
    };

    LayoutConfig                         apply_overrides(const LayoutConfig& base, const LayoutConfigOverrides& overrides);

    // Reads {"debug_logging", "wrap_focus", "quick_slot_count", "default_direction"}.
    // Unknown keys are ignored, present keys of the wrong type fail the whole document.
    std::optional<LayoutConfigOverrides> layout_config_overrides_from_json(std::string_view json_text, std::string* error);

} // namespace panelayout

#endif // PANELAYOUT_CONFIG_HPP
