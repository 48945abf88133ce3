#ifndef PANELAYOUT_PANE_COMMAND_HPP
#define PANELAYOUT_PANE_COMMAND_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "panelayout/split_tree.hpp"

namespace panelayout {

    enum class PaneCommandKind {
        kSplit,
        kClose,
        kResize,
        kFocusSlot,
        kFocusIndex,
        kFocusNext,
        kFocusPrevious,
        kFocusLast,
        kFocusSibling,
    };

    struct PaneCommand {
        PaneCommandKind               kind;
        std::optional<std::string>    slot_id     = std::nullopt;
        std::optional<std::string>    new_slot_id = std::nullopt;
        std::optional<SplitDirection> direction   = std::nullopt;
        std::optional<std::string>    node_id     = std::nullopt;
        std::optional<float>          ratio       = std::nullopt;
        std::optional<int>            index       = std::nullopt;
    };

    struct ParseError {
        std::string message;
    };

    // split <target> <new> [horizontal|vertical]
    // close <slot>
    // resize <node-id> <ratio>
    // focus <slot> | focus index <n> | focus next | focus prev | focus last | focus sibling
    // focus slot <slot>   (for slots named like a focus keyword)
    std::variant<PaneCommand, ParseError> parse_pane_command(std::string_view args);

} // namespace panelayout

#endif // PANELAYOUT_PANE_COMMAND_HPP
