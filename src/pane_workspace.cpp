#include "panelayout/pane_workspace.hpp"

#include <algorithm>
#include <utility>

#include "panelayout/grid_layout.hpp"
#include "panelayout/logging.hpp"

namespace panelayout {

    namespace {

        std::string describe_panes(const PaneTree& tree) {
            return "panes=" + std::to_string(leaf_count(tree));
        }

    } // namespace

    PaneWorkspace::PaneWorkspace(LayoutConfig config) : config_(std::move(config)) {}

    void PaneWorkspace::reset(const std::vector<std::string>& slot_ids) {
        focus_.clear();
        tree_        = build_grid_tree(slot_ids);
        placeholder_ = slot_ids.empty();
        if (!slot_ids.empty()) {
            focus_.record(slot_ids.front());
        }
        const auto dims = grid_dimensions(slot_ids.size());
        debug_log(config_.debug_logging, "reset", "grid=" + std::to_string(dims.cols) + "x" + std::to_string(dims.rows) + " " + describe_panes(tree_));
    }

    LayoutResult PaneWorkspace::split(std::string_view target_slot_id, std::string_view new_slot_id, std::optional<SplitDirection> direction) {
        if (!tree_) {
            return fail("split", "workspace is empty");
        }
        if (new_slot_id.empty()) {
            return fail("split", "new slot id is empty");
        }
        if (new_slot_id == kEmptySlotId) {
            return fail("split", "slot id is reserved: " + std::string(new_slot_id));
        }
        const auto resolved = direction.value_or(config_.default_direction);
        if (placeholder_) {
            if (target_slot_id != kEmptySlotId) {
                return fail("split", "slot not found: " + std::string(target_slot_id));
            }
            // The first real pane takes the placeholder's place instead of splitting it.
            placeholder_ = false;
            commit(create_leaf(std::string(new_slot_id)), "split",
                   "target=" + std::string(target_slot_id) + " new=" + std::string(new_slot_id) + " direction=" + std::string(split_direction_name(resolved)));
            focus_.record(new_slot_id);
            return {};
        }
        // split_leaf does not guard slot uniqueness; a second leaf for the same slot is refused here.
        if (contains_slot(tree_, new_slot_id)) {
            return fail("split", "slot already exists: " + std::string(new_slot_id));
        }
        auto next = split_leaf(tree_, target_slot_id, new_slot_id, resolved);
        if (next == tree_) {
            return fail("split", "slot not found: " + std::string(target_slot_id));
        }
        commit(std::move(next), "split",
               "target=" + std::string(target_slot_id) + " new=" + std::string(new_slot_id) + " direction=" + std::string(split_direction_name(resolved)));
        focus_.record(new_slot_id);
        return {};
    }

    LayoutResult PaneWorkspace::close(std::string_view slot_id) {
        if (!tree_ || placeholder_) {
            return fail("close", "workspace is empty");
        }
        auto next = remove_leaf(tree_, slot_id);
        if (next == tree_) {
            return fail("close", "slot not found: " + std::string(slot_id));
        }

        const auto focused     = focus_.current();
        const bool was_focused = focused && *focused == slot_id;
        const auto sibling     = was_focused ? find_sibling_slot_id(tree_, slot_id) : std::nullopt;

        commit(std::move(next), "close", "slot=" + std::string(slot_id));
        focus_.forget(slot_id);
        if (!was_focused || !tree_) {
            return {};
        }
        if (sibling) {
            focus_.record(*sibling);
            return {};
        }
        const auto remaining = collect_slot_ids(tree_);
        if (!remaining.empty()) {
            focus_.record(remaining.front());
        }
        return {};
    }

    LayoutResult PaneWorkspace::resize(std::string_view node_id, float ratio) {
        const auto node = find_node(tree_, node_id);
        if (!node || !node->is_split()) {
            return fail("resize", "split not found: " + std::string(node_id));
        }
        commit(update_ratio(tree_, node_id, ratio), "resize", "node=" + std::string(node_id) + " ratio=" + std::to_string(ratio));
        return {};
    }

    LayoutResult PaneWorkspace::focus(std::string_view slot_id) {
        if (!has_slot(slot_id)) {
            return fail("focus", "slot not found: " + std::string(slot_id));
        }
        focus_.record(slot_id);
        return {};
    }

    LayoutResult PaneWorkspace::focus_index(int index) {
        if (index < 1 || index > config_.quick_slot_count) {
            return fail("focus", "index out of range: " + std::to_string(index));
        }
        const auto ids = slot_ids();
        if (static_cast<std::size_t>(index) > ids.size()) {
            return fail("focus", "no pane at index " + std::to_string(index));
        }
        focus_.record(ids[static_cast<std::size_t>(index) - 1]);
        return {};
    }

    LayoutResult PaneWorkspace::cycle_focus(CycleDirection direction) {
        const auto ids = slot_ids();
        if (ids.empty()) {
            return fail("focus", "workspace is empty");
        }
        const auto current = focus_.current();
        const auto it      = current ? std::find(ids.begin(), ids.end(), *current) : ids.end();
        if (it == ids.end()) {
            focus_.record(direction == CycleDirection::kNext ? ids.front() : ids.back());
            return {};
        }

        const auto last     = ids.size() - 1;
        auto       position = static_cast<std::size_t>(it - ids.begin());
        if (direction == CycleDirection::kNext) {
            if (position < last) {
                ++position;
            } else if (config_.wrap_focus) {
                position = 0;
            }
        } else {
            if (position > 0) {
                --position;
            } else if (config_.wrap_focus) {
                position = last;
            }
        }
        focus_.record(ids[position]);
        return {};
    }

    LayoutResult PaneWorkspace::focus_last() {
        const auto previous = focus_.previous();
        if (!previous || !has_slot(*previous)) {
            return fail("focus", "no previous pane");
        }
        focus_.record(*previous);
        return {};
    }

    LayoutResult PaneWorkspace::focus_sibling() {
        const auto current = focus_.current();
        if (!current) {
            return fail("focus", "no focused pane");
        }
        const auto sibling = find_sibling_slot_id(tree_, *current);
        if (!sibling) {
            return fail("focus", "no sibling pane");
        }
        focus_.record(*sibling);
        return {};
    }

    LayoutResult PaneWorkspace::apply(const PaneCommand& command) {
        switch (command.kind) {
            case PaneCommandKind::kSplit:
                if (!command.slot_id || !command.new_slot_id) {
                    return fail("apply", "split requires target and new slot ids");
                }
                return split(*command.slot_id, *command.new_slot_id, command.direction);
            case PaneCommandKind::kClose:
                if (!command.slot_id) {
                    return fail("apply", "close requires a slot id");
                }
                return close(*command.slot_id);
            case PaneCommandKind::kResize:
                if (!command.node_id || !command.ratio) {
                    return fail("apply", "resize requires node id and ratio");
                }
                return resize(*command.node_id, *command.ratio);
            case PaneCommandKind::kFocusSlot:
                if (!command.slot_id) {
                    return fail("apply", "focus requires a slot id");
                }
                return focus(*command.slot_id);
            case PaneCommandKind::kFocusIndex:
                if (!command.index) {
                    return fail("apply", "focus index requires an index");
                }
                return focus_index(*command.index);
            case PaneCommandKind::kFocusNext: return cycle_focus(CycleDirection::kNext);
            case PaneCommandKind::kFocusPrevious: return cycle_focus(CycleDirection::kPrev);
            case PaneCommandKind::kFocusLast: return focus_last();
            case PaneCommandKind::kFocusSibling: return focus_sibling();
        }
        return fail("apply", "unknown command");
    }

    const PaneTree& PaneWorkspace::tree() const {
        return tree_;
    }

    std::optional<std::string> PaneWorkspace::focused() const {
        return focus_.current();
    }

    std::vector<std::string> PaneWorkspace::slot_ids() const {
        if (placeholder_) {
            return {};
        }
        return collect_slot_ids(tree_);
    }

    bool PaneWorkspace::empty() const {
        return tree_ == nullptr;
    }

    bool PaneWorkspace::showing_placeholder() const {
        return placeholder_;
    }

    const LayoutConfig& PaneWorkspace::config() const {
        return config_;
    }

    LayoutResult PaneWorkspace::fail(std::string_view context, std::string message) const {
        error_log(context, message);
        return std::unexpected(LayoutError{.context = std::string(context), .message = std::move(message)});
    }

    bool PaneWorkspace::has_slot(std::string_view slot_id) const {
        return !placeholder_ && contains_slot(tree_, slot_id);
    }

    void PaneWorkspace::commit(PaneTree next, std::string_view context, std::string_view detail) {
        tree_ = std::move(next);
        debug_log(config_.debug_logging, context, std::string(detail) + " " + describe_panes(tree_));
    }

} // namespace panelayout
