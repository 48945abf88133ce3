#ifndef PANELAYOUT_PANE_WORKSPACE_HPP
#define PANELAYOUT_PANE_WORKSPACE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "panelayout/config.hpp"
#include "panelayout/focus_history.hpp"
#include "panelayout/layout_error.hpp"
#include "panelayout/pane_command.hpp"
#include "panelayout/split_tree.hpp"

namespace panelayout {

    enum class CycleDirection {
        kNext,
        kPrev,
    };

    // Layout state of one workspace. Every mutation runs one split-tree
    // operation and swaps in its result; a failed call leaves tree and focus as
    // they were. Single writer, not thread-safe.
    //
    // reset({}) shows the "empty" placeholder leaf. The placeholder is not a
    // pane: slot_ids() leaves it out, focus never lands on it, and the first
    // split replaces it with the new slot.
    class PaneWorkspace {
      public:
        explicit PaneWorkspace(LayoutConfig config = {});

        void                       reset(const std::vector<std::string>& slot_ids);

        LayoutResult               split(std::string_view target_slot_id, std::string_view new_slot_id, std::optional<SplitDirection> direction = std::nullopt);
        LayoutResult               close(std::string_view slot_id);
        LayoutResult               resize(std::string_view node_id, float ratio);

        LayoutResult               focus(std::string_view slot_id);
        LayoutResult               focus_index(int index);
        LayoutResult               cycle_focus(CycleDirection direction);
        LayoutResult               focus_last();
        LayoutResult               focus_sibling();

        LayoutResult               apply(const PaneCommand& command);

        const PaneTree&            tree() const;
        std::optional<std::string> focused() const;
        std::vector<std::string>   slot_ids() const;
        bool                       empty() const;
        bool                       showing_placeholder() const;
        const LayoutConfig&        config() const;

      private:
        LayoutResult fail(std::string_view context, std::string message) const;
        bool         has_slot(std::string_view slot_id) const;
        void         commit(PaneTree next, std::string_view context, std::string_view detail);

        LayoutConfig config_;
        PaneTree     tree_;
        FocusHistory focus_;
        bool         placeholder_ = false;
    };

} // namespace panelayout

#endif // PANELAYOUT_PANE_WORKSPACE_HPP
