#ifndef PANELAYOUT_SPLIT_TREE_HPP
#define PANELAYOUT_SPLIT_TREE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "panelayout/node_id.hpp"

namespace panelayout {

    // kHorizontal stacks children top/bottom, kVertical places them side by side.
    enum class SplitDirection {
        kHorizontal,
        kVertical,
    };

    enum class PaneNodeKind {
        kLeaf,
        kSplit,
    };

    struct PaneNode;

    // Nodes are shared between tree versions and never mutated once built.
    // A null PaneTree is the empty workspace.
    using PaneTree = std::shared_ptr<const PaneNode>;

    struct PaneNode {
        PaneNodeKind   kind = PaneNodeKind::kLeaf;
        NodeId         id;
        std::string    slot_id;
        SplitDirection direction = SplitDirection::kVertical;
        float          ratio     = 0.5f;
        PaneTree       first;
        PaneTree       second;

        bool           is_leaf() const {
            return kind == PaneNodeKind::kLeaf;
        }
        bool is_split() const {
            return kind == PaneNodeKind::kSplit;
        }
    };

    inline constexpr std::string_view kEmptySlotId       = "empty";
    inline constexpr float            kDefaultSplitRatio = 0.5f;

    std::string_view                  split_direction_name(SplitDirection direction);
    std::optional<SplitDirection>     parse_split_direction(std::string_view value);

    PaneTree                          create_leaf(std::string slot_id);
    PaneTree                          make_split(SplitDirection direction, PaneTree first, PaneTree second, float ratio);

    // Replaces the leaf holding target_slot_id with a 50/50 split of (leaf, new leaf).
    // Returns `tree` itself when the target is absent. new_slot_id is not checked
    // for duplicates here.
    PaneTree split_leaf(const PaneTree& tree, std::string_view target_slot_id, std::string_view new_slot_id, SplitDirection direction);

    // Removes the leaf and promotes its sibling into the parent's position.
    // Returns null when the last leaf goes away, `tree` itself when slot_id is absent.
    PaneTree                   remove_leaf(const PaneTree& tree, std::string_view slot_id);

    // Ratio is stored as given, without clamping.
    PaneTree                   update_ratio(const PaneTree& tree, std::string_view node_id, float ratio);

    std::vector<std::string>   collect_slot_ids(const PaneTree& tree);
    std::optional<std::string> find_sibling_slot_id(const PaneTree& tree, std::string_view slot_id);

    bool                       contains_slot(const PaneTree& tree, std::string_view slot_id);
    std::size_t                leaf_count(const PaneTree& tree);
    PaneTree                   find_node(const PaneTree& tree, std::string_view node_id);
    bool                       same_layout(const PaneTree& lhs, const PaneTree& rhs);

} // namespace panelayout

#endif // PANELAYOUT_SPLIT_TREE_HPP
