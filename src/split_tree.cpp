#include "panelayout/split_tree.hpp"

#include <utility>

#include "panelayout/strings.hpp"

namespace panelayout {

    namespace {

        PaneTree with_children(const PaneTree& split, PaneTree first, PaneTree second) {
            auto copy    = std::make_shared<PaneNode>(*split);
            copy->first  = std::move(first);
            copy->second = std::move(second);
            return copy;
        }

        bool is_leaf_for(const PaneTree& node, std::string_view slot_id) {
            return node && node->is_leaf() && node->slot_id == slot_id;
        }

        void append_slot_ids(const PaneNode& node, std::vector<std::string>* out) {
            if (node.is_leaf()) {
                out->push_back(node.slot_id);
                return;
            }
            if (node.first) {
                append_slot_ids(*node.first, out);
            }
            if (node.second) {
                append_slot_ids(*node.second, out);
            }
        }

        std::optional<std::string> first_slot_id(const PaneTree& tree) {
            const PaneNode* node = tree.get();
            while (node && node->is_split()) {
                node = node->first ? node->first.get() : node->second.get();
            }
            if (!node) {
                return std::nullopt;
            }
            return node->slot_id;
        }

    } // namespace

    std::string_view split_direction_name(SplitDirection direction) {
        switch (direction) {
            case SplitDirection::kHorizontal: return "horizontal";
            case SplitDirection::kVertical: return "vertical";
        }
        return "vertical";
    }

    std::optional<SplitDirection> parse_split_direction(std::string_view value) {
        const auto lowered = to_lower_copy(trim_view(value));
        if (lowered == "horizontal" || lowered == "h") {
            return SplitDirection::kHorizontal;
        }
        if (lowered == "vertical" || lowered == "v") {
            return SplitDirection::kVertical;
        }
        return std::nullopt;
    }

    PaneTree create_leaf(std::string slot_id) {
        auto leaf     = std::make_shared<PaneNode>();
        leaf->kind    = PaneNodeKind::kLeaf;
        leaf->id      = next_node_id();
        leaf->slot_id = std::move(slot_id);
        return leaf;
    }

    PaneTree make_split(SplitDirection direction, PaneTree first, PaneTree second, float ratio) {
        auto split       = std::make_shared<PaneNode>();
        split->kind      = PaneNodeKind::kSplit;
        split->id        = next_node_id();
        split->direction = direction;
        split->ratio     = ratio;
        split->first     = std::move(first);
        split->second    = std::move(second);
        return split;
    }

    PaneTree split_leaf(const PaneTree& tree, std::string_view target_slot_id, std::string_view new_slot_id, SplitDirection direction) {
        if (!tree) {
            return tree;
        }
        if (tree->is_leaf()) {
            if (tree->slot_id != target_slot_id) {
                return tree;
            }
            return make_split(direction, tree, create_leaf(std::string(new_slot_id)), kDefaultSplitRatio);
        }

        auto first  = split_leaf(tree->first, target_slot_id, new_slot_id, direction);
        auto second = split_leaf(tree->second, target_slot_id, new_slot_id, direction);
        if (first == tree->first && second == tree->second) {
            return tree;
        }
        return with_children(tree, std::move(first), std::move(second));
    }

    PaneTree remove_leaf(const PaneTree& tree, std::string_view slot_id) {
        if (!tree) {
            return tree;
        }
        if (tree->is_leaf()) {
            return tree->slot_id == slot_id ? nullptr : tree;
        }

        if (is_leaf_for(tree->first, slot_id)) {
            return tree->second;
        }
        if (is_leaf_for(tree->second, slot_id)) {
            return tree->first;
        }

        auto first  = remove_leaf(tree->first, slot_id);
        auto second = remove_leaf(tree->second, slot_id);
        if (!first) {
            return second;
        }
        if (!second) {
            return first;
        }
        if (first == tree->first && second == tree->second) {
            return tree;
        }
        return with_children(tree, std::move(first), std::move(second));
    }

    PaneTree update_ratio(const PaneTree& tree, std::string_view node_id, float ratio) {
        if (!tree || tree->is_leaf()) {
            return tree;
        }
        if (tree->id == node_id) {
            auto copy   = std::make_shared<PaneNode>(*tree);
            copy->ratio = ratio;
            return copy;
        }

        auto first  = update_ratio(tree->first, node_id, ratio);
        auto second = update_ratio(tree->second, node_id, ratio);
        if (first == tree->first && second == tree->second) {
            return tree;
        }
        return with_children(tree, std::move(first), std::move(second));
    }

    std::vector<std::string> collect_slot_ids(const PaneTree& tree) {
        std::vector<std::string> ids;
        if (tree) {
            append_slot_ids(*tree, &ids);
        }
        return ids;
    }

    std::optional<std::string> find_sibling_slot_id(const PaneTree& tree, std::string_view slot_id) {
        if (!tree || tree->is_leaf()) {
            return std::nullopt;
        }

        // The sibling of a direct leaf child is the first slot of the other subtree.
        if (is_leaf_for(tree->first, slot_id)) {
            return first_slot_id(tree->second);
        }
        if (is_leaf_for(tree->second, slot_id)) {
            return first_slot_id(tree->first);
        }

        if (auto found = find_sibling_slot_id(tree->first, slot_id)) {
            return found;
        }
        return find_sibling_slot_id(tree->second, slot_id);
    }

    bool contains_slot(const PaneTree& tree, std::string_view slot_id) {
        if (!tree) {
            return false;
        }
        if (tree->is_leaf()) {
            return tree->slot_id == slot_id;
        }
        return contains_slot(tree->first, slot_id) || contains_slot(tree->second, slot_id);
    }

    std::size_t leaf_count(const PaneTree& tree) {
        if (!tree) {
            return 0;
        }
        if (tree->is_leaf()) {
            return 1;
        }
        return leaf_count(tree->first) + leaf_count(tree->second);
    }

    PaneTree find_node(const PaneTree& tree, std::string_view node_id) {
        if (!tree) {
            return nullptr;
        }
        if (tree->id == node_id) {
            return tree;
        }
        if (tree->is_leaf()) {
            return nullptr;
        }
        if (auto found = find_node(tree->first, node_id)) {
            return found;
        }
        return find_node(tree->second, node_id);
    }

    bool same_layout(const PaneTree& lhs, const PaneTree& rhs) {
        if (lhs == rhs) {
            return true;
        }
        if (!lhs || !rhs) {
            return false;
        }
        if (lhs->kind != rhs->kind || lhs->id != rhs->id) {
            return false;
        }
        if (lhs->is_leaf()) {
            return lhs->slot_id == rhs->slot_id;
        }
        return lhs->direction == rhs->direction && lhs->ratio == rhs->ratio && same_layout(lhs->first, rhs->first) && same_layout(lhs->second, rhs->second);
    }

} // namespace panelayout
