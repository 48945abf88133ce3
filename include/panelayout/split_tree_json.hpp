#ifndef PANELAYOUT_SPLIT_TREE_JSON_HPP
#define PANELAYOUT_SPLIT_TREE_JSON_HPP

#include <optional>
#include <string>
#include <string_view>

#include "panelayout/split_tree.hpp"

namespace panelayout {

    // Wire format for handing the live tree to an out-of-process renderer:
    //   {"version":1,"root":<node|null>}
    //   leaf:  {"type":"leaf","id":...,"slot_id":...}
    //   split: {"type":"split","id":...,"direction":...,"ratio":...,"children":[<node>,<node>]}
    std::optional<std::string> pane_tree_to_json(const PaneTree& tree, std::string* error);

    // Decoded nodes get fresh ids so they can never alias nodes of a live tree.
    std::optional<PaneTree> pane_tree_from_json(std::string_view json_text, std::string* error);

} // namespace panelayout

#endif // PANELAYOUT_SPLIT_TREE_JSON_HPP
