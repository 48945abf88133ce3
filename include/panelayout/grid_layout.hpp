#ifndef PANELAYOUT_GRID_LAYOUT_HPP
#define PANELAYOUT_GRID_LAYOUT_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "panelayout/split_tree.hpp"

namespace panelayout {

    struct GridDimensions {
        int cols = 1;
        int rows = 1;

        bool operator==(const GridDimensions&) const = default;
    };

    // Fixed legacy table: 1->1x1, 2->2x1, 3->3x1, 4->2x2, 5-6->3x2, 7+->3x3.
    GridDimensions grid_dimensions(std::size_t count);

    // Halves `nodes` (first half gets ceil(n/2)) until single nodes remain. Each
    // split's ratio is its first-half share so every input gets equal space.
    PaneTree build_balanced_split(const std::vector<PaneTree>& nodes, SplitDirection direction);

    // Rows of side-by-side panes stacked top to bottom. The last row takes any
    // slots beyond the table's capacity.
    PaneTree build_grid_tree(const std::vector<std::string>& slot_ids);

} // namespace panelayout

#endif // PANELAYOUT_GRID_LAYOUT_HPP
