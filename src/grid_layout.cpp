#include "panelayout/grid_layout.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace panelayout {

    namespace {

        PaneTree balanced_range(std::vector<PaneTree>::const_iterator begin, std::vector<PaneTree>::const_iterator end, SplitDirection direction) {
            const auto count = static_cast<std::size_t>(end - begin);
            if (count == 1) {
                return *begin;
            }
            const std::size_t mid   = (count + 1) / 2;
            auto              first = balanced_range(begin, begin + static_cast<std::ptrdiff_t>(mid), direction);
            auto              rest  = balanced_range(begin + static_cast<std::ptrdiff_t>(mid), end, direction);
            return make_split(direction, std::move(first), std::move(rest), static_cast<float>(mid) / static_cast<float>(count));
        }

    } // namespace

    GridDimensions grid_dimensions(std::size_t count) {
        if (count <= 1) {
            return GridDimensions{.cols = 1, .rows = 1};
        }
        if (count == 2) {
            return GridDimensions{.cols = 2, .rows = 1};
        }
        if (count == 3) {
            return GridDimensions{.cols = 3, .rows = 1};
        }
        if (count == 4) {
            return GridDimensions{.cols = 2, .rows = 2};
        }
        if (count <= 6) {
            return GridDimensions{.cols = 3, .rows = 2};
        }
        return GridDimensions{.cols = 3, .rows = 3};
    }

    PaneTree build_balanced_split(const std::vector<PaneTree>& nodes, SplitDirection direction) {
        if (nodes.empty()) {
            return nullptr;
        }
        return balanced_range(nodes.begin(), nodes.end(), direction);
    }

    PaneTree build_grid_tree(const std::vector<std::string>& slot_ids) {
        if (slot_ids.empty()) {
            return create_leaf(std::string(kEmptySlotId));
        }
        if (slot_ids.size() == 1) {
            return create_leaf(slot_ids.front());
        }

        const auto            dims = grid_dimensions(slot_ids.size());
        const auto            cols = static_cast<std::size_t>(dims.cols);
        const auto            rows = static_cast<std::size_t>(dims.rows);

        std::vector<PaneTree> row_nodes;
        row_nodes.reserve(rows);
        for (std::size_t row = 0; row < rows; ++row) {
            const std::size_t start = row * cols;
            if (start >= slot_ids.size()) {
                break;
            }
            const bool            last_row = row + 1 == rows;
            const std::size_t     end      = last_row ? slot_ids.size() : std::min(start + cols, slot_ids.size());

            std::vector<PaneTree> leaves;
            leaves.reserve(end - start);
            for (std::size_t index = start; index < end; ++index) {
                leaves.push_back(create_leaf(slot_ids[index]));
            }
            row_nodes.push_back(build_balanced_split(leaves, SplitDirection::kVertical));
        }

        return build_balanced_split(row_nodes, SplitDirection::kHorizontal);
    }

} // namespace panelayout
