#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "panelayout/grid_layout.hpp"

namespace {

    using panelayout::GridDimensions;
    using panelayout::SplitDirection;

    std::vector<std::string> make_slots(int count) {
        std::vector<std::string> slots;
        for (int i = 0; i < count; ++i) {
            slots.push_back("slot-" + std::to_string(i + 1));
        }
        return slots;
    }

    // Share of the full area a leaf receives when ratios are applied along the path.
    float leaf_share(const panelayout::PaneTree& tree, const std::string& slot_id, SplitDirection axis) {
        if (tree->is_leaf()) {
            return tree->slot_id == slot_id ? 1.f : 0.f;
        }
        const float first_share  = tree->direction == axis ? tree->ratio : 1.f;
        const float second_share = tree->direction == axis ? 1.f - tree->ratio : 1.f;
        return first_share * leaf_share(tree->first, slot_id, axis) + second_share * leaf_share(tree->second, slot_id, axis);
    }

} // namespace

TEST(GridDimensions, MatchesLegacyTable) {
    EXPECT_EQ(panelayout::grid_dimensions(1), (GridDimensions{.cols = 1, .rows = 1}));
    EXPECT_EQ(panelayout::grid_dimensions(2), (GridDimensions{.cols = 2, .rows = 1}));
    EXPECT_EQ(panelayout::grid_dimensions(3), (GridDimensions{.cols = 3, .rows = 1}));
    EXPECT_EQ(panelayout::grid_dimensions(4), (GridDimensions{.cols = 2, .rows = 2}));
    EXPECT_EQ(panelayout::grid_dimensions(5), (GridDimensions{.cols = 3, .rows = 2}));
    EXPECT_EQ(panelayout::grid_dimensions(6), (GridDimensions{.cols = 3, .rows = 2}));
    EXPECT_EQ(panelayout::grid_dimensions(7), (GridDimensions{.cols = 3, .rows = 3}));
    EXPECT_EQ(panelayout::grid_dimensions(8), (GridDimensions{.cols = 3, .rows = 3}));
    EXPECT_EQ(panelayout::grid_dimensions(9), (GridDimensions{.cols = 3, .rows = 3}));
    EXPECT_EQ(panelayout::grid_dimensions(12), (GridDimensions{.cols = 3, .rows = 3}));
}

TEST(GridDimensions, TreatsZeroAsSinglePane) {
    EXPECT_EQ(panelayout::grid_dimensions(0), (GridDimensions{.cols = 1, .rows = 1}));
}

TEST(BalancedSplit, ReturnsNullForNoNodes) {
    EXPECT_EQ(panelayout::build_balanced_split({}, SplitDirection::kVertical), nullptr);
}

TEST(BalancedSplit, ReturnsSingleNodeUnwrapped) {
    const auto leaf = panelayout::create_leaf("a");

    EXPECT_EQ(panelayout::build_balanced_split({leaf}, SplitDirection::kVertical), leaf);
}

TEST(BalancedSplit, GivesFirstHalfTheLargerShare) {
    const std::vector<panelayout::PaneTree> nodes = {
        panelayout::create_leaf("a"),
        panelayout::create_leaf("b"),
        panelayout::create_leaf("c"),
    };

    const auto tree = panelayout::build_balanced_split(nodes, SplitDirection::kVertical);

    ASSERT_TRUE(tree->is_split());
    EXPECT_EQ(tree->direction, SplitDirection::kVertical);
    EXPECT_FLOAT_EQ(tree->ratio, 2.f / 3.f);
    ASSERT_TRUE(tree->first->is_split());
    EXPECT_FLOAT_EQ(tree->first->ratio, 0.5f);
    EXPECT_EQ(tree->second, nodes[2]);
    EXPECT_EQ(panelayout::collect_slot_ids(tree), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(BalancedSplit, GivesEveryLeafEqualSpace) {
    std::vector<panelayout::PaneTree> nodes;
    for (const auto& slot : make_slots(5)) {
        nodes.push_back(panelayout::create_leaf(slot));
    }

    const auto tree = panelayout::build_balanced_split(nodes, SplitDirection::kHorizontal);

    for (const auto& slot : make_slots(5)) {
        EXPECT_NEAR(leaf_share(tree, slot, SplitDirection::kHorizontal), 0.2f, 1e-5f) << slot;
    }
}

TEST(GridTree, EmptyInputBuildsPlaceholder) {
    const auto tree = panelayout::build_grid_tree({});

    ASSERT_TRUE(tree);
    ASSERT_TRUE(tree->is_leaf());
    EXPECT_EQ(tree->slot_id, "empty");
}

TEST(GridTree, SingleSlotBuildsLeaf) {
    const auto tree = panelayout::build_grid_tree({"a"});

    ASSERT_TRUE(tree->is_leaf());
    EXPECT_EQ(tree->slot_id, "a");
}

TEST(GridTree, PreservesOrder) {
    const auto tree = panelayout::build_grid_tree({"a", "b", "c", "d"});

    EXPECT_EQ(panelayout::collect_slot_ids(tree), (std::vector<std::string>{"a", "b", "c", "d"}));
}

TEST(GridTree, StacksRowsOfSideBySidePanes) {
    const auto tree = panelayout::build_grid_tree({"a", "b", "c", "d"});

    ASSERT_TRUE(tree->is_split());
    EXPECT_EQ(tree->direction, SplitDirection::kHorizontal);
    EXPECT_FLOAT_EQ(tree->ratio, 0.5f);
    ASSERT_TRUE(tree->first->is_split());
    EXPECT_EQ(tree->first->direction, SplitDirection::kVertical);
    EXPECT_EQ(panelayout::collect_slot_ids(tree->first), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(panelayout::collect_slot_ids(tree->second), (std::vector<std::string>{"c", "d"}));
}

TEST(GridTree, TwoSlotsFormOneRow) {
    const auto tree = panelayout::build_grid_tree({"a", "b"});

    ASSERT_TRUE(tree->is_split());
    EXPECT_EQ(tree->direction, SplitDirection::kVertical);
    EXPECT_FLOAT_EQ(tree->ratio, 0.5f);
}

TEST(GridTree, ShortLastRow) {
    const auto tree = panelayout::build_grid_tree(make_slots(5));

    ASSERT_TRUE(tree->is_split());
    EXPECT_EQ(tree->direction, SplitDirection::kHorizontal);
    EXPECT_EQ(panelayout::leaf_count(tree->first), 3u);
    EXPECT_EQ(panelayout::leaf_count(tree->second), 2u);
    EXPECT_EQ(panelayout::collect_slot_ids(tree), make_slots(5));
}

TEST(GridTree, NineSlotsGiveEqualRows) {
    const auto tree = panelayout::build_grid_tree(make_slots(9));

    for (const auto& slot : make_slots(9)) {
        EXPECT_NEAR(leaf_share(tree, slot, SplitDirection::kHorizontal), 1.f / 3.f, 1e-5f) << slot;
        EXPECT_NEAR(leaf_share(tree, slot, SplitDirection::kVertical), 1.f / 3.f, 1e-5f) << slot;
    }
}

TEST(GridTree, LastRowAbsorbsOverflow) {
    const auto slots = make_slots(12);

    const auto tree = panelayout::build_grid_tree(slots);

    EXPECT_EQ(panelayout::collect_slot_ids(tree), slots);
    EXPECT_NEAR(leaf_share(tree, "slot-12", SplitDirection::kVertical), 1.f / 6.f, 1e-5f);
    EXPECT_NEAR(leaf_share(tree, "slot-1", SplitDirection::kVertical), 1.f / 3.f, 1e-5f);
}
