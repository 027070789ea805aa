#include "QuadTree.h"

#include <gtest/gtest.h>

#include <vector>

namespace {

TEST(QuadTree, EmptyInputBuildsNoCells)
{
    QuadTree tree;
    tree.build({});
    EXPECT_TRUE(tree.empty());
    int visited = 0;
    tree.visit([&](const QuadTree::Cell&) { ++visited; return false; });
    EXPECT_EQ(visited, 0);
}

TEST(QuadTree, SinglePointIsOneLeaf)
{
    QuadTree tree;
    tree.build({{3.0, 4.0}});
    ASSERT_EQ(tree.cellsView().size(), 1u);
    const auto& root = tree.cellsView()[0];
    EXPECT_TRUE(root.leaf());
    EXPECT_EQ(root.count, 1);
}

TEST(QuadTree, FourCornersSplitIntoFourLeaves)
{
    QuadTree tree;
    tree.build({{0, 0}, {10, 0}, {0, 10}, {10, 10}});
    const auto& root = tree.cellsView()[0];
    ASSERT_FALSE(root.leaf());
    for (int q = 0; q < 4; ++q) {
        ASSERT_GE(root.child[q], 0);
        const auto& c = tree.cellsView()[(size_t)root.child[q]];
        EXPECT_TRUE(c.leaf());
        EXPECT_EQ(c.count, 1);
    }
    // Quadrant 0 is top-left, quadrant 3 bottom-right.
    const auto& tl = tree.cellsView()[(size_t)root.child[0]];
    EXPECT_EQ(tree.order()[(size_t)tl.first], 0);
    const auto& br = tree.cellsView()[(size_t)root.child[3]];
    EXPECT_EQ(tree.order()[(size_t)br.first], 3);
}

TEST(QuadTree, CoincidentPointsShareALeaf)
{
    QuadTree tree;
    tree.build({{5, 5}, {5, 5}, {5, 5}});
    ASSERT_EQ(tree.cellsView().size(), 1u);
    EXPECT_EQ(tree.cellsView()[0].count, 3);
}

TEST(QuadTree, EveryPointLandsInExactlyOneLeaf)
{
    std::vector<QuadTree::Point> pts;
    for (int i = 0; i < 200; ++i) pts.push_back({(double)((i * 37) % 101), (double)((i * 53) % 89)});
    QuadTree tree;
    tree.build(pts);
    std::vector<int> seen(pts.size(), 0);
    tree.visit([&](const QuadTree::Cell& c) {
        if (c.leaf()) {
            for (int k = c.first; k < c.first + c.count; ++k) {
                int i = tree.order()[(size_t)k];
                ++seen[(size_t)i];
                EXPECT_GE(pts[(size_t)i].x, c.x0);
                EXPECT_LE(pts[(size_t)i].x, c.x1);
                EXPECT_GE(pts[(size_t)i].y, c.y0);
                EXPECT_LE(pts[(size_t)i].y, c.y1);
            }
        }
        return false;
    });
    for (int s : seen) EXPECT_EQ(s, 1);
}

TEST(QuadTree, ChargeAggregatesAreStrengthWeighted)
{
    QuadTree tree;
    tree.build({{0, 0}, {10, 0}});
    tree.accumulateCharge({-100.0, -300.0});
    const auto& root = tree.cellsView()[0];
    EXPECT_DOUBLE_EQ(root.value, -400.0);
    EXPECT_DOUBLE_EQ(root.cx, 7.5);
    EXPECT_DOUBLE_EQ(root.cy, 0.0);
}

TEST(QuadTree, RadiusAggregateIsTheMaximum)
{
    QuadTree tree;
    tree.build({{0, 0}, {10, 0}, {0, 10}});
    tree.accumulateRadius({4.0, 9.0, 2.0});
    EXPECT_DOUBLE_EQ(tree.cellsView()[0].maxRadius, 9.0);
}

}  // namespace
