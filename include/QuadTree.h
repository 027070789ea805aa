/**
 * @file QuadTree.h
 * @brief Region quadtree over node positions, rebuilt every iteration for Barnes-Hut repulsion and collision pruning.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>
#include <vector>

/**
 * @class QuadTree
 * @brief Flat array of square cells; children are always stored after their parent.
 *
 * Leaves hold a contiguous range of point indices (more than one only for coincident points or at the depth
 * cap). Aggregates are filled on demand by accumulateCharge() and accumulateRadius().
 */
class QuadTree {
public:
    struct Point { double x; double y; };

    struct Cell {
        double x0, y0, x1, y1;  // square bounds
        double cx{0}, cy{0};    // strength-weighted centroid (after accumulateCharge)
        double value{0};        // summed strength (after accumulateCharge)
        double maxRadius{0};    // largest radius below this cell (after accumulateRadius)
        int child[4]{-1, -1, -1, -1};
        int first{0};           // leaf point range into order()
        int count{0};
        bool leaf() const { return child[0] < 0 && child[1] < 0 && child[2] < 0 && child[3] < 0; }
        double width() const { return x1 - x0; }
    };

    /** @brief Rebuild over @p pts (index-aligned with nodes). Points must be finite. */
    void build(const std::vector<Point>& pts);
    /** @brief Fill value/cx/cy from per-point strengths (index-aligned with the built points). */
    void accumulateCharge(const std::vector<double>& strength);
    /** @brief Fill maxRadius from per-point radii. */
    void accumulateRadius(const std::vector<double>& radius);

    /**
     * @brief Pre-order traversal from the root. @p fn(const Cell&) returns true to skip the cell's children.
     */
    template <class F>
    void visit(F&& fn) const {
        if (cells.empty()) return;
        stack.clear();
        stack.push_back(0);
        while (!stack.empty()) {
            int idx = stack.back();
            stack.pop_back();
            const Cell& c = cells[(size_t)idx];
            if (fn(c)) continue;
            // Push in reverse so quadrant 0 is visited first.
            for (int q = 3; q >= 0; --q) if (c.child[q] >= 0) stack.push_back(c.child[q]);
        }
    }

    const std::vector<Cell>& cellsView() const { return cells; }
    /** @brief Point indices; a leaf's points are order()[first, first+count). */
    const std::vector<int>& order() const { return pointOrder; }
    const Point& point(int i) const { return points[(size_t)i]; }
    bool empty() const { return cells.empty(); }
    void clear() { cells.clear(); pointOrder.clear(); points.clear(); }

    static constexpr int MaxDepth = 32;

private:
    int buildCell(int lo, int hi, double x0, double y0, double x1, double y1, int depth);
    bool allCoincident(int lo, int hi) const;

    std::vector<Cell> cells;
    std::vector<int> pointOrder;
    std::vector<Point> points;
    mutable std::vector<int> stack;
};
