/**
 * @file QuadTree.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "QuadTree.h"

#include <algorithm>
#include <cmath>

void QuadTree::build(const std::vector<Point>& pts) {
    cells.clear();
    points = pts;
    pointOrder.resize(points.size());
    for (size_t i = 0; i < points.size(); ++i) pointOrder[i] = (int)i;
    if (points.empty()) return;

    double minx = points[0].x, maxx = points[0].x, miny = points[0].y, maxy = points[0].y;
    for (auto& p : points) {
        minx = std::min(minx, p.x); maxx = std::max(maxx, p.x);
        miny = std::min(miny, p.y); maxy = std::max(maxy, p.y);
    }
    // Square extent so cell width is meaningful for the opening criterion.
    double side = std::max(maxx - minx, maxy - miny);
    if (!(side > 0.0)) side = 1.0;
    cells.reserve(points.size() * 2 + 1);
    buildCell(0, (int)points.size(), minx, miny, minx + side, miny + side, 0);
}

bool QuadTree::allCoincident(int lo, int hi) const {
    const Point& a = points[(size_t)pointOrder[(size_t)lo]];
    for (int k = lo + 1; k < hi; ++k) {
        const Point& b = points[(size_t)pointOrder[(size_t)k]];
        if (b.x != a.x || b.y != a.y) return false;
    }
    return true;
}

int QuadTree::buildCell(int lo, int hi, double x0, double y0, double x1, double y1, int depth) {
    int idx = (int)cells.size();
    Cell c{};
    c.x0 = x0; c.y0 = y0; c.x1 = x1; c.y1 = y1;
    cells.push_back(c);
    if (hi - lo <= 1 || depth >= MaxDepth || allCoincident(lo, hi)) {
        cells[(size_t)idx].first = lo;
        cells[(size_t)idx].count = hi - lo;
        return idx;
    }
    const double mx = 0.5 * (x0 + x1), my = 0.5 * (y0 + y1);
    auto begin = pointOrder.begin();
    auto below = [&](int i) { return points[(size_t)i].y < my; };
    auto left = [&](int i) { return points[(size_t)i].x < mx; };
    // Quadrants: 0 = top-left, 1 = top-right, 2 = bottom-left, 3 = bottom-right (y grows downward).
    int midY = (int)(std::partition(begin + lo, begin + hi, below) - begin);
    int midX0 = (int)(std::partition(begin + lo, begin + midY, left) - begin);
    int midX1 = (int)(std::partition(begin + midY, begin + hi, left) - begin);
    const int bounds[4][2] = { {lo, midX0}, {midX0, midY}, {midY, midX1}, {midX1, hi} };
    for (int q = 0; q < 4; ++q) {
        int a = bounds[q][0], b = bounds[q][1];
        if (a >= b) continue;
        double qx0 = (q & 1) ? mx : x0, qx1 = (q & 1) ? x1 : mx;
        double qy0 = (q & 2) ? my : y0, qy1 = (q & 2) ? y1 : my;
        int child = buildCell(a, b, qx0, qy0, qx1, qy1, depth + 1);
        cells[(size_t)idx].child[q] = child;
    }
    return idx;
}

void QuadTree::accumulateCharge(const std::vector<double>& strength) {
    // Children follow their parent in the array, so a reverse sweep is a post-order pass.
    for (size_t n = cells.size(); n-- > 0;) {
        Cell& c = cells[n];
        double value = 0.0, weight = 0.0, sx = 0.0, sy = 0.0;
        if (c.leaf()) {
            for (int k = c.first; k < c.first + c.count; ++k) {
                int i = pointOrder[(size_t)k];
                double s = strength[(size_t)i];
                double w = std::fabs(s);
                value += s; weight += w;
                sx += w * points[(size_t)i].x; sy += w * points[(size_t)i].y;
            }
        } else {
            for (int q = 0; q < 4; ++q) {
                if (c.child[q] < 0) continue;
                const Cell& ch = cells[(size_t)c.child[q]];
                double w = std::fabs(ch.value);
                value += ch.value; weight += w;
                sx += w * ch.cx; sy += w * ch.cy;
            }
        }
        c.value = value;
        if (weight > 0.0) { c.cx = sx / weight; c.cy = sy / weight; }
        else { c.cx = 0.5 * (c.x0 + c.x1); c.cy = 0.5 * (c.y0 + c.y1); }
    }
}

void QuadTree::accumulateRadius(const std::vector<double>& radius) {
    for (size_t n = cells.size(); n-- > 0;) {
        Cell& c = cells[n];
        double r = 0.0;
        if (c.leaf()) {
            for (int k = c.first; k < c.first + c.count; ++k) r = std::max(r, radius[(size_t)pointOrder[(size_t)k]]);
        } else {
            for (int q = 0; q < 4; ++q) if (c.child[q] >= 0) r = std::max(r, cells[(size_t)c.child[q]].maxRadius);
        }
        c.maxRadius = r;
    }
}
