/**
 * @file ForceModel.cpp
 * @brief Link, many-body (Barnes-Hut), centering and collision forces.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "ForceModel.h"

#include <algorithm>
#include <cmath>

namespace {
inline bool finite2(double a, double b) { return std::isfinite(a) && std::isfinite(b); }

inline void addVelocity(SimNode& n, double dx, double dy) {
    if (!finite2(dx, dy)) return;
    n.vx += dx;
    n.vy += dy;
}
}

ForceModel::ForceModel(uint32_t seed) : prng(seed) {}

double ForceModel::jiggle() {
    return (unit(prng) - 0.5) * 1e-6;
}

void ForceModel::apply(std::vector<SimNode>& nodes, const std::vector<SimLink>& links,
                       const LayoutConfig& cfg, double alpha) {
    if (nodes.empty()) return;
    applyLinks(nodes, links, cfg, alpha);
    applyRepulsion(nodes, cfg, alpha);
    applyCentering(nodes, cfg);
    applyCollisions(nodes, cfg);
}

size_t ForceModel::sanitize(std::vector<SimNode>& nodes) {
    size_t fixedUp = 0;
    auto fix = [&](double& v) { if (!std::isfinite(v)) { v = 0.0; ++fixedUp; } };
    for (auto& n : nodes) { fix(n.x); fix(n.y); fix(n.vx); fix(n.vy); }
    return fixedUp;
}

void ForceModel::computeBias(std::vector<SimLink>& links, size_t nodeCount) {
    std::vector<int> degree(nodeCount, 0);
    for (auto& l : links) { ++degree[l.source]; ++degree[l.target]; }
    for (auto& l : links) {
        double s = degree[l.source], t = degree[l.target];
        l.bias = s / (s + t);
    }
}

void ForceModel::applyLinks(std::vector<SimNode>& nodes, const std::vector<SimLink>& links,
                            const LayoutConfig& cfg, double alpha) {
    for (const auto& l : links) {
        SimNode& s = nodes[l.source];
        SimNode& t = nodes[l.target];
        double x = t.x + t.vx - s.x - s.vx;
        double y = t.y + t.vy - s.y - s.vy;
        if (x == 0.0) x = jiggle();
        if (y == 0.0) y = jiggle();
        double len = std::sqrt(x * x + y * y);
        double k = (len - cfg.distanceFor(l.kind)) / len * alpha * cfg.strengthFor(l.kind);
        x *= k; y *= k;
        addVelocity(t, -x * l.bias, -y * l.bias);
        addVelocity(s, x * (1.0 - l.bias), y * (1.0 - l.bias));
    }
}

void ForceModel::applyRepulsion(std::vector<SimNode>& nodes, const LayoutConfig& cfg, double alpha) {
    const size_t n = nodes.size();
    scratchPoints.resize(n);
    scratchValues.resize(n);
    for (size_t i = 0; i < n; ++i) {
        // A node with a non-finite position takes part with zero strength.
        bool ok = finite2(nodes[i].x, nodes[i].y);
        scratchPoints[i] = ok ? QuadTree::Point{nodes[i].x, nodes[i].y} : QuadTree::Point{0.0, 0.0};
        scratchValues[i] = ok ? cfg.repulsionFor(nodes[i].kind) : 0.0;
    }
    chargeTree.build(scratchPoints);
    chargeTree.accumulateCharge(scratchValues);

    const double theta2 = cfg.theta * cfg.theta;
    const double dmin2 = cfg.distanceMin * cfg.distanceMin;
    const auto& order = chargeTree.order();

    for (size_t i = 0; i < n; ++i) {
        SimNode& node = nodes[i];
        const double xi = node.x, yi = node.y;
        double ax = 0.0, ay = 0.0;
        chargeTree.visit([&](const QuadTree::Cell& c) {
            if (c.value == 0.0) return true;
            double dx = c.cx - xi, dy = c.cy - yi;
            double w = c.width();
            double l = dx * dx + dy * dy;
            // Far enough: treat the whole cell as one body at its centroid.
            if (theta2 > 0.0 && w * w < l * theta2) {
                if (l < dmin2) l = std::sqrt(dmin2 * l);
                ax += dx * c.value * alpha / l;
                ay += dy * c.value * alpha / l;
                return true;
            }
            if (!c.leaf()) return false;
            for (int k = c.first; k < c.first + c.count; ++k) {
                int j = order[(size_t)k];
                if ((size_t)j == i) continue;
                const QuadTree::Point& p = chargeTree.point(j);
                double px = p.x - xi, py = p.y - yi;
                if (px == 0.0) px = jiggle();
                if (py == 0.0) py = jiggle();
                double lj = px * px + py * py;
                if (lj < dmin2) lj = std::sqrt(dmin2 * lj);
                double f = scratchValues[(size_t)j] * alpha / lj;
                ax += px * f;
                ay += py * f;
            }
            return true;
        });
        addVelocity(node, ax, ay);
    }
}

void ForceModel::applyCentering(std::vector<SimNode>& nodes, const LayoutConfig& cfg) {
    if (nodes.empty() || cfg.centerStrength == 0.0) return;
    double sx = 0.0, sy = 0.0;
    size_t counted = 0;
    for (auto& nd : nodes) {
        if (!finite2(nd.x, nd.y)) continue;
        sx += nd.x; sy += nd.y; ++counted;
    }
    if (counted == 0) return;
    sx = sx / (double)counted * cfg.centerStrength;
    sy = sy / (double)counted * cfg.centerStrength;
    if (!finite2(sx, sy)) return;
    for (auto& nd : nodes) { nd.x -= sx; nd.y -= sy; }
}

void ForceModel::applyCollisions(std::vector<SimNode>& nodes, const LayoutConfig& cfg) {
    if (cfg.collisionStrength == 0.0) return;
    const size_t n = nodes.size();
    scratchPoints.resize(n);
    scratchValues.resize(n);
    for (size_t i = 0; i < n; ++i) {
        // Collide on predicted positions so this iteration's velocity is already accounted for.
        double px = nodes[i].x + nodes[i].vx, py = nodes[i].y + nodes[i].vy;
        bool ok = finite2(px, py);
        scratchPoints[i] = ok ? QuadTree::Point{px, py} : QuadTree::Point{0.0, 0.0};
        scratchValues[i] = ok ? std::max(0.0, nodes[i].radius) + cfg.collisionPadding : 0.0;
    }
    collideTree.build(scratchPoints);
    collideTree.accumulateRadius(scratchValues);
    const auto& order = collideTree.order();

    for (size_t i = 0; i < n; ++i) {
        SimNode& node = nodes[i];
        const double ri = scratchValues[i];
        const double ri2 = ri * ri;
        const double xi = node.x + node.vx, yi = node.y + node.vy;
        if (!finite2(xi, yi)) continue;
        collideTree.visit([&](const QuadTree::Cell& c) {
            const double reach = ri + c.maxRadius;
            if (c.x0 > xi + reach || c.x1 < xi - reach || c.y0 > yi + reach || c.y1 < yi - reach) return true;
            if (!c.leaf()) return false;
            for (int k = c.first; k < c.first + c.count; ++k) {
                size_t j = (size_t)order[(size_t)k];
                // Each pair is resolved once, by its lower index.
                if (j <= i) continue;
                SimNode& other = nodes[j];
                double rj = scratchValues[j];
                double r = ri + rj;
                double x = xi - other.x - other.vx;
                double y = yi - other.y - other.vy;
                double l = x * x + y * y;
                if (!(l < r * r)) continue;
                if (x == 0.0) { x = jiggle(); l += x * x; }
                if (y == 0.0) { y = jiggle(); l += y * y; }
                l = std::sqrt(l);
                l = (r - l) / l * cfg.collisionStrength;
                x *= l; y *= l;
                double rj2 = rj * rj;
                double share = rj2 / (ri2 + rj2);
                addVelocity(node, x * share, y * share);
                addVelocity(other, -x * (1.0 - share), -y * (1.0 - share));
            }
            return true;
        });
    }
}
