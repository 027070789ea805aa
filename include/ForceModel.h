/**
 * @file ForceModel.h
 * @brief Per-iteration forces of the layout: link springs, many-body repulsion, centering and collision.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "GraphTypes.h"
#include "LayoutConfig.h"
#include "QuadTree.h"

/**
 * @struct SimNode
 * @brief Engine-owned arena entry for one node. Addressed by its index, never by pointer.
 */
struct SimNode {
    std::string id;
    NodeKind kind{NodeKind::Minor};
    std::string group;
    double radius{1.0};
    double x{0}, y{0};
    double vx{0}, vy{0};
    std::optional<double> fx;
    std::optional<double> fy;
};

/** @struct SimLink @brief Link with endpoints resolved to arena indices at init. */
struct SimLink {
    size_t source{0};
    size_t target{0};
    LinkKind kind{LinkKind::Subfeature};
    double bias{0.5}; // share of the spring displacement applied to the target
};

/**
 * @class ForceModel
 * @brief Adds one iteration's displacement into node velocities.
 *
 * Forces are applied in a fixed order (links, repulsion, centering, collision), each one seeing the velocities
 * left by the previous. Centering moves positions directly. Non-finite contributions are dropped.
 */
class ForceModel {
public:
    explicit ForceModel(uint32_t seed = 1);

    /** @brief Run all four forces with the current @p alpha. */
    void apply(std::vector<SimNode>& nodes, const std::vector<SimLink>& links,
               const LayoutConfig& cfg, double alpha);

    void applyLinks(std::vector<SimNode>& nodes, const std::vector<SimLink>& links,
                    const LayoutConfig& cfg, double alpha);
    void applyRepulsion(std::vector<SimNode>& nodes, const LayoutConfig& cfg, double alpha);
    void applyCentering(std::vector<SimNode>& nodes, const LayoutConfig& cfg);
    void applyCollisions(std::vector<SimNode>& nodes, const LayoutConfig& cfg);

    /** @brief Replace every non-finite position or velocity component with 0; returns how many were replaced. */
    static size_t sanitize(std::vector<SimNode>& nodes);
    /** @brief Compute bias for each link from endpoint degrees. */
    static void computeBias(std::vector<SimLink>& links, size_t nodeCount);

    void reseed(uint32_t seed) { prng.seed(seed); }

private:
    // Tiny random offset separating coincident points.
    double jiggle();

    std::mt19937 prng;
    std::uniform_real_distribution<double> unit{0.0, 1.0};
    QuadTree chargeTree;
    QuadTree collideTree;
    std::vector<QuadTree::Point> scratchPoints;
    std::vector<double> scratchValues;
};
