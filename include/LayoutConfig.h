/**
 * @file LayoutConfig.h
 * @brief Tunables of the force model, keyed by node and link kind, plus the partial patch used by live reconfigure.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <array>
#include <optional>
#include <string>

#include "GraphTypes.h"

struct LayoutConfigPatch;

/**
 * @struct LayoutConfig
 * @brief Complete configuration read by the force model at every iteration.
 *
 * Per-kind coefficients live in enum-indexed tables; use the accessors rather than indexing directly.
 */
struct LayoutConfig {
    std::array<double, LinkKindCount> linkDistance{{380.0, 230.0, 400.0}}; /**< orchestrator, subfeature, overlap */
    std::array<double, LinkKindCount> linkStrength{{0.6, 0.32, 0.08}};     /**< orchestrator, subfeature, overlap */
    std::array<double, NodeKindCount> repulsion{{-2400.0, -600.0}};        /**< major, minor (negative repels) */
    double collisionPadding{22.0};
    double alphaDecay{0.011};
    double velocityDecay{0.35};

    double alphaMin{0.001};      // settle threshold
    int snapshotEvery{2};        // emit a tick every Nth iteration
    double theta{0.9};           // Barnes-Hut opening angle, 0 = exact pairwise
    double centerStrength{1.0};
    double collisionStrength{1.0};
    double distanceMin{1.0};     // repulsion softening distance

    static LayoutConfig defaults() { return LayoutConfig{}; }

    double distanceFor(LinkKind k) const { return linkDistance[static_cast<size_t>(k)]; }
    double strengthFor(LinkKind k) const { return linkStrength[static_cast<size_t>(k)]; }
    double repulsionFor(NodeKind k) const { return repulsion[static_cast<size_t>(k)]; }

    /** @brief Overwrite every field present in @p patch. */
    void merge(const LayoutConfigPatch& patch);
    /** @brief Copy with non-finite or out-of-range fields replaced by their defaults. */
    LayoutConfig validated() const;
    /** @brief One-line rendering for log output. */
    std::string describe() const;
};

/** @struct LayoutConfigPatch @brief Same fields as LayoutConfig, each optional; absent fields are left unchanged. */
struct LayoutConfigPatch {
    std::array<std::optional<double>, LinkKindCount> linkDistance;
    std::array<std::optional<double>, LinkKindCount> linkStrength;
    std::array<std::optional<double>, NodeKindCount> repulsion;
    std::optional<double> collisionPadding;
    std::optional<double> alphaDecay;
    std::optional<double> velocityDecay;
    std::optional<double> alphaMin;
    std::optional<int> snapshotEvery;
    std::optional<double> theta;
    std::optional<double> centerStrength;
    std::optional<double> collisionStrength;
    std::optional<double> distanceMin;

    LayoutConfigPatch& setLinkDistance(LinkKind k, double v) { linkDistance[static_cast<size_t>(k)] = v; return *this; }
    LayoutConfigPatch& setLinkStrength(LinkKind k, double v) { linkStrength[static_cast<size_t>(k)] = v; return *this; }
    LayoutConfigPatch& setRepulsion(NodeKind k, double v) { repulsion[static_cast<size_t>(k)] = v; return *this; }
    bool empty() const;
};
