/**
 * @file GraphTypes.h
 * @brief Node and link records handed to the layout engine by its controller.
 *
 * These are plain input values: the engine copies them into its own arena on init and never hands them back.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>

/** @brief Node classification; selects the repulsion strength. */
enum class NodeKind { Major = 0, Minor = 1 };
/** @brief Edge classification; selects spring distance and strength. */
enum class LinkKind { Orchestrator = 0, Subfeature = 1, Overlap = 2 };

constexpr std::size_t NodeKindCount = 2;
constexpr std::size_t LinkKindCount = 3;

const char* nodeKindName(NodeKind k);
const char* linkKindName(LinkKind k);
/** @brief Parse "major"/"minor"; returns false for anything else. */
bool parseNodeKind(const std::string& s, NodeKind& out);
/** @brief Parse "orchestrator"/"subfeature"/"overlap"; returns false for anything else. */
bool parseLinkKind(const std::string& s, LinkKind& out);

/**
 * @struct GraphNode
 * @brief One node as supplied to init.
 *
 * Position and fixed coordinates are optional: nodes without a finite position are placed on a
 * phyllotaxis spiral around the origin. Fixing is per axis.
 */
struct GraphNode {
    std::string id;                 /**< unique within a session */
    NodeKind kind{NodeKind::Minor};
    std::string group;              /**< opaque grouping label, carried but not interpreted */
    double radius{1.0};             /**< body radius (> 0), collision padding is added on top */
    std::optional<double> x;
    std::optional<double> y;
    double vx{0.0};
    double vy{0.0};
    std::optional<double> fx;       /**< fixed x, if pinned on that axis */
    std::optional<double> fy;       /**< fixed y, if pinned on that axis */
};

/** @struct GraphLink @brief One edge as supplied to init; endpoints reference GraphNode::id. */
struct GraphLink {
    std::string sourceId;
    std::string targetId;
    LinkKind kind{LinkKind::Subfeature};
};
