/**
 * @file Messages.h
 * @brief Closed command (controller -> engine) and event (engine -> controller) vocabularies.
 *
 * Every message kind maps to the `type` discriminator used on the wire (commandTypeName / eventTypeName).
 * Position snapshots travel as a move-only PositionBuffer: the sender gives the buffer up when it posts it.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "GraphTypes.h"
#include "LayoutConfig.h"

/**
 * @class PositionBuffer
 * @brief Owned flat array [x0, y0, x1, y1, ...] of one snapshot, ordered by node index.
 *
 * Copying is disabled; moving leaves the source empty, so the producer cannot touch a snapshot after handing
 * it to the channel.
 */
class PositionBuffer {
public:
    PositionBuffer() = default;
    /** @brief Allocate a zeroed buffer for @p nodeCount nodes. */
    explicit PositionBuffer(size_t nodeCount);

    PositionBuffer(const PositionBuffer&) = delete;
    PositionBuffer& operator=(const PositionBuffer&) = delete;
    PositionBuffer(PositionBuffer&& other) noexcept;
    PositionBuffer& operator=(PositionBuffer&& other) noexcept;

    /** @brief Number of doubles (2 x nodeCount). */
    size_t size() const { return len; }
    size_t nodeCount() const { return len / 2; }
    bool empty() const { return len == 0; }

    double x(size_t node) const { return data[node * 2]; }
    double y(size_t node) const { return data[node * 2 + 1]; }
    /** @brief Store a node's coordinates; non-finite values are written as 0. */
    void set(size_t node, double x, double y);

    const double* begin() const { return data.get(); }
    const double* end() const { return data.get() + len; }

private:
    std::unique_ptr<double[]> data;
    size_t len{0};
};

// ---- Commands -------------------------------------------------------------------------------

struct InitCommand {
    std::vector<GraphNode> nodes;
    std::vector<GraphLink> links;
    LayoutConfig config;
    uint64_t session{0};           // echoed on every event of the session this init starts
};
struct ReheatCommand { double alpha{0.3}; };
struct ConfigCommand { LayoutConfigPatch patch; };
struct PinCommand {
    long long nodeIndex{0};        // signed so a bogus negative index is representable and dropped
    std::optional<double> fx;      // both absent releases the node
    std::optional<double> fy;
};
struct UnpinCommand { std::string nodeId; };
struct AlphaTargetCommand { double value{0.0}; };
struct AlphaCommand { double value{1.0}; };
struct RestartCommand {};
struct StopCommand {};
/** @brief A command whose type this build does not know; always ignored. */
struct UnknownCommand { std::string type; };

using LayoutCommand = std::variant<InitCommand, ReheatCommand, ConfigCommand, PinCommand, UnpinCommand,
                                   AlphaTargetCommand, AlphaCommand, RestartCommand, StopCommand, UnknownCommand>;

// ---- Events ---------------------------------------------------------------------------------

struct TickEvent {
    PositionBuffer positions;
    std::optional<double> alpha;
    uint64_t session{0};
};
struct SettledEvent {
    double alpha{0.0};
    uint64_t session{0};
};

using LayoutEvent = std::variant<TickEvent, SettledEvent>;

/** @brief Wire discriminator of a command ("init", "reheat", "config", "pin", ...). */
std::string commandTypeName(const LayoutCommand& cmd);
/** @brief Wire discriminator of an event ("tick" or "settled"). */
const char* eventTypeName(const LayoutEvent& ev);
