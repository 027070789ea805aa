/**
 * @file LayoutEngine.h
 * @brief Declares LayoutEngine: the state machine that owns a layout session and advances it one iteration at a time.
 *
 * The engine is single-threaded by construction. LayoutWorker confines it to the simulation thread; tests drive
 * it directly.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ForceModel.h"
#include "GraphTypes.h"
#include "LayoutConfig.h"
#include "Messages.h"

/**
 * @class LayoutEngine
 * @brief Owns nodes, links, configuration and the alpha schedule of one session.
 *
 * Lifecycle: Idle -> Running -> {Settled, Stopped}. init() may be issued from any state and replaces the
 * session; restart() and reheat() resume a finished session.
 */
class LayoutEngine {
public:
    enum class State { Idle, Running, Settled, Stopped };

    static constexpr double RestartAlpha = 0.3;

    LayoutEngine();

    // Lifecycle
    /**
     * @brief Build a new session and start running.
     * @throws LayoutError (InvalidLink, DuplicateNodeId) if the graph is rejected; the engine is then unchanged.
     */
    void init(const std::vector<GraphNode>& nodes, const std::vector<GraphLink>& links,
              const LayoutConfig& config = LayoutConfig::defaults(), uint64_t tag = 0);
    /** @brief Halt iteration; idempotent, and a no-op while Idle. */
    void stop();
    /** @brief alpha = RestartAlpha and resume from Settled or Stopped. */
    void restart();

    // Live control
    /** @brief Fix node @p index on each axis given; both absent releases it. Out-of-range indexes are dropped. */
    bool pin(long long index, std::optional<double> fx, std::optional<double> fy);
    /** @brief Release the node with @p id; unknown ids are dropped. */
    bool unpin(const std::string& id);
    /** @brief Merge @p patch into the live configuration; takes effect on the next iteration. */
    void reconfigure(const LayoutConfigPatch& patch);
    /** @brief Set alpha and wake a Settled session. */
    void reheat(double alpha);
    void setAlpha(double alpha);
    void setAlphaTarget(double target);

    /**
     * @brief Apply one protocol command. Commands are never reordered and malformed ones never throw,
     *        except init, which propagates LayoutError.
     */
    void apply(LayoutCommand&& cmd);

    /**
     * @brief Run one iteration if Running, appending any tick/settled events to @p out.
     * @return true if an iteration ran.
     */
    bool step(std::vector<LayoutEvent>& out);

    // Inspection
    State state() const { return st; }
    bool isRunning() const { return st == State::Running; }
    double alpha() const { return alphaValue; }
    double alphaTarget() const { return alphaTargetValue; }
    uint64_t iteration() const { return iterations; }
    /** @brief Session tag of the current graph, stamped on every emitted event. */
    uint64_t session() const { return sessionId; }
    size_t nodeCount() const { return nodes.size(); }
    size_t linkCount() const { return links.size(); }
    const LayoutConfig& config() const { return cfg; }
    std::pair<double, double> position(size_t index) const { return {nodes[index].x, nodes[index].y}; }
    const SimNode& node(size_t index) const { return nodes[index]; }
    /** @brief Index of the node with @p id, if any. */
    std::optional<size_t> indexOf(const std::string& id) const;
    /** @brief Fresh sanitized copy of all positions. */
    PositionBuffer snapshot() const;

    static const char* stateName(State s);

private:
    void integrate();
    void emitTick(std::vector<LayoutEvent>& out) const;
    void setState(State next);

    State st{State::Idle};
    std::vector<SimNode> nodes;
    std::vector<SimLink> links;
    std::unordered_map<std::string, size_t> indexById;
    LayoutConfig cfg;
    ForceModel forces;
    double alphaValue{1.0};
    double alphaTargetValue{0.0};
    uint64_t iterations{0};
    uint64_t sessionId{0};
};
