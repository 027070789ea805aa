/**
 * @file LayoutController.h
 * @brief Interactive-side facade over LayoutWorker: posts commands and applies received snapshots.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "LayoutWorker.h"
#include "Messages.h"

/**
 * @class LayoutController
 * @brief Owned by the rendering/input thread. Never blocks on the simulation thread.
 *
 * Call poll() once per frame; it drains whatever events have arrived, keeps the newest snapshot and invokes
 * the callbacks. The controller only ever holds snapshots it has received, never engine memory.
 */
class LayoutController {
public:
    using TickHandler = std::function<void(const PositionBuffer&, std::optional<double> alpha)>;
    using SettledHandler = std::function<void(double alpha)>;

    LayoutController();
    explicit LayoutController(const LayoutWorker::Options& opts);
    ~LayoutController();

    /** @brief Start a session; positions() is cleared until the first tick arrives. */
    void init(std::vector<GraphNode> nodes, std::vector<GraphLink> links,
              const LayoutConfig& config = LayoutConfig::defaults());
    void pinNode(long long index, std::optional<double> fx, std::optional<double> fy);
    void unpinNode(const std::string& id);
    void setAlphaTarget(double value);
    void setAlpha(double value);
    void reheat(double alpha = 0.3);
    void restart();
    void updateConfig(const LayoutConfigPatch& patch);
    void stop();
    /** @brief Post any command, including ones without a dedicated helper. An init is stamped with a new session. */
    void post(LayoutCommand cmd);

    /** @brief Drain pending events; returns how many were processed. */
    size_t poll();

    void onTick(TickHandler fn) { tickHandler = std::move(fn); }
    void onSettled(SettledHandler fn) { settledHandler = std::move(fn); }

    const PositionBuffer& positions() const { return latest; }
    bool hasPositions() const { return !latest.empty(); }
    bool settled() const { return isSettled; }
    std::optional<double> lastAlpha() const { return alpha; }
    uint64_t ticksReceived() const { return ticks; }
    uint64_t session() const { return generation; }

    LayoutWorker& worker() { return channel; }

private:
    void handle(LayoutEvent& ev);

    LayoutWorker channel;
    PositionBuffer latest;
    std::optional<double> alpha;
    bool isSettled{false};
    uint64_t ticks{0};
    uint64_t generation{0};
    std::vector<LayoutEvent> inbox;
    TickHandler tickHandler;
    SettledHandler settledHandler;
};
