/**
 * @file LayoutController.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "LayoutController.h"
#include "Logger.h"

LayoutController::LayoutController() : LayoutController(LayoutWorker::Options{}) {}

LayoutController::LayoutController(const LayoutWorker::Options& opts) : channel(opts) {
    channel.start();
}

LayoutController::~LayoutController() {
    channel.shutdown();
}

void LayoutController::post(LayoutCommand cmd) {
    if (auto* fresh = std::get_if<InitCommand>(&cmd)) {
        // Events still queued from the previous graph carry an older session and are dropped by handle().
        fresh->session = ++generation;
        latest = PositionBuffer();
        alpha.reset();
        ticks = 0;
    }
    // A new command may wake a finished session, so settled is re-learned from the event stream.
    if (std::holds_alternative<InitCommand>(cmd) || std::holds_alternative<RestartCommand>(cmd) ||
        std::holds_alternative<ReheatCommand>(cmd)) {
        isSettled = false;
    }
    channel.post(std::move(cmd));
}

void LayoutController::init(std::vector<GraphNode> nodes, std::vector<GraphLink> links, const LayoutConfig& config) {
    Logger::debug("controller init: nodes=" + std::to_string(nodes.size()) + " links=" + std::to_string(links.size()));
    post(InitCommand{std::move(nodes), std::move(links), config, 0});
}

void LayoutController::pinNode(long long index, std::optional<double> fx, std::optional<double> fy) {
    post(PinCommand{index, fx, fy});
}

void LayoutController::unpinNode(const std::string& id) { post(UnpinCommand{id}); }
void LayoutController::setAlphaTarget(double value) { post(AlphaTargetCommand{value}); }
void LayoutController::setAlpha(double value) { post(AlphaCommand{value}); }
void LayoutController::reheat(double a) { post(ReheatCommand{a}); }
void LayoutController::restart() { post(RestartCommand{}); }
void LayoutController::updateConfig(const LayoutConfigPatch& patch) { post(ConfigCommand{patch}); }
void LayoutController::stop() { post(StopCommand{}); }

size_t LayoutController::poll() {
    inbox.clear();
    size_t n = channel.receiveAll(inbox);
    for (auto& ev : inbox) handle(ev);
    return n;
}

void LayoutController::handle(LayoutEvent& ev) {
    if (auto* tick = std::get_if<TickEvent>(&ev)) {
        if (tick->session != generation) return;
        latest = std::move(tick->positions);
        if (tick->alpha) alpha = tick->alpha;
        ++ticks;
        if (tickHandler) tickHandler(latest, tick->alpha);
    } else if (auto* done = std::get_if<SettledEvent>(&ev)) {
        if (done->session != generation) return;
        alpha = done->alpha;
        isSettled = true;
        if (settledHandler) settledHandler(done->alpha);
    }
}
