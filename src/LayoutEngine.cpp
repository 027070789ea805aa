/**
 * @file LayoutEngine.cpp
 * @brief Session build, command handling and the iterate/decay loop.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "LayoutEngine.h"
#include "LayoutError.h"
#include "Logger.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace {
// Phyllotaxis placement for nodes that arrive without a position.
constexpr double InitialRadius = 10.0;
const double InitialAngle = M_PI * (3.0 - std::sqrt(5.0));

bool finiteOpt(const std::optional<double>& v) { return v && std::isfinite(*v); }

std::optional<double> finiteOrNone(const std::optional<double>& v) {
    return finiteOpt(v) ? v : std::nullopt;
}
}

LayoutEngine::LayoutEngine() = default;

const char* LayoutEngine::stateName(State s) {
    switch (s) {
        case State::Idle: return "idle";
        case State::Running: return "running";
        case State::Settled: return "settled";
        case State::Stopped: return "stopped";
    }
    return "?";
}

void LayoutEngine::setState(State next) {
    if (next == st) return;
    Logger::debug(std::string("layout state ") + stateName(st) + " -> " + stateName(next));
    st = next;
}

void LayoutEngine::init(const std::vector<GraphNode>& inNodes, const std::vector<GraphLink>& inLinks,
                        const LayoutConfig& config, uint64_t tag) {
    // Build everything into locals first so a rejected graph leaves the current session untouched.
    std::unordered_map<std::string, size_t> ids;
    ids.reserve(inNodes.size() * 2);
    std::vector<SimNode> built;
    built.reserve(inNodes.size());
    for (size_t i = 0; i < inNodes.size(); ++i) {
        const GraphNode& g = inNodes[i];
        if (!ids.emplace(g.id, i).second) {
            throw LayoutError(LayoutErrc::DuplicateNodeId, "node id '" + g.id + "' appears more than once");
        }
        SimNode n;
        n.id = g.id;
        n.kind = g.kind;
        n.group = g.group;
        n.radius = (std::isfinite(g.radius) && g.radius > 0.0) ? g.radius : 0.0;
        n.fx = finiteOrNone(g.fx);
        n.fy = finiteOrNone(g.fy);
        if (finiteOpt(g.x) && finiteOpt(g.y)) {
            n.x = *g.x;
            n.y = *g.y;
        } else {
            double r = InitialRadius * std::sqrt(0.5 + (double)i);
            double a = (double)i * InitialAngle;
            n.x = r * std::cos(a);
            n.y = r * std::sin(a);
        }
        if (n.fx) n.x = *n.fx;
        if (n.fy) n.y = *n.fy;
        n.vx = std::isfinite(g.vx) ? g.vx : 0.0;
        n.vy = std::isfinite(g.vy) ? g.vy : 0.0;
        built.push_back(std::move(n));
    }

    std::vector<SimLink> resolved;
    resolved.reserve(inLinks.size());
    for (const auto& l : inLinks) {
        auto s = ids.find(l.sourceId);
        auto t = ids.find(l.targetId);
        if (s == ids.end() || t == ids.end()) {
            const std::string& missing = (s == ids.end()) ? l.sourceId : l.targetId;
            throw LayoutError(LayoutErrc::InvalidLink,
                              "link " + l.sourceId + " -> " + l.targetId + " references unknown node '" + missing + "'");
        }
        SimLink sl;
        sl.source = s->second;
        sl.target = t->second;
        sl.kind = l.kind;
        resolved.push_back(sl);
    }
    ForceModel::computeBias(resolved, built.size());

    nodes = std::move(built);
    links = std::move(resolved);
    indexById = std::move(ids);
    cfg = config.validated();
    forces.reseed(1);
    alphaValue = 1.0;
    alphaTargetValue = 0.0;
    iterations = 0;
    sessionId = tag;
    setState(State::Running);
    Logger::info("layout init: session=" + std::to_string(sessionId) + " nodes=" + std::to_string(nodes.size()) +
                 " links=" + std::to_string(links.size()));
    Logger::debug("layout config: " + cfg.describe());
}

void LayoutEngine::stop() {
    if (st == State::Idle || st == State::Stopped) return;
    setState(State::Stopped);
    Logger::info("layout stopped at iteration " + std::to_string(iterations));
}

void LayoutEngine::restart() {
    if (st == State::Idle) {
        Logger::debug("restart dropped: no session");
        return;
    }
    alphaValue = RestartAlpha;
    setState(State::Running);
}

bool LayoutEngine::pin(long long index, std::optional<double> fx, std::optional<double> fy) {
    if (index < 0 || (unsigned long long)index >= nodes.size()) {
        Logger::debug("pin dropped: index " + std::to_string(index) + " out of range (nodes=" +
                      std::to_string(nodes.size()) + ")");
        return false;
    }
    SimNode& n = nodes[(size_t)index];
    n.fx = finiteOrNone(fx);
    n.fy = finiteOrNone(fy);
    return true;
}

bool LayoutEngine::unpin(const std::string& id) {
    auto it = indexById.find(id);
    if (it == indexById.end()) {
        Logger::debug("unpin dropped: unknown node '" + id + "'");
        return false;
    }
    nodes[it->second].fx.reset();
    nodes[it->second].fy.reset();
    return true;
}

void LayoutEngine::reconfigure(const LayoutConfigPatch& patch) {
    cfg.merge(patch);
    cfg = cfg.validated();
    Logger::debug("layout reconfigured: " + cfg.describe());
}

void LayoutEngine::reheat(double a) {
    if (st == State::Idle || !std::isfinite(a)) return;
    alphaValue = std::clamp(a, 0.0, 1.0);
    if (st == State::Settled) setState(State::Running);
}

void LayoutEngine::setAlpha(double a) {
    if (!std::isfinite(a)) return;
    alphaValue = std::clamp(a, 0.0, 1.0);
}

void LayoutEngine::setAlphaTarget(double t) {
    if (!std::isfinite(t)) return;
    alphaTargetValue = std::clamp(t, 0.0, 1.0);
}

std::optional<size_t> LayoutEngine::indexOf(const std::string& id) const {
    auto it = indexById.find(id);
    if (it == indexById.end()) return std::nullopt;
    return it->second;
}

void LayoutEngine::apply(LayoutCommand&& cmd) {
    if (auto* c = std::get_if<InitCommand>(&cmd)) {
        init(c->nodes, c->links, c->config, c->session);
        return;
    }
    if (auto* c = std::get_if<UnknownCommand>(&cmd)) {
        Logger::debug("ignoring unknown command type '" + c->type + "'");
        return;
    }
    if (st == State::Idle) {
        Logger::debug("command '" + commandTypeName(cmd) + "' dropped: no session");
        return;
    }
    if (auto* c = std::get_if<ReheatCommand>(&cmd)) reheat(c->alpha);
    else if (auto* c = std::get_if<ConfigCommand>(&cmd)) reconfigure(c->patch);
    else if (auto* c = std::get_if<PinCommand>(&cmd)) (void)pin(c->nodeIndex, c->fx, c->fy);
    else if (auto* c = std::get_if<UnpinCommand>(&cmd)) (void)unpin(c->nodeId);
    else if (auto* c = std::get_if<AlphaTargetCommand>(&cmd)) setAlphaTarget(c->value);
    else if (auto* c = std::get_if<AlphaCommand>(&cmd)) setAlpha(c->value);
    else if (std::holds_alternative<RestartCommand>(cmd)) restart();
    else if (std::holds_alternative<StopCommand>(cmd)) stop();
}

void LayoutEngine::integrate() {
    const double keep = 1.0 - cfg.velocityDecay;
    for (auto& n : nodes) {
        if (n.fx) { n.x = *n.fx; n.vx = 0.0; }
        else { n.vx *= keep; n.x += n.vx; }
        if (n.fy) { n.y = *n.fy; n.vy = 0.0; }
        else { n.vy *= keep; n.y += n.vy; }
    }
}

bool LayoutEngine::step(std::vector<LayoutEvent>& out) {
    if (st != State::Running) return false;

    size_t repaired = ForceModel::sanitize(nodes);
    forces.apply(nodes, links, cfg, alphaValue);
    integrate();
    repaired += ForceModel::sanitize(nodes);
    if (repaired > 0) {
        Logger::debug("numeric instability: " + std::to_string(repaired) + " coordinate(s) reset to 0 at iteration " +
                      std::to_string(iterations));
    }

    alphaValue += (alphaTargetValue - alphaValue) * cfg.alphaDecay;
    ++iterations;

    if (iterations % (uint64_t)cfg.snapshotEvery == 0) emitTick(out);
    if (alphaValue < cfg.alphaMin) {
        // The settled snapshot is sent regardless of the throttle.
        emitTick(out);
        out.emplace_back(SettledEvent{alphaValue, sessionId});
        setState(State::Settled);
        Logger::info("layout settled after " + std::to_string(iterations) + " iterations (alpha=" +
                     std::to_string(alphaValue) + ")");
    }
    return true;
}

PositionBuffer LayoutEngine::snapshot() const {
    PositionBuffer buf(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) buf.set(i, nodes[i].x, nodes[i].y);
    return buf;
}

void LayoutEngine::emitTick(std::vector<LayoutEvent>& out) const {
    TickEvent ev;
    ev.positions = snapshot();
    ev.alpha = alphaValue;
    ev.session = sessionId;
    out.emplace_back(std::move(ev));
}
