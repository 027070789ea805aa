/**
 * @file LayoutConfig.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "LayoutConfig.h"

#include <cmath>
#include <sstream>

namespace {
template <class T>
void assignIf(T& dst, const std::optional<T>& src) {
    if (src) dst = *src;
}

bool isFiniteValue(double v) { return std::isfinite(v); }
}

void LayoutConfig::merge(const LayoutConfigPatch& p) {
    for (size_t k = 0; k < LinkKindCount; ++k) {
        assignIf(linkDistance[k], p.linkDistance[k]);
        assignIf(linkStrength[k], p.linkStrength[k]);
    }
    for (size_t k = 0; k < NodeKindCount; ++k) assignIf(repulsion[k], p.repulsion[k]);
    assignIf(collisionPadding, p.collisionPadding);
    assignIf(alphaDecay, p.alphaDecay);
    assignIf(velocityDecay, p.velocityDecay);
    assignIf(alphaMin, p.alphaMin);
    assignIf(snapshotEvery, p.snapshotEvery);
    assignIf(theta, p.theta);
    assignIf(centerStrength, p.centerStrength);
    assignIf(collisionStrength, p.collisionStrength);
    assignIf(distanceMin, p.distanceMin);
}

LayoutConfig LayoutConfig::validated() const {
    const LayoutConfig d = defaults();
    LayoutConfig c = *this;
    for (size_t k = 0; k < LinkKindCount; ++k) {
        if (!isFiniteValue(c.linkDistance[k]) || c.linkDistance[k] < 0.0) c.linkDistance[k] = d.linkDistance[k];
        if (!isFiniteValue(c.linkStrength[k])) c.linkStrength[k] = d.linkStrength[k];
    }
    for (size_t k = 0; k < NodeKindCount; ++k) {
        if (!isFiniteValue(c.repulsion[k])) c.repulsion[k] = d.repulsion[k];
    }
    if (!isFiniteValue(c.collisionPadding) || c.collisionPadding < 0.0) c.collisionPadding = d.collisionPadding;
    if (!(c.alphaDecay >= 0.0 && c.alphaDecay <= 1.0)) c.alphaDecay = d.alphaDecay;
    if (!(c.velocityDecay >= 0.0 && c.velocityDecay <= 1.0)) c.velocityDecay = d.velocityDecay;
    if (!(c.alphaMin >= 0.0 && c.alphaMin <= 1.0)) c.alphaMin = d.alphaMin;
    if (c.snapshotEvery < 1) c.snapshotEvery = d.snapshotEvery;
    if (!isFiniteValue(c.theta) || c.theta < 0.0) c.theta = d.theta;
    if (!isFiniteValue(c.centerStrength)) c.centerStrength = d.centerStrength;
    if (!isFiniteValue(c.collisionStrength) || c.collisionStrength < 0.0) c.collisionStrength = d.collisionStrength;
    if (!isFiniteValue(c.distanceMin) || c.distanceMin < 0.0) c.distanceMin = d.distanceMin;
    return c;
}

std::string LayoutConfig::describe() const {
    std::ostringstream oss;
    oss << "distance{";
    for (size_t k = 0; k < LinkKindCount; ++k)
        oss << (k ? " " : "") << linkKindName(static_cast<LinkKind>(k)) << "=" << linkDistance[k];
    oss << "} strength{";
    for (size_t k = 0; k < LinkKindCount; ++k)
        oss << (k ? " " : "") << linkKindName(static_cast<LinkKind>(k)) << "=" << linkStrength[k];
    oss << "} repulsion{";
    for (size_t k = 0; k < NodeKindCount; ++k)
        oss << (k ? " " : "") << nodeKindName(static_cast<NodeKind>(k)) << "=" << repulsion[k];
    oss << "} padding=" << collisionPadding
        << " alphaDecay=" << alphaDecay
        << " velocityDecay=" << velocityDecay
        << " alphaMin=" << alphaMin
        << " snapshotEvery=" << snapshotEvery
        << " theta=" << theta;
    return oss.str();
}

bool LayoutConfigPatch::empty() const {
    for (auto& v : linkDistance) if (v) return false;
    for (auto& v : linkStrength) if (v) return false;
    for (auto& v : repulsion) if (v) return false;
    return !collisionPadding && !alphaDecay && !velocityDecay && !alphaMin && !snapshotEvery && !theta
        && !centerStrength && !collisionStrength && !distanceMin;
}
