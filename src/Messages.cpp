/**
 * @file Messages.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Messages.h"

#include <cmath>

PositionBuffer::PositionBuffer(size_t nodeCount)
    : data(new double[nodeCount * 2]()), len(nodeCount * 2) {}

PositionBuffer::PositionBuffer(PositionBuffer&& other) noexcept
    : data(std::move(other.data)), len(other.len) {
    other.len = 0;
}

PositionBuffer& PositionBuffer::operator=(PositionBuffer&& other) noexcept {
    if (this != &other) {
        data = std::move(other.data);
        len = other.len;
        other.len = 0;
    }
    return *this;
}

void PositionBuffer::set(size_t node, double x, double y) {
    data[node * 2] = std::isfinite(x) ? x : 0.0;
    data[node * 2 + 1] = std::isfinite(y) ? y : 0.0;
}

std::string commandTypeName(const LayoutCommand& cmd) {
    switch (cmd.index()) {
        case 0: return "init";
        case 1: return "reheat";
        case 2: return "config";
        case 3: return "pin";
        case 4: return "unpin";
        case 5: return "alphaTarget";
        case 6: return "alpha";
        case 7: return "restart";
        case 8: return "stop";
        default: return std::get<UnknownCommand>(cmd).type;
    }
}

const char* eventTypeName(const LayoutEvent& ev) {
    return std::holds_alternative<TickEvent>(ev) ? "tick" : "settled";
}
