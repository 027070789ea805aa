/**
 * @file GraphTypes.cpp
 * @brief Kind names and the error-code names shared by log lines.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "GraphTypes.h"
#include "LayoutError.h"

const char* nodeKindName(NodeKind k) {
    return k == NodeKind::Major ? "major" : "minor";
}

const char* linkKindName(LinkKind k) {
    switch (k) {
        case LinkKind::Orchestrator: return "orchestrator";
        case LinkKind::Overlap: return "overlap";
        default: return "subfeature";
    }
}

bool parseNodeKind(const std::string& s, NodeKind& out) {
    if (s == "major") { out = NodeKind::Major; return true; }
    if (s == "minor") { out = NodeKind::Minor; return true; }
    return false;
}

bool parseLinkKind(const std::string& s, LinkKind& out) {
    if (s == "orchestrator") { out = LinkKind::Orchestrator; return true; }
    if (s == "subfeature") { out = LinkKind::Subfeature; return true; }
    if (s == "overlap") { out = LinkKind::Overlap; return true; }
    return false;
}

const char* layoutErrcName(LayoutErrc code) {
    switch (code) {
        case LayoutErrc::InvalidLink: return "invalid link";
        case LayoutErrc::DuplicateNodeId: return "duplicate node id";
        case LayoutErrc::OutOfRangeIndex: return "out of range index";
        case LayoutErrc::NumericInstability: return "numeric instability";
        case LayoutErrc::UnknownCommand: return "unknown command";
    }
    return "unknown error";
}
