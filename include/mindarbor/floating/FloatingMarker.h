#pragma once

#include "mindarbor/core/Types.h"

#include <optional>
#include <unordered_map>

namespace mindarbor {

/// Per-node floating record as persisted by the host.
///
/// Subtree roots carry the anchor they were detached from; non-root members
/// only carry the flag. Legacy documents may store the flag alone for roots
/// as well.
struct FloatingMarker {
    bool isFloating = false;
    std::optional<NodeId> originalParent;

    FloatingMarker() = default;
    explicit FloatingMarker(bool floating) : isFloating(floating) {}
    FloatingMarker(bool floating, NodeId parent)
        : isFloating(floating), originalParent(std::move(parent)) {}

    bool operator==(const FloatingMarker& o) const {
        return isFloating == o.isFloating && originalParent == o.originalParent;
    }
};

using FloatingMarkers = std::unordered_map<NodeId, FloatingMarker>;

/// True when the id has a marker with isFloating set
inline bool isMarkedFloating(const FloatingMarkers& markers, const NodeId& id) {
    auto it = markers.find(id);
    return it != markers.end() && it->second.isFloating;
}

/// Recorded originalParent of a floating node, if any
inline std::optional<NodeId> recordedOriginalParent(const FloatingMarkers& markers, const NodeId& id) {
    auto it = markers.find(id);
    if (it == markers.end() || !it->second.isFloating) {
        return std::nullopt;
    }
    return it->second.originalParent;
}

}  // namespace mindarbor
