#pragma once

#include "../core/Edge.h"
#include "../core/NodeMap.h"
#include "../floating/FloatingMarker.h"

namespace mindarbor {

/// Inputs of one layout call. Everything is borrowed: the caller keeps the
/// referenced collections alive and unchanged until layout() returns.
struct LayoutRequest {
    const NodeMap* visibleNodes = nullptr;            ///< Required
    const EdgeList* currentEdges = nullptr;           ///< Live edges (nullptr = none)
    const EdgeList* originalEdges = nullptr;          ///< Historical superset, nullptr = use currentEdges
    const NodeMap* allNodes = nullptr;                ///< Superset incl. hidden nodes, nullptr = visibleNodes
    const FloatingMarkers* floatingMarkers = nullptr; ///< nullptr = nothing floats

    LayoutRequest() = default;
    LayoutRequest(const NodeMap& visible, const EdgeList& current)
        : visibleNodes(&visible), currentEdges(&current) {}
};

}  // namespace mindarbor
