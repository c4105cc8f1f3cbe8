#pragma once

#include "Edge.h"
#include "NodeMap.h"
#include "../floating/FloatingMarker.h"
#include "../visibility/CollapseState.h"

namespace mindarbor {

/// Consistent copy of everything one arrange call reads.
/// The host builds it at the point of the request and must not share a
/// snapshot that is still being edited.
struct CanvasSnapshot {
    NodeMap nodes;
    EdgeList edges;                  ///< Current structural edges
    EdgeList originalEdges;          ///< Historical superset, empty = use edges
    CollapseState collapsed;
    FloatingMarkers floatingMarkers;
};

}  // namespace mindarbor
