#pragma once

#include "mindarbor/core/Edge.h"
#include "mindarbor/core/NodeMap.h"
#include "mindarbor/floating/FloatingMarker.h"
#include "mindarbor/visibility/CollapseState.h"

#include <unordered_set>

namespace mindarbor {

/// Computes which nodes a collapse hides.
///
/// A collapsed node stays visible; every node reachable from it through the
/// current edges is hidden. A floating node whose recorded originalParent is
/// collapsed or hidden disappears with its descendants as well, so a detached
/// subtree follows its last attachment point. The floating rule is applied
/// until nothing changes, which covers floating subtrees anchored inside
/// other hidden floating subtrees.
///
/// Every node is expanded at most once, so cyclic edge sets terminate; the
/// result for a cycle is whatever first-visit order produces.
class VisibilityResolver {
public:
    /// Hidden ids among @p nodes
    /// @param markers Floating markers, nullptr when there are none
    static std::unordered_set<NodeId> hiddenNodes(
        const NodeMap& nodes,
        const EdgeList& edges,
        const CollapseState& collapsed,
        const FloatingMarkers* markers = nullptr);

    /// The nodes that survive, in input order
    static NodeMap visibleNodes(const NodeMap& nodes,
                                const std::unordered_set<NodeId>& hidden);

    /// Edges whose both endpoints are present in @p visible
    static EdgeList visibleEdges(const EdgeList& edges, const NodeMap& visible);

    /// Convenience check for a single node
    static bool isVisible(const NodeId& id,
                          const NodeMap& nodes,
                          const EdgeList& edges,
                          const CollapseState& collapsed,
                          const FloatingMarkers* markers = nullptr);
};

}  // namespace mindarbor
