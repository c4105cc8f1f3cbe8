#pragma once

#include "mindarbor/core/NodeMap.h"
#include "mindarbor/core/ParentChildMap.h"
#include "mindarbor/floating/FloatingMarker.h"

#include <optional>
#include <vector>

namespace mindarbor {

/// A detached subtree and the node it should hang from
struct FloatingSubtree {
    NodeId root;
    std::optional<NodeId> anchor;   ///< Recorded originalParent, else the historical parent
    std::vector<NodeId> members;    ///< Root first, then descendants in DFS pre-order
    bool anchorFromHistory = false; ///< Anchor came from the edge history, not the marker
};

/// Groups floating nodes into subtrees rooted at the shallowest floating node
/// of each chain.
///
/// Only markers with isFloating set whose node is eligible (visible) count;
/// markers of deleted or hidden nodes are ignored. Ancestry is read from the
/// complete (historical) parent map because the live edge that used to
/// connect a floating root is gone by definition.
class FloatingSubtreeResolver {
public:
    /// @param markers Floating markers keyed by node id
    /// @param eligible Nodes allowed to float; also fixes the output order
    /// @param completeMap Parent/child map built from the original edge set
    static std::vector<FloatingSubtree> resolve(const FloatingMarkers& markers,
                                                const NodeMap& eligible,
                                                const ParentChildMap& completeMap);

    /// Persistence form of one subtree: the root records its anchor, the
    /// other members only the flag.
    static FloatingMarkers toMarkers(const FloatingSubtree& subtree);

    /// Persistence form of several subtrees merged into one map
    static FloatingMarkers toMarkers(const std::vector<FloatingSubtree>& subtrees);
};

}  // namespace mindarbor
