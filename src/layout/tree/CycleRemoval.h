#pragma once

#include "LayoutGraph.h"
#include "mindarbor/layout/config/LayoutSettings.h"

#include <vector>

namespace mindarbor {
namespace algorithms {

struct CycleRemovalResult {
    std::vector<NodeIndex> roots;  ///< Natural roots first, then promoted orphans
    size_t removedEdges = 0;
    size_t promotedOrphans = 0;
    size_t unreachedNodes = 0;     ///< Visible nodes left out (KeepPosition)
};

/// DFS-based cycle removal over the layout arena
///
/// Roots are the visible nodes without a parent, in initialization order.
/// A DFS from each root drops every child link that points back to a node
/// still on the DFS stack, which leaves the reachable part acyclic. Visible
/// nodes that no root reaches are handled according to the OrphanPolicy.
/// The DFS uses an explicit stack so deep trees cannot overflow.
class CycleRemoval {
public:
    CycleRemovalResult breakCycles(LayoutGraph& graph, OrphanPolicy policy) const;

private:
    enum class NodeState { White, Gray, Black };

    /// @return Number of links removed
    size_t dfs(NodeIndex start, LayoutGraph& graph, std::vector<NodeState>& state) const;
};

}  // namespace algorithms
}  // namespace mindarbor
