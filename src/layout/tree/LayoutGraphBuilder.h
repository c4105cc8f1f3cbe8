#pragma once

#include "LayoutGraph.h"
#include "mindarbor/core/ParentChildMap.h"
#include "mindarbor/layout/LayoutRequest.h"
#include "mindarbor/layout/config/LayoutResult.h"
#include "mindarbor/layout/config/LayoutSettings.h"

#include <vector>

namespace mindarbor {
namespace algorithms {

/// Output of the graph building phase
struct LayoutGraphBuildResult {
    LayoutGraph graph;
    ParentChildMap completeMap;
    std::vector<VirtualEdge> virtualEdges;
    size_t formulaNodes = 0;
};

/// Builds the layout arena from a request.
///
/// - Every node of allNodes (or visibleNodes) is initialized so that virtual
///   edges may anchor at hidden nodes. Visible nodes missing from allNodes
///   are appended.
/// - Live children come from current edges whose endpoints are both visible.
/// - Floating subtree roots are inserted at the front of their anchor's
///   children and take the anchor as parent.
class LayoutGraphBuilder {
public:
    explicit LayoutGraphBuilder(const LayoutSettings& settings) : settings_(settings) {}

    LayoutGraphBuildResult build(const LayoutRequest& request) const;

private:
    const LayoutSettings& settings_;

    LayoutNode initializeNode(const NodeData& data, bool visible) const;
    void attachFloatingSubtrees(const LayoutRequest& request,
                                LayoutGraphBuildResult& out) const;
};

}  // namespace algorithms
}  // namespace mindarbor
