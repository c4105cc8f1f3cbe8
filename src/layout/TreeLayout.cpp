#include "mindarbor/layout/TreeLayout.h"
#include "mindarbor/common/Logger.h"
#include "tree/CoordinateAssignment.h"
#include "tree/CycleRemoval.h"
#include "tree/LayoutGraphBuilder.h"
#include "tree/LevelAssignment.h"

namespace mindarbor {

using namespace algorithms;

LayoutResult TreeLayout::layout(const LayoutRequest& request) {
    LayoutResult result;
    if (!request.visibleNodes) {
        LOG_WARN("layout called without visible nodes");
        return result;
    }

    // Phase 1: layout graph with live and virtual links
    LayoutGraphBuilder builder(settings_);
    LayoutGraphBuildResult built = builder.build(request);
    LayoutGraph& graph = built.graph;

    // Phase 2: roots and an acyclic child structure
    CycleRemoval cycleRemoval;
    CycleRemovalResult roots = cycleRemoval.breakCycles(graph, settings_.orphanPolicy);

    // Phase 3: vertical placement, one root at a time
    CoordinateAssignment coordinates(settings_.verticalSpacing);
    for (NodeIndex root : roots.roots) {
        coordinates.computeSubtreeHeight(graph, root);
        coordinates.assignY(graph, root);
    }

    // Phase 4: level columns
    LevelAssignment levels(settings_.horizontalSpacing, settings_.textNodeWidth);
    int layerCount = levels.assign(graph, roots.roots);

    for (const auto& node : graph.nodes) {
        NodeLayout layout;
        layout.id = node.id;
        layout.position = {node.x, node.y};
        layout.size = {node.width, node.height};
        layout.layer = node.level;
        layout.subtreeHeight = node.subtreeHeight;
        result.setNodeLayout(layout);
    }
    for (const auto& edge : built.virtualEdges) {
        result.addVirtualEdge(edge);
    }
    result.setLayerCount(layerCount);

    LayoutStats stats;
    stats.nodeCount = graph.size();
    stats.rootCount = roots.roots.size();
    stats.promotedOrphans = roots.promotedOrphans;
    stats.unreachedNodes = roots.unreachedNodes;
    stats.virtualEdgeCount = built.virtualEdges.size();
    stats.removedCycleEdges = roots.removedEdges;
    stats.formulaNodes = built.formulaNodes;
    stats.layerCount = layerCount;
    result.setStats(stats);

    LOG_DEBUG("{} nodes, {} roots, {} layers, {} virtual edges",
              stats.nodeCount, stats.rootCount, stats.layerCount, stats.virtualEdgeCount);
    return result;
}

}  // namespace mindarbor
