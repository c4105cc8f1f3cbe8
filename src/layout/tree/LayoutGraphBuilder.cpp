#include "LayoutGraphBuilder.h"
#include "mindarbor/common/Logger.h"
#include "mindarbor/floating/FloatingSubtreeResolver.h"

#include <algorithm>
#include <cmath>

namespace mindarbor {
namespace algorithms {

LayoutNode LayoutGraphBuilder::initializeNode(const NodeData& data, bool visible) const {
    LayoutNode node;
    node.id = data.id;
    node.visible = visible;
    node.x = std::isnan(data.x) ? 0.0f : data.x;
    node.y = std::isnan(data.y) ? 0.0f : data.y;

    if (settings_.enableFormulaDetection && isFormulaContent(data.text)) {
        node.kind = ContentKind::Formula;
    } else if (isImageContent(data.text)) {
        node.kind = ContentKind::Image;
    }

    bool hasWidth = data.width && isProvidedDimension(*data.width);
    bool hasHeight = data.height && isProvidedDimension(*data.height);

    switch (node.kind) {
        case ContentKind::Formula:
            node.height = settings_.formulaNodeHeight;
            node.width = hasWidth ? *data.width : settings_.formulaNodeWidth;
            break;
        case ContentKind::Image:
            node.height = hasHeight ? *data.height : settings_.imageNodeHeight;
            node.width = hasWidth ? *data.width : settings_.imageNodeWidth;
            break;
        case ContentKind::Text:
            node.height = hasHeight ? *data.height : DEFAULT_NODE_HEIGHT;
            node.width = hasWidth ? *data.width : settings_.textNodeWidth;
            break;
    }
    return node;
}

LayoutGraphBuildResult LayoutGraphBuilder::build(const LayoutRequest& request) const {
    LayoutGraphBuildResult out;
    LayoutGraph& graph = out.graph;

    const NodeMap& visible = *request.visibleNodes;
    const NodeMap& initial = request.allNodes ? *request.allNodes : visible;

    // Step 1: layout nodes
    for (const auto& data : initial) {
        graph.add(initializeNode(data, visible.hasNode(data.id)));
    }
    if (request.allNodes) {
        for (const auto& data : visible) {
            if (!graph.contains(data.id)) {
                graph.add(initializeNode(data, true));
            }
        }
    }
    out.formulaNodes = static_cast<size_t>(std::count_if(
        graph.nodes.begin(), graph.nodes.end(),
        [](const LayoutNode& n) { return n.kind == ContentKind::Formula; }));

    // Step 2: live parent/child links between visible nodes
    static const EdgeList noEdges;
    const EdgeList& current = request.currentEdges ? *request.currentEdges : noEdges;

    ParentChildMap currentMap = ParentChildMap::build(current, [&](const NodeId& id) {
        NodeIndex idx = graph.find(id);
        return idx != NO_NODE && graph.nodes[idx].visible;
    });

    for (auto& node : graph.nodes) {
        for (const auto& childId : currentMap.children(node.id)) {
            node.children.push_back(graph.find(childId));
        }
        if (auto parentId = currentMap.parent(node.id)) {
            node.parent = graph.find(*parentId);
        }
    }

    // Step 3: historical parentage
    const EdgeList& history = (request.originalEdges && !request.originalEdges->empty())
        ? *request.originalEdges
        : current;
    out.completeMap = ParentChildMap::build(history, [&graph](const NodeId& id) {
        return graph.contains(id);
    });

    LOG_DEBUG("{} layout nodes ({} formula), {} live links, {} historical links",
              graph.size(), out.formulaNodes, currentMap.edgeCount(), out.completeMap.edgeCount());

    // Steps 4-5: floating subtrees and their virtual edges
    attachFloatingSubtrees(request, out);
    return out;
}

void LayoutGraphBuilder::attachFloatingSubtrees(const LayoutRequest& request,
                                                LayoutGraphBuildResult& out) const {
    if (!request.floatingMarkers || request.floatingMarkers->empty()) {
        return;
    }

    LayoutGraph& graph = out.graph;
    auto subtrees = FloatingSubtreeResolver::resolve(
        *request.floatingMarkers, *request.visibleNodes, out.completeMap);

    for (const auto& subtree : subtrees) {
        if (!subtree.anchor) {
            LOG_DEBUG("floating root {} has no anchor, laid out on its own", subtree.root);
            continue;
        }

        NodeIndex rootIdx = graph.find(subtree.root);
        NodeIndex anchorIdx = graph.find(*subtree.anchor);
        if (rootIdx == NO_NODE || anchorIdx == NO_NODE || rootIdx == anchorIdx) {
            LOG_DEBUG("anchor {} of floating root {} is not a layout node",
                      *subtree.anchor, subtree.root);
            continue;
        }

        auto& siblings = graph.nodes[anchorIdx].children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), rootIdx), siblings.end());
        siblings.insert(siblings.begin(), rootIdx);
        graph.nodes[rootIdx].parent = anchorIdx;

        out.virtualEdges.push_back({*subtree.anchor, subtree.root});
        LOG_TRACE("virtual edge {} -> {}", *subtree.anchor, subtree.root);
    }
}

}  // namespace algorithms
}  // namespace mindarbor
