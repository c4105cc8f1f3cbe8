#include "mindarbor/visibility/VisibilityResolver.h"
#include "mindarbor/core/ParentChildMap.h"
#include "mindarbor/common/Logger.h"

#include <algorithm>
#include <iterator>
#include <vector>

namespace mindarbor {

namespace {

/// Add every descendant of @p start to @p hidden, expanding only nodes seen
/// for the first time
void hideDescendants(const NodeId& start,
                     const ParentChildMap& map,
                     std::unordered_set<NodeId>& hidden) {
    std::vector<NodeId> stack(map.children(start).rbegin(), map.children(start).rend());
    while (!stack.empty()) {
        NodeId current = std::move(stack.back());
        stack.pop_back();
        if (current == start) continue;  // cycle back to the collapsed node
        if (!hidden.insert(current).second) continue;

        const auto& kids = map.children(current);
        for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
            stack.push_back(*it);
        }
    }
}

}  // namespace

std::unordered_set<NodeId> VisibilityResolver::hiddenNodes(
    const NodeMap& nodes,
    const EdgeList& edges,
    const CollapseState& collapsed,
    const FloatingMarkers* markers) {

    std::unordered_set<NodeId> hidden;
    if (collapsed.empty()) {
        return hidden;
    }

    ParentChildMap map = ParentChildMap::build(edges);

    for (const auto& id : collapsed.all()) {
        hideDescendants(id, map, hidden);
    }

    // Floating subtrees follow their recorded anchor into hiding
    if (markers) {
        bool changed = true;
        while (changed) {
            changed = false;
            for (const auto& [id, marker] : *markers) {
                if (!marker.isFloating || !marker.originalParent) continue;
                if (hidden.count(id)) continue;

                const NodeId& anchor = *marker.originalParent;
                if (!collapsed.isCollapsed(anchor) && !hidden.count(anchor)) continue;

                hidden.insert(id);
                hideDescendants(id, map, hidden);
                changed = true;
            }
        }
    }

    // Report only ids that exist in the snapshot
    for (auto it = hidden.begin(); it != hidden.end();) {
        if (!nodes.hasNode(*it)) {
            it = hidden.erase(it);
        } else {
            ++it;
        }
    }

    LOG_DEBUG("{} collapsed, {} of {} nodes hidden",
              collapsed.size(), hidden.size(), nodes.size());
    return hidden;
}

NodeMap VisibilityResolver::visibleNodes(const NodeMap& nodes,
                                         const std::unordered_set<NodeId>& hidden) {
    NodeMap visible;
    for (const auto& node : nodes) {
        if (hidden.count(node.id) == 0) {
            visible.addNode(node);
        }
    }
    return visible;
}

EdgeList VisibilityResolver::visibleEdges(const EdgeList& edges, const NodeMap& visible) {
    EdgeList result;
    std::copy_if(edges.begin(), edges.end(), std::back_inserter(result),
                 [&visible](const Edge& edge) {
                     return visible.hasNode(edge.from) && visible.hasNode(edge.to);
                 });
    return result;
}

bool VisibilityResolver::isVisible(const NodeId& id,
                                   const NodeMap& nodes,
                                   const EdgeList& edges,
                                   const CollapseState& collapsed,
                                   const FloatingMarkers* markers) {
    return nodes.hasNode(id) && hiddenNodes(nodes, edges, collapsed, markers).count(id) == 0;
}

}  // namespace mindarbor
