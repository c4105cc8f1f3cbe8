#include "mindarbor/floating/FloatingStateTracker.h"
#include "mindarbor/core/ParentChildMap.h"
#include "mindarbor/common/Logger.h"

#include <algorithm>

namespace mindarbor {

FloatingStateTracker::FloatingStateTracker(FloatingMarkers markers)
    : markers_(std::move(markers)) {
}

// === Events ===

bool FloatingStateTracker::onEdgeRemoved(const EdgeRemoved& event, const EdgeList& remainingEdges) {
    if (event.from.empty() || event.to.empty() || event.from == event.to) {
        return false;
    }

    bool hasOtherIncoming = std::any_of(remainingEdges.begin(), remainingEdges.end(),
        [&event](const Edge& edge) {
            return edge.to == event.to && !edge.isSelfLoop();
        });
    if (hasOtherIncoming) {
        LOG_DEBUG("{} still has an incoming edge, not floating", event.to);
        return false;
    }

    ParentChildMap map = ParentChildMap::build(remainingEdges);

    std::vector<NodeId> members{event.to};
    for (auto& id : map.descendants(event.to)) {
        members.push_back(std::move(id));
    }

    markers_[event.to] = FloatingMarker(true, event.from);
    for (size_t i = 1; i < members.size(); ++i) {
        auto it = markers_.find(members[i]);
        // A nested floating root keeps its own anchor
        if (it != markers_.end() && it->second.isFloating && it->second.originalParent) {
            continue;
        }
        markers_[members[i]] = FloatingMarker(true);
    }

    LOG_INFO("{} detached from {} with {} descendants", event.to, event.from, members.size() - 1);
    if (listener_) {
        listener_->onSubtreeFloated(event.to, event.from, members);
    }
    return true;
}

std::vector<NodeId> FloatingStateTracker::onEdgeAdded(const EdgeAdded& event, const EdgeList& currentEdges) {
    std::vector<NodeId> cleared;

    if (!event.to.empty() && isFloating(event.to)) {
        clearNode(event.to, currentEdges, cleared);
    }
    if (!event.from.empty() && isFloating(event.from)) {
        clearNode(event.from, currentEdges, cleared);
    }

    if (!cleared.empty()) {
        LOG_INFO("edge {} -> {} reattached {} floating nodes", event.from, event.to, cleared.size());
        if (listener_) {
            listener_->onFloatingCleared(cleared);
        }
    }
    return cleared;
}

void FloatingStateTracker::clearNode(const NodeId& id, const EdgeList& currentEdges,
                                     std::vector<NodeId>& cleared) {
    std::vector<NodeId> targets{id};

    // Members reachable through live edges
    ParentChildMap map = ParentChildMap::build(currentEdges);
    for (const auto& member : map.descendants(id)) {
        auto it = markers_.find(member);
        if (it != markers_.end() && it->second.isFloating && !it->second.originalParent) {
            targets.push_back(member);
        }
    }

    // Roots that were detached from this node
    for (auto& child : floatingChildrenOf(id)) {
        targets.push_back(std::move(child));
    }

    for (const auto& target : targets) {
        if (markers_.erase(target) > 0) {
            cleared.push_back(target);
        }
    }
}

std::vector<NodeId> FloatingStateTracker::reconcile(const NodeMap& nodes, const EdgeList& edges) {
    std::vector<NodeId> cleared;

    for (auto it = markers_.begin(); it != markers_.end();) {
        if (!it->second.isFloating || !nodes.hasNode(it->first)) {
            cleared.push_back(it->first);
            it = markers_.erase(it);
        } else {
            ++it;
        }
    }

    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& edge : edges) {
            if (edge.isSelfLoop()) continue;
            if (!isFloating(edge.to) || isFloating(edge.from)) continue;
            if (!nodes.hasNode(edge.from)) continue;

            markers_.erase(edge.to);
            cleared.push_back(edge.to);
            changed = true;
        }
    }

    if (!cleared.empty()) {
        LOG_DEBUG("dropped {} stale floating markers", cleared.size());
        if (listener_) {
            listener_->onFloatingCleared(cleared);
        }
    }
    return cleared;
}

// === Queries ===

bool FloatingStateTracker::isFloating(const NodeId& id) const {
    return isMarkedFloating(markers_, id);
}

std::optional<NodeId> FloatingStateTracker::originalParent(const NodeId& id) const {
    return recordedOriginalParent(markers_, id);
}

std::vector<NodeId> FloatingStateTracker::floatingChildrenOf(const NodeId& parentId) const {
    std::vector<NodeId> children;
    for (const auto& [id, marker] : markers_) {
        if (marker.isFloating && marker.originalParent && *marker.originalParent == parentId) {
            children.push_back(id);
        }
    }
    std::sort(children.begin(), children.end());
    return children;
}

}  // namespace mindarbor
