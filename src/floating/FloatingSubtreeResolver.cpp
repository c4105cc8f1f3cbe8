#include "mindarbor/floating/FloatingSubtreeResolver.h"
#include "mindarbor/common/Logger.h"

#include <unordered_set>

namespace mindarbor {

namespace {

/// True when some ancestor on the complete parent chain is floating
bool hasFloatingAncestor(const NodeId& id,
                         const std::unordered_set<NodeId>& floating,
                         const ParentChildMap& completeMap) {
    std::unordered_set<NodeId> seen{id};
    auto parent = completeMap.parent(id);
    while (parent) {
        if (!seen.insert(*parent).second) {
            return false;  // cycle in the history
        }
        if (floating.count(*parent)) {
            return true;
        }
        parent = completeMap.parent(*parent);
    }
    return false;
}

}  // namespace

std::vector<FloatingSubtree> FloatingSubtreeResolver::resolve(const FloatingMarkers& markers,
                                                              const NodeMap& eligible,
                                                              const ParentChildMap& completeMap) {
    std::vector<FloatingSubtree> subtrees;
    if (markers.empty()) {
        return subtrees;
    }

    std::unordered_set<NodeId> floating;
    for (const auto& node : eligible) {
        if (isMarkedFloating(markers, node.id)) {
            floating.insert(node.id);
        }
    }

    size_t stale = 0;
    for (const auto& [id, marker] : markers) {
        if (marker.isFloating && !eligible.hasNode(id)) ++stale;
    }
    if (stale > 0) {
        LOG_DEBUG("ignoring {} floating markers of absent or hidden nodes", stale);
    }

    for (const auto& node : eligible) {
        if (!floating.count(node.id)) continue;
        if (hasFloatingAncestor(node.id, floating, completeMap)) continue;

        FloatingSubtree subtree;
        subtree.root = node.id;
        subtree.members.push_back(node.id);
        for (auto& member : completeMap.descendants(node.id)) {
            subtree.members.push_back(std::move(member));
        }

        if (auto recorded = recordedOriginalParent(markers, node.id)) {
            subtree.anchor = std::move(recorded);
        } else if (auto historical = completeMap.parent(node.id)) {
            subtree.anchor = std::move(historical);
            subtree.anchorFromHistory = true;
        }
        if (subtree.anchor && *subtree.anchor == subtree.root) {
            subtree.anchor.reset();
            subtree.anchorFromHistory = false;
        }

        LOG_TRACE("floating root {} ({} members) anchored at {}",
                  subtree.root, subtree.members.size(),
                  subtree.anchor ? *subtree.anchor : std::string("<none>"));
        subtrees.push_back(std::move(subtree));
    }

    return subtrees;
}

FloatingMarkers FloatingSubtreeResolver::toMarkers(const FloatingSubtree& subtree) {
    FloatingMarkers markers;
    for (const auto& member : subtree.members) {
        if (member == subtree.root) continue;
        markers[member] = FloatingMarker(true);
    }
    markers[subtree.root] = subtree.anchor
        ? FloatingMarker(true, *subtree.anchor)
        : FloatingMarker(true);
    return markers;
}

FloatingMarkers FloatingSubtreeResolver::toMarkers(const std::vector<FloatingSubtree>& subtrees) {
    FloatingMarkers merged;
    for (const auto& subtree : subtrees) {
        for (auto& [id, marker] : toMarkers(subtree)) {
            // A root record never loses its anchor to a plain member record
            auto it = merged.find(id);
            if (it != merged.end() && it->second.originalParent && !marker.originalParent) {
                continue;
            }
            merged[id] = marker;
        }
    }
    return merged;
}

}  // namespace mindarbor
