#include "mindarbor/core/ParentChildMap.h"

#include <algorithm>
#include <unordered_set>

namespace mindarbor {

const std::vector<NodeId> ParentChildMap::emptyChildren_;

ParentChildMap ParentChildMap::build(const EdgeList& edges, const AcceptFn& accept) {
    ParentChildMap map;

    for (const auto& edge : edges) {
        if (edge.isSelfLoop()) continue;
        if (accept && (!accept(edge.from) || !accept(edge.to))) continue;

        auto& siblings = map.children_[edge.from];
        if (std::find(siblings.begin(), siblings.end(), edge.to) != siblings.end()) {
            continue;  // duplicate (from, to)
        }
        siblings.push_back(edge.to);
        map.parents_[edge.to] = edge.from;
        ++map.edgeCount_;
    }

    return map;
}

const std::vector<NodeId>& ParentChildMap::children(const NodeId& id) const {
    auto it = children_.find(id);
    if (it != children_.end()) {
        return it->second;
    }
    return emptyChildren_;
}

std::optional<NodeId> ParentChildMap::parent(const NodeId& id) const {
    auto it = parents_.find(id);
    if (it == parents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ParentChildMap::hasParent(const NodeId& id) const {
    return parents_.find(id) != parents_.end();
}

bool ParentChildMap::hasEdge(const NodeId& from, const NodeId& to) const {
    const auto& kids = children(from);
    return std::find(kids.begin(), kids.end(), to) != kids.end();
}

std::vector<NodeId> ParentChildMap::descendants(const NodeId& id) const {
    std::vector<NodeId> result;
    std::unordered_set<NodeId> visited{id};

    // Explicit stack; children pushed in reverse so they pop in edge order
    std::vector<NodeId> stack;
    const auto& rootChildren = children(id);
    stack.assign(rootChildren.rbegin(), rootChildren.rend());

    while (!stack.empty()) {
        NodeId current = std::move(stack.back());
        stack.pop_back();
        if (!visited.insert(current).second) continue;

        result.push_back(current);
        const auto& kids = children(current);
        for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
            if (visited.find(*it) == visited.end()) {
                stack.push_back(*it);
            }
        }
    }

    return result;
}

}  // namespace mindarbor
