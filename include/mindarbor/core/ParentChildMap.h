#pragma once

#include "Edge.h"

#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace mindarbor {

/// Ordered children lists plus a child -> parent lookup built from an edge list.
///
/// Build rules:
/// - an ordered (from, to) pair is recorded once, later duplicates are ignored
/// - self-loops are ignored
/// - edges whose endpoints fail the accept predicate are ignored
/// - when a node has several parents, the last edge seen wins the parent slot
///   (every parent still lists it as a child)
class ParentChildMap {
public:
    /// Endpoint filter applied to both ends of every edge
    using AcceptFn = std::function<bool(const NodeId&)>;

    ParentChildMap() = default;

    /// Build from canonical edges. An empty accept function accepts every id.
    static ParentChildMap build(const EdgeList& edges, const AcceptFn& accept = {});

    /// Children of a node in edge order (empty for unknown nodes)
    const std::vector<NodeId>& children(const NodeId& id) const;

    /// Recorded parent of a node, std::nullopt for roots and unknown nodes
    std::optional<NodeId> parent(const NodeId& id) const;

    bool hasParent(const NodeId& id) const;
    bool hasEdge(const NodeId& from, const NodeId& to) const;

    /// All descendants of a node reachable through children lists, in DFS
    /// pre-order. Every node is listed at most once and the start node is
    /// never listed, so cyclic input terminates.
    std::vector<NodeId> descendants(const NodeId& id) const;

    /// Number of distinct accepted edges
    size_t edgeCount() const { return edgeCount_; }
    bool empty() const { return edgeCount_ == 0; }

    const std::unordered_map<NodeId, std::vector<NodeId>>& childrenMap() const { return children_; }
    const std::unordered_map<NodeId, NodeId>& parentMap() const { return parents_; }

private:
    std::unordered_map<NodeId, std::vector<NodeId>> children_;
    std::unordered_map<NodeId, NodeId> parents_;
    size_t edgeCount_ = 0;

    static const std::vector<NodeId> emptyChildren_;
};

}  // namespace mindarbor
