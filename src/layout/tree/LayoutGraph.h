#pragma once

#include "mindarbor/content/ContentKind.h"
#include "mindarbor/core/Types.h"

#include <cstddef>
#include <limits>
#include <unordered_map>
#include <vector>

namespace mindarbor {
namespace algorithms {

/// Index of a node inside LayoutGraph::nodes
using NodeIndex = size_t;

constexpr NodeIndex NO_NODE = std::numeric_limits<NodeIndex>::max();

/// Engine-private node, rebuilt on every layout call
struct LayoutNode {
    NodeId id;
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    ContentKind kind = ContentKind::Text;

    std::vector<NodeIndex> children;  ///< Live children, virtual children first
    NodeIndex parent = NO_NODE;       ///< Live or virtual parent

    float subtreeHeight = 0.0f;
    int level = -1;                   ///< -1 until reached by the level BFS
    bool visible = true;              ///< False for nodes only present in allNodes
};

/// Arena of layout nodes addressed by index
struct LayoutGraph {
    std::vector<LayoutNode> nodes;
    std::unordered_map<NodeId, NodeIndex> index;

    NodeIndex find(const NodeId& id) const {
        auto it = index.find(id);
        return it != index.end() ? it->second : NO_NODE;
    }

    bool contains(const NodeId& id) const { return index.find(id) != index.end(); }

    NodeIndex add(LayoutNode node) {
        NodeIndex idx = nodes.size();
        index[node.id] = idx;
        nodes.push_back(std::move(node));
        return idx;
    }

    size_t size() const { return nodes.size(); }
};

}  // namespace algorithms
}  // namespace mindarbor
