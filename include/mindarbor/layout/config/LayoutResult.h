#pragma once

#include "../../core/Types.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace mindarbor {

/// Positioned node in the layout result
struct NodeLayout {
    NodeId id;
    Point position;            // Top-left corner
    Size size;                 // Size after fallbacks
    int layer = -1;            // Level index, -1 when no root reached the node
    float subtreeHeight = 0.0f;

    bool isPlaced() const { return layer >= 0; }

    Point center() const {
        return {position.x + size.width / 2, position.y + size.height / 2};
    }

    Rect bounds() const {
        return {position.x, position.y, size.width, size.height};
    }
};

/// Layout-time edge synthesized for a floating subtree
struct VirtualEdge {
    NodeId anchor;
    NodeId root;
};

/// Counters describing one layout run
struct LayoutStats {
    size_t nodeCount = 0;           ///< Initialized layout nodes
    size_t rootCount = 0;           ///< Roots, promoted orphans included
    size_t promotedOrphans = 0;
    size_t unreachedNodes = 0;      ///< Visible nodes left at their input position
    size_t virtualEdgeCount = 0;
    size_t removedCycleEdges = 0;
    size_t formulaNodes = 0;
    int layerCount = 0;
};

/// Complete layout result.
///
/// Node layouts keep the order of layout-node initialization, so iterating
/// the result is deterministic.
class LayoutResult {
public:
    LayoutResult() = default;

    // Node layout operations
    void setNodeLayout(const NodeLayout& layout);
    const NodeLayout* getNodeLayout(const NodeId& id) const;
    NodeLayout* getNodeLayout(const NodeId& id);
    bool hasNodeLayout(const NodeId& id) const;
    bool removeNodeLayout(const NodeId& id);

    // Iteration (insertion order)
    const std::vector<NodeLayout>& nodeLayouts() const { return nodeLayouts_; }

    // Virtual edges
    void addVirtualEdge(const VirtualEdge& edge) { virtualEdges_.push_back(edge); }
    const std::vector<VirtualEdge>& virtualEdges() const { return virtualEdges_; }

    // Bounds of all node rectangles
    Rect computeBounds() const;
    Rect computeBounds(float padding) const;

    // Layer information
    void setLayerCount(int count) { layerCount_ = count; }
    int layerCount() const { return layerCount_; }

    /// Ids on one layer, top to bottom
    std::vector<NodeId> nodesInLayer(int layer) const;

    // Statistics
    size_t nodeCount() const { return nodeLayouts_.size(); }
    bool empty() const { return nodeLayouts_.empty(); }
    void setStats(const LayoutStats& stats) { stats_ = stats; }
    const LayoutStats& stats() const { return stats_; }

    // Translate all positions
    void translate(float dx, float dy);

    void clear();

    // Serialization (JSON format)
    std::string toJson() const;
    static LayoutResult fromJson(const std::string& json);

private:
    std::vector<NodeLayout> nodeLayouts_;
    std::unordered_map<NodeId, size_t> index_;
    std::vector<VirtualEdge> virtualEdges_;
    LayoutStats stats_;
    int layerCount_ = 0;
};

}  // namespace mindarbor
