#pragma once

#include "Types.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace mindarbor {

/// Snapshot of one canvas node as the layout engine reads it
struct NodeData {
    NodeId id;
    float x = 0.0f;
    float y = 0.0f;
    std::optional<float> width;   ///< Absent = use the per-kind fallback
    std::optional<float> height;  ///< Absent = use the per-kind fallback
    std::string text;             ///< Raw node content (markdown, formula, embed)

    NodeData() = default;
    explicit NodeData(NodeId nodeId) : id(std::move(nodeId)) {}
    NodeData(NodeId nodeId, float w, float h)
        : id(std::move(nodeId)), width(w), height(h) {}
    NodeData(NodeId nodeId, float w, float h, std::string content)
        : id(std::move(nodeId)), width(w), height(h), text(std::move(content)) {}

    Point position() const { return {x, y}; }
};

/// Insertion-ordered collection of nodes keyed by id.
///
/// Iteration order is the order in which ids were first added. Root selection
/// and BFS leveling depend on it, so two snapshots with the same content and
/// the same order always lay out identically.
class NodeMap {
public:
    NodeMap() = default;

    /// Add a node, or replace the existing node with the same id in place
    /// (the original insertion position is kept).
    void addNode(const NodeData& data);

    void removeNode(const NodeId& id);
    bool hasNode(const NodeId& id) const;

    // Node access API:
    // - getNode(): reference return for ids known to exist.
    //   Throws std::out_of_range if the id is unknown.
    //   WARNING: the reference is invalidated by addNode()/removeNode().
    // - tryGetNode(): copy return, std::nullopt for unknown ids.
    const NodeData& getNode(const NodeId& id) const;
    NodeData& getNode(const NodeId& id);
    std::optional<NodeData> tryGetNode(const NodeId& id) const;

    /// Node ids in insertion order
    std::vector<NodeId> ids() const;

    /// Nodes in insertion order
    const std::vector<NodeData>& nodes() const { return nodes_; }

    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

    void clear();

    auto begin() const { return nodes_.begin(); }
    auto end() const { return nodes_.end(); }

private:
    std::vector<NodeData> nodes_;
    std::unordered_map<NodeId, size_t> index_;
};

}  // namespace mindarbor
