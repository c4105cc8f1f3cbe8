#include "mindarbor/core/NodeMap.h"

namespace mindarbor {

void NodeMap::addNode(const NodeData& data) {
    auto it = index_.find(data.id);
    if (it != index_.end()) {
        nodes_[it->second] = data;
        return;
    }
    index_[data.id] = nodes_.size();
    nodes_.push_back(data);
}

void NodeMap::removeNode(const NodeId& id) {
    auto it = index_.find(id);
    if (it == index_.end()) return;

    size_t removed = it->second;
    nodes_.erase(nodes_.begin() + static_cast<std::ptrdiff_t>(removed));
    index_.erase(it);

    // Shift indices of everything stored after the removed slot
    for (auto& [nodeId, idx] : index_) {
        if (idx > removed) {
            --idx;
        }
    }
}

bool NodeMap::hasNode(const NodeId& id) const {
    return index_.find(id) != index_.end();
}

const NodeData& NodeMap::getNode(const NodeId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("Invalid node ID: " + id);
    }
    return nodes_[it->second];
}

NodeData& NodeMap::getNode(const NodeId& id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("Invalid node ID: " + id);
    }
    return nodes_[it->second];
}

std::optional<NodeData> NodeMap::tryGetNode(const NodeId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return nodes_[it->second];
}

std::vector<NodeId> NodeMap::ids() const {
    std::vector<NodeId> result;
    result.reserve(nodes_.size());
    for (const auto& node : nodes_) {
        result.push_back(node.id);
    }
    return result;
}

void NodeMap::clear() {
    nodes_.clear();
    index_.clear();
}

}  // namespace mindarbor
