#include "mindarbor/layout/config/LayoutResult.h"
#include "mindarbor/layout/LayoutSerializer.h"

#include <algorithm>
#include <limits>

namespace mindarbor {

void LayoutResult::setNodeLayout(const NodeLayout& layout) {
    auto it = index_.find(layout.id);
    if (it != index_.end()) {
        nodeLayouts_[it->second] = layout;
        return;
    }
    index_[layout.id] = nodeLayouts_.size();
    nodeLayouts_.push_back(layout);
}

const NodeLayout* LayoutResult::getNodeLayout(const NodeId& id) const {
    auto it = index_.find(id);
    return it != index_.end() ? &nodeLayouts_[it->second] : nullptr;
}

NodeLayout* LayoutResult::getNodeLayout(const NodeId& id) {
    auto it = index_.find(id);
    return it != index_.end() ? &nodeLayouts_[it->second] : nullptr;
}

bool LayoutResult::hasNodeLayout(const NodeId& id) const {
    return index_.find(id) != index_.end();
}

bool LayoutResult::removeNodeLayout(const NodeId& id) {
    auto it = index_.find(id);
    if (it == index_.end()) return false;

    size_t removed = it->second;
    nodeLayouts_.erase(nodeLayouts_.begin() + static_cast<std::ptrdiff_t>(removed));
    index_.erase(it);
    for (auto& [nodeId, idx] : index_) {
        if (idx > removed) --idx;
    }
    return true;
}

Rect LayoutResult::computeBounds() const {
    return computeBounds(0.0f);
}

Rect LayoutResult::computeBounds(float padding) const {
    if (nodeLayouts_.empty()) {
        return {0, 0, 0, 0};
    }

    float minX = std::numeric_limits<float>::max();
    float minY = std::numeric_limits<float>::max();
    float maxX = std::numeric_limits<float>::lowest();
    float maxY = std::numeric_limits<float>::lowest();

    for (const auto& layout : nodeLayouts_) {
        minX = std::min(minX, layout.position.x);
        minY = std::min(minY, layout.position.y);
        maxX = std::max(maxX, layout.position.x + layout.size.width);
        maxY = std::max(maxY, layout.position.y + layout.size.height);
    }

    return {
        minX - padding,
        minY - padding,
        maxX - minX + 2 * padding,
        maxY - minY + 2 * padding
    };
}

std::vector<NodeId> LayoutResult::nodesInLayer(int layer) const {
    std::vector<const NodeLayout*> members;
    for (const auto& layout : nodeLayouts_) {
        if (layout.layer == layer) {
            members.push_back(&layout);
        }
    }
    std::stable_sort(members.begin(), members.end(), [](const NodeLayout* a, const NodeLayout* b) {
        return a->position.y < b->position.y;
    });

    std::vector<NodeId> result;
    result.reserve(members.size());
    for (const auto* layout : members) {
        result.push_back(layout->id);
    }
    return result;
}

void LayoutResult::translate(float dx, float dy) {
    for (auto& layout : nodeLayouts_) {
        layout.position.x += dx;
        layout.position.y += dy;
    }
}

void LayoutResult::clear() {
    nodeLayouts_.clear();
    index_.clear();
    virtualEdges_.clear();
    stats_ = LayoutStats{};
    layerCount_ = 0;
}

std::string LayoutResult::toJson() const {
    return LayoutSerializer::toJson(*this);
}

LayoutResult LayoutResult::fromJson(const std::string& json) {
    return LayoutSerializer::layoutResultFromJson(json);
}

}  // namespace mindarbor
