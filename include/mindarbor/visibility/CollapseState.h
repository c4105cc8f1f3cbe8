#pragma once

#include "mindarbor/core/Types.h"

#include <unordered_set>
#include <vector>

namespace mindarbor {

/// Set of nodes the user has collapsed. Owned by the host; the layout core
/// only reads it.
class CollapseState {
public:
    CollapseState() = default;
    explicit CollapseState(std::unordered_set<NodeId> collapsed)
        : collapsed_(std::move(collapsed)) {}

    void markCollapsed(const NodeId& id) { collapsed_.insert(id); }
    void markExpanded(const NodeId& id) { collapsed_.erase(id); }

    /// Flip the state of a node.
    /// @return true if the node is collapsed afterwards
    bool toggle(const NodeId& id);

    bool isCollapsed(const NodeId& id) const { return collapsed_.count(id) > 0; }

    /// Forget collapsed ids that no longer exist in the document
    /// @return number of ids removed
    size_t retainOnly(const std::unordered_set<NodeId>& existing);

    void clear() { collapsed_.clear(); }
    size_t size() const { return collapsed_.size(); }
    bool empty() const { return collapsed_.empty(); }

    const std::unordered_set<NodeId>& all() const { return collapsed_; }

private:
    std::unordered_set<NodeId> collapsed_;
};

}  // namespace mindarbor
