#include "mindarbor/visibility/CollapseState.h"

namespace mindarbor {

bool CollapseState::toggle(const NodeId& id) {
    if (collapsed_.erase(id) > 0) {
        return false;
    }
    collapsed_.insert(id);
    return true;
}

size_t CollapseState::retainOnly(const std::unordered_set<NodeId>& existing) {
    size_t removed = 0;
    for (auto it = collapsed_.begin(); it != collapsed_.end();) {
        if (existing.count(*it) == 0) {
            it = collapsed_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

}  // namespace mindarbor
