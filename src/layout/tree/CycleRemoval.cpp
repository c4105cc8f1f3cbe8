#include "CycleRemoval.h"
#include "mindarbor/common/Logger.h"

namespace mindarbor {
namespace algorithms {

CycleRemovalResult CycleRemoval::breakCycles(LayoutGraph& graph, OrphanPolicy policy) const {
    CycleRemovalResult result;
    std::vector<NodeState> state(graph.size(), NodeState::White);

    for (NodeIndex i = 0; i < graph.size(); ++i) {
        const auto& node = graph.nodes[i];
        if (node.visible && node.parent == NO_NODE) {
            result.roots.push_back(i);
        }
    }

    for (NodeIndex root : result.roots) {
        if (state[root] == NodeState::White) {
            result.removedEdges += dfs(root, graph, state);
        }
    }

    // Visible nodes no root reached: cycles without an entry point, or
    // floating subtrees hanging from a hidden anchor
    for (NodeIndex i = 0; i < graph.size(); ++i) {
        if (!graph.nodes[i].visible || state[i] != NodeState::White) continue;

        if (policy == OrphanPolicy::PromoteToRoot) {
            result.roots.push_back(i);
            ++result.promotedOrphans;
            result.removedEdges += dfs(i, graph, state);
            LOG_DEBUG("promoted unreached node {} to root", graph.nodes[i].id);
        } else {
            ++result.unreachedNodes;
        }
    }

    if (result.removedEdges > 0) {
        LOG_DEBUG("removed {} cycle links", result.removedEdges);
    }
    return result;
}

size_t CycleRemoval::dfs(NodeIndex start, LayoutGraph& graph, std::vector<NodeState>& state) const {
    struct Frame {
        NodeIndex node;
        size_t nextChild;
    };

    size_t removed = 0;
    std::vector<Frame> stack;
    stack.push_back({start, 0});
    state[start] = NodeState::Gray;

    while (!stack.empty()) {
        Frame& frame = stack.back();
        auto& children = graph.nodes[frame.node].children;

        if (frame.nextChild >= children.size()) {
            state[frame.node] = NodeState::Black;
            stack.pop_back();
            continue;
        }

        NodeIndex child = children[frame.nextChild];
        if (state[child] == NodeState::Gray) {
            // Back link - drop it, the next child slides into this slot
            LOG_TRACE("dropping cycle link {} -> {}", graph.nodes[frame.node].id, graph.nodes[child].id);
            children.erase(children.begin() + static_cast<std::ptrdiff_t>(frame.nextChild));
            ++removed;
            continue;
        }

        ++frame.nextChild;
        if (state[child] == NodeState::White) {
            state[child] = NodeState::Gray;
            stack.push_back({child, 0});  // invalidates `frame`
        }
    }

    return removed;
}

}  // namespace algorithms
}  // namespace mindarbor
