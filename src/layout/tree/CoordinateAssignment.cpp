#include "CoordinateAssignment.h"

#include <algorithm>

namespace mindarbor {
namespace algorithms {

float CoordinateAssignment::childrenHeight(const LayoutGraph& graph, NodeIndex node) const {
    const auto& children = graph.nodes[node].children;
    if (children.empty()) {
        return 0.0f;
    }
    float total = 0.0f;
    for (NodeIndex child : children) {
        total += graph.nodes[child].subtreeHeight;
    }
    return total + static_cast<float>(children.size() - 1) * verticalSpacing_;
}

void CoordinateAssignment::computeSubtreeHeight(LayoutGraph& graph, NodeIndex root) const {
    struct Frame {
        NodeIndex node;
        bool expanded;
    };

    std::vector<Frame> stack;
    stack.push_back({root, false});

    while (!stack.empty()) {
        Frame frame = stack.back();
        stack.pop_back();
        auto& node = graph.nodes[frame.node];

        if (node.children.empty()) {
            node.subtreeHeight = node.height;
            continue;
        }

        if (!frame.expanded) {
            // Revisit after all children are done
            stack.push_back({frame.node, true});
            for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
                stack.push_back({*it, false});
            }
            continue;
        }

        node.subtreeHeight = std::max(node.height, childrenHeight(graph, frame.node));
    }
}

void CoordinateAssignment::assignY(LayoutGraph& graph, NodeIndex root) const {
    struct Frame {
        NodeIndex node;
        size_t nextChild;
        float currentY;
    };

    auto childrenStart = [&](NodeIndex idx) {
        const auto& node = graph.nodes[idx];
        float centered = node.y + node.height / 2 - childrenHeight(graph, idx) / 2;
        return std::max(node.y, centered);
    };

    graph.nodes[root].y = 0.0f;

    std::vector<Frame> stack;
    stack.push_back({root, 0, childrenStart(root)});

    while (!stack.empty()) {
        Frame& frame = stack.back();
        const auto& children = graph.nodes[frame.node].children;

        if (frame.nextChild >= children.size()) {
            stack.pop_back();
            continue;
        }

        NodeIndex child = children[frame.nextChild++];
        graph.nodes[child].y = frame.currentY;
        frame.currentY += graph.nodes[child].subtreeHeight + verticalSpacing_;

        stack.push_back({child, 0, childrenStart(child)});  // invalidates `frame`
    }
}

}  // namespace algorithms
}  // namespace mindarbor
