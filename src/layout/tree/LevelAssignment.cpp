#include "LevelAssignment.h"

#include <algorithm>
#include <queue>

namespace mindarbor {
namespace algorithms {

int LevelAssignment::assign(LayoutGraph& graph, const std::vector<NodeIndex>& roots) const {
    std::queue<NodeIndex> queue;
    std::vector<float> levelWidths;

    auto visit = [&](NodeIndex idx, int level) {
        auto& node = graph.nodes[idx];
        node.level = level;
        if (static_cast<size_t>(level) >= levelWidths.size()) {
            levelWidths.resize(static_cast<size_t>(level) + 1, 0.0f);
        }
        levelWidths[static_cast<size_t>(level)] =
            std::max(levelWidths[static_cast<size_t>(level)], node.width);
        queue.push(idx);
    };

    for (NodeIndex root : roots) {
        if (graph.nodes[root].level < 0) {
            visit(root, 0);
        }
    }

    while (!queue.empty()) {
        NodeIndex current = queue.front();
        queue.pop();
        int childLevel = graph.nodes[current].level + 1;
        for (NodeIndex child : graph.nodes[current].children) {
            if (graph.nodes[child].level < 0) {
                visit(child, childLevel);
            }
        }
    }

    std::vector<float> columns = columnPositions(levelWidths);
    for (auto& node : graph.nodes) {
        if (node.level >= 0) {
            node.x = columns[static_cast<size_t>(node.level)];
        }
    }

    return static_cast<int>(levelWidths.size());
}

std::vector<float> LevelAssignment::columnPositions(const std::vector<float>& levelWidths) const {
    std::vector<float> columns;
    columns.reserve(levelWidths.size());

    float currentX = 0.0f;
    for (float width : levelWidths) {
        columns.push_back(currentX);
        float column = isProvidedDimension(width) ? width : fallbackWidth_;
        currentX += column + horizontalSpacing_;
    }
    return columns;
}

}  // namespace algorithms
}  // namespace mindarbor
