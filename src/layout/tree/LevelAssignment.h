#pragma once

#include "LayoutGraph.h"

#include <vector>

namespace mindarbor {
namespace algorithms {

/// Horizontal placement by breadth-first leveling.
///
/// All roots start at level 0 and are enqueued together; a child takes its
/// parent's level + 1 the first time it is discovered and keeps it. Each
/// level becomes a column as wide as its widest node; columns are separated
/// by the horizontal spacing.
class LevelAssignment {
public:
    /// @param fallbackWidth Column width used for a level whose widest node is 0
    LevelAssignment(float horizontalSpacing, float fallbackWidth)
        : horizontalSpacing_(horizontalSpacing), fallbackWidth_(fallbackWidth) {}

    /// Assign level and x to every reached node
    /// @return Number of levels
    int assign(LayoutGraph& graph, const std::vector<NodeIndex>& roots) const;

    /// Left edge of every level column, level 0 at x = 0
    std::vector<float> columnPositions(const std::vector<float>& levelWidths) const;

private:
    float horizontalSpacing_;
    float fallbackWidth_;
};

}  // namespace algorithms
}  // namespace mindarbor
