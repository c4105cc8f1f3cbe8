#pragma once

#include "LayoutGraph.h"

#include <vector>

namespace mindarbor {
namespace algorithms {

/// Vertical placement: subtree heights bottom-up, then Y top-down.
///
/// Expects an acyclic child structure below the roots (see CycleRemoval).
/// Both passes use explicit stacks and visit nodes in the same order as the
/// natural recursion, so a node shared by two parents ends up with the
/// placement of the parent visited last.
class CoordinateAssignment {
public:
    explicit CoordinateAssignment(float verticalSpacing) : verticalSpacing_(verticalSpacing) {}

    /// Leaf: own height. Internal node:
    /// max(own height, sum of child subtree heights + (n - 1) * spacing)
    void computeSubtreeHeight(LayoutGraph& graph, NodeIndex root) const;

    /// Root at y = 0; children stacked from
    /// max(y, y + height / 2 - childrenHeight / 2), separated by the spacing
    void assignY(LayoutGraph& graph, NodeIndex root) const;

    /// Stacked height of a node's children including the gaps between them
    float childrenHeight(const LayoutGraph& graph, NodeIndex node) const;

private:
    float verticalSpacing_;
};

}  // namespace algorithms
}  // namespace mindarbor
