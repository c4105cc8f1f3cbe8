#pragma once

#include "ILayout.h"

namespace mindarbor {

/// Left-to-right leveled tree layout with floating-subtree anchoring
///
/// Phases, in order:
/// 1. Graph building - size every node, build the live and historical
///    parent/child maps, attach floating subtrees through virtual edges
/// 2. Cycle removal - drop back edges, promote unreached nodes to roots
/// 3. Coordinate assignment - subtree heights bottom-up, then Y top-down
///    with children centered on (but never above) their parent
/// 4. Level assignment - BFS levels from the roots, one X column per level
///
/// Usage:
/// @code
/// mindarbor::TreeLayout layout(mindarbor::LayoutSettings::defaults());
/// mindarbor::LayoutRequest request(visibleNodes, visibleEdges);
/// request.floatingMarkers = &markers;
/// auto result = layout.layout(request);
/// @endcode
class TreeLayout : public ILayout {
public:
    TreeLayout() = default;
    explicit TreeLayout(const LayoutSettings& settings) : settings_(settings) {}

    void setSettings(const LayoutSettings& settings) override { settings_ = settings; }
    const LayoutSettings& settings() const override { return settings_; }

    LayoutResult layout(const LayoutRequest& request) override;

private:
    LayoutSettings settings_;
};

}  // namespace mindarbor
