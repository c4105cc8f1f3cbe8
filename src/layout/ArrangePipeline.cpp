#include "mindarbor/layout/ArrangePipeline.h"
#include "mindarbor/common/Logger.h"
#include "mindarbor/layout/TreeLayout.h"
#include "mindarbor/visibility/VisibilityResolver.h"

namespace mindarbor {

const char* arrangeStatusName(ArrangeStatus status) {
    switch (status) {
        case ArrangeStatus::Arranged: return "arranged";
        case ArrangeStatus::NoNodes: return "no-nodes";
        case ArrangeStatus::NoVisibleNodes: return "no-visible-nodes";
        case ArrangeStatus::EmptyResult: return "empty-result";
    }
    return "unknown";
}

std::string ArrangeOutcome::notice() const {
    switch (status) {
        case ArrangeStatus::Arranged: return "";
        case ArrangeStatus::NoNodes: return "No nodes to arrange";
        case ArrangeStatus::NoVisibleNodes: return "No visible nodes to arrange";
        case ArrangeStatus::EmptyResult: return "Layout produced no positions";
    }
    return "";
}

ArrangePipeline::ArrangePipeline(const LayoutSettings& settings)
    : layout_(std::make_unique<TreeLayout>(settings)) {
}

ArrangePipeline::ArrangePipeline(std::unique_ptr<ILayout> layout)
    : layout_(layout ? std::move(layout) : std::make_unique<TreeLayout>()) {
}

ArrangePipeline::~ArrangePipeline() = default;
ArrangePipeline::ArrangePipeline(ArrangePipeline&&) noexcept = default;
ArrangePipeline& ArrangePipeline::operator=(ArrangePipeline&&) noexcept = default;

void ArrangePipeline::setSettings(const LayoutSettings& settings) {
    layout_->setSettings(settings);
}

const LayoutSettings& ArrangePipeline::settings() const {
    return layout_->settings();
}

ArrangeOutcome ArrangePipeline::arrange(const CanvasSnapshot& snapshot) {
    ArrangeOutcome outcome;

    if (snapshot.nodes.empty()) {
        outcome.status = ArrangeStatus::NoNodes;
        LOG_WARN("{}", outcome.notice());
        return outcome;
    }

    outcome.hidden = VisibilityResolver::hiddenNodes(
        snapshot.nodes, snapshot.edges, snapshot.collapsed, &snapshot.floatingMarkers);
    NodeMap visible = VisibilityResolver::visibleNodes(snapshot.nodes, outcome.hidden);
    if (visible.empty()) {
        outcome.status = ArrangeStatus::NoVisibleNodes;
        LOG_WARN("{}", outcome.notice());
        return outcome;
    }
    EdgeList visibleEdges = VisibilityResolver::visibleEdges(snapshot.edges, visible);

    LayoutRequest request(visible, visibleEdges);
    request.allNodes = &snapshot.nodes;
    request.originalEdges = snapshot.originalEdges.empty() ? &snapshot.edges : &snapshot.originalEdges;
    request.floatingMarkers = &snapshot.floatingMarkers;

    outcome.result = layout_->layout(request);
    for (const auto& id : outcome.hidden) {
        outcome.result.removeNodeLayout(id);
    }

    if (outcome.result.empty()) {
        outcome.status = ArrangeStatus::EmptyResult;
        LOG_WARN("{}", outcome.notice());
        return outcome;
    }

    outcome.status = ArrangeStatus::Arranged;
    LOG_INFO("arranged {} nodes ({} hidden)", outcome.result.nodeCount(), outcome.hidden.size());
    return outcome;
}

size_t ArrangePipeline::applyResult(NodeMap& nodes, const LayoutResult& result) {
    size_t updated = 0;
    for (const auto& layout : result.nodeLayouts()) {
        if (!nodes.hasNode(layout.id)) continue;
        NodeData& node = nodes.getNode(layout.id);
        node.x = layout.position.x;
        node.y = layout.position.y;
        node.width = layout.size.width;
        node.height = layout.size.height;
        ++updated;
    }
    return updated;
}

}  // namespace mindarbor
