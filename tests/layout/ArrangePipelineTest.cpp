#include <gtest/gtest.h>
#include <mindarbor/mindarbor.h>

#include <memory>

using namespace mindarbor;

// ============================================================================
// ArrangePipelineTest - visibility + floating + layout in one call
// ============================================================================

namespace {

CanvasSnapshot mindMap() {
    CanvasSnapshot snapshot;
    for (const char* id : {"root", "a", "a1", "a2", "b", "b1"}) {
        snapshot.nodes.addNode(NodeData(id, 200.0f, 60.0f));
    }
    snapshot.edges = {{"root", "a"}, {"a", "a1"}, {"a", "a2"}, {"root", "b"}, {"b", "b1"}};
    return snapshot;
}

/// Layout that records the request it saw and returns nothing
class EmptyLayout : public ILayout {
public:
    void setSettings(const LayoutSettings& settings) override { settings_ = settings; }
    const LayoutSettings& settings() const override { return settings_; }
    LayoutResult layout(const LayoutRequest& request) override {
        sawAllNodes = request.allNodes != nullptr;
        return LayoutResult();
    }

    bool sawAllNodes = false;

private:
    LayoutSettings settings_;
};

}  // namespace

TEST(ArrangePipelineTest, ArrangesAllVisibleNodes) {
    ArrangePipeline pipeline;
    ArrangeOutcome outcome = pipeline.arrange(mindMap());

    EXPECT_TRUE(outcome.arranged());
    EXPECT_EQ(outcome.result.nodeCount(), 6u);
    EXPECT_TRUE(outcome.hidden.empty());
    EXPECT_TRUE(outcome.notice().empty());
}

TEST(ArrangePipelineTest, CollapsedSubtreeExcludedFromResult) {
    CanvasSnapshot snapshot = mindMap();
    snapshot.collapsed.markCollapsed("a");

    ArrangePipeline pipeline;
    ArrangeOutcome outcome = pipeline.arrange(snapshot);

    ASSERT_TRUE(outcome.arranged());
    EXPECT_TRUE(outcome.result.hasNodeLayout("a"));
    EXPECT_FALSE(outcome.result.hasNodeLayout("a1"));
    EXPECT_FALSE(outcome.result.hasNodeLayout("a2"));
    EXPECT_EQ(outcome.hidden.size(), 2u);
}

TEST(ArrangePipelineTest, HiddenNodesDoNotMoveOtherNodes) {
    CanvasSnapshot collapsed = mindMap();
    collapsed.collapsed.markCollapsed("a");

    // Same document with a's children deleted outright
    CanvasSnapshot pruned = mindMap();
    pruned.nodes.removeNode("a1");
    pruned.nodes.removeNode("a2");
    pruned.edges = {{"root", "a"}, {"root", "b"}, {"b", "b1"}};

    ArrangePipeline pipeline;
    LayoutResult withCollapse = pipeline.arrange(collapsed).result;
    LayoutResult withoutNodes = pipeline.arrange(pruned).result;

    ASSERT_EQ(withCollapse.nodeCount(), withoutNodes.nodeCount());
    for (const auto& layout : withoutNodes.nodeLayouts()) {
        const NodeLayout* other = withCollapse.getNodeLayout(layout.id);
        ASSERT_NE(other, nullptr) << layout.id;
        EXPECT_EQ(other->position, layout.position) << layout.id;
    }
}

TEST(ArrangePipelineTest, FloatingSubtreeHiddenWithCollapsedAnchor) {
    CanvasSnapshot snapshot = mindMap();
    snapshot.nodes.addNode(NodeData("f", 200.0f, 60.0f));
    snapshot.floatingMarkers["f"] = FloatingMarker(true, "a");
    snapshot.collapsed.markCollapsed("a");

    ArrangePipeline pipeline;
    ArrangeOutcome outcome = pipeline.arrange(snapshot);

    EXPECT_TRUE(outcome.hidden.count("f"));
    EXPECT_FALSE(outcome.result.hasNodeLayout("f"));
}

TEST(ArrangePipelineTest, FloatingSubtreeAnchoredWhenVisible) {
    CanvasSnapshot snapshot = mindMap();
    snapshot.nodes.addNode(NodeData("f", 200.0f, 60.0f));
    snapshot.originalEdges = snapshot.edges;
    snapshot.originalEdges.push_back({"b", "f"});
    snapshot.floatingMarkers["f"] = FloatingMarker(true, "b");

    ArrangePipeline pipeline;
    ArrangeOutcome outcome = pipeline.arrange(snapshot);

    ASSERT_TRUE(outcome.arranged());
    const NodeLayout* f = outcome.result.getNodeLayout("f");
    const NodeLayout* b1 = outcome.result.getNodeLayout("b1");
    ASSERT_NE(f, nullptr);
    ASSERT_NE(b1, nullptr);
    EXPECT_EQ(f->layer, 2);
    EXPECT_LT(f->position.y, b1->position.y);
}

TEST(ArrangePipelineTest, NoNodes) {
    ArrangePipeline pipeline;
    ArrangeOutcome outcome = pipeline.arrange(CanvasSnapshot());

    EXPECT_EQ(outcome.status, ArrangeStatus::NoNodes);
    EXPECT_FALSE(outcome.notice().empty());
}

TEST(ArrangePipelineTest, EmptyLayoutResultReported) {
    auto layout = std::make_unique<EmptyLayout>();
    EmptyLayout* raw = layout.get();
    ArrangePipeline pipeline(std::move(layout));

    ArrangeOutcome outcome = pipeline.arrange(mindMap());

    EXPECT_EQ(outcome.status, ArrangeStatus::EmptyResult);
    EXPECT_STREQ(arrangeStatusName(outcome.status), "empty-result");
    EXPECT_TRUE(raw->sawAllNodes);
}

TEST(ArrangePipelineTest, SettingsForwardedToLayout) {
    LayoutSettings settings;
    settings.horizontalSpacing = 10.0f;
    ArrangePipeline pipeline(settings);

    ArrangeOutcome outcome = pipeline.arrange(mindMap());

    EXPECT_FLOAT_EQ(pipeline.settings().horizontalSpacing, 10.0f);
    EXPECT_FLOAT_EQ(outcome.result.getNodeLayout("a")->position.x, 210.0f);
}

TEST(ArrangePipelineTest, ApplyResultWritesPositionsBack) {
    CanvasSnapshot snapshot = mindMap();
    snapshot.nodes.addNode(NodeData("formula", 0.0f, 0.0f, "$$x$$"));

    ArrangePipeline pipeline;
    ArrangeOutcome outcome = pipeline.arrange(snapshot);
    size_t updated = ArrangePipeline::applyResult(snapshot.nodes, outcome.result);

    EXPECT_EQ(updated, 7u);
    const NodeData& a = snapshot.nodes.getNode("a");
    EXPECT_FLOAT_EQ(a.x, outcome.result.getNodeLayout("a")->position.x);
    EXPECT_FLOAT_EQ(a.y, outcome.result.getNodeLayout("a")->position.y);
    EXPECT_FLOAT_EQ(*snapshot.nodes.getNode("formula").height, 80.0f);
}
