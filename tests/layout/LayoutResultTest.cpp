#include <gtest/gtest.h>
#include <mindarbor/mindarbor.h>

using namespace mindarbor;

// ============================================================================
// LayoutResultTest - result container and JSON form
// ============================================================================

namespace {

NodeLayout makeLayout(const NodeId& id, float x, float y, float w, float h, int layer) {
    NodeLayout layout;
    layout.id = id;
    layout.position = {x, y};
    layout.size = {w, h};
    layout.layer = layer;
    return layout;
}

LayoutResult sampleResult() {
    NodeMap nodes;
    nodes.addNode(NodeData("P", 200.0f, 60.0f));
    nodes.addNode(NodeData("C", 200.0f, 60.0f));
    nodes.addNode(NodeData("F", 200.0f, 60.0f));
    EdgeList edges{{"P", "C"}};
    FloatingMarkers markers{{"F", FloatingMarker(true, "P")}};

    TreeLayout layout;
    LayoutRequest request(nodes, edges);
    request.floatingMarkers = &markers;
    return layout.layout(request);
}

}  // namespace

// --- Container ---

TEST(LayoutResultTest, SetNodeLayout_ReplacesExisting) {
    LayoutResult result;
    result.setNodeLayout(makeLayout("a", 0, 0, 10, 10, 0));
    result.setNodeLayout(makeLayout("b", 0, 20, 10, 10, 0));
    result.setNodeLayout(makeLayout("a", 5, 5, 10, 10, 1));

    ASSERT_EQ(result.nodeCount(), 2u);
    EXPECT_EQ(result.nodeLayouts()[0].id, "a");
    EXPECT_EQ(result.getNodeLayout("a")->layer, 1);
}

TEST(LayoutResultTest, RemoveNodeLayout_KeepsLookupConsistent) {
    LayoutResult result;
    result.setNodeLayout(makeLayout("a", 0, 0, 10, 10, 0));
    result.setNodeLayout(makeLayout("b", 0, 0, 10, 10, 0));
    result.setNodeLayout(makeLayout("c", 7, 0, 10, 10, 0));

    EXPECT_TRUE(result.removeNodeLayout("a"));
    EXPECT_FALSE(result.removeNodeLayout("a"));

    EXPECT_FALSE(result.hasNodeLayout("a"));
    ASSERT_NE(result.getNodeLayout("c"), nullptr);
    EXPECT_FLOAT_EQ(result.getNodeLayout("c")->position.x, 7.0f);
}

TEST(LayoutResultTest, ComputeBounds) {
    LayoutResult result;
    EXPECT_EQ(result.computeBounds().width, 0.0f);

    result.setNodeLayout(makeLayout("a", 0, 0, 100, 50, 0));
    result.setNodeLayout(makeLayout("b", 300, 100, 100, 50, 1));

    Rect bounds = result.computeBounds(10.0f);
    EXPECT_FLOAT_EQ(bounds.x, -10.0f);
    EXPECT_FLOAT_EQ(bounds.y, -10.0f);
    EXPECT_FLOAT_EQ(bounds.width, 420.0f);
    EXPECT_FLOAT_EQ(bounds.height, 170.0f);
}

TEST(LayoutResultTest, NodesInLayerSortedTopToBottom) {
    LayoutResult result;
    result.setNodeLayout(makeLayout("low", 0, 200, 10, 10, 1));
    result.setNodeLayout(makeLayout("root", 0, 0, 10, 10, 0));
    result.setNodeLayout(makeLayout("high", 0, 0, 10, 10, 1));

    std::vector<NodeId> expected{"high", "low"};
    EXPECT_EQ(result.nodesInLayer(1), expected);
    EXPECT_TRUE(result.nodesInLayer(5).empty());
}

TEST(LayoutResultTest, Translate) {
    LayoutResult result;
    result.setNodeLayout(makeLayout("a", 10, 20, 10, 10, 0));
    result.translate(5, -20);

    EXPECT_FLOAT_EQ(result.getNodeLayout("a")->position.x, 15.0f);
    EXPECT_FLOAT_EQ(result.getNodeLayout("a")->position.y, 0.0f);
}

TEST(LayoutResultTest, Clear) {
    LayoutResult result = sampleResult();
    result.clear();

    EXPECT_TRUE(result.empty());
    EXPECT_TRUE(result.virtualEdges().empty());
    EXPECT_EQ(result.layerCount(), 0);
}

// --- JSON Serialization ---

TEST(LayoutResultTest, ToJson_ContainsRequiredFields) {
    std::string json = sampleResult().toJson();

    EXPECT_NE(json.find("layerCount"), std::string::npos);
    EXPECT_NE(json.find("nodeLayouts"), std::string::npos);
    EXPECT_NE(json.find("virtualEdges"), std::string::npos);
    EXPECT_NE(json.find("subtreeHeight"), std::string::npos);
}

TEST(LayoutResultTest, FromJson_RestoresLayoutsAndVirtualEdges) {
    LayoutResult original = sampleResult();
    LayoutResult restored = LayoutResult::fromJson(original.toJson());

    EXPECT_EQ(restored.nodeCount(), original.nodeCount());
    EXPECT_EQ(restored.layerCount(), original.layerCount());

    for (const auto& layout : original.nodeLayouts()) {
        const NodeLayout* copy = restored.getNodeLayout(layout.id);
        ASSERT_NE(copy, nullptr) << layout.id;
        EXPECT_EQ(copy->position, layout.position);
        EXPECT_EQ(copy->size, layout.size);
        EXPECT_EQ(copy->layer, layout.layer);
        EXPECT_FLOAT_EQ(copy->subtreeHeight, layout.subtreeHeight);
    }

    ASSERT_EQ(restored.virtualEdges().size(), 1u);
    EXPECT_EQ(restored.virtualEdges()[0].anchor, "P");
    EXPECT_EQ(restored.virtualEdges()[0].root, "F");
}

TEST(LayoutResultTest, FromJson_MalformedThrows) {
    EXPECT_THROW(LayoutResult::fromJson("{not json"), std::runtime_error);
    EXPECT_THROW(LayoutResult::fromJson(R"({"nodeLayouts": [{"id": 3}]})"), std::runtime_error);
}
