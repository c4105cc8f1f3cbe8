#include <gtest/gtest.h>
#include <mindarbor/mindarbor.h>

using namespace mindarbor;

// ============================================================================
// CanvasSerializerTest - canvas documents in and out
// ============================================================================

TEST(CanvasSerializerTest, ReadsNodesInDocumentOrder) {
    auto snapshot = CanvasSerializer::snapshotFromJson(R"({
        "nodes": [
            {"id": "b", "x": 10, "y": 20, "width": 300, "height": 80, "text": "hello"},
            {"id": "a"}
        ]
    })");

    std::vector<NodeId> expected{"b", "a"};
    EXPECT_EQ(snapshot.nodes.ids(), expected);

    const NodeData& b = snapshot.nodes.getNode("b");
    EXPECT_FLOAT_EQ(b.x, 10.0f);
    EXPECT_FLOAT_EQ(*b.width, 300.0f);
    EXPECT_EQ(b.text, "hello");

    const NodeData& a = snapshot.nodes.getNode("a");
    EXPECT_FALSE(a.width.has_value());
    EXPECT_FLOAT_EQ(a.y, 0.0f);
}

TEST(CanvasSerializerTest, AcceptsEveryEdgeShape) {
    auto snapshot = CanvasSerializer::snapshotFromJson(R"({
        "nodes": [{"id": "r"}, {"id": "a"}, {"id": "b"}, {"id": "c"}],
        "edges": [
            {"id": "e1", "fromNode": "r", "toNode": "a"},
            {"from": "r", "to": "b"},
            {"from": {"nodeId": "r"}, "to": {"node": {"id": "c"}}},
            {"from": "r"},
            {"from": 42, "to": "a"}
        ]
    })");

    ASSERT_EQ(snapshot.edges.size(), 3u);
    EXPECT_EQ(snapshot.edges[0], Edge("r", "a"));
    EXPECT_EQ(snapshot.edges[1], Edge("r", "b"));
    EXPECT_EQ(snapshot.edges[2], Edge("r", "c"));
}

TEST(CanvasSerializerTest, ReadsFloatingMarkersAndCollapsedIds) {
    auto snapshot = CanvasSerializer::snapshotFromJson(R"({
        "nodes": [
            {"id": "p"},
            {"id": "f", "data": {"isFloating": true, "originalParent": "p"}},
            {"id": "g", "data": {"color": "red"}},
            {"id": "h"}
        ],
        "collapsed": ["p"],
        "metadata": {"floatingNodes": {"h": true, "f": false}}
    })");

    EXPECT_EQ(snapshot.floatingMarkers["f"], FloatingMarker(true, "p"));
    EXPECT_EQ(snapshot.floatingMarkers["h"], FloatingMarker(true));
    EXPECT_EQ(snapshot.floatingMarkers.count("g"), 0u);
    EXPECT_TRUE(snapshot.collapsed.isCollapsed("p"));
}

TEST(CanvasSerializerTest, ReadsOriginalEdges) {
    auto snapshot = CanvasSerializer::snapshotFromJson(R"({
        "nodes": [{"id": "p"}, {"id": "f"}],
        "edges": [],
        "originalEdges": [{"fromNode": "p", "toNode": "f"}]
    })");

    EXPECT_TRUE(snapshot.edges.empty());
    ASSERT_EQ(snapshot.originalEdges.size(), 1u);
    EXPECT_EQ(snapshot.originalEdges[0], Edge("p", "f"));
}

TEST(CanvasSerializerTest, MalformedDocumentsThrow) {
    EXPECT_THROW(CanvasSerializer::snapshotFromJson("{"), std::runtime_error);
    EXPECT_THROW(CanvasSerializer::snapshotFromJson("[]"), std::runtime_error);
    EXPECT_THROW(CanvasSerializer::snapshotFromJson(R"({"nodes": [{"x": 1}]})"), std::runtime_error);
}

TEST(CanvasSerializerTest, SnapshotRoundTrip) {
    CanvasSnapshot snapshot;
    snapshot.nodes.addNode(NodeData("p", 200.0f, 60.0f, "parent"));
    snapshot.nodes.addNode(NodeData("f"));
    snapshot.edges = {{"p", "x"}};
    snapshot.originalEdges = {{"p", "f"}, {"p", "x"}};
    snapshot.collapsed.markCollapsed("p");
    snapshot.floatingMarkers["f"] = FloatingMarker(true, "p");
    snapshot.floatingMarkers["orphan"] = FloatingMarker(true);

    auto restored = CanvasSerializer::snapshotFromJson(CanvasSerializer::snapshotToJson(snapshot));

    EXPECT_EQ(restored.nodes.ids(), snapshot.nodes.ids());
    EXPECT_EQ(restored.nodes.getNode("p").text, "parent");
    EXPECT_FALSE(restored.nodes.getNode("f").width.has_value());
    EXPECT_EQ(restored.edges, snapshot.edges);
    EXPECT_EQ(restored.originalEdges, snapshot.originalEdges);
    EXPECT_TRUE(restored.collapsed.isCollapsed("p"));
    EXPECT_EQ(restored.floatingMarkers, snapshot.floatingMarkers);
}

TEST(CanvasSerializerTest, MarkersPersistenceFormat) {
    FloatingMarkers markers{
        {"root", FloatingMarker(true, "anchor")},
        {"member", FloatingMarker(true)},
    };

    std::string json = CanvasSerializer::markersToJson(markers);
    auto restored = CanvasSerializer::markersFromJson(json);

    EXPECT_EQ(restored, markers);
    // Members never carry an anchor
    EXPECT_EQ(json.find("\"originalParent\""), json.rfind("\"originalParent\""));
}

TEST(CanvasSerializerTest, MarkersFromJson_AcceptsLegacyFlags) {
    auto markers = CanvasSerializer::markersFromJson(R"({"a": true, "b": {"isFloating": true}, "c": 7})");

    EXPECT_EQ(markers.size(), 2u);
    EXPECT_TRUE(isMarkedFloating(markers, "a"));
    EXPECT_TRUE(isMarkedFloating(markers, "b"));
    EXPECT_THROW(CanvasSerializer::markersFromJson("[]"), std::runtime_error);
}

TEST(CanvasSerializerTest, LoadedDocumentArranges) {
    auto snapshot = CanvasSerializer::snapshotFromJson(R"({
        "nodes": [
            {"id": "root", "width": 200, "height": 60},
            {"id": "child", "width": 200, "height": 60},
            {"id": "floater", "width": 200, "height": 60,
             "data": {"isFloating": true, "originalParent": "root"}}
        ],
        "edges": [{"fromNode": "root", "toNode": "child"}]
    })");

    ArrangePipeline pipeline;
    ArrangeOutcome outcome = pipeline.arrange(snapshot);

    ASSERT_TRUE(outcome.arranged());
    EXPECT_EQ(outcome.result.getNodeLayout("floater")->layer, 1);
    EXPECT_FLOAT_EQ(outcome.result.getNodeLayout("floater")->position.y, 0.0f);
}
