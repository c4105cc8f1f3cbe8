#include <gtest/gtest.h>
#include <mindarbor/core/NodeMap.h>

using namespace mindarbor;

TEST(NodeMapTest, AddNode) {
    NodeMap nodes;
    nodes.addNode(NodeData("a", 200.0f, 60.0f));

    EXPECT_TRUE(nodes.hasNode("a"));
    EXPECT_EQ(nodes.size(), 1u);
    EXPECT_FLOAT_EQ(*nodes.getNode("a").width, 200.0f);
    EXPECT_FLOAT_EQ(*nodes.getNode("a").height, 60.0f);
}

TEST(NodeMapTest, AddNodeWithoutSize_LeavesDimensionsAbsent) {
    NodeMap nodes;
    nodes.addNode(NodeData("a"));

    EXPECT_FALSE(nodes.getNode("a").width.has_value());
    EXPECT_FALSE(nodes.getNode("a").height.has_value());
}

TEST(NodeMapTest, IterationFollowsInsertionOrder) {
    NodeMap nodes;
    nodes.addNode(NodeData("c"));
    nodes.addNode(NodeData("a"));
    nodes.addNode(NodeData("b"));

    std::vector<NodeId> expected{"c", "a", "b"};
    EXPECT_EQ(nodes.ids(), expected);
}

TEST(NodeMapTest, AddExistingId_ReplacesInPlace) {
    NodeMap nodes;
    nodes.addNode(NodeData("a", 100.0f, 50.0f));
    nodes.addNode(NodeData("b"));
    nodes.addNode(NodeData("a", 300.0f, 70.0f));

    EXPECT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes.ids().front(), "a");
    EXPECT_FLOAT_EQ(*nodes.getNode("a").width, 300.0f);
}

TEST(NodeMapTest, RemoveNode_KeepsOrderOfOthers) {
    NodeMap nodes;
    nodes.addNode(NodeData("a"));
    nodes.addNode(NodeData("b"));
    nodes.addNode(NodeData("c"));

    nodes.removeNode("b");

    EXPECT_FALSE(nodes.hasNode("b"));
    std::vector<NodeId> expected{"a", "c"};
    EXPECT_EQ(nodes.ids(), expected);
    EXPECT_EQ(nodes.getNode("c").id, "c");
}

TEST(NodeMapTest, RemoveUnknownNode_IsNoOp) {
    NodeMap nodes;
    nodes.addNode(NodeData("a"));
    nodes.removeNode("zzz");
    EXPECT_EQ(nodes.size(), 1u);
}

TEST(NodeMapTest, GetNode_UnknownIdThrows) {
    NodeMap nodes;
    EXPECT_THROW(nodes.getNode("missing"), std::out_of_range);
}

TEST(NodeMapTest, TryGetNode) {
    NodeMap nodes;
    nodes.addNode(NodeData("a", 10.0f, 20.0f, "hello"));

    auto found = nodes.tryGetNode("a");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->text, "hello");
    EXPECT_FALSE(nodes.tryGetNode("b").has_value());
}

TEST(NodeMapTest, Clear) {
    NodeMap nodes;
    nodes.addNode(NodeData("a"));
    nodes.clear();

    EXPECT_TRUE(nodes.empty());
    EXPECT_FALSE(nodes.hasNode("a"));
}
