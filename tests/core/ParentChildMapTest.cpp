#include <gtest/gtest.h>
#include <mindarbor/core/ParentChildMap.h>

#include <algorithm>

using namespace mindarbor;

TEST(ParentChildMapTest, ChildrenInEdgeOrder) {
    auto map = ParentChildMap::build({{"r", "b"}, {"r", "a"}, {"r", "c"}});

    std::vector<NodeId> expected{"b", "a", "c"};
    EXPECT_EQ(map.children("r"), expected);
    EXPECT_EQ(map.parent("a"), "r");
    EXPECT_FALSE(map.parent("r").has_value());
}

TEST(ParentChildMapTest, DuplicateEdgesRecordedOnce) {
    auto map = ParentChildMap::build({{"x", "y"}, {"x", "y"}});

    ASSERT_EQ(map.children("x").size(), 1u);
    EXPECT_EQ(map.edgeCount(), 1u);
}

TEST(ParentChildMapTest, SelfLoopsIgnored) {
    auto map = ParentChildMap::build({{"a", "a"}});

    EXPECT_TRUE(map.children("a").empty());
    EXPECT_FALSE(map.hasParent("a"));
    EXPECT_TRUE(map.empty());
}

TEST(ParentChildMapTest, LastParentWins) {
    auto map = ParentChildMap::build({{"p1", "c"}, {"p2", "c"}});

    EXPECT_EQ(map.parent("c"), "p2");
    EXPECT_TRUE(map.hasEdge("p1", "c"));
    EXPECT_TRUE(map.hasEdge("p2", "c"));
}

TEST(ParentChildMapTest, AcceptFilterRejectsEdges) {
    auto map = ParentChildMap::build({{"a", "b"}, {"a", "hidden"}},
                                     [](const NodeId& id) { return id != "hidden"; });

    EXPECT_TRUE(map.hasEdge("a", "b"));
    EXPECT_FALSE(map.hasEdge("a", "hidden"));
    EXPECT_FALSE(map.hasParent("hidden"));
}

TEST(ParentChildMapTest, UnknownNodeHasNoChildren) {
    ParentChildMap map;
    EXPECT_TRUE(map.children("nobody").empty());
}

TEST(ParentChildMapTest, DescendantsPreOrder) {
    auto map = ParentChildMap::build({{"n", "a"}, {"a", "b"}, {"a", "c"}, {"n", "d"}});

    std::vector<NodeId> expected{"a", "b", "c", "d"};
    EXPECT_EQ(map.descendants("n"), expected);
}

TEST(ParentChildMapTest, DescendantsTerminateOnCycle) {
    auto map = ParentChildMap::build({{"a", "b"}, {"b", "c"}, {"c", "a"}});

    std::vector<NodeId> expected{"b", "c"};
    EXPECT_EQ(map.descendants("a"), expected);
}

TEST(ParentChildMapTest, DescendantsOfDiamondListedOnce) {
    auto map = ParentChildMap::build({{"r", "a"}, {"r", "b"}, {"a", "d"}, {"b", "d"}});

    auto result = map.descendants("r");
    EXPECT_EQ(result.size(), 3u);
    EXPECT_EQ(std::count(result.begin(), result.end(), "d"), 1);
}
