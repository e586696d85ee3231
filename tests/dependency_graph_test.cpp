#include "agentboard/schema/dependency_graph.hpp"

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace agentboard;
using agentboard::test::task_id;

TEST(DependencyGraphTest, AddNode_IsIdempotent) {
  DependencyGraph graph;
  auto a = graph.add_node(task_id("a"));
  auto again = graph.add_node(task_id("a"));

  EXPECT_EQ(a, again);
  EXPECT_TRUE(graph.has_node(task_id("a")));
  EXPECT_EQ(graph.get_index(task_id("a")), a);
  EXPECT_EQ(graph.get_index(task_id("b")), kInvalidNode);
}

TEST(DependencyGraphTest, AddEdge_UnknownDependency_Fails) {
  DependencyGraph graph;
  graph.add_node(task_id("b"));

  auto r = graph.add_edge(task_id("missing"), task_id("b"));

  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is(Error::DependencyUnresolved));
  EXPECT_EQ(r.error().task_id, "b");
}

TEST(DependencyGraphTest, AddEdge_SelfLoop_Fails) {
  DependencyGraph graph;
  graph.add_node(task_id("a"));

  auto r = graph.add_edge(task_id("a"), task_id("a"));

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().reason, "task depends on itself");
}

TEST(DependencyGraphTest, AddEdge_ClosingCycle_FailsWithChain) {
  DependencyGraph graph;
  for (const char* id : {"a", "b", "c"}) {
    graph.add_node(task_id(id));
  }
  ASSERT_TRUE(graph.add_edge(task_id("a"), task_id("b")).has_value());
  ASSERT_TRUE(graph.add_edge(task_id("b"), task_id("c")).has_value());

  auto r = graph.add_edge(task_id("c"), task_id("a"));

  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is(Error::DependencyUnresolved));
  EXPECT_EQ(r.error().reason, "dependency cycle: a -> b -> c -> a");
  EXPECT_TRUE(graph.find_path(graph.get_index(task_id("c")),
                              graph.get_index(task_id("a")))
                  .empty());
}

TEST(DependencyGraphTest, FindPath_FollowsDependents) {
  DependencyGraph graph;
  auto a = graph.add_node(task_id("a"));
  auto b = graph.add_node(task_id("b"));
  auto c = graph.add_node(task_id("c"));
  ASSERT_TRUE(graph.add_edge(a, b).has_value());
  ASSERT_TRUE(graph.add_edge(b, c).has_value());

  auto path = graph.find_path(a, c);
  ASSERT_EQ(path.size(), 3u);
  EXPECT_EQ(path.front(), task_id("a"));
  EXPECT_EQ(path.back(), task_id("c"));
  EXPECT_TRUE(graph.find_path(c, a).empty());
}
