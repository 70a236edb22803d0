// tests/analysis/test_graph.cpp - Unit tests for the generic graph
//
#include <gtest/gtest.h>

#include <vector>

#include "ivl/sema/analysis/graph.hpp"

using namespace ivl;

namespace
{

/// 0 -> 1 -> 2 -> 1, 2 -> 3
Graph<int> simple_loop()
{
  Graph<int> g;
  g.add_source(0);
  g.add_edge(0, 1);
  g.add_edge(1, 2);
  g.add_edge(2, 1);
  g.add_edge(2, 3);
  return g;
}

}  // namespace

TEST(AnalysisGraph, EdgesAreKeptOnce)
{
  Graph<int> g;
  g.add_edge(1, 2);
  g.add_edge(1, 2);
  g.add_edge(1, 3);

  EXPECT_EQ(g.size(), 3u);
  EXPECT_EQ(g.successors(1), (std::vector<int>{2, 3}));
  EXPECT_EQ(g.predecessors(2), (std::vector<int>{1}));
  EXPECT_TRUE(g.has_edge(1, 3));
  EXPECT_FALSE(g.has_edge(3, 1));
  EXPECT_FALSE(g.has_edge(1, 42));
  EXPECT_TRUE(g.successors(42).empty());
}

TEST(AnalysisGraph, ReachabilityInPreorder)
{
  Graph<int> g;
  g.add_source(0);
  g.add_edge(0, 1);
  g.add_edge(1, 2);
  g.add_edge(1, 4);
  g.add_edge(2, 3);
  g.add_edge(3, 1);
  g.add_node(9);

  EXPECT_EQ(g.reachable_from(0), (std::vector<int>{0, 1, 2, 3, 4}));
  EXPECT_EQ(g.reachable_from(9), (std::vector<int>{9}));
  EXPECT_TRUE(g.reachable_from(77).empty());
}

TEST(AnalysisGraph, StronglyConnectedComponentsCalleesFirst)
{
  const Graph<int> g = simple_loop();
  const auto sccs = g.strongly_connected_components();
  ASSERT_EQ(sccs.size(), 3u);
  EXPECT_EQ(sccs[0], (std::vector<int>{3}));
  EXPECT_EQ(sccs[1], (std::vector<int>{1, 2}));
  EXPECT_EQ(sccs[2], (std::vector<int>{0}));

  EXPECT_TRUE(g.on_cycle(1));
  EXPECT_TRUE(g.on_cycle(2));
  EXPECT_FALSE(g.on_cycle(0));
  EXPECT_FALSE(g.on_cycle(3));
}

TEST(AnalysisGraph, SelfLoopIsACycle)
{
  Graph<int> g;
  g.add_source(0);
  g.add_edge(0, 1);
  g.add_edge(1, 1);
  g.add_edge(1, 2);

  EXPECT_TRUE(g.on_cycle(1));
  EXPECT_EQ(g.headers(), (std::vector<int>{1}));
  EXPECT_EQ(g.back_edge_nodes(1), (std::vector<int>{1}));
  EXPECT_EQ(g.natural_loop(1, 1), (std::vector<int>{1}));
}

TEST(AnalysisGraph, Dominators)
{
  Graph<int> g = simple_loop();
  g.add_node(9);

  EXPECT_TRUE(g.dominates(0, 3));
  EXPECT_TRUE(g.dominates(1, 3));
  EXPECT_TRUE(g.dominates(2, 2));
  EXPECT_FALSE(g.dominates(3, 2));
  EXPECT_EQ(g.immediate_dominator(3), 2);
  EXPECT_EQ(g.immediate_dominator(0), 0);

  // Unreachable nodes have no dominator and dominate nothing
  EXPECT_FALSE(g.immediate_dominator(9).has_value());
  EXPECT_FALSE(g.dominates(0, 9));
}

TEST(AnalysisGraph, NestedNaturalLoops)
{
  Graph<int> g;
  g.add_source(0);
  g.add_edge(0, 1);
  g.add_edge(1, 2);
  g.add_edge(2, 3);
  g.add_edge(3, 2);
  g.add_edge(3, 1);
  g.add_edge(1, 4);

  EXPECT_TRUE(g.reducible());
  EXPECT_EQ(g.headers(), (std::vector<int>{1, 2}));
  EXPECT_EQ(g.back_edge_nodes(1), (std::vector<int>{3}));
  EXPECT_EQ(g.natural_loop(1, 3), (std::vector<int>{1, 3, 2}));
  EXPECT_EQ(g.natural_loop(2, 3), (std::vector<int>{2, 3}));
}

TEST(AnalysisGraph, IrreducibleCycleIsDetected)
{
  // The cycle 1 <-> 2 has two entries from 0
  Graph<int> g;
  g.add_source(0);
  g.add_edge(0, 1);
  g.add_edge(0, 2);
  g.add_edge(1, 2);
  g.add_edge(2, 1);

  EXPECT_FALSE(g.reducible());
  EXPECT_TRUE(g.headers().empty());
}

TEST(AnalysisGraph, LoopsAreRecomputedAfterChanges)
{
  Graph<int> g;
  g.add_source(0);
  g.add_edge(0, 1);
  EXPECT_TRUE(g.headers().empty());

  g.add_edge(1, 0);
  EXPECT_EQ(g.headers(), (std::vector<int>{0}));
  EXPECT_TRUE(g.reducible());
}
