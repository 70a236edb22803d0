// tests/analysis/test_cfg.cpp - Unit tests for implementation control flow
//
#include <gtest/gtest.h>

#include <algorithm>
#include <string_view>
#include <vector>

#include "ivl/ast/ast.hpp"
#include "ivl/basic/internal_error.hpp"
#include "ivl/sema/analysis/cfg.hpp"
#include "ivl/test_support/check_helpers.hpp"

using namespace ivl;
using ivl::test_support::resolve;

namespace
{

std::vector<std::string_view> labels(const std::vector<Block *> & blocks)
{
  std::vector<std::string_view> out;
  for (const Block * b : blocks) out.push_back(b->label);
  return out;
}

std::vector<std::string_view> labels(gsl::span<Block *> blocks)
{
  return labels(std::vector<Block *>(blocks.begin(), blocks.end()));
}

}  // namespace

TEST(AnalysisCfg, OneNodePerBlockOneEdgePerTarget)
{
  auto u = resolve(
    "procedure P();\n"
    "implementation P() { A: goto B, C; B: goto D; C: goto D, D; D: return; }\n");
  ASSERT_TRUE(u.resolved);
  auto * impl = u.find<ImplementationDecl>("P");
  ASSERT_NE(impl, nullptr);

  const BlockGraph g = graph_from_implementation(*impl);
  EXPECT_EQ(g.size(), 4u);
  EXPECT_EQ(g.source(), impl->blocks[0]);
  EXPECT_EQ(labels(g.successors(impl->blocks[0])), (std::vector<std::string_view>{"B", "C"}));
  // Duplicate targets give one edge
  EXPECT_EQ(g.successors(impl->blocks[2]).size(), 1u);
  EXPECT_EQ(labels(g.predecessors(impl->blocks[3])), (std::vector<std::string_view>{"B", "C"}));
  EXPECT_TRUE(g.reducible());
}

TEST(AnalysisCfg, LoweredWhileHasOneLoop)
{
  auto u = resolve(
    "procedure P(n: int);\n"
    "implementation P(n: int) { var i: int; i := 0; while (i < n) { i := i + 1; } }\n");
  ASSERT_TRUE(u.resolved);
  auto * impl = u.find<ImplementationDecl>("P");
  ASSERT_NE(impl, nullptr);

  const BlockGraph g = graph_from_implementation(*impl);
  const auto headers = g.headers();
  ASSERT_EQ(headers.size(), 1u);
  EXPECT_EQ(headers[0]->label, "anon1_LoopHead");
  EXPECT_EQ(labels(g.back_edge_nodes(headers[0])), (std::vector<std::string_view>{"anon1_LoopBody"}));
}

TEST(AnalysisCfg, PredecessorsFollowGotos)
{
  auto u = resolve(
    "procedure P();\n"
    "implementation P() { A: goto B, C; B: goto C; C: return; }\n");
  ASSERT_TRUE(u.resolved);
  auto * impl = u.find<ImplementationDecl>("P");
  ASSERT_NE(impl, nullptr);

  compute_predecessors(*impl, u.ast());
  EXPECT_TRUE(impl->predecessorsComputed);
  EXPECT_TRUE(impl->blocks[0]->predecessors.empty());
  EXPECT_EQ(labels(impl->blocks[1]->predecessors), (std::vector<std::string_view>{"A"}));
  EXPECT_EQ(labels(impl->blocks[2]->predecessors), (std::vector<std::string_view>{"A", "B"}));
}

TEST(AnalysisCfg, PruneRemovesUnreachableBlocks)
{
  auto u = resolve(
    "procedure P();\n"
    "implementation P() { L: goto M; D: goto E; E: goto M; M: return; }\n");
  ASSERT_TRUE(u.resolved);
  auto * impl = u.find<ImplementationDecl>("P");
  ASSERT_NE(impl, nullptr);

  EXPECT_EQ(prune_unreachable_blocks(*impl, u.ast()), 2u);
  EXPECT_EQ(labels(impl->blocks), (std::vector<std::string_view>{"L", "M"}));
  EXPECT_EQ(labels(impl->blocks[1]->predecessors), (std::vector<std::string_view>{"L"}));

  // Nothing left to remove
  EXPECT_EQ(prune_unreachable_blocks(*impl, u.ast()), 0u);
}

TEST(AnalysisCfg, ImplementationWithoutBlocksIsInternalError)
{
  AstContext ast;
  auto * impl = ast.create<ImplementationDecl>("Empty");
  EXPECT_THROW((void)graph_from_implementation(*impl), InternalError);
}

TEST(AnalysisCfg, ComponentsAreCachedWithPredecessors)
{
  auto u = resolve(
    "procedure P();\n"
    "implementation P() { A: goto B; B: goto C, A; C: return; }\n");
  ASSERT_TRUE(u.resolved);
  auto * impl = u.find<ImplementationDecl>("P");
  ASSERT_NE(impl, nullptr);
  EXPECT_FALSE(impl->sccComputed);

  compute_strongly_connected_components(*impl, u.ast());
  EXPECT_TRUE(impl->sccComputed);
  EXPECT_TRUE(impl->predecessorsComputed);
  ASSERT_EQ(impl->blockComponents.size(), 2u);
  // The exit component is listed before the loop that reaches it
  EXPECT_EQ(labels(impl->blockComponents[0]), (std::vector<std::string_view>{"C"}));

  const auto loop = component_of(*impl, impl->blocks[0], u.ast());
  ASSERT_EQ(loop.size(), 2u);
  EXPECT_NE(std::find(loop.begin(), loop.end(), impl->blocks[1]), loop.end());
  EXPECT_EQ(component_of(*impl, impl->blocks[2], u.ast()).size(), 1u);

  Block stray("stray");
  EXPECT_THROW((void)component_of(*impl, &stray, u.ast()), InternalError);
}

TEST(AnalysisCfg, PruneInvalidatesComponents)
{
  auto u = resolve(
    "procedure P();\n"
    "implementation P() { L: goto M; D: goto E; E: goto D; M: return; }\n");
  ASSERT_TRUE(u.resolved);
  auto * impl = u.find<ImplementationDecl>("P");
  ASSERT_NE(impl, nullptr);

  compute_strongly_connected_components(*impl, u.ast());
  EXPECT_EQ(impl->blockComponents.size(), 3u);

  ASSERT_EQ(prune_unreachable_blocks(*impl, u.ast()), 2u);
  EXPECT_FALSE(impl->sccComputed);
  EXPECT_TRUE(impl->blockComponents.empty());
  EXPECT_TRUE(impl->predecessorsComputed);

  // Recomputed on demand from the pruned block list
  EXPECT_EQ(component_of(*impl, impl->blocks[0], u.ast()).size(), 1u);
  EXPECT_EQ(impl->blockComponents.size(), 2u);
}
