// ivl/sema/analysis/cfg.cpp - Block-level control flow of implementations
//
#include "ivl/sema/analysis/cfg.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <fmt/format.h>

#include "ivl/basic/internal_error.hpp"

namespace ivl
{

BlockGraph graph_from_implementation(const ImplementationDecl & impl)
{
  if (impl.blocks.empty()) {
    throw InternalError(
      fmt::format("control-flow graph requested for implementation {} without blocks", impl.name));
  }

  BlockGraph g;
  g.add_source(impl.blocks[0]);
  for (Block * b : impl.blocks) {
    g.add_node(b);
  }
  for (Block * b : impl.blocks) {
    const auto * go = dyn_cast<GotoCmd>(b->transfer);
    if (go == nullptr) continue;
    for (Block * target : go->targets) {
      if (target != nullptr) g.add_edge(b, target);
    }
  }
  return g;
}

void compute_predecessors(ImplementationDecl & impl, AstContext & ast)
{
  std::unordered_map<Block *, std::vector<Block *>> preds;
  for (Block * b : impl.blocks) {
    preds[b];
  }
  for (Block * b : impl.blocks) {
    const auto * go = dyn_cast<GotoCmd>(b->transfer);
    if (go == nullptr) continue;
    for (Block * target : go->targets) {
      if (target != nullptr) preds[target].push_back(b);
    }
  }
  for (Block * b : impl.blocks) {
    b->predecessors = ast.copy_to_arena(preds[b]);
  }
  impl.predecessorsComputed = true;
}

void compute_strongly_connected_components(ImplementationDecl & impl, AstContext & ast)
{
  if (!impl.predecessorsComputed) {
    compute_predecessors(impl, ast);
  }
  const auto components = graph_from_implementation(impl).strongly_connected_components();
  std::vector<gsl::span<Block *>> spans;
  spans.reserve(components.size());
  for (const auto & c : components) {
    spans.push_back(ast.copy_to_arena(c));
  }
  impl.blockComponents = ast.copy_to_arena(spans);
  impl.sccComputed = true;
}

gsl::span<Block *> component_of(ImplementationDecl & impl, const Block * block, AstContext & ast)
{
  if (!impl.sccComputed) {
    compute_strongly_connected_components(impl, ast);
  }
  for (gsl::span<Block *> component : impl.blockComponents) {
    if (std::find(component.begin(), component.end(), block) != component.end()) {
      return component;
    }
  }
  throw InternalError(fmt::format(
    "block {} is not part of implementation {}", block ? block->label : "<null>", impl.name));
}

void invalidate_flow_info(ImplementationDecl & impl) noexcept
{
  impl.predecessorsComputed = false;
  impl.sccComputed = false;
  impl.blockComponents = {};
}

size_t prune_unreachable_blocks(ImplementationDecl & impl, AstContext & ast)
{
  if (impl.blocks.empty()) return 0;

  const BlockGraph g = graph_from_implementation(impl);
  const std::vector<Block *> reached = g.reachable_from(impl.blocks[0]);
  const std::unordered_set<Block *> live(reached.begin(), reached.end());

  std::vector<Block *> kept;
  kept.reserve(live.size());
  for (Block * b : impl.blocks) {
    if (live.count(b) != 0) kept.push_back(b);
  }

  const size_t removed = impl.blocks.size() - kept.size();
  if (removed != 0) {
    impl.blocks = ast.copy_to_arena(kept);
    invalidate_flow_info(impl);
  }
  compute_predecessors(impl, ast);
  return removed;
}

}  // namespace ivl
