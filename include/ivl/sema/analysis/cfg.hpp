// ivl/sema/analysis/cfg.hpp - Block-level control flow of implementations
//
// The control-flow graph of an implementation has one node per block and
// one edge per goto target. blocks[0] is the entry.
//
#pragma once

#include "ivl/ast/ast.hpp"
#include "ivl/ast/ast_context.hpp"
#include "ivl/sema/analysis/graph.hpp"

namespace ivl
{

using BlockGraph = Graph<Block *>;

/**
 * Build the control-flow graph of a resolved implementation.
 *
 * Every block is a node (unreachable ones included). Goto targets must
 * already be resolved.
 *
 * @throws InternalError if the implementation has no blocks
 */
[[nodiscard]] BlockGraph graph_from_implementation(const ImplementationDecl & impl);

/**
 * Fill Block::predecessors for every block and set
 * ImplementationDecl::predecessorsComputed.
 */
void compute_predecessors(ImplementationDecl & impl, AstContext & ast);

/**
 * Compute and cache the strongly connected components of the blocks.
 *
 * Predecessors are computed first if they are stale. Components are listed
 * callees-first: a component comes before every component that can reach it.
 */
void compute_strongly_connected_components(ImplementationDecl & impl, AstContext & ast);

/// The cached component containing @p block; computes the cache if needed.
[[nodiscard]] gsl::span<Block *> component_of(
  ImplementationDecl & impl, const Block * block, AstContext & ast);

/// Forget predecessors and components after the block list changed.
void invalidate_flow_info(ImplementationDecl & impl) noexcept;

/**
 * Drop blocks not reachable from the entry block.
 *
 * Keeps the relative order of the remaining blocks and recomputes
 * predecessors. Cached components are dropped.
 *
 * @return Number of blocks removed
 */
size_t prune_unreachable_blocks(ImplementationDecl & impl, AstContext & ast);

}  // namespace ivl
