// ivl/sema/analysis/loop_unroller.hpp - Bounded loop unrolling
//
// Every loop of an implementation is replaced by copies of its body. Copy k
// of block `b` is labelled `b#k`; a back edge leaving copy k enters the
// header of copy k + 1, and the back edges of the last copy are cut. A copy
// left without successors ends in `assume false; return;`.
//
// Loops are unrolled outermost first, so the copies of an inner loop are
// unrolled again in every copy of the enclosing one.
//
#pragma once

#include <cstddef>

#include "ivl/ast/ast.hpp"
#include "ivl/ast/ast_context.hpp"
#include "ivl/sema/analysis/cfg.hpp"
#include "ivl/sema/types/type.hpp"

namespace ivl
{

class LoopUnroller
{
public:
  LoopUnroller(AstContext & ast, TypeContext & types, unsigned unroll_count)
  : ast_(ast), types_(types), count_(unroll_count)
  {
  }

  /// Unroll every implementation of @p program; returns the number of loops unrolled.
  size_t unroll(Program & program);

  /**
   * Unroll the loops of one implementation.
   *
   * Commands are shared between the copies; only blocks and gotos are new.
   *
   * @throws InternalError if the control flow is irreducible
   */
  size_t unroll(ImplementationDecl & impl);

private:
  void unroll_loop(ImplementationDecl & impl, const BlockGraph & g, Block * header);

  AstContext & ast_;
  TypeContext & types_;
  unsigned count_;
};

/// Convenience wrapper around LoopUnroller::unroll(Program&).
size_t unroll_loops(Program & program, AstContext & ast, TypeContext & types, unsigned unroll_count);

}  // namespace ivl
