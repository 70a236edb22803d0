// ivl/sema/analysis/loop_extractor.hpp - Rewrite loops into procedures
//
// Every loop of an implementation becomes a tail-recursive procedure
// `loop_<header>` whose implementation holds a copy of the loop body.
// The enclosing implementation calls it on entry to the loop header.
//
#pragma once

#include <vector>

#include "ivl/ast/ast.hpp"
#include "ivl/ast/ast_context.hpp"
#include "ivl/sema/analysis/cfg.hpp"
#include "ivl/sema/types/type.hpp"

namespace ivl
{

/// One extracted loop.
struct ExtractedLoop
{
  ImplementationDecl * owner = nullptr;  ///< Implementation the loop came from
  Block * header = nullptr;              ///< Loop header in @c owner
  ProcedureDecl * proc = nullptr;
  ImplementationDecl * impl = nullptr;
};

/**
 * Loop extraction over a resolved, type-checked program.
 *
 * For each loop header h of an implementation with in-parameters I,
 * out-parameters O and locals L:
 * - procedure `loop_h` takes `in_v` for every v in I, O, L and returns
 *   `out_v` for every v in O, L; it modifies the globals assigned inside
 *   the loop and carries `{:inline 1}`
 * - each back edge s -> h is redirected to a new block `s_dummy`
 *   (`assume false; return;`); in the loop implementation the copy of
 *   `s_dummy` calls `loop_h` recursively
 * - `call O, L := loop_h(I, O, L);` is inserted at the start of h
 *
 * The new declarations are appended to the program.
 */
class LoopExtractor
{
public:
  LoopExtractor(AstContext & ast, TypeContext & types) : ast_(ast), types_(types) {}

  /**
   * Extract the loops of every implementation in @p program.
   *
   * @throws InternalError if some implementation has irreducible control flow
   */
  std::vector<ExtractedLoop> extract(Program & program);

  /// Extract the loops of one implementation (declarations are not appended).
  std::vector<ExtractedLoop> extract(ImplementationDecl & impl);

private:
  struct LoopFrame;

  void create_procedure(ImplementationDecl & impl, Block * header, LoopFrame & frame);
  ImplementationDecl * create_implementation(
    ImplementationDecl & impl, const BlockGraph & g, Block * header, LoopFrame & frame);

  IdentifierExpr * make_identifier(VariableDecl * var);
  GotoCmd * make_goto(const std::vector<Block *> & targets);
  AssumeCmd * make_assume_false();

  AstContext & ast_;
  TypeContext & types_;
};

/// Convenience wrapper around LoopExtractor::extract(Program&).
std::vector<ExtractedLoop> extract_loops(Program & program, AstContext & ast, TypeContext & types);

}  // namespace ivl
