// ivl/ast/emitter.hpp - Concrete syntax printer
//
// Writes declarations, commands and expressions back in the surface syntax
// accepted by the parser. Output of a parsed program parses to a program
// that emits to the same text.
//
#pragma once

#include <ostream>
#include <string>

#include "ivl/ast/ast.hpp"

namespace ivl
{

class Emitter
{
public:
  /// Spaces per nesting level
  static constexpr int k_indent_width = 2;

  explicit Emitter(std::ostream & out) : out_(out) {}

  /// Declarations separated by a blank line.
  void emit(const Program & program);
  void emit_decl(const Decl * decl);
  void emit_cmd(const Cmd * cmd);
  void emit_block(const Block * block);

  /**
   * Emit an expression.
   *
   * @param min_strength Parenthesize when the expression binds weaker than
   *        this (see precedence::k_*; k_top accepts anything)
   */
  void emit_expr(const Expr * expr, int min_strength = k_top);

  /// Context that needs no parentheses at all (statement, argument, index)
  static constexpr int k_top = -1;

private:
  void indent();
  void emit_attributes(gsl::span<Attribute * const> attrs);
  void emit_type_params(gsl::span<TypeVariable * const> params);
  void emit_formal(const VariableDecl * var);
  void emit_formals(gsl::span<FormalDecl * const> formals);
  void emit_signature(std::string_view keyword, const DeclWithFormals * decl);
  void emit_exprs(gsl::span<Expr * const> exprs);
  void emit_lhs(const AssignLhs * lhs);
  void emit_binary(const BinaryExpr * expr);
  void emit_quantifier(const QuantifierExpr * expr);
  void emit_type(const Type * type);

  std::ostream & out_;
  int level_ = 0;
};

/// Emitted text of a whole program.
[[nodiscard]] std::string to_source(const Program & program);

/// Emitted text of a single expression.
[[nodiscard]] std::string to_source(const Expr * expr);

}  // namespace ivl
