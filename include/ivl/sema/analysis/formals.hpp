// ivl/sema/analysis/formals.hpp - Helpers over procedure and implementation formals
//
#pragma once

#include <gsl/span>
#include <unordered_map>

#include "ivl/ast/ast.hpp"
#include "ivl/ast/ast_context.hpp"

namespace ivl
{

/// Procedure formal -> reference to the matching implementation formal.
using FormalMap = std::unordered_map<const VariableDecl *, IdentifierExpr *>;

/**
 * Map the in- and out-parameters of the procedure of @p impl to
 * identifiers of the implementation's formals at the same positions.
 *
 * Used to read a procedure's contract in terms of an implementation.
 *
 * @throws InternalError if @p impl is unresolved or the parameter counts differ
 */
[[nodiscard]] FormalMap impl_formal_map(const ImplementationDecl & impl, AstContext & ast);

/**
 * Copies of @p formals without where clauses.
 *
 * Name, type, direction and range are kept.
 */
[[nodiscard]] gsl::span<FormalDecl *> strip_where_clauses(
  gsl::span<FormalDecl * const> formals, AstContext & ast);

}  // namespace ivl
