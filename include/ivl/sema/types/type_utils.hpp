// ivl/sema/types/type_utils.hpp - Shared helpers for polymorphic signatures
//
// Used by name resolution (type parameter order) and by the type checker
// (instantiation of functions, procedures and map types at use sites).
//
#pragma once

#include <gsl/span>
#include <optional>
#include <string_view>
#include <vector>

#include "ivl/sema/types/type.hpp"

namespace ivl
{

class DiagnosticBag;
class Expr;
class IdentifierExpr;

// ============================================================================
// Instantiation
// ============================================================================

/// Result of instantiating a polymorphic signature at a use site.
struct Instantiation
{
  std::vector<Type *> outs;      ///< Formal out types with type parameters instantiated
  std::vector<Type *> typeArgs;  ///< One per type parameter, in declaration order
};

/**
 * Instantiate @p type_params with fresh proxies and check actual arguments
 * against the formals.
 *
 * Each actual in-argument's type must unify with its formal. When
 * @p check_outs is set, each formal out type must unify with the type of
 * the corresponding actual out-variable.
 *
 * Mismatches are reported to @p diags (if non-null) and do not stop the
 * check of the remaining arguments.
 *
 * @param op_name Name used in messages ("f", "map select", ...)
 * @return nullopt if the number of arguments or results is wrong
 */
[[nodiscard]] std::optional<Instantiation> check_argument_types(
  TypeContext & ctx, gsl::span<TypeVariable * const> type_params,
  gsl::span<Type * const> formal_ins, gsl::span<Expr * const> actual_ins,
  gsl::span<Type * const> formal_outs, gsl::span<IdentifierExpr * const> actual_outs,
  bool check_outs, SourceRange range, std::string_view op_name, DiagnosticBag * diags);

// ============================================================================
// Type Parameter Order
// ============================================================================

/**
 * Order type parameters by first occurrence in @p arg_types, then in
 * @p result_types; parameters occurring in neither keep their relative
 * order at the end.
 */
[[nodiscard]] std::vector<TypeVariable *> sort_type_params(
  gsl::span<TypeVariable * const> type_params, gsl::span<Type * const> arg_types,
  gsl::span<Type * const> result_types);

}  // namespace ivl
