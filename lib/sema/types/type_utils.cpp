// ivl/sema/types/type_utils.cpp - Shared helpers for polymorphic signatures
//
#include "ivl/sema/types/type_utils.hpp"

#include <fmt/core.h>

#include <algorithm>

#include "ivl/ast/ast.hpp"
#include "ivl/basic/diagnostic.hpp"
#include "ivl/sema/types/unification.hpp"

namespace ivl
{

std::optional<Instantiation> check_argument_types(
  TypeContext & ctx, gsl::span<TypeVariable * const> type_params,
  gsl::span<Type * const> formal_ins, gsl::span<Expr * const> actual_ins,
  gsl::span<Type * const> formal_outs, gsl::span<IdentifierExpr * const> actual_outs,
  bool check_outs, SourceRange range, std::string_view op_name, DiagnosticBag * diags)
{
  if (formal_ins.size() != actual_ins.size()) {
    if (diags) {
      diags->report_error(
        range, fmt::format("wrong number of arguments in {}: {}", op_name, actual_ins.size()));
    }
    return std::nullopt;
  }
  if (check_outs && formal_outs.size() != actual_outs.size()) {
    if (diags) {
      diags->report_error(
        range,
        fmt::format("wrong number of result variables in {}: {}", op_name, actual_outs.size()));
    }
    return std::nullopt;
  }

  const TypeSubstitution subst = fresh_proxy_substitution(ctx, type_params);

  for (size_t i = 0; i < formal_ins.size(); ++i) {
    Type * formal = substitute(ctx, formal_ins[i], subst);
    Expr * actual = actual_ins[i];
    if (actual->type == nullptr) {
      continue;  // already reported
    }
    if (!unify(ctx, actual->type, formal)) {
      if (diags) {
        diags->report_error(
          actual->get_range(), fmt::format(
                                 "invalid type for argument {} in {}: {} (expected: {})", i,
                                 op_name, to_string(actual->type), to_string(formal)));
      }
    }
  }

  Instantiation res;
  for (size_t i = 0; i < formal_outs.size(); ++i) {
    Type * formal = substitute(ctx, formal_outs[i], subst);
    res.outs.push_back(formal);
    if (!check_outs) {
      continue;
    }
    IdentifierExpr * actual = actual_outs[i];
    if (actual->type == nullptr) {
      continue;
    }
    if (!unify(ctx, formal, actual->type)) {
      if (diags) {
        diags->report_error(
          actual->get_range(), fmt::format(
                                 "invalid type for out-parameter {} in {}: {} (expected: {})", i,
                                 op_name, to_string(actual->type), to_string(formal)));
      }
    }
  }

  for (TypeVariable * v : type_params) {
    res.typeArgs.push_back(subst.at(v));
  }
  return res;
}

std::vector<TypeVariable *> sort_type_params(
  gsl::span<TypeVariable * const> type_params, gsl::span<Type * const> arg_types,
  gsl::span<Type * const> result_types)
{
  if (type_params.empty()) {
    return {};
  }

  std::vector<TypeVariable *> in_use = free_variables_in(arg_types);
  for (TypeVariable * v : free_variables_in(result_types)) {
    if (std::find(in_use.begin(), in_use.end(), v) == in_use.end()) {
      in_use.push_back(v);
    }
  }

  std::vector<TypeVariable *> sorted;
  for (TypeVariable * v : in_use) {
    if (std::find(type_params.begin(), type_params.end(), v) != type_params.end()) {
      sorted.push_back(v);
    }
  }
  for (TypeVariable * v : type_params) {
    if (std::find(sorted.begin(), sorted.end(), v) == sorted.end()) {
      sorted.push_back(v);
    }
  }
  return sorted;
}

}  // namespace ivl
