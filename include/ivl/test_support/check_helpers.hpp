// ivl/test_support/check_helpers.hpp - helpers for unit/integration tests
//
// A single-source pipeline for tests: parse, then optionally resolve and
// type check, keeping the ParsedUnit (and therefore every arena) alive.
//
#pragma once

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "ivl/ast/ast.hpp"
#include "ivl/basic/casting.hpp"
#include "ivl/basic/diagnostic.hpp"
#include "ivl/sema/resolution/name_resolver.hpp"
#include "ivl/sema/types/type_checker.hpp"
#include "ivl/syntax/frontend.hpp"

namespace ivl::test_support
{

struct CheckedUnit
{
  std::unique_ptr<ParsedUnit> unit;
  bool parsed = false;
  bool resolved = false;
  bool typechecked = false;

  [[nodiscard]] Program * program() const noexcept { return unit->program; }
  [[nodiscard]] DiagnosticBag & diags() const noexcept { return unit->diags; }
  [[nodiscard]] AstContext & ast() const noexcept { return unit->ast; }
  [[nodiscard]] TypeContext & types() const noexcept { return unit->types; }

  [[nodiscard]] bool has_error_containing(std::string_view needle) const
  {
    const auto errs = unit->diags.errors();
    return std::any_of(errs.begin(), errs.end(), [&](const Diagnostic & d) {
      return d.message.find(needle) != std::string::npos;
    });
  }

  [[nodiscard]] bool has_warning_containing(std::string_view needle) const
  {
    const auto warns = unit->diags.warnings();
    return std::any_of(warns.begin(), warns.end(), [&](const Diagnostic & d) {
      return d.message.find(needle) != std::string::npos;
    });
  }

  /// First top-level declaration of kind T named @p name.
  template <typename T>
  [[nodiscard]] T * find(std::string_view name) const
  {
    for (auto * decl : unit->program->decls) {
      if (auto * d = dyn_cast<T>(decl); d && d->name == name) {
        return d;
      }
    }
    return nullptr;
  }
};

[[nodiscard]] inline CheckedUnit parse(std::string src)
{
  CheckedUnit out;
  out.unit = parse_source(std::move(src));
  out.parsed = !out.unit->diags.has_errors();
  return out;
}

[[nodiscard]] inline CheckedUnit resolve(std::string src, ResolveOptions options = {})
{
  CheckedUnit out = parse(std::move(src));
  if (!out.parsed) return out;
  NameResolver resolver(out.ast(), out.types(), &out.diags(), options);
  out.resolved = resolver.resolve(*out.program());
  return out;
}

/// Parse, resolve and (when resolution succeeded) type check.
[[nodiscard]] inline CheckedUnit check(std::string src, ResolveOptions options = {})
{
  CheckedUnit out = resolve(std::move(src), options);
  if (!out.resolved) return out;
  TypeChecker checker(out.types(), &out.diags());
  out.typechecked = checker.check(*out.program());
  return out;
}

}  // namespace ivl::test_support
