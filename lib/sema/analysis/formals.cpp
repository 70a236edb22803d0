// ivl/sema/analysis/formals.cpp - Helpers over procedure and implementation formals
//
#include "ivl/sema/analysis/formals.hpp"

#include <vector>

#include <fmt/format.h>

#include "ivl/basic/internal_error.hpp"

namespace ivl
{

namespace
{

void map_formals(
  gsl::span<FormalDecl * const> proc_formals, gsl::span<FormalDecl * const> impl_formals,
  AstContext & ast, FormalMap & out)
{
  for (size_t i = 0; i < impl_formals.size(); ++i) {
    FormalDecl * v = impl_formals[i];
    auto * id = ast.create<IdentifierExpr>(v->name, v->get_range());
    id->decl = v;
    id->type = v->type;
    out.emplace(proc_formals[i], id);
  }
}

}  // namespace

FormalMap impl_formal_map(const ImplementationDecl & impl, AstContext & ast)
{
  if (impl.proc == nullptr) {
    throw InternalError(fmt::format("formal map requested for unresolved implementation {}", impl.name));
  }
  const ProcedureDecl & proc = *impl.proc;
  if (
    proc.inParams.size() != impl.inParams.size() ||
    proc.outParams.size() != impl.outParams.size()) {
    throw InternalError(
      fmt::format("implementation {} does not match the formals of its procedure", impl.name));
  }

  FormalMap map;
  map.reserve(impl.inParams.size() + impl.outParams.size());
  map_formals(proc.inParams, impl.inParams, ast, map);
  map_formals(proc.outParams, impl.outParams, ast, map);
  return map;
}

gsl::span<FormalDecl *> strip_where_clauses(gsl::span<FormalDecl * const> formals, AstContext & ast)
{
  std::vector<FormalDecl *> out;
  out.reserve(formals.size());
  for (const FormalDecl * f : formals) {
    auto * copy = ast.create<FormalDecl>(f->name, f->type, f->incoming, f->get_range());
    copy->attributes = f->attributes;
    out.push_back(copy);
  }
  return ast.copy_to_arena(out);
}

}  // namespace ivl
