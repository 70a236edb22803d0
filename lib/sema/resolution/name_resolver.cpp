// ivl/sema/resolution/name_resolver.cpp - Name and type resolution
//
#include "ivl/sema/resolution/name_resolver.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <unordered_set>

#include "ivl/ast/attributes.hpp"
#include "ivl/basic/casting.hpp"
#include "ivl/sema/types/type_utils.hpp"
#include "ivl/sema/types/unification.hpp"

namespace ivl
{

namespace
{

std::vector<Type *> formal_types(gsl::span<FormalDecl * const> formals)
{
  std::vector<Type *> res;
  res.reserve(formals.size());
  for (const auto * f : formals) {
    res.push_back(f->type);
  }
  return res;
}

/// Width of a `bv<digits>` type name.
std::optional<uint32_t> parse_bv_name(std::string_view name)
{
  if (name.size() <= 2 || name.substr(0, 2) != "bv") {
    return std::nullopt;
  }
  const std::string_view digits = name.substr(2);
  if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }
  uint32_t bits = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), bits);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return bits;
}

}  // namespace

NameResolver::NameResolver(
  AstContext & ast, TypeContext & types, DiagnosticBag * diags, ResolveOptions options)
: ast_(ast), types_(types), diags_(diags), options_(options), rc_(diags)
{
}

// ============================================================================
// Entry Point
// ============================================================================

bool NameResolver::resolve(Program & program)
{
  VarScope globals(rc_);

  for (auto * decl : program.decls) {
    register_decl(decl);
  }

  // Types first: everything else may mention them
  std::vector<TypeSynonymDecl *> synonyms;
  for (auto * decl : program.decls) {
    if (auto * ctor = dyn_cast<TypeCtorDecl>(decl)) {
      resolve_attributes(ctor->attributes);
    } else if (auto * syn = dyn_cast<TypeSynonymDecl>(decl)) {
      synonyms.push_back(syn);
    }
  }
  resolve_type_synonyms(synonyms);

  std::vector<Decl *> kept;
  kept.reserve(program.decls.size());
  for (auto * decl : program.decls) {
    if (isa_any<TypeCtorDecl, TypeSynonymDecl>(decl)) {
      kept.push_back(decl);
      continue;
    }
    if (find_bool_attribute(decl->attributes, "ignore").value_or(false)) {
      kept.push_back(decl);
      continue;
    }

    const size_t errors_before = rc_.error_count();
    const size_t diag_mark = diags_ ? diags_->size() : 0;
    resolve_decl(decl);

    auto * impl = dyn_cast<ImplementationDecl>(decl);
    if (options_.overlookTypeErrors && impl && rc_.error_count() != errors_before) {
      if (diags_) {
        diags_->demote_errors_since(diag_mark);
      }
      rc_.report_warning(
        impl->get_range(),
        fmt::format(
          "Ignoring implementation {} because of translation resolution errors", impl->name));
      rc_.reset_error_count(errors_before);
      continue;
    }
    kept.push_back(decl);
  }
  if (kept.size() != program.decls.size()) {
    program.decls = ast_.copy_to_arena(kept);
  }

  // Where clauses may refer to any global
  for (auto * decl : program.decls) {
    if (auto * var = dyn_cast<VariableDecl>(decl)) {
      resolve_expr(var->where);
    }
  }

  program.resolved = !rc_.has_errors();
  return program.resolved;
}

// ============================================================================
// Registration
// ============================================================================

void NameResolver::register_decl(Decl * decl)
{
  switch (decl->get_kind()) {
    case NodeKind::TypeCtorDecl:
    case NodeKind::TypeSynonymDecl:
      rc_.add_type(cast<NamedDecl>(decl));
      break;
    case NodeKind::GlobalVarDecl:
    case NodeKind::ConstantDecl:
      rc_.add_variable(cast<VariableDecl>(decl), /*global=*/true);
      break;
    case NodeKind::FunctionDecl:
    case NodeKind::ProcedureDecl:
      rc_.add_procedure(cast<DeclWithFormals>(decl));
      break;
    default:
      // implementations look up their procedure during resolution
      break;
  }
}

// ============================================================================
// Type Synonyms
// ============================================================================

namespace
{

void find_synonym_dependencies(
  Type * t, const ResolutionContext & rc, std::vector<TypeSynonymDecl *> & deps)
{
  if (auto * u = dyn_cast<UnresolvedTypeIdentifier>(t)) {
    if (auto * syn = rc.lookup_type_synonym(u->name)) {
      if (std::find(deps.begin(), deps.end(), syn) == deps.end()) {
        deps.push_back(syn);
      }
    }
    for (Type * arg : u->args) {
      find_synonym_dependencies(arg, rc, deps);
    }
  } else if (auto * m = dyn_cast<MapType>(t)) {
    for (Type * arg : m->args) {
      find_synonym_dependencies(arg, rc, deps);
    }
    find_synonym_dependencies(m->result, rc, deps);
  } else if (auto * c = dyn_cast<CtorType>(t)) {
    for (Type * arg : c->args) {
      find_synonym_dependencies(arg, rc, deps);
    }
  }
}

}  // namespace

void NameResolver::resolve_type_synonyms(const std::vector<TypeSynonymDecl *> & synonyms)
{
  std::unordered_map<TypeSynonymDecl *, std::vector<TypeSynonymDecl *>> deps;
  for (auto * syn : synonyms) {
    find_synonym_dependencies(syn->body, rc_, deps[syn]);
  }

  std::unordered_set<TypeSynonymDecl *> resolved;
  size_t unresolved = synonyms.size();
  while (unresolved > 0) {
    for (auto * syn : synonyms) {
      if (resolved.count(syn) != 0) {
        continue;
      }
      const auto & d = deps[syn];
      if (std::all_of(d.begin(), d.end(), [&](TypeSynonymDecl * x) { return resolved.count(x); })) {
        resolve_type_synonym(syn);
        resolved.insert(syn);
      }
    }

    const size_t now_unresolved = synonyms.size() - resolved.size();
    if (now_unresolved < unresolved) {
      unresolved = now_unresolved;
      continue;
    }

    // No progress: the remaining synonyms form (or depend on) cycles
    for (auto * syn : synonyms) {
      if (resolved.count(syn) == 0) {
        rc_.report_error(
          syn->get_range(),
          fmt::format(
            "type synonym could not be resolved because of cycles: {} (replacing body with \"bool\" "
            "to continue resolving)",
            syn->name));
        syn->body = types_.bool_type();
        resolve_type_synonym(syn);
        resolved.insert(syn);
      }
    }
    unresolved = 0;
  }
}

void NameResolver::resolve_type_synonym(TypeSynonymDecl * decl)
{
  TypeBinderScope binders(rc_);
  register_type_params(decl->typeParams, decl->get_range());
  resolve_attributes(decl->attributes);
  decl->body = resolve_type(decl->body);
}

// ============================================================================
// Types
// ============================================================================

Type * NameResolver::resolve_type(Type * type)
{
  if (type == nullptr) {
    return nullptr;
  }

  switch (type->get_kind()) {
    case TypeKind::Unresolved:
      break;
    case TypeKind::Map: {
      auto * m = cast<MapType>(type);
      TypeBinderScope binders(rc_);
      register_type_params(m->typeParams, m->get_range());
      std::vector<Type *> args;
      for (Type * arg : m->args) {
        args.push_back(resolve_type(arg));
      }
      Type * result = resolve_type(m->result);
      check_bound_variable_occurrences(
        m->typeParams, args, {result}, m->get_range(), "map arguments");
      auto sorted = ivl::sort_type_params(m->typeParams, args, gsl::span<Type * const>(&result, 1));
      return types_.map_type(
        types_.copy_to_arena(sorted), types_.copy_to_arena(args), result, m->get_range());
    }
    case TypeKind::Ctor: {
      auto * c = cast<CtorType>(type);
      std::vector<Type *> args;
      for (Type * arg : c->args) {
        args.push_back(resolve_type(arg));
      }
      return types_.ctor_type(c->decl, c->name, types_.copy_to_arena(args), c->get_range());
    }
    default:
      return type;
  }

  auto * u = cast<UnresolvedTypeIdentifier>(type);
  const SourceRange range = u->get_range();

  if (auto bits = parse_bv_name(u->name)) {
    if (!u->args.empty()) {
      rc_.report_error(
        range, fmt::format("bitvector types must not be applied to arguments: {}", u->name));
    }
    return types_.bv_type(*bits);
  }

  if (TypeVariable * var = rc_.lookup_type_binder(u->name)) {
    if (!u->args.empty()) {
      rc_.report_error(
        range, fmt::format("type variables must not be applied to arguments: {}", var->name));
    }
    return var;
  }

  if (TypeCtorDecl * ctor = rc_.lookup_type(u->name)) {
    if (u->args.size() != ctor->arity()) {
      rc_.report_error(
        range, fmt::format("type constructor received wrong number of arguments: {}", ctor->name));
      return type;
    }
    std::vector<Type *> args;
    for (Type * arg : u->args) {
      args.push_back(resolve_type(arg));
    }
    return types_.ctor_type(ctor, ctor->name, types_.copy_to_arena(args), range);
  }

  if (TypeSynonymDecl * syn = rc_.lookup_type_synonym(u->name)) {
    if (u->args.size() != syn->typeParams.size()) {
      rc_.report_error(
        range, fmt::format("type synonym received wrong number of arguments: {}", syn->name));
      return type;
    }
    std::vector<Type *> args;
    TypeSubstitution subst;
    for (size_t i = 0; i < u->args.size(); ++i) {
      args.push_back(resolve_type(u->args[i]));
      subst.emplace(syn->typeParams[i], args.back());
    }
    Type * expansion = substitute(types_, syn->body, subst);
    return types_.synonym_annotation(syn, syn->name, types_.copy_to_arena(args), expansion, range);
  }

  rc_.report_error(range, fmt::format("undeclared type: {}", u->name));
  return type;
}

void NameResolver::register_type_params(gsl::span<TypeVariable *> params, SourceRange range)
{
  const auto mark = rc_.type_binder_state();
  for (TypeVariable * v : params) {
    rc_.add_type_binder(v, mark, v->get_range().is_valid() ? v->get_range() : range);
  }
}

bool NameResolver::check_bound_variable_occurrences(
  gsl::span<TypeVariable * const> params, const std::vector<Type *> & arg_types,
  const std::vector<Type *> & more_types, SourceRange range, std::string_view subject)
{
  const auto in_args = free_variables_in(arg_types);
  const auto in_more = free_variables_in(more_types);
  bool only_in_more = false;
  for (TypeVariable * var : params) {
    // a variable bound twice is only reported once
    if (rc_.lookup_type_binder(var->name) != var) {
      continue;
    }
    if (std::find(in_args.begin(), in_args.end(), var) != in_args.end()) {
      continue;
    }
    if (std::find(in_more.begin(), in_more.end(), var) != in_more.end()) {
      only_in_more = true;
    } else {
      rc_.report_error(range, fmt::format("type variable must occur in {}: {}", subject, var->name));
    }
  }
  return only_in_more;
}

void NameResolver::sort_type_params(DeclWithFormals * decl)
{
  if (decl->typeParams.empty()) {
    return;
  }
  const auto ins = formal_types(decl->inParams);
  const auto outs = formal_types(decl->outParams);
  decl->typeParams = ast_.copy_to_arena(ivl::sort_type_params(decl->typeParams, ins, outs));
}

// ============================================================================
// Declarations
// ============================================================================

void NameResolver::resolve_decl(Decl * decl)
{
  switch (decl->get_kind()) {
    case NodeKind::GlobalVarDecl:
      resolve_variable(cast<VariableDecl>(decl));
      break;
    case NodeKind::ConstantDecl:
      resolve_constant(cast<ConstantDecl>(decl));
      break;
    case NodeKind::FunctionDecl:
      resolve_function(cast<FunctionDecl>(decl));
      break;
    case NodeKind::ProcedureDecl:
      resolve_procedure(cast<ProcedureDecl>(decl));
      break;
    case NodeKind::ImplementationDecl:
      resolve_implementation(cast<ImplementationDecl>(decl));
      break;
    case NodeKind::AxiomDecl:
      resolve_axiom(cast<AxiomDecl>(decl));
      break;
    default:
      break;
  }
}

void NameResolver::resolve_variable(VariableDecl * var)
{
  var->type = resolve_type(var->type);
  resolve_attributes(var->attributes);
}

void NameResolver::resolve_constant(ConstantDecl * decl)
{
  resolve_variable(decl);
  if (decl->parents) {
    for (auto & p : *decl->parents) {
      resolve_expr(p.parent);
    }
  }
}

void NameResolver::resolve_function(FunctionDecl * decl)
{
  {
    TypeBinderScope binders(rc_);
    register_type_params(decl->typeParams, decl->get_range());
    {
      VarScope scope(rc_);
      register_formals(decl->inParams);
      register_formals(decl->outParams);
      resolve_attributes(decl->attributes);
      if (decl->body) {
        StateModeScope stateless(rc_, StateMode::Stateless);
        resolve_expr(decl->body);
      }
    }
    decl->typeParamsOnlyInOutputs = check_bound_variable_occurrences(
      decl->typeParams, formal_types(decl->inParams), formal_types(decl->outParams),
      decl->get_range(), "function arguments");
  }
  sort_type_params(decl);
}

void NameResolver::resolve_procedure(ProcedureDecl * decl)
{
  {
    VarScope scope(rc_);
    // modifies refers to globals only, so resolve it before anything is bound
    for (auto * m : decl->modifies) {
      resolve_expr(m);
    }

    TypeBinderScope binders(rc_);
    register_type_params(decl->typeParams, decl->get_range());

    register_formals(decl->inParams);
    // where clauses of in-parameters do not see the out-parameters
    resolve_where_clauses(decl->inParams);
    for (auto * r : decl->requiresClauses) {
      resolve_attributes(r->attributes);
      resolve_expr(r->condition);
    }

    register_formals(decl->outParams);
    resolve_where_clauses(decl->outParams);

    {
      StateModeScope two_state(rc_, StateMode::TwoState);
      for (auto * e : decl->ensuresClauses) {
        resolve_attributes(e->attributes);
        resolve_expr(e->condition);
      }
    }
    resolve_attributes(decl->attributes);

    decl->typeParamsOnlyInOutputs = check_bound_variable_occurrences(
      decl->typeParams, formal_types(decl->inParams), formal_types(decl->outParams),
      decl->get_range(), "procedure arguments");
  }
  sort_type_params(decl);
}

void NameResolver::resolve_implementation(ImplementationDecl * decl)
{
  if (decl->proc != nullptr) {
    return;  // already resolved
  }

  DeclWithFormals * target = rc_.lookup_procedure(decl->name);
  if (target == nullptr) {
    rc_.report_error(
      decl->get_range(),
      fmt::format("implementation given for undeclared procedure: {}", decl->name));
  } else if (auto * proc = dyn_cast<ProcedureDecl>(target)) {
    decl->proc = proc;
  } else {
    rc_.report_error(
      decl->get_range(),
      fmt::format("implementations given for function, not procedure: {}", decl->name));
  }

  {
    TypeBinderScope binders(rc_);
    register_type_params(decl->typeParams, decl->get_range());
    {
      VarScope scope(rc_);
      register_formals(decl->inParams);
      register_formals(decl->outParams);
      for (auto * local : decl->locals) {
        rc_.add_variable(local);
        resolve_variable(local);
      }
      for (auto * local : decl->locals) {
        resolve_expr(local->where);
      }
      resolve_where_clauses(decl->inParams);
      resolve_where_clauses(decl->outParams);

      rc_.push_procedure_context();
      for (auto * block : decl->blocks) {
        rc_.add_block(block);
      }
      resolve_attributes(decl->attributes);
      {
        StateModeScope two_state(rc_, StateMode::TwoState);
        for (auto * block : decl->blocks) {
          visit(block);
        }
      }
      rc_.pop_procedure_context();
    }
    decl->typeParamsOnlyInOutputs = check_bound_variable_occurrences(
      decl->typeParams, formal_types(decl->inParams), formal_types(decl->outParams),
      decl->get_range(), "implementation arguments");
  }
  sort_type_params(decl);
}

void NameResolver::resolve_axiom(AxiomDecl * decl)
{
  StateModeScope stateless(rc_, StateMode::Stateless);
  resolve_attributes(decl->attributes);
  resolve_expr(decl->expr);
}

// ============================================================================
// Helpers
// ============================================================================

void NameResolver::resolve_attributes(gsl::span<Attribute *> attrs)
{
  for (auto * a : attrs) {
    visit(a);
  }
}

void NameResolver::resolve_expr(Expr * expr)
{
  if (expr) {
    visit(expr);
  }
}

void NameResolver::register_formals(gsl::span<FormalDecl *> formals)
{
  for (auto * f : formals) {
    if (!f->name.empty()) {
      rc_.add_variable(f);
    }
    resolve_variable(f);
  }
}

void NameResolver::resolve_where_clauses(gsl::span<FormalDecl *> formals)
{
  for (auto * f : formals) {
    resolve_expr(f->where);
  }
}

// ============================================================================
// Expressions
// ============================================================================

bool NameResolver::visit_identifier_expr(IdentifierExpr * node)
{
  node->decl = rc_.lookup_variable(node->name);
  if (node->decl == nullptr) {
    rc_.report_error(node->get_range(), fmt::format("undeclared identifier: {}", node->name));
  } else if (rc_.state_mode() == StateMode::Stateless && isa<GlobalVarDecl>(node->decl)) {
    rc_.report_error(
      node->get_range(),
      fmt::format("cannot refer to a global variable in this context: {}", node->name));
  }
  return true;
}

bool NameResolver::visit_old_expr(OldExpr * node)
{
  if (rc_.state_mode() != StateMode::TwoState) {
    rc_.report_error(node->get_range(), "old expressions allowed only in two-state contexts");
  }
  return visit(node->expr);
}

bool NameResolver::visit_function_call_expr(FunctionCallExpr * node)
{
  DeclWithFormals * target = rc_.lookup_procedure(node->name);
  if (target == nullptr) {
    rc_.report_error(
      node->get_range(), fmt::format("undeclared function or procedure: {}", node->name));
  } else if (auto * fn = dyn_cast<FunctionDecl>(target)) {
    node->decl = fn;
  } else {
    rc_.report_error(
      node->get_range(), fmt::format("procedure cannot be called in an expression: {}", node->name));
  }
  for (auto * arg : node->args) {
    visit(arg);
  }
  return true;
}

bool NameResolver::visit_quantifier_expr(QuantifierExpr * node)
{
  TypeBinderScope binders(rc_);
  register_type_params(node->typeParams, node->get_range());

  VarScope scope(rc_);
  for (auto * v : node->vars) {
    rc_.add_variable(v);
  }
  std::vector<Type *> var_types;
  for (auto * v : node->vars) {
    resolve_variable(v);
    var_types.push_back(v->type);
  }
  resolve_attributes(node->attributes);
  for (auto * t : node->triggers) {
    visit(t);
  }
  resolve_expr(node->body);

  const auto mentioned = free_variables_in(var_types);
  for (TypeVariable * p : node->typeParams) {
    if (std::find(mentioned.begin(), mentioned.end(), p) == mentioned.end()) {
      rc_.report_error(
        node->get_range(),
        fmt::format("the type variable {} does not occur in types of the quantified variables", p->name));
    }
  }
  node->typeParams =
    ast_.copy_to_arena(ivl::sort_type_params(node->typeParams, var_types, {}));
  return true;
}

// ============================================================================
// Commands
// ============================================================================

bool NameResolver::visit_assign_cmd(AssignCmd * node)
{
  if (node->lhss.size() != node->rhss.size()) {
    rc_.report_error(
      node->get_range(), "number of left-hand sides does not match number of right-hand sides");
  }
  for (auto * lhs : node->lhss) {
    visit(lhs);
  }
  for (auto * rhs : node->rhss) {
    visit(rhs);
  }

  std::vector<const VariableDecl *> assigned;
  for (auto * lhs : node->lhss) {
    const IdentifierExpr * id = lhs->deep_assigned_identifier();
    if (id->decl == nullptr) {
      continue;
    }
    if (std::find(assigned.begin(), assigned.end(), id->decl) != assigned.end()) {
      rc_.report_error(
        lhs->get_range(),
        fmt::format("variable {} is assigned more than once in parallel assignment", id->name));
    }
    assigned.push_back(id->decl);
  }
  return true;
}

bool NameResolver::visit_call_cmd(CallCmd * node)
{
  DeclWithFormals * target = rc_.lookup_procedure(node->callee);
  if (target == nullptr) {
    rc_.report_error(
      node->get_range(), fmt::format("undeclared function or procedure: {}", node->callee));
  } else if (auto * proc = dyn_cast<ProcedureDecl>(target)) {
    node->proc = proc;
  } else {
    rc_.report_error(
      node->get_range(), fmt::format("call to function, not procedure: {}", node->callee));
  }

  resolve_attributes(node->attributes);
  for (auto * in : node->ins) {
    visit(in);
  }
  std::vector<const VariableDecl *> assigned;
  for (auto * out : node->outs) {
    visit(out);
    if (out->decl == nullptr) {
      continue;
    }
    if (std::find(assigned.begin(), assigned.end(), out->decl) != assigned.end()) {
      rc_.report_error(
        out->get_range(),
        fmt::format("the same variable may not be assigned twice in one call: {}", out->name));
    }
    assigned.push_back(out->decl);
  }
  return true;
}

bool NameResolver::visit_goto_cmd(GotoCmd * node)
{
  std::vector<Block *> targets;
  targets.reserve(node->labels.size());
  for (auto label : node->labels) {
    Block * b = rc_.lookup_block(label);
    if (b == nullptr) {
      rc_.report_error(node->get_range(), fmt::format("no such label: {}", label));
      continue;
    }
    targets.push_back(b);
  }
  node->targets = ast_.copy_to_arena(targets);
  return true;
}

}  // namespace ivl
