// ivl/sema/types/type_checker.cpp - Type inference and checking
//
#include "ivl/sema/types/type_checker.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "ivl/ast/attributes.hpp"
#include "ivl/ast/visitor.hpp"
#include "ivl/basic/casting.hpp"
#include "ivl/basic/internal_error.hpp"
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

bool is_ignored(const Decl * decl)
{
  return find_bool_attribute(decl->attributes, "ignore").value_or(false);
}

/// Type parameters of the map type an index operation is applied to.
gsl::span<TypeVariable *> map_type_params(Type * map_type)
{
  if (auto * m = dyn_cast<MapType>(expanded(map_type))) {
    return m->typeParams;
  }
  return {};
}

// ============================================================================
// Ambiguity Sweep
// ============================================================================

/**
 * Post-order walk collecting undefined proxies in expression types and
 * instantiations.
 *
 * Each proxy is reported only once, at the innermost node that mentions
 * it. Attribute parameters and ignored declarations are not visited.
 */
class AmbiguitySeeker : public RecursiveAstVisitor<AmbiguitySeeker>
{
  using Base = RecursiveAstVisitor<AmbiguitySeeker>;

public:
  struct Finding
  {
    SourceRange range;
    std::string message;
  };

  bool visit(AstNode * node)
  {
    if (node == nullptr || isa<Attribute>(node)) {
      return true;
    }
    if (auto * d = dyn_cast<Decl>(node); d && is_ignored(d)) {
      return true;
    }
    if (!Base::visit(node)) {
      return false;
    }
    inspect(node);
    return true;
  }

  std::vector<Finding> findings;
  /// First node that was never assigned a type
  const AstNode * untyped = nullptr;

private:
  void inspect(AstNode * node)
  {
    switch (node->get_kind()) {
      case NodeKind::FunctionCall: {
        auto * call = cast<FunctionCallExpr>(node);
        check_type_args(
          call->typeArgs, call->decl->typeParams, fmt::format("application of {}", call->name),
          call->get_range());
        break;
      }
      case NodeKind::MapSelect: {
        auto * sel = cast<MapSelectExpr>(node);
        check_type_args(
          sel->typeArgs, map_type_params(sel->map->type), "map select", sel->get_range());
        break;
      }
      case NodeKind::MapStore: {
        auto * st = cast<MapStoreExpr>(node);
        check_type_args(
          st->typeArgs, map_type_params(st->map->type), "map store", st->get_range());
        break;
      }
      case NodeKind::MapAssignLhs: {
        auto * lhs = cast<MapAssignLhs>(node);
        check_type_args(
          lhs->typeArgs, map_type_params(lhs->map->type), "map assignment", lhs->get_range());
        break;
      }
      case NodeKind::CallCmd: {
        auto * call = cast<CallCmd>(node);
        check_type_args(
          call->typeArgs, call->proc->typeParams, fmt::format("call to {}", call->callee),
          call->get_range());
        break;
      }
      default:
        break;
    }

    if (auto * e = dyn_cast<Expr>(node)) {
      check_type(e->type, e);
    } else if (auto * lhs = dyn_cast<AssignLhs>(node)) {
      check_type(lhs->type, lhs);
    }
  }

  void check_type(Type * t, const AstNode * node)
  {
    if (t == nullptr) {
      if (untyped == nullptr) untyped = node;
      return;
    }
    if (mark_new_proxies(t)) {
      findings.push_back(
        {node->get_range(), fmt::format("type of expression is ambiguous: {}", to_string(t))});
    }
  }

  void check_type_args(
    gsl::span<Type *> args, gsl::span<TypeVariable *> params, const std::string & op,
    SourceRange range)
  {
    for (size_t i = 0; i < args.size(); ++i) {
      if (mark_new_proxies(args[i])) {
        const std::string_view name = i < params.size() ? params[i]->name : std::string_view("?");
        findings.push_back({range, fmt::format("type parameter {} is ambiguous in {}", name, op)});
      }
    }
  }

  /// True if @p t mentions an undefined proxy not reported before.
  bool mark_new_proxies(Type * t)
  {
    bool fresh = false;
    for (TypeProxy * p : free_proxies(t)) {
      if (reported_.insert(p).second) {
        fresh = true;
      }
    }
    return fresh;
  }

  std::unordered_set<const TypeProxy *> reported_;
};

}  // namespace

// ============================================================================
// Construction
// ============================================================================

TypeChecker::TypeChecker(TypeContext & types, DiagnosticBag * diags) : types_(types), diags_(diags)
{
}

// ============================================================================
// Entry Points
// ============================================================================

bool TypeChecker::check(Program & program)
{
  if (!program.resolved) {
    throw InternalError("type checking requires a resolved program");
  }

  for (auto * decl : program.decls) {
    if (is_ignored(decl)) continue;
    check_decl(decl);
  }

  // Proxies can only be judged once every constraint has been seen.
  if (error_count_ == 0) {
    check_ambiguities(program);
  }
  if (error_count_ == 0) {
    assert_fully_typed(program);
  }

  return error_count_ == 0;
}

Type * TypeChecker::check_expr(Expr * expr)
{
  if (!expr) {
    throw InternalError("check_expr() on a missing expression");
  }

  Type * result = nullptr;

  switch (expr->get_kind()) {
    case NodeKind::IntLiteral:
      result = types_.int_type();
      break;
    case NodeKind::BvLiteral:
      result = types_.bv_type(cast<BvLiteralExpr>(expr)->bits);
      break;
    case NodeKind::BoolLiteral:
    case NodeKind::MissingExpr:
      result = types_.bool_type();
      break;
    case NodeKind::Identifier:
      result = infer_identifier(cast<IdentifierExpr>(expr));
      break;
    case NodeKind::Old:
      result = check_expr(cast<OldExpr>(expr)->expr);
      break;
    case NodeKind::Unary:
      result = infer_unary_expr(cast<UnaryExpr>(expr));
      break;
    case NodeKind::Binary:
      result = infer_binary_expr(cast<BinaryExpr>(expr));
      break;
    case NodeKind::FunctionCall:
      result = infer_function_call(cast<FunctionCallExpr>(expr));
      break;
    case NodeKind::MapSelect:
      result = infer_map_select(cast<MapSelectExpr>(expr));
      break;
    case NodeKind::MapStore:
      result = infer_map_store(cast<MapStoreExpr>(expr));
      break;
    case NodeKind::BvExtract:
      result = infer_bv_extract(cast<BvExtractExpr>(expr));
      break;
    case NodeKind::IfThenElse:
      result = infer_if_then_else(cast<IfThenElseExpr>(expr));
      break;
    case NodeKind::Quantifier:
      result = infer_quantifier(cast<QuantifierExpr>(expr));
      break;
    default:
      throw InternalError("check_expr() on a non-expression node");
  }

  expr->type = result;
  return result;
}

// ============================================================================
// Expression Type Inference
// ============================================================================

Type * TypeChecker::infer_identifier(IdentifierExpr * node)
{
  if (node->decl == nullptr) {
    throw InternalError(fmt::format("identifier {} was not resolved", node->name));
  }
  return node->decl->type;
}

Type * TypeChecker::infer_unary_expr(UnaryExpr * node)
{
  Type * t = check_expr(node->operand);
  Type * expected = node->op == UnaryOp::Not ? static_cast<Type *>(types_.bool_type())
                                             : static_cast<Type *>(types_.int_type());
  if (!unify(types_, t, expected)) {
    report_error(
      node->get_range(), fmt::format(
                           "invalid argument type ({}) to unary operator {}", to_string(t),
                           to_string(node->op)));
  }
  return expected;
}

Type * TypeChecker::infer_binary_expr(BinaryExpr * node)
{
  Type * t0 = check_expr(node->lhs);
  Type * t1 = check_expr(node->rhs);

  if (node->op == BinaryOp::Concat) {
    return infer_concat(node, t0, t1);
  }

  bool ok = false;
  Type * result = types_.bool_type();

  if (is_arithmetic(node->op)) {
    ok = unify(types_, t0, types_.int_type()) && unify(types_, t1, types_.int_type());
    result = types_.int_type();
  } else if (is_logical(node->op)) {
    ok = expect_bool(t0) && expect_bool(t1);
  } else {
    switch (node->op) {
      case BinaryOp::Lt:
      case BinaryOp::Le:
      case BinaryOp::Gt:
      case BinaryOp::Ge:
        ok = unify(types_, t0, types_.int_type()) && unify(types_, t1, types_.int_type());
        break;
      case BinaryOp::Eq:
      case BinaryOp::Neq:
        ok = unify(types_, t0, t1);
        break;
      case BinaryOp::Subtype:
        ok = unify(types_, t0, t1) && !is_bool(t0);
        break;
      default:
        break;
    }
  }

  if (!ok) {
    report_error(
      node->get_range(), fmt::format(
                           "invalid argument types ({} and {}) to binary operator {}",
                           to_string(t0), to_string(t1), to_string(node->op)));
  }
  return result;
}

Type * TypeChecker::infer_concat(BinaryExpr * node, Type * lhs, Type * rhs)
{
  if (!unify(types_, lhs, types_.new_bv_proxy(0)) || !unify(types_, rhs, types_.new_bv_proxy(0))) {
    report_error(
      node->get_range(), fmt::format(
                           "++ operands need to be bitvectors (got {}, {})", to_string(lhs),
                           to_string(rhs)));
    return error_type();
  }

  const Type * l = expanded(lhs);
  const Type * r = expanded(rhs);
  if (isa<BvType>(l) && isa<BvType>(r)) {
    return types_.bv_type(cast<BvType>(l)->bits + cast<BvType>(r)->bits);
  }
  return types_.new_bv_proxy(lhs, rhs, node->get_range());
}

Type * TypeChecker::infer_function_call(FunctionCallExpr * node)
{
  FunctionDecl * fn = node->decl;
  if (fn == nullptr) {
    throw InternalError(fmt::format("function application {} was not resolved", node->name));
  }

  for (auto * arg : node->args) {
    check_expr(arg);
  }

  const std::vector<Type *> ins = formal_types(fn->inParams);
  const std::vector<Type *> outs = formal_types(fn->outParams);
  auto inst = instantiate(
    fn->typeParams, ins, node->args, outs, {}, false, node->get_range(),
    fmt::format("application of {}", fn->name));
  if (!inst) {
    return outs.empty() ? error_type() : outs.front();
  }

  node->typeArgs = types_.copy_to_arena(inst->typeArgs);
  return inst->outs.empty() ? error_type() : inst->outs.front();
}

Type * TypeChecker::infer_map_select(MapSelectExpr * node)
{
  Type * map_type = check_expr(node->map);
  for (auto * idx : node->indices) {
    check_expr(idx);
  }
  return map_select_type(map_type, node->indices, node->get_range(), node->typeArgs);
}

Type * TypeChecker::infer_map_store(MapStoreExpr * node)
{
  Type * map_type = check_expr(node->map);
  for (auto * idx : node->indices) {
    check_expr(idx);
  }
  Type * value = check_expr(node->value);

  Type * elem = map_select_type(map_type, node->indices, node->get_range(), node->typeArgs);
  if (!unify(types_, value, elem)) {
    report_error(
      node->value->get_range(), fmt::format(
                                  "right-hand side in map store with wrong type: {} (expected: {})",
                                  to_string(value), to_string(elem)));
  }
  return map_type;
}

Type * TypeChecker::map_select_type(
  Type * map_type, gsl::span<Expr *> indices, SourceRange range, gsl::span<Type *> & type_args)
{
  const auto arity = static_cast<uint32_t>(indices.size());

  if (const auto * known = dyn_cast<MapType>(expanded(map_type)); known && known->arity() != arity) {
    report_error(
      range, fmt::format(
               "wrong number of arguments in map select: {} instead of {}", arity,
               known->arity()));
    return error_type();
  }

  if (!unify(types_, map_type, types_.new_map_proxy(arity, range))) {
    report_error(
      range, fmt::format("map type expected in map select, got: {}", to_string(map_type)));
    return error_type();
  }

  Type * m = expanded(map_type);

  // Shape still unknown: remember how the map is used.
  if (auto * proxy = dyn_cast<MapTypeProxy>(m)) {
    std::vector<Type *> arg_types;
    arg_types.reserve(indices.size());
    for (auto * idx : indices) {
      arg_types.push_back(idx->type);
    }
    Type * result = types_.new_proxy("result", range);
    add_map_constraint(types_, proxy, types_.copy_to_arena(arg_types), result);
    return result;
  }

  auto * mt = cast<MapType>(m);
  const std::array<Type *, 1> results{mt->result};
  auto inst = instantiate(
    mt->typeParams, mt->args, indices, results, {}, false, range, "map select");
  if (!inst) {
    return error_type();
  }
  type_args = types_.copy_to_arena(inst->typeArgs);
  return inst->outs.front();
}

Type * TypeChecker::infer_bv_extract(BvExtractExpr * node)
{
  Type * t = check_expr(node->bv);

  if (node->end < node->start) {
    report_error(
      node->get_range(), "start index in extract must be no bigger than the end index");
    return types_.bv_type(0);
  }

  if (!unify(types_, t, types_.new_bv_proxy(node->end))) {
    report_error(
      node->get_range(), fmt::format(
                           "extract operand must be a bitvector of at least {} bits (got {})",
                           node->end, to_string(t)));
  }
  return types_.bv_type(node->end - node->start);
}

Type * TypeChecker::infer_if_then_else(IfThenElseExpr * node)
{
  Type * cond = check_expr(node->cond);
  Type * then_type = check_expr(node->thenExpr);
  Type * else_type = check_expr(node->elseExpr);

  if (!expect_bool(cond)) {
    report_error(
      node->cond->get_range(),
      fmt::format("the first argument to if-then-else should be bool, not {}", to_string(cond)));
  }
  if (!unify(types_, then_type, else_type)) {
    report_error(
      node->get_range(), fmt::format(
                           "branches of if-then-else have incompatible types {} and {}",
                           to_string(then_type), to_string(else_type)));
  }
  return then_type;
}

Type * TypeChecker::infer_quantifier(QuantifierExpr * node)
{
  for (auto * var : node->vars) {
    check_where(var);
  }
  check_attributes(node->attributes);
  for (auto * trigger : node->triggers) {
    for (auto * e : trigger->exprs) {
      check_expr(e);
    }
  }

  Type * body = check_expr(node->body);
  if (!expect_bool(body)) {
    report_error(node->body->get_range(), "quantifier body must be of type bool");
  }
  return types_.bool_type();
}

// ============================================================================
// Commands
// ============================================================================

void TypeChecker::check_block(Block * block)
{
  for (auto * cmd : block->cmds) {
    check_cmd(cmd);
  }
}

void TypeChecker::check_cmd(Cmd * cmd)
{
  switch (cmd->get_kind()) {
    case NodeKind::AssignCmd:
      check_assign_cmd(cast<AssignCmd>(cmd));
      break;

    case NodeKind::AssertCmd: {
      auto * node = cast<AssertCmd>(cmd);
      check_attributes(node->attributes);
      Type * t = check_expr(node->expr);
      if (!expect_bool(t)) {
        report_error(
          node->expr->get_range(),
          fmt::format("an asserted expression must be of type bool (instead of {})", to_string(t)));
      }
      break;
    }

    case NodeKind::AssumeCmd: {
      auto * node = cast<AssumeCmd>(cmd);
      check_attributes(node->attributes);
      Type * t = check_expr(node->expr);
      if (!expect_bool(t)) {
        report_error(
          node->expr->get_range(),
          fmt::format("an assumed expression must be of type bool (instead of {})", to_string(t)));
      }
      break;
    }

    case NodeKind::HavocCmd:
      for (auto * var : cast<HavocCmd>(cmd)->vars) {
        check_expr(var);
        check_assignment_target(var);
      }
      break;

    case NodeKind::CallCmd:
      check_call_cmd(cast<CallCmd>(cmd));
      break;

    default:
      break;
  }
}

void TypeChecker::check_assign_cmd(AssignCmd * node)
{
  for (auto * lhs : node->lhss) {
    check_lhs(lhs);
    check_assignment_target(lhs->deep_assigned_identifier());
  }
  for (auto * rhs : node->rhss) {
    check_expr(rhs);
  }

  const size_t n = std::min(node->lhss.size(), node->rhss.size());
  for (size_t i = 0; i < n; ++i) {
    Type * lt = node->lhss[i]->type;
    Type * rt = node->rhss[i]->type;
    if (!unify(types_, rt, lt)) {
      report_error(
        node->rhss[i]->get_range(),
        fmt::format(
          "mismatched types in assignment command (cannot assign {} to {})", to_string(rt),
          to_string(lt)));
    }
  }
}

void TypeChecker::check_call_cmd(CallCmd * node)
{
  ProcedureDecl * proc = node->proc;
  if (proc == nullptr) {
    throw InternalError(fmt::format("call to {} was not resolved", node->callee));
  }

  check_attributes(node->attributes);
  for (auto * in : node->ins) {
    check_expr(in);
  }
  for (auto * out : node->outs) {
    check_expr(out);
    check_assignment_target(out);
  }

  auto inst = instantiate(
    proc->typeParams, formal_types(proc->inParams), node->ins, formal_types(proc->outParams),
    node->outs, true, node->get_range(), fmt::format("call to {}", proc->name));
  if (inst) {
    node->typeArgs = types_.copy_to_arena(inst->typeArgs);
  }
}

Type * TypeChecker::check_lhs(AssignLhs * lhs)
{
  if (auto * simple = dyn_cast<SimpleAssignLhs>(lhs)) {
    lhs->type = check_expr(simple->var);
    return lhs->type;
  }

  auto * m = cast<MapAssignLhs>(lhs);
  Type * map_type = check_lhs(m->map);
  for (auto * idx : m->indices) {
    check_expr(idx);
  }
  lhs->type = map_select_type(map_type, m->indices, m->get_range(), m->typeArgs);
  return lhs->type;
}

void TypeChecker::check_assignment_target(IdentifierExpr * id)
{
  VariableDecl * var = id->decl;
  if (var == nullptr) {
    throw InternalError(fmt::format("assignment target {} was not resolved", id->name));
  }

  if (!var->is_mutable()) {
    report_error(
      id->get_range(), fmt::format("command assigns to an immutable variable: {}", id->name));
    return;
  }

  if (frame_ && isa<GlobalVarDecl>(var)) {
    for (const auto * m : *frame_) {
      if (m->decl == var) return;
    }
    report_error(
      id->get_range(),
      fmt::format(
        "command assigns to a global variable that is not in the enclosing procedure's modifies "
        "clause: {}",
        id->name));
  }
}

// ============================================================================
// Declarations
// ============================================================================

void TypeChecker::check_decl(Decl * decl)
{
  switch (decl->get_kind()) {
    case NodeKind::GlobalVarDecl:
      check_where(cast<GlobalVarDecl>(decl));
      break;
    case NodeKind::ConstantDecl:
      check_constant(cast<ConstantDecl>(decl));
      break;
    case NodeKind::TypeCtorDecl:
    case NodeKind::TypeSynonymDecl:
      check_attributes(decl->attributes);
      break;
    case NodeKind::FunctionDecl:
      check_function(cast<FunctionDecl>(decl));
      break;
    case NodeKind::ProcedureDecl:
      check_procedure(cast<ProcedureDecl>(decl));
      break;
    case NodeKind::ImplementationDecl:
      check_implementation(cast<ImplementationDecl>(decl));
      break;
    case NodeKind::AxiomDecl: {
      auto * axiom = cast<AxiomDecl>(decl);
      check_attributes(axiom->attributes);
      if (!expect_bool(check_expr(axiom->expr))) {
        report_error(axiom->expr->get_range(), "axioms must be of type bool");
      }
      break;
    }
    default:
      throw InternalError("unexpected top-level declaration");
  }
}

void TypeChecker::check_constant(ConstantDecl * decl)
{
  check_where(decl);
  if (!decl->parents) return;

  std::unordered_set<const VariableDecl *> seen;
  for (const auto & p : *decl->parents) {
    IdentifierExpr * id = p.parent;
    check_expr(id);
    const auto * parent = dyn_cast<ConstantDecl>(id->decl);
    if (parent == nullptr) {
      report_error(
        id->get_range(), fmt::format("the parent of a constant has to be a constant: {}", id->name));
    } else if (parent == decl) {
      report_error(
        id->get_range(), fmt::format("a constant cannot be a parent of itself: {}", id->name));
    } else if (!seen.insert(parent).second) {
      report_error(
        id->get_range(), fmt::format("constant cannot appear twice in parent list: {}", id->name));
    } else if (!types_equal(parent->type, decl->type)) {
      report_error(
        id->get_range(), fmt::format(
                           "parent of constant has incompatible type ({} instead of {})",
                           to_string(parent->type), to_string(decl->type)));
    }
  }
}

void TypeChecker::check_function(FunctionDecl * decl)
{
  check_attributes(decl->attributes);
  if (decl->body == nullptr) return;

  Type * body = check_expr(decl->body);
  FormalDecl * result = decl->out_param();
  if (result == nullptr) {
    throw InternalError(fmt::format("function {} has no result", decl->name));
  }
  if (!unify(types_, body, result->type)) {
    report_error(
      decl->body->get_range(), fmt::format(
                                 "function body with invalid type: {} (expected: {})",
                                 to_string(body), to_string(result->type)));
  }
}

void TypeChecker::check_procedure(ProcedureDecl * decl)
{
  check_attributes(decl->attributes);
  for (auto * f : decl->inParams) check_where(f);
  for (auto * f : decl->outParams) check_where(f);

  for (auto * r : decl->requiresClauses) {
    check_attributes(r->attributes);
    if (!expect_bool(check_expr(r->condition))) {
      report_error(r->condition->get_range(), "preconditions must be of type bool");
    }
  }

  for (auto * m : decl->modifies) {
    check_expr(m);
    if (isa<ConstantDecl>(m->decl)) {
      report_error(
        m->get_range(), fmt::format("modifies list contains constant: {}", m->name));
    }
  }

  for (auto * e : decl->ensuresClauses) {
    check_attributes(e->attributes);
    if (!expect_bool(check_expr(e->condition))) {
      report_error(e->condition->get_range(), "postconditions must be of type bool");
    }
  }
}

void TypeChecker::check_implementation(ImplementationDecl * decl)
{
  ProcedureDecl * proc = decl->proc;
  if (proc == nullptr) {
    throw InternalError(fmt::format("implementation {} was not resolved", decl->name));
  }

  check_attributes(decl->attributes);

  if (decl->typeParams.size() != proc->typeParams.size()) {
    report_error(
      decl->get_range(),
      fmt::format("mismatched number of type parameters in procedure implementation: {}", decl->name));
  } else {
    match_formals(decl, decl->inParams, proc->inParams, "in");
    match_formals(decl, decl->outParams, proc->outParams, "out");
  }

  for (auto * f : decl->inParams) check_where(f);
  for (auto * f : decl->outParams) check_where(f);
  for (auto * local : decl->locals) check_where(local);

  frame_ = proc->modifies;
  for (auto * block : decl->blocks) {
    check_block(block);
  }
  frame_.reset();
}

void TypeChecker::match_formals(
  ImplementationDecl * impl, gsl::span<FormalDecl *> impl_formals,
  gsl::span<FormalDecl *> proc_formals, std::string_view inout)
{
  if (impl_formals.size() != proc_formals.size()) {
    report_error(
      impl->get_range(), fmt::format(
                           "mismatched number of {}-parameters in procedure implementation: {}",
                           inout, impl->name));
    return;
  }

  // Rename both sides' type parameters to shared variables.
  TypeSubstitution impl_subst;
  TypeSubstitution proc_subst;
  for (size_t i = 0; i < impl->typeParams.size(); ++i) {
    TypeVariable * shared = types_.new_type_variable(impl->typeParams[i]->name);
    impl_subst[impl->typeParams[i]] = shared;
    proc_subst[impl->proc->typeParams[i]] = shared;
  }

  for (size_t i = 0; i < impl_formals.size(); ++i) {
    Type * it = substitute(types_, impl_formals[i]->type, impl_subst);
    Type * pt = substitute(types_, proc_formals[i]->type, proc_subst);
    if (types_equal(it, pt)) continue;

    const std::string name =
      impl_formals[i]->name == proc_formals[i]->name
        ? std::string(impl_formals[i]->name)
        : fmt::format(
            "{} (named {} in implementation)", proc_formals[i]->name, impl_formals[i]->name);
    report_error(
      impl_formals[i]->get_range(),
      fmt::format("mismatched type of {}-parameter in implementation {}: {}", inout, impl->name, name));
  }
}

// ============================================================================
// Helper Methods
// ============================================================================

std::optional<Instantiation> TypeChecker::instantiate(
  gsl::span<TypeVariable * const> type_params, gsl::span<Type * const> formal_ins,
  gsl::span<Expr * const> actual_ins, gsl::span<Type * const> formal_outs,
  gsl::span<IdentifierExpr * const> actual_outs, bool check_outs, SourceRange range,
  std::string_view op_name)
{
  DiagnosticBag local;
  auto inst = check_argument_types(
    types_, type_params, formal_ins, actual_ins, formal_outs, actual_outs, check_outs, range,
    op_name, &local);
  error_count_ += local.error_count();
  if (diags_) {
    diags_->merge(local);
  }
  return inst;
}

void TypeChecker::check_attributes(gsl::span<Attribute *> attrs)
{
  for (auto * attr : attrs) {
    for (const auto & p : attr->params) {
      if (p.expr) check_expr(p.expr);
    }
  }
}

void TypeChecker::check_where(VariableDecl * var)
{
  check_attributes(var->attributes);
  if (var->where == nullptr) return;
  if (!expect_bool(check_expr(var->where))) {
    report_error(var->where->get_range(), "where clauses must be of type bool");
  }
}

bool TypeChecker::expect_bool(Type * t)
{
  return t == nullptr || unify(types_, t, types_.bool_type());
}

void TypeChecker::report_error(SourceRange range, std::string message)
{
  ++error_count_;
  if (diags_) {
    diags_->report_error(range, std::move(message));
  }
}

void TypeChecker::check_ambiguities(Program & program)
{
  AmbiguitySeeker seeker;
  seeker.visit(&program);
  for (auto & f : seeker.findings) {
    report_error(f.range, std::move(f.message));
  }
}

void TypeChecker::assert_fully_typed(Program & program)
{
  AmbiguitySeeker seeker;
  seeker.visit(&program);
  if (seeker.untyped != nullptr) {
    throw InternalError(fmt::format(
      "node at offset {} has no type after type checking",
      seeker.untyped->get_range().get_begin().get_offset()));
  }
  if (!seeker.findings.empty()) {
    throw InternalError(fmt::format(
      "undefined type proxy left after type checking: {}", seeker.findings.front().message));
  }
}

}  // namespace ivl
