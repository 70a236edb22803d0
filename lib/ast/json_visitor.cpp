// ivl/ast/json_visitor.cpp - JSON serialization implementation
//
#include "ivl/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "ivl/ast/ast.hpp"
#include "ivl/ast/ast_enums.hpp"
#include "ivl/basic/casting.hpp"
#include "ivl/basic/source_manager.hpp"

namespace ivl
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

uint32_t begin_off(SourceRange r) { return r.get_begin().get_offset(); }
uint32_t end_off(SourceRange r) { return r.get_end().get_offset(); }

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", begin_off(r)}, {"end", end_off(r)}};
}

std::string str(std::string_view s) { return std::string(s); }

// Forward declarations
json j_expr(const Expr * e);
json j_cmd(const Cmd * c);
json j_decl(const Decl * d);

json j_type(const Type * t) { return to_json(t); }
json j_type_or_null(const Type * t) { return t ? to_json(t) : json(nullptr); }

template <typename T, typename F>
json j_array(gsl::span<T> items, F && fn)
{
  json arr = json::array();
  for (const auto & item : items) arr.push_back(fn(item));
  return arr;
}

json j_exprs(gsl::span<Expr *> exprs) { return j_array(exprs, j_expr); }

// ============================================================================
// Supporting nodes
// ============================================================================

json j_attribute(const Attribute * a)
{
  json params = json::array();
  for (const auto & p : a->params) {
    if (p.is_string()) {
      params.push_back(json{{"string", str(p.str)}});
    } else {
      params.push_back(j_expr(p.expr));
    }
  }
  return json{
    {"type", "Attribute"}, {"range", j_range(a->get_range())}, {"key", str(a->key)},
    {"params", params}};
}

json j_attributes(gsl::span<Attribute *> attrs) { return j_array(attrs, j_attribute); }

json j_trigger(const Trigger * t)
{
  return json{
    {"type", "Trigger"}, {"range", j_range(t->get_range())}, {"exprs", j_exprs(t->exprs)}};
}

json j_variable(const VariableDecl * v)
{
  json j{
    {"type", v->kind == NodeKind::FormalDecl     ? "FormalDecl"
             : v->kind == NodeKind::LocalVarDecl ? "LocalVarDecl"
             : v->kind == NodeKind::BoundVarDecl ? "BoundVarDecl"
                                                 : "VariableDecl"},
    {"range", j_range(v->get_range())},
    {"name", str(v->name)},
    {"typeExpr", j_type_or_null(v->type)}};
  if (const auto * f = dyn_cast<FormalDecl>(v)) j["incoming"] = f->incoming;
  if (v->where) j["where"] = j_expr(v->where);
  if (!v->attributes.empty()) j["attributes"] = j_attributes(v->attributes);
  return j;
}

json j_type_params(gsl::span<TypeVariable *> params)
{
  json arr = json::array();
  for (const auto * p : params) arr.push_back(str(p->name));
  return arr;
}

json j_lhs(const AssignLhs * lhs)
{
  if (const auto * s = dyn_cast<SimpleAssignLhs>(lhs)) {
    return json{
      {"type", "SimpleAssignLhs"}, {"range", j_range(s->get_range())}, {"var", j_expr(s->var)}};
  }
  const auto * m = cast<MapAssignLhs>(lhs);
  return json{
    {"type", "MapAssignLhs"},
    {"range", j_range(m->get_range())},
    {"map", j_lhs(m->map)},
    {"indices", j_exprs(m->indices)}};
}

json j_block(const Block * b)
{
  json j{
    {"type", "Block"},
    {"range", j_range(b->get_range())},
    {"label", str(b->label)},
    {"cmds", j_array(b->cmds, j_cmd)}};
  if (const auto * g = dyn_cast<GotoCmd>(b->transfer)) {
    json labels = json::array();
    for (auto l : g->labels) labels.push_back(str(l));
    j["transfer"] = json{{"type", "GotoCmd"}, {"range", j_range(g->get_range())}, {"labels", labels}};
  } else if (b->transfer) {
    j["transfer"] = json{{"type", "ReturnCmd"}, {"range", j_range(b->transfer->get_range())}};
  }
  return j;
}

// ============================================================================
// Expression serialization
// ============================================================================

json j_expr_node(const Expr * e)
{
  switch (e->get_kind()) {
    case NodeKind::IntLiteral:
      return json{{"type", "IntLiteralExpr"}, {"value", cast<IntLiteralExpr>(e)->value}};

    case NodeKind::BvLiteral: {
      const auto * lit = cast<BvLiteralExpr>(e);
      return json{{"type", "BvLiteralExpr"}, {"digits", str(lit->digits)}, {"bits", lit->bits}};
    }

    case NodeKind::BoolLiteral:
      return json{{"type", "BoolLiteralExpr"}, {"value", cast<BoolLiteralExpr>(e)->value}};

    case NodeKind::Identifier: {
      const auto * id = cast<IdentifierExpr>(e);
      json j{{"type", "IdentifierExpr"}, {"name", str(id->name)}};
      if (id->decl) j["declRange"] = j_range(id->decl->get_range());
      return j;
    }

    case NodeKind::Old:
      return json{{"type", "OldExpr"}, {"expr", j_expr(cast<OldExpr>(e)->expr)}};

    case NodeKind::Unary: {
      const auto * u = cast<UnaryExpr>(e);
      return json{
        {"type", "UnaryExpr"}, {"op", str(to_string(u->op))}, {"operand", j_expr(u->operand)}};
    }

    case NodeKind::Binary: {
      const auto * b = cast<BinaryExpr>(e);
      return json{
        {"type", "BinaryExpr"},
        {"op", str(to_string(b->op))},
        {"lhs", j_expr(b->lhs)},
        {"rhs", j_expr(b->rhs)}};
    }

    case NodeKind::FunctionCall: {
      const auto * c = cast<FunctionCallExpr>(e);
      json j{{"type", "FunctionCallExpr"}, {"name", str(c->name)}, {"args", j_exprs(c->args)}};
      if (!c->typeArgs.empty()) j["typeArgs"] = j_array(c->typeArgs, j_type);
      return j;
    }

    case NodeKind::MapSelect: {
      const auto * s = cast<MapSelectExpr>(e);
      return json{
        {"type", "MapSelectExpr"}, {"map", j_expr(s->map)}, {"indices", j_exprs(s->indices)}};
    }

    case NodeKind::MapStore: {
      const auto * s = cast<MapStoreExpr>(e);
      return json{
        {"type", "MapStoreExpr"},
        {"map", j_expr(s->map)},
        {"indices", j_exprs(s->indices)},
        {"value", j_expr(s->value)}};
    }

    case NodeKind::BvExtract: {
      const auto * x = cast<BvExtractExpr>(e);
      return json{
        {"type", "BvExtractExpr"}, {"bv", j_expr(x->bv)}, {"end", x->end}, {"start", x->start}};
    }

    case NodeKind::IfThenElse: {
      const auto * ite = cast<IfThenElseExpr>(e);
      return json{
        {"type", "IfThenElseExpr"},
        {"cond", j_expr(ite->cond)},
        {"then", j_expr(ite->thenExpr)},
        {"else", j_expr(ite->elseExpr)}};
    }

    case NodeKind::Quantifier: {
      const auto * q = cast<QuantifierExpr>(e);
      return json{
        {"type", "QuantifierExpr"},
        {"quantifier", str(to_string(q->quantifier))},
        {"typeParams", j_type_params(q->typeParams)},
        {"vars", j_array(q->vars, [](const BoundVarDecl * v) { return j_variable(v); })},
        {"attributes", j_attributes(q->attributes)},
        {"triggers", j_array(q->triggers, j_trigger)},
        {"body", j_expr(q->body)}};
    }

    default:
      return json{{"type", "MissingExpr"}};
  }
}

json j_expr(const Expr * e)
{
  if (!e) return json{{"type", "MissingExpr"}, {"range", j_range({})}};

  json j = j_expr_node(e);
  j["range"] = j_range(e->get_range());
  if (e->type) j["resolvedType"] = to_string(e->type);
  return j;
}

// ============================================================================
// Command serialization
// ============================================================================

json j_cmd(const Cmd * c)
{
  if (!c) return json{{"type", "MissingCmd"}, {"range", j_range({})}};

  switch (c->get_kind()) {
    case NodeKind::AssignCmd: {
      const auto * a = cast<AssignCmd>(c);
      return json{
        {"type", "AssignCmd"},
        {"range", j_range(a->get_range())},
        {"lhss", j_array(a->lhss, j_lhs)},
        {"rhss", j_exprs(a->rhss)}};
    }

    case NodeKind::AssertCmd: {
      const auto * a = cast<AssertCmd>(c);
      return json{
        {"type", "AssertCmd"},
        {"range", j_range(a->get_range())},
        {"attributes", j_attributes(a->attributes)},
        {"expr", j_expr(a->expr)}};
    }

    case NodeKind::AssumeCmd: {
      const auto * a = cast<AssumeCmd>(c);
      return json{
        {"type", "AssumeCmd"},
        {"range", j_range(a->get_range())},
        {"attributes", j_attributes(a->attributes)},
        {"expr", j_expr(a->expr)}};
    }

    case NodeKind::HavocCmd: {
      const auto * h = cast<HavocCmd>(c);
      return json{
        {"type", "HavocCmd"},
        {"range", j_range(h->get_range())},
        {"vars", j_array(h->vars, [](const IdentifierExpr * v) { return j_expr(v); })}};
    }

    case NodeKind::CallCmd: {
      const auto * call = cast<CallCmd>(c);
      return json{
        {"type", "CallCmd"},
        {"range", j_range(call->get_range())},
        {"callee", str(call->callee)},
        {"attributes", j_attributes(call->attributes)},
        {"ins", j_exprs(call->ins)},
        {"outs", j_array(call->outs, [](const IdentifierExpr * v) { return j_expr(v); })}};
    }

    default:
      return json{{"type", "UnknownCmd"}, {"range", j_range(c->get_range())}};
  }
}

// ============================================================================
// Declaration serialization
// ============================================================================

json j_formals(const DeclWithFormals * d, json j)
{
  j["typeParams"] = j_type_params(d->typeParams);
  j["inParams"] = j_array(d->inParams, [](const FormalDecl * f) { return j_variable(f); });
  j["outParams"] = j_array(d->outParams, [](const FormalDecl * f) { return j_variable(f); });
  if (!d->attributes.empty()) j["attributes"] = j_attributes(d->attributes);
  return j;
}

json j_decl(const Decl * d)
{
  if (!d) return json{{"type", "MissingDecl"}, {"range", j_range({})}};

  switch (d->get_kind()) {
    case NodeKind::GlobalVarDecl:
    case NodeKind::FormalDecl:
    case NodeKind::LocalVarDecl:
    case NodeKind::BoundVarDecl: {
      json j = j_variable(cast<VariableDecl>(d));
      if (isa<GlobalVarDecl>(d)) j["type"] = "GlobalVarDecl";
      return j;
    }

    case NodeKind::ConstantDecl: {
      const auto * c = cast<ConstantDecl>(d);
      json j = j_variable(c);
      j["type"] = "ConstantDecl";
      j["unique"] = c->unique;
      if (c->parents) {
        json parents = json::array();
        for (const auto & p : *c->parents) {
          parents.push_back(json{{"name", str(p.parent->name)}, {"unique", p.unique}});
        }
        j["parents"] = parents;
      }
      j["childrenComplete"] = c->childrenComplete;
      return j;
    }

    case NodeKind::TypeCtorDecl: {
      const auto * t = cast<TypeCtorDecl>(d);
      json params = json::array();
      for (auto p : t->paramNames) params.push_back(str(p));
      return json{
        {"type", "TypeCtorDecl"},
        {"range", j_range(t->get_range())},
        {"name", str(t->name)},
        {"finite", t->finite},
        {"params", params}};
    }

    case NodeKind::TypeSynonymDecl: {
      const auto * s = cast<TypeSynonymDecl>(d);
      return json{
        {"type", "TypeSynonymDecl"},
        {"range", j_range(s->get_range())},
        {"name", str(s->name)},
        {"typeParams", j_type_params(s->typeParams)},
        {"body", j_type_or_null(s->body)}};
    }

    case NodeKind::FunctionDecl: {
      const auto * f = cast<FunctionDecl>(d);
      json j = j_formals(
        f, json{{"type", "FunctionDecl"}, {"range", j_range(f->get_range())}, {"name", str(f->name)}});
      if (f->body) j["body"] = j_expr(f->body);
      return j;
    }

    case NodeKind::ProcedureDecl: {
      const auto * p = cast<ProcedureDecl>(d);
      json j = j_formals(
        p,
        json{{"type", "ProcedureDecl"}, {"range", j_range(p->get_range())}, {"name", str(p->name)}});
      j["requires"] = j_array(p->requiresClauses, [](const Requires * r) {
        return json{
          {"type", "Requires"},
          {"range", j_range(r->get_range())},
          {"free", r->isFree},
          {"condition", j_expr(r->condition)}};
      });
      j["modifies"] = j_array(p->modifies, [](const IdentifierExpr * m) { return str(m->name); });
      j["ensures"] = j_array(p->ensuresClauses, [](const Ensures * e) {
        return json{
          {"type", "Ensures"},
          {"range", j_range(e->get_range())},
          {"free", e->isFree},
          {"condition", j_expr(e->condition)}};
      });
      return j;
    }

    case NodeKind::ImplementationDecl: {
      const auto * impl = cast<ImplementationDecl>(d);
      json j = j_formals(
        impl, json{
                {"type", "ImplementationDecl"},
                {"range", j_range(impl->get_range())},
                {"name", str(impl->name)}});
      j["locals"] = j_array(impl->locals, [](const LocalVarDecl * l) { return j_variable(l); });
      j["blocks"] = j_array(impl->blocks, j_block);
      return j;
    }

    case NodeKind::AxiomDecl: {
      const auto * a = cast<AxiomDecl>(d);
      json j{{"type", "AxiomDecl"}, {"range", j_range(a->get_range())}, {"expr", j_expr(a->expr)}};
      if (!a->attributes.empty()) j["attributes"] = j_attributes(a->attributes);
      return j;
    }

    default:
      return json{{"type", "UnknownDecl"}, {"range", j_range(d->get_range())}};
  }
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const Type * type)
{
  if (!type) return nullptr;

  const Type * t = follow_proxy(type);
  switch (t->get_kind()) {
    case TypeKind::Basic:
      return json{{"kind", "basic"}, {"name", cast<BasicType>(t)->is_int() ? "int" : "bool"}};
    case TypeKind::Bv:
      return json{{"kind", "bv"}, {"bits", cast<BvType>(t)->bits}};
    case TypeKind::Variable:
      return json{{"kind", "variable"}, {"name", str(cast<TypeVariable>(t)->name)}};
    case TypeKind::Ctor: {
      const auto * c = cast<CtorType>(t);
      return json{{"kind", "ctor"}, {"name", str(c->name)}, {"args", j_array(c->args, j_type)}};
    }
    case TypeKind::Map: {
      const auto * m = cast<MapType>(t);
      return json{
        {"kind", "map"},
        {"typeParams", j_type_params(m->typeParams)},
        {"args", j_array(m->args, j_type)},
        {"result", to_json(m->result)}};
    }
    case TypeKind::Synonym: {
      const auto * s = cast<TypeSynonymAnnotation>(t);
      return json{
        {"kind", "synonym"},
        {"name", str(s->name)},
        {"args", j_array(s->args, j_type)},
        {"expanded", to_json(s->expanded)}};
    }
    case TypeKind::Unresolved: {
      const auto * u = cast<UnresolvedTypeIdentifier>(t);
      return json{
        {"kind", "unresolved"}, {"name", str(u->name)}, {"args", j_array(u->args, j_type)}};
    }
    case TypeKind::Proxy:
    case TypeKind::BvProxy:
    case TypeKind::MapProxy:
      return json{{"kind", "proxy"}, {"text", to_string(t)}};
  }
  return nullptr;
}

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nlohmann::json{{"type", "null"}, {"range", j_range({})}};

  // Dispatch based on node category
  if (isa<Program>(node)) {
    return to_json(cast<Program>(node));
  }
  if (isa<Decl>(node)) {
    return j_decl(cast<Decl>(node));
  }
  if (isa<Cmd>(node)) {
    return j_cmd(cast<Cmd>(node));
  }
  if (isa<Expr>(node)) {
    return j_expr(cast<Expr>(node));
  }

  // Supporting nodes
  if (isa<Block>(node)) {
    return j_block(cast<Block>(node));
  }
  if (isa<Attribute>(node)) {
    return j_attribute(cast<Attribute>(node));
  }
  if (isa<Trigger>(node)) {
    return j_trigger(cast<Trigger>(node));
  }
  if (isa<AssignLhs>(node)) {
    return j_lhs(cast<AssignLhs>(node));
  }

  return nlohmann::json{{"type", "UnknownNode"}, {"range", j_range(node->get_range())}};
}

nlohmann::json to_json(const Program * program)
{
  if (!program)
    return nlohmann::json{
      {"type", "Program"}, {"range", j_range({})}, {"decls", nlohmann::json::array()}};

  nlohmann::json decls = nlohmann::json::array();

  for (auto * d : program->decls) decls.push_back(j_decl(d));

  return nlohmann::json{
    {"type", "Program"},
    {"range", j_range(program->get_range())},
    {"resolved", program->resolved},
    {"decls", decls}};
}

}  // namespace ivl
