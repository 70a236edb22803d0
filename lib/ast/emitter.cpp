// ivl/ast/emitter.cpp - Concrete syntax printer
//
#include "ivl/ast/emitter.hpp"

#include <sstream>

#include "ivl/basic/casting.hpp"
#include "ivl/sema/types/type.hpp"

namespace ivl
{

namespace
{

int expr_strength(const Expr * e)
{
  switch (e->get_kind()) {
    case NodeKind::Binary:
      return binding_strength(cast<BinaryExpr>(e)->op);
    case NodeKind::Unary:
      return precedence::k_unary;
    case NodeKind::MapSelect:
    case NodeKind::MapStore:
    case NodeKind::BvExtract:
      return precedence::k_postfix;
    case NodeKind::IfThenElse:
      // The else branch extends as far as possible
      return Emitter::k_top;
    default:
      return precedence::k_atom;
  }
}

template <typename T, typename F>
void join(std::ostream & out, gsl::span<T> items, F && fn)
{
  bool first = true;
  for (const auto & item : items) {
    if (!first) out << ", ";
    first = false;
    fn(item);
  }
}

}  // namespace

// ============================================================================
// Program and Declarations
// ============================================================================

void Emitter::emit(const Program & program)
{
  bool first = true;
  for (const auto * decl : program.decls) {
    if (!first) out_ << '\n';
    first = false;
    emit_decl(decl);
  }
}

void Emitter::emit_decl(const Decl * decl)
{
  switch (decl->get_kind()) {
    case NodeKind::TypeCtorDecl: {
      const auto * t = cast<TypeCtorDecl>(decl);
      out_ << "type ";
      emit_attributes(t->attributes);
      if (t->finite) out_ << "finite ";
      out_ << t->name;
      for (auto p : t->paramNames) out_ << ' ' << p;
      out_ << ";\n";
      break;
    }

    case NodeKind::TypeSynonymDecl: {
      const auto * s = cast<TypeSynonymDecl>(decl);
      out_ << "type ";
      emit_attributes(s->attributes);
      out_ << s->name;
      for (const auto * p : s->typeParams) out_ << ' ' << p->name;
      out_ << " = ";
      emit_type(s->body);
      out_ << ";\n";
      break;
    }

    case NodeKind::ConstantDecl: {
      const auto * c = cast<ConstantDecl>(decl);
      out_ << "const ";
      emit_attributes(c->attributes);
      if (c->unique) out_ << "unique ";
      out_ << c->name << ": ";
      emit_type(c->type);
      if (c->parents) {
        out_ << " extends";
        bool first = true;
        for (const auto & p : *c->parents) {
          out_ << (first ? " " : ", ");
          first = false;
          if (p.unique) out_ << "unique ";
          out_ << p.parent->name;
        }
        if (c->childrenComplete) out_ << " complete";
      }
      out_ << ";\n";
      break;
    }

    case NodeKind::GlobalVarDecl: {
      out_ << "var ";
      emit_formal(cast<GlobalVarDecl>(decl));
      out_ << ";\n";
      break;
    }

    case NodeKind::FunctionDecl: {
      const auto * f = cast<FunctionDecl>(decl);
      emit_signature("function", f);
      if (f->body) {
        out_ << "\n{\n";
        ++level_;
        indent();
        emit_expr(f->body);
        --level_;
        out_ << "\n}\n";
      } else {
        out_ << ";\n";
      }
      break;
    }

    case NodeKind::ProcedureDecl: {
      const auto * p = cast<ProcedureDecl>(decl);
      emit_signature("procedure", p);
      out_ << ";\n";
      ++level_;
      for (const auto * r : p->requiresClauses) {
        indent();
        if (r->isFree) out_ << "free ";
        out_ << "requires ";
        emit_attributes(r->attributes);
        emit_expr(r->condition);
        out_ << ";\n";
      }
      if (!p->modifies.empty()) {
        indent();
        out_ << "modifies ";
        join(out_, p->modifies, [this](const IdentifierExpr * m) { out_ << m->name; });
        out_ << ";\n";
      }
      for (const auto * e : p->ensuresClauses) {
        indent();
        if (e->isFree) out_ << "free ";
        out_ << "ensures ";
        emit_attributes(e->attributes);
        emit_expr(e->condition);
        out_ << ";\n";
      }
      --level_;
      break;
    }

    case NodeKind::ImplementationDecl: {
      const auto * impl = cast<ImplementationDecl>(decl);
      emit_signature("implementation", impl);
      out_ << "\n{\n";
      ++level_;
      for (const auto * local : impl->locals) {
        indent();
        out_ << "var ";
        emit_formal(local);
        out_ << ";\n";
      }
      for (const auto * block : impl->blocks) {
        out_ << '\n';
        emit_block(block);
      }
      --level_;
      out_ << "}\n";
      break;
    }

    case NodeKind::AxiomDecl: {
      const auto * a = cast<AxiomDecl>(decl);
      out_ << "axiom ";
      emit_attributes(a->attributes);
      emit_expr(a->expr);
      out_ << ";\n";
      break;
    }

    default:
      break;
  }
}

void Emitter::emit_signature(std::string_view keyword, const DeclWithFormals * decl)
{
  out_ << keyword << ' ';
  emit_attributes(decl->attributes);
  out_ << decl->name;
  emit_type_params(decl->typeParams);
  out_ << '(';
  emit_formals(decl->inParams);
  out_ << ')';
  if (!decl->outParams.empty()) {
    out_ << " returns (";
    emit_formals(decl->outParams);
    out_ << ')';
  }
}

// ============================================================================
// Blocks and Commands
// ============================================================================

void Emitter::emit_block(const Block * block)
{
  indent();
  out_ << block->label << ":\n";
  ++level_;
  for (const auto * cmd : block->cmds) {
    indent();
    emit_cmd(cmd);
    out_ << '\n';
  }
  if (const auto * g = dyn_cast<GotoCmd>(block->transfer)) {
    indent();
    out_ << "goto ";
    join(out_, g->labels, [this](std::string_view l) { out_ << l; });
    out_ << ";\n";
  } else if (block->transfer) {
    indent();
    out_ << "return;\n";
  }
  --level_;
}

void Emitter::emit_cmd(const Cmd * cmd)
{
  switch (cmd->get_kind()) {
    case NodeKind::AssignCmd: {
      const auto * a = cast<AssignCmd>(cmd);
      join(out_, a->lhss, [this](const AssignLhs * lhs) { emit_lhs(lhs); });
      out_ << " := ";
      emit_exprs(a->rhss);
      out_ << ';';
      break;
    }

    case NodeKind::AssertCmd: {
      const auto * a = cast<AssertCmd>(cmd);
      out_ << "assert ";
      emit_attributes(a->attributes);
      emit_expr(a->expr);
      out_ << ';';
      break;
    }

    case NodeKind::AssumeCmd: {
      const auto * a = cast<AssumeCmd>(cmd);
      out_ << "assume ";
      emit_attributes(a->attributes);
      emit_expr(a->expr);
      out_ << ';';
      break;
    }

    case NodeKind::HavocCmd: {
      out_ << "havoc ";
      join(out_, cast<HavocCmd>(cmd)->vars, [this](const IdentifierExpr * v) { out_ << v->name; });
      out_ << ';';
      break;
    }

    case NodeKind::CallCmd: {
      const auto * c = cast<CallCmd>(cmd);
      out_ << "call ";
      emit_attributes(c->attributes);
      if (!c->outs.empty()) {
        join(out_, c->outs, [this](const IdentifierExpr * v) { out_ << v->name; });
        out_ << " := ";
      }
      out_ << c->callee << '(';
      emit_exprs(c->ins);
      out_ << ");";
      break;
    }

    default:
      break;
  }
}

void Emitter::emit_lhs(const AssignLhs * lhs)
{
  if (const auto * s = dyn_cast<SimpleAssignLhs>(lhs)) {
    out_ << s->var->name;
    return;
  }
  const auto * m = cast<MapAssignLhs>(lhs);
  emit_lhs(m->map);
  out_ << '[';
  emit_exprs(m->indices);
  out_ << ']';
}

// ============================================================================
// Expressions
// ============================================================================

void Emitter::emit_expr(const Expr * expr, int min_strength)
{
  const bool parens = expr_strength(expr) < min_strength;
  if (parens) out_ << '(';

  switch (expr->get_kind()) {
    case NodeKind::IntLiteral:
      out_ << cast<IntLiteralExpr>(expr)->value;
      break;

    case NodeKind::BvLiteral: {
      const auto * lit = cast<BvLiteralExpr>(expr);
      out_ << lit->digits << "bv" << lit->bits;
      break;
    }

    case NodeKind::BoolLiteral:
      out_ << (cast<BoolLiteralExpr>(expr)->value ? "true" : "false");
      break;

    case NodeKind::MissingExpr:
      out_ << "true";
      break;

    case NodeKind::Identifier:
      out_ << cast<IdentifierExpr>(expr)->name;
      break;

    case NodeKind::Old:
      out_ << "old(";
      emit_expr(cast<OldExpr>(expr)->expr);
      out_ << ')';
      break;

    case NodeKind::Unary: {
      const auto * u = cast<UnaryExpr>(expr);
      out_ << to_string(u->op);
      emit_expr(u->operand, precedence::k_unary);
      break;
    }

    case NodeKind::Binary:
      emit_binary(cast<BinaryExpr>(expr));
      break;

    case NodeKind::FunctionCall: {
      const auto * c = cast<FunctionCallExpr>(expr);
      out_ << c->name << '(';
      emit_exprs(c->args);
      out_ << ')';
      break;
    }

    case NodeKind::MapSelect: {
      const auto * s = cast<MapSelectExpr>(expr);
      emit_expr(s->map, precedence::k_postfix);
      out_ << '[';
      emit_exprs(s->indices);
      out_ << ']';
      break;
    }

    case NodeKind::MapStore: {
      const auto * s = cast<MapStoreExpr>(expr);
      emit_expr(s->map, precedence::k_postfix);
      out_ << '[';
      emit_exprs(s->indices);
      out_ << " := ";
      emit_expr(s->value);
      out_ << ']';
      break;
    }

    case NodeKind::BvExtract: {
      const auto * x = cast<BvExtractExpr>(expr);
      emit_expr(x->bv, precedence::k_postfix);
      out_ << '[' << x->end << ':' << x->start << ']';
      break;
    }

    case NodeKind::IfThenElse: {
      const auto * ite = cast<IfThenElseExpr>(expr);
      out_ << "if ";
      emit_expr(ite->cond);
      out_ << " then ";
      emit_expr(ite->thenExpr);
      out_ << " else ";
      emit_expr(ite->elseExpr);
      break;
    }

    case NodeKind::Quantifier:
      emit_quantifier(cast<QuantifierExpr>(expr));
      break;

    default:
      break;
  }

  if (parens) out_ << ')';
}

void Emitter::emit_binary(const BinaryExpr * expr)
{
  const int s = binding_strength(expr->op);
  int left = s;
  int right = s + 1;

  switch (expr->op) {
    case BinaryOp::Imp:
      // right associative
      left = s + 1;
      right = s;
      break;
    case BinaryOp::And:
    case BinaryOp::Or: {
      // && and || chain only with themselves
      const auto * l = dyn_cast<BinaryExpr>(expr->lhs);
      left = l && l->op == expr->op ? s : s + 1;
      break;
    }
    default:
      if (is_relation(expr->op)) left = s + 1;
      break;
  }

  emit_expr(expr->lhs, left);
  out_ << ' ' << to_string(expr->op) << ' ';
  emit_expr(expr->rhs, right);
}

void Emitter::emit_quantifier(const QuantifierExpr * expr)
{
  out_ << '(' << to_string(expr->quantifier);
  emit_type_params(expr->typeParams);
  out_ << ' ';
  join(out_, expr->vars, [this](const BoundVarDecl * v) { emit_formal(v); });
  out_ << " :: ";
  emit_attributes(expr->attributes);
  for (const auto * t : expr->triggers) {
    out_ << "{ ";
    emit_exprs(t->exprs);
    out_ << " } ";
  }
  emit_expr(expr->body);
  out_ << ')';
}

void Emitter::emit_exprs(gsl::span<Expr * const> exprs)
{
  join(out_, exprs, [this](const Expr * e) { emit_expr(e); });
}

// ============================================================================
// Helpers
// ============================================================================

void Emitter::indent()
{
  for (int i = 0; i < level_ * k_indent_width; ++i) out_ << ' ';
}

void Emitter::emit_attributes(gsl::span<Attribute * const> attrs)
{
  for (const auto * a : attrs) {
    out_ << "{:" << a->key;
    bool first = true;
    for (const auto & p : a->params) {
      out_ << (first ? " " : ", ");
      first = false;
      if (p.is_string()) {
        out_ << '"' << p.str << '"';
      } else {
        emit_expr(p.expr);
      }
    }
    out_ << "} ";
  }
}

void Emitter::emit_type_params(gsl::span<TypeVariable * const> params)
{
  if (params.empty()) return;
  out_ << '<';
  join(out_, params, [this](const TypeVariable * v) { out_ << v->name; });
  out_ << '>';
}

void Emitter::emit_formal(const VariableDecl * var)
{
  emit_attributes(var->attributes);
  if (!var->name.empty()) out_ << var->name << ": ";
  emit_type(var->type);
  if (var->where) {
    out_ << " where ";
    emit_expr(var->where);
  }
}

void Emitter::emit_formals(gsl::span<FormalDecl * const> formals)
{
  join(out_, formals, [this](const FormalDecl * f) { emit_formal(f); });
}

void Emitter::emit_type(const Type * type) { out_ << to_string(type); }

// ============================================================================
// Convenience
// ============================================================================

std::string to_source(const Program & program)
{
  std::ostringstream oss;
  Emitter(oss).emit(program);
  return oss.str();
}

std::string to_source(const Expr * expr)
{
  std::ostringstream oss;
  Emitter(oss).emit_expr(expr);
  return oss.str();
}

}  // namespace ivl
