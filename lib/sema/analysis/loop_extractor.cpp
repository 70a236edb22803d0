// ivl/sema/analysis/loop_extractor.cpp - Rewrite loops into procedures
//
#include "ivl/sema/analysis/loop_extractor.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

#include "ivl/ast/attributes.hpp"
#include "ivl/basic/internal_error.hpp"

namespace ivl
{

namespace
{

using SubstMap = std::unordered_map<const VariableDecl *, VariableDecl *>;

// ============================================================================
// CodeCopier
// ============================================================================

/**
 * Deep copy of commands and expressions.
 *
 * Identifiers bound in the substitution map are redirected to their
 * replacement variable; everything else keeps its declaration. Resolved
 * fields (decl, proc, type, typeArgs) are carried over so the copy needs no
 * second resolution pass.
 */
class CodeCopier
{
public:
  CodeCopier(AstContext & ast, SubstMap subst) : ast_(ast), subst_(std::move(subst)) {}

  std::vector<Cmd *> copy_cmds(gsl::span<Cmd *> cmds)
  {
    std::vector<Cmd *> result;
    result.reserve(cmds.size());
    for (Cmd * c : cmds) {
      result.push_back(copy_cmd(c));
    }
    return result;
  }

  Cmd * copy_cmd(const Cmd * cmd)
  {
    switch (cmd->get_kind()) {
      case NodeKind::AssignCmd: {
        const auto * a = cast<AssignCmd>(cmd);
        std::vector<AssignLhs *> lhss;
        for (const AssignLhs * lhs : a->lhss) {
          lhss.push_back(copy_lhs(lhs));
        }
        return ast_.create<AssignCmd>(
          ast_.copy_to_arena(lhss), copy_exprs(a->rhss), a->get_range());
      }
      case NodeKind::AssertCmd: {
        const auto * a = cast<AssertCmd>(cmd);
        auto * copy = ast_.create<AssertCmd>(copy_expr(a->expr), a->get_range());
        copy->attributes = copy_attributes(a->attributes);
        return copy;
      }
      case NodeKind::AssumeCmd: {
        const auto * a = cast<AssumeCmd>(cmd);
        auto * copy = ast_.create<AssumeCmd>(copy_expr(a->expr), a->get_range());
        copy->attributes = copy_attributes(a->attributes);
        return copy;
      }
      case NodeKind::HavocCmd: {
        const auto * h = cast<HavocCmd>(cmd);
        return ast_.create<HavocCmd>(copy_identifiers(h->vars), h->get_range());
      }
      case NodeKind::CallCmd: {
        const auto * c = cast<CallCmd>(cmd);
        auto * copy = ast_.create<CallCmd>(c->callee, c->get_range());
        copy->ins = copy_exprs(c->ins);
        copy->outs = copy_identifiers(c->outs);
        copy->attributes = copy_attributes(c->attributes);
        copy->proc = c->proc;
        copy->typeArgs = c->typeArgs;
        return copy;
      }
      default:
        throw InternalError(
          fmt::format("unexpected command kind {}", static_cast<int>(cmd->get_kind())));
    }
  }

  Expr * copy_expr(const Expr * expr)
  {
    if (expr == nullptr) return nullptr;

    Expr * result = nullptr;
    switch (expr->get_kind()) {
      case NodeKind::IntLiteral:
        result = ast_.create<IntLiteralExpr>(cast<IntLiteralExpr>(expr)->value, expr->get_range());
        break;
      case NodeKind::BvLiteral: {
        const auto * bv = cast<BvLiteralExpr>(expr);
        result = ast_.create<BvLiteralExpr>(bv->digits, bv->bits, bv->get_range());
        break;
      }
      case NodeKind::BoolLiteral:
        result =
          ast_.create<BoolLiteralExpr>(cast<BoolLiteralExpr>(expr)->value, expr->get_range());
        break;
      case NodeKind::Identifier:
        return copy_identifier(cast<IdentifierExpr>(expr));
      case NodeKind::Old:
        result = ast_.create<OldExpr>(copy_expr(cast<OldExpr>(expr)->expr), expr->get_range());
        break;
      case NodeKind::Unary: {
        const auto * u = cast<UnaryExpr>(expr);
        result = ast_.create<UnaryExpr>(u->op, copy_expr(u->operand), u->get_range());
        break;
      }
      case NodeKind::Binary: {
        const auto * b = cast<BinaryExpr>(expr);
        result =
          ast_.create<BinaryExpr>(copy_expr(b->lhs), b->op, copy_expr(b->rhs), b->get_range());
        break;
      }
      case NodeKind::FunctionCall: {
        const auto * f = cast<FunctionCallExpr>(expr);
        auto * copy = ast_.create<FunctionCallExpr>(f->name, copy_exprs(f->args), f->get_range());
        copy->decl = f->decl;
        copy->typeArgs = f->typeArgs;
        result = copy;
        break;
      }
      case NodeKind::MapSelect: {
        const auto * s = cast<MapSelectExpr>(expr);
        auto * copy =
          ast_.create<MapSelectExpr>(copy_expr(s->map), copy_exprs(s->indices), s->get_range());
        copy->typeArgs = s->typeArgs;
        result = copy;
        break;
      }
      case NodeKind::MapStore: {
        const auto * s = cast<MapStoreExpr>(expr);
        auto * copy = ast_.create<MapStoreExpr>(
          copy_expr(s->map), copy_exprs(s->indices), copy_expr(s->value), s->get_range());
        copy->typeArgs = s->typeArgs;
        result = copy;
        break;
      }
      case NodeKind::BvExtract: {
        const auto * x = cast<BvExtractExpr>(expr);
        result = ast_.create<BvExtractExpr>(copy_expr(x->bv), x->end, x->start, x->get_range());
        break;
      }
      case NodeKind::IfThenElse: {
        const auto * ite = cast<IfThenElseExpr>(expr);
        result = ast_.create<IfThenElseExpr>(
          copy_expr(ite->cond), copy_expr(ite->thenExpr), copy_expr(ite->elseExpr),
          ite->get_range());
        break;
      }
      case NodeKind::Quantifier:
        result = copy_quantifier(cast<QuantifierExpr>(expr));
        break;
      case NodeKind::MissingExpr:
        result = ast_.create<MissingExpr>(expr->get_range());
        break;
      default:
        throw InternalError(
          fmt::format("unexpected expression kind {}", static_cast<int>(expr->get_kind())));
    }
    result->type = expr->type;
    return result;
  }

private:
  IdentifierExpr * copy_identifier(const IdentifierExpr * id)
  {
    auto it = subst_.find(id->decl);
    if (it != subst_.end()) {
      auto * copy = ast_.create<IdentifierExpr>(it->second->name, id->get_range());
      copy->decl = it->second;
      copy->type = id->type;
      return copy;
    }
    auto * copy = ast_.create<IdentifierExpr>(id->name, id->get_range());
    copy->decl = id->decl;
    copy->type = id->type;
    return copy;
  }

  gsl::span<IdentifierExpr *> copy_identifiers(gsl::span<IdentifierExpr *> ids)
  {
    std::vector<IdentifierExpr *> result;
    result.reserve(ids.size());
    for (const IdentifierExpr * id : ids) {
      result.push_back(copy_identifier(id));
    }
    return ast_.copy_to_arena(result);
  }

  gsl::span<Expr *> copy_exprs(gsl::span<Expr *> exprs)
  {
    std::vector<Expr *> result;
    result.reserve(exprs.size());
    for (const Expr * e : exprs) {
      result.push_back(copy_expr(e));
    }
    return ast_.copy_to_arena(result);
  }

  AssignLhs * copy_lhs(const AssignLhs * lhs)
  {
    AssignLhs * result = nullptr;
    if (const auto * s = dyn_cast<SimpleAssignLhs>(lhs)) {
      result = ast_.create<SimpleAssignLhs>(copy_identifier(s->var), s->get_range());
    } else {
      const auto * m = cast<MapAssignLhs>(lhs);
      auto * copy =
        ast_.create<MapAssignLhs>(copy_lhs(m->map), copy_exprs(m->indices), m->get_range());
      copy->typeArgs = m->typeArgs;
      result = copy;
    }
    result->type = lhs->type;
    return result;
  }

  gsl::span<Attribute *> copy_attributes(gsl::span<Attribute *> attrs)
  {
    std::vector<Attribute *> result;
    result.reserve(attrs.size());
    for (const Attribute * a : attrs) {
      auto * copy = ast_.create<Attribute>(a->key, a->get_range());
      std::vector<AttributeParam> params;
      for (const AttributeParam & p : a->params) {
        params.push_back(AttributeParam{copy_expr(p.expr), p.str});
      }
      copy->params = ast_.copy_to_arena(params);
      result.push_back(copy);
    }
    return ast_.copy_to_arena(result);
  }

  QuantifierExpr * copy_quantifier(const QuantifierExpr * q)
  {
    auto * copy = ast_.create<QuantifierExpr>(q->quantifier, q->get_range());
    copy->typeParams = q->typeParams;

    // Fresh bound variables so the copy shares no binders with the original
    std::vector<BoundVarDecl *> vars;
    vars.reserve(q->vars.size());
    for (BoundVarDecl * v : q->vars) {
      auto * nv = ast_.create<BoundVarDecl>(v->name, v->type, v->get_range());
      subst_[v] = nv;
      vars.push_back(nv);
    }
    for (size_t i = 0; i < vars.size(); ++i) {
      vars[i]->where = copy_expr(q->vars[i]->where);
      vars[i]->attributes = copy_attributes(q->vars[i]->attributes);
    }
    copy->vars = ast_.copy_to_arena(vars);
    copy->attributes = copy_attributes(q->attributes);

    std::vector<Trigger *> triggers;
    for (const Trigger * t : q->triggers) {
      triggers.push_back(ast_.create<Trigger>(copy_exprs(t->exprs), t->get_range()));
    }
    copy->triggers = ast_.copy_to_arena(triggers);
    copy->body = copy_expr(q->body);
    return copy;
  }

  AstContext & ast_;
  SubstMap subst_;
};

/// Variables a command may change, including the callee's modifies list.
void add_assigned_variables(const Cmd * cmd, std::vector<VariableDecl *> & out)
{
  if (const auto * a = dyn_cast<AssignCmd>(cmd)) {
    for (const AssignLhs * lhs : a->lhss) {
      out.push_back(lhs->deep_assigned_identifier()->decl);
    }
  } else if (const auto * h = dyn_cast<HavocCmd>(cmd)) {
    for (const IdentifierExpr * id : h->vars) {
      out.push_back(id->decl);
    }
  } else if (const auto * c = dyn_cast<CallCmd>(cmd)) {
    for (const IdentifierExpr * id : c->outs) {
      out.push_back(id->decl);
    }
    if (c->proc != nullptr) {
      for (const IdentifierExpr * id : c->proc->modifies) {
        out.push_back(id->decl);
      }
    }
  }
}

}  // namespace

// ============================================================================
// LoopExtractor
// ============================================================================

struct LoopExtractor::LoopFrame
{
  std::string_view name;
  std::vector<FormalDecl *> inputs;
  std::vector<FormalDecl *> outputs;
  SubstMap subst;
  ProcedureDecl * proc = nullptr;
  CallCmd * headerCall = nullptr;  ///< Inserted at the start of the header
};

std::vector<ExtractedLoop> extract_loops(Program & program, AstContext & ast, TypeContext & types)
{
  LoopExtractor extractor(ast, types);
  return extractor.extract(program);
}

std::vector<ExtractedLoop> LoopExtractor::extract(Program & program)
{
  std::vector<ExtractedLoop> all;

  // Snapshot: the extracted implementations are not themselves processed
  const std::vector<Decl *> decls(program.decls.begin(), program.decls.end());
  for (Decl * d : decls) {
    auto * impl = dyn_cast<ImplementationDecl>(d);
    if (impl == nullptr || impl->blocks.empty()) continue;
    auto loops = extract(*impl);
    all.insert(all.end(), loops.begin(), loops.end());
  }

  if (!all.empty()) {
    std::vector<Decl *> extended = decls;
    for (const ExtractedLoop & loop : all) {
      extended.push_back(loop.proc);
      extended.push_back(loop.impl);
    }
    program.decls = ast_.copy_to_arena(extended);
  }
  return all;
}

std::vector<ExtractedLoop> LoopExtractor::extract(ImplementationDecl & impl)
{
  const BlockGraph g = graph_from_implementation(impl);
  if (!g.reducible()) {
    throw InternalError("Irreducible flow graphs are unsupported.");
  }

  const std::vector<Block *> headers = g.headers();
  if (headers.empty()) return {};

  std::unordered_map<Block *, LoopFrame> frames;
  for (Block * header : headers) {
    create_procedure(impl, header, frames[header]);
  }

  std::vector<ExtractedLoop> result;
  for (Block * header : headers) {
    LoopFrame & frame = frames[header];
    ImplementationDecl * loop_impl = create_implementation(impl, g, header, frame);

    std::vector<Cmd *> cmds{frame.headerCall};
    cmds.insert(cmds.end(), header->cmds.begin(), header->cmds.end());
    header->cmds = ast_.copy_to_arena(cmds);

    result.push_back(ExtractedLoop{&impl, header, frame.proc, loop_impl});
  }

  compute_predecessors(impl, ast_);
  return result;
}

void LoopExtractor::create_procedure(ImplementationDecl & impl, Block * header, LoopFrame & frame)
{
  frame.name = ast_.intern(fmt::format("loop_{}", header->label));

  std::vector<Expr *> call_ins;
  std::vector<IdentifierExpr *> call_outs;

  auto make_formal = [&](const VariableDecl * v, std::string_view prefix, bool incoming) {
    return ast_.create<FormalDecl>(
      ast_.intern(fmt::format("{}{}", prefix, v->name)), v->type, incoming);
  };

  for (FormalDecl * v : impl.inParams) {
    call_ins.push_back(make_identifier(v));
    FormalDecl * f = make_formal(v, "in_", true);
    frame.inputs.push_back(f);
    frame.subst[v] = f;
  }

  std::vector<VariableDecl *> carried(impl.outParams.begin(), impl.outParams.end());
  carried.insert(carried.end(), impl.locals.begin(), impl.locals.end());
  for (VariableDecl * v : carried) {
    call_ins.push_back(make_identifier(v));
    frame.inputs.push_back(make_formal(v, "in_", true));
    call_outs.push_back(make_identifier(v));
    FormalDecl * f = make_formal(v, "out_", false);
    frame.outputs.push_back(f);
    frame.subst[v] = f;
  }

  // Globals assigned anywhere in the loop
  const BlockGraph g = graph_from_implementation(impl);
  std::vector<VariableDecl *> targets;
  for (Block * source : g.back_edge_nodes(header)) {
    for (Block * block : g.natural_loop(header, source)) {
      for (const Cmd * c : block->cmds) {
        add_assigned_variables(c, targets);
      }
    }
  }
  std::vector<IdentifierExpr *> global_mods;
  std::unordered_set<const VariableDecl *> seen;
  for (VariableDecl * v : targets) {
    if (v == nullptr || !isa<GlobalVarDecl>(v) || !seen.insert(v).second) continue;
    global_mods.push_back(make_identifier(v));
  }

  auto * proc = ast_.create<ProcedureDecl>(frame.name);
  proc->inParams = ast_.copy_to_arena(frame.inputs);
  proc->outParams = ast_.copy_to_arena(frame.outputs);
  proc->modifies = ast_.copy_to_arena(global_mods);
  proc->attributes = add_attribute(
    ast_, proc->attributes, "inline", ast_.create<IntLiteralExpr>(1));
  proc->attributes[0]->params[0].expr->type = types_.int_type();
  frame.proc = proc;

  auto * call = ast_.create<CallCmd>(frame.name);
  call->ins = ast_.copy_to_arena(call_ins);
  call->outs = ast_.copy_to_arena(call_outs);
  call->proc = proc;
  frame.headerCall = call;
}

ImplementationDecl * LoopExtractor::create_implementation(
  ImplementationDecl & impl, const BlockGraph & g, Block * header, LoopFrame & frame)
{
  CodeCopier copier(ast_, frame.subst);

  // Insertion-ordered map from original blocks to their copies
  std::vector<Block *> originals;
  std::unordered_map<Block *, Block *> block_map;
  std::vector<Block *> dummies;

  for (Block * source : g.back_edge_nodes(header)) {
    for (Block * block : g.natural_loop(header, source)) {
      if (block_map.count(block) != 0) continue;
      auto * copy = ast_.create<Block>(block->label, block->get_range());
      copy->cmds = ast_.copy_to_arena(copier.copy_cmds(block->cmds));
      block_map[block] = copy;
      originals.push_back(block);
    }

    // Recursive call: in_ values of the in-parameters, then the current outputs
    std::vector<Expr *> ins;
    std::vector<IdentifierExpr *> outs;
    for (size_t i = 0; i < impl.inParams.size(); ++i) {
      ins.push_back(make_identifier(frame.inputs[i]));
    }
    for (FormalDecl * v : frame.outputs) {
      ins.push_back(make_identifier(v));
      outs.push_back(make_identifier(v));
    }
    auto * call = ast_.create<CallCmd>(frame.name);
    call->ins = ast_.copy_to_arena(ins);
    call->outs = ast_.copy_to_arena(outs);
    call->proc = frame.proc;

    const std::string_view dummy_label = ast_.intern(fmt::format("{}_dummy", source->label));
    auto * dummy = ast_.create<Block>(dummy_label);
    dummy->cmds = ast_.copy_to_arena(std::vector<Cmd *>{make_assume_false()});
    dummy->transfer = ast_.create<ReturnCmd>();
    dummies.push_back(dummy);

    auto * recursive = ast_.create<Block>(dummy_label);
    recursive->cmds = ast_.copy_to_arena(std::vector<Cmd *>{call});
    recursive->transfer = ast_.create<ReturnCmd>();

    // Break the back edge in the enclosing implementation
    auto * go = dyn_cast<GotoCmd>(source->transfer);
    if (go == nullptr || go->targets.empty()) {
      throw InternalError(
        fmt::format("back edge source {} does not end in a goto", source->label));
    }
    std::vector<Block *> kept;
    for (Block * t : go->targets) {
      if (t != header) kept.push_back(t);
    }
    kept.push_back(dummy);
    source->transfer = make_goto(kept);

    block_map[dummy] = recursive;
    originals.push_back(dummy);
  }

  std::vector<Block *> all_blocks(impl.blocks.begin(), impl.blocks.end());
  all_blocks.insert(all_blocks.end(), dummies.begin(), dummies.end());
  impl.blocks = ast_.copy_to_arena(all_blocks);
  invalidate_flow_info(impl);

  auto * exit = ast_.create<Block>(ast_.intern("exit"));
  exit->transfer = ast_.create<ReturnCmd>();

  // entry: out_v := in_v for everything but the in-parameters
  std::vector<AssignLhs *> lhss;
  std::vector<Expr *> rhss;
  for (size_t i = impl.inParams.size(); i < frame.inputs.size(); ++i) {
    FormalDecl * outv = frame.outputs[i - impl.inParams.size()];
    auto * lhs = ast_.create<SimpleAssignLhs>(make_identifier(outv));
    lhs->type = outv->type;
    lhss.push_back(lhs);
    rhss.push_back(make_identifier(frame.inputs[i]));
  }
  auto * entry = ast_.create<Block>(ast_.intern("entry"));
  if (!lhss.empty()) {
    entry->cmds = ast_.copy_to_arena(std::vector<Cmd *>{
      ast_.create<AssignCmd>(ast_.copy_to_arena(lhss), ast_.copy_to_arena(rhss))});
  }
  entry->transfer = make_goto({block_map.at(header), exit});

  std::vector<Block *> blocks{entry};
  for (Block * block : originals) {
    Block * copy = block_map.at(block);
    const auto * go = dyn_cast<GotoCmd>(block->transfer);
    if (go == nullptr) {
      copy->transfer = ast_.create<ReturnCmd>();
    } else {
      std::vector<Block *> targets;
      for (Block * t : go->targets) {
        auto it = block_map.find(t);
        if (it != block_map.end()) targets.push_back(it->second);
      }
      if (targets.empty()) {
        copy->cmds = ast_.append(copy->cmds, static_cast<Cmd *>(make_assume_false()));
        copy->transfer = ast_.create<ReturnCmd>();
      } else {
        copy->transfer = make_goto(targets);
      }
    }
    blocks.push_back(copy);
  }
  blocks.push_back(exit);

  auto * loop_impl = ast_.create<ImplementationDecl>(frame.name);
  loop_impl->inParams = frame.proc->inParams;
  loop_impl->outParams = frame.proc->outParams;
  loop_impl->blocks = ast_.copy_to_arena(blocks);
  loop_impl->proc = frame.proc;
  compute_predecessors(*loop_impl, ast_);
  return loop_impl;
}

IdentifierExpr * LoopExtractor::make_identifier(VariableDecl * var)
{
  auto * id = ast_.create<IdentifierExpr>(var->name);
  id->decl = var;
  id->type = var->type;
  return id;
}

GotoCmd * LoopExtractor::make_goto(const std::vector<Block *> & targets)
{
  std::vector<std::string_view> labels;
  labels.reserve(targets.size());
  for (const Block * b : targets) {
    labels.push_back(b->label);
  }
  auto * go = ast_.create<GotoCmd>(ast_.copy_to_arena(labels));
  go->targets = ast_.copy_to_arena(targets);
  return go;
}

AssumeCmd * LoopExtractor::make_assume_false()
{
  auto * lit = ast_.create<BoolLiteralExpr>(false);
  lit->type = types_.bool_type();
  return ast_.create<AssumeCmd>(lit);
}

}  // namespace ivl
