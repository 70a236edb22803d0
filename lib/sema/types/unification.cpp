// ivl/sema/types/unification.cpp - Unification and substitution of types
//
#include "ivl/sema/types/unification.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <vector>

#include "ivl/basic/internal_error.hpp"

namespace ivl
{

namespace
{

bool is_unifiable(const TypeVariable * v, gsl::span<TypeVariable * const> unifiable)
{
  return std::find(unifiable.begin(), unifiable.end(), v) != unifiable.end();
}

bool contains_var(const std::vector<TypeVariable *> & vars, const TypeVariable * v)
{
  return std::find(vars.begin(), vars.end(), v) != vars.end();
}

/**
 * Occurs check for defining @p p as @p that (already expanded).
 *
 * A proxy may be defined as itself or as another proxy that mentions it;
 * only compound types containing it are rejected.
 */
bool really_occurs_in(TypeProxy * p, Type * that)
{
  if (!isa_any<CtorType, MapType>(that)) {
    return false;
  }
  const auto proxies = free_proxies(that);
  return std::find(proxies.begin(), proxies.end(), p) != proxies.end();
}

class Unifier
{
public:
  Unifier(TypeContext & ctx, gsl::span<TypeVariable * const> unifiable, TypeSubstitution & subst)
  : ctx_(ctx), unifiable_(unifiable), subst_(subst)
  {
  }

  bool unify(Type * a, Type * b)
  {
    switch (a->get_kind()) {
      case TypeKind::Synonym:
        return unify(cast<TypeSynonymAnnotation>(a)->expanded, b);
      case TypeKind::Proxy:
        return unify_proxy(cast<TypeProxy>(a), b);
      case TypeKind::BvProxy:
        return unify_bv_proxy(cast<BvTypeProxy>(a), b);
      case TypeKind::MapProxy:
        return unify_map_proxy(cast<MapTypeProxy>(a), b);
      case TypeKind::Variable:
        return unify_variable(cast<TypeVariable>(a), b);
      case TypeKind::Basic:
      case TypeKind::Bv:
      case TypeKind::Ctor:
      case TypeKind::Map:
        break;
      case TypeKind::Unresolved:
        throw InternalError(fmt::format("unification of unresolved type {}", to_string(a)));
    }

    Type * that = expanded(b);
    if (isa_any<TypeProxy, TypeVariable>(that)) {
      return unify(that, a);
    }

    if (const auto * ca = dyn_cast<CtorType>(a)) {
      const auto * cb = dyn_cast<CtorType>(that);
      if (cb == nullptr || ca->decl != cb->decl || ca->args.size() != cb->args.size()) {
        return false;
      }
      for (size_t i = 0; i < ca->args.size(); ++i) {
        if (!unify(ca->args[i], cb->args[i])) {
          return false;
        }
      }
      return true;
    }
    if (auto * ma = dyn_cast<MapType>(a)) {
      auto * mb = dyn_cast<MapType>(that);
      return mb != nullptr && unify_maps(ma, mb);
    }
    if (that->get_kind() == TypeKind::Unresolved) {
      throw InternalError(fmt::format("unification of unresolved type {}", to_string(that)));
    }
    return types_equal(a, that);
  }

private:
  // ==========================================================================
  // Maps
  // ==========================================================================

  bool unify_maps(MapType * a, MapType * b)
  {
    if (a->typeParams.size() != b->typeParams.size() || a->args.size() != b->args.size()) {
      return false;
    }

    // Identify the bound variables of both sides with shared fresh ones
    TypeSubstitution subst_a;
    TypeSubstitution subst_b;
    std::vector<TypeVariable *> freshies;
    for (size_t i = 0; i < a->typeParams.size(); ++i) {
      TypeVariable * fresh = ctx_.new_type_variable(a->typeParams[i]->name);
      freshies.push_back(fresh);
      subst_a.emplace(a->typeParams[i], fresh);
      subst_b.emplace(b->typeParams[i], fresh);
    }

    bool good = true;
    for (size_t i = 0; good && i < a->args.size(); ++i) {
      good = unify(substitute(ctx_, a->args[i], subst_a), substitute(ctx_, b->args[i], subst_b));
    }
    good = good && unify(substitute(ctx_, a->result, subst_a), substitute(ctx_, b->result, subst_b));

    if (good && !freshies.empty()) {
      // None of the fresh variables may escape
      const auto escapes = [&](Type * t) {
        const auto vars = free_variables(t);
        return std::any_of(
          freshies.begin(), freshies.end(), [&](TypeVariable * f) { return contains_var(vars, f); });
      };
      if (escapes(a) || escapes(b)) {
        return false;
      }
      for (const auto & [var, val] : subst_) {
        if (escapes(val)) {
          return false;
        }
      }
    }
    return good;
  }

  // ==========================================================================
  // Type Variables
  // ==========================================================================

  bool unify_variable(TypeVariable * v, Type * b)
  {
    Type * that = expanded(b);
    if (auto * p = dyn_cast<TypeProxy>(that); p != nullptr && p->is_plain()) {
      return unify_proxy(p, v);
    }
    if (that == v) {
      return true;
    }

    if (is_unifiable(v, unifiable_)) {
      auto it = subst_.find(v);
      if (it == subst_.end()) {
        return add_substitution(v, that);
      }
      return unify(it->second, that);
    }

    // v is rigid, but that may still be a unifiable variable
    auto * tv = dyn_cast<TypeVariable>(that);
    return tv != nullptr && is_unifiable(tv, unifiable_) && unify_variable(tv, v);
  }

  bool add_substitution(TypeVariable * v, Type * t)
  {
    Type * value = substitute(ctx_, t, subst_);
    if (contains_var(free_variables(value), v)) {
      return false;
    }
    const TypeSubstitution single{{v, value}};
    for (auto & entry : subst_) {
      entry.second = substitute(ctx_, entry.second, single);
    }
    subst_.emplace(v, value);
    return true;
  }

  // ==========================================================================
  // Proxies
  // ==========================================================================

  bool unify_proxy(TypeProxy * p, Type * b)
  {
    if (Type * target = p->proxy_for()) {
      return unify(target, b);
    }
    Type * that = expanded(b);
    if (that == p) {
      return true;
    }
    if (really_occurs_in(p, that)) {
      return false;
    }
    p->define_proxy(that);
    return true;
  }

  bool unify_bv_proxy(BvTypeProxy * p, Type * b)
  {
    if (Type * target = p->proxy_for()) {
      return unify(target, b);
    }
    Type * that = expanded(b);
    if (that == p) {
      return true;
    }
    if (really_occurs_in(p, that)) {
      return false;
    }

    if (auto * tv = dyn_cast<TypeVariable>(that)) {
      return is_unifiable(tv, unifiable_) && unify_variable(tv, p);
    }

    if (auto * bv = dyn_cast<BvType>(that)) {
      if (p->minBits > bv->bits) {
        return false;
      }
      for (const auto & c : p->constraints) {
        const int64_t min_t1 = bv_bits(c.t1);
        int64_t left = increase_bits(ctx_, c.t0, static_cast<int64_t>(bv->bits) - min_t1);
        left = increase_bits(ctx_, c.t1, min_t1 + left);
        if (left != 0) {
          throw InternalError(fmt::format(
            "bit-vector constraint of {} cannot be satisfied by {}", p->name, to_string(bv)));
        }
      }
      p->define_proxy(bv);
      return true;
    }

    if (auto * q = dyn_cast<BvTypeProxy>(that)) {
      if (!p->constraints.empty() || !q->constraints.empty()) {
        auto * merged = ctx_.new_bv_proxy(std::max(p->minBits, q->minBits), p->get_range());
        std::vector<BvConstraint> all(p->constraints.begin(), p->constraints.end());
        all.insert(all.end(), q->constraints.begin(), q->constraints.end());
        merged->constraints = ctx_.copy_to_arena(all);
        p->define_proxy(merged);
        q->define_proxy(merged);
      } else if (p->minBits <= q->minBits) {
        p->define_proxy(q);
      } else {
        q->define_proxy(p);
      }
      return true;
    }

    if (auto * other = dyn_cast<TypeProxy>(that); other != nullptr && other->is_plain()) {
      return unify_proxy(other, p);
    }
    return false;
  }

  bool unify_map_proxy(MapTypeProxy * p, Type * b)
  {
    if (Type * target = p->proxy_for()) {
      return unify(target, b);
    }
    Type * that = expanded(b);
    if (that == p) {
      return true;
    }
    if (really_occurs_in(p, that)) {
      return false;
    }

    if (auto * m = dyn_cast<MapType>(that); m != nullptr && m->arity() == p->arity) {
      for (const auto & c : p->constraints) {
        if (!unify_constraint(c, m)) {
          return false;
        }
      }
      p->define_proxy(m);
      return true;
    }

    if (auto * q = dyn_cast<MapTypeProxy>(that); q != nullptr && q->arity == p->arity) {
      for (const auto & c : p->constraints) {
        add_map_constraint(ctx_, q, c.args, c.result);
      }
      p->define_proxy(q);
      return true;
    }

    if (auto * tv = dyn_cast<TypeVariable>(that)) {
      return is_unifiable(tv, unifiable_) && unify_variable(tv, p);
    }
    if (auto * other = dyn_cast<TypeProxy>(that); other != nullptr && other->is_plain()) {
      return unify_proxy(other, p);
    }
    return false;
  }

public:
  /// Instantiate @p m's type parameters with fresh proxies and match it against @p c.
  bool unify_constraint(const MapConstraint & c, MapType * m)
  {
    const TypeSubstitution inst = fresh_proxy_substitution(ctx_, m->typeParams);
    for (size_t i = 0; i < m->args.size(); ++i) {
      if (!unify(substitute(ctx_, m->args[i], inst), c.args[i])) {
        return false;
      }
    }
    return unify(substitute(ctx_, m->result, inst), c.result);
  }

private:
  TypeContext & ctx_;
  gsl::span<TypeVariable * const> unifiable_;
  TypeSubstitution & subst_;
};

// ============================================================================
// Substitution
// ============================================================================

gsl::span<Type *> substitute_all(
  TypeContext & ctx, gsl::span<Type *> types, const TypeSubstitution & subst, bool & changed)
{
  std::vector<Type *> res;
  res.reserve(types.size());
  for (Type * t : types) {
    Type * s = substitute(ctx, t, subst);
    changed = changed || s != t;
    res.push_back(s);
  }
  return changed ? ctx.copy_to_arena(res) : types;
}

Type * substitute_map(TypeContext & ctx, MapType * m, const TypeSubstitution & subst)
{
  // Bound variables shadow the substitution
  TypeSubstitution inner;
  for (const auto & entry : subst) {
    if (std::find(m->typeParams.begin(), m->typeParams.end(), entry.first) == m->typeParams.end()) {
      inner.insert(entry);
    }
  }

  bool captured = false;
  for (const auto & entry : inner) {
    const auto vars = free_variables(entry.second);
    for (TypeVariable * param : m->typeParams) {
      captured = captured || contains_var(vars, param);
    }
  }

  gsl::span<TypeVariable *> params = m->typeParams;
  bool changed = false;
  if (captured) {
    std::vector<TypeVariable *> fresh;
    for (TypeVariable * param : m->typeParams) {
      TypeVariable * v = ctx.new_type_variable(param->name, param->get_range());
      fresh.push_back(v);
      inner[param] = v;
    }
    params = ctx.copy_to_arena(fresh);
    changed = true;
  }

  if (inner.empty()) {
    return m;
  }
  auto args = substitute_all(ctx, m->args, inner, changed);
  Type * result = substitute(ctx, m->result, inner);
  changed = changed || result != m->result;
  if (!changed) {
    return m;
  }
  return ctx.map_type(params, args, result, m->get_range());
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

bool unify(
  TypeContext & ctx, Type * a, Type * b, gsl::span<TypeVariable * const> unifiable,
  TypeSubstitution & subst)
{
  Unifier unifier(ctx, unifiable, subst);
  return unifier.unify(a, b);
}

bool unify(TypeContext & ctx, Type * a, Type * b)
{
  TypeSubstitution subst;
  return unify(ctx, a, b, {}, subst);
}

Type * substitute(TypeContext & ctx, Type * t, const TypeSubstitution & subst)
{
  if (subst.empty()) {
    return t;
  }
  t = follow_proxy(t);
  bool changed = false;
  switch (t->get_kind()) {
    case TypeKind::Variable: {
      auto it = subst.find(cast<TypeVariable>(t));
      return it == subst.end() ? t : it->second;
    }
    case TypeKind::Ctor: {
      auto * c = cast<CtorType>(t);
      auto args = substitute_all(ctx, c->args, subst, changed);
      return changed ? ctx.ctor_type(c->decl, c->name, args, c->get_range()) : t;
    }
    case TypeKind::Synonym: {
      auto * s = cast<TypeSynonymAnnotation>(t);
      auto args = substitute_all(ctx, s->args, subst, changed);
      Type * exp = substitute(ctx, s->expanded, subst);
      changed = changed || exp != s->expanded;
      return changed ? ctx.synonym_annotation(s->decl, s->name, args, exp, s->get_range()) : t;
    }
    case TypeKind::Map:
      return substitute_map(ctx, cast<MapType>(t), subst);
    case TypeKind::Unresolved: {
      auto * u = cast<UnresolvedTypeIdentifier>(t);
      auto args = substitute_all(ctx, u->args, subst, changed);
      return changed ? ctx.unresolved_type(u->name, args, u->get_range()) : t;
    }
    case TypeKind::Basic:
    case TypeKind::Bv:
    case TypeKind::Proxy:
    case TypeKind::BvProxy:
    case TypeKind::MapProxy:
      return t;
  }
  return t;
}

TypeSubstitution fresh_proxy_substitution(TypeContext & ctx, gsl::span<TypeVariable * const> vars)
{
  TypeSubstitution res;
  for (TypeVariable * v : vars) {
    res.emplace(v, ctx.new_proxy(v->name, v->get_range()));
  }
  return res;
}

int64_t increase_bits(TypeContext & ctx, Type * t, int64_t to)
{
  t = follow_proxy(t);
  if (const auto * bv = dyn_cast<BvType>(t)) {
    return to - static_cast<int64_t>(bv->bits);
  }
  auto * p = dyn_cast<BvTypeProxy>(t);
  if (p == nullptr) {
    throw InternalError(fmt::format("expected a bit-vector type, got {}", to_string(t)));
  }
  if (static_cast<int64_t>(p->minBits) > to) {
    return to - static_cast<int64_t>(p->minBits);
  }
  auto * raised = ctx.new_bv_proxy(static_cast<uint32_t>(to), p->get_range());
  raised->constraints = p->constraints;
  p->define_proxy(raised);
  return 0;
}

void add_map_constraint(
  TypeContext & ctx, MapTypeProxy * proxy, gsl::span<Type *> args, Type * result)
{
  if (Type * target = proxy->proxy_for()) {
    if (auto * m = dyn_cast<MapType>(target)) {
      TypeSubstitution subst;
      Unifier unifier(ctx, {}, subst);
      if (!unifier.unify_constraint(MapConstraint{args, result}, m)) {
        throw InternalError(
          fmt::format("map constraint does not fit {} = {}", proxy->name, to_string(m)));
      }
      return;
    }
    if (auto * q = dyn_cast<MapTypeProxy>(target)) {
      add_map_constraint(ctx, q, args, result);
      return;
    }
    throw InternalError(
      fmt::format("map proxy {} is defined as non-map {}", proxy->name, to_string(target)));
  }

  std::vector<MapConstraint> all(proxy->constraints.begin(), proxy->constraints.end());
  const std::vector<Type *> arg_copy(args.begin(), args.end());
  all.push_back(MapConstraint{ctx.copy_to_arena(arg_copy), result});
  proxy->constraints = ctx.copy_to_arena(all);
}

}  // namespace ivl
