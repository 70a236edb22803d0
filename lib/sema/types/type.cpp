// ivl/sema/types/type.cpp - Type context, proxy chains and structural queries
//
#include "ivl/sema/types/type.hpp"

#include <fmt/core.h>

#include <algorithm>

#include "ivl/basic/internal_error.hpp"

namespace ivl
{

// ============================================================================
// TypeProxy
// ============================================================================

Type * TypeProxy::proxy_for() const noexcept
{
  Type * res = proxyFor_;
  auto * p = dyn_cast<TypeProxy>(res);
  while (p != nullptr && p->proxyFor_ != nullptr) {
    res = p->proxyFor_;
    p = dyn_cast<TypeProxy>(res);
  }
  proxyFor_ = res;  // shorten the chain
  return res;
}

void TypeProxy::define_proxy(Type * target)
{
  TypeProxy * leaf = this;
  Type * next = leaf->proxyFor_;
  while (next != nullptr) {
    auto * p = dyn_cast<TypeProxy>(next);
    if (p == nullptr) {
      throw InternalError(fmt::format("proxy {} is already defined as {}", name, to_string(next)));
    }
    leaf = p;
    next = p->proxyFor_;
  }
  if (leaf != target) {
    leaf->proxyFor_ = target;
  }
}

// ============================================================================
// TypeContext
// ============================================================================

TypeContext::TypeContext()
{
  int_ = create<BasicType>(BasicKind::Int);
  bool_ = create<BasicType>(BasicKind::Bool);
  bvCache_.assign(k_bv_cache_limit + 1, nullptr);
}

BvType * TypeContext::bv_type(uint32_t bits)
{
  if (bits > k_bv_cache_limit) {
    return create<BvType>(bits);
  }
  if (bvCache_[bits] == nullptr) {
    bvCache_[bits] = create<BvType>(bits);
  }
  return bvCache_[bits];
}

TypeVariable * TypeContext::new_type_variable(std::string_view name, SourceRange r)
{
  return create<TypeVariable>(intern(name), r);
}

CtorType * TypeContext::ctor_type(
  const TypeCtorDecl * decl, std::string_view name, gsl::span<Type *> args, SourceRange r)
{
  return create<CtorType>(decl, intern(name), args, r);
}

MapType * TypeContext::map_type(
  gsl::span<TypeVariable *> params, gsl::span<Type *> args, Type * result, SourceRange r)
{
  return create<MapType>(params, args, result, r);
}

TypeSynonymAnnotation * TypeContext::synonym_annotation(
  const TypeSynonymDecl * decl, std::string_view name, gsl::span<Type *> args, Type * expanded,
  SourceRange r)
{
  return create<TypeSynonymAnnotation>(decl, intern(name), args, expanded, r);
}

UnresolvedTypeIdentifier * TypeContext::unresolved_type(
  std::string_view name, gsl::span<Type *> args, SourceRange r)
{
  return create<UnresolvedTypeIdentifier>(intern(name), args, r);
}

TypeProxy * TypeContext::new_proxy(std::string_view given_name, SourceRange r)
{
  return create<TypeProxy>(make_name(given_name, "proxy", proxyCount_++), r);
}

BvTypeProxy * TypeContext::new_bv_proxy(uint32_t min_bits, SourceRange r)
{
  return create<BvTypeProxy>(make_name("", "bvproxy", bvProxyCount_++), min_bits, r);
}

BvTypeProxy * TypeContext::new_bv_proxy(Type * t0, Type * t1, SourceRange r)
{
  t0 = follow_proxy(t0);
  t1 = follow_proxy(t1);
  auto * proxy = new_bv_proxy(bv_bits(t0) + bv_bits(t1), r);
  proxy->constraints = copy_to_arena(std::vector<BvConstraint>{BvConstraint{t0, t1}});
  return proxy;
}

MapTypeProxy * TypeContext::new_map_proxy(uint32_t arity, SourceRange r)
{
  return create<MapTypeProxy>(make_name("", "mapproxy", mapProxyCount_++), arity, r);
}

std::string_view TypeContext::intern(std::string_view s)
{
  auto it = stringPool_.find(s);
  if (it != stringPool_.end()) {
    return *it;
  }
  char * const ptr = static_cast<char *>(arena_.allocate(s.size() == 0 ? 1 : s.size(), 1));
  std::memcpy(ptr, s.data(), s.size());
  const std::string_view stored(ptr, s.size());
  stringPool_.insert(stored);
  return stored;
}

std::string_view TypeContext::make_name(std::string_view given, std::string_view suffix, uint32_t n)
{
  return intern(fmt::format("{}${}#{}", given, suffix, n));
}

// ============================================================================
// Proxy Following and Expansion
// ============================================================================

Type * follow_proxy(Type * t) noexcept
{
  if (auto * p = dyn_cast<TypeProxy>(t)) {
    if (Type * target = p->proxy_for()) {
      return target;
    }
  }
  return t;
}

const Type * follow_proxy(const Type * t) noexcept
{
  return follow_proxy(const_cast<Type *>(t));  // NOLINT(cppcoreguidelines-pro-type-const-cast)
}

Type * expanded(Type * t) noexcept
{
  for (;;) {
    t = follow_proxy(t);
    if (auto * syn = dyn_cast<TypeSynonymAnnotation>(t)) {
      t = syn->expanded;
      continue;
    }
    return t;
  }
}

const Type * expanded(const Type * t) noexcept
{
  return expanded(const_cast<Type *>(t));  // NOLINT(cppcoreguidelines-pro-type-const-cast)
}

bool is_int(const Type * t) noexcept
{
  const auto * b = dyn_cast<BasicType>(expanded(t));
  return b != nullptr && b->is_int();
}

bool is_bool(const Type * t) noexcept
{
  const auto * b = dyn_cast<BasicType>(expanded(t));
  return b != nullptr && b->is_bool();
}

bool is_bv(const Type * t) noexcept { return isa_any<BvType, BvTypeProxy>(expanded(t)); }

bool is_map(const Type * t) noexcept { return isa_any<MapType, MapTypeProxy>(expanded(t)); }

uint32_t bv_bits(const Type * t) noexcept
{
  const Type * e = expanded(t);
  if (const auto * bv = dyn_cast<BvType>(e)) {
    return bv->bits;
  }
  if (const auto * p = dyn_cast<BvTypeProxy>(e)) {
    return p->minBits;
  }
  return 0;
}

// ============================================================================
// Equality up to Bound Variables
// ============================================================================

namespace
{

using BoundList = std::vector<const TypeVariable *>;

int last_index_of(const BoundList & list, const TypeVariable * v)
{
  for (size_t i = list.size(); i > 0; --i) {
    if (list[i - 1] == v) {
      return static_cast<int>(i - 1);
    }
  }
  return -1;
}

bool equal_in(const Type * a, const Type * b, BoundList & this_bound, BoundList & that_bound)
{
  a = expanded(a);
  b = expanded(b);

  switch (a->get_kind()) {
    case TypeKind::Basic: {
      const auto * tb = dyn_cast<BasicType>(b);
      return tb != nullptr && tb->which == cast<BasicType>(a)->which;
    }
    case TypeKind::Bv: {
      const auto * tb = dyn_cast<BvType>(b);
      return tb != nullptr && tb->bits == cast<BvType>(a)->bits;
    }
    case TypeKind::Variable: {
      const auto * tb = dyn_cast<TypeVariable>(b);
      if (tb == nullptr) {
        return false;
      }
      const int this_index = last_index_of(this_bound, cast<TypeVariable>(a));
      const int that_index = last_index_of(that_bound, tb);
      return (this_index >= 0 && this_index == that_index) ||
             (this_index == -1 && that_index == -1 && a == b);
    }
    case TypeKind::Ctor: {
      const auto * ta = cast<CtorType>(a);
      const auto * tb = dyn_cast<CtorType>(b);
      if (tb == nullptr || ta->decl != tb->decl || ta->args.size() != tb->args.size()) {
        return false;
      }
      for (size_t i = 0; i < ta->args.size(); ++i) {
        if (!equal_in(ta->args[i], tb->args[i], this_bound, that_bound)) {
          return false;
        }
      }
      return true;
    }
    case TypeKind::Map: {
      const auto * ta = cast<MapType>(a);
      const auto * tb = dyn_cast<MapType>(b);
      if (
        tb == nullptr || ta->typeParams.size() != tb->typeParams.size() ||
        ta->args.size() != tb->args.size()) {
        return false;
      }
      const size_t this_mark = this_bound.size();
      const size_t that_mark = that_bound.size();
      this_bound.insert(this_bound.end(), ta->typeParams.begin(), ta->typeParams.end());
      that_bound.insert(that_bound.end(), tb->typeParams.begin(), tb->typeParams.end());

      bool result = true;
      for (size_t i = 0; result && i < ta->args.size(); ++i) {
        result = equal_in(ta->args[i], tb->args[i], this_bound, that_bound);
      }
      result = result && equal_in(ta->result, tb->result, this_bound, that_bound);

      this_bound.resize(this_mark);
      that_bound.resize(that_mark);
      return result;
    }
    case TypeKind::Unresolved: {
      const auto * ta = cast<UnresolvedTypeIdentifier>(a);
      const auto * tb = dyn_cast<UnresolvedTypeIdentifier>(b);
      if (tb == nullptr || ta->name != tb->name || ta->args.size() != tb->args.size()) {
        return false;
      }
      for (size_t i = 0; i < ta->args.size(); ++i) {
        if (!equal_in(ta->args[i], tb->args[i], this_bound, that_bound)) {
          return false;
        }
      }
      return true;
    }
    case TypeKind::Proxy:
    case TypeKind::BvProxy:
    case TypeKind::MapProxy:
      // undefined (expanded() followed every defined proxy)
      return a == b;
    case TypeKind::Synonym:
      break;
  }
  return false;
}

// ----------------------------------------------------------------------------

template <typename T>
void append_without_dups(std::vector<T *> & out, T * v)
{
  if (std::find(out.begin(), out.end(), v) == out.end()) {
    out.push_back(v);
  }
}

void collect_free_variables(Type * t, std::vector<TypeVariable *> & out)
{
  t = follow_proxy(t);
  switch (t->get_kind()) {
    case TypeKind::Variable:
      append_without_dups(out, cast<TypeVariable>(t));
      return;
    case TypeKind::Ctor:
      for (Type * arg : cast<CtorType>(t)->args) {
        collect_free_variables(arg, out);
      }
      return;
    case TypeKind::Unresolved:
      for (Type * arg : cast<UnresolvedTypeIdentifier>(t)->args) {
        collect_free_variables(arg, out);
      }
      return;
    case TypeKind::Synonym:
      collect_free_variables(cast<TypeSynonymAnnotation>(t)->expanded, out);
      return;
    case TypeKind::Map: {
      auto * m = cast<MapType>(t);
      std::vector<TypeVariable *> inner;
      for (Type * arg : m->args) {
        collect_free_variables(arg, inner);
      }
      collect_free_variables(m->result, inner);
      for (TypeVariable * v : inner) {
        if (std::find(m->typeParams.begin(), m->typeParams.end(), v) == m->typeParams.end()) {
          append_without_dups(out, v);
        }
      }
      return;
    }
    case TypeKind::Basic:
    case TypeKind::Bv:
    case TypeKind::Proxy:
    case TypeKind::BvProxy:
    case TypeKind::MapProxy:
      return;
  }
}

void collect_free_proxies(Type * t, std::vector<TypeProxy *> & out)
{
  t = follow_proxy(t);
  switch (t->get_kind()) {
    case TypeKind::Proxy:
    case TypeKind::BvProxy:
    case TypeKind::MapProxy:
      append_without_dups(out, cast<TypeProxy>(t));
      return;
    case TypeKind::Ctor:
      for (Type * arg : cast<CtorType>(t)->args) {
        collect_free_proxies(arg, out);
      }
      return;
    case TypeKind::Unresolved:
      for (Type * arg : cast<UnresolvedTypeIdentifier>(t)->args) {
        collect_free_proxies(arg, out);
      }
      return;
    case TypeKind::Synonym:
      collect_free_proxies(cast<TypeSynonymAnnotation>(t)->expanded, out);
      return;
    case TypeKind::Map: {
      auto * m = cast<MapType>(t);
      for (Type * arg : m->args) {
        collect_free_proxies(arg, out);
      }
      collect_free_proxies(m->result, out);
      return;
    }
    case TypeKind::Basic:
    case TypeKind::Bv:
    case TypeKind::Variable:
      return;
  }
}

// ----------------------------------------------------------------------------
// Printing
// ----------------------------------------------------------------------------

void print_type(const Type * t, int context_strength, std::string & out);

void print_application(
  std::string_view name, gsl::span<Type * const> args, int context_strength, std::string & out)
{
  const int strength = args.empty() ? 2 : 0;
  if (strength < context_strength) out += '(';
  out += name;
  for (size_t i = 0; i < args.size(); ++i) {
    out += ' ';
    print_type(args[i], i + 1 == args.size() ? 1 : 2, out);
  }
  if (strength < context_strength) out += ')';
}

void print_type(const Type * t, int context_strength, std::string & out)
{
  t = follow_proxy(t);
  switch (t->get_kind()) {
    case TypeKind::Basic:
      out += cast<BasicType>(t)->is_int() ? "int" : "bool";
      return;
    case TypeKind::Bv:
      out += fmt::format("bv{}", cast<BvType>(t)->bits);
      return;
    case TypeKind::Variable:
      out += cast<TypeVariable>(t)->name;
      return;
    case TypeKind::Ctor: {
      const auto * c = cast<CtorType>(t);
      print_application(c->name, c->args, context_strength, out);
      return;
    }
    case TypeKind::Synonym: {
      const auto * s = cast<TypeSynonymAnnotation>(t);
      print_application(s->name, s->args, context_strength, out);
      return;
    }
    case TypeKind::Unresolved: {
      const auto * u = cast<UnresolvedTypeIdentifier>(t);
      print_application(u->name, u->args, context_strength, out);
      return;
    }
    case TypeKind::Map: {
      const auto * m = cast<MapType>(t);
      if (context_strength > 1) out += '(';
      if (!m->typeParams.empty()) {
        out += '<';
        for (size_t i = 0; i < m->typeParams.size(); ++i) {
          if (i > 0) out += ", ";
          out += m->typeParams[i]->name;
        }
        out += '>';
      }
      out += '[';
      for (size_t i = 0; i < m->args.size(); ++i) {
        if (i > 0) out += ", ";
        print_type(m->args[i], 0, out);
      }
      out += ']';
      print_type(m->result, 0, out);
      if (context_strength > 1) out += ')';
      return;
    }
    case TypeKind::Proxy:
      out += '?';
      return;
    case TypeKind::BvProxy:
      out += "bv?";
      return;
    case TypeKind::MapProxy: {
      const auto * mp = cast<MapTypeProxy>(t);
      out += '[';
      for (uint32_t i = 0; i < mp->arity; ++i) {
        if (i > 0) out += ", ";
        out += '?';
      }
      out += "]?";
      return;
    }
  }
}

}  // namespace

bool types_equal(const Type * a, const Type * b)
{
  BoundList this_bound;
  BoundList that_bound;
  return equal_in(a, b, this_bound, that_bound);
}

std::vector<TypeVariable *> free_variables(Type * t)
{
  std::vector<TypeVariable *> out;
  collect_free_variables(t, out);
  return out;
}

std::vector<TypeVariable *> free_variables_in(gsl::span<Type * const> types)
{
  std::vector<TypeVariable *> out;
  for (Type * t : types) {
    collect_free_variables(t, out);
  }
  return out;
}

std::vector<TypeProxy *> free_proxies(Type * t)
{
  std::vector<TypeProxy *> out;
  collect_free_proxies(t, out);
  return out;
}

std::string to_string(const Type * t)
{
  if (t == nullptr) {
    return "<null>";
  }
  std::string out;
  print_type(t, 0, out);
  return out;
}

}  // namespace ivl
