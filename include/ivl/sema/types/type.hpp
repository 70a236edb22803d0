// ivl/sema/types/type.hpp - Structural type representation
//
// Types form a closed hierarchy with LLVM-style RTTI (see casting.hpp).
// The parser produces UnresolvedTypeIdentifier occurrences; name resolution
// replaces them by concrete types, and type checking introduces proxies
// (write-once placeholders) that unification later resolves.
//
// All types are owned by a TypeContext arena and are trivially destructible.
//
#pragma once

#include <cstdint>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

#include "ivl/basic/casting.hpp"
#include "ivl/basic/source_manager.hpp"

namespace ivl
{

class TypeCtorDecl;
class TypeSynonymDecl;

// ============================================================================
// Type Kind
// ============================================================================

enum class TypeKind : uint8_t {
  Basic,       ///< int, bool
  Bv,          ///< bvN
  Variable,    ///< type variable (identity-based)
  Ctor,        ///< user type constructor application
  Map,         ///< <a>[args]result
  Synonym,     ///< synonym occurrence with its expansion
  Unresolved,  ///< type name before resolution
  // Proxies (must stay last; TypeProxy::classof is a range check)
  Proxy,     ///< unconstrained placeholder
  BvProxy,   ///< bit-vector of unknown width
  MapProxy,  ///< map of known arity but unknown shape
};

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all types.
 *
 * Types are non-copyable and managed by TypeContext.
 */
class Type
{
public:
  const TypeKind kind;
  SourceRange range_;  ///< Occurrence in source (invalid for synthesized types)

  Type(const Type &) = delete;
  Type & operator=(const Type &) = delete;
  Type(Type &&) = delete;
  Type & operator=(Type &&) = delete;

  [[nodiscard]] TypeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit Type(TypeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~Type() = default;
};

/**
 * CRTP base class that implements classof() for concrete type classes.
 */
template <typename Derived, TypeKind K>
class TypeBase : public Type
{
public:
  static constexpr TypeKind kind = K;

  static bool classof(const Type * t) { return t->get_kind() == K; }

protected:
  explicit TypeBase(SourceRange r = {}) : Type(K, r) {}
};

// ============================================================================
// Concrete Types
// ============================================================================

enum class BasicKind : uint8_t { Int, Bool };

class BasicType : public TypeBase<BasicType, TypeKind::Basic>
{
public:
  BasicKind which;

  explicit BasicType(BasicKind w, SourceRange r = {}) : TypeBase(r), which(w) {}

  [[nodiscard]] bool is_int() const noexcept { return which == BasicKind::Int; }
  [[nodiscard]] bool is_bool() const noexcept { return which == BasicKind::Bool; }
};

class BvType : public TypeBase<BvType, TypeKind::Bv>
{
public:
  uint32_t bits;

  explicit BvType(uint32_t b, SourceRange r = {}) : TypeBase(r), bits(b) {}
};

/// Type variable; two variables are the same variable iff they are the same object.
class TypeVariable : public TypeBase<TypeVariable, TypeKind::Variable>
{
public:
  std::string_view name;

  explicit TypeVariable(std::string_view n, SourceRange r = {}) : TypeBase(r), name(n) {}
};

/// Application of a user-declared type constructor (`C int bool`).
class CtorType : public TypeBase<CtorType, TypeKind::Ctor>
{
public:
  const TypeCtorDecl * decl;
  std::string_view name;
  gsl::span<Type *> args;

  CtorType(const TypeCtorDecl * d, std::string_view n, gsl::span<Type *> a, SourceRange r = {})
  : TypeBase(r), decl(d), name(n), args(a)
  {
  }
};

/// Polymorphic map type `<typeParams>[args]result`.
class MapType : public TypeBase<MapType, TypeKind::Map>
{
public:
  gsl::span<TypeVariable *> typeParams;
  gsl::span<Type *> args;
  Type * result;

  MapType(
    gsl::span<TypeVariable *> params, gsl::span<Type *> a, Type * res, SourceRange r = {})
  : TypeBase(r), typeParams(params), args(a), result(res)
  {
  }

  [[nodiscard]] size_t arity() const noexcept { return args.size(); }
};

/**
 * Occurrence of a type synonym.
 *
 * Behaves exactly like `expanded` for every structural operation; the
 * synonym name and arguments are kept only for printing.
 */
class TypeSynonymAnnotation : public TypeBase<TypeSynonymAnnotation, TypeKind::Synonym>
{
public:
  const TypeSynonymDecl * decl;
  std::string_view name;
  gsl::span<Type *> args;
  Type * expanded;

  TypeSynonymAnnotation(
    const TypeSynonymDecl * d, std::string_view n, gsl::span<Type *> a, Type * exp,
    SourceRange r = {})
  : TypeBase(r), decl(d), name(n), args(a), expanded(exp)
  {
  }
};

/// Type name as written in source; replaced during name resolution.
class UnresolvedTypeIdentifier : public TypeBase<UnresolvedTypeIdentifier, TypeKind::Unresolved>
{
public:
  std::string_view name;
  gsl::span<Type *> args;

  UnresolvedTypeIdentifier(std::string_view n, gsl::span<Type *> a, SourceRange r = {})
  : TypeBase(r), name(n), args(a)
  {
  }
};

// ============================================================================
// Proxies
// ============================================================================

/**
 * Placeholder for a type that is not yet known.
 *
 * A proxy is defined at most once. Chains of defined proxies are shortened
 * whenever they are followed, so repeated lookups stay cheap.
 *
 * TypeProxy is both the category base of all proxies and the concrete
 * unconstrained proxy.
 */
class TypeProxy : public Type
{
public:
  std::string_view name;

  explicit TypeProxy(std::string_view n, SourceRange r = {}) : Type(TypeKind::Proxy, r), name(n) {}

  static bool classof(const Type * t) { return t->get_kind() >= TypeKind::Proxy; }

  /**
   * Target of this proxy with the chain of defined proxies collapsed.
   *
   * @return The last type in the chain (which may itself be an undefined
   *         proxy), or nullptr if this proxy is undefined
   */
  [[nodiscard]] Type * proxy_for() const noexcept;

  [[nodiscard]] bool is_defined() const noexcept { return proxyFor_ != nullptr; }

  /// True for the unconstrained kind (not a BvTypeProxy or MapTypeProxy).
  [[nodiscard]] bool is_plain() const noexcept { return kind == TypeKind::Proxy; }

  /**
   * Define the undefined proxy at the end of this chain as @p target.
   *
   * Defining a proxy as itself is a no-op.
   *
   * @throws InternalError if the chain already ends in a non-proxy type
   */
  void define_proxy(Type * target);

protected:
  TypeProxy(TypeKind k, std::string_view n, SourceRange r) : Type(k, r), name(n) {}

private:
  mutable Type * proxyFor_ = nullptr;
};

/// Width relation produced by `++`: this proxy's width equals width(t0) + width(t1).
struct BvConstraint
{
  Type * t0;
  Type * t1;
};

class BvTypeProxy : public TypeProxy
{
public:
  uint32_t minBits;
  gsl::span<BvConstraint> constraints;

  BvTypeProxy(std::string_view n, uint32_t min_bits, SourceRange r = {})
  : TypeProxy(TypeKind::BvProxy, n, r), minBits(min_bits)
  {
  }

  static bool classof(const Type * t) { return t->get_kind() == TypeKind::BvProxy; }
};

/// Usage-site shape a map proxy has to accept once it is known.
struct MapConstraint
{
  gsl::span<Type *> args;
  Type * result;
};

class MapTypeProxy : public TypeProxy
{
public:
  uint32_t arity;
  gsl::span<MapConstraint> constraints;

  MapTypeProxy(std::string_view n, uint32_t a, SourceRange r = {})
  : TypeProxy(TypeKind::MapProxy, n, r), arity(a)
  {
  }

  static bool classof(const Type * t) { return t->get_kind() == TypeKind::MapProxy; }
};

// ============================================================================
// Type Context
// ============================================================================

/**
 * Owns every type of a compilation unit and hands out shared instances of
 * the built-in types.
 */
class TypeContext
{
public:
  /// Widths up to this value are interned
  static constexpr uint32_t k_bv_cache_limit = 128;

  TypeContext();

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;
  TypeContext(TypeContext &&) = delete;
  TypeContext & operator=(TypeContext &&) = delete;

  // ===========================================================================
  // Built-in Types (Singletons)
  // ===========================================================================

  [[nodiscard]] BasicType * int_type() const noexcept { return int_; }
  [[nodiscard]] BasicType * bool_type() const noexcept { return bool_; }
  [[nodiscard]] BvType * bv_type(uint32_t bits);

  // ===========================================================================
  // Type Creation
  // ===========================================================================

  TypeVariable * new_type_variable(std::string_view name, SourceRange r = {});
  CtorType * ctor_type(
    const TypeCtorDecl * decl, std::string_view name, gsl::span<Type *> args, SourceRange r = {});
  MapType * map_type(
    gsl::span<TypeVariable *> params, gsl::span<Type *> args, Type * result, SourceRange r = {});
  TypeSynonymAnnotation * synonym_annotation(
    const TypeSynonymDecl * decl, std::string_view name, gsl::span<Type *> args, Type * expanded,
    SourceRange r = {});
  UnresolvedTypeIdentifier * unresolved_type(
    std::string_view name, gsl::span<Type *> args, SourceRange r = {});

  /// Fresh unconstrained proxy named `<given>$proxy#<n>`.
  TypeProxy * new_proxy(std::string_view given_name, SourceRange r = {});
  BvTypeProxy * new_bv_proxy(uint32_t min_bits, SourceRange r = {});
  /// Proxy for the result of concatenating @p t0 and @p t1.
  BvTypeProxy * new_bv_proxy(Type * t0, Type * t1, SourceRange r = {});
  MapTypeProxy * new_map_proxy(uint32_t arity, SourceRange r = {});

  // ===========================================================================
  // Arena Helpers
  // ===========================================================================

  [[nodiscard]] std::string_view intern(std::string_view s);

  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(arena_.allocate(sizeof(T) * size, alignof(T)));
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    auto span = allocate_array<T>(vec.size());
    std::uninitialized_copy(vec.begin(), vec.end(), span.begin());
    return span;
  }

  [[nodiscard]] uint32_t proxy_count() const noexcept { return proxyCount_; }

private:
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<Type, T>, "T must derive from Type");
    static_assert(
      std::is_trivially_destructible_v<T>, "Types must be trivially destructible to live in the arena");
    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  std::string_view make_name(std::string_view given, std::string_view suffix, uint32_t n);

  std::pmr::monotonic_buffer_resource arena_{size_t{16} * size_t{1024}};
  std::pmr::unordered_set<std::string_view> stringPool_{&arena_};

  BasicType * int_ = nullptr;
  BasicType * bool_ = nullptr;
  std::vector<BvType *> bvCache_;

  uint32_t proxyCount_ = 0;
  uint32_t bvProxyCount_ = 0;
  uint32_t mapProxyCount_ = 0;
};

// ============================================================================
// Structural Queries
// ============================================================================

/// Follow defined proxies; returns @p t itself when it is not a defined proxy.
[[nodiscard]] Type * follow_proxy(Type * t) noexcept;
[[nodiscard]] const Type * follow_proxy(const Type * t) noexcept;

/// follow_proxy() and synonym expansion until neither applies.
[[nodiscard]] Type * expanded(Type * t) noexcept;
[[nodiscard]] const Type * expanded(const Type * t) noexcept;

[[nodiscard]] bool is_int(const Type * t) noexcept;
[[nodiscard]] bool is_bool(const Type * t) noexcept;
[[nodiscard]] bool is_bv(const Type * t) noexcept;
[[nodiscard]] bool is_map(const Type * t) noexcept;

/**
 * Width of a bit-vector type.
 *
 * For an undefined BvTypeProxy this is its current lower bound; 0 for
 * anything that is not a bit-vector.
 */
[[nodiscard]] uint32_t bv_bits(const Type * t) noexcept;

/**
 * Structural equality up to consistent renaming of bound type variables.
 *
 * Free type variables are equal only to themselves; undefined proxies only
 * to themselves.
 */
[[nodiscard]] bool types_equal(const Type * a, const Type * b);

/// Free type variables in order of first occurrence, without duplicates.
[[nodiscard]] std::vector<TypeVariable *> free_variables(Type * t);

/// Free variables of several types, in order of first occurrence.
[[nodiscard]] std::vector<TypeVariable *> free_variables_in(gsl::span<Type * const> types);

/// Undefined proxies reachable from @p t, in order of first occurrence.
[[nodiscard]] std::vector<TypeProxy *> free_proxies(Type * t);

[[nodiscard]] inline bool contains_proxy(Type * t) { return !free_proxies(t).empty(); }

/// Textual form in the concrete syntax; undefined proxies print as `?`.
[[nodiscard]] std::string to_string(const Type * t);

}  // namespace ivl
