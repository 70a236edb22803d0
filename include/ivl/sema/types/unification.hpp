// ivl/sema/types/unification.hpp - Unification and substitution of types
//
// unify() makes two types equal by binding type variables (only those
// listed as unifiable) and by defining proxies. Proxies are defined for
// good; variable bindings are collected in a TypeSubstitution that the
// caller owns.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <unordered_map>

#include "ivl/sema/types/type.hpp"

namespace ivl
{

/// Binding of type variables (by identity) to types.
using TypeSubstitution = std::unordered_map<const TypeVariable *, Type *>;

/**
 * Unify @p a with @p b.
 *
 * @p subst must be idempotent on entry and stays idempotent. On failure
 * it may have been extended partially, and proxies defined on the way
 * stay defined.
 *
 * @param unifiable Variables that may be bound in @p subst
 * @return true if a unifier was found
 * @throws InternalError on a bit-vector width constraint that cannot be met
 *         (cannot happen for well-formed proxy graphs)
 */
bool unify(
  TypeContext & ctx, Type * a, Type * b, gsl::span<TypeVariable * const> unifiable,
  TypeSubstitution & subst);

/// Unification without unifiable variables.
bool unify(TypeContext & ctx, Type * a, Type * b);

/**
 * Apply @p subst to @p t.
 *
 * Bound variables of map types are renamed when a substituted type would
 * capture them. Returns @p t itself when nothing changes.
 */
[[nodiscard]] Type * substitute(TypeContext & ctx, Type * t, const TypeSubstitution & subst);

/// Fresh unconstrained proxy for each variable, named after it.
[[nodiscard]] TypeSubstitution fresh_proxy_substitution(
  TypeContext & ctx, gsl::span<TypeVariable * const> vars);

// ============================================================================
// Proxy Operations
// ============================================================================

/**
 * Raise the width of bit-vector @p t to at least @p to.
 *
 * An undefined BvTypeProxy below @p to is redefined as a proxy with
 * minimum width @p to (keeping its constraints).
 *
 * @return The remaining difference `to - width(t)` (0 once the proxy was raised)
 * @throws InternalError if @p t is no bit-vector
 */
int64_t increase_bits(TypeContext & ctx, Type * t, int64_t to);

/**
 * Record that @p proxy is used as a map with the given arguments and result.
 *
 * If the proxy has been defined in the meantime the constraint is applied
 * to its definition instead.
 *
 * @throws InternalError if the constraint does not fit an already known map type
 */
void add_map_constraint(
  TypeContext & ctx, MapTypeProxy * proxy, gsl::span<Type *> args, Type * result);

}  // namespace ivl
