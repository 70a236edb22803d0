// ivl/ast/attributes.hpp - Attribute queries
//
// Attributes `{:key p1, p2}` are kept as an ordered list per declaration.
// Later entries win when the same key appears twice.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>

#include "ivl/ast/ast.hpp"

namespace ivl
{

class AstContext;

/// Attributes of any node that carries them (empty span otherwise).
[[nodiscard]] gsl::span<Attribute *> attributes_of(const AstNode * node) noexcept;

[[nodiscard]] bool has_attribute(gsl::span<Attribute * const> attrs, std::string_view key) noexcept;

/// Last attribute named @p key, or nullptr.
[[nodiscard]] const Attribute * find_attribute(
  gsl::span<Attribute * const> attrs, std::string_view key) noexcept;

/**
 * Expression of the last `{:key e}` that has exactly one expression
 * parameter.
 */
[[nodiscard]] Expr * find_expr_attribute(
  gsl::span<Attribute * const> attrs, std::string_view key) noexcept;

/// String of the last `{:key "s"}` with exactly one string parameter.
[[nodiscard]] std::optional<std::string_view> find_string_attribute(
  gsl::span<Attribute * const> attrs, std::string_view key) noexcept;

/**
 * Boolean value of `{:key}` (true), `{:key true}` or `{:key false}`.
 *
 * @return nullopt when the attribute is absent or its parameter is not a
 *         boolean literal
 */
[[nodiscard]] std::optional<bool> find_bool_attribute(
  gsl::span<Attribute * const> attrs, std::string_view key) noexcept;

/// Value of `{:key N}` with an integer literal parameter.
[[nodiscard]] std::optional<int64_t> find_int_attribute(
  gsl::span<Attribute * const> attrs, std::string_view key) noexcept;

/**
 * Add a parameter-less or single-expression attribute.
 *
 * If @p key is already present, @p param is appended to its parameters;
 * otherwise a new attribute is put in front of the list.
 */
[[nodiscard]] gsl::span<Attribute *> add_attribute(
  AstContext & ctx, gsl::span<Attribute *> attrs, std::string_view key, Expr * param = nullptr);

/**
 * Whether `{:verify false}` excludes @p impl from verification.
 *
 * The procedure's attribute is read first; the implementation's own
 * `{:verify ...}` overrides it.
 */
[[nodiscard]] bool skip_verification(const ImplementationDecl & impl) noexcept;

/// `{:never_pattern}`: the function must not be used in inferred triggers.
[[nodiscard]] bool never_trigger(const FunctionDecl & fn) noexcept;

/// Custom failure message from `{:msg "..."}`, if any.
[[nodiscard]] std::optional<std::string> error_message_attribute(
  gsl::span<Attribute * const> attrs);

}  // namespace ivl
