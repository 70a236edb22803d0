// ivl/ast/attributes.cpp - Attribute queries
//
#include "ivl/ast/attributes.hpp"

#include <vector>

#include "ivl/ast/ast_context.hpp"

namespace ivl
{

gsl::span<Attribute *> attributes_of(const AstNode * node) noexcept
{
  if (node == nullptr) return {};
  if (const auto * d = dyn_cast<Decl>(node)) return d->attributes;
  if (const auto * q = dyn_cast<QuantifierExpr>(node)) return q->attributes;
  if (const auto * a = dyn_cast<AssertCmd>(node)) return a->attributes;
  if (const auto * a = dyn_cast<AssumeCmd>(node)) return a->attributes;
  if (const auto * c = dyn_cast<CallCmd>(node)) return c->attributes;
  if (const auto * r = dyn_cast<Requires>(node)) return r->attributes;
  if (const auto * e = dyn_cast<Ensures>(node)) return e->attributes;
  return {};
}

bool has_attribute(gsl::span<Attribute * const> attrs, std::string_view key) noexcept
{
  return find_attribute(attrs, key) != nullptr;
}

const Attribute * find_attribute(gsl::span<Attribute * const> attrs, std::string_view key) noexcept
{
  const Attribute * res = nullptr;
  for (const auto * a : attrs) {
    if (a->key == key) res = a;
  }
  return res;
}

Expr * find_expr_attribute(gsl::span<Attribute * const> attrs, std::string_view key) noexcept
{
  Expr * res = nullptr;
  for (const auto * a : attrs) {
    if (a->key == key && a->params.size() == 1 && !a->params[0].is_string()) {
      res = a->params[0].expr;
    }
  }
  return res;
}

std::optional<std::string_view> find_string_attribute(
  gsl::span<Attribute * const> attrs, std::string_view key) noexcept
{
  std::optional<std::string_view> res;
  for (const auto * a : attrs) {
    if (a->key == key && a->params.size() == 1 && a->params[0].is_string()) {
      res = a->params[0].str;
    }
  }
  return res;
}

std::optional<bool> find_bool_attribute(
  gsl::span<Attribute * const> attrs, std::string_view key) noexcept
{
  const Attribute * a = find_attribute(attrs, key);
  if (a == nullptr) return std::nullopt;
  if (a->params.empty()) return true;
  if (a->params.size() == 1) {
    if (const auto * lit = dyn_cast<BoolLiteralExpr>(a->params[0].expr)) {
      return lit->value;
    }
  }
  return std::nullopt;
}

std::optional<int64_t> find_int_attribute(
  gsl::span<Attribute * const> attrs, std::string_view key) noexcept
{
  Expr * e = find_expr_attribute(attrs, key);
  if (const auto * lit = dyn_cast<IntLiteralExpr>(e)) {
    return lit->value;
  }
  return std::nullopt;
}

gsl::span<Attribute *> add_attribute(
  AstContext & ctx, gsl::span<Attribute *> attrs, std::string_view key, Expr * param)
{
  for (auto * a : attrs) {
    if (a->key == key) {
      if (param != nullptr) {
        a->params = ctx.append(a->params, AttributeParam{param, {}});
      }
      return attrs;
    }
  }

  auto * attr = ctx.create<Attribute>(ctx.intern(key));
  if (param != nullptr) {
    attr->params = ctx.copy_to_arena(std::vector<AttributeParam>{AttributeParam{param, {}}});
  }
  std::vector<Attribute *> res;
  res.reserve(attrs.size() + 1);
  res.push_back(attr);
  res.insert(res.end(), attrs.begin(), attrs.end());
  return ctx.copy_to_arena(res);
}

bool skip_verification(const ImplementationDecl & impl) noexcept
{
  bool verify = true;
  if (impl.proc != nullptr) {
    verify = find_bool_attribute(impl.proc->attributes, "verify").value_or(verify);
  }
  verify = find_bool_attribute(impl.attributes, "verify").value_or(verify);
  return !verify;
}

bool never_trigger(const FunctionDecl & fn) noexcept
{
  return find_bool_attribute(fn.attributes, "never_pattern").value_or(false);
}

std::optional<std::string> error_message_attribute(gsl::span<Attribute * const> attrs)
{
  auto msg = find_string_attribute(attrs, "msg");
  if (!msg) return std::nullopt;
  return std::string(*msg);
}

}  // namespace ivl
