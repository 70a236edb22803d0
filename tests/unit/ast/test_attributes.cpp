// tests/ast/test_attributes.cpp - Unit tests for attribute queries
//

#include <gtest/gtest.h>

#include "ivl/ast/ast.hpp"
#include "ivl/ast/ast_context.hpp"
#include "ivl/ast/attributes.hpp"
#include "ivl/test_support/check_helpers.hpp"

using namespace ivl;
using ivl::test_support::parse;
using ivl::test_support::resolve;

TEST(AstAttributes, QueriesOnParsedAttributes)
{
  auto u = parse(
    "procedure {:inline 2} {:verify false} {:msg \"first\"} {:msg \"second\"} {:opaque} P();\n");
  ASSERT_TRUE(u.parsed);
  auto * p = u.find<ProcedureDecl>("P");
  ASSERT_NE(p, nullptr);

  const auto attrs = attributes_of(p);
  ASSERT_EQ(attrs.size(), 5u);
  EXPECT_TRUE(has_attribute(attrs, "opaque"));
  EXPECT_FALSE(has_attribute(attrs, "inline_all"));

  EXPECT_EQ(find_int_attribute(attrs, "inline"), 2);
  EXPECT_EQ(find_bool_attribute(attrs, "verify"), false);
  EXPECT_EQ(find_bool_attribute(attrs, "opaque"), true);
  EXPECT_FALSE(find_bool_attribute(attrs, "inline").has_value());
  EXPECT_FALSE(find_bool_attribute(attrs, "absent").has_value());

  // The last occurrence wins
  EXPECT_EQ(find_string_attribute(attrs, "msg"), "second");
  EXPECT_EQ(error_message_attribute(attrs), std::string("second"));
  EXPECT_EQ(find_expr_attribute(attrs, "msg"), nullptr);
}

TEST(AstAttributes, AttributesOfCommandsAndQuantifiers)
{
  auto u = parse(
    "axiom (forall x: int :: {:weight 3} x == x);\n"
    "procedure P();\n"
    "implementation P() { assert {:msg \"boom\"} true; assume {:partition} true; }\n");
  ASSERT_TRUE(u.parsed);

  auto * axiom = dyn_cast<AxiomDecl>(u.program()->decls[0]);
  ASSERT_NE(axiom, nullptr);
  EXPECT_EQ(find_int_attribute(attributes_of(axiom->expr), "weight"), 3);

  auto * impl = u.find<ImplementationDecl>("P");
  ASSERT_NE(impl, nullptr);
  const auto cmds = impl->blocks[0]->cmds;
  ASSERT_EQ(cmds.size(), 2u);
  EXPECT_EQ(error_message_attribute(attributes_of(cmds[0])), std::string("boom"));
  EXPECT_TRUE(has_attribute(attributes_of(cmds[1]), "partition"));

  // Nodes without attributes yield an empty span
  EXPECT_TRUE(attributes_of(impl->blocks[0]).empty());
  EXPECT_TRUE(attributes_of(nullptr).empty());
}

TEST(AstAttributes, AddAttributePrependsOrExtends)
{
  AstContext ctx;
  gsl::span<Attribute *> attrs;

  attrs = add_attribute(ctx, attrs, "inline", ctx.create<IntLiteralExpr>(1));
  ASSERT_EQ(attrs.size(), 1u);
  EXPECT_EQ(find_int_attribute(attrs, "inline"), 1);

  attrs = add_attribute(ctx, attrs, "opaque");
  ASSERT_EQ(attrs.size(), 2u);
  EXPECT_EQ(attrs[0]->key, "opaque");
  EXPECT_TRUE(attrs[0]->params.empty());

  // Existing key: the parameter is appended, no new attribute
  attrs = add_attribute(ctx, attrs, "inline", ctx.create<IntLiteralExpr>(2));
  ASSERT_EQ(attrs.size(), 2u);
  const Attribute * inl = find_attribute(attrs, "inline");
  ASSERT_NE(inl, nullptr);
  EXPECT_EQ(inl->params.size(), 2u);
  // Two parameters are no longer a single integer value
  EXPECT_FALSE(find_int_attribute(attrs, "inline").has_value());
}

TEST(AstAttributes, VerifyFalseOnProcedureOrImplementation)
{
  auto u = resolve(
    "procedure {:verify false} P();\n"
    "implementation P() { }\n"
    "procedure Q();\n"
    "implementation {:verify false} Q() { }\n"
    "procedure {:verify false} R();\n"
    "implementation {:verify true} R() { }\n"
    "procedure S();\n"
    "implementation S() { }\n");
  ASSERT_TRUE(u.resolved);

  EXPECT_TRUE(skip_verification(*u.find<ImplementationDecl>("P")));
  EXPECT_TRUE(skip_verification(*u.find<ImplementationDecl>("Q")));
  // The implementation's own setting overrides its procedure's
  EXPECT_FALSE(skip_verification(*u.find<ImplementationDecl>("R")));
  EXPECT_FALSE(skip_verification(*u.find<ImplementationDecl>("S")));
}

TEST(AstAttributes, NeverPatternFunctions)
{
  auto u = parse(
    "function {:never_pattern} f(x: int) returns (int);\n"
    "function {:never_pattern false} g(x: int) returns (int);\n"
    "function h(x: int) returns (int);\n");
  ASSERT_TRUE(u.parsed);
  EXPECT_TRUE(never_trigger(*u.find<FunctionDecl>("f")));
  EXPECT_FALSE(never_trigger(*u.find<FunctionDecl>("g")));
  EXPECT_FALSE(never_trigger(*u.find<FunctionDecl>("h")));
}
