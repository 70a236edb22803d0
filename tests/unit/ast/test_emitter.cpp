// tests/ast/test_emitter.cpp - Unit tests for the concrete syntax printer
//
// Exact layout for small programs, minimal parenthesization, and
// emit -> parse -> emit stability for larger ones.
//

#include <gtest/gtest.h>

#include <string>

#include "ivl/ast/emitter.hpp"
#include "ivl/syntax/frontend.hpp"
#include "ivl/test_support/check_helpers.hpp"

using namespace ivl;
using ivl::test_support::check;
using ivl::test_support::parse;

namespace
{

std::string reprint_expr(std::string_view text)
{
  AstContext ast;
  TypeContext types;
  DiagnosticBag diags;
  Expr * e = parse_expression(text, ast, types, diags);
  EXPECT_FALSE(diags.has_errors()) << text;
  return to_source(e);
}

/// Emit, parse the emitted text, emit again: both texts must agree.
void expect_stable(const std::string & src)
{
  auto first = check(src);
  ASSERT_TRUE(first.typechecked) << src;
  const std::string once = to_source(*first.program());

  auto second = check(once);
  ASSERT_TRUE(second.typechecked) << once;
  EXPECT_EQ(to_source(*second.program()), once);
}

}  // namespace

// ============================================================================
// Layout
// ============================================================================

TEST(AstEmitter, DeclarationLayout)
{
  auto u = parse(
    "var g: int;\n"
    "procedure P(x: int) returns (y: int);\n"
    "  requires x > 0;\n"
    "  modifies g;\n"
    "implementation P(x: int) returns (y: int) { var t: int; t := x + 1; y := t * 2; }\n");
  ASSERT_TRUE(u.parsed);

  const std::string expected =
    "var g: int;\n"
    "\n"
    "procedure P(x: int) returns (y: int);\n"
    "  requires x > 0;\n"
    "  modifies g;\n"
    "\n"
    "implementation P(x: int) returns (y: int)\n"
    "{\n"
    "  var t: int;\n"
    "\n"
    "  anon0:\n"
    "    t := x + 1;\n"
    "    y := t * 2;\n"
    "    return;\n"
    "}\n";
  EXPECT_EQ(to_source(*u.program()), expected);
}

TEST(AstEmitter, FunctionsConstantsAndTypes)
{
  auto u = parse(
    "type {:datatype} List a;\n"
    "type Set a = [a]bool;\n"
    "const unique c: int extends unique p, q complete;\n"
    "function {:inline} inc(x: int) returns (int) { x + 1 }\n"
    "function low(bv16): bv8;\n"
    "axiom {:msg \"positive\"} inc(0) > 0;\n");
  ASSERT_TRUE(u.parsed);

  const std::string expected =
    "type {:datatype} List a;\n"
    "\n"
    "type Set a = [a]bool;\n"
    "\n"
    "const unique c: int extends unique p, q complete;\n"
    "\n"
    "function {:inline} inc(x: int) returns (int)\n"
    "{\n"
    "  x + 1\n"
    "}\n"
    "\n"
    "function low(bv16) returns (bv8);\n"
    "\n"
    "axiom {:msg \"positive\"} inc(0) > 0;\n";
  EXPECT_EQ(to_source(*u.program()), expected);
}

TEST(AstEmitter, CommandsAndTransfers)
{
  auto u = parse(
    "procedure P();\n"
    "implementation P() {\n"
    "  var m: [int]int;\n"
    "  var a, b: int;\n"
    "  L: m[1] := 2; call a, b := Q(m[1]); havoc a; goto L, M;\n"
    "  M: assert {:msg \"x\"} a == b; assume true;\n"
    "}\n");
  ASSERT_TRUE(u.parsed);

  const std::string expected =
    "procedure P();\n"
    "\n"
    "implementation P()\n"
    "{\n"
    "  var m: [int]int;\n"
    "  var a: int;\n"
    "  var b: int;\n"
    "\n"
    "  L:\n"
    "    m[1] := 2;\n"
    "    call a, b := Q(m[1]);\n"
    "    havoc a;\n"
    "    goto L, M;\n"
    "\n"
    "  M:\n"
    "    assert {:msg \"x\"} a == b;\n"
    "    assume true;\n"
    "    return;\n"
    "}\n";
  EXPECT_EQ(to_source(*u.program()), expected);
}

// ============================================================================
// Parenthesization
// ============================================================================

TEST(AstEmitter, MinimalParentheses)
{
  EXPECT_EQ(reprint_expr("((1 + 2)) * 3"), "(1 + 2) * 3");
  EXPECT_EQ(reprint_expr("(1 - 2) - 3"), "1 - 2 - 3");
  EXPECT_EQ(reprint_expr("1 - (2 - 3)"), "1 - (2 - 3)");
  EXPECT_EQ(reprint_expr("a ==> (b ==> c)"), "a ==> b ==> c");
  EXPECT_EQ(reprint_expr("(a ==> b) ==> c"), "(a ==> b) ==> c");
  EXPECT_EQ(reprint_expr("!(a && b)"), "!(a && b)");
  EXPECT_EQ(reprint_expr("-x[3:1]"), "-x[3:1]");
}

TEST(AstEmitter, LogicalChainsAndRelations)
{
  EXPECT_EQ(reprint_expr("(a && b) && c"), "a && b && c");
  EXPECT_EQ(reprint_expr("(a && b) || c"), "(a && b) || c");
  EXPECT_EQ(reprint_expr("a || (b && c)"), "a || (b && c)");
  EXPECT_EQ(reprint_expr("(x < y) == b"), "(x < y) == b");
  EXPECT_EQ(reprint_expr("(a <==> b) <==> c"), "a <==> b <==> c");
}

TEST(AstEmitter, IfThenElseAndQuantifiers)
{
  EXPECT_EQ(reprint_expr("(if b then 1 else 2) + 3"), "(if b then 1 else 2) + 3");
  EXPECT_EQ(reprint_expr("if b then 1 else 2 + 3"), "if b then 1 else 2 + 3");
  EXPECT_EQ(
    reprint_expr("(forall<T> x: T :: {:weight 1} {f(x)} f(x) == x)"),
    "(forall<T> x: T :: {:weight 1} { f(x) } f(x) == x)");
  EXPECT_EQ(reprint_expr("(exists i: int :: i > 0) && p"), "(exists i: int :: i > 0) && p");
  EXPECT_EQ(reprint_expr("m[1 := old(x)][2]"), "m[1 := old(x)][2]");
  EXPECT_EQ(reprint_expr("0bv8 ++ x[4:0]"), "0bv8 ++ x[4:0]");
}

// ============================================================================
// Round trip
// ============================================================================

TEST(AstEmitter, RoundTripHeapProgram)
{
  expect_stable(
    "type Ref;\n"
    "type Field a;\n"
    "var Heap: <a>[Ref, Field a]a;\n"
    "const unique alloc: Field bool;\n"
    "const unique root: Ref;\n"
    "const unique child: Ref extends unique root complete;\n"
    "function low(x: bv16) returns (bv8) { x[8:0] }\n"
    "procedure Update(r: Ref, v: bv16) returns (b: bv8);\n"
    "  modifies Heap;\n"
    "  ensures b == low(v);\n"
    "implementation Update(r: Ref, v: bv16) returns (b: bv8) {\n"
    "  Heap[r, alloc] := true;\n"
    "  b := low(v);\n"
    "}\n");
}

TEST(AstEmitter, RoundTripStructuredBody)
{
  expect_stable(
    "procedure Sum(n: int) returns (s: int);\n"
    "  requires n >= 0;\n"
    "  ensures s >= 0;\n"
    "implementation Sum(n: int) returns (s: int) {\n"
    "  var i: int;\n"
    "  i := 0; s := 0;\n"
    "  while (i < n) invariant s >= 0; {\n"
    "    if (i mod 2 == 0) { s := s + i; } else { s := s + 1; }\n"
    "    i := i + 1;\n"
    "  }\n"
    "}\n");
}

TEST(AstEmitter, EmittedTextParsesBackToSameText)
{
  // Already in canonical form: emitting once reproduces the input
  const std::string canonical =
    "function f<T>(x: T) returns (T)\n"
    "{\n"
    "  x\n"
    "}\n"
    "\n"
    "axiom (forall i: int :: f(i) == i);\n";
  auto u = check(canonical);
  ASSERT_TRUE(u.typechecked);
  EXPECT_EQ(to_source(*u.program()), canonical);
}
