// tests/types/test_type_checker.cpp - Unit tests for type checker
//
// Runs parse + name resolution + type checking on small programs and
// inspects the inferred types and the reported diagnostics.
//

#include <gtest/gtest.h>

#include <string>

#include "ivl/ast/ast.hpp"
#include "ivl/basic/internal_error.hpp"
#include "ivl/sema/types/type.hpp"
#include "ivl/sema/types/type_checker.hpp"
#include "ivl/test_support/check_helpers.hpp"

using namespace ivl;
using ivl::test_support::check;
using ivl::test_support::parse;

// ============================================================================
// Declarations
// ============================================================================

TEST(TypesChecker, PolymorphicIdentityFunction)
{
  auto u = check("function f<T>(x: T) returns (T) { x }");
  ASSERT_TRUE(u.resolved);
  EXPECT_TRUE(u.typechecked);
  EXPECT_EQ(u.diags().error_count(), 0u);

  auto * f = u.find<FunctionDecl>("f");
  ASSERT_NE(f, nullptr);
  ASSERT_EQ(f->typeParams.size(), 1u);
  ASSERT_NE(f->body, nullptr);
  EXPECT_EQ(follow_proxy(f->body->type), f->typeParams[0]);
}

TEST(TypesChecker, OutParameterMismatchReportedOnce)
{
  auto u = check(
    "procedure P() returns (r: int);\n"
    "implementation P() returns (r: bool) { r := true; }\n");
  ASSERT_TRUE(u.resolved);
  EXPECT_FALSE(u.typechecked);
  ASSERT_EQ(u.diags().error_count(), 1u);
  EXPECT_EQ(
    u.diags().errors().front().message, "mismatched type of out-parameter in implementation P: r");
}

TEST(TypesChecker, InParameterMismatchMentionsBothNames)
{
  auto u = check(
    "procedure P(a: int);\n"
    "implementation P(b: bool) { }\n");
  ASSERT_TRUE(u.resolved);
  EXPECT_TRUE(u.has_error_containing("mismatched type of in-parameter in implementation P: a (named b"));
}

TEST(TypesChecker, ImplementationTypeParametersMatchUpToRenaming)
{
  auto u = check(
    "procedure P<a>(x: a) returns (y: a);\n"
    "implementation P<b>(x: b) returns (y: b) { y := x; }\n");
  EXPECT_TRUE(u.typechecked);
  EXPECT_EQ(u.diags().error_count(), 0u);
}

TEST(TypesChecker, AxiomMustBeBool)
{
  auto u = check("axiom 1 + 2;");
  EXPECT_FALSE(u.typechecked);
  EXPECT_TRUE(u.has_error_containing("axioms must be of type bool"));
}

TEST(TypesChecker, FunctionBodyMustMatchResult)
{
  auto u = check("function f(x: int) returns (bool) { x + 1 }");
  EXPECT_FALSE(u.typechecked);
  EXPECT_TRUE(u.has_error_containing("function body with invalid type: int (expected: bool)"));
}

TEST(TypesChecker, ConstantParentsAreChecked)
{
  auto u = check(
    "const a: int;\n"
    "const b: bool;\n"
    "const c: int extends a, b;\n"
    "const d: int extends d;\n");
  EXPECT_TRUE(u.has_error_containing("parent of constant has incompatible type (bool instead of int)"));
  EXPECT_TRUE(u.has_error_containing("a constant cannot be a parent of itself: d"));
}

TEST(TypesChecker, RequiresTypeCheckedProgram)
{
  auto u = parse("var x: int;");
  ASSERT_TRUE(u.parsed);
  TypeChecker checker(u.types(), &u.diags());
  EXPECT_THROW((void)checker.check(*u.program()), InternalError);
}

// ============================================================================
// Expressions
// ============================================================================

TEST(TypesChecker, ArithmeticAndRelations)
{
  auto u = check(
    "const x: int;\n"
    "const b: bool;\n"
    "axiom x + 1 < x * 2 && !b;\n"
    "axiom x == b;\n");
  EXPECT_FALSE(u.typechecked);
  EXPECT_EQ(u.diags().error_count(), 1u);
  EXPECT_TRUE(u.has_error_containing("invalid argument types (int and bool) to binary operator =="));
}

TEST(TypesChecker, SubtypeRejectsBool)
{
  auto u = check(
    "type T;\n"
    "const a: T;\n"
    "const b: T;\n"
    "axiom a <: b;\n"
    "axiom true <: false;\n");
  EXPECT_EQ(u.diags().error_count(), 1u);
  EXPECT_TRUE(u.has_error_containing("to binary operator <:"));
}

TEST(TypesChecker, ConcatAndExtractWidths)
{
  auto u = check(
    "const lo: bv8;\n"
    "const hi: bv8;\n"
    "function join(a: bv8, b: bv8) returns (bv16) { a ++ b }\n"
    "axiom (hi ++ lo)[12:4] == 0bv8;\n");
  EXPECT_TRUE(u.typechecked);
  EXPECT_EQ(u.diags().error_count(), 0u);

  auto * join = u.find<FunctionDecl>("join");
  ASSERT_NE(join, nullptr);
  EXPECT_EQ(to_string(join->body->type), "bv16");
}

TEST(TypesChecker, ExtractBeyondWidthIsRejected)
{
  auto u = check("const x: bv4;\naxiom x[8:0] == 0bv8;\n");
  EXPECT_TRUE(u.has_error_containing("extract operand must be a bitvector of at least 8 bits"));
}

TEST(TypesChecker, ConcatOfIntIsRejected)
{
  auto u = check("const x: int;\naxiom x ++ x == x;\n");
  EXPECT_TRUE(u.has_error_containing("++ operands need to be bitvectors"));
}

TEST(TypesChecker, PolymorphicMapSelectInstantiates)
{
  auto u = check(
    "type Ref;\n"
    "type Field a;\n"
    "const Heap: <a>[Ref, Field a]a;\n"
    "const r: Ref;\n"
    "const f: Field int;\n"
    "const g: Field bool;\n"
    "axiom Heap[r, f] > 0 && Heap[r, g];\n");
  EXPECT_TRUE(u.typechecked);
  EXPECT_EQ(u.diags().error_count(), 0u);
}

TEST(TypesChecker, MapSelectArityAndKind)
{
  auto u = check(
    "const m: [int]bool;\n"
    "const x: int;\n"
    "axiom m[1, 2];\n"
    "axiom x[1] == 0;\n");
  EXPECT_TRUE(u.has_error_containing("wrong number of arguments in map select: 2 instead of 1"));
  EXPECT_TRUE(u.has_error_containing("map type expected in map select, got: int"));
}

TEST(TypesChecker, MapStoreValueMustMatch)
{
  auto u = check("const m: [int]bool;\naxiom m[1 := 5] == m;\n");
  EXPECT_TRUE(u.has_error_containing("right-hand side in map store with wrong type: int (expected: bool)"));
}

TEST(TypesChecker, IfThenElseBranchesMustAgree)
{
  auto u = check("axiom (if true then 1 else false) == 1;\naxiom (if 1 then true else false);\n");
  EXPECT_TRUE(u.has_error_containing("branches of if-then-else have incompatible types int and bool"));
  EXPECT_TRUE(u.has_error_containing("the first argument to if-then-else should be bool, not int"));
}

TEST(TypesChecker, QuantifierBodyMustBeBool)
{
  auto u = check("axiom (forall i: int :: i + 1);");
  EXPECT_TRUE(u.has_error_containing("quantifier body must be of type bool"));
}

TEST(TypesChecker, FunctionArgumentTypes)
{
  auto u = check("function f(x: int) returns (int);\naxiom f(true) == 1;\naxiom f(1, 2) == 1;\n");
  EXPECT_TRUE(u.has_error_containing("invalid type for argument 0 in application of f: bool (expected: int)"));
  EXPECT_TRUE(u.has_error_containing("wrong number of arguments in application of f: 2"));
}

TEST(TypesChecker, AmbiguousInstantiationIsReported)
{
  auto u = check("function f<T>() returns (T);\naxiom f() == f();\n");
  ASSERT_TRUE(u.resolved);
  EXPECT_FALSE(u.typechecked);
  EXPECT_TRUE(u.has_error_containing("is ambiguous"));
}

TEST(TypesChecker, AmbiguityResolvedByContext)
{
  auto u = check("function f<T>() returns (T);\naxiom f() == 1;\n");
  EXPECT_TRUE(u.typechecked);
  EXPECT_EQ(u.diags().error_count(), 0u);
}

TEST(TypesChecker, IgnoredDeclarationsAreSkipped)
{
  auto u = check("axiom {:ignore} 1 + 1;");
  EXPECT_TRUE(u.typechecked);
  EXPECT_EQ(u.diags().error_count(), 0u);
}

// ============================================================================
// Commands
// ============================================================================

TEST(TypesChecker, AssignmentTypes)
{
  auto u = check(
    "procedure P() returns (r: int);\n"
    "implementation P() returns (r: int) { var b: bool; r := 1; b := r; }\n");
  EXPECT_TRUE(u.has_error_containing("mismatched types in assignment command (cannot assign int to bool)"));
}

TEST(TypesChecker, AssertAndAssumeMustBeBool)
{
  auto u = check(
    "procedure P();\n"
    "implementation P() { assert 1; assume 2; }\n");
  EXPECT_TRUE(u.has_error_containing("an asserted expression must be of type bool (instead of int)"));
  EXPECT_TRUE(u.has_error_containing("an assumed expression must be of type bool (instead of int)"));
}

TEST(TypesChecker, GlobalAssignmentRequiresModifies)
{
  auto bad = check(
    "var g: int;\n"
    "procedure P();\n"
    "implementation P() { g := 1; }\n");
  EXPECT_TRUE(bad.has_error_containing(
    "command assigns to a global variable that is not in the enclosing procedure's modifies clause: g"));

  auto good = check(
    "var g: int;\n"
    "procedure P();\n"
    "  modifies g;\n"
    "implementation P() { g := 1; havoc g; }\n");
  EXPECT_TRUE(good.typechecked);
  EXPECT_EQ(good.diags().error_count(), 0u);
}

TEST(TypesChecker, ModifiesMayNotListConstants)
{
  auto u = check("const c: int;\nprocedure P();\n  modifies c;\n");
  EXPECT_TRUE(u.has_error_containing("modifies list contains constant: c"));
}

TEST(TypesChecker, CallArgumentsAndResults)
{
  auto u = check(
    "procedure Q(x: int) returns (y: bool);\n"
    "procedure P();\n"
    "implementation P() { var b: bool; var i: int; call b := Q(1); call i := Q(1); }\n");
  EXPECT_EQ(u.diags().error_count(), 1u);
  EXPECT_TRUE(u.has_error_containing("invalid type for out-parameter 0 in call to Q: int (expected: bool)"));
}

TEST(TypesChecker, PolymorphicCallRecordsTypeArguments)
{
  auto u = check(
    "procedure Id<a>(x: a) returns (y: a);\n"
    "procedure P();\n"
    "implementation P() { var i: int; call i := Id(3); }\n");
  ASSERT_TRUE(u.typechecked);

  auto * impl = u.find<ImplementationDecl>("P");
  ASSERT_NE(impl, nullptr);
  CallCmd * call = nullptr;
  for (auto * block : impl->blocks) {
    for (auto * cmd : block->cmds) {
      if (auto * c = dyn_cast<CallCmd>(cmd)) call = c;
    }
  }
  ASSERT_NE(call, nullptr);
  ASSERT_EQ(call->typeArgs.size(), 1u);
  EXPECT_TRUE(is_int(call->typeArgs[0]));
}
