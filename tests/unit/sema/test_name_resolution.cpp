// tests/sema/test_name_resolution.cpp - Unit tests for name resolution
//
// Tests NameResolver: binding of identifiers, types, labels and callees,
// namespace conflicts, synonym cycles and the overlook mode.
//

#include <gtest/gtest.h>

#include <string>

#include "ivl/ast/ast.hpp"
#include "ivl/basic/casting.hpp"
#include "ivl/sema/types/type.hpp"
#include "ivl/test_support/check_helpers.hpp"

using namespace ivl;
using ivl::test_support::check;
using ivl::test_support::resolve;

namespace
{

/// First command of kind T in any block of @p impl.
template <typename T>
T * first_cmd(ImplementationDecl * impl)
{
  for (auto * block : impl->blocks) {
    for (auto * cmd : block->cmds) {
      if (auto * c = dyn_cast<T>(cmd)) return c;
    }
  }
  return nullptr;
}

}  // namespace

// ============================================================================
// Constants
// ============================================================================

TEST(SemaNameResolution, UniqueConstantWithoutParents)
{
  auto u = resolve("const unique c: int;");
  ASSERT_TRUE(u.parsed);
  EXPECT_TRUE(u.resolved);
  EXPECT_EQ(u.diags().error_count(), 0u);

  auto * c = u.find<ConstantDecl>("c");
  ASSERT_NE(c, nullptr);
  EXPECT_TRUE(c->unique);
  EXPECT_FALSE(c->parents.has_value());
  EXPECT_TRUE(is_int(c->type));
}

TEST(SemaNameResolution, ConstantParentsAreBound)
{
  auto u = resolve(
    "type T;\n"
    "const unique root: T;\n"
    "const unique child: T extends unique root complete;\n");
  ASSERT_TRUE(u.resolved);

  auto * root = u.find<ConstantDecl>("root");
  auto * child = u.find<ConstantDecl>("child");
  ASSERT_NE(child, nullptr);
  ASSERT_TRUE(child->parents.has_value());
  ASSERT_EQ(child->parents->size(), 1u);
  EXPECT_EQ((*child->parents)[0].parent->decl, root);
  EXPECT_TRUE((*child->parents)[0].unique);
  EXPECT_TRUE(child->childrenComplete);
}

// ============================================================================
// Identifiers and namespaces
// ============================================================================

TEST(SemaNameResolution, UndeclaredNames)
{
  auto u = resolve(
    "var x: Missing;\n"
    "axiom y > 0;\n"
    "axiom g(1);\n");
  EXPECT_FALSE(u.resolved);
  EXPECT_TRUE(u.has_error_containing("undeclared type: Missing"));
  EXPECT_TRUE(u.has_error_containing("undeclared identifier: y"));
  EXPECT_TRUE(u.has_error_containing("undeclared function or procedure: g"));
}

TEST(SemaNameResolution, DeclarationOrderDoesNotMatter)
{
  auto u = resolve(
    "axiom f(x) == x;\n"
    "function f(a: T) returns (T);\n"
    "const x: T;\n"
    "type T;\n");
  EXPECT_TRUE(u.resolved);
  EXPECT_EQ(u.diags().error_count(), 0u);
}

TEST(SemaNameResolution, DuplicateVariableReplacesEarlierBinding)
{
  auto u = resolve(
    "const x: int;\n"
    "const x: bool;\n"
    "axiom x;\n");
  EXPECT_FALSE(u.resolved);
  ASSERT_EQ(u.diags().error_count(), 1u);

  const auto errors = u.diags().errors();
  const auto & err = errors.front();
  EXPECT_EQ(err.message, "duplicate declaration of variable: x");
  ASSERT_EQ(err.labels.size(), 2u);
  EXPECT_EQ(err.labels[1].message, "previous declaration is here");

  // The later declaration wins
  auto * axiom = dyn_cast<AxiomDecl>(u.program()->decls[2]);
  ASSERT_NE(axiom, nullptr);
  auto * id = dyn_cast<IdentifierExpr>(axiom->expr);
  ASSERT_NE(id, nullptr);
  EXPECT_EQ(id->decl, u.program()->decls[1]);
}

TEST(SemaNameResolution, DuplicateTypeAndCallableNames)
{
  auto u = resolve(
    "type T;\n"
    "type T = int;\n"
    "function f() returns (int);\n"
    "procedure f();\n");
  EXPECT_TRUE(u.has_error_containing("more than one declaration of type name: T"));
  EXPECT_TRUE(u.has_error_containing("more than one declaration of function/procedure name: f"));
}

TEST(SemaNameResolution, LocalsShadowGlobals)
{
  auto u = resolve(
    "var x: int;\n"
    "procedure P();\n"
    "implementation P() { var x: bool; x := true; }\n");
  ASSERT_TRUE(u.resolved);

  auto * impl = u.find<ImplementationDecl>("P");
  ASSERT_NE(impl, nullptr);
  ASSERT_EQ(impl->locals.size(), 1u);
  auto * assign = first_cmd<AssignCmd>(impl);
  ASSERT_NE(assign, nullptr);
  EXPECT_EQ(assign->lhss[0]->deep_assigned_identifier()->decl, impl->locals[0]);
}

TEST(SemaNameResolution, GlobalsNotAllowedInFunctionBodies)
{
  auto u = resolve(
    "var g: int;\n"
    "const c: int;\n"
    "function f() returns (int) { g + c }\n");
  EXPECT_TRUE(u.has_error_containing("cannot refer to a global variable in this context: g"));
  EXPECT_EQ(u.diags().error_count(), 1u);
}

TEST(SemaNameResolution, OldOnlyInTwoStateContexts)
{
  auto u = resolve("var g: int;\naxiom old(g) == g;\n");
  EXPECT_TRUE(u.has_error_containing("old expressions allowed only in two-state contexts"));

  auto ok = resolve(
    "var g: int;\n"
    "procedure P();\n"
    "  modifies g;\n"
    "  ensures g == old(g) + 1;\n");
  EXPECT_TRUE(ok.resolved);
}

TEST(SemaNameResolution, CalleeKindsAreChecked)
{
  auto u = resolve(
    "function f(x: int) returns (int);\n"
    "procedure P();\n"
    "axiom P() == 1;\n"
    "implementation P() { call f(1); }\n");
  EXPECT_TRUE(u.has_error_containing("procedure cannot be called in an expression: P"));
  EXPECT_TRUE(u.has_error_containing("call to function, not procedure: f"));
}

TEST(SemaNameResolution, CallBindsProcedure)
{
  auto u = resolve(
    "procedure Q(x: int) returns (y: int);\n"
    "procedure P();\n"
    "implementation P() { var r: int; call r := Q(1); }\n");
  ASSERT_TRUE(u.resolved);
  auto * call = first_cmd<CallCmd>(u.find<ImplementationDecl>("P"));
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->proc, u.find<ProcedureDecl>("Q"));
}

TEST(SemaNameResolution, ParallelAssignmentTargetsMustDiffer)
{
  auto u = resolve(
    "procedure P();\n"
    "implementation P() { var a: int; a, a := 1, 2; }\n");
  EXPECT_TRUE(u.has_error_containing("variable a is assigned more than once in parallel assignment"));
}

// ============================================================================
// Types
// ============================================================================

TEST(SemaNameResolution, SynonymCycleIsBrokenWithBool)
{
  auto u = resolve(
    "type A = B;\n"
    "type B = A;\n"
    "var x: A;\n");
  EXPECT_FALSE(u.resolved);
  EXPECT_EQ(u.diags().error_count(), 2u);
  EXPECT_TRUE(u.has_error_containing(
    "type synonym could not be resolved because of cycles: A (replacing body with \"bool\" to "
    "continue resolving)"));
  EXPECT_TRUE(u.has_error_containing("type synonym could not be resolved because of cycles: B"));

  auto * a = u.find<TypeSynonymDecl>("A");
  auto * b = u.find<TypeSynonymDecl>("B");
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  EXPECT_TRUE(is_bool(a->body));
  EXPECT_TRUE(is_bool(b->body));

  // No proxy or unresolved identifier survives
  auto * x = u.find<GlobalVarDecl>("x");
  ASSERT_NE(x, nullptr);
  EXPECT_TRUE(is_bool(x->type));
  EXPECT_TRUE(free_proxies(x->type).empty());
}

TEST(SemaNameResolution, SynonymsExpandWithArguments)
{
  auto u = resolve(
    "type Set a = [a]bool;\n"
    "type IntSet = Set int;\n"
    "const s: IntSet;\n"
    "axiom s[3];\n");
  ASSERT_TRUE(u.resolved);
  auto * s = u.find<ConstantDecl>("s");
  ASSERT_NE(s, nullptr);
  EXPECT_TRUE(is_map(s->type));
  EXPECT_EQ(to_string(expanded(s->type)), "[int]bool");
}

TEST(SemaNameResolution, TypeArityIsChecked)
{
  auto u = resolve(
    "type C a;\n"
    "type S a = a;\n"
    "var x: C;\n"
    "var y: S int bool;\n");
  EXPECT_TRUE(u.has_error_containing("type constructor received wrong number of arguments: C"));
  EXPECT_TRUE(u.has_error_containing("type synonym received wrong number of arguments: S"));
}

TEST(SemaNameResolution, TypeParametersAreSortedByOccurrence)
{
  auto u = resolve("function f<a, b>(x: b, y: a) returns (bool);");
  ASSERT_TRUE(u.resolved);
  auto * f = u.find<FunctionDecl>("f");
  ASSERT_NE(f, nullptr);
  ASSERT_EQ(f->typeParams.size(), 2u);
  EXPECT_EQ(f->typeParams[0]->name, "b");
  EXPECT_EQ(f->typeParams[1]->name, "a");
}

TEST(SemaNameResolution, TypeParameterMustOccurInSignature)
{
  auto u = resolve("function f<T>(x: int) returns (int);");
  EXPECT_TRUE(u.has_error_containing("type variable must occur in function arguments: T"));

  auto only_result = resolve("function g<T>() returns (T);");
  EXPECT_TRUE(only_result.resolved);
  auto * g = only_result.find<FunctionDecl>("g");
  ASSERT_NE(g, nullptr);
  EXPECT_TRUE(g->typeParamsOnlyInOutputs);
}

TEST(SemaNameResolution, DuplicateTypeParameters)
{
  auto fn = resolve("function f<T, T>(x: T) returns (bool);");
  EXPECT_FALSE(fn.resolved);
  EXPECT_TRUE(fn.has_error_containing("more than one declaration of type variable: T"));

  auto proc = resolve("procedure P<a, a>(x: a);");
  EXPECT_FALSE(proc.resolved);
  EXPECT_TRUE(proc.has_error_containing("more than one declaration of type variable: a"));

  auto map = resolve("var m: <a, a>[a]int;");
  EXPECT_FALSE(map.resolved);
  EXPECT_TRUE(map.has_error_containing("more than one declaration of type variable: a"));

  auto quant = resolve("axiom (forall<a, a> x: a :: x == x);");
  EXPECT_FALSE(quant.resolved);
  EXPECT_TRUE(quant.has_error_containing("more than one declaration of type variable: a"));
}

TEST(SemaNameResolution, NestedBindersMayReuseNames)
{
  auto u = resolve("function f<a>(m: <a>[a]int, x: a) returns (bool);");
  EXPECT_TRUE(u.resolved);
  EXPECT_EQ(u.diags().error_count(), 0u);
}

TEST(SemaNameResolution, TypeParameterMustNotNameAType)
{
  auto u = resolve(
    "type T;\n"
    "function f<T>(x: T) returns (bool);\n");
  EXPECT_FALSE(u.resolved);
  EXPECT_TRUE(u.has_error_containing("type variable has the same name as a declared type: T"));
}

TEST(SemaNameResolution, QuantifierTypeParametersMustOccur)
{
  auto u = resolve("axiom (forall<T> x: int :: true);");
  EXPECT_TRUE(u.has_error_containing(
    "the type variable T does not occur in types of the quantified variables"));
}

// ============================================================================
// Implementations and labels
// ============================================================================

TEST(SemaNameResolution, ImplementationNeedsProcedure)
{
  auto u = resolve(
    "function f() returns (int);\n"
    "implementation Q() { }\n"
    "implementation f() { }\n");
  EXPECT_TRUE(u.has_error_containing("implementation given for undeclared procedure: Q"));
  EXPECT_TRUE(u.has_error_containing("implementations given for function, not procedure: f"));
}

TEST(SemaNameResolution, GotoLabelsAreBound)
{
  auto u = resolve(
    "procedure P();\n"
    "implementation P() { A: goto B; B: return; }\n");
  ASSERT_TRUE(u.resolved);
  auto * impl = u.find<ImplementationDecl>("P");
  ASSERT_EQ(impl->blocks.size(), 2u);
  auto * jump = dyn_cast<GotoCmd>(impl->blocks[0]->transfer);
  ASSERT_NE(jump, nullptr);
  ASSERT_EQ(jump->targets.size(), 1u);
  EXPECT_EQ(jump->targets[0], impl->blocks[1]);
}

TEST(SemaNameResolution, LabelErrors)
{
  auto u = resolve(
    "procedure P();\n"
    "implementation P() { A: goto L; A: return; }\n");
  EXPECT_TRUE(u.has_error_containing("no such label: L"));
  EXPECT_TRUE(u.has_error_containing("more than one declaration of label: A"));
}

// ============================================================================
// Overlook mode
// ============================================================================

TEST(SemaNameResolution, OverlookModeDropsFailingImplementations)
{
  const std::string src =
    "procedure P();\n"
    "implementation P() { x := 1; }\n"
    "procedure Q();\n"
    "implementation Q() { }\n";

  auto strict = resolve(src);
  EXPECT_FALSE(strict.resolved);
  EXPECT_TRUE(strict.has_error_containing("undeclared identifier: x"));

  ResolveOptions options;
  options.overlookTypeErrors = true;
  auto lenient = check(src, options);
  EXPECT_TRUE(lenient.resolved);
  EXPECT_TRUE(lenient.typechecked);
  EXPECT_EQ(lenient.diags().error_count(), 0u);
  EXPECT_TRUE(lenient.has_warning_containing("undeclared identifier: x"));
  EXPECT_TRUE(lenient.has_warning_containing("Ignoring implementation P"));

  EXPECT_NE(lenient.find<ProcedureDecl>("P"), nullptr);
  EXPECT_EQ(lenient.find<ImplementationDecl>("P"), nullptr);
  EXPECT_NE(lenient.find<ImplementationDecl>("Q"), nullptr);
}

TEST(SemaNameResolution, OverlookModeKeepsDeclarationErrors)
{
  ResolveOptions options;
  options.overlookTypeErrors = true;
  auto u = resolve("axiom y;", options);
  EXPECT_FALSE(u.resolved);
  EXPECT_TRUE(u.has_error_containing("undeclared identifier: y"));
}

// ============================================================================
// Mutability (checked after resolution)
// ============================================================================

TEST(SemaNameResolution, ImmutableTargetsAreRejected)
{
  auto u = check(
    "const c: int;\n"
    "procedure P(a: int);\n"
    "implementation P(a: int) { a := 1; havoc c; }\n");
  ASSERT_TRUE(u.resolved);
  EXPECT_TRUE(u.has_error_containing("command assigns to an immutable variable: a"));
  EXPECT_TRUE(u.has_error_containing("command assigns to an immutable variable: c"));
}
