// tests/syntax/test_parser.cpp - Unit tests for the recursive-descent parser
//
// Checks declaration shapes, operator precedence, syntax errors and the
// lowering of structured statements into blocks.
//

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ivl/ast/ast.hpp"
#include "ivl/basic/casting.hpp"
#include "ivl/syntax/frontend.hpp"
#include "ivl/test_support/check_helpers.hpp"

using namespace ivl;
using ivl::test_support::parse;

namespace
{

std::vector<std::string> labels_of(const ImplementationDecl * impl)
{
  std::vector<std::string> out;
  for (const auto * b : impl->blocks) {
    out.emplace_back(b->label);
  }
  return out;
}

std::vector<std::string> goto_targets(const Block * b)
{
  std::vector<std::string> out;
  if (const auto * g = dyn_cast<GotoCmd>(b->transfer)) {
    for (auto l : g->labels) out.emplace_back(l);
  }
  return out;
}

struct ExprFixture
{
  AstContext ast;
  TypeContext types;
  DiagnosticBag diags;

  Expr * parse(std::string_view text) { return parse_expression(text, ast, types, diags); }
};

}  // namespace

// ============================================================================
// Declarations
// ============================================================================

TEST(SyntaxParser, TopLevelDeclarations)
{
  auto u = parse(
    "type {:builtin \"Int\"} T;\n"
    "type Pair a b;\n"
    "type Syn = [int]bool;\n"
    "const unique c, d: int;\n"
    "var x, y: bool where x;\n"
    "function f(int, b: bool) returns (int);\n"
    "function g(x: int): int { x + 1 }\n"
    "axiom c != d;\n"
    "procedure P(a: int) returns (r: int);\n"
    "implementation P(a: int) returns (r: int) { r := a; }\n");
  ASSERT_TRUE(u.parsed) << u.diags().errors().front().message;

  const auto decls = u.program()->decls;
  ASSERT_EQ(decls.size(), 12u);
  EXPECT_TRUE(isa<TypeCtorDecl>(decls[0]));
  EXPECT_TRUE(isa<TypeSynonymDecl>(decls[2]));

  auto * pair = u.find<TypeCtorDecl>("Pair");
  ASSERT_NE(pair, nullptr);
  EXPECT_EQ(pair->arity(), 2u);

  auto * d = u.find<ConstantDecl>("d");
  ASSERT_NE(d, nullptr);
  EXPECT_TRUE(d->unique);

  auto * y = u.find<GlobalVarDecl>("y");
  ASSERT_NE(y, nullptr);
  EXPECT_NE(y->where, nullptr);

  auto * f = u.find<FunctionDecl>("f");
  ASSERT_NE(f, nullptr);
  ASSERT_EQ(f->inParams.size(), 2u);
  EXPECT_TRUE(f->inParams[0]->name.empty());
  EXPECT_EQ(f->inParams[1]->name, "b");
  EXPECT_EQ(f->body, nullptr);

  auto * g = u.find<FunctionDecl>("g");
  ASSERT_NE(g, nullptr);
  EXPECT_NE(g->body, nullptr);
  ASSERT_EQ(g->outParams.size(), 1u);
}

TEST(SyntaxParser, ConstantExtendsClause)
{
  auto u = parse(
    "const a: int extends;\n"
    "const b: int extends unique a, c complete;\n");
  ASSERT_TRUE(u.parsed);

  auto * a = u.find<ConstantDecl>("a");
  ASSERT_TRUE(a->parents.has_value());
  EXPECT_TRUE(a->parents->empty());
  EXPECT_FALSE(a->childrenComplete);

  auto * b = u.find<ConstantDecl>("b");
  ASSERT_TRUE(b->parents.has_value());
  ASSERT_EQ(b->parents->size(), 2u);
  EXPECT_TRUE((*b->parents)[0].unique);
  EXPECT_EQ((*b->parents)[0].parent->name, "a");
  EXPECT_FALSE((*b->parents)[1].unique);
  EXPECT_TRUE(b->childrenComplete);
}

TEST(SyntaxParser, ProcedureSpecifications)
{
  auto u = parse(
    "var g: int;\n"
    "procedure P(x: int) returns (y: int);\n"
    "  requires x > 0;\n"
    "  free requires x < 100;\n"
    "  modifies g;\n"
    "  ensures y == x + g;\n");
  ASSERT_TRUE(u.parsed);

  auto * p = u.find<ProcedureDecl>("P");
  ASSERT_NE(p, nullptr);
  ASSERT_EQ(p->requiresClauses.size(), 2u);
  EXPECT_FALSE(p->requiresClauses[0]->isFree);
  EXPECT_TRUE(p->requiresClauses[1]->isFree);
  ASSERT_EQ(p->modifies.size(), 1u);
  EXPECT_EQ(p->modifies[0]->name, "g");
  ASSERT_EQ(p->ensuresClauses.size(), 1u);
}

TEST(SyntaxParser, ProcedureWithBodyDeclaresImplementation)
{
  auto u = parse("procedure P<a>(x: a) returns (y: a) { y := x; }");
  ASSERT_TRUE(u.parsed);
  ASSERT_EQ(u.program()->decls.size(), 2u);

  auto * proc = u.find<ProcedureDecl>("P");
  auto * impl = u.find<ImplementationDecl>("P");
  ASSERT_NE(proc, nullptr);
  ASSERT_NE(impl, nullptr);
  ASSERT_EQ(impl->typeParams.size(), 1u);
  EXPECT_NE(impl->typeParams[0], proc->typeParams[0]);
  EXPECT_NE(impl->inParams[0], proc->inParams[0]);
  EXPECT_EQ(impl->outParams[0]->name, "y");
}

TEST(SyntaxParser, ReservedWordsAreNotIdentifiers)
{
  auto u = parse("var while: int;");
  EXPECT_FALSE(u.parsed);
  EXPECT_TRUE(u.has_error_containing("'while' is a reserved word"));
}

TEST(SyntaxParser, FiniteSynonymIsRejected)
{
  auto u = parse("type finite S = int;");
  EXPECT_TRUE(u.has_error_containing("a type synonym cannot be declared finite"));
}

TEST(SyntaxParser, RecoversAtNextDeclaration)
{
  auto u = parse(
    "var x: ;\n"
    "const c: int;\n"
    "garbage here;\n"
    "var y: bool;\n");
  EXPECT_FALSE(u.parsed);
  EXPECT_TRUE(u.has_error_containing("expected a type"));
  EXPECT_TRUE(u.has_error_containing("expected a declaration"));
  EXPECT_NE(u.find<ConstantDecl>("c"), nullptr);
  EXPECT_NE(u.find<GlobalVarDecl>("y"), nullptr);
}

// ============================================================================
// Types
// ============================================================================

TEST(SyntaxParser, TypeSyntax)
{
  AstContext ast;
  TypeContext types;
  DiagnosticBag diags;

  Type * bv = parse_type("bv32", ast, types, diags);
  EXPECT_EQ(bv, types.bv_type(32));

  auto * map = dyn_cast<MapType>(parse_type("<a>[Ref, Field a]a", ast, types, diags));
  ASSERT_NE(map, nullptr);
  EXPECT_EQ(map->typeParams.size(), 1u);
  EXPECT_EQ(map->arity(), 2u);

  auto * ctor = dyn_cast<UnresolvedTypeIdentifier>(parse_type("C int (D bool) [int]int", ast, types, diags));
  ASSERT_NE(ctor, nullptr);
  EXPECT_EQ(ctor->name, "C");
  ASSERT_EQ(ctor->args.size(), 3u);
  EXPECT_TRUE(isa<MapType>(ctor->args[2]));

  EXPECT_FALSE(diags.has_errors());
}

// ============================================================================
// Expressions
// ============================================================================

TEST(SyntaxParser, ImplicationIsRightAssociative)
{
  ExprFixture fx;
  auto * e = dyn_cast<BinaryExpr>(fx.parse("a ==> b ==> c"));
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->op, BinaryOp::Imp);
  EXPECT_TRUE(isa<IdentifierExpr>(e->lhs));
  auto * rhs = dyn_cast<BinaryExpr>(e->rhs);
  ASSERT_NE(rhs, nullptr);
  EXPECT_EQ(rhs->op, BinaryOp::Imp);
}

TEST(SyntaxParser, ArithmeticPrecedence)
{
  ExprFixture fx;
  auto * e = dyn_cast<BinaryExpr>(fx.parse("1 + 2 * 3 < x - 4 mod 2"));
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->op, BinaryOp::Lt);
  auto * lhs = dyn_cast<BinaryExpr>(e->lhs);
  ASSERT_NE(lhs, nullptr);
  EXPECT_EQ(lhs->op, BinaryOp::Add);
  EXPECT_EQ(cast<BinaryExpr>(lhs->rhs)->op, BinaryOp::Mul);
  auto * rhs = dyn_cast<BinaryExpr>(e->rhs);
  ASSERT_NE(rhs, nullptr);
  EXPECT_EQ(rhs->op, BinaryOp::Sub);
  EXPECT_EQ(cast<BinaryExpr>(rhs->rhs)->op, BinaryOp::Mod);
  EXPECT_FALSE(fx.diags.has_errors());
}

TEST(SyntaxParser, MixingAndOrNeedsParentheses)
{
  ExprFixture fx;
  (void)fx.parse("a && b || c");
  ASSERT_TRUE(fx.diags.has_errors());
  EXPECT_EQ(fx.diags.errors().front().message, "mixing '&&' and '||' requires parentheses");

  ExprFixture ok;
  (void)ok.parse("(a && b) || c");
  EXPECT_FALSE(ok.diags.has_errors());
}

TEST(SyntaxParser, ChainedRelationsAreRejected)
{
  ExprFixture fx;
  (void)fx.parse("a < b < c");
  ASSERT_TRUE(fx.diags.has_errors());
  EXPECT_EQ(fx.diags.errors().front().message, "chained relational operators are not allowed");
}

TEST(SyntaxParser, PostfixOperators)
{
  ExprFixture fx;
  auto * ext = dyn_cast<BvExtractExpr>(fx.parse("x[8:0]"));
  ASSERT_NE(ext, nullptr);
  EXPECT_EQ(ext->end, 8u);
  EXPECT_EQ(ext->start, 0u);

  auto * store = dyn_cast<MapStoreExpr>(fx.parse("m[i, j := v]"));
  ASSERT_NE(store, nullptr);
  EXPECT_EQ(store->indices.size(), 2u);

  auto * sel = dyn_cast<MapSelectExpr>(fx.parse("m[i][j]"));
  ASSERT_NE(sel, nullptr);
  EXPECT_TRUE(isa<MapSelectExpr>(sel->map));
  EXPECT_FALSE(fx.diags.has_errors());
}

TEST(SyntaxParser, QuantifierWithTriggerAndAttribute)
{
  ExprFixture fx;
  auto * q = dyn_cast<QuantifierExpr>(fx.parse("(forall<T> x: T, y: int :: {:weight 2} {f(x)} f(x) == y)"));
  ASSERT_NE(q, nullptr);
  EXPECT_EQ(q->quantifier, QuantifierKind::Forall);
  EXPECT_EQ(q->typeParams.size(), 1u);
  EXPECT_EQ(q->vars.size(), 2u);
  EXPECT_EQ(q->attributes.size(), 1u);
  ASSERT_EQ(q->triggers.size(), 1u);
  EXPECT_TRUE(isa<BinaryExpr>(q->body));
  EXPECT_FALSE(fx.diags.has_errors());
}

TEST(SyntaxParser, LiteralsAndOld)
{
  ExprFixture fx;
  auto * bv = dyn_cast<BvLiteralExpr>(fx.parse("5bv8"));
  ASSERT_NE(bv, nullptr);
  EXPECT_EQ(bv->bits, 8u);
  EXPECT_EQ(bv->digits, "5");

  auto * i = dyn_cast<IntLiteralExpr>(fx.parse("12345"));
  ASSERT_NE(i, nullptr);
  EXPECT_EQ(i->value, 12345);

  EXPECT_TRUE(isa<OldExpr>(fx.parse("old(x)")));
  EXPECT_TRUE(isa<IfThenElseExpr>(fx.parse("if b then 1 else 2")));
  EXPECT_FALSE(fx.diags.has_errors());
}

TEST(SyntaxParser, MissingOperandYieldsMissingExpr)
{
  ExprFixture fx;
  auto * e = dyn_cast<BinaryExpr>(fx.parse("x + ;"));
  ASSERT_NE(e, nullptr);
  EXPECT_TRUE(isa<MissingExpr>(e->rhs));
  ASSERT_TRUE(fx.diags.has_errors());
  EXPECT_EQ(fx.diags.errors().front().message, "expected an expression, found ';'");
}

// ============================================================================
// Statements
// ============================================================================

TEST(SyntaxParser, LabelsAndGotos)
{
  auto u = parse(
    "procedure P();\n"
    "implementation P() { var i: int; A: i := 0; goto B, C; B: return; C: assume i == 0; }\n");
  ASSERT_TRUE(u.parsed);
  auto * impl = u.find<ImplementationDecl>("P");
  ASSERT_NE(impl, nullptr);
  EXPECT_EQ(impl->locals.size(), 1u);
  EXPECT_EQ(labels_of(impl), (std::vector<std::string>{"A", "B", "C"}));
  EXPECT_EQ(goto_targets(impl->blocks[0]), (std::vector<std::string>{"B", "C"}));
  EXPECT_TRUE(isa<ReturnCmd>(impl->blocks[1]->transfer));
  // The last block returns implicitly
  EXPECT_TRUE(isa<ReturnCmd>(impl->blocks[2]->transfer));
}

TEST(SyntaxParser, LeadingCommandsGetAnonymousBlock)
{
  auto u = parse(
    "procedure P();\n"
    "implementation P() { var i: int; i := 1; L: i := 2; }\n");
  ASSERT_TRUE(u.parsed);
  auto * impl = u.find<ImplementationDecl>("P");
  EXPECT_EQ(labels_of(impl), (std::vector<std::string>{"anon0", "L"}));
  EXPECT_EQ(goto_targets(impl->blocks[0]), (std::vector<std::string>{"L"}));
}

TEST(SyntaxParser, EmptyBodyReturns)
{
  auto u = parse("procedure P();\nimplementation P() { }\n");
  ASSERT_TRUE(u.parsed);
  auto * impl = u.find<ImplementationDecl>("P");
  ASSERT_EQ(impl->blocks.size(), 1u);
  EXPECT_TRUE(isa<ReturnCmd>(impl->blocks[0]->transfer));
}

TEST(SyntaxParser, IfIsLoweredToBlocks)
{
  auto u = parse(
    "procedure P(x: int) returns (y: int);\n"
    "implementation P(x: int) returns (y: int) { if (x > 0) { y := 1; } else { y := 2; } }\n");
  ASSERT_TRUE(u.parsed);
  auto * impl = u.find<ImplementationDecl>("P");
  EXPECT_EQ(
    labels_of(impl),
    (std::vector<std::string>{"anon0", "anon1_Then", "anon1_Else", "anon2"}));
  EXPECT_EQ(goto_targets(impl->blocks[0]), (std::vector<std::string>{"anon1_Then", "anon1_Else"}));
  EXPECT_EQ(goto_targets(impl->blocks[1]), (std::vector<std::string>{"anon2"}));
  EXPECT_EQ(goto_targets(impl->blocks[2]), (std::vector<std::string>{"anon2"}));

  // Then assumes the guard, Else its negation (on separate nodes)
  auto * then_assume = dyn_cast<AssumeCmd>(impl->blocks[1]->cmds[0]);
  auto * else_assume = dyn_cast<AssumeCmd>(impl->blocks[2]->cmds[0]);
  ASSERT_NE(then_assume, nullptr);
  ASSERT_NE(else_assume, nullptr);
  auto * negation = dyn_cast<UnaryExpr>(else_assume->expr);
  ASSERT_NE(negation, nullptr);
  EXPECT_EQ(negation->op, UnaryOp::Not);
  EXPECT_NE(negation->operand, then_assume->expr);
  EXPECT_TRUE(isa<ReturnCmd>(impl->blocks[3]->transfer));
}

TEST(SyntaxParser, NondeterministicIfHasNoAssumes)
{
  auto u = parse(
    "procedure P();\n"
    "implementation P() { var i: int; if (*) { i := 1; } }\n");
  ASSERT_TRUE(u.parsed);
  auto * impl = u.find<ImplementationDecl>("P");
  ASSERT_EQ(impl->blocks.size(), 4u);
  EXPECT_EQ(impl->blocks[1]->cmds.size(), 1u);
  EXPECT_TRUE(isa<AssignCmd>(impl->blocks[1]->cmds[0]));
  EXPECT_TRUE(impl->blocks[2]->cmds.empty());
}

TEST(SyntaxParser, WhileIsLoweredToBlocks)
{
  auto u = parse(
    "procedure P();\n"
    "implementation P() {\n"
    "  var i: int;\n"
    "  i := 0;\n"
    "  while (i < 10)\n"
    "    invariant i >= 0;\n"
    "    free invariant i <= 10;\n"
    "  {\n"
    "    i := i + 1;\n"
    "  }\n"
    "}\n");
  ASSERT_TRUE(u.parsed);
  auto * impl = u.find<ImplementationDecl>("P");
  EXPECT_EQ(
    labels_of(impl),
    (std::vector<std::string>{"anon0", "anon1_LoopHead", "anon1_LoopBody", "anon1_LoopDone"}));

  EXPECT_EQ(goto_targets(impl->blocks[0]), (std::vector<std::string>{"anon1_LoopHead"}));

  const Block * head = impl->blocks[1];
  ASSERT_EQ(head->cmds.size(), 2u);
  EXPECT_TRUE(isa<AssertCmd>(head->cmds[0]));
  EXPECT_TRUE(isa<AssumeCmd>(head->cmds[1]));
  EXPECT_EQ(goto_targets(head), (std::vector<std::string>{"anon1_LoopBody", "anon1_LoopDone"}));

  const Block * loop_body = impl->blocks[2];
  ASSERT_EQ(loop_body->cmds.size(), 2u);
  EXPECT_TRUE(isa<AssumeCmd>(loop_body->cmds[0]));
  EXPECT_EQ(goto_targets(loop_body), (std::vector<std::string>{"anon1_LoopHead"}));

  const Block * done = impl->blocks[3];
  ASSERT_EQ(done->cmds.size(), 1u);
  EXPECT_TRUE(isa<UnaryExpr>(cast<AssumeCmd>(done->cmds[0])->expr));
  EXPECT_TRUE(isa<ReturnCmd>(done->transfer));
}

TEST(SyntaxParser, BreakLeavesInnermostLoop)
{
  auto u = parse(
    "procedure P();\n"
    "implementation P() {\n"
    "  while (true) {\n"
    "    while (*) { break; }\n"
    "    break;\n"
    "  }\n"
    "}\n");
  ASSERT_TRUE(u.parsed) << u.diags().errors().front().message;
  auto * impl = u.find<ImplementationDecl>("P");

  bool inner_break = false;
  bool outer_break = false;
  for (const auto * b : impl->blocks) {
    const auto targets = goto_targets(b);
    if (b->label == "anon2_LoopBody") {
      inner_break = targets == std::vector<std::string>{"anon2_LoopDone"};
    }
    if (b->label == "anon2_LoopDone") {
      outer_break = targets == std::vector<std::string>{"anon1_LoopDone"};
    }
  }
  EXPECT_TRUE(inner_break);
  EXPECT_TRUE(outer_break);
}

TEST(SyntaxParser, BreakOutsideLoopIsAnError)
{
  auto u = parse("procedure P();\nimplementation P() { break; }\n");
  EXPECT_FALSE(u.parsed);
  EXPECT_TRUE(u.has_error_containing("break statement is not inside a loop"));
}

TEST(SyntaxParser, CallAndHavocCommands)
{
  auto u = parse(
    "procedure P();\n"
    "implementation P() { var a, b: int; call a, b := Q(1, 2); call R(); havoc a, b; }\n");
  ASSERT_TRUE(u.parsed);
  auto * impl = u.find<ImplementationDecl>("P");
  ASSERT_EQ(impl->blocks.size(), 1u);
  const auto cmds = impl->blocks[0]->cmds;
  ASSERT_EQ(cmds.size(), 3u);

  auto * q = dyn_cast<CallCmd>(cmds[0]);
  ASSERT_NE(q, nullptr);
  EXPECT_EQ(q->callee, "Q");
  EXPECT_EQ(q->outs.size(), 2u);
  EXPECT_EQ(q->ins.size(), 2u);

  auto * r = dyn_cast<CallCmd>(cmds[1]);
  ASSERT_NE(r, nullptr);
  EXPECT_TRUE(r->outs.empty());

  auto * h = dyn_cast<HavocCmd>(cmds[2]);
  ASSERT_NE(h, nullptr);
  EXPECT_EQ(h->vars.size(), 2u);
}

TEST(SyntaxParser, StatementErrorRecovery)
{
  auto u = parse(
    "procedure P();\n"
    "implementation P() { var i: int; i := ; i := 1; }\n");
  EXPECT_FALSE(u.parsed);
  EXPECT_TRUE(u.has_error_containing("expected an expression"));
  auto * impl = u.find<ImplementationDecl>("P");
  ASSERT_NE(impl, nullptr);
  ASSERT_FALSE(impl->blocks.empty());
}
