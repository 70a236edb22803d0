// test_json_visitor.cpp - Unit tests for AST JSON serialization
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "ivl/ast/ast.hpp"
#include "ivl/ast/json_visitor.hpp"
#include "ivl/test_support/check_helpers.hpp"

using nlohmann::json;

namespace ivl
{

class JsonVisitorTest : public ::testing::Test
{
protected:
  static json parse_and_serialize(const std::string & source)
  {
    auto unit = test_support::parse(source);
    EXPECT_TRUE(unit.parsed) << source;
    return to_json(unit.program());
  }

  static json check_and_serialize(const std::string & source)
  {
    auto unit = test_support::check(source);
    EXPECT_TRUE(unit.typechecked) << source;
    return to_json(unit.program());
  }
};

TEST_F(JsonVisitorTest, EmptyProgram)
{
  auto j = parse_and_serialize("");
  EXPECT_EQ(j["type"], "Program");
  EXPECT_TRUE(j["decls"].is_array());
  EXPECT_EQ(j["decls"].size(), 0u);
}

TEST_F(JsonVisitorTest, NullProgram)
{
  const Program * none = nullptr;
  auto j = to_json(none);
  EXPECT_EQ(j["type"], "Program");
  EXPECT_TRUE(j["range"]["start"].is_null());
}

TEST_F(JsonVisitorTest, DeclarationKinds)
{
  auto j = parse_and_serialize(
    "type finite Color;\n"
    "type Pair a b;\n"
    "const unique red: Color extends unique top complete;\n"
    "var g: int where g > 0;\n"
    "axiom {:msg \"hi\"} true;\n");

  const auto & decls = j["decls"];
  ASSERT_EQ(decls.size(), 5u);

  EXPECT_EQ(decls[0]["type"], "TypeCtorDecl");
  EXPECT_EQ(decls[0]["name"], "Color");
  EXPECT_EQ(decls[0]["finite"], true);

  EXPECT_EQ(decls[1]["params"], json::array({"a", "b"}));

  const auto & red = decls[2];
  EXPECT_EQ(red["type"], "ConstantDecl");
  EXPECT_EQ(red["unique"], true);
  EXPECT_EQ(red["childrenComplete"], true);
  ASSERT_EQ(red["parents"].size(), 1u);
  EXPECT_EQ(red["parents"][0]["name"], "top");
  EXPECT_EQ(red["parents"][0]["unique"], true);

  EXPECT_EQ(decls[3]["type"], "GlobalVarDecl");
  EXPECT_EQ(decls[3]["where"]["type"], "BinaryExpr");

  EXPECT_EQ(decls[4]["type"], "AxiomDecl");
  EXPECT_EQ(decls[4]["attributes"][0]["key"], "msg");
  EXPECT_EQ(decls[4]["attributes"][0]["params"][0]["string"], "hi");
}

TEST_F(JsonVisitorTest, ConstantWithoutExtendsHasNoParents)
{
  auto j = parse_and_serialize("const a: int;\nconst b: int extends;\n");
  EXPECT_FALSE(j["decls"][0].contains("parents"));
  ASSERT_TRUE(j["decls"][1].contains("parents"));
  EXPECT_TRUE(j["decls"][1]["parents"].empty());
}

TEST_F(JsonVisitorTest, ProcedureAndImplementation)
{
  auto j = parse_and_serialize(
    "var g: int;\n"
    "procedure P(x: int) returns (y: int);\n"
    "  free requires x > 0;\n"
    "  modifies g;\n"
    "  ensures y == x;\n"
    "implementation P(x: int) returns (y: int) { var t: int; L: t := x; goto M; M: y := t; }\n");

  const auto & proc = j["decls"][1];
  EXPECT_EQ(proc["type"], "ProcedureDecl");
  EXPECT_EQ(proc["inParams"][0]["name"], "x");
  EXPECT_EQ(proc["inParams"][0]["incoming"], true);
  EXPECT_EQ(proc["outParams"][0]["incoming"], false);
  EXPECT_EQ(proc["requires"][0]["free"], true);
  EXPECT_EQ(proc["modifies"], json::array({"g"}));
  EXPECT_EQ(proc["ensures"][0]["free"], false);

  const auto & impl = j["decls"][2];
  EXPECT_EQ(impl["type"], "ImplementationDecl");
  EXPECT_EQ(impl["locals"][0]["type"], "LocalVarDecl");
  ASSERT_EQ(impl["blocks"].size(), 2u);
  EXPECT_EQ(impl["blocks"][0]["label"], "L");
  EXPECT_EQ(impl["blocks"][0]["transfer"]["type"], "GotoCmd");
  EXPECT_EQ(impl["blocks"][0]["transfer"]["labels"], json::array({"M"}));
  EXPECT_EQ(impl["blocks"][1]["transfer"]["type"], "ReturnCmd");
  EXPECT_EQ(impl["blocks"][1]["cmds"][0]["type"], "AssignCmd");
  EXPECT_EQ(impl["blocks"][1]["cmds"][0]["lhss"][0]["type"], "SimpleAssignLhs");
}

TEST_F(JsonVisitorTest, CommandShapes)
{
  auto j = parse_and_serialize(
    "procedure P() { var m: [int]int; var a: int; m[1] := 2; havoc a; call a := Q(a); "
    "assert {:msg \"x\"} a > 0; assume true; }\n");

  // The body declares an implementation right after the procedure
  const auto & cmds = j["decls"][1]["blocks"][0]["cmds"];
  ASSERT_EQ(cmds.size(), 5u);
  EXPECT_EQ(cmds[0]["lhss"][0]["type"], "MapAssignLhs");
  EXPECT_EQ(cmds[0]["lhss"][0]["map"]["var"]["name"], "m");
  EXPECT_EQ(cmds[1]["type"], "HavocCmd");
  EXPECT_EQ(cmds[2]["type"], "CallCmd");
  EXPECT_EQ(cmds[2]["callee"], "Q");
  EXPECT_EQ(cmds[2]["outs"][0]["name"], "a");
  EXPECT_EQ(cmds[3]["attributes"][0]["key"], "msg");
  EXPECT_EQ(cmds[4]["type"], "AssumeCmd");
}

TEST_F(JsonVisitorTest, ExpressionShapes)
{
  auto j = parse_and_serialize(
    "axiom (forall<T> x: T :: {:w 1} {f(x)} f(x) == x);\n"
    "axiom (if b then m[1 := 2][1] else -n) == old(k);\n"
    "axiom 5bv8 ++ y[4:0] == z;\n");

  const auto & q = j["decls"][0]["expr"];
  EXPECT_EQ(q["type"], "QuantifierExpr");
  EXPECT_EQ(q["quantifier"], "forall");
  EXPECT_EQ(q["typeParams"], json::array({"T"}));
  EXPECT_EQ(q["vars"][0]["type"], "BoundVarDecl");
  EXPECT_EQ(q["attributes"][0]["key"], "w");
  EXPECT_EQ(q["triggers"][0]["exprs"][0]["type"], "FunctionCallExpr");
  EXPECT_EQ(q["body"]["op"], "==");

  const auto & eq = j["decls"][1]["expr"];
  const auto & ite = eq["lhs"];
  EXPECT_EQ(ite["type"], "IfThenElseExpr");
  EXPECT_EQ(ite["then"]["type"], "MapSelectExpr");
  EXPECT_EQ(ite["then"]["map"]["type"], "MapStoreExpr");
  EXPECT_EQ(ite["else"]["type"], "UnaryExpr");
  EXPECT_EQ(ite["else"]["op"], "-");
  EXPECT_EQ(eq["rhs"]["type"], "OldExpr");

  const auto & cat = j["decls"][2]["expr"]["lhs"];
  EXPECT_EQ(cat["op"], "++");
  EXPECT_EQ(cat["lhs"]["type"], "BvLiteralExpr");
  EXPECT_EQ(cat["lhs"]["digits"], "5");
  EXPECT_EQ(cat["lhs"]["bits"], 8);
  EXPECT_EQ(cat["rhs"]["type"], "BvExtractExpr");
  EXPECT_EQ(cat["rhs"]["end"], 4);
  EXPECT_EQ(cat["rhs"]["start"], 0);
}

TEST_F(JsonVisitorTest, RangesAreByteOffsets)
{
  auto j = parse_and_serialize("axiom 1 + 2 == 3;");
  const auto & e = j["decls"][0]["expr"];
  EXPECT_EQ(e["range"]["start"], 6);
  EXPECT_EQ(e["range"]["end"], 16);
  EXPECT_EQ(e["lhs"]["lhs"]["range"]["start"], 6);
  EXPECT_EQ(e["lhs"]["lhs"]["range"]["end"], 7);
}

TEST_F(JsonVisitorTest, ResolvedTypesAfterChecking)
{
  auto j = check_and_serialize(
    "type Set a = [a]bool;\n"
    "const s: Set int;\n"
    "function id<T>(x: T) returns (T) { x }\n"
    "axiom id(1) == 1 && s[3];\n");

  const auto & s = j["decls"][1];
  EXPECT_EQ(s["typeExpr"]["kind"], "synonym");
  EXPECT_EQ(s["typeExpr"]["name"], "Set");
  EXPECT_EQ(s["typeExpr"]["expanded"]["kind"], "map");
  EXPECT_EQ(s["typeExpr"]["expanded"]["result"]["name"], "bool");

  const auto & axiom = j["decls"][3]["expr"];
  EXPECT_EQ(axiom["resolvedType"], "bool");
  const auto & call = axiom["lhs"]["lhs"];
  EXPECT_EQ(call["resolvedType"], "int");
  ASSERT_EQ(call["typeArgs"].size(), 1u);
  EXPECT_EQ(call["typeArgs"][0]["kind"], "basic");
  EXPECT_EQ(call["typeArgs"][0]["name"], "int");

  // Bound identifiers point at their declaration
  EXPECT_TRUE(axiom["rhs"]["map"].contains("declRange"));
}

TEST_F(JsonVisitorTest, UnresolvedTypesBeforeChecking)
{
  auto j = parse_and_serialize("var h: <a>[Ref, Field a]a;\nvar b: bv32;\n");
  const auto & h = j["decls"][0]["typeExpr"];
  EXPECT_EQ(h["kind"], "map");
  EXPECT_EQ(h["typeParams"], json::array({"a"}));
  EXPECT_EQ(h["args"][0]["kind"], "unresolved");
  EXPECT_EQ(h["args"][1]["name"], "Field");
  EXPECT_EQ(h["args"][1]["args"].size(), 1u);
  EXPECT_EQ(j["decls"][1]["typeExpr"]["kind"], "bv");
  EXPECT_EQ(j["decls"][1]["typeExpr"]["bits"], 32);
}

TEST_F(JsonVisitorTest, NodeDispatch)
{
  auto unit = test_support::parse("procedure P() { L: assume true; }\n");
  ASSERT_TRUE(unit.parsed);
  auto * impl = unit.find<ImplementationDecl>("P");
  ASSERT_NE(impl, nullptr);

  EXPECT_EQ(to_json(static_cast<const AstNode *>(impl))["type"], "ImplementationDecl");
  EXPECT_EQ(to_json(static_cast<const AstNode *>(impl->blocks[0]))["type"], "Block");
  EXPECT_EQ(to_json(static_cast<const AstNode *>(impl->blocks[0]->cmds[0]))["type"], "AssumeCmd");
  EXPECT_EQ(to_json(static_cast<const AstNode *>(nullptr))["type"], "null");
}

}  // namespace ivl
