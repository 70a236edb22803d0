// ivl/syntax/parser.hpp - Recursive-descent parser for the surface syntax
//
// Produces an unresolved Program: types are UnresolvedTypeIdentifier
// (except int, bool and bvN), identifiers are unbound and goto labels are
// names only. Structured statements (if, while, break) are lowered to
// blocks while parsing, so every implementation carries a block list.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ivl/ast/ast.hpp"
#include "ivl/ast/ast_context.hpp"
#include "ivl/basic/diagnostic.hpp"
#include "ivl/sema/types/type.hpp"
#include "ivl/syntax/token.hpp"

namespace ivl::syntax
{

class BodyBuilder;

class Parser
{
public:
  Parser(AstContext & ast, TypeContext & types, DiagnosticBag & diags, std::vector<Token> tokens)
  : ast_(ast), types_(types), diags_(diags), tokens_(std::move(tokens))
  {
  }

  [[nodiscard]] Program * parse_program();

  /// Parse input consisting of exactly one expression.
  [[nodiscard]] Expr * parse_single_expr();

  /// Parse input consisting of exactly one type.
  [[nodiscard]] Type * parse_single_type();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k, size_t lookahead = 0) const;
  [[nodiscard]] bool at_kw(std::string_view kw, size_t lookahead = 0) const;
  [[nodiscard]] bool at_eof() const;

  const Token & advance();
  bool match(TokenKind k);
  bool match_kw(std::string_view kw);
  bool expect(TokenKind k, std::string_view what);
  bool expect_kw(std::string_view kw);

  void error_at(const Token & t, std::string_view msg);
  void synchronize_to_decl();
  void synchronize_to_stmt();
  void expect_end_of_input();

  [[nodiscard]] SourceRange range_from(const Token & start) const;
  [[nodiscard]] static bool is_reserved(std::string_view ident);
  [[nodiscard]] bool at_identifier(size_t lookahead = 0) const;
  [[nodiscard]] std::optional<std::string_view> expect_identifier(std::string_view what);
  [[nodiscard]] std::vector<std::string_view> parse_identifier_list(std::string_view what);

  // Attributes
  [[nodiscard]] gsl::span<Attribute *> parse_attributes();
  [[nodiscard]] Attribute * parse_attribute();
  [[nodiscard]] bool at_attribute() const;

  // Declarations
  void parse_decl(std::vector<Decl *> & out);
  void parse_type_decl(gsl::span<Attribute *> attrs, const Token & start, std::vector<Decl *> & out);
  void parse_const_decl(const Token & start, std::vector<Decl *> & out);
  void parse_var_decl(const Token & start, std::vector<Decl *> & out);
  [[nodiscard]] FunctionDecl * parse_function_decl(const Token & start);
  [[nodiscard]] AxiomDecl * parse_axiom_decl(const Token & start);
  void parse_procedure_decl(const Token & start, std::vector<Decl *> & out);
  [[nodiscard]] ImplementationDecl * parse_implementation_decl(const Token & start);

  /// `<a, b>` (optional)
  [[nodiscard]] gsl::span<TypeVariable *> parse_type_params_opt();

  struct TypedIdent
  {
    std::string_view name;
    SourceRange range;
    Type * type = nullptr;
    Expr * where = nullptr;
    gsl::span<Attribute *> attributes;
  };

  /// `x, y: T where e, z: U` groups
  [[nodiscard]] std::vector<TypedIdent> parse_typed_idents(bool allow_where);
  /// Procedure/implementation formals `(x: T, ...)`
  [[nodiscard]] gsl::span<FormalDecl *> parse_formals(bool incoming, bool allow_where);
  /// Function formals: each entry is `name: T` or an anonymous `T`
  [[nodiscard]] gsl::span<FormalDecl *> parse_function_formals(bool incoming);
  [[nodiscard]] FormalDecl * parse_var_or_type(bool incoming);

  // Procedure specifications
  void parse_specs(
    std::vector<Requires *> & requires_clauses, std::vector<IdentifierExpr *> & modifies,
    std::vector<Ensures *> & ensures_clauses);

  // Implementation bodies
  void parse_body(std::vector<LocalVarDecl *> & locals, std::vector<Block *> & blocks);
  void parse_stmt_list(BodyBuilder & body);
  void parse_stmt(BodyBuilder & body);
  void parse_if_stmt(BodyBuilder & body);
  void parse_while_stmt(BodyBuilder & body);
  /// `(e)` or `(*)`; nullptr for the nondeterministic guard
  [[nodiscard]] Expr * parse_guard();
  /// Parse the guard starting at @p guard_start again, yielding fresh nodes.
  [[nodiscard]] Expr * reparse_guard(size_t guard_start);

  // Commands
  [[nodiscard]] Cmd * parse_assign_cmd();
  [[nodiscard]] CallCmd * parse_call_cmd();
  [[nodiscard]] HavocCmd * parse_havoc_cmd();
  [[nodiscard]] AssignLhs * parse_assign_lhs();

  // Types
  [[nodiscard]] Type * parse_type();
  [[nodiscard]] Type * parse_type_atom();
  [[nodiscard]] Type * parse_map_type();
  [[nodiscard]] std::optional<uint32_t> bv_width(std::string_view name) const;

  // Expressions (weakest to strongest)
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_implies();
  [[nodiscard]] Expr * parse_and_or();
  [[nodiscard]] Expr * parse_relation();
  [[nodiscard]] Expr * parse_concat();
  [[nodiscard]] Expr * parse_additive();
  [[nodiscard]] Expr * parse_multiplicative();
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] Expr * parse_quantifier(const Token & open);
  [[nodiscard]] Expr * parse_if_then_else();
  [[nodiscard]] gsl::span<Expr *> parse_expr_list(TokenKind close);

  [[nodiscard]] Expr * make_missing_expr_at(const Token & t);
  [[nodiscard]] BinaryExpr * make_binary(Expr * lhs, BinaryOp op, Expr * rhs);

  AstContext & ast_;
  TypeContext & types_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
};

}  // namespace ivl::syntax
