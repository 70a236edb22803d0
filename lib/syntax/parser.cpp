// ivl/syntax/parser.cpp - Recursive-descent parser for the surface syntax
#include "ivl/syntax/parser.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>

#include <fmt/format.h>

#include "ivl/syntax/keywords.hpp"

namespace ivl::syntax
{
namespace
{

std::string describe(const Token & t)
{
  switch (t.kind) {
    case TokenKind::Eof:
      return "end of input";
    case TokenKind::Unknown:
      return fmt::format("unrecognized input '{}'", t.text);
    default:
      return fmt::format("'{}'", t.text);
  }
}

template <typename T>
std::optional<T> parse_number(std::string_view text)
{
  T value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<BinaryOp> relation_op(TokenKind k)
{
  switch (k) {
    case TokenKind::EqEq:
      return BinaryOp::Eq;
    case TokenKind::Ne:
      return BinaryOp::Neq;
    case TokenKind::Lt:
      return BinaryOp::Lt;
    case TokenKind::Le:
      return BinaryOp::Le;
    case TokenKind::Gt:
      return BinaryOp::Gt;
    case TokenKind::Ge:
      return BinaryOp::Ge;
    case TokenKind::Subtype:
      return BinaryOp::Subtype;
    default:
      return std::nullopt;
  }
}

}  // namespace

// ============================================================================
// BodyBuilder
// ============================================================================

/**
 * Collects the blocks of an implementation body while statements are
 * parsed.
 *
 * Commands go to the open block; a command arriving when no block is open
 * starts a fresh anonymous one. Starting a labelled block while another is
 * open ends the open one with a goto to the new label.
 */
class BodyBuilder
{
public:
  explicit BodyBuilder(AstContext & ast) : ast_(ast) {}

  [[nodiscard]] int next_id() noexcept { return nextId_++; }

  [[nodiscard]] std::string_view fresh_label(int id, std::string_view suffix)
  {
    return ast_.intern(fmt::format("anon{}{}", id, suffix));
  }

  [[nodiscard]] bool is_open() const noexcept { return current_ != nullptr; }

  /// Start an anonymous block unless one is open.
  void ensure_open(SourceRange range)
  {
    if (!is_open()) {
      current_ = ast_.create<Block>(fresh_label(next_id(), ""), range);
    }
  }

  void start_block(std::string_view label, SourceRange range = {})
  {
    fall_through_to(label);
    current_ = ast_.create<Block>(label, range);
  }

  void add_cmd(Cmd * cmd)
  {
    ensure_open(cmd->get_range());
    cmds_.push_back(cmd);
  }

  /// End the open block (or a fresh unreachable one) with `goto labels`.
  void end_with_goto(const std::vector<std::string_view> & labels, SourceRange range = {})
  {
    ensure_open(range);
    close(ast_.create<GotoCmd>(ast_.copy_to_arena(labels), range));
  }

  void end_with_return(SourceRange range = {})
  {
    ensure_open(range);
    close(ast_.create<ReturnCmd>(range));
  }

  /// Jump to @p label if control can reach the current point.
  void fall_through_to(std::string_view label)
  {
    if (is_open()) {
      close(ast_.create<GotoCmd>(ast_.copy_to_arena(std::vector<std::string_view>{label})));
    }
  }

  void push_loop(std::string_view exit_label) { loopExits_.push_back(exit_label); }
  void pop_loop() { loopExits_.pop_back(); }
  [[nodiscard]] std::optional<std::string_view> innermost_loop_exit() const
  {
    if (loopExits_.empty()) return std::nullopt;
    return loopExits_.back();
  }

  /// Close the body; control reaching the end returns.
  [[nodiscard]] std::vector<Block *> finish(SourceRange end_range)
  {
    if (is_open() || blocks_.empty()) {
      end_with_return(end_range);
    }
    return std::move(blocks_);
  }

private:
  void close(TransferCmd * transfer)
  {
    current_->cmds = ast_.copy_to_arena(cmds_);
    current_->transfer = transfer;
    blocks_.push_back(current_);
    cmds_.clear();
    current_ = nullptr;
  }

  AstContext & ast_;
  Block * current_ = nullptr;
  std::vector<Cmd *> cmds_;
  std::vector<Block *> blocks_;
  std::vector<std::string_view> loopExits_;
  int nextId_ = 0;
};

// ============================================================================
// Token Helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k, size_t lookahead) const { return cur(lookahead).kind == k; }

bool Parser::at_kw(std::string_view kw, size_t lookahead) const
{
  const Token & t = cur(lookahead);
  return t.kind == TokenKind::Identifier && t.text == kw;
}

bool Parser::at_eof() const { return at(TokenKind::Eof); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::match_kw(std::string_view kw)
{
  if (at_kw(kw)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }
  error_at(cur(), fmt::format("expected {}, found {}", what, describe(cur())));
  return false;
}

bool Parser::expect_kw(std::string_view kw)
{
  if (match_kw(kw)) {
    return true;
  }
  error_at(cur(), fmt::format("expected '{}', found {}", kw, describe(cur())));
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  diags_.report_error(t.range, std::string(msg));
}

void Parser::synchronize_to_decl()
{
  while (!at_eof()) {
    const bool top_level = std::any_of(
      k_top_level_keywords.begin(), k_top_level_keywords.end(),
      [this](std::string_view kw) { return at_kw(kw); });
    if (top_level) {
      return;
    }
    advance();
  }
}

void Parser::synchronize_to_stmt()
{
  while (!at_eof()) {
    if (match(TokenKind::Semicolon)) {
      return;
    }
    if (at(TokenKind::RBrace)) {
      return;
    }
    advance();
  }
}

void Parser::expect_end_of_input()
{
  if (!at_eof()) {
    error_at(cur(), fmt::format("unexpected {} after end of input", describe(cur())));
  }
}

SourceRange Parser::range_from(const Token & start) const
{
  if (idx_ == 0) {
    return start.range;
  }
  return join_ranges(start.range, tokens_[std::min(idx_, tokens_.size()) - 1].range);
}

bool Parser::is_reserved(std::string_view ident)
{
  return std::find(k_reserved_words.begin(), k_reserved_words.end(), ident) !=
         k_reserved_words.end();
}

bool Parser::at_identifier(size_t lookahead) const
{
  const Token & t = cur(lookahead);
  return t.kind == TokenKind::Identifier && !is_reserved(t.text);
}

std::optional<std::string_view> Parser::expect_identifier(std::string_view what)
{
  if (at_identifier()) {
    return ast_.intern(advance().text);
  }
  if (cur().kind == TokenKind::Identifier) {
    error_at(cur(), fmt::format("'{}' is a reserved word and cannot be used as {}", cur().text, what));
  } else {
    error_at(cur(), fmt::format("expected {}, found {}", what, describe(cur())));
  }
  return std::nullopt;
}

std::vector<std::string_view> Parser::parse_identifier_list(std::string_view what)
{
  std::vector<std::string_view> names;
  do {
    if (auto name = expect_identifier(what)) {
      names.push_back(*name);
    } else {
      break;
    }
  } while (match(TokenKind::Comma));
  return names;
}

// ============================================================================
// Attributes
// ============================================================================

bool Parser::at_attribute() const { return at(TokenKind::LBrace) && at(TokenKind::Colon, 1); }

gsl::span<Attribute *> Parser::parse_attributes()
{
  std::vector<Attribute *> attrs;
  while (at_attribute()) {
    attrs.push_back(parse_attribute());
  }
  return ast_.copy_to_arena(attrs);
}

Attribute * Parser::parse_attribute()
{
  const Token start = advance();  // {
  advance();                      // :

  std::string_view key;
  if (cur().kind == TokenKind::Identifier) {
    key = ast_.intern(advance().text);
  } else {
    error_at(cur(), fmt::format("expected attribute name, found {}", describe(cur())));
  }

  std::vector<AttributeParam> params;
  if (!at(TokenKind::RBrace)) {
    do {
      if (at(TokenKind::StringLiteral)) {
        params.push_back(AttributeParam{nullptr, ast_.intern(advance().text)});
      } else {
        params.push_back(AttributeParam{parse_expr(), {}});
      }
    } while (match(TokenKind::Comma));
  }
  expect(TokenKind::RBrace, "'}' after attribute");

  auto * attr = ast_.create<Attribute>(key, range_from(start));
  attr->params = ast_.copy_to_arena(params);
  return attr;
}

// ============================================================================
// Top-level
// ============================================================================

Program * Parser::parse_program()
{
  const uint32_t end = tokens_.empty() ? 0 : tokens_.back().end();
  auto * prog = ast_.create<Program>(SourceRange(0U, end));

  std::vector<Decl *> decls;
  while (!at_eof()) {
    const size_t errors_before = diags_.error_count();
    const size_t start_idx = idx_;

    parse_decl(decls);

    if (diags_.error_count() != errors_before) {
      if (idx_ == start_idx) {
        advance();
      }
      synchronize_to_decl();
    }
  }

  prog->decls = ast_.copy_to_arena(decls);
  return prog;
}

Expr * Parser::parse_single_expr()
{
  Expr * e = parse_expr();
  expect_end_of_input();
  return e;
}

Type * Parser::parse_single_type()
{
  Type * t = parse_type();
  expect_end_of_input();
  return t;
}

void Parser::parse_decl(std::vector<Decl *> & out)
{
  const Token start = cur();

  if (match_kw("type")) {
    parse_type_decl(parse_attributes(), start, out);
    return;
  }
  if (match_kw("const")) {
    parse_const_decl(start, out);
    return;
  }
  if (match_kw("var")) {
    parse_var_decl(start, out);
    return;
  }
  if (match_kw("function")) {
    out.push_back(parse_function_decl(start));
    return;
  }
  if (match_kw("axiom")) {
    out.push_back(parse_axiom_decl(start));
    return;
  }
  if (match_kw("procedure")) {
    parse_procedure_decl(start, out);
    return;
  }
  if (match_kw("implementation")) {
    out.push_back(parse_implementation_decl(start));
    return;
  }

  diags_.report_error(start.range, fmt::format("expected a declaration, found {}", describe(start)))
    .with_help(
      "declarations start with type, const, var, function, axiom, procedure or implementation");
}

void Parser::parse_type_decl(
  gsl::span<Attribute *> attrs, const Token & start, std::vector<Decl *> & out)
{
  const Token finite_tok = cur();
  const bool finite = match_kw("finite");
  const std::string_view name = expect_identifier("type name").value_or("");

  std::vector<std::string_view> params;
  while (at_identifier()) {
    params.push_back(ast_.intern(advance().text));
  }

  if (match(TokenKind::Eq)) {
    if (finite) {
      error_at(finite_tok, "a type synonym cannot be declared finite");
    }
    std::vector<TypeVariable *> vars;
    for (std::string_view p : params) {
      vars.push_back(types_.new_type_variable(p));
    }
    Type * body = parse_type();
    expect(TokenKind::Semicolon, "';' after type synonym");

    auto * syn = ast_.create<TypeSynonymDecl>(name, body, range_from(start));
    syn->typeParams = ast_.copy_to_arena(vars);
    syn->attributes = attrs;
    out.push_back(syn);
    return;
  }

  expect(TokenKind::Semicolon, "';' after type declaration");
  auto * ctor = ast_.create<TypeCtorDecl>(name, range_from(start));
  ctor->paramNames = ast_.copy_to_arena(params);
  ctor->finite = finite;
  ctor->attributes = attrs;
  out.push_back(ctor);
}

void Parser::parse_const_decl(const Token & start, std::vector<Decl *> & out)
{
  const auto attrs = parse_attributes();
  const bool unique = match_kw("unique");
  const std::vector<TypedIdent> idents = parse_typed_idents(false);

  struct ParentRef
  {
    std::string_view name;
    SourceRange range;
    bool unique;
  };
  std::optional<std::vector<ParentRef>> parents;
  bool complete = false;

  if (match_kw("extends")) {
    parents.emplace();
    if (!at_kw("complete") && !at(TokenKind::Semicolon)) {
      do {
        const bool parent_unique = match_kw("unique");
        const Token tok = cur();
        if (auto name = expect_identifier("parent constant")) {
          parents->push_back(ParentRef{*name, tok.range, parent_unique});
        }
      } while (match(TokenKind::Comma));
    }
    complete = match_kw("complete");
  }
  expect(TokenKind::Semicolon, "';' after constant declaration");

  for (const TypedIdent & id : idents) {
    const SourceRange range = idents.size() == 1 ? range_from(start) : id.range;
    auto * c = ast_.create<ConstantDecl>(id.name, id.type, unique, range);
    c->attributes = attrs;
    if (parents) {
      // Each constant gets its own parent references
      std::vector<ConstantParent> edges;
      for (const ParentRef & p : *parents) {
        edges.push_back(ConstantParent{ast_.create<IdentifierExpr>(p.name, p.range), p.unique});
      }
      c->parents = ast_.copy_to_arena(edges);
      c->childrenComplete = complete;
    }
    out.push_back(c);
  }
}

void Parser::parse_var_decl(const Token & start, std::vector<Decl *> & out)
{
  const auto attrs = parse_attributes();
  const std::vector<TypedIdent> idents = parse_typed_idents(true);
  expect(TokenKind::Semicolon, "';' after variable declaration");

  for (const TypedIdent & id : idents) {
    const SourceRange range = idents.size() == 1 ? range_from(start) : id.range;
    auto * v = ast_.create<GlobalVarDecl>(id.name, id.type, range);
    v->where = id.where;
    v->attributes = id.attributes.empty() ? attrs : id.attributes;
    out.push_back(v);
  }
}

FunctionDecl * Parser::parse_function_decl(const Token & start)
{
  const auto attrs = parse_attributes();
  const std::string_view name = expect_identifier("function name").value_or("");

  auto * f = ast_.create<FunctionDecl>(name);
  f->attributes = attrs;
  f->typeParams = parse_type_params_opt();
  f->inParams = parse_function_formals(true);

  if (match_kw("returns")) {
    expect(TokenKind::LParen, "'(' after 'returns'");
    FormalDecl * result = parse_var_or_type(false);
    expect(TokenKind::RParen, "')' after function result");
    f->outParams = ast_.copy_to_arena(std::vector<FormalDecl *>{result});
  } else if (match(TokenKind::Colon)) {
    const Token type_start = cur();
    Type * t = parse_type();
    f->outParams = ast_.copy_to_arena(
      std::vector<FormalDecl *>{ast_.create<FormalDecl>("", t, false, range_from(type_start))});
  } else {
    error_at(cur(), fmt::format("expected 'returns' or ':' after function parameters, found {}",
                                describe(cur())));
  }

  if (match(TokenKind::LBrace)) {
    f->body = parse_expr();
    expect(TokenKind::RBrace, "'}' after function body");
  } else {
    expect(TokenKind::Semicolon, "';' or function body");
  }

  f->range_ = range_from(start);
  return f;
}

AxiomDecl * Parser::parse_axiom_decl(const Token & start)
{
  const auto attrs = parse_attributes();
  Expr * e = parse_expr();
  expect(TokenKind::Semicolon, "';' after axiom");
  auto * a = ast_.create<AxiomDecl>(e, range_from(start));
  a->attributes = attrs;
  return a;
}

void Parser::parse_procedure_decl(const Token & start, std::vector<Decl *> & out)
{
  const auto attrs = parse_attributes();
  const std::string_view name = expect_identifier("procedure name").value_or("");

  auto * proc = ast_.create<ProcedureDecl>(name);
  proc->attributes = attrs;
  proc->typeParams = parse_type_params_opt();
  proc->inParams = parse_formals(true, true);
  if (match_kw("returns")) {
    proc->outParams = parse_formals(false, true);
  }

  const bool has_semicolon = match(TokenKind::Semicolon);

  std::vector<Requires *> requires_clauses;
  std::vector<IdentifierExpr *> modifies;
  std::vector<Ensures *> ensures_clauses;
  parse_specs(requires_clauses, modifies, ensures_clauses);
  proc->requiresClauses = ast_.copy_to_arena(requires_clauses);
  proc->modifies = ast_.copy_to_arena(modifies);
  proc->ensuresClauses = ast_.copy_to_arena(ensures_clauses);
  proc->range_ = range_from(start);
  out.push_back(proc);

  if (has_semicolon) {
    return;
  }
  if (!at(TokenKind::LBrace)) {
    error_at(cur(), fmt::format("expected ';' or procedure body, found {}", describe(cur())));
    return;
  }

  // `procedure P() { ... }` also declares an implementation with the same
  // signature (fresh type parameters and formals, no where clauses)
  auto * impl = ast_.create<ImplementationDecl>(name);

  std::vector<TypeVariable *> type_params;
  for (const TypeVariable * v : proc->typeParams) {
    type_params.push_back(types_.new_type_variable(v->name, v->get_range()));
  }
  impl->typeParams = ast_.copy_to_arena(type_params);

  auto copy_formals = [this](gsl::span<FormalDecl *> formals) {
    std::vector<FormalDecl *> copies;
    for (const FormalDecl * f : formals) {
      copies.push_back(ast_.create<FormalDecl>(f->name, f->type, f->incoming, f->get_range()));
    }
    return ast_.copy_to_arena(copies);
  };
  impl->inParams = copy_formals(proc->inParams);
  impl->outParams = copy_formals(proc->outParams);

  std::vector<LocalVarDecl *> locals;
  std::vector<Block *> blocks;
  parse_body(locals, blocks);
  impl->locals = ast_.copy_to_arena(locals);
  impl->blocks = ast_.copy_to_arena(blocks);
  impl->range_ = range_from(start);
  out.push_back(impl);
}

ImplementationDecl * Parser::parse_implementation_decl(const Token & start)
{
  const auto attrs = parse_attributes();
  const std::string_view name = expect_identifier("procedure name").value_or("");

  auto * impl = ast_.create<ImplementationDecl>(name);
  impl->attributes = attrs;
  impl->typeParams = parse_type_params_opt();
  impl->inParams = parse_formals(true, false);
  if (match_kw("returns")) {
    impl->outParams = parse_formals(false, false);
  }

  std::vector<LocalVarDecl *> locals;
  std::vector<Block *> blocks;
  parse_body(locals, blocks);
  impl->locals = ast_.copy_to_arena(locals);
  impl->blocks = ast_.copy_to_arena(blocks);
  impl->range_ = range_from(start);
  return impl;
}

// ============================================================================
// Formals and Type Parameters
// ============================================================================

gsl::span<TypeVariable *> Parser::parse_type_params_opt()
{
  if (!match(TokenKind::Lt)) {
    return {};
  }
  std::vector<TypeVariable *> vars;
  do {
    const Token tok = cur();
    if (auto name = expect_identifier("type parameter")) {
      vars.push_back(types_.new_type_variable(*name, tok.range));
    }
  } while (match(TokenKind::Comma));
  expect(TokenKind::Gt, "'>' after type parameters");
  return ast_.copy_to_arena(vars);
}

std::vector<Parser::TypedIdent> Parser::parse_typed_idents(bool allow_where)
{
  std::vector<TypedIdent> out;
  do {
    const auto attrs = parse_attributes();

    std::vector<std::pair<std::string_view, SourceRange>> names;
    do {
      const Token tok = cur();
      if (auto name = expect_identifier("variable name")) {
        names.emplace_back(*name, tok.range);
      } else {
        return out;
      }
    } while (match(TokenKind::Comma));

    if (!expect(TokenKind::Colon, "':' and a type")) {
      return out;
    }
    Type * type = parse_type();

    Expr * where = nullptr;
    const Token where_tok = cur();
    if (match_kw("where")) {
      where = parse_expr();
      if (!allow_where) {
        error_at(where_tok, "where clauses are not allowed here");
      }
    }

    for (const auto & [name, range] : names) {
      out.push_back(TypedIdent{name, range, type, where, attrs});
    }
  } while (match(TokenKind::Comma));
  return out;
}

gsl::span<FormalDecl *> Parser::parse_formals(bool incoming, bool allow_where)
{
  std::vector<FormalDecl *> formals;
  if (!expect(TokenKind::LParen, "'(' before parameters")) {
    return {};
  }
  if (!at(TokenKind::RParen)) {
    for (const TypedIdent & id : parse_typed_idents(allow_where)) {
      auto * f = ast_.create<FormalDecl>(id.name, id.type, incoming, id.range);
      f->where = id.where;
      f->attributes = id.attributes;
      formals.push_back(f);
    }
  }
  expect(TokenKind::RParen, "')' after parameters");
  return ast_.copy_to_arena(formals);
}

gsl::span<FormalDecl *> Parser::parse_function_formals(bool incoming)
{
  std::vector<FormalDecl *> formals;
  if (!expect(TokenKind::LParen, "'(' before parameters")) {
    return {};
  }
  if (!at(TokenKind::RParen)) {
    do {
      formals.push_back(parse_var_or_type(incoming));
    } while (match(TokenKind::Comma));
  }
  expect(TokenKind::RParen, "')' after parameters");
  return ast_.copy_to_arena(formals);
}

FormalDecl * Parser::parse_var_or_type(bool incoming)
{
  const auto attrs = parse_attributes();
  const Token start = cur();

  std::string_view name;
  if (at_identifier() && at(TokenKind::Colon, 1)) {
    name = ast_.intern(advance().text);
    advance();  // :
  }
  Type * type = parse_type();

  auto * f = ast_.create<FormalDecl>(name, type, incoming, range_from(start));
  f->attributes = attrs;
  return f;
}

// ============================================================================
// Procedure Specifications
// ============================================================================

void Parser::parse_specs(
  std::vector<Requires *> & requires_clauses, std::vector<IdentifierExpr *> & modifies,
  std::vector<Ensures *> & ensures_clauses)
{
  while (true) {
    const Token start = cur();
    const bool is_free = match_kw("free");

    if (match_kw("requires")) {
      const auto attrs = parse_attributes();
      Expr * e = parse_expr();
      expect(TokenKind::Semicolon, "';' after precondition");
      auto * r = ast_.create<Requires>(is_free, e, range_from(start));
      r->attributes = attrs;
      requires_clauses.push_back(r);
      continue;
    }

    if (match_kw("ensures")) {
      const auto attrs = parse_attributes();
      Expr * e = parse_expr();
      expect(TokenKind::Semicolon, "';' after postcondition");
      auto * en = ast_.create<Ensures>(is_free, e, range_from(start));
      en->attributes = attrs;
      ensures_clauses.push_back(en);
      continue;
    }

    if (match_kw("modifies")) {
      if (is_free) {
        error_at(start, "'free' must be followed by 'requires' or 'ensures'");
      }
      if (!at(TokenKind::Semicolon)) {
        do {
          const Token tok = cur();
          if (auto name = expect_identifier("modified variable")) {
            modifies.push_back(ast_.create<IdentifierExpr>(*name, tok.range));
          }
        } while (match(TokenKind::Comma));
      }
      expect(TokenKind::Semicolon, "';' after modifies clause");
      continue;
    }

    if (is_free) {
      error_at(start, "'free' must be followed by 'requires' or 'ensures'");
    }
    return;
  }
}

// ============================================================================
// Implementation Bodies
// ============================================================================

void Parser::parse_body(std::vector<LocalVarDecl *> & locals, std::vector<Block *> & blocks)
{
  if (!expect(TokenKind::LBrace, "'{' before implementation body")) {
    return;
  }

  while (at_kw("var")) {
    advance();
    const auto attrs = parse_attributes();
    for (const TypedIdent & id : parse_typed_idents(true)) {
      auto * local = ast_.create<LocalVarDecl>(id.name, id.type, id.range);
      local->where = id.where;
      local->attributes = id.attributes.empty() ? attrs : id.attributes;
      locals.push_back(local);
    }
    expect(TokenKind::Semicolon, "';' after local variable declaration");
  }

  BodyBuilder body(ast_);
  parse_stmt_list(body);

  const Token end = cur();
  expect(TokenKind::RBrace, "'}' after implementation body");
  blocks = body.finish(end.range);
}

void Parser::parse_stmt_list(BodyBuilder & body)
{
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const size_t start_idx = idx_;
    const size_t errors_before = diags_.error_count();

    parse_stmt(body);

    if (diags_.error_count() != errors_before) {
      synchronize_to_stmt();
    }
    if (idx_ == start_idx) {
      advance();
    }
  }
}

void Parser::parse_stmt(BodyBuilder & body)
{
  const Token start = cur();

  // Label `L:`
  if (at_identifier() && at(TokenKind::Colon, 1)) {
    const std::string_view label = ast_.intern(advance().text);
    advance();
    body.start_block(label, start.range);
    return;
  }

  if (match_kw("assert") || match_kw("assume")) {
    const bool is_assert = start.text == "assert";
    const auto attrs = parse_attributes();
    Expr * e = parse_expr();
    expect(TokenKind::Semicolon, is_assert ? "';' after assertion" : "';' after assumption");
    if (is_assert) {
      auto * a = ast_.create<AssertCmd>(e, range_from(start));
      a->attributes = attrs;
      body.add_cmd(a);
    } else {
      auto * a = ast_.create<AssumeCmd>(e, range_from(start));
      a->attributes = attrs;
      body.add_cmd(a);
    }
    return;
  }

  if (at_kw("havoc")) {
    body.add_cmd(parse_havoc_cmd());
    return;
  }

  if (at_kw("call")) {
    body.add_cmd(parse_call_cmd());
    return;
  }

  if (match_kw("goto")) {
    const auto labels = parse_identifier_list("label");
    expect(TokenKind::Semicolon, "';' after goto");
    body.end_with_goto(labels, range_from(start));
    return;
  }

  if (match_kw("return")) {
    expect(TokenKind::Semicolon, "';' after return");
    body.end_with_return(range_from(start));
    return;
  }

  if (at_kw("if")) {
    parse_if_stmt(body);
    return;
  }

  if (at_kw("while")) {
    parse_while_stmt(body);
    return;
  }

  if (match_kw("break")) {
    expect(TokenKind::Semicolon, "';' after break");
    if (auto exit = body.innermost_loop_exit()) {
      body.end_with_goto({*exit}, range_from(start));
    } else {
      error_at(start, "break statement is not inside a loop");
    }
    return;
  }

  if (at_identifier()) {
    body.add_cmd(parse_assign_cmd());
    return;
  }

  error_at(start, fmt::format("expected a statement, found {}", describe(start)));
}

Expr * Parser::parse_guard()
{
  expect(TokenKind::LParen, "'(' before condition");
  Expr * guard = nullptr;
  if (at(TokenKind::Star) && at(TokenKind::RParen, 1)) {
    advance();
  } else {
    guard = parse_expr();
  }
  expect(TokenKind::RParen, "')' after condition");
  return guard;
}

Expr * Parser::reparse_guard(size_t guard_start)
{
  const size_t saved = idx_;
  idx_ = guard_start;
  Expr * guard = parse_guard();
  idx_ = saved;
  return guard;
}

void Parser::parse_if_stmt(BodyBuilder & body)
{
  const Token start = advance();  // if
  const size_t guard_start = idx_;
  const size_t errors_before = diags_.error_count();
  Expr * guard = parse_guard();
  const bool guard_ok = diags_.error_count() == errors_before;

  body.ensure_open(start.range);
  const int id = body.next_id();
  const std::string_view then_label = body.fresh_label(id, "_Then");
  const std::string_view else_label = body.fresh_label(id, "_Else");
  const std::string_view join_label = body.fresh_label(body.next_id(), "");

  body.end_with_goto({then_label, else_label}, start.range);

  body.start_block(then_label, start.range);
  if (guard) {
    body.add_cmd(ast_.create<AssumeCmd>(guard, guard->get_range()));
  }
  expect(TokenKind::LBrace, "'{' after if condition");
  parse_stmt_list(body);
  expect(TokenKind::RBrace, "'}' after then branch");
  body.fall_through_to(join_label);

  body.start_block(else_label, start.range);
  if (guard) {
    // The negated guard needs nodes of its own
    Expr * negated = guard_ok ? reparse_guard(guard_start) : make_missing_expr_at(start);
    body.add_cmd(ast_.create<AssumeCmd>(
      ast_.create<UnaryExpr>(UnaryOp::Not, negated, negated->get_range()), guard->get_range()));
  }
  if (match_kw("else")) {
    if (at_kw("if")) {
      parse_if_stmt(body);
    } else {
      expect(TokenKind::LBrace, "'{' after else");
      parse_stmt_list(body);
      expect(TokenKind::RBrace, "'}' after else branch");
    }
  }
  body.fall_through_to(join_label);

  body.start_block(join_label, range_from(start));
}

void Parser::parse_while_stmt(BodyBuilder & body)
{
  const Token start = advance();  // while
  const size_t guard_start = idx_;
  const size_t errors_before = diags_.error_count();
  Expr * guard = parse_guard();
  const bool guard_ok = diags_.error_count() == errors_before;

  struct Invariant
  {
    bool isFree;
    Expr * expr;
    gsl::span<Attribute *> attributes;
    SourceRange range;
  };
  std::vector<Invariant> invariants;
  while (at_kw("invariant") || (at_kw("free") && at_kw("invariant", 1))) {
    const Token inv_start = cur();
    const bool is_free = match_kw("free");
    advance();  // invariant
    const auto attrs = parse_attributes();
    Expr * e = parse_expr();
    expect(TokenKind::Semicolon, "';' after loop invariant");
    invariants.push_back(Invariant{is_free, e, attrs, range_from(inv_start)});
  }

  body.ensure_open(start.range);
  const int id = body.next_id();
  const std::string_view head_label = body.fresh_label(id, "_LoopHead");
  const std::string_view body_label = body.fresh_label(id, "_LoopBody");
  const std::string_view done_label = body.fresh_label(id, "_LoopDone");

  body.start_block(head_label, start.range);
  for (const Invariant & inv : invariants) {
    if (inv.isFree) {
      auto * a = ast_.create<AssumeCmd>(inv.expr, inv.range);
      a->attributes = inv.attributes;
      body.add_cmd(a);
    } else {
      auto * a = ast_.create<AssertCmd>(inv.expr, inv.range);
      a->attributes = inv.attributes;
      body.add_cmd(a);
    }
  }
  body.end_with_goto({body_label, done_label}, start.range);

  body.start_block(body_label, start.range);
  if (guard) {
    body.add_cmd(ast_.create<AssumeCmd>(guard, guard->get_range()));
  }
  body.push_loop(done_label);
  expect(TokenKind::LBrace, "'{' before loop body");
  parse_stmt_list(body);
  expect(TokenKind::RBrace, "'}' after loop body");
  body.pop_loop();
  body.fall_through_to(head_label);

  body.start_block(done_label, range_from(start));
  if (guard) {
    Expr * negated = guard_ok ? reparse_guard(guard_start) : make_missing_expr_at(start);
    body.add_cmd(ast_.create<AssumeCmd>(
      ast_.create<UnaryExpr>(UnaryOp::Not, negated, negated->get_range()), guard->get_range()));
  }
}

// ============================================================================
// Commands
// ============================================================================

Cmd * Parser::parse_assign_cmd()
{
  const Token start = cur();
  std::vector<AssignLhs *> lhss;
  do {
    lhss.push_back(parse_assign_lhs());
  } while (match(TokenKind::Comma));

  expect(TokenKind::ColonEq, "':=' in assignment");

  std::vector<Expr *> rhss;
  do {
    rhss.push_back(parse_expr());
  } while (match(TokenKind::Comma));
  expect(TokenKind::Semicolon, "';' after assignment");

  return ast_.create<AssignCmd>(
    ast_.copy_to_arena(lhss), ast_.copy_to_arena(rhss), range_from(start));
}

AssignLhs * Parser::parse_assign_lhs()
{
  const Token start = cur();
  const std::string_view name = expect_identifier("assignment target").value_or("");
  AssignLhs * lhs = ast_.create<SimpleAssignLhs>(
    ast_.create<IdentifierExpr>(name, start.range), start.range);

  while (match(TokenKind::LBracket)) {
    std::vector<Expr *> indices;
    if (!at(TokenKind::RBracket)) {
      do {
        indices.push_back(parse_expr());
      } while (match(TokenKind::Comma));
    }
    expect(TokenKind::RBracket, "']' after map index");
    lhs = ast_.create<MapAssignLhs>(lhs, ast_.copy_to_arena(indices), range_from(start));
  }
  return lhs;
}

CallCmd * Parser::parse_call_cmd()
{
  const Token start = advance();  // call
  const auto attrs = parse_attributes();

  std::vector<IdentifierExpr *> outs;
  const Token first = cur();
  std::string_view callee = expect_identifier("procedure name").value_or("");

  if (!at(TokenKind::LParen)) {
    // `call a, b := P(...)`
    outs.push_back(ast_.create<IdentifierExpr>(callee, first.range));
    while (match(TokenKind::Comma)) {
      const Token tok = cur();
      if (auto name = expect_identifier("call output")) {
        outs.push_back(ast_.create<IdentifierExpr>(*name, tok.range));
      }
    }
    expect(TokenKind::ColonEq, "':=' after call outputs");
    callee = expect_identifier("procedure name").value_or("");
  }

  auto * call = ast_.create<CallCmd>(callee);
  if (expect(TokenKind::LParen, "'(' after procedure name")) {
    call->ins = parse_expr_list(TokenKind::RParen);
    expect(TokenKind::RParen, "')' after call arguments");
  }
  expect(TokenKind::Semicolon, "';' after call");

  call->outs = ast_.copy_to_arena(outs);
  call->attributes = attrs;
  call->range_ = range_from(start);
  return call;
}

HavocCmd * Parser::parse_havoc_cmd()
{
  const Token start = advance();  // havoc
  std::vector<IdentifierExpr *> vars;
  do {
    const Token tok = cur();
    if (auto name = expect_identifier("havoc target")) {
      vars.push_back(ast_.create<IdentifierExpr>(*name, tok.range));
    }
  } while (match(TokenKind::Comma));
  expect(TokenKind::Semicolon, "';' after havoc");
  return ast_.create<HavocCmd>(ast_.copy_to_arena(vars), range_from(start));
}

// ============================================================================
// Types
// ============================================================================

std::optional<uint32_t> Parser::bv_width(std::string_view name) const
{
  if (name.size() <= 2 || name.substr(0, 2) != "bv") {
    return std::nullopt;
  }
  return parse_number<uint32_t>(name.substr(2));
}

Type * Parser::parse_type()
{
  if (at(TokenKind::LBracket) || at(TokenKind::Lt)) {
    return parse_map_type();
  }
  if (!at_identifier()) {
    return parse_type_atom();
  }

  const Token start = advance();
  if (auto bits = bv_width(start.text)) {
    return types_.bv_type(*bits);
  }

  // Constructor application `C a (D b) [int]bool`: a map type can only be
  // the last argument
  std::vector<Type *> args;
  while (true) {
    if (at(TokenKind::LBracket) || at(TokenKind::Lt)) {
      args.push_back(parse_map_type());
      break;
    }
    if (at_kw("int") || at_kw("bool") || at(TokenKind::LParen)) {
      args.push_back(parse_type_atom());
      continue;
    }
    if (at_identifier()) {
      const Token & arg = advance();
      if (auto bits = bv_width(arg.text)) {
        args.push_back(types_.bv_type(*bits));
      } else {
        args.push_back(types_.unresolved_type(ast_.intern(arg.text), {}, arg.range));
      }
      continue;
    }
    break;
  }

  return types_.unresolved_type(
    ast_.intern(start.text), types_.copy_to_arena(args), range_from(start));
}

Type * Parser::parse_type_atom()
{
  if (match_kw("int")) {
    return types_.int_type();
  }
  if (match_kw("bool")) {
    return types_.bool_type();
  }
  if (at_identifier()) {
    const Token & t = advance();
    if (auto bits = bv_width(t.text)) {
      return types_.bv_type(*bits);
    }
    return types_.unresolved_type(ast_.intern(t.text), {}, t.range);
  }
  if (match(TokenKind::LParen)) {
    Type * t = parse_type();
    expect(TokenKind::RParen, "')' after type");
    return t;
  }

  error_at(cur(), fmt::format("expected a type, found {}", describe(cur())));
  return types_.bool_type();
}

Type * Parser::parse_map_type()
{
  const Token start = cur();
  const auto params = parse_type_params_opt();

  std::vector<Type *> args;
  expect(TokenKind::LBracket, "'[' in map type");
  if (!at(TokenKind::RBracket)) {
    do {
      args.push_back(parse_type());
    } while (match(TokenKind::Comma));
  }
  expect(TokenKind::RBracket, "']' in map type");
  Type * result = parse_type();

  return types_.map_type(params, types_.copy_to_arena(args), result, range_from(start));
}

// ============================================================================
// Expressions
// ============================================================================

BinaryExpr * Parser::make_binary(Expr * lhs, BinaryOp op, Expr * rhs)
{
  return ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
}

Expr * Parser::parse_expr()
{
  Expr * lhs = parse_implies();
  while (match(TokenKind::Iff)) {
    lhs = make_binary(lhs, BinaryOp::Iff, parse_implies());
  }
  return lhs;
}

Expr * Parser::parse_implies()
{
  Expr * lhs = parse_and_or();
  if (match(TokenKind::Implies)) {
    // right associative
    return make_binary(lhs, BinaryOp::Imp, parse_implies());
  }
  return lhs;
}

Expr * Parser::parse_and_or()
{
  Expr * lhs = parse_relation();
  if (!at(TokenKind::AndAnd) && !at(TokenKind::OrOr)) {
    return lhs;
  }

  const TokenKind first = cur().kind;
  bool mixed_reported = false;
  while (at(TokenKind::AndAnd) || at(TokenKind::OrOr)) {
    const Token & op_tok = advance();
    if (op_tok.kind != first && !mixed_reported) {
      error_at(op_tok, "mixing '&&' and '||' requires parentheses");
      mixed_reported = true;
    }
    const BinaryOp op = op_tok.kind == TokenKind::AndAnd ? BinaryOp::And : BinaryOp::Or;
    lhs = make_binary(lhs, op, parse_relation());
  }
  return lhs;
}

Expr * Parser::parse_relation()
{
  Expr * lhs = parse_concat();
  const auto op = relation_op(cur().kind);
  if (!op) {
    return lhs;
  }
  advance();
  Expr * out = make_binary(lhs, *op, parse_concat());

  // Reject chaining: a < b < c
  if (relation_op(cur().kind)) {
    error_at(cur(), "chained relational operators are not allowed");
  }
  return out;
}

Expr * Parser::parse_concat()
{
  Expr * lhs = parse_additive();
  while (match(TokenKind::PlusPlus)) {
    lhs = make_binary(lhs, BinaryOp::Concat, parse_additive());
  }
  return lhs;
}

Expr * Parser::parse_additive()
{
  Expr * lhs = parse_multiplicative();
  while (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const BinaryOp op = advance().kind == TokenKind::Plus ? BinaryOp::Add : BinaryOp::Sub;
    lhs = make_binary(lhs, op, parse_multiplicative());
  }
  return lhs;
}

Expr * Parser::parse_multiplicative()
{
  Expr * lhs = parse_unary();
  while (true) {
    BinaryOp op = BinaryOp::Mul;
    if (at(TokenKind::Star)) {
      op = BinaryOp::Mul;
    } else if (at_kw("div")) {
      op = BinaryOp::Div;
    } else if (at_kw("mod")) {
      op = BinaryOp::Mod;
    } else {
      break;
    }
    advance();
    lhs = make_binary(lhs, op, parse_unary());
  }
  return lhs;
}

Expr * Parser::parse_unary()
{
  if (at(TokenKind::Bang) || at(TokenKind::Minus)) {
    const Token op = advance();
    Expr * e = parse_unary();
    return ast_.create<UnaryExpr>(
      op.kind == TokenKind::Bang ? UnaryOp::Not : UnaryOp::Neg, e,
      join_ranges(op.range, e->get_range()));
  }
  return parse_postfix();
}

Expr * Parser::parse_postfix()
{
  Expr * e = parse_primary();

  while (at(TokenKind::LBracket)) {
    advance();

    // Bit-vector extraction `e[hi:lo]`
    if (at(TokenKind::IntLiteral) && at(TokenKind::Colon, 1)) {
      const Token hi_tok = advance();
      advance();  // :
      const Token lo_tok = cur();
      expect(TokenKind::IntLiteral, "lower bound of bit-vector extraction");
      expect(TokenKind::RBracket, "']' after bit-vector extraction");
      const auto hi = parse_number<uint32_t>(hi_tok.text);
      const auto lo = parse_number<uint32_t>(lo_tok.text);
      if (!hi || !lo) {
        error_at(hi_tok, "bit-vector extraction bounds out of range");
      }
      e = ast_.create<BvExtractExpr>(
        e, hi.value_or(0), lo.value_or(0), join_ranges(e->get_range(), range_from(hi_tok)));
      continue;
    }

    std::vector<Expr *> indices;
    if (!at(TokenKind::RBracket) && !at(TokenKind::ColonEq)) {
      do {
        indices.push_back(parse_expr());
      } while (match(TokenKind::Comma));
    }

    if (match(TokenKind::ColonEq)) {
      Expr * value = parse_expr();
      expect(TokenKind::RBracket, "']' after map update");
      e = ast_.create<MapStoreExpr>(
        e, ast_.copy_to_arena(indices), value, join_ranges(e->get_range(), tokens_[idx_ - 1].range));
    } else {
      expect(TokenKind::RBracket, "']' after map index");
      e = ast_.create<MapSelectExpr>(
        e, ast_.copy_to_arena(indices), join_ranges(e->get_range(), tokens_[idx_ - 1].range));
    }
  }
  return e;
}

Expr * Parser::parse_primary()
{
  const Token t = cur();

  if (match(TokenKind::IntLiteral)) {
    const auto v = parse_number<int64_t>(t.text);
    if (!v) {
      error_at(t, fmt::format("integer literal out of range: {}", t.text));
    }
    return ast_.create<IntLiteralExpr>(v.value_or(0), t.range);
  }

  if (match(TokenKind::BvLiteral)) {
    const size_t split = t.text.find("bv");
    const std::string_view digits = t.text.substr(0, split);
    const auto bits = parse_number<uint32_t>(t.text.substr(split + 2));
    if (!bits) {
      error_at(t, fmt::format("bit-vector width out of range: {}", t.text));
    }
    return ast_.create<BvLiteralExpr>(ast_.intern(digits), bits.value_or(0), t.range);
  }

  if (match_kw("true")) {
    return ast_.create<BoolLiteralExpr>(true, t.range);
  }
  if (match_kw("false")) {
    return ast_.create<BoolLiteralExpr>(false, t.range);
  }

  if (match_kw("old")) {
    expect(TokenKind::LParen, "'(' after 'old'");
    Expr * e = parse_expr();
    expect(TokenKind::RParen, "')' after old expression");
    return ast_.create<OldExpr>(e, range_from(t));
  }

  if (at_kw("if")) {
    return parse_if_then_else();
  }

  if (at(TokenKind::LParen)) {
    if (at_kw("forall", 1) || at_kw("exists", 1)) {
      advance();
      return parse_quantifier(t);
    }
    advance();
    Expr * e = parse_expr();
    expect(TokenKind::RParen, "')' after expression");
    return e;
  }

  if (at_identifier()) {
    const std::string_view name = ast_.intern(advance().text);
    if (match(TokenKind::LParen)) {
      auto args = parse_expr_list(TokenKind::RParen);
      expect(TokenKind::RParen, "')' after function arguments");
      return ast_.create<FunctionCallExpr>(name, args, range_from(t));
    }
    return ast_.create<IdentifierExpr>(name, t.range);
  }

  error_at(t, fmt::format("expected an expression, found {}", describe(t)));
  return make_missing_expr_at(t);
}

Expr * Parser::parse_quantifier(const Token & open)
{
  const QuantifierKind kind =
    advance().text == "forall" ? QuantifierKind::Forall : QuantifierKind::Exists;

  auto * q = ast_.create<QuantifierExpr>(kind);
  q->typeParams = parse_type_params_opt();

  std::vector<BoundVarDecl *> vars;
  for (const TypedIdent & id : parse_typed_idents(true)) {
    auto * v = ast_.create<BoundVarDecl>(id.name, id.type, id.range);
    v->where = id.where;
    v->attributes = id.attributes;
    vars.push_back(v);
  }
  q->vars = ast_.copy_to_arena(vars);
  expect(TokenKind::ColonColon, "'::' after bound variables");

  std::vector<Attribute *> attrs;
  std::vector<Trigger *> triggers;
  while (at(TokenKind::LBrace)) {
    if (at_attribute()) {
      attrs.push_back(parse_attribute());
      continue;
    }
    const Token start = advance();
    auto exprs = parse_expr_list(TokenKind::RBrace);
    expect(TokenKind::RBrace, "'}' after trigger");
    triggers.push_back(ast_.create<Trigger>(exprs, range_from(start)));
  }
  q->attributes = ast_.copy_to_arena(attrs);
  q->triggers = ast_.copy_to_arena(triggers);

  q->body = parse_expr();
  expect(TokenKind::RParen, "')' after quantifier body");
  q->range_ = range_from(open);
  return q;
}

Expr * Parser::parse_if_then_else()
{
  const Token start = advance();  // if
  Expr * cond = parse_expr();
  expect_kw("then");
  Expr * then_expr = parse_expr();
  expect_kw("else");
  Expr * else_expr = parse_expr();
  return ast_.create<IfThenElseExpr>(cond, then_expr, else_expr, range_from(start));
}

gsl::span<Expr *> Parser::parse_expr_list(TokenKind close)
{
  std::vector<Expr *> exprs;
  if (!at(close)) {
    do {
      exprs.push_back(parse_expr());
    } while (match(TokenKind::Comma));
  }
  return ast_.copy_to_arena(exprs);
}

Expr * Parser::make_missing_expr_at(const Token & t) { return ast_.create<MissingExpr>(t.range); }

}  // namespace ivl::syntax
