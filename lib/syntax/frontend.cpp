// ivl/syntax/frontend.cpp - High-level parse pipeline
#include "ivl/syntax/frontend.hpp"

#include <fstream>
#include <sstream>

#include "ivl/syntax/lexer.hpp"
#include "ivl/syntax/parser.hpp"

namespace ivl
{

std::unique_ptr<ParsedUnit> parse_source(std::string source_text, std::filesystem::path path)
{
  auto unit = std::make_unique<ParsedUnit>();
  unit->source = path.empty() ? SourceManager(std::move(source_text))
                              : SourceManager(std::move(path), std::move(source_text));

  syntax::Lexer lexer(unit->source.get_source());
  syntax::Parser parser(unit->ast, unit->types, unit->diags, lexer.lex_all());
  unit->program = parser.parse_program();
  return unit;
}

std::unique_ptr<ParsedUnit> parse_file(const std::filesystem::path & path)
{
  std::ifstream file(path);
  if (!file.is_open()) {
    auto unit = std::make_unique<ParsedUnit>();
    unit->source.set_file_path(path);
    unit->diags.report_error(SourceRange{}, "cannot open file: " + path.string());
    unit->program = unit->ast.create<Program>();
    return unit;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse_source(buffer.str(), path);
}

Expr * parse_expression(
  std::string_view text, AstContext & ast, TypeContext & types, DiagnosticBag & diags)
{
  // Token text is interned by the parser, so the lexer may borrow `text`
  syntax::Lexer lexer(text);
  syntax::Parser parser(ast, types, diags, lexer.lex_all());
  return parser.parse_single_expr();
}

Type * parse_type(
  std::string_view text, AstContext & ast, TypeContext & types, DiagnosticBag & diags)
{
  syntax::Lexer lexer(text);
  syntax::Parser parser(ast, types, diags, lexer.lex_all());
  return parser.parse_single_type();
}

}  // namespace ivl
