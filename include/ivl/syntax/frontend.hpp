// ivl/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "ivl/ast/ast.hpp"
#include "ivl/ast/ast_context.hpp"
#include "ivl/basic/diagnostic.hpp"
#include "ivl/basic/source_manager.hpp"
#include "ivl/sema/types/type.hpp"

namespace ivl
{

/**
 * Everything produced by parsing one input: the source text, the arenas
 * the AST and its types live in, and the parse diagnostics.
 *
 * Later passes (resolution, type checking, loop extraction) keep working
 * on the same contexts.
 */
struct ParsedUnit
{
  SourceManager source;
  AstContext ast;
  TypeContext types;
  DiagnosticBag diags;
  Program * program = nullptr;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_source(
  std::string source_text, std::filesystem::path path = {});

/// Read and parse @p path. An unreadable file yields an empty program and an error.
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_file(const std::filesystem::path & path);

/// Parse a standalone expression into existing contexts.
[[nodiscard]] Expr * parse_expression(
  std::string_view text, AstContext & ast, TypeContext & types, DiagnosticBag & diags);

/// Parse a standalone type into existing contexts.
[[nodiscard]] Type * parse_type(
  std::string_view text, AstContext & ast, TypeContext & types, DiagnosticBag & diags);

}  // namespace ivl
