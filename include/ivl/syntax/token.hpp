// ivl/syntax/token.hpp - Lexical tokens of the surface syntax
//
#pragma once

#include <cstdint>
#include <string_view>

#include "ivl/basic/source_manager.hpp"

namespace ivl::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  Identifier,     // also keywords; the parser tells them apart
  IntLiteral,     // 42
  BvLiteral,      // 5bv8 (text is the whole literal)
  StringLiteral,  // token.text is the string *contents* (without quotes)

  // Punctuation
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Colon,
  ColonColon,  // ::
  ColonEq,     // :=
  Semicolon,

  // Operators
  Bang,
  Plus,
  Minus,
  Star,
  PlusPlus,  // ++

  Iff,      // <==>
  Implies,  // ==>
  AndAnd,
  OrOr,

  Eq,  // =
  EqEq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,
  Subtype,  // <:
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the original source (including quotes for strings)
  std::string_view text;  // slice view (for StringLiteral: interior)

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "integer";
    case TokenKind::BvLiteral:
      return "bit-vector literal";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Colon:
      return ":";
    case TokenKind::ColonColon:
      return "::";
    case TokenKind::ColonEq:
      return ":=";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Bang:
      return "!";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::PlusPlus:
      return "++";
    case TokenKind::Iff:
      return "<==>";
    case TokenKind::Implies:
      return "==>";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::Eq:
      return "=";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
    case TokenKind::Subtype:
      return "<:";
  }
  return "";
}

}  // namespace ivl::syntax
