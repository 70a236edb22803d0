// ivl/syntax/lexer.cpp - Tokenizer for the surface syntax
#include "ivl/syntax/lexer.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace ivl::syntax
{
namespace
{

bool is_ident_start(unsigned char c)
{
  return (std::isalpha(c) != 0) || c == '_' || c == '$' || c == '#' || c == '\'' || c == '~' ||
         c == '^' || c == '?';
}

bool is_ident_continue(unsigned char c)
{
  return is_ident_start(c) || (std::isdigit(c) != 0) || c == '.';
}

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

/// Operators, longest first so that prefixes never shadow a longer match.
constexpr std::array<std::pair<std::string_view, TokenKind>, 14> k_operators = {{
  {"<==>", TokenKind::Iff},
  {"==>", TokenKind::Implies},
  {"::", TokenKind::ColonColon},
  {":=", TokenKind::ColonEq},
  {"++", TokenKind::PlusPlus},
  {"&&", TokenKind::AndAnd},
  {"||", TokenKind::OrOr},
  {"==", TokenKind::EqEq},
  {"!=", TokenKind::Ne},
  {"<=", TokenKind::Le},
  {">=", TokenKind::Ge},
  {"<:", TokenKind::Subtype},
  {"(", TokenKind::LParen},
  {")", TokenKind::RParen},
}};

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

bool Lexer::skip_trivia()
{
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance(1);
      continue;
    }
    if (starts_with("//")) {
      while (!eof() && peek() != '\n') {
        advance(1);
      }
      continue;
    }
    if (starts_with("/*")) {
      // Block comments nest
      advance(2);
      int depth = 1;
      while (!eof() && depth > 0) {
        if (starts_with("/*")) {
          ++depth;
          advance(2);
        } else if (starts_with("*/")) {
          --depth;
          advance(2);
        } else {
          advance(1);
        }
      }
      if (depth > 0) return false;
      continue;
    }
    break;
  }
  return true;
}

Token Lexer::lex_identifier()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);
  while (!eof() && is_digit(peek())) {
    advance(1);
  }

  // Bit-vector literal: <digits>bv<digits>
  if (peek() == 'b' && peek(1) == 'v' && is_digit(peek(2))) {
    advance(2);
    while (!eof() && is_digit(peek())) {
      advance(1);
    }
    // Trailing identifier characters make the whole thing malformed
    if (!eof() && is_ident_continue(static_cast<unsigned char>(peek())) && peek() != '.') {
      while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
        advance(1);
      }
      return make_token(TokenKind::Unknown, start);
    }
    return make_token(TokenKind::BvLiteral, start);
  }

  if (!eof() && is_ident_start(static_cast<unsigned char>(peek()))) {
    while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
    return make_token(TokenKind::Unknown, start);
  }
  return make_token(TokenKind::IntLiteral, start);
}

Token Lexer::lex_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  // opening quote
  advance(1);
  const auto payload_start = static_cast<uint32_t>(pos_);

  while (!eof() && peek() != '"') {
    // Raw newlines are not allowed inside string literals.
    if (peek() == '\n' || peek() == '\r') {
      advance(1);
      return make_token(TokenKind::Unknown, start);
    }
    if (peek() == '\\' && pos_ + 1 < src_.size()) {
      advance(1);
    }
    advance(1);
  }

  if (eof()) {
    return make_token(TokenKind::Unknown, start);
  }

  const auto payload_end = static_cast<uint32_t>(pos_);
  advance(1);  // closing quote

  Token t = make_token(TokenKind::StringLiteral, start);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Token Lexer::next_token()
{
  if (!skip_trivia()) {
    // Unterminated block comment swallows the rest of the input
    const auto at = static_cast<uint32_t>(src_.size());
    return {TokenKind::Unknown, SourceRange(at, at), {}};
  }

  if (eof()) {
    const auto at = static_cast<uint32_t>(src_.size());
    return {TokenKind::Eof, SourceRange(at, at), {}};
  }

  const auto c = static_cast<unsigned char>(peek());
  if (is_ident_start(c)) {
    return lex_identifier();
  }
  if (std::isdigit(c) != 0) {
    return lex_number();
  }
  if (c == '"') {
    return lex_string();
  }

  const auto start = static_cast<uint32_t>(pos_);

  for (const auto & [text, kind] : k_operators) {
    if (starts_with(text)) {
      advance(text.size());
      return make_token(kind, start);
    }
  }

  // Single-char tokens
  const char ch = peek();
  advance(1);

  switch (ch) {
    case '{':
      return make_token(TokenKind::LBrace, start);
    case '}':
      return make_token(TokenKind::RBrace, start);
    case '[':
      return make_token(TokenKind::LBracket, start);
    case ']':
      return make_token(TokenKind::RBracket, start);
    case ',':
      return make_token(TokenKind::Comma, start);
    case ':':
      return make_token(TokenKind::Colon, start);
    case ';':
      return make_token(TokenKind::Semicolon, start);
    case '!':
      return make_token(TokenKind::Bang, start);
    case '+':
      return make_token(TokenKind::Plus, start);
    case '-':
      return make_token(TokenKind::Minus, start);
    case '*':
      return make_token(TokenKind::Star, start);
    case '=':
      return make_token(TokenKind::Eq, start);
    case '<':
      return make_token(TokenKind::Lt, start);
    case '>':
      return make_token(TokenKind::Gt, start);
    default:
      break;
  }

  return make_token(TokenKind::Unknown, start);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
    if (t.kind == TokenKind::Unknown && t.range.get_begin().get_offset() >= src_.size()) {
      out.push_back({TokenKind::Eof, t.range, {}});
      break;
    }
  }
  return out;
}

}  // namespace ivl::syntax
