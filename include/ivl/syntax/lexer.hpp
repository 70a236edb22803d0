// ivl/syntax/lexer.hpp - Tokenizer for the surface syntax
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "ivl/syntax/token.hpp"

namespace ivl::syntax
{

/**
 * Splits source text into tokens. Comments and whitespace are skipped;
 * malformed input becomes TokenKind::Unknown for the parser to report.
 * The last token is always Eof.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  /// Skip whitespace and comments. Returns false on an unterminated block comment.
  bool skip_trivia();

  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();

  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start) const noexcept
  {
    const auto end = static_cast<uint32_t>(pos_);
    return {kind, SourceRange(start, end), src_.substr(start, end - start)};
  }

  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace ivl::syntax
