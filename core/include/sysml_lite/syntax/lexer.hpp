#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "sysml_lite/syntax/token.hpp"

namespace sysml_lite::syntax
{

/**
 * Single forward scanner over one source buffer.
 *
 * The lexer never fails: malformed input still yields a token sequence,
 * terminated by exactly one Eof token. Comments are emitted as tokens and
 * left for the parser to filter.
 */
class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src) : file_id_(file_id), src_(src) {}

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

  /// Consume n bytes, keeping line/column in sync.
  void advance(size_t n = 1) noexcept;

  /// Byte length of the UTF-8 sequence starting at the cursor (1 for ASCII or malformed input).
  [[nodiscard]] size_t char_width() const noexcept;

  void skip_whitespace();

  [[nodiscard]] Token lex_comment();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_identifier_or_keyword();

  [[nodiscard]] Token make_token(TokenKind kind, TokenValue value, uint32_t start) const;

  FileId file_id_;
  std::string_view src_;
  size_t pos_ = 0;
  uint32_t line_ = 1;
  uint32_t column_ = 1;

  // Position of the token being scanned, captured before its first character is consumed.
  uint32_t tok_line_ = 1;
  uint32_t tok_column_ = 1;
};

/// Lex a detached buffer (file id invalid). Convenience for tools and tests.
[[nodiscard]] std::vector<Token> tokenize(std::string_view text);

}  // namespace sysml_lite::syntax
