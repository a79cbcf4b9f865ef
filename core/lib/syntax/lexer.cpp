#include "sysml_lite/syntax/lexer.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cmath>
#include <limits>
#include <utility>

#include "sysml_lite/syntax/keywords.hpp"

namespace sysml_lite::syntax
{
namespace
{

// ASCII-only classification.
bool is_ascii_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
bool is_ascii_digit(char c) { return c >= '0' && c <= '9'; }
bool is_ident_start(char c) { return is_ascii_alpha(c) || c == '_'; }
bool is_ident_continue(char c) { return is_ident_start(c) || is_ascii_digit(c); }

bool is_whitespace(char c)
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool is_punctuation(char c)
{
  switch (c) {
    case '{':
    case '}':
    case '(':
    case ')':
    case ';':
    case ':':
    case ',':
    case '.':
      return true;
    default:
      return false;
  }
}

bool is_operator(char c)
{
  switch (c) {
    case '=':
    case '<':
    case '>':
    case '!':
    case '+':
    case '-':
    case '*':
    case '/':
      return true;
    default:
      return false;
  }
}

bool is_utf8_continuation(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

/// Value of the longest decimal prefix of `text` (`1.2.3` is 1.2, `1..` is 1).
/// NaN when no prefix converts, e.g. on overflow.
double parse_decimal(std::string_view text)
{
  double value = 0.0;
  const auto [ptr, ec] =
    std::from_chars(text.data(), text.data() + text.size(), value, std::chars_format::fixed);
  if (ec != std::errc{}) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return value;
}

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::advance(size_t n) noexcept
{
  for (size_t i = 0; i < n && !eof(); ++i) {
    const char c = src_[pos_];
    if (c == '\n') {
      ++line_;
      column_ = 1;
    } else if (!is_utf8_continuation(c)) {
      ++column_;
    }
    ++pos_;
  }
}

size_t Lexer::char_width() const noexcept
{
  const auto lead = static_cast<unsigned char>(peek());
  size_t width = 1;
  if ((lead & 0xE0) == 0xC0) {
    width = 2;
  } else if ((lead & 0xF0) == 0xE0) {
    width = 3;
  } else if ((lead & 0xF8) == 0xF0) {
    width = 4;
  }
  // Truncated or malformed sequences are taken one byte at a time.
  for (size_t i = 1; i < width; ++i) {
    if (pos_ + i >= src_.size() || !is_utf8_continuation(src_[pos_ + i])) {
      return 1;
    }
  }
  return width;
}

void Lexer::skip_whitespace()
{
  while (!eof() && is_whitespace(peek())) {
    advance(1);
  }
}

Token Lexer::make_token(TokenKind kind, TokenValue value, uint32_t start) const
{
  Token t;
  t.kind = kind;
  t.value = std::move(value);
  t.line = tok_line_;
  t.column = tok_column_;
  t.range = {file_id_, start, static_cast<uint32_t>(pos_)};
  return t;
}

Token Lexer::lex_comment()
{
  const auto start = static_cast<uint32_t>(pos_);

  if (starts_with("//")) {
    // Line comment: the value keeps the leading `//`; the newline is left for skip_whitespace.
    while (!eof() && peek() != '\n') {
      advance(1);
    }
    return make_token(TokenKind::Comment, std::string(src_.substr(start, pos_ - start)), start);
  }

  // Block comment. An unterminated one silently runs to end of input.
  advance(2);
  const size_t payload_start = pos_;
  while (!eof() && !starts_with("*/")) {
    advance(1);
  }
  const size_t payload_end = pos_;
  if (starts_with("*/")) {
    advance(2);
  }
  return make_token(
    TokenKind::Comment, std::string(src_.substr(payload_start, payload_end - payload_start)), start);
}

Token Lexer::lex_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  const char quote = peek();
  advance(1);

  std::string value;
  while (!eof() && peek() != quote) {
    if (peek() == '\\') {
      // The escaped character is kept verbatim; there is no \n or \t translation.
      advance(1);
      if (eof()) {
        break;
      }
    }
    const size_t width = char_width();
    value.append(src_.substr(pos_, width));
    advance(width);
  }

  // Unterminated strings keep whatever was accumulated.
  if (!eof()) {
    advance(1);
  }
  return make_token(TokenKind::String, std::move(value), start);
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);
  while (!eof() && (is_ascii_digit(peek()) || peek() == '.')) {
    advance(1);
  }
  const double value = parse_decimal(src_.substr(start, pos_ - start));
  return make_token(TokenKind::Number, value, start);
}

Token Lexer::lex_identifier_or_keyword()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(peek())) {
    advance(1);
  }
  const std::string_view text = src_.substr(start, pos_ - start);
  const TokenKind kind = is_keyword(text) ? TokenKind::Keyword : TokenKind::Identifier;
  return make_token(kind, std::string(text), start);
}

Token Lexer::next_token()
{
  skip_whitespace();

  tok_line_ = line_;
  tok_column_ = column_;

  if (eof()) {
    return make_token(TokenKind::Eof, std::monostate{}, static_cast<uint32_t>(src_.size()));
  }

  const char c = peek();

  if (c == '/' && (peek(1) == '/' || peek(1) == '*')) {
    return lex_comment();
  }
  if (c == '"' || c == '\'') {
    return lex_string();
  }
  if (is_ascii_digit(c)) {
    return lex_number();
  }
  if (is_ident_start(c)) {
    return lex_identifier_or_keyword();
  }

  const auto start = static_cast<uint32_t>(pos_);
  if (is_punctuation(c)) {
    advance(1);
    return make_token(TokenKind::Punctuation, std::string(1, c), start);
  }
  if (is_operator(c)) {
    advance(1);
    return make_token(TokenKind::Operator, std::string(1, c), start);
  }

  // Anything else becomes a one-character identifier rather than an error.
  const size_t width = char_width();
  advance(width);
  return make_token(TokenKind::Identifier, std::string(src_.substr(start, width)), start);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    Token t = next_token();
    const bool done = t.kind == TokenKind::Eof;
    out.push_back(std::move(t));
    if (done) {
      break;
    }
  }
  return out;
}

std::vector<Token> tokenize(std::string_view text)
{
  Lexer lexer(FileId::invalid(), text);
  return lexer.lex_all();
}

std::string format_value(const TokenValue & value)
{
  if (const auto * s = std::get_if<std::string>(&value)) {
    return *s;
  }
  if (const auto * d = std::get_if<double>(&value)) {
    if (std::isnan(*d)) {
      return "NaN";
    }
    return fmt::format("{}", *d);
  }
  return "null";
}

std::string describe(const Token & t)
{
  if (t.kind == TokenKind::Eof) {
    return "EOF";
  }
  return fmt::format("{} '{}'", to_string(t.kind), format_value(t.value));
}

}  // namespace sysml_lite::syntax
