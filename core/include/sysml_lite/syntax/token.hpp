#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "sysml_lite/basic/source_manager.hpp"

namespace sysml_lite::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Keyword,
  Identifier,
  String,  // value is the decoded contents (without quotes)
  Number,
  Operator,     // = < > ! + - * /
  Punctuation,  // { } ( ) ; : , .
  Comment,      // line comments keep the leading //, block comments drop /* */
};

/// Payload of a token: nothing for EOF, a number for NUMBER, text otherwise.
using TokenValue = std::variant<std::monostate, std::string, double>;

struct Token
{
  TokenKind kind = TokenKind::Eof;
  TokenValue value;
  uint32_t line = 1;    // 1-based, position of the first character
  uint32_t column = 1;  // 1-based, counted in characters
  SourceRange range;    // byte range in the original source (including quotes/delimiters)

  [[nodiscard]] uint32_t begin() const noexcept { return range.start; }
  [[nodiscard]] uint32_t end() const noexcept { return range.end; }

  /// Text payload, or an empty view for EOF and NUMBER tokens.
  [[nodiscard]] std::string_view text() const noexcept
  {
    if (const auto * s = std::get_if<std::string>(&value)) {
      return *s;
    }
    return {};
  }

  /// Numeric payload (NaN-preserving); 0 for non-number tokens.
  [[nodiscard]] double number() const noexcept
  {
    if (const auto * d = std::get_if<double>(&value)) {
      return *d;
    }
    return 0.0;
  }

  [[nodiscard]] bool is(TokenKind k) const noexcept { return kind == k; }

  /// Value match regardless of kind (NUMBER and EOF never match).
  [[nodiscard]] bool has_text(std::string_view s) const noexcept
  {
    const auto * v = std::get_if<std::string>(&value);
    return v != nullptr && *v == s;
  }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "eof";
    case TokenKind::Keyword:
      return "keyword";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::String:
      return "string";
    case TokenKind::Number:
      return "number";
    case TokenKind::Operator:
      return "operator";
    case TokenKind::Punctuation:
      return "punctuation";
    case TokenKind::Comment:
      return "comment";
  }
  return "";
}

/// Human-readable token description used in diagnostics, e.g. `identifier 'Engine'` or `EOF`.
[[nodiscard]] std::string describe(const Token & t);

/// Value rendered for token listings (numbers in shortest form, EOF as `null`).
[[nodiscard]] std::string format_value(const TokenValue & value);

}  // namespace sysml_lite::syntax
