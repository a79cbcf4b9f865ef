#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "sysml_lite/ast/ast.hpp"
#include "sysml_lite/ast/ast_context.hpp"
#include "sysml_lite/basic/diagnostic.hpp"
#include "sysml_lite/basic/source_manager.hpp"
#include "sysml_lite/syntax/token.hpp"

namespace sysml_lite::syntax
{

/**
 * Structural parse failure.
 *
 * Raised by Parser::expect (and the stray top-level `}` check) and caught
 * only at the recovery boundary in Parser::parse, where it becomes a
 * diagnostic.
 */
class ParseError : public std::runtime_error
{
public:
  ParseError(std::string message, SourceRange range, DiagCode code)
  : std::runtime_error(std::move(message)), range_(range), code_(code)
  {
  }

  [[nodiscard]] SourceRange range() const noexcept { return range_; }
  [[nodiscard]] DiagCode code() const noexcept { return code_; }

  /// Opening `{` of the body that was still open when input ended.
  [[nodiscard]] const std::optional<SourceRange> & unclosed_body() const noexcept
  {
    return unclosed_body_;
  }
  void set_unclosed_body(SourceRange open_brace) { unclosed_body_ = open_brace; }

private:
  SourceRange range_;
  DiagCode code_;
  std::optional<SourceRange> unclosed_body_;
};

/**
 * Recursive-descent parser over a token stream.
 *
 * Comment tokens are dropped up front. The cursor only moves forward;
 * reading past the end yields the trailing Eof token. On the first
 * structural failure parsing stops: elements completed before it are kept,
 * the element under construction is discarded, and one error is reported
 * to the diagnostic bag.
 */
class Parser
{
public:
  Parser(AstContext & ast, DiagnosticBag & diags, std::vector<Token> tokens);

  [[nodiscard]] Model * parse();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_value(std::string_view value) const;

  const Token & advance();
  bool match_value(std::string_view value);
  const Token & expect(TokenKind k, std::optional<std::string_view> value = std::nullopt);
  [[nodiscard]] ParseError mismatch(TokenKind k, std::optional<std::string_view> value) const;

  /// Consume an IDENTIFIER token if present and return its interned text.
  [[nodiscard]] std::optional<std::string_view> match_identifier();

  [[nodiscard]] SourceRange range_from(const Token & first) const;

  // Grammar rules
  [[nodiscard]] Element * parse_element();
  [[nodiscard]] Package * parse_package();
  [[nodiscard]] Part * parse_part();
  [[nodiscard]] Attribute * parse_attribute();
  [[nodiscard]] Port * parse_port();
  [[nodiscard]] Connection * parse_connection();
  [[nodiscard]] Requirement * parse_requirement();
  [[nodiscard]] UseCase * parse_use_case();
  [[nodiscard]] GenericElement * parse_generic_element();

  /// `{` element* `}`; the braces are validated with expect().
  [[nodiscard]] gsl::span<Element *> parse_body();

  void report(const ParseError & err);

  AstContext & ast_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
};

}  // namespace sysml_lite::syntax
