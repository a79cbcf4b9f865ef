#include "sysml_lite/syntax/parser.hpp"

#include <fmt/core.h>

#include <string>
#include <utility>

namespace sysml_lite::syntax
{
namespace
{

std::string describe_expected(TokenKind k, std::optional<std::string_view> value)
{
  if (value) {
    return fmt::format("{} '{}'", to_string(k), *value);
  }
  return std::string(to_string(k));
}

}  // namespace

Parser::Parser(AstContext & ast, DiagnosticBag & diags, std::vector<Token> tokens)
: ast_(ast), diags_(diags)
{
  // Comments are never part of a grammar decision.
  tokens_.reserve(tokens.size());
  for (auto & t : tokens) {
    if (t.kind != TokenKind::Comment) {
      tokens_.push_back(std::move(t));
    }
  }
  if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof) {
    Token eof;
    if (!tokens_.empty()) {
      const SourceRange last = tokens_.back().range;
      eof.range = SourceRange::empty_at(last.file, last.end);
      eof.line = tokens_.back().line;
      eof.column = tokens_.back().column;
    }
    tokens_.push_back(std::move(eof));
  }
}

// =============================================================================
// Token helpers
// =============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::at_value(std::string_view value) const { return cur().has_text(value); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match_value(std::string_view value)
{
  if (at_value(value)) {
    advance();
    return true;
  }
  return false;
}

ParseError Parser::mismatch(TokenKind k, std::optional<std::string_view> value) const
{
  const Token & t = cur();
  return ParseError(
    fmt::format("expected {} but got {}", describe_expected(k, value), describe(t)), t.range,
    DiagCode::UnexpectedToken);
}

const Token & Parser::expect(TokenKind k, std::optional<std::string_view> value)
{
  if (!at(k) || (value && !at_value(*value))) {
    throw mismatch(k, value);
  }
  return advance();
}

std::optional<std::string_view> Parser::match_identifier()
{
  if (!at(TokenKind::Identifier)) {
    return std::nullopt;
  }
  return ast_.intern(advance().text());
}

SourceRange Parser::range_from(const Token & first) const
{
  if (idx_ == 0) {
    return first.range;
  }
  return SourceRange::cover(first.range, tokens_[idx_ - 1].range);
}

// =============================================================================
// Entry point
// =============================================================================

Model * Parser::parse()
{
  const Token & first = cur();
  auto * model = ast_.create<Model>(first.range);

  // Elements are collected here so that everything completed before a
  // failure survives it.
  std::vector<Element *> elements;
  try {
    while (!at_eof()) {
      if (at_value("}")) {
        throw ParseError(
          fmt::format("unexpected {} at top level", describe(cur())), cur().range,
          DiagCode::StrayCloseBrace);
      }
      if (Element * elem = parse_element()) {
        elements.push_back(elem);
      }
    }
  } catch (const ParseError & err) {
    report(err);
  }

  model->elements = ast_.copy_to_arena(elements);
  model->range_ = SourceRange::cover(first.range, tokens_.back().range);
  return model;
}

void Parser::report(const ParseError & err)
{
  const bool at_end = cur().kind == TokenKind::Eof;
  auto builder =
    diags_.error(err.range(), err.what(), at_end ? "input ends here" : "unexpected token");
  builder.code(err.code());

  if (const auto & open = err.unclosed_body()) {
    builder.note_at(*open, "body opened here");
    builder.insert(err.range(), "}");
  }
  if (err.code() == DiagCode::StrayCloseBrace) {
    builder.help("remove this '}' or add the matching '{' before it");
  }
}

// =============================================================================
// Grammar rules
// =============================================================================

Element * Parser::parse_element()
{
  if (at_eof()) {
    return nullptr;
  }

  if (at(TokenKind::Keyword)) {
    const std::string_view kw = cur().text();
    if (kw == "package") return parse_package();
    if (kw == "part") return parse_part();
    if (kw == "attribute") return parse_attribute();
    if (kw == "port") return parse_port();
    if (kw == "connection") return parse_connection();
    if (kw == "requirement") return parse_requirement();
    if (kw == "use") return parse_use_case();
  }
  return parse_generic_element();
}

gsl::span<Element *> Parser::parse_body()
{
  const Token & open = expect(TokenKind::Punctuation, "{");
  const SourceRange open_range = open.range;

  std::vector<Element *> children;
  while (!at_value("}") && !at_eof()) {
    if (Element * elem = parse_element()) {
      children.push_back(elem);
    }
  }

  if (at_eof()) {
    ParseError err = mismatch(TokenKind::Punctuation, "}");
    err.set_unclosed_body(open_range);
    throw err;
  }
  expect(TokenKind::Punctuation, "}");

  return ast_.copy_to_arena(children);
}

Package * Parser::parse_package()
{
  const Token & kw = expect(TokenKind::Keyword, "package");
  auto * node = ast_.create<Package>(kw.range);
  node->name = match_identifier();

  if (at_value("{")) {
    node->children = parse_body();
  }

  node->range_ = range_from(kw);
  return node;
}

Part * Parser::parse_part()
{
  const Token & kw = expect(TokenKind::Keyword, "part");
  auto * node = ast_.create<Part>(kw.range);
  node->name = match_identifier();

  if (match_value("specializes")) {
    node->specializes = match_identifier();
  }

  if (at_value("{")) {
    node->children = parse_body();
  } else {
    match_value(";");
  }

  node->range_ = range_from(kw);
  return node;
}

Attribute * Parser::parse_attribute()
{
  const Token & kw = expect(TokenKind::Keyword, "attribute");
  auto * node = ast_.create<Attribute>(kw.range);
  node->name = match_identifier();

  if (match_value(":")) {
    node->propType = match_identifier();
  }

  if (match_value("=")) {
    if (at(TokenKind::Number)) {
      node->defaultValue = LiteralValue{advance().number()};
    } else if (at(TokenKind::String)) {
      node->defaultValue = LiteralValue{ast_.intern(advance().text())};
    }
  }

  match_value(";");

  node->range_ = range_from(kw);
  return node;
}

Port * Parser::parse_port()
{
  const Token & kw = expect(TokenKind::Keyword, "port");
  auto * node = ast_.create<Port>(kw.range);
  node->name = match_identifier();

  if (match_value(":")) {
    node->propType = match_identifier();
  }

  match_value(";");

  node->range_ = range_from(kw);
  return node;
}

Connection * Parser::parse_connection()
{
  const Token & kw = expect(TokenKind::Keyword, "connection");
  auto * node = ast_.create<Connection>(kw.range);
  node->name = match_identifier();

  // `: from to`; the target is only looked for when a source was given.
  if (match_value(":")) {
    node->fromRef = match_identifier();
    if (node->fromRef) {
      node->toRef = match_identifier();
    }
  }

  match_value(";");

  node->range_ = range_from(kw);
  return node;
}

Requirement * Parser::parse_requirement()
{
  const Token & kw = expect(TokenKind::Keyword, "requirement");
  auto * node = ast_.create<Requirement>(kw.range);
  node->name = match_identifier();

  if (at_value("{")) {
    node->children = parse_body();
  }

  node->range_ = range_from(kw);
  return node;
}

UseCase * Parser::parse_use_case()
{
  const Token & kw = expect(TokenKind::Keyword, "use");
  auto * node = ast_.create<UseCase>(kw.range);
  match_value("case");
  node->name = match_identifier();

  if (at_value("{")) {
    node->children = parse_body();
  }

  node->range_ = range_from(kw);
  return node;
}

GenericElement * Parser::parse_generic_element()
{
  const Token & first = cur();
  auto * node = ast_.create<GenericElement>(first.range);
  node->name = match_identifier();

  // Unrecognized syntax (including keywords without a rule) is skipped
  // up to the end of the statement or the enclosing body.
  while (!at_eof() && !at_value(";") && !at_value("}")) {
    advance();
  }
  match_value(";");

  node->range_ = range_from(first);
  return node;
}

}  // namespace sysml_lite::syntax
