#include <gtest/gtest.h>

#include <string>

#include "sysml_lite/ast/ast.hpp"
#include "sysml_lite/ast/ast_equal.hpp"
#include "sysml_lite/basic/diagnostic.hpp"
#include "sysml_lite/test_support/parse_helpers.hpp"

using namespace sysml_lite;

TEST(AstParserRecovery, CleanParseHasNoDiagnostics)
{
  auto unit = test_support::parse("package P { part A; }\nport p : T;\n");
  ASSERT_NE(unit.model, nullptr);
  EXPECT_TRUE(unit.diags.empty());
  EXPECT_FALSE(unit.diags.has_errors());
}

TEST(AstParserRecovery, UnclosedBodyKeepsEarlierElements)
{
  const std::string src =
    "part A;\n"
    "package P {\n"
    "  part B;\n";

  auto unit = test_support::parse(src);
  ASSERT_NE(unit.model, nullptr);

  // The package under construction is discarded, `part A` survives.
  ASSERT_EQ(unit.model->elements.size(), 1U);
  const auto * a = dyn_cast<Part>(unit.model->elements[0]);
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->name, "A");

  ASSERT_EQ(unit.diags.size(), 1U);
  const auto & d = unit.diags.items()[0];
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, DiagCode::UnexpectedToken);
  EXPECT_EQ(d.message, "expected punctuation '}' but got EOF");
  EXPECT_EQ(d.range().start, src.size());
}

TEST(AstParserRecovery, UnclosedBodyPointsAtOpeningBrace)
{
  auto unit = test_support::parse("package P {\n  part B;\n");
  ASSERT_EQ(unit.diags.size(), 1U);
  const auto & d = unit.diags.items()[0];

  ASSERT_EQ(d.labels.size(), 2U);
  EXPECT_TRUE(d.labels[0].primary);
  EXPECT_EQ(d.labels[0].message, "input ends here");
  EXPECT_FALSE(d.labels[1].primary);
  EXPECT_EQ(d.labels[1].message, "body opened here");
  EXPECT_EQ(unit.slice(d.labels[1].range), "{");

  ASSERT_TRUE(d.insertion.has_value());
  EXPECT_EQ(d.insertion->text, "}");
  EXPECT_EQ(d.insertion->at, d.range());
}

TEST(AstParserRecovery, NestedUnclosedBodyDropsOutermostElement)
{
  auto unit = test_support::parse(
    "package Outer {\n"
    "  part Inner {\n"
    "    attribute x;\n"
    "  }\n");
  ASSERT_NE(unit.model, nullptr);
  EXPECT_TRUE(unit.model->elements.empty());
  EXPECT_EQ(unit.diags.error_count(), 1U);
}

TEST(AstParserRecovery, NothingAfterTheFailureIsParsed)
{
  // The string "{" passes the body check but is not punctuation.
  auto unit = test_support::parse("part A;\npackage P \"{\" part B; }\npart C;\n");
  ASSERT_EQ(unit.model->elements.size(), 1U);
  EXPECT_EQ(unit.model->elements[0]->name, "A");

  ASSERT_EQ(unit.diags.size(), 1U);
  const auto & d = unit.diags.items()[0];
  EXPECT_EQ(d.message, "expected punctuation '{' but got string '{'");
  EXPECT_EQ(d.labels[0].message, "unexpected token");
  EXPECT_EQ(unit.slice(d.range()), "\"{\"");
}

TEST(AstParserRecovery, StrayClosingBraceAtTopLevel)
{
  auto unit = test_support::parse("part A; } part B;");
  ASSERT_EQ(unit.model->elements.size(), 1U);
  EXPECT_EQ(unit.model->elements[0]->name, "A");

  ASSERT_EQ(unit.diags.size(), 1U);
  const auto & d = unit.diags.items()[0];
  EXPECT_EQ(d.code, DiagCode::StrayCloseBrace);
  EXPECT_EQ(d.message, "unexpected punctuation '}' at top level");
  EXPECT_EQ(unit.slice(d.range()), "}");
  EXPECT_TRUE(d.help.has_value());
}

TEST(AstParserRecovery, BodyOnlyForContainerKinds)
{
  // A port has no body: `{ part x;` is a generic element and the `}` is stray.
  auto unit = test_support::parse("port p { part x; }");
  ASSERT_EQ(unit.model->elements.size(), 2U);
  EXPECT_TRUE(isa<Port>(unit.model->elements[0]));
  EXPECT_TRUE(isa<GenericElement>(unit.model->elements[1]));

  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.items()[0].code, DiagCode::StrayCloseBrace);
}

TEST(AstParserRecovery, ParsingIsDeterministic)
{
  const std::string src =
    "package Vehicle {\n"
    "  part Engine specializes PowerUnit { attribute mass : Real = 1500.0; }\n"
    "  connection c : a b;\n"
    "  interface I;\n"
    "}\n"
    "package Broken {\n";

  auto first = test_support::parse(src);
  auto second = test_support::parse(src);
  EXPECT_TRUE(structurally_equal(first.model, second.model));
  EXPECT_EQ(first.diags.size(), second.diags.size());
}
