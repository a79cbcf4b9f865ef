#include <gtest/gtest.h>

#include <string>

#include "sysml_lite/ast/ast.hpp"
#include "sysml_lite/ast/ast_equal.hpp"
#include "sysml_lite/ast/properties.hpp"
#include "sysml_lite/test_support/parse_helpers.hpp"

using namespace sysml_lite;

TEST(AstEqual, SameTextParsesToEqualTrees)
{
  // `n` overflows to NaN, which still compares equal to itself.
  const std::string src =
    "package P {\n"
    "  part E specializes B { attribute m : Real = 1.0; attribute n = " +
    std::string(400, '9') + "; }\n"
    "}\n";
  auto a = test_support::parse(src);
  auto b = test_support::parse(src);
  EXPECT_TRUE(structurally_equal(a.model, b.model));
}

TEST(AstEqual, RangesAreIgnored)
{
  auto a = test_support::parse("part A;");
  auto b = test_support::parse("\n\n   part   A ;");
  EXPECT_TRUE(structurally_equal(a.model, b.model));
}

TEST(AstEqual, DifferencesAreDetected)
{
  auto base = test_support::parse("package P { part A; part B; }");
  auto renamed = test_support::parse("package P { part A; part C; }");
  auto reordered = test_support::parse("package P { part B; part A; }");
  auto retyped = test_support::parse("package P { part A; port B; }");
  auto literal = test_support::parse("attribute x = \"1\";");
  auto number = test_support::parse("attribute x = 1;");

  EXPECT_FALSE(structurally_equal(base.model, renamed.model));
  EXPECT_FALSE(structurally_equal(base.model, reordered.model));
  EXPECT_FALSE(structurally_equal(base.model, retyped.model));
  EXPECT_FALSE(structurally_equal(literal.model, number.model));
}

TEST(AstEqual, SelectionKey)
{
  auto unit = test_support::parse("part A; part A; port A; part; part; part B;");
  ASSERT_EQ(unit.model->elements.size(), 6U);
  const auto & e = unit.model->elements;

  // Same type and name are not told apart.
  EXPECT_TRUE(same_selection_key(e[0], e[1]));
  EXPECT_FALSE(same_selection_key(e[0], e[2]));
  EXPECT_TRUE(same_selection_key(e[3], e[4]));
  EXPECT_FALSE(same_selection_key(e[0], e[3]));
  EXPECT_FALSE(same_selection_key(e[0], e[5]));
}

TEST(AstEqual, CountElements)
{
  auto unit = test_support::parse(
    "package P {\n"
    "  part A { attribute x; attribute y; }\n"
    "  package Q { part B; }\n"
    "}\n"
    "port p;\n");
  EXPECT_EQ(count_elements(unit.model), 7U);
  EXPECT_EQ(count_elements(unit.model->elements[0]), 5U);

  auto empty = test_support::parse("");
  EXPECT_EQ(count_elements(empty.model), 0U);
}

TEST(AstProperties, KeyOrderAndLookup)
{
  auto unit = test_support::parse("attribute mass : Real = 2;");
  const auto * attr = unit.model->elements[0];

  const auto props = properties(attr);
  ASSERT_EQ(props.size(), 3U);
  EXPECT_EQ(props[0].key, prop_key::k_name);
  EXPECT_EQ(props[1].key, prop_key::k_prop_type);
  EXPECT_EQ(props[2].key, prop_key::k_default_value);

  const auto type = get_property(attr, prop_key::k_prop_type);
  ASSERT_TRUE(type.has_value());
  EXPECT_EQ(std::get<std::string_view>(*type), "Real");
  EXPECT_FALSE(get_property(attr, prop_key::k_from_ref).has_value());

  EXPECT_EQ(type_tag(attr), "attribute");
  EXPECT_EQ(type_tag(unit.model), "root");
  EXPECT_TRUE(properties(unit.model).empty());
}

TEST(AstProperties, NumberFormatting)
{
  EXPECT_EQ(format_number(1500.0), "1500");
  EXPECT_EQ(format_number(0.25), "0.25");
  EXPECT_EQ(format_property_value(PropertyValue{std::string_view("kg")}), "kg");
}
