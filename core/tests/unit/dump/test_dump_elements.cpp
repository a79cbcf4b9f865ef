#include <gtest/gtest.h>

#include <string>

#include "sysml_lite/ast/ast_dumper.hpp"
#include "sysml_lite/test_support/parse_helpers.hpp"

using namespace sysml_lite;

namespace
{

std::string dump_source(const std::string & src)
{
  auto unit = test_support::parse(src);
  EXPECT_NE(unit.model, nullptr);
  return dump_to_string(unit.model);
}

}  // namespace

TEST(AstDump, EmptyModel) { EXPECT_EQ(dump_source(""), "Model\n"); }

TEST(AstDump, NestedElements)
{
  const std::string src =
    "package Vehicle {\n"
    "  part Engine specializes PowerUnit {\n"
    "    attribute mass : Real = 1500.0;\n"
    "  }\n"
    "  port fuelIn : FuelPort;\n"
    "}\n"
    "use case Drive { }\n";

  const std::string expected =
    "Model\n"
    "|-Package name='Vehicle'\n"
    "| |-Part name='Engine' specializes='PowerUnit'\n"
    "| | `-Attribute name='mass' propType='Real' defaultValue=1500\n"
    "| `-Port name='fuelIn' propType='FuelPort'\n"
    "`-UseCase name='Drive'\n";

  EXPECT_EQ(dump_source(src), expected);
}

TEST(AstDump, LiteralFormsStayDistinct)
{
  const std::string src =
    "attribute a = 0.5;\n"
    "attribute b = \"0.5\";\n"
    "attribute c = 1.2.3;\n"
    "attribute d = " + std::string(400, '9') + ";\n";

  const std::string expected =
    "Model\n"
    "|-Attribute name='a' defaultValue=0.5\n"
    "|-Attribute name='b' defaultValue=\"0.5\"\n"
    "|-Attribute name='c' defaultValue=1.2\n"
    "`-Attribute name='d' defaultValue=NaN\n";

  EXPECT_EQ(dump_source(src), expected);
}

TEST(AstDump, ConnectionRequirementAndGeneric)
{
  const std::string src =
    "requirement Safety {\n"
    "  connection link : a b;\n"
    "  interface I;\n"
    "}\n"
    "Thing;\n";

  const std::string expected =
    "Model\n"
    "|-Requirement name='Safety'\n"
    "| |-Connection name='link' fromRef='a' toRef='b'\n"
    "| `-GenericElement\n"
    "`-GenericElement name='Thing'\n";

  EXPECT_EQ(dump_source(src), expected);
}

TEST(AstDump, SubtreeDumpStartsWithItsOwnLine)
{
  auto unit = test_support::parse("package P { part A; part B; }");
  ASSERT_EQ(unit.model->elements.size(), 1U);

  const std::string expected =
    "`-Package name='P'\n"
    "  |-Part name='A'\n"
    "  `-Part name='B'\n";
  EXPECT_EQ(dump_to_string(unit.model->elements[0]), expected);
}

TEST(AstDump, LabelsAreClassNames)
{
  EXPECT_EQ(class_name(NodeKind::Root), "Model");
  EXPECT_EQ(class_name(NodeKind::UseCase), "UseCase");
  EXPECT_EQ(class_name(NodeKind::Generic), "GenericElement");
}
