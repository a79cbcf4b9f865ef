// sysml_lite/ast/ast_dumper.hpp - Debug AST tree output
//
#pragma once

#include <gsl/span>
#include <ostream>
#include <string>
#include <string_view>

#include "sysml_lite/ast/ast.hpp"
#include "sysml_lite/ast/visitor.hpp"

namespace sysml_lite
{

/// C++ class name of a node kind ("Part", "GenericElement", "Model").
[[nodiscard]] constexpr std::string_view class_name(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_ELEMENT(Class, Kind, Snake, Tag) \
  case NodeKind::Kind:                            \
    return #Class;
#define AST_NODE_TOP(Class, Kind, Snake, Tag) \
  case NodeKind::Kind:                        \
    return #Class;
#include "sysml_lite/ast/ast_nodes.def"
  }
  return "";
}

/**
 * Writes a model as an indented tree, one element per line.
 *
 * @code
 *   Model
 *   |-Package name='Vehicle'
 *   | |-Part name='Engine' specializes='PowerUnit'
 *   | | `-Attribute name='mass' propType='Real' defaultValue=1500
 *   | `-Port name='fuelIn' propType='FuelPort'
 *   `-GenericElement
 * @endcode
 *
 * Properties come from the key/value view in their listed order. A string
 * default value is printed in double quotes and a number bare, so the two
 * literal forms stay distinguishable.
 */
class AstDumper : public AstVisitor<AstDumper>
{
public:
  explicit AstDumper(std::ostream & os) : os_(os) {}

  void dump(const AstNode * node) { visit(node); }

  /// The root has no branch marker; its elements start at column 0.
  void visit_model(const Model * model);
  void visit_element(const Element * element);

private:
  void dump_children(gsl::span<Element * const> children);

  std::ostream & os_;
  std::string indent_;
  bool last_ = true;
};

void dump(const AstNode * node, std::ostream & os);
[[nodiscard]] std::string dump_to_string(const AstNode * node);

}  // namespace sysml_lite
