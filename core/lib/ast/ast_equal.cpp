#include "sysml_lite/ast/ast_equal.hpp"

#include <cmath>
#include <optional>

#include "sysml_lite/ast/properties.hpp"
#include "sysml_lite/ast/visitor.hpp"

namespace sysml_lite
{
namespace
{

bool values_equal(const PropertyValue & a, const PropertyValue & b)
{
  if (a.index() != b.index()) {
    return false;
  }
  if (const auto * da = std::get_if<double>(&a)) {
    const double db = std::get<double>(b);
    return (std::isnan(*da) && std::isnan(db)) || *da == db;
  }
  return std::get<std::string_view>(a) == std::get<std::string_view>(b);
}

std::optional<std::string_view> name_of(const AstNode * node)
{
  if (const auto * elem = dyn_cast<Element>(node)) {
    return elem->name;
  }
  return std::nullopt;
}

class ElementCounter : public RecursiveAstVisitor<ElementCounter>
{
public:
  size_t count = 0;

  bool visit_element(const Element * node)
  {
    ++count;
    return RecursiveAstVisitor::visit_element(node);
  }
};

}  // namespace

bool structurally_equal(const AstNode * a, const AstNode * b)
{
  if (a == nullptr || b == nullptr) {
    return a == b;
  }
  if (a->get_kind() != b->get_kind()) {
    return false;
  }

  const auto props_a = properties(a);
  const auto props_b = properties(b);
  if (props_a.size() != props_b.size()) {
    return false;
  }
  for (size_t i = 0; i < props_a.size(); ++i) {
    if (props_a[i].key != props_b[i].key || !values_equal(props_a[i].value, props_b[i].value)) {
      return false;
    }
  }

  const auto children_a = children_of(a);
  const auto children_b = children_of(b);
  if (children_a.size() != children_b.size()) {
    return false;
  }
  for (size_t i = 0; i < children_a.size(); ++i) {
    if (!structurally_equal(children_a[i], children_b[i])) {
      return false;
    }
  }
  return true;
}

bool same_selection_key(const AstNode * a, const AstNode * b)
{
  if (a == nullptr || b == nullptr) {
    return a == b;
  }
  return a->get_kind() == b->get_kind() && name_of(a) == name_of(b);
}

size_t count_elements(const AstNode * root)
{
  if (root == nullptr) {
    return 0;
  }
  ElementCounter counter;
  for (const auto * child : children_of(root)) {
    counter.visit(child);
  }
  return counter.count;
}

}  // namespace sysml_lite
