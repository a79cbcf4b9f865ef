#include "sysml_lite/ast/properties.hpp"

#include <fmt/core.h>

#include <cmath>

namespace sysml_lite
{
namespace
{

void push_text(
  std::vector<Property> & out, std::string_view key, const std::optional<std::string_view> & v)
{
  if (v) {
    out.push_back(Property{key, PropertyValue{*v}});
  }
}

}  // namespace

gsl::span<Element * const> children_of(const AstNode * node) noexcept
{
  if (const auto * model = dyn_cast<Model>(node)) {
    return model->elements;
  }
  if (const auto * elem = dyn_cast<Element>(node)) {
    return elem->children;
  }
  return {};
}

std::vector<Property> properties(const AstNode * node)
{
  std::vector<Property> out;
  const auto * elem = dyn_cast<Element>(node);
  if (elem == nullptr) {
    return out;
  }

  push_text(out, prop_key::k_name, elem->name);

  switch (elem->get_kind()) {
    case NodeKind::Part:
      push_text(out, prop_key::k_specializes, cast<Part>(elem)->specializes);
      break;
    case NodeKind::Attribute: {
      const auto * attr = cast<Attribute>(elem);
      push_text(out, prop_key::k_prop_type, attr->propType);
      if (attr->defaultValue) {
        out.push_back(Property{prop_key::k_default_value, *attr->defaultValue});
      }
      break;
    }
    case NodeKind::Port:
      push_text(out, prop_key::k_prop_type, cast<Port>(elem)->propType);
      break;
    case NodeKind::Connection: {
      const auto * conn = cast<Connection>(elem);
      push_text(out, prop_key::k_from_ref, conn->fromRef);
      push_text(out, prop_key::k_to_ref, conn->toRef);
      break;
    }
    default:
      break;
  }
  return out;
}

std::optional<PropertyValue> get_property(const AstNode * node, std::string_view key)
{
  for (auto & prop : properties(node)) {
    if (prop.key == key) {
      return prop.value;
    }
  }
  return std::nullopt;
}

std::string format_number(double value)
{
  if (std::isnan(value)) {
    return "NaN";
  }
  return fmt::format("{}", value);
}

std::string format_property_value(const PropertyValue & value)
{
  if (const auto * d = std::get_if<double>(&value)) {
    return format_number(*d);
  }
  return std::string(std::get<std::string_view>(value));
}

}  // namespace sysml_lite
