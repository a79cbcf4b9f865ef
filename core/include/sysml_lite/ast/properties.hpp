// sysml_lite/ast/properties.hpp - Key/value view of element properties
//
// Consumers that do not want to switch over node classes read elements
// through this view. Key sets per type tag:
//
//   root                                   (none)
//   package, requirement, usecase, generic  name
//   part                                   name, specializes
//   attribute                              name, propType, defaultValue
//   port                                   name, propType
//   connection                             name, fromRef, toRef
//
// A key is reported only when the corresponding syntax was present.
//
#pragma once

#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sysml_lite/ast/ast.hpp"

namespace sysml_lite
{

namespace prop_key
{
inline constexpr std::string_view k_name = "name";
inline constexpr std::string_view k_specializes = "specializes";
inline constexpr std::string_view k_prop_type = "propType";
inline constexpr std::string_view k_default_value = "defaultValue";
inline constexpr std::string_view k_from_ref = "fromRef";
inline constexpr std::string_view k_to_ref = "toRef";
}  // namespace prop_key

using PropertyValue = LiteralValue;

struct Property
{
  std::string_view key;
  PropertyValue value;
};

/// Type tag of a node ("part", "usecase", "root", ...).
[[nodiscard]] inline std::string_view type_tag(const AstNode * node) noexcept
{
  return to_string(node->get_kind());
}

/// Children in source order (top-level elements for the root).
[[nodiscard]] gsl::span<Element * const> children_of(const AstNode * node) noexcept;

/// Look up a single property; nullopt when the key is absent or not valid for the node's type.
[[nodiscard]] std::optional<PropertyValue> get_property(
  const AstNode * node, std::string_view key);

/// All present properties, in the key order listed above.
[[nodiscard]] std::vector<Property> properties(const AstNode * node);

/// Shortest round-trip text of a number ("1500", "0.5", "NaN").
[[nodiscard]] std::string format_number(double value);

/// Display text of a property value: numbers via format_number, strings as-is.
[[nodiscard]] std::string format_property_value(const PropertyValue & value);

}  // namespace sysml_lite
