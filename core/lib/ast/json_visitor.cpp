// sysml_lite/ast/json_visitor.cpp - JSON serialization implementation
//
#include "sysml_lite/ast/json_visitor.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <utility>

#include "sysml_lite/ast/properties.hpp"
#include "sysml_lite/basic/source_manager.hpp"

namespace sysml_lite
{
namespace
{

using nlohmann::json;

json j_range(SourceRange r)
{
  if (!r.is_valid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.start}, {"end", r.end}};
}

// NaN has no JSON form; nlohmann serializes it as null.
json j_value(const PropertyValue & v)
{
  if (const auto * d = std::get_if<double>(&v)) {
    return *d;
  }
  return std::string(std::get<std::string_view>(v));
}

json j_node(const AstNode * node, bool with_ranges)
{
  json props = json::object();
  for (const auto & prop : properties(node)) {
    props[std::string(prop.key)] = j_value(prop.value);
  }

  json children = json::array();
  for (const auto * child : children_of(node)) {
    children.push_back(j_node(child, with_ranges));
  }

  json j{
    {"type", std::string(type_tag(node))},
    {"properties", std::move(props)},
    {"children", std::move(children)}};
  if (with_ranges) {
    j["range"] = j_range(node->get_range());
  }
  return j;
}

}  // namespace

nlohmann::json to_json(const AstNode * node, bool with_ranges)
{
  if (node == nullptr) {
    return nullptr;
  }
  return j_node(node, with_ranges);
}

}  // namespace sysml_lite
