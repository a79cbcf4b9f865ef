// sysml_lite/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Every node becomes
//   {"type": "<tag>", "properties": {...}, "children": [...]}
// with properties carrying only the keys present in the source.
//
#pragma once

#include <nlohmann/json.hpp>

#include "sysml_lite/ast/ast.hpp"

namespace sysml_lite
{

/**
 * Serialize an AST node (and its subtree) to JSON.
 *
 * @param node The node to serialize; nullptr yields JSON null
 * @param with_ranges Also emit a "range" object with byte offsets
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node, bool with_ranges = false);

}  // namespace sysml_lite
