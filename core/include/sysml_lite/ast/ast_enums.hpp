// sysml_lite/ast/ast_enums.hpp - AST enumeration definitions
//
#pragma once

#include <cstdint>
#include <string_view>

namespace sysml_lite
{

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Generated from ast_nodes.def; element kinds come first so that
 * category checks are a range comparison.
 */
enum class NodeKind : uint8_t {
// === Elements ===
#define AST_NODE_ELEMENT(Class, Kind, Snake, Tag) Kind,
#include "sysml_lite/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake, Tag) Kind,
#include "sysml_lite/ast/ast_nodes.def"
};

/// Type tag of a node kind ("package", "usecase", "root", ...).
[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_ELEMENT(Class, Kind, Snake, Tag) \
  case NodeKind::Kind:                            \
    return Tag;
#define AST_NODE_TOP(Class, Kind, Snake, Tag) \
  case NodeKind::Kind:                        \
    return Tag;
#include "sysml_lite/ast/ast_nodes.def"
  }
  return "";
}

namespace detail
{
inline constexpr NodeKind k_first_element_kind = NodeKind::Package;
inline constexpr NodeKind k_last_element_kind = NodeKind::Generic;
}  // namespace detail

[[nodiscard]] constexpr bool is_element_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_element_kind && kind <= detail::k_last_element_kind;
}

}  // namespace sysml_lite
