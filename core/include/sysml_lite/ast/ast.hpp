// sysml_lite/ast/ast.hpp - AST node class definitions
//
// Node classes follow the LLVM/Clang style with classof() for RTTI.
// All nodes live in an AstContext arena and must stay trivially
// destructible: text is stored as std::string_view into the context's
// string pool and child lists as gsl::span into arena memory.
//
#pragma once

#include <gsl/span>
#include <optional>
#include <string_view>
#include <variant>

#include "sysml_lite/ast/ast_enums.hpp"
#include "sysml_lite/basic/casting.hpp"
#include "sysml_lite/basic/source_manager.hpp"

namespace sysml_lite
{

/// Literal on the right-hand side of an attribute default (`= 1500.0` or `= "km"`).
using LiteralValue = std::variant<double, std::string_view>;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has a NodeKind for RTTI and the SourceRange it was parsed
 * from. Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;  ///< Byte offsets only. Line/col computed via SourceRegistry.

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that automatically implements classof().
 *
 * @tparam Derived The concrete node class
 * @tparam Base The base class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

/**
 * Base class for declarations that appear in a body or at top level.
 *
 * `name` is set only when the declaration carried a name; an absent name is
 * distinct from an empty one. `children` keeps source order and is frozen
 * once the owning parse rule returns.
 */
class Element : public AstNode
{
public:
  std::optional<std::string_view> name;
  gsl::span<Element *> children;

  static bool classof(const AstNode * node) { return is_element_kind(node->kind); }

protected:
  explicit Element(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Element Nodes
// ============================================================================

/// `package Name { ... }`
class Package : public NodeBase<Package, Element, NodeKind::Package>
{
public:
  explicit Package(SourceRange r = {}) : NodeBase(r) {}
};

/// `part Name specializes Base { ... }` or `part Name;`
class Part : public NodeBase<Part, Element, NodeKind::Part>
{
public:
  std::optional<std::string_view> specializes;

  explicit Part(SourceRange r = {}) : NodeBase(r) {}
};

/// `attribute name : Type = value;`
class Attribute : public NodeBase<Attribute, Element, NodeKind::Attribute>
{
public:
  std::optional<std::string_view> propType;
  std::optional<LiteralValue> defaultValue;

  explicit Attribute(SourceRange r = {}) : NodeBase(r) {}
};

/// `port name : Type;`
class Port : public NodeBase<Port, Element, NodeKind::Port>
{
public:
  std::optional<std::string_view> propType;

  explicit Port(SourceRange r = {}) : NodeBase(r) {}
};

/// `connection name : from to;`
class Connection : public NodeBase<Connection, Element, NodeKind::Connection>
{
public:
  std::optional<std::string_view> fromRef;
  std::optional<std::string_view> toRef;

  explicit Connection(SourceRange r = {}) : NodeBase(r) {}
};

/// `requirement Name { ... }`
class Requirement : public NodeBase<Requirement, Element, NodeKind::Requirement>
{
public:
  explicit Requirement(SourceRange r = {}) : NodeBase(r) {}
};

/// `use case Name { ... }`
class UseCase : public NodeBase<UseCase, Element, NodeKind::UseCase>
{
public:
  explicit UseCase(SourceRange r = {}) : NodeBase(r) {}
};

/// Anything without a dedicated rule: an optional name and skipped tokens up to `;` or `}`.
class GenericElement : public NodeBase<GenericElement, Element, NodeKind::Generic>
{
public:
  explicit GenericElement(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Top-level
// ============================================================================

/// Synthetic root holding the top-level elements of one source text.
class Model : public NodeBase<Model, AstNode, NodeKind::Root>
{
public:
  gsl::span<Element *> elements;

  explicit Model(SourceRange r = {}) : NodeBase(r) {}
};

}  // namespace sysml_lite
