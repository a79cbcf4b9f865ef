// sysml_lite/ast/visitor.hpp - Static dispatch over AST node kinds
#pragma once

#include "sysml_lite/ast/ast.hpp"
#include "sysml_lite/ast/ast_enums.hpp"
#include "sysml_lite/basic/casting.hpp"

namespace sysml_lite
{

/**
 * CRTP visitor over the node kinds listed in ast_nodes.def.
 *
 * A derived visitor defines visit_<snake>(const Class *) for the kinds it
 * handles. Element kinds it leaves out fall back to visit_element, and
 * everything ends in visit_node.
 *
 * @code
 *   class PartNames : public AstVisitor<PartNames> {
 *   public:
 *     void visit_part(const Part * part) { ... }
 *   };
 * @endcode
 */
template <typename Derived, typename R = void>
class AstVisitor
{
public:
  R visit(const AstNode * node)
  {
    if (node == nullptr) {
      return R();
    }
    switch (node->get_kind()) {
#define AST_NODE_ELEMENT(Class, Kind, Snake, Tag) \
  case NodeKind::Kind:                            \
    return self().visit_##Snake(cast<Class>(node));
#define AST_NODE_TOP(Class, Kind, Snake, Tag) \
  case NodeKind::Kind:                        \
    return self().visit_##Snake(cast<Class>(node));
#include "sysml_lite/ast/ast_nodes.def"
    }
    return R();
  }

#define AST_NODE_ELEMENT(Class, Kind, Snake, Tag) \
  R visit_##Snake(const Class * node) { return self().visit_element(node); }
#define AST_NODE_TOP(Class, Kind, Snake, Tag) \
  R visit_##Snake(const Class * node) { return self().visit_node(node); }
#include "sysml_lite/ast/ast_nodes.def"

  R visit_element(const Element * element) { return self().visit_node(element); }
  R visit_node(const AstNode * /*node*/) { return R(); }

protected:
  Derived & self() { return static_cast<Derived &>(*this); }
};

/**
 * Walks the model and every element below it in source order.
 *
 * Override visit_element (or a specific kind) and call the
 * RecursiveAstVisitor version to descend; return false to stop the walk.
 */
template <typename Derived>
class RecursiveAstVisitor : public AstVisitor<Derived, bool>
{
public:
  bool visit_model(const Model * model)
  {
    for (const Element * element : model->elements) {
      if (!this->self().visit(element)) return false;
    }
    return true;
  }

  bool visit_element(const Element * element)
  {
    for (const Element * child : element->children) {
      if (!this->self().visit(child)) return false;
    }
    return true;
  }

  bool visit_node(const AstNode * /*node*/) { return true; }
};

}  // namespace sysml_lite
