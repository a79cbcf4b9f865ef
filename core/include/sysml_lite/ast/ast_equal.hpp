// sysml_lite/ast/ast_equal.hpp - Structural comparison helpers
//
#pragma once

#include <cstddef>

#include "sysml_lite/ast/ast.hpp"

namespace sysml_lite
{

/**
 * Deep equality over type tag, properties and children (in order).
 * Source ranges are ignored. Two NaN default values compare equal.
 */
[[nodiscard]] bool structurally_equal(const AstNode * a, const AstNode * b);

/**
 * Coarse identity used by selection in the diagram view: equal when the
 * type tags match and both names match (an absent name only matches an
 * absent name). Siblings sharing type and name are not told apart.
 */
[[nodiscard]] bool same_selection_key(const AstNode * a, const AstNode * b);

/// Number of elements below `root`, at any depth. The root itself is not counted.
[[nodiscard]] size_t count_elements(const AstNode * root);

}  // namespace sysml_lite
