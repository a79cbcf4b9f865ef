// sysml_lite/basic/casting.hpp - isa / cast / dyn_cast over NodeKind
//
//   if (isa<Part>(elem)) { ... }
//   const auto * part = cast<Part>(elem);          // kind already known
//   if (const auto * port = dyn_cast<Port>(elem))  // nullptr otherwise
//
// T must provide `static bool classof(const AstNode *)`; constness of the
// argument carries over to the result.
//
#pragma once

#include <cassert>
#include <type_traits>

namespace sysml_lite
{

namespace detail
{
template <typename T, typename From>
using cast_result_t = std::conditional_t<std::is_const_v<From>, const T, T> *;
}  // namespace detail

template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline detail::cast_result_t<T, From> cast(From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of another kind");
  return static_cast<detail::cast_result_t<T, From>>(node);
}

template <typename T, typename From>
[[nodiscard]] inline detail::cast_result_t<T, From> dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<detail::cast_result_t<T, From>>(node) : nullptr;
}

}  // namespace sysml_lite
