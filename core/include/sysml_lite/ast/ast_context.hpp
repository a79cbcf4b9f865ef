// sysml_lite/ast/ast_context.hpp - Arena for the nodes and names of one model
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory_resource>
#include <new>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace sysml_lite
{

class AstNode;

/**
 * Owns every node, child list and name of one parsed model.
 *
 * Nothing is freed before the context itself. An element abandoned by a
 * parse failure simply stays unreachable in the arena.
 */
class AstContext
{
public:
  AstContext() : arena_(k_initial_size), names_(&arena_) {}

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>, "arena nodes are never destroyed; use views and spans");
    return new (arena_.allocate(sizeof(T), alignof(T))) T(std::forward<Args>(args)...);
  }

  /// Arena copy of `text`; equal names share one copy.
  [[nodiscard]] std::string_view intern(std::string_view text)
  {
    if (const auto it = names_.find(text); it != names_.end()) {
      return *it;
    }
    auto * data = static_cast<char *>(arena_.allocate(text.size(), alignof(char)));
    std::memcpy(data, text.data(), text.size());
    return *names_.emplace(data, text.size()).first;
  }

  /// Move a child list built during parsing into the arena.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & items)
  {
    static_assert(std::is_trivially_copyable_v<T>, "child lists hold pointers");
    if (items.empty()) {
      return {};
    }
    auto * data = static_cast<T *>(arena_.allocate(sizeof(T) * items.size(), alignof(T)));
    std::copy(items.begin(), items.end(), data);
    return gsl::span<T>(data, items.size());
  }

private:
  static constexpr size_t k_initial_size = 16 * 1024;

  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> names_;
};

}  // namespace sysml_lite
