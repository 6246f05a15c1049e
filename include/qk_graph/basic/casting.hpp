// qk_graph/basic/casting.hpp - Kind-tag checked downcasts for the syntax tree
//
// A target type opts in by providing `static bool classof(const Base *)`.
// All three helpers accept nullptr; only cast<T> requires the kind to match.
//
#pragma once

#include <cassert>
#include <type_traits>

namespace qk_graph
{

template <typename T, typename From>
using enable_if_classof_t = decltype(T::classof(static_cast<const From *>(nullptr)));

/// True when node is non-null and matches one of the listed kinds
template <typename T, typename... More, typename From, typename = enable_if_classof_t<T, From>>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  if (node == nullptr) return false;
  if constexpr (sizeof...(More) == 0) {
    return T::classof(node);
  } else {
    return T::classof(node) || isa<More...>(node);
  }
}

/// Downcast to T, or nullptr when the kind differs
template <typename T, typename From>
[[nodiscard]] inline auto dyn_cast(From * node) noexcept
  -> std::conditional_t<std::is_const_v<From>, const T *, T *>
{
  using Result = std::conditional_t<std::is_const_v<From>, const T *, T *>;
  return isa<T>(node) ? static_cast<Result>(node) : nullptr;
}

/// Downcast whose kind the caller has already switched on
template <typename T, typename From>
[[nodiscard]] inline auto cast(From * node) noexcept
  -> std::conditional_t<std::is_const_v<From>, const T *, T *>
{
  assert(isa<T>(node) && "cast<T>() on a node of another kind");
  return dyn_cast<T>(node);
}

}  // namespace qk_graph
