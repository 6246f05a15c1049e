// qk_graph/ast/ast_context.hpp - Storage for one analysis run's syntax trees
//
// Every node of one parsed file (and every node synthesized while resolving
// keys) lives in an AstContext. Nodes are never freed individually.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace qk_graph
{

class AstNode;

/**
 * Bump-allocated home for nodes, child lists and identifier text.
 *
 * Nodes hold string_views and gsl::spans into the same context, so they
 * must be trivially destructible and must not outlive it.
 *
 * @code
 *   AstContext ctx;
 *   auto * id = ctx.create<Identifier>(ctx.intern("todos"), range);
 *   gsl::span<Expr *> elements = ctx.store(std::vector<Expr *>{id});
 * @endcode
 */
class AstContext
{
public:
  AstContext() : names_(&arena_) {}

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;

  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(std::is_trivially_destructible_v<T>, "T must be trivially destructible");
    ++node_count_;
    return new (arena_.allocate(sizeof(T), alignof(T))) T(std::forward<Args>(args)...);
  }

  /// Copy of `s` owned by the context; equal strings share one copy
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (s.empty()) return {};
    if (const auto it = names_.find(s); it != names_.end()) return *it;

    auto * const text = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::memcpy(text, s.data(), s.size());
    return *names_.emplace(text, s.size()).first;
  }

  /// Child list owned by the context, copied from a builder-side vector
  template <typename T>
  [[nodiscard]] gsl::span<T> store(const std::vector<T> & items)
  {
    static_assert(std::is_trivially_copyable_v<T>, "child lists hold pointers or plain values");
    if (items.empty()) return {};
    auto * const first = static_cast<T *>(arena_.allocate(sizeof(T) * items.size(), alignof(T)));
    std::uninitialized_copy(items.begin(), items.end(), first);
    return {first, items.size()};
  }

  [[nodiscard]] size_t node_count() const noexcept { return node_count_; }

private:
  std::pmr::monotonic_buffer_resource arena_{size_t{64} * 1024};
  std::pmr::unordered_set<std::string_view> names_;
  size_t node_count_ = 0;
};

}  // namespace qk_graph
