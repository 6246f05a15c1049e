// qk_graph/sema/resolution/binding.hpp - Local bindings and lexical scopes
//
// Bindings are produced per file by LocalBindingResolver and attached to
// Identifier/BindingIdentifier nodes. They answer "which declaration does
// this name refer to" without any cross-file knowledge.
//
#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "qk_graph/ast/ast.hpp"

namespace qk_graph
{

// ============================================================================
// Binding
// ============================================================================

enum class BindingKind : uint8_t {
  Var,
  Let,
  Const,
  Param,
  Function,  ///< Hoisted function declaration
  Class,
  Import,
  Catch,
};

[[nodiscard]] std::string_view to_string(BindingKind kind) noexcept;

/**
 * A name declared somewhere in one file.
 */
struct Binding
{
  std::string_view name;
  BindingKind kind;
  SourceRange definitionRange;

  /// BindingIdentifier that introduced the name
  const BindingIdentifier * identifier = nullptr;

  /**
   * Declaring node:
   * VariableDeclarator, FunctionDecl, ClassDecl, ImportSpecifier, CatchClause,
   * or the root parameter node (BindingIdentifier, pattern, AssignmentPattern).
   */
  const AstNode * declarator = nullptr;

  /// Initializer, only when the declarator id is a plain identifier
  const Expr * init = nullptr;

  /// Innermost function containing the declaration (nullptr at module level)
  const FunctionExpr * owner = nullptr;

  /// For parameters: the function and the index in its parameter list
  const FunctionExpr * function = nullptr;
  int paramIndex = -1;

  /// False once any assignment, update or redeclaration targets the name
  bool constant = true;

  [[nodiscard]] bool is_param() const noexcept { return kind == BindingKind::Param; }
  [[nodiscard]] bool is_import() const noexcept { return kind == BindingKind::Import; }
  [[nodiscard]] bool is_variable() const noexcept
  {
    return kind == BindingKind::Var || kind == BindingKind::Let || kind == BindingKind::Const;
  }
};

// ============================================================================
// Transparent Hash/Equal for string_view keys
// ============================================================================

struct StringViewHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

struct StringViewEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

// ============================================================================
// Scope
// ============================================================================

enum class ScopeKind : uint8_t {
  Module,
  Function,
  Block,
};

/**
 * A lexical scope. Child scopes look names up through their parents.
 *
 * Names must be interned string_views owned by the file's AstContext.
 */
class Scope
{
public:
  explicit Scope(ScopeKind kind, Scope * parent = nullptr) : kind_(kind), parent_(parent) {}

  /**
   * Define a binding in this scope.
   *
   * @return false if the name already exists here (the first binding is kept)
   */
  bool define(Binding * binding)
  {
    auto [it, inserted] = bindings_.emplace(binding->name, binding);
    return inserted;
  }

  [[nodiscard]] Binding * lookup_local(std::string_view name) const
  {
    auto it = bindings_.find(name);
    return it != bindings_.end() ? it->second : nullptr;
  }

  [[nodiscard]] Binding * lookup(std::string_view name) const
  {
    if (Binding * b = lookup_local(name)) {
      return b;
    }
    return parent_ ? parent_->lookup(name) : nullptr;
  }

  [[nodiscard]] ScopeKind get_kind() const noexcept { return kind_; }
  [[nodiscard]] Scope * get_parent() const noexcept { return parent_; }
  [[nodiscard]] size_t size() const noexcept { return bindings_.size(); }

  /// Nearest enclosing function or module scope (var hoisting target)
  [[nodiscard]] Scope * hoisting_scope() noexcept
  {
    Scope * s = this;
    while (s->kind_ == ScopeKind::Block && s->parent_ != nullptr) s = s->parent_;
    return s;
  }

private:
  ScopeKind kind_;
  Scope * parent_;
  std::unordered_map<std::string_view, Binding *, StringViewHash, StringViewEqual> bindings_;
};

// ============================================================================
// BindingTable
// ============================================================================

/**
 * Owns every Binding and Scope of one file.
 *
 * Must outlive the AST it annotates (Identifier::binding points into it).
 */
class BindingTable
{
public:
  BindingTable() = default;
  BindingTable(const BindingTable &) = delete;
  BindingTable & operator=(const BindingTable &) = delete;
  BindingTable(BindingTable &&) = default;
  BindingTable & operator=(BindingTable &&) = default;

  [[nodiscard]] Scope * create_scope(ScopeKind kind, Scope * parent)
  {
    scopes_.push_back(std::make_unique<Scope>(kind, parent));
    return scopes_.back().get();
  }

  [[nodiscard]] Binding * create_binding(Binding binding)
  {
    bindings_.push_back(binding);
    return &bindings_.back();
  }

  [[nodiscard]] Scope * module_scope() const noexcept
  {
    return scopes_.empty() ? nullptr : scopes_.front().get();
  }

  [[nodiscard]] const std::deque<Binding> & bindings() const noexcept { return bindings_; }
  [[nodiscard]] size_t scope_count() const noexcept { return scopes_.size(); }

private:
  std::deque<Binding> bindings_;
  std::vector<std::unique_ptr<Scope>> scopes_;
};

}  // namespace qk_graph
