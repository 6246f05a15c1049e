// qk_graph/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds and the small attribute enums carried by JS/TS nodes.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace qk_graph
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Kinds of one category are contiguous so classof can use range checks.
 */
enum class NodeKind : uint8_t {
#define AST_NODE(Class, Snake) Class,
#include "qk_graph/ast/ast_nodes.def"
#undef AST_NODE
};

// ============================================================================
// Attribute enums
// ============================================================================

/// Declaration keyword of a VariableDecl
enum class VariableKind : uint8_t { Var, Let, Const };

/// Shape of an object-literal or class member
enum class PropertyKind : uint8_t {
  Init,    ///< key: value (also shorthand)
  Method,  ///< key() {}
  Get,     ///< get key() {}
  Set,     ///< set key(v) {}
  Field,   ///< class field: key = value
};

/// Import specifier flavour
enum class ImportKind : uint8_t {
  Named,      ///< import { a as b }
  Default,    ///< import a
  Namespace,  ///< import * as a
};

/// TypeScript-only expression wrappers
enum class CastKind : uint8_t {
  As,         ///< x as T
  Satisfies,  ///< x satisfies T
  NonNull,    ///< x!
  Angle,      ///< <T>x
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE(Class, Snake) \
  case NodeKind::Class:        \
    return #Snake;
#include "qk_graph/ast/ast_nodes.def"
#undef AST_NODE
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(VariableKind kind) noexcept
{
  switch (kind) {
    case VariableKind::Var:
      return "var";
    case VariableKind::Let:
      return "let";
    case VariableKind::Const:
      return "const";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(ImportKind kind) noexcept
{
  switch (kind) {
    case ImportKind::Named:
      return "named";
    case ImportKind::Default:
      return "default";
    case ImportKind::Namespace:
      return "namespace";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::Identifier;
inline constexpr NodeKind k_last_expr_kind = NodeKind::OpaqueExpr;

inline constexpr NodeKind k_first_pattern_kind = NodeKind::BindingIdentifier;
inline constexpr NodeKind k_last_pattern_kind = NodeKind::RestElement;

inline constexpr NodeKind k_first_type_kind = NodeKind::TypeReference;
inline constexpr NodeKind k_last_type_kind = NodeKind::OpaqueType;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::BlockStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::EmptyStmt;

inline constexpr NodeKind k_first_decl_kind = NodeKind::VariableDecl;
inline constexpr NodeKind k_last_decl_kind = NodeKind::ExportAllDecl;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_pattern_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_pattern_kind && kind <= detail::k_last_pattern_kind;
}

[[nodiscard]] constexpr bool is_type_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_type_kind && kind <= detail::k_last_type_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

/// Declarations also appear in statement position (`const x = ...;`)
[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

}  // namespace qk_graph
