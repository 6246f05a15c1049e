// qk_graph/syntax/ts_ll.hpp - Low-level Tree-sitter wrapper (CST access)
#pragma once

#include <tree_sitter/api.h>

#include <cstdint>
#include <string_view>
#include <vector>

#include "qk_graph/basic/source_manager.hpp"

namespace qk_graph::ts_ll
{

// Language entry points of the tree-sitter-typescript grammar library.
extern "C" const TSLanguage * tree_sitter_typescript();
extern "C" const TSLanguage * tree_sitter_tsx();

/// Which of the two tree-sitter-typescript grammars to use
enum class Grammar : uint8_t {
  TypeScript,  ///< .ts/.mts/.cts (angle-bracket casts, no JSX)
  Tsx,         ///< .tsx/.js/.jsx/.mjs/.cjs
};

[[nodiscard]] constexpr Grammar other_grammar(Grammar g) noexcept
{
  return g == Grammar::TypeScript ? Grammar::Tsx : Grammar::TypeScript;
}

//------------------------------------------------------------------------------
// Node - thin wrapper around TSNode
//------------------------------------------------------------------------------
class Node
{
public:
  Node() : node_{} {}
  explicit Node(TSNode n) : node_(n) {}

  [[nodiscard]] bool is_null() const noexcept { return ts_node_is_null(node_); }
  [[nodiscard]] bool is_named() const noexcept { return ts_node_is_named(node_); }
  [[nodiscard]] bool has_error() const noexcept { return ts_node_has_error(node_); }
  [[nodiscard]] bool is_error() const noexcept { return ts_node_is_error(node_); }
  [[nodiscard]] bool is_missing() const noexcept { return ts_node_is_missing(node_); }

  /// Comments and other tokens the grammar allows anywhere
  [[nodiscard]] bool is_extra() const noexcept { return ts_node_is_extra(node_); }

  [[nodiscard]] std::string_view kind() const noexcept
  {
    const char * t = ts_node_type(node_);
    return t ? std::string_view(t) : std::string_view();
  }

  [[nodiscard]] uint32_t start_byte() const noexcept { return ts_node_start_byte(node_); }
  [[nodiscard]] uint32_t end_byte() const noexcept { return ts_node_end_byte(node_); }

  [[nodiscard]] SourceRange range(FileId file) const noexcept
  {
    return {file, start_byte(), end_byte()};
  }

  [[nodiscard]] std::string_view text(std::string_view source) const noexcept
  {
    const uint32_t b = start_byte();
    const uint32_t e = end_byte();
    if (b > e || e > source.size()) return {};
    return source.substr(b, e - b);
  }

  [[nodiscard]] uint32_t child_count() const noexcept { return ts_node_child_count(node_); }
  [[nodiscard]] uint32_t named_child_count() const noexcept
  {
    return ts_node_named_child_count(node_);
  }

  [[nodiscard]] Node child(uint32_t i) const noexcept { return Node(ts_node_child(node_, i)); }
  [[nodiscard]] Node named_child(uint32_t i) const noexcept
  {
    return Node(ts_node_named_child(node_, i));
  }

  [[nodiscard]] Node child_by_field(std::string_view field) const noexcept
  {
    return Node(
      ts_node_child_by_field_name(node_, field.data(), static_cast<uint32_t>(field.size())));
  }

  /// First named child that is not a comment, or a null node
  [[nodiscard]] Node first_named_child() const noexcept
  {
    for (uint32_t i = 0; i < named_child_count(); ++i) {
      const Node c = named_child(i);
      if (!c.is_extra()) return c;
    }
    return Node();
  }

  /// Named children without comments, in source order
  [[nodiscard]] std::vector<Node> named_children() const
  {
    std::vector<Node> out;
    out.reserve(named_child_count());
    for (uint32_t i = 0; i < named_child_count(); ++i) {
      const Node c = named_child(i);
      if (!c.is_extra()) out.push_back(c);
    }
    return out;
  }

  /// First ERROR or MISSING node in pre-order, or a null node
  [[nodiscard]] Node first_error() const noexcept;

  /// First named child whose kind is `k`
  [[nodiscard]] Node first_named_child_of_kind(std::string_view k) const noexcept
  {
    for (uint32_t i = 0; i < named_child_count(); ++i) {
      const Node c = named_child(i);
      if (c.kind() == k) return c;
    }
    return Node();
  }

  /// True if an anonymous token child spells `token` (e.g. "async", "static", "?.")
  [[nodiscard]] bool has_token(std::string_view token) const noexcept
  {
    for (uint32_t i = 0; i < child_count(); ++i) {
      const Node c = child(i);
      if (!c.is_named() && c.kind() == token) return true;
    }
    return false;
  }

private:
  TSNode node_;
};

//------------------------------------------------------------------------------
// Parser/Tree - RAII wrappers
//------------------------------------------------------------------------------
class Parser
{
public:
  explicit Parser(Grammar grammar);
  Parser(const Parser &) = delete;
  Parser & operator=(const Parser &) = delete;
  ~Parser();

  /// False when the grammar could not be installed (ABI mismatch)
  [[nodiscard]] bool is_ready() const noexcept { return ready_; }

  [[nodiscard]] Grammar grammar() const noexcept { return grammar_; }

  /// Parse UTF-8 text; nullptr when the parser is not ready or parsing failed
  [[nodiscard]] TSTree * parse_string(std::string_view source) const;

private:
  TSParser * parser_ = nullptr;
  Grammar grammar_;
  bool ready_ = false;
};

class Tree
{
public:
  explicit Tree(TSTree * t = nullptr) : tree_(t) {}
  Tree(const Tree &) = delete;
  Tree & operator=(const Tree &) = delete;

  Tree(Tree && other) noexcept : tree_(other.tree_) { other.tree_ = nullptr; }
  Tree & operator=(Tree && other) noexcept
  {
    if (this != &other) {
      reset();
      tree_ = other.tree_;
      other.tree_ = nullptr;
    }
    return *this;
  }

  ~Tree() { reset(); }

  void reset(TSTree * t = nullptr)
  {
    if (tree_) ts_tree_delete(tree_);
    tree_ = t;
  }

  [[nodiscard]] bool is_null() const noexcept { return tree_ == nullptr; }

  [[nodiscard]] Node root_node() const noexcept
  {
    return tree_ ? Node(ts_tree_root_node(tree_)) : Node();
  }

private:
  TSTree * tree_ = nullptr;
};

}  // namespace qk_graph::ts_ll
