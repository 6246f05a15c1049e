// qk_graph/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "qk_graph/syntax/ts_ll.hpp"

namespace qk_graph::ts_ll
{

Node Node::first_error() const noexcept
{
  if (is_null()) return Node();
  if (is_error() || is_missing()) return *this;
  if (!has_error()) return Node();

  for (uint32_t i = 0; i < child_count(); ++i) {
    const Node found = child(i).first_error();
    if (!found.is_null()) return found;
  }
  return Node();
}

// ============================================================================
// Parser
// ============================================================================

Parser::Parser(Grammar grammar) : parser_(ts_parser_new()), grammar_(grammar)
{
  if (parser_ == nullptr) return;

  const TSLanguage * lang =
    grammar == Grammar::TypeScript ? tree_sitter_typescript() : tree_sitter_tsx();
  ready_ = lang != nullptr && ts_parser_set_language(parser_, lang);
}

Parser::~Parser()
{
  if (parser_ != nullptr) ts_parser_delete(parser_);
}

TSTree * Parser::parse_string(std::string_view source) const
{
  if (!ready_) return nullptr;
  return ts_parser_parse_string(
    parser_, /*old_tree=*/nullptr, source.data(), static_cast<uint32_t>(source.size()));
}

}  // namespace qk_graph::ts_ll
