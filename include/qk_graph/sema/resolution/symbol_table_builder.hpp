// qk_graph/sema/resolution/symbol_table_builder.hpp - FileSymbolTable construction
//
// Traverses one file's AST and records its exports, imports, re-exports and
// named expressions. Never looks at any other file.
//
#pragma once

#include <unordered_set>

#include "qk_graph/ast/visitor.hpp"
#include "qk_graph/sema/resolution/symbol_table.hpp"

namespace qk_graph
{

/**
 * Builds a FileSymbolTable from one Program.
 *
 * Recorded bindings:
 * - top-level variable declarators with an identifier id and initializer
 *   (plus the returned expression when the initializer is a function)
 * - top-level function declarations (their returned expression)
 * - non-top-level declarations whose name passes is_query_key_symbol_name()
 *
 * Later declarations of the same name overwrite earlier ones.
 */
class SymbolTableBuilder : public ConstRecursiveAstVisitor<SymbolTableBuilder>
{
public:
  explicit SymbolTableBuilder(FileSymbolTable & table) : table_(table) {}

  /// Entry point
  void build(const Program & program);

  // Visitor Methods
  bool visit_import_decl(const ImportDecl * node);
  bool visit_variable_decl(const VariableDecl * node);
  bool visit_function_decl(const FunctionDecl * node);
  bool visit_export_named_decl(const ExportNamedDecl * node);
  bool visit_export_default_decl(const ExportDefaultDecl * node);
  bool visit_export_all_decl(const ExportAllDecl * node);

private:
  void collect_variable(const VariableDeclarator * declarator);
  void collect_default_export(const AstNode * declaration);

  [[nodiscard]] bool is_top_level(const AstNode * decl) const
  {
    return top_level_.count(decl) > 0;
  }

  FileSymbolTable & table_;
  std::unordered_set<const AstNode *> top_level_;
};

/// Build the table of one parsed file
[[nodiscard]] FileSymbolTable build_file_symbols(
  const std::string & path, FileId file_id, const Program & program);

}  // namespace qk_graph
