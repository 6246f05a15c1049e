// qk_graph/sema/resolution/symbol_table.hpp - Per-file export/import tables and the symbol index
//
// A FileSymbolTable is purely syntactic: it records what one file exports,
// imports and re-exports, plus the value/return expressions of top-level
// (and key-named) bindings. SymbolIndex aggregates the tables of one run.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "qk_graph/ast/ast.hpp"
#include "qk_graph/sema/resolution/binding.hpp"

namespace qk_graph
{

/// Export name under which non-identifier default exports are stored
inline constexpr std::string_view k_default_export_name = "__default_export__";

// ============================================================================
// Table entries
// ============================================================================

struct ImportBinding
{
  ImportKind kind;
  std::string_view source;    ///< Module specifier as written
  std::string_view imported;  ///< Exported name in the source module; empty for namespaces
};

struct ReExportBinding
{
  std::string_view source;
  std::string_view imported;  ///< Empty when `all`
  std::string_view exported;  ///< Empty when `all`
  bool all = false;           ///< `export * from 'source'`
};

// ============================================================================
// FileSymbolTable
// ============================================================================

/**
 * Exports, imports and named expressions of one file.
 *
 * Keys and expressions point into the file's AstContext, which must
 * outlive the table.
 */
struct FileSymbolTable
{
  template <typename V>
  using NameMap = std::unordered_map<std::string_view, V, StringViewHash, StringViewEqual>;

  std::string path;  ///< Normalized absolute path (forward slashes)
  FileId file_id = FileId::invalid();

  NameMap<const Expr *> values;     ///< name -> initializer (casts stripped)
  NameMap<const Expr *> functions;  ///< name -> returned expression
  NameMap<ImportBinding> imports;   ///< local name -> import
  NameMap<std::string_view> exports;  ///< exported name -> local name
  std::vector<ReExportBinding> reExports;

  [[nodiscard]] const Expr * find_value(std::string_view name) const
  {
    auto it = values.find(name);
    return it != values.end() ? it->second : nullptr;
  }

  [[nodiscard]] const Expr * find_function(std::string_view name) const
  {
    auto it = functions.find(name);
    return it != functions.end() ? it->second : nullptr;
  }

  [[nodiscard]] const ImportBinding * find_import(std::string_view name) const
  {
    auto it = imports.find(name);
    return it != imports.end() ? &it->second : nullptr;
  }

  [[nodiscard]] std::optional<std::string_view> find_export(std::string_view name) const
  {
    auto it = exports.find(name);
    if (it == exports.end()) return std::nullopt;
    return it->second;
  }
};

// ============================================================================
// SymbolIndex
// ============================================================================

/**
 * All FileSymbolTables of one analysis run, in insertion order.
 *
 * Built once after parsing; read-only during resolution.
 */
class SymbolIndex
{
public:
  /// Add (or replace) the table of a file
  void add(FileSymbolTable table);

  [[nodiscard]] const FileSymbolTable * find(std::string_view path) const;
  /// Table of the file an AST node came from
  [[nodiscard]] const FileSymbolTable * find(FileId file_id) const;
  [[nodiscard]] bool contains(std::string_view path) const { return find(path) != nullptr; }

  [[nodiscard]] const std::vector<std::unique_ptr<FileSymbolTable>> & files() const noexcept
  {
    return files_;
  }
  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

private:
  std::vector<std::unique_ptr<FileSymbolTable>> files_;
  std::unordered_map<std::string, FileSymbolTable *> by_path_;
  std::unordered_map<uint32_t, FileSymbolTable *> by_file_;
};

// ============================================================================
// Helpers shared by resolution and key normalization
// ============================================================================

/// Absolute, lexically normal path with forward slashes
[[nodiscard]] std::string normalize_analyzer_path(const std::filesystem::path & path);

/**
 * Names that look like query-key constants or factories: the lower-cased name
 * contains `querykey` or `rqkey`, except the bare name `querykey`.
 */
[[nodiscard]] bool is_query_key_symbol_name(std::string_view name);

/**
 * Expression returned by a function.
 *
 * Arrows with an expression body return it; block bodies yield the first
 * reachable `return` argument. A returned identifier declared by a top-level
 * variable of the body is replaced by that initializer (following aliases).
 *
 * @return nullptr if no return expression exists
 */
[[nodiscard]] const Expr * extract_function_return_expression(const FunctionExpr * fn);

}  // namespace qk_graph
