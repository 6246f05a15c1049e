// qk_graph/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <string>

#include "qk_graph/ast/ast.hpp"
#include "qk_graph/ast/ast_context.hpp"
#include "qk_graph/basic/diagnostic.hpp"
#include "qk_graph/basic/source_manager.hpp"
#include "qk_graph/syntax/ts_ll.hpp"

namespace qk_graph
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  Program * program = nullptr;  ///< nullptr on parse failure
  ts_ll::Grammar grammar = ts_ll::Grammar::Tsx;

  /// `Syntax error at line:col` / `Missing token at line:col` on failure
  std::string error_message;

  [[nodiscard]] bool ok() const noexcept { return program != nullptr; }
};

/// Grammar chosen first for a file: TypeScript for .ts/.mts/.cts, TSX otherwise
[[nodiscard]] ts_ll::Grammar grammar_for_path(const std::filesystem::path & path);

/**
 * Parse pipeline:
 * source -> tree-sitter (preferred grammar, then the other one) -> AstBuilder
 *
 * The file is registered in `sources` even when parsing fails. On failure a
 * single error diagnostic is added to `diags` at the first error node.
 */
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags);

}  // namespace qk_graph
