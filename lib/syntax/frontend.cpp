// qk_graph/syntax/frontend.cpp - High-level parse pipeline
#include "qk_graph/syntax/frontend.hpp"

#include <fmt/format.h>

#include <string_view>

#include "qk_graph/syntax/ast_builder.hpp"

namespace qk_graph
{

namespace
{

std::string describe_error(const SourceFile & file, const ts_ll::Node err)
{
  const LineColumn lc = file.get_line_column(err.start_byte());
  return fmt::format(
    "{} at {}:{}", err.is_missing() ? "Missing token" : "Syntax error", lc.line, lc.column);
}

}  // namespace

ts_ll::Grammar grammar_for_path(const std::filesystem::path & path)
{
  const std::string ext = path.extension().string();
  if (ext == ".ts" || ext == ".mts" || ext == ".cts") return ts_ll::Grammar::TypeScript;
  return ts_ll::Grammar::Tsx;
}

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags)
{
  ParseOutput out;
  out.file_id = sources.register_file(path, std::move(source_text));
  const SourceFile * file = sources.get_file(out.file_id);
  if (file == nullptr) {
    out.error_message = "too many source files";
    diags.report_error(SourceRange{}, out.error_message).with_code("parse-error");
    return out;
  }
  const std::string_view text = file->content();

  const ts_ll::Grammar preferred = grammar_for_path(path);

  ts_ll::Tree tree;
  SourceRange error_range(out.file_id, 0, 0);
  for (const ts_ll::Grammar g : {preferred, ts_ll::other_grammar(preferred)}) {
    const ts_ll::Parser parser(g);
    if (!parser.is_ready()) continue;
    ts_ll::Tree candidate(parser.parse_string(text));
    if (candidate.is_null()) continue;

    const ts_ll::Node root = candidate.root_node();
    if (!root.has_error()) {
      tree = std::move(candidate);
      out.grammar = parser.grammar();
      break;
    }
    // Failures are described by the preferred grammar's first error
    if (out.error_message.empty()) {
      const ts_ll::Node err = root.first_error();
      const ts_ll::Node at = err.is_null() ? root : err;
      out.error_message = describe_error(*file, at);
      error_range = at.range(out.file_id);
    }
  }

  if (tree.is_null()) {
    if (out.error_message.empty()) {
      out.error_message = "tree-sitter parse failed (null tree)";
    }
    diags.report_error(error_range, out.error_message).with_code("parse-error");
    return out;
  }
  out.error_message.clear();

  AstBuilder builder(ast, out.file_id, text);
  out.program = builder.build_program(tree.root_node());
  return out;
}

}  // namespace qk_graph
