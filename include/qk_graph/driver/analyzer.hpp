// qk_graph/driver/analyzer.hpp - Analysis driver
//
// Single entry point for an analysis run. Used by the CLI and by tests.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "qk_graph/basic/diagnostic.hpp"
#include "qk_graph/basic/source_manager.hpp"
#include "qk_graph/driver/file_collector.hpp"
#include "qk_graph/graph/graph.hpp"
#include "qk_graph/graph/graph_builder.hpp"
#include "qk_graph/graph/project_scope.hpp"
#include "qk_graph/project/project_config.hpp"
#include "qk_graph/sema/analysis/call_site.hpp"

namespace qk_graph
{

// ============================================================================
// Analyze Options
// ============================================================================

struct AnalyzeOptions
{
  /// Roots to scan; their names label display paths and project scopes
  std::vector<WorkspaceRoot> roots;

  /// File selection (globs, .gitignore, size ceiling)
  ScanConfig scan;

  /// Emit phase summaries as info diagnostics
  bool verbose = false;
};

/// In-memory source handed to the pipeline without touching the disk
struct SourceInput
{
  std::filesystem::path path;
  std::string text;
};

// ============================================================================
// Analysis Result
// ============================================================================

struct AnalysisResult
{
  /// Whether the run completed (parse errors alone do not fail a run)
  bool success = false;

  /// Every classified call site, in file order then source order
  std::vector<CallSiteRecord> records;

  /// Normalized paths of every file handed to the parser
  std::vector<std::string> scannedFiles;

  /// Files that were read but could not be parsed
  std::vector<FileParseFailure> parseErrors;

  /// Files left out by the size ceiling or read errors
  std::vector<SkippedFile> skipped;

  Graph graph;

  /// Parse failures, collection problems and (verbose) phase notes
  DiagnosticBag diagnostics;

  /// Sources of the run, for rendering diagnostics
  std::unique_ptr<SourceRegistry> sources = std::make_unique<SourceRegistry>();

  [[nodiscard]] size_t files_scanned() const noexcept { return scannedFiles.size(); }
};

// ============================================================================
// Analyzer
// ============================================================================

/**
 * Driver that orchestrates the analysis pipeline.
 *
 * The pipeline consists of:
 * 1. File collection (per root)
 * 2. Parsing and local binding resolution (per file)
 * 3. Symbol index construction (all parsed files)
 * 4. Call-site classification (per file, against the finished index)
 * 5. Graph assembly
 */
class Analyzer
{
public:
  /**
   * Collect, parse and analyze every root of `options`.
   *
   * @param options Roots and scan settings
   * @return AnalysisResult with records, graph and diagnostics
   */
  [[nodiscard]] static AnalysisResult analyze_project(const AnalyzeOptions & options);

  /**
   * Analyze an explicit list of files (no globbing).
   *
   * Files that cannot be read are reported as parse errors.
   */
  [[nodiscard]] static AnalysisResult analyze_files(
    const std::vector<std::filesystem::path> & files, const AnalyzeOptions & options);

  /**
   * Analyze in-memory sources. Module resolution still consults tsconfig
   * files on disk, and project scopes still look for package manifests.
   */
  [[nodiscard]] static AnalysisResult analyze_sources(
    std::vector<SourceInput> inputs, const AnalyzeOptions & options);

private:
  static void run_pipeline(
    std::vector<SourceInput> inputs, const AnalyzeOptions & options, AnalysisResult & result);
};

/// Roots named after their directory (`name`, `name-2`, ... on collisions)
[[nodiscard]] std::vector<WorkspaceRoot> make_workspace_roots(
  const std::vector<std::filesystem::path> & dirs);

/// Roots declared by a loaded configuration
[[nodiscard]] std::vector<WorkspaceRoot> workspace_roots_from_config(const ProjectConfig & config);

}  // namespace qk_graph
