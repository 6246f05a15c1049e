// qk_graph/graph/graph.hpp - Query-cache impact graph
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "qk_graph/sema/analysis/call_site.hpp"
#include "qk_graph/sema/keys/normalized_key.hpp"

namespace qk_graph
{

enum class GraphNodeKind : uint8_t {
  File,
  Action,
  QueryKey,
};

[[nodiscard]] constexpr std::string_view to_string(GraphNodeKind kind) noexcept
{
  switch (kind) {
    case GraphNodeKind::File:
      return "file";
    case GraphNodeKind::Action:
      return "action";
    case GraphNodeKind::QueryKey:
      return "queryKey";
  }
  return "file";
}

/**
 * Per-node metrics.
 *
 * Which fields are set depends on the node kind:
 * - file: affectedKeys, projectScope
 * - action: relation, displayFile, declaresDirectly, projectScope
 * - queryKey: matchMode, rootSegment, affectedFiles, declaredFiles,
 *   declaredCallsites, actionCallsites, projectScope
 */
struct NodeMetrics
{
  std::string projectScope;

  std::optional<uint32_t> affectedKeys;

  std::optional<Relation> relation;
  std::optional<std::string> displayFile;
  std::optional<bool> declaresDirectly;

  std::optional<MatchMode> matchMode;
  std::optional<std::string> rootSegment;
  std::optional<uint32_t> affectedFiles;
  std::optional<uint32_t> declaredFiles;
  std::optional<uint32_t> declaredCallsites;
  std::optional<uint32_t> actionCallsites;
};

struct GraphLocation
{
  uint32_t line = 1;
  uint32_t column = 1;
};

struct GraphNode
{
  std::string id;
  GraphNodeKind kind = GraphNodeKind::File;
  std::string label;
  std::optional<std::string> file;  ///< Absolute path (file and action nodes)
  std::optional<GraphLocation> loc;  ///< Action nodes
  Resolution resolution = Resolution::Static;
  NodeMetrics metrics;
};

struct GraphEdge
{
  std::string id;
  std::string source;
  std::string target;
  Relation relation = Relation::Declares;
  Resolution resolution = Resolution::Static;
};

/// File that could not be parsed; `file` is a display path
struct ParseError
{
  std::string file;
  std::string message;
};

struct GraphSummary
{
  uint32_t files = 0;
  uint32_t actions = 0;
  uint32_t queryKeys = 0;
  uint32_t parseErrors = 0;
};

/**
 * Assembled graph.
 *
 * Nodes keep first-seen order: every file, action and key node appears in
 * the order its first record was processed. Edges likewise.
 */
struct Graph
{
  std::vector<GraphNode> nodes;
  std::vector<GraphEdge> edges;
  GraphSummary summary;
  std::vector<ParseError> parseErrors;

  [[nodiscard]] const GraphNode * find_node(std::string_view id) const noexcept;
  [[nodiscard]] const GraphEdge * find_edge(std::string_view id) const noexcept;
  [[nodiscard]] size_t count(GraphNodeKind kind) const noexcept;
};

// ============================================================================
// Identifiers
// ============================================================================

[[nodiscard]] std::string file_node_id(std::string_view absolute_path);

[[nodiscard]] std::string action_node_id(const CallSiteRecord & record, size_t index);

/// Key nodes are per project scope: `qk:<scope>::<key id>`
[[nodiscard]] std::string query_key_node_id(
  std::string_view project_scope, std::string_view key_id);

[[nodiscard]] std::string edge_id(
  std::string_view source, std::string_view target, Relation relation);

}  // namespace qk_graph
