// qk_graph/graph/graph.cpp - Graph lookups and identifiers
//
#include "qk_graph/graph/graph.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace qk_graph
{

const GraphNode * Graph::find_node(std::string_view id) const noexcept
{
  auto it =
    std::find_if(nodes.begin(), nodes.end(), [id](const GraphNode & n) { return n.id == id; });
  return it != nodes.end() ? &*it : nullptr;
}

const GraphEdge * Graph::find_edge(std::string_view id) const noexcept
{
  auto it =
    std::find_if(edges.begin(), edges.end(), [id](const GraphEdge & e) { return e.id == id; });
  return it != edges.end() ? &*it : nullptr;
}

size_t Graph::count(GraphNodeKind kind) const noexcept
{
  return static_cast<size_t>(std::count_if(
    nodes.begin(), nodes.end(), [kind](const GraphNode & n) { return n.kind == kind; }));
}

std::string file_node_id(std::string_view absolute_path)
{
  return fmt::format("file:{}", absolute_path);
}

std::string action_node_id(const CallSiteRecord & record, size_t index)
{
  return fmt::format(
    "action:{}:{}:{}:{}:{}", record.file, record.line, record.column, record.operation, index);
}

std::string query_key_node_id(std::string_view project_scope, std::string_view key_id)
{
  return fmt::format("qk:{}::{}", project_scope, key_id);
}

std::string edge_id(std::string_view source, std::string_view target, Relation relation)
{
  return fmt::format("{}->{}:{}", source, target, to_string(relation));
}

}  // namespace qk_graph
