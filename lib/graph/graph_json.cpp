// qk_graph/graph/graph_json.cpp - JSON serialization for graphs and keys
//
#include "qk_graph/graph/graph_json.hpp"

#include <string>

namespace qk_graph
{
namespace
{

using nlohmann::json;

std::string str(std::string_view text) { return std::string(text); }

json j_metrics(const NodeMetrics & m)
{
  json j = json::object();
  if (m.affectedKeys) j["affectedKeys"] = *m.affectedKeys;
  if (m.relation) j["relation"] = str(to_string(*m.relation));
  if (m.displayFile) j["displayFile"] = *m.displayFile;
  if (m.declaresDirectly) j["declaresDirectly"] = *m.declaresDirectly ? 1 : 0;
  if (m.matchMode) j["matchMode"] = str(to_string(*m.matchMode));
  if (m.rootSegment) j["rootSegment"] = *m.rootSegment;
  if (m.affectedFiles) j["affectedFiles"] = *m.affectedFiles;
  if (m.declaredFiles) j["declaredFiles"] = *m.declaredFiles;
  if (m.declaredCallsites) j["declaredCallsites"] = *m.declaredCallsites;
  if (m.actionCallsites) j["actionCallsites"] = *m.actionCallsites;
  j["projectScope"] = m.projectScope;
  return j;
}

json j_node(const GraphNode & node)
{
  json j{
    {"id", node.id},
    {"kind", str(to_string(node.kind))},
    {"label", node.label},
    {"resolution", str(to_string(node.resolution))}};
  if (node.file) j["file"] = *node.file;
  if (node.loc) j["loc"] = json{{"line", node.loc->line}, {"column", node.loc->column}};
  j["metrics"] = j_metrics(node.metrics);
  return j;
}

json j_edge(const GraphEdge & edge)
{
  return json{
    {"id", edge.id},
    {"source", edge.source},
    {"target", edge.target},
    {"relation", str(to_string(edge.relation))},
    {"resolution", str(to_string(edge.resolution))}};
}

}  // namespace

json to_json(const NormalizedKey & key)
{
  return json{
    {"id", key.id},
    {"display", key.display},
    {"segments", key.segments},
    {"matchMode", str(to_string(key.matchMode))},
    {"resolution", str(to_string(key.resolution))},
    {"source", str(to_string(key.source))}};
}

json to_json(const CallSiteRecord & record)
{
  return json{
    {"relation", str(to_string(record.relation))},
    {"operation", record.operation},
    {"file", record.file},
    {"loc", json{{"line", record.line}, {"column", record.column}}},
    {"queryKey", to_json(record.queryKey)},
    {"resolution", str(to_string(record.resolution))},
    {"declaresDirectly", record.declaresDirectly}};
}

json to_json(const Graph & graph)
{
  json nodes = json::array();
  for (const GraphNode & node : graph.nodes) nodes.push_back(j_node(node));

  json edges = json::array();
  for (const GraphEdge & edge : graph.edges) edges.push_back(j_edge(edge));

  json errors = json::array();
  for (const ParseError & error : graph.parseErrors) {
    errors.push_back(json{{"file", error.file}, {"message", error.message}});
  }

  return json{
    {"nodes", std::move(nodes)},
    {"edges", std::move(edges)},
    {"summary",
     json{
       {"files", graph.summary.files},
       {"actions", graph.summary.actions},
       {"queryKeys", graph.summary.queryKeys},
       {"parseErrors", graph.summary.parseErrors}}},
    {"parseErrors", std::move(errors)}};
}

}  // namespace qk_graph
