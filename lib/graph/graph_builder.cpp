// qk_graph/graph/graph_builder.cpp - Links call sites to declared keys
//
#include "qk_graph/graph/graph_builder.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace qk_graph
{

namespace
{

std::string_view trim(std::string_view text)
{
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) return {};
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

bool starts_with(std::string_view text, std::string_view prefix)
{
  return text.substr(0, prefix.size()) == prefix;
}

bool has_compatible_prefix(
  const std::vector<std::string> & prefix, const std::vector<std::string> & value)
{
  if (prefix.size() > value.size()) return false;
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (!segments_compatible(prefix[i], value[i])) return false;
  }
  return true;
}

/// Action waiting for pass 2
struct PendingLink
{
  size_t actionNode;
  const CallSiteRecord * record;
  std::string file;
  std::string projectScope;
  bool wildcard;
  std::string keyNodeId;  ///< Empty for wildcards
};

/// Node and edge tables that keep first-insertion order
class GraphTables
{
public:
  /// Index of the node with `id`, inserting `make()` when absent
  template <typename Make>
  size_t ensure_node(const std::string & id, Make && make)
  {
    auto it = node_index_.find(id);
    if (it != node_index_.end()) return it->second;
    nodes.push_back(make());
    node_index_.emplace(id, nodes.size() - 1);
    return nodes.size() - 1;
  }

  void ensure_edge(const std::string & source, const std::string & target, Relation relation,
                   Resolution resolution)
  {
    std::string id = edge_id(source, target, relation);
    if (!edge_ids_.insert(id).second) return;
    edges.push_back(GraphEdge{std::move(id), source, target, relation, resolution});
  }

  [[nodiscard]] GraphNode * find(const std::string & id)
  {
    auto it = node_index_.find(id);
    return it != node_index_.end() ? &nodes[it->second] : nullptr;
  }

  std::vector<GraphNode> nodes;
  std::vector<GraphEdge> edges;

private:
  std::unordered_map<std::string, size_t> node_index_;
  std::unordered_set<std::string> edge_ids_;
};

/// Distinct key nodes reachable from each file (and back) through surviving edges
void recompute_reach_metrics(Graph & graph)
{
  std::unordered_map<std::string, GraphNodeKind> kinds;
  for (const GraphNode & node : graph.nodes) kinds.emplace(node.id, node.kind);

  std::unordered_map<std::string, std::set<std::string>> action_files;
  std::unordered_map<std::string, std::set<std::string>> action_keys;
  for (const GraphEdge & edge : graph.edges) {
    const GraphNodeKind source = kinds.at(edge.source);
    const GraphNodeKind target = kinds.at(edge.target);
    if (source == GraphNodeKind::File && target == GraphNodeKind::Action) {
      action_files[edge.target].insert(edge.source);
    } else if (source == GraphNodeKind::Action && target == GraphNodeKind::QueryKey) {
      action_keys[edge.source].insert(edge.target);
    }
  }

  std::unordered_map<std::string, std::set<std::string>> file_keys;
  std::unordered_map<std::string, std::set<std::string>> key_files;
  for (const auto & [action, keys] : action_keys) {
    auto files = action_files.find(action);
    if (files == action_files.end()) continue;
    for (const std::string & file : files->second) {
      for (const std::string & key : keys) {
        file_keys[file].insert(key);
        key_files[key].insert(file);
      }
    }
  }

  for (GraphNode & node : graph.nodes) {
    if (node.kind == GraphNodeKind::File) {
      auto it = file_keys.find(node.id);
      const size_t count = it != file_keys.end() ? it->second.size() : 0;
      node.metrics.affectedKeys = static_cast<uint32_t>(count);
    } else if (node.kind == GraphNodeKind::QueryKey) {
      auto it = key_files.find(node.id);
      const size_t count = it != key_files.end() ? it->second.size() : 0;
      node.metrics.affectedFiles = static_cast<uint32_t>(count);
    }
  }
}

}  // namespace

// ============================================================================
// Key matching
// ============================================================================

bool is_wildcard_record_key(const NormalizedKey & key)
{
  return key.is_wildcard() || key.id == "*" || key.id == k_all_query_cache_id;
}

bool is_dynamic_segment(std::string_view segment)
{
  const std::string_view text = trim(segment);
  if (text.empty()) return true;
  if (text.front() == '$') return true;
  if (text.find("${") != std::string_view::npos) return true;
  if (text.find(k_unresolved_segment) != std::string_view::npos) return true;
  return starts_with(text, "call(") || starts_with(text, "cond(");
}

bool segments_compatible(std::string_view left, std::string_view right)
{
  return left == right || is_dynamic_segment(left) || is_dynamic_segment(right);
}

bool action_affects_declared_key(const NormalizedKey & action, const NormalizedKey & declared)
{
  if (action.id == k_pass_through_key_id) return false;
  if (action.is_wildcard() || action.matchMode == MatchMode::All ||
      action.matchMode == MatchMode::Predicate) {
    return true;
  }
  if (action.id == declared.id) return true;

  // A key that is nothing but UNRESOLVED carries no position to compare
  if (is_unresolved_key(action) || is_unresolved_key(declared)) return false;
  if (action.segments.empty() || declared.segments.empty()) return false;

  if (action.matchMode == MatchMode::Exact && action.segments.size() != declared.segments.size()) {
    return false;
  }
  return has_compatible_prefix(action.segments, declared.segments);
}

bool is_set_anchored_key(const NormalizedKey & key)
{
  if (key.is_wildcard()) return false;
  return key.id != k_pass_through_key_id && key.id != k_all_query_cache_id &&
         key.id != k_unresolved_key_id;
}

// ============================================================================
// Assembly
// ============================================================================

Graph build_graph(
  std::vector<WorkspaceRoot> roots, const std::vector<CallSiteRecord> & records,
  const std::vector<FileParseFailure> & parse_failures)
{
  if (roots.empty()) {
    std::error_code ec;
    roots.push_back(WorkspaceRoot{"workspace", fs::current_path(ec)});
  }
  ProjectScopeResolver scopes(std::move(roots));

  GraphTables tables;
  std::unordered_map<std::string, std::string> file_scopes;
  std::unordered_map<std::string, std::string> key_scopes;

  // Declared keys in first-declaration order
  std::vector<std::string> declared_ids;
  std::unordered_map<std::string, const NormalizedKey *> declared_keys;

  std::vector<PendingLink> pending;
  pending.reserve(records.size());

  // Pass 1: nodes and declarations
  for (size_t index = 0; index < records.size(); ++index) {
    const CallSiteRecord & record = records[index];
    const std::string file = to_generic_path(record.file);
    const std::string display = scopes.display_path(file);
    const std::string scope = scopes.project_scope(file);
    file_scopes.insert_or_assign(file, scope);

    const std::string file_id = file_node_id(file);
    const std::string action_id = action_node_id(record, index);
    const std::string key_id = query_key_node_id(scope, record.queryKey.id);
    const bool wildcard = is_wildcard_record_key(record.queryKey);

    tables.ensure_node(file_id, [&] {
      GraphNode node;
      node.id = file_id;
      node.kind = GraphNodeKind::File;
      node.label = display;
      node.file = file;
      node.resolution = Resolution::Static;
      return node;
    });

    const size_t action_node = tables.ensure_node(action_id, [&] {
      GraphNode node;
      node.id = action_id;
      node.kind = GraphNodeKind::Action;
      node.label = record.operation;
      node.file = file;
      node.loc = GraphLocation{record.line, record.column};
      node.resolution = record.resolution;
      node.metrics.relation = record.relation;
      node.metrics.displayFile = display;
      node.metrics.projectScope = scope;
      node.metrics.declaresDirectly = record.declaresDirectly;
      return node;
    });

    if (!wildcard) {
      tables.ensure_node(key_id, [&] {
        GraphNode node;
        node.id = key_id;
        node.kind = GraphNodeKind::QueryKey;
        node.label = record.queryKey.display;
        node.resolution = record.queryKey.resolution;
        node.metrics.matchMode = record.queryKey.matchMode;
        const auto & segments = record.queryKey.segments;
        node.metrics.rootSegment = segments.empty() ? std::string("unknown") : segments.front();
        return node;
      });

      key_scopes.emplace(key_id, scope);

      if (record.relation == Relation::Declares) {
        if (declared_keys.emplace(key_id, &record.queryKey).second) declared_ids.push_back(key_id);
      }
    }

    tables.ensure_edge(file_id, action_id, record.relation, record.resolution);
    pending.push_back(
      PendingLink{action_node, &record, file, scope, wildcard, wildcard ? std::string() : key_id});
  }

  // Pass 2: action -> key links
  std::unordered_set<std::string> set_anchored;
  std::unordered_map<std::string, std::set<std::string>> key_declare_files;
  std::unordered_map<std::string, uint32_t> key_declare_callsites;
  std::unordered_map<std::string, uint32_t> key_action_callsites;

  auto in_scope = [&key_scopes](const std::string & key, const std::string & scope) {
    auto it = key_scopes.find(key);
    return it != key_scopes.end() && it->second == scope;
  };

  for (const PendingLink & link : pending) {
    const CallSiteRecord & record = *link.record;
    std::vector<std::string> targets;

    if (record.relation == Relation::Declares) {
      if (!link.keyNodeId.empty()) targets.push_back(link.keyNodeId);
    } else if (link.wildcard) {
      for (const std::string & key : declared_ids) {
        if (in_scope(key, link.projectScope)) targets.push_back(key);
      }
    } else if (!link.keyNodeId.empty()) {
      for (const std::string & key : declared_ids) {
        if (!in_scope(key, link.projectScope)) continue;
        if (action_affects_declared_key(record.queryKey, *declared_keys.at(key))) {
          targets.push_back(key);
        }
      }
      if (targets.empty()) targets.push_back(link.keyNodeId);
    }

    const std::string & action_id = tables.nodes[link.actionNode].id;
    for (const std::string & target : targets) {
      if (record.relation == Relation::Sets && is_set_anchored_key(record.queryKey)) {
        set_anchored.insert(target);
      }
      tables.ensure_edge(action_id, target, record.relation, record.resolution);

      if (record.relation == Relation::Declares) {
        key_declare_files[target].insert(link.file);
        ++key_declare_callsites[target];
      } else {
        ++key_action_callsites[target];
      }
    }
  }

  // Scope and declaration metrics
  for (GraphNode & node : tables.nodes) {
    if (node.kind == GraphNodeKind::File) {
      auto it = file_scopes.find(*node.file);
      node.metrics.projectScope = it != file_scopes.end() ? it->second : "workspace:*";
      continue;
    }
    if (node.kind != GraphNodeKind::QueryKey) continue;

    node.metrics.declaredFiles = static_cast<uint32_t>(key_declare_files[node.id].size());
    node.metrics.declaredCallsites = key_declare_callsites[node.id];
    node.metrics.actionCallsites = key_action_callsites[node.id];

    auto scope = key_scopes.find(node.id);
    node.metrics.projectScope = scope != key_scopes.end() ? scope->second : "workspace:*";
  }

  // Prune keys without a declaration or a concrete `sets` anchor
  Graph graph;
  std::unordered_set<std::string> kept;
  for (GraphNode & node : tables.nodes) {
    if (node.kind == GraphNodeKind::QueryKey && node.metrics.declaredCallsites.value_or(0) == 0 &&
        set_anchored.count(node.id) == 0) {
      continue;
    }
    kept.insert(node.id);
    graph.nodes.push_back(std::move(node));
  }
  for (GraphEdge & edge : tables.edges) {
    if (kept.count(edge.source) > 0 && kept.count(edge.target) > 0) {
      graph.edges.push_back(std::move(edge));
    }
  }

  recompute_reach_metrics(graph);

  for (const FileParseFailure & failure : parse_failures) {
    graph.parseErrors.push_back(ParseError{scopes.display_path(failure.file), failure.message});
  }

  graph.summary.files = static_cast<uint32_t>(graph.count(GraphNodeKind::File));
  graph.summary.actions = static_cast<uint32_t>(graph.count(GraphNodeKind::Action));
  graph.summary.queryKeys = static_cast<uint32_t>(graph.count(GraphNodeKind::QueryKey));
  graph.summary.parseErrors = static_cast<uint32_t>(graph.parseErrors.size());
  return graph;
}

}  // namespace qk_graph
