// qk_graph/graph/graph_json.hpp - JSON serialization for graphs and keys
//
// Field names follow the graph data model: nodes carry `id`, `kind`,
// `label`, `resolution`, optional `file`/`loc` and a `metrics` object;
// edges carry `id`, `source`, `target`, `relation`, `resolution`.
//
#pragma once

#include <nlohmann/json.hpp>

#include "qk_graph/graph/graph.hpp"

namespace qk_graph
{

/**
 * Serialize a graph.
 *
 * @return `{ nodes, edges, summary, parseErrors }`
 */
[[nodiscard]] nlohmann::json to_json(const Graph & graph);

/// `{ id, display, segments, matchMode, resolution, source }`
[[nodiscard]] nlohmann::json to_json(const NormalizedKey & key);

/// One classified call site, key included
[[nodiscard]] nlohmann::json to_json(const CallSiteRecord & record);

}  // namespace qk_graph
