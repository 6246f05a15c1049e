// qk_graph/graph/graph_builder.hpp - Links call sites to declared keys
//
#pragma once

#include <vector>

#include "qk_graph/graph/graph.hpp"
#include "qk_graph/graph/project_scope.hpp"
#include "qk_graph/sema/analysis/call_site.hpp"

namespace qk_graph
{

/// Parse failure as reported by the driver (absolute path)
struct FileParseFailure
{
  std::string file;
  std::string message;
};

// ============================================================================
// Key matching
// ============================================================================

/// Key that stands for the whole cache (or for a whole project scope)
[[nodiscard]] bool is_wildcard_record_key(const NormalizedKey & key);

/// Matches anything: empty, `$name`, template holes, UNRESOLVED, `call(...)`, `cond(...)`
[[nodiscard]] bool is_dynamic_segment(std::string_view segment);

/// Equal text, or either side dynamic
[[nodiscard]] bool segments_compatible(std::string_view left, std::string_view right);

/**
 * Whether a mutation key reaches a declared key.
 *
 * Pass-through keys never match. Wildcard, `all` and `predicate` keys match
 * everything. Keys consisting of a lone UNRESOLVED never match. Otherwise
 * the mutation's segments must be a position-by-position compatible prefix
 * of the declared key's, of equal length when the mode is `exact`.
 * UNRESOLVED segments keep their position and compare as dynamic.
 */
[[nodiscard]] bool action_affects_declared_key(
  const NormalizedKey & action, const NormalizedKey & declared);

/// Concrete key that a `sets` record keeps alive in the graph
[[nodiscard]] bool is_set_anchored_key(const NormalizedKey & key);

// ============================================================================
// Assembly
// ============================================================================

/**
 * Builds the graph in two passes over the records.
 *
 * Pass 1 creates file, action and key nodes and collects declared keys per
 * project scope. Pass 2 links every action to its target keys: a
 * declaration to its own key, a wildcard to every declared key of its
 * scope, any other mutation to the compatible declared keys of its scope
 * or, failing that, to its own key. Key nodes without a declaration or a
 * concrete `sets` anchor are pruned afterwards, together with their edges.
 *
 * With no roots, the current directory is used as the single root
 * `workspace`.
 */
[[nodiscard]] Graph build_graph(
  std::vector<WorkspaceRoot> roots, const std::vector<CallSiteRecord> & records,
  const std::vector<FileParseFailure> & parse_failures = {});

}  // namespace qk_graph
