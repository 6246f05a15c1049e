// qk_graph/sema/analysis/call_site_classifier.hpp - Query call-site classification
//
#pragma once

#include <vector>

#include "qk_graph/ast/ast.hpp"
#include "qk_graph/basic/source_manager.hpp"
#include "qk_graph/sema/analysis/call_site.hpp"
#include "qk_graph/sema/keys/key_normalizer.hpp"

namespace qk_graph
{

/// Name of the JSX prop whose value lists keys to invalidate
inline constexpr std::string_view k_invalidate_prop_name = "queryKeysToInvalidate";

/// Recursion cap while resolving that prop's value
inline constexpr int k_max_jsx_prop_depth = 16;

/**
 * Turns the query-related calls of one file into CallSiteRecords.
 *
 * Recognized sites are:
 * - query hooks (`useQuery`, `useQueries`, `queryOptions`, ...), as
 *   declarations, one record per inferred key;
 * - query-client methods on a tracked client variable: fetch-style methods
 *   declare, mutation-style methods invalidate/refetch/cancel/reset/clear/
 *   remove/set;
 * - `refetch()` handles obtained from a hook;
 * - the `queryKeysToInvalidate` JSX prop, one invalidation per listed key.
 *
 * Records come out in source order. The caller owns the program; keys
 * synthesised along the way live in the normalizer's scratch context.
 */
class CallSiteClassifier
{
public:
  CallSiteClassifier(const SourceRegistry & sources, KeyNormalizer & normalizer)
  : sources_(sources), normalizer_(normalizer)
  {
  }

  [[nodiscard]] std::vector<CallSiteRecord> classify(const Program & program, FileId file);

private:
  const SourceRegistry & sources_;
  KeyNormalizer & normalizer_;
};

}  // namespace qk_graph
