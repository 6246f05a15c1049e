// qk_graph/sema/analysis/call_site.hpp - Classified call-site records
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "qk_graph/sema/keys/normalized_key.hpp"

namespace qk_graph
{

/// Effect of a call site on the cache
enum class Relation : uint8_t {
  Declares,
  Invalidates,
  Refetches,
  Cancels,
  Resets,
  Clears,
  Removes,
  Sets,
};

[[nodiscard]] constexpr std::string_view to_string(Relation relation) noexcept
{
  switch (relation) {
    case Relation::Declares:
      return "declares";
    case Relation::Invalidates:
      return "invalidates";
    case Relation::Refetches:
      return "refetches";
    case Relation::Cancels:
      return "cancels";
    case Relation::Resets:
      return "resets";
    case Relation::Clears:
      return "clears";
    case Relation::Removes:
      return "removes";
    case Relation::Sets:
      return "sets";
  }
  return "declares";
}

/**
 * One recognized call site.
 *
 * `file` is the normalized absolute path. `line` and `column` are 1-based
 * and point at the start of the call (or of the JSX attribute element).
 */
struct CallSiteRecord
{
  Relation relation = Relation::Declares;
  std::string operation;
  std::string file;
  uint32_t line = 1;
  uint32_t column = 1;
  NormalizedKey queryKey;
  Resolution resolution = Resolution::Dynamic;

  /// Declarations only: the key was spelled out at the call
  bool declaresDirectly = false;
};

}  // namespace qk_graph
