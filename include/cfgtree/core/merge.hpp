// include/cfgtree/core/merge.hpp
#pragma once

#include <string>
#include <vector>

#include "cfgtree/core/value.hpp"

namespace cfgtree {

// Something the merge discarded. Merging never fails, but callers that care
// about silent overrides can inspect these.
struct MergeDiagnostic {
  enum class Kind : int {
    // Base held a ${...} reference; the override value for it was ignored.
    kPlaceholderKept,
    // Both sides named different registered functions; the base block was dropped.
    kFunctionBlockReplaced,
    // A section met a plain value at the same key; the override side won.
    kShapeReplaced,
  };

  Kind kind;
  std::string path;    // dotted path of the affected key
  std::string detail;  // human-readable "what was kept / dropped"
};

const char* to_string(MergeDiagnostic::Kind kind);

struct MergeResult {
  Tree tree;
  std::vector<MergeDiagnostic> diagnostics;
};

// Deep merge of `override_` onto `base`. Both inputs are left untouched.
//
// Per key:
//   - present on one side only: copied
//   - both sections naming different registered functions (different '@' key
//     or value): the override block replaces the base block wholesale
//   - both sections otherwise: merged recursively
//   - both plain values (lists count as plain): a base placeholder is kept,
//     anything else is replaced by the override
//   - section vs plain value: the override wins
MergeResult merge(const Tree& base, const Tree& override_);

}  // namespace cfgtree
