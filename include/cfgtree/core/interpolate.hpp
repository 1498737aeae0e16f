// include/cfgtree/core/interpolate.hpp
#pragma once

#include "cfgtree/core/status.hpp"
#include "cfgtree/core/value.hpp"

namespace cfgtree {

// Replaces every ${dotted.path} placeholder with a deep copy of the value it
// names, looked up from the root of `tree`. Referenced values are resolved
// first, so chains (a -> b -> c) and sections full of placeholders work.
//
// Errors (the input is never partially substituted):
//   kUnresolvedReference  the path does not exist or walks through a non-section
//   kInterpolationCycle   resolving a path requires that same path
//
// A tree without placeholders comes back equal to the input.
Result<Tree> interpolate(const Tree& tree);

[[nodiscard]] bool has_placeholders(const Tree& tree);
[[nodiscard]] bool has_placeholders(const Value& value);

}  // namespace cfgtree
