// include/cfgtree/core/parser.hpp
#pragma once

#include <map>
#include <string>
#include <string_view>

#include "cfgtree/core/status.hpp"
#include "cfgtree/core/value.hpp"

namespace cfgtree {

// Dotted path -> replacement value, e.g. {"training.dropout", 0.2}.
using Overrides = std::map<std::string, Value>;

struct ParseOptions {
  // Substitute every ${...} placeholder after parsing.
  bool interpolate = false;

  // Applied last (after interpolation), keyed by dotted path.
  Overrides overrides;
};

// Text -> nested tree. No interpolation, no overrides.
//
//   # comment (also ';')
//   [section.sub]
//   key = <json literal, or any other text kept as a string>
//
// Re-opening a section appends to it; a repeated key keeps the last value.
// Fails with kParseError on malformed headers, unknown line shapes,
// assignments before the first header and scalar/section conflicts.
Result<Tree> parse_structure(std::string_view text);

// parse_structure + optional interpolation + overrides.
Result<Tree> parse(std::string_view text, const ParseOptions& opts = {});

// The post-parse half of parse(): interpolation (if requested), then overrides.
// If an override introduces a placeholder it is resolved too.
Result<Tree> apply_parse_options(Tree tree, const ParseOptions& opts);

// Sets each dotted path directly (explicit overrides beat placeholders).
// A path needs a parent section that already exists; the key itself may be
// new but must not hold a section. Fails with kInvalidArgument otherwise.
Result<Tree> apply_overrides(const Tree& tree, const Overrides& overrides);

}  // namespace cfgtree
