// include/cfgtree/core/coerce.hpp
#pragma once

#include <string>
#include <string_view>

#include "cfgtree/core/value.hpp"

namespace cfgtree {

// Converts the right-hand side of `key = value` into a typed Value.
// Accepts strict JSON values, plus bare NaN / Infinity / -Infinity. Anything
// that is not a JSON value comes back verbatim as a String; this never fails.
// `text` is expected to be trimmed already.
Value coerce_value(std::string_view text);

// Inverse of coerce_value for the right-hand side of an assignment:
// coerce_value(render_literal(v)) == v for every representable v. NaN never
// compares equal, and non-finite floats inside a list or object are not
// representable (JSON has no spelling for them).
// Strings are written bare when that re-parses to the same string.
std::string render_literal(const Value& v);

// True if `v` is a list or object holding a NaN or infinite float anywhere.
[[nodiscard]] bool has_nested_non_finite(const Value& v);

// Always-quoted JSON string.
std::string json_quote(std::string_view s);

}  // namespace cfgtree
