// include/cfgtree/core/dot_path.hpp
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "cfgtree/core/value.hpp"

namespace cfgtree {

// "a.b.c" -> {"a", "b", "c"}. Empty segments are kept so callers can reject them.
// An empty path yields no segments.
std::vector<std::string> split_dot_path(std::string_view path);

std::string join_dot_path(const std::vector<std::string>& segments);

// Appends `key` to a dotted prefix ("" + "a" -> "a", "a" + "b" -> "a.b").
std::string child_path(const std::string& prefix, const std::string& key);

// Walks sections from `root`. Returns nullptr when a segment is missing or
// the walk hits a non-section before the last segment.
const Value* find_path(const Tree& root, const std::vector<std::string>& segments);

// True for names usable as a key or section segment in the text format.
[[nodiscard]] bool is_valid_key(std::string_view key);

}  // namespace cfgtree
