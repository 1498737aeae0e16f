// File: include/cfgtree/core/util/tree_hash.hpp
#pragma once

#include <string>

#include "cfgtree/core/value.hpp"

namespace cfgtree {

// Fingerprint of a whole tree (16 hex chars).
// Goal: if any key, type or value changes, this hash changes; formatting,
// comments and section order in the source text do not matter.
std::string compute_tree_hash(const Tree& tree);

}  // namespace cfgtree
