// include/cfgtree/core/serializer.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "cfgtree/core/parser.hpp"
#include "cfgtree/core/status.hpp"
#include "cfgtree/core/value.hpp"

namespace cfgtree {

using Bytes = std::vector<std::uint8_t>;

struct RenderOptions {
  // Resolve placeholders before rendering. Otherwise they are written as-is.
  bool interpolate = false;

  // Top-level sections to write first, in this order. Names not in the tree
  // are ignored; remaining sections follow alphabetically.
  std::vector<std::string> section_order;
};

// Tree -> text that parse() reads back to an equal tree.
// Within a section, plain keys come first (alphabetically), then sub-sections.
// Fails with kInvalidArgument when the tree cannot be expressed in the format:
// a plain value at the top level, or a key the grammar cannot spell.
Result<std::string> render(const Tree& tree, const RenderOptions& opts = {});

// UTF-8 bytes of render(); no header or framing.
Result<Bytes> to_bytes(const Tree& tree, const RenderOptions& opts = {});
Result<Tree> from_bytes(const Bytes& bytes, const ParseOptions& opts = {});

}  // namespace cfgtree
