// include/cfgtree/core/util/config_io.hpp
#pragma once

#include <string>
#include <vector>

#include "cfgtree/core/merge.hpp"
#include "cfgtree/core/parser.hpp"
#include "cfgtree/core/serializer.hpp"
#include "cfgtree/core/status.hpp"

namespace cfgtree {

// Reads and parses a config file (UTF-8 text, no header).
// kNotFound if the file does not exist, kIoError if it cannot be read.
Result<Tree> load_file(const std::string& path, const ParseOptions& opts = {});

// Renders `tree` and writes it to `path`, replacing any existing file.
Status save_file(const std::string& path, const Tree& tree, const RenderOptions& opts = {});

// Loads several files and merges them left to right: later files override
// earlier ones. Interpolation and overrides from `opts` run once, on the
// merged tree. Merge diagnostics are appended to `diagnostics` when given.
Result<Tree> load_layered(const std::vector<std::string>& paths, const ParseOptions& opts = {},
                          std::vector<MergeDiagnostic>* diagnostics = nullptr);

}  // namespace cfgtree
