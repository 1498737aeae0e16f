// File: include/cfgtree/core/events/diagnostic_sink.hpp
#pragma once

#include <string>
#include <vector>

#include "cfgtree/core/merge.hpp"
#include "cfgtree/core/status.hpp"

namespace cfgtree {

// Minimal record of one merge run.
// Keep output stable and boring; evolve by adding fields (not breaking existing ones).
struct MergeRunInfo {
  std::string out_path;              // where the sink writes
  std::vector<std::string> sources;  // merged files, base first
  std::string tree_hash;             // compute_tree_hash() of the merged tree
};

class DiagnosticSink {
 public:
  virtual ~DiagnosticSink() = default;

  virtual Status open(const MergeRunInfo& run) = 0;
  virtual Status emit(const MergeDiagnostic& d) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace cfgtree
