// File: include/cfgtree/core/events/jsonl_diagnostic_sink.hpp
#pragma once

#include <fstream>
#include <string>

#include "cfgtree/core/events/diagnostic_sink.hpp"
#include "cfgtree/core/status.hpp"

namespace cfgtree {

// JSONL sink for merge diagnostics.
// First line is a "merge_started" header (sources + tree hash), then one
// line per diagnostic:
//   {"type":"function_block_replaced","path":"training.optimizer","detail":"..."}
class JsonlDiagnosticSink final : public DiagnosticSink {
 public:
  JsonlDiagnosticSink() = default;
  ~JsonlDiagnosticSink() override;

  const std::string& path() const { return path_; }
  std::size_t emitted() const { return emitted_; }

  Status open(const MergeRunInfo& run) override;
  Status emit(const MergeDiagnostic& d) override;
  Status flush() override;
  void close() override;

 private:
  Status write_line_(const std::string& line);

  bool open_{false};
  std::size_t emitted_{0};

  std::string path_;
  std::ofstream f_;
};

}  // namespace cfgtree
