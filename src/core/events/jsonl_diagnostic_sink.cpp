// File: src/core/events/jsonl_diagnostic_sink.cpp
#include "cfgtree/core/events/jsonl_diagnostic_sink.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>

#include "cfgtree/core/coerce.hpp"

namespace cfgtree {

JsonlDiagnosticSink::~JsonlDiagnosticSink() { close(); }

Status JsonlDiagnosticSink::open(const MergeRunInfo& run) {
  close();

  namespace fs = std::filesystem;
  const fs::path out = fs::path(run.out_path);
  if (out.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(out.parent_path(), ec);
    if (ec) {
      return Status::io_error("failed creating '" + out.parent_path().string() + "': " + ec.message());
    }
  }

  path_ = run.out_path;
  emitted_ = 0;

  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  open_ = true;

  std::ostringstream ss;
  ss << "{"
     << "\"type\":\"merge_started\","
     << "\"sources\":[";
  for (std::size_t i = 0; i < run.sources.size(); ++i) {
    if (i > 0) ss << ",";
    ss << json_quote(run.sources[i]);
  }
  ss << "],"
     << "\"tree_hash\":" << json_quote(run.tree_hash)
     << "}";

  const Status w = write_line_(ss.str());
  if (!w.ok()) return w;
  return flush();
}

Status JsonlDiagnosticSink::emit(const MergeDiagnostic& d) {
  if (!open_) return Status::invalid_argument("JsonlDiagnosticSink::emit called while not open");

  std::ostringstream ss;
  ss << "{"
     << "\"type\":\"" << to_string(d.kind) << "\","
     << "\"path\":" << json_quote(d.path);

  if (!d.detail.empty()) {
    ss << ",\"detail\":" << json_quote(d.detail);
  }

  ss << "}";

  const Status w = write_line_(ss.str());
  if (w.ok()) ++emitted_;
  return w;
}

Status JsonlDiagnosticSink::write_line_(const std::string& line) {
  f_ << line << "\n";
  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  return Status{};
}

Status JsonlDiagnosticSink::flush() {
  if (!open_) return Status{};

  f_.flush();
  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  return Status{};
}

void JsonlDiagnosticSink::close() {
  if (f_.is_open()) f_.close();
  open_ = false;
}

}  // namespace cfgtree
