// src/core/util/config_io.cpp
#include "cfgtree/core/util/config_io.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace cfgtree {
namespace fs = std::filesystem;

static Result<std::string> read_text_file(const fs::path& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return Result<std::string>::err(Status::not_found("config not found: " + path.string()));
  }

  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return Result<std::string>::err(Status::io_error("failed opening '" + path.string() + "'"));
  }

  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::err(Status::io_error("failed reading '" + path.string() + "'"));
  }
  return Result<std::string>::ok(ss.str());
}

// Prefixes parse errors with the file they came from.
static Status in_file(const Status& s, const fs::path& path) {
  return Status(s.code(), path.string() + ": " + s.message());
}

Result<Tree> load_file(const std::string& path_str, const ParseOptions& opts) {
  const fs::path path = fs::path(path_str);

  auto text_r = read_text_file(path);
  if (!text_r.ok()) return Result<Tree>::err(text_r.status());

  auto tree_r = parse(text_r.value(), opts);
  if (!tree_r.ok()) return Result<Tree>::err(in_file(tree_r.status(), path));
  return tree_r;
}

Status save_file(const std::string& path_str, const Tree& tree, const RenderOptions& opts) {
  const fs::path path = fs::path(path_str);

  auto text_r = render(tree, opts);
  if (!text_r.ok()) return text_r.status();

  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return Status::io_error("failed creating '" + path.parent_path().string() + "': " + ec.message());
    }
  }

  std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!out.is_open()) return Status::io_error("failed opening '" + path.string() + "'");

  out << text_r.value();
  out.flush();
  if (!out.good()) return Status::io_error("failed writing to '" + path.string() + "'");
  return Status::ok_status();
}

Result<Tree> load_layered(const std::vector<std::string>& paths, const ParseOptions& opts,
                          std::vector<MergeDiagnostic>* diagnostics) {
  if (paths.empty()) return Result<Tree>::err(Status::invalid_argument("no config files given"));

  Tree merged;  // empty
  for (const auto& path : paths) {
    // Layers stay uninterpolated until everything is merged: a later file may
    // define what an earlier file references.
    auto layer_r = load_file(path);
    if (!layer_r.ok()) return Result<Tree>::err(layer_r.status());

    MergeResult m = merge(merged, layer_r.value());
    merged = std::move(m.tree);
    if (diagnostics != nullptr) {
      diagnostics->insert(diagnostics->end(), m.diagnostics.begin(), m.diagnostics.end());
    }
  }

  return apply_parse_options(std::move(merged), opts);
}

}  // namespace cfgtree
