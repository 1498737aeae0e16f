// File: src/apps/cfgtool/main.cpp
#include <iostream>
#include <string>
#include <vector>

#include "cfgtree/core/coerce.hpp"
#include "cfgtree/core/events/jsonl_diagnostic_sink.hpp"
#include "cfgtree/core/parser.hpp"
#include "cfgtree/core/serializer.hpp"
#include "cfgtree/core/util/config_io.hpp"
#include "cfgtree/core/util/tree_hash.hpp"

namespace {

struct Args {
  std::string command;             // render | merge | check | hash
  std::vector<std::string> files;  // base first for merge
  bool interpolate{false};
  std::vector<std::string> order;
  cfgtree::Overrides overrides;
  std::string out_path;          // empty -> stdout
  std::string diagnostics_path;  // merge only
  bool help{false};
  std::string error;
};

std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    cur += c;
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

// "--set training.dropout=0.2": the value is coerced like a config value.
bool parse_set(const std::string& arg, cfgtree::Overrides& out) {
  const std::size_t eq = arg.find('=');
  if (eq == std::string::npos || eq == 0) return false;
  out[arg.substr(0, eq)] = cfgtree::coerce_value(arg.substr(eq + 1));
  return true;
}

Args parse_args(int argc, char** argv) {
  Args a;
  if (argc < 2) {
    a.help = true;
    return a;
  }

  a.command = argv[1];
  if (a.command == "--help" || a.command == "-h") {
    a.help = true;
    return a;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--interpolate") {
      a.interpolate = true;
      continue;
    }
    if (s == "--order" && i + 1 < argc) {
      a.order = split_csv(argv[++i]);
      continue;
    }
    if (s == "--set" && i + 1 < argc) {
      const std::string kv = argv[++i];
      if (!parse_set(kv, a.overrides)) {
        a.error = "--set expects path=value, got '" + kv + "'";
        return a;
      }
      continue;
    }
    if (s == "--out" && i + 1 < argc) {
      a.out_path = argv[++i];
      continue;
    }
    if (s == "--diagnostics" && i + 1 < argc) {
      a.diagnostics_path = argv[++i];
      continue;
    }
    if (!s.empty() && s.front() == '-') {
      a.error = "unknown option: " + s;
      return a;
    }
    a.files.push_back(s);
  }
  return a;
}

void print_usage() {
  std::cout << "cfgtool\n"
            << "  render <file> [--interpolate] [--order a,b] [--set path=value]... [--out <file>]\n"
            << "  merge <base> <override>... [--interpolate] [--order a,b] [--set path=value]...\n"
            << "        [--diagnostics <out.jsonl>] [--out <file>]\n"
            << "  check <file> [--interpolate]\n"
            << "  hash <file> [--interpolate]\n";
}

// Exit codes: 0 ok, 1 config error, 2 usage or I/O error.
int exit_code_for(const cfgtree::Status& s) {
  using Code = cfgtree::Status::Code;
  switch (s.code()) {
    case Code::kNotFound:
    case Code::kIoError:
      return 2;
    default:
      return 1;
  }
}

int fail(const cfgtree::Status& s) {
  std::cerr << s.message() << "\n";
  return exit_code_for(s);
}

int write_output(const Args& args, const cfgtree::Tree& tree) {
  cfgtree::RenderOptions ro;
  ro.section_order = args.order;

  if (!args.out_path.empty()) {
    const cfgtree::Status st = cfgtree::save_file(args.out_path, tree, ro);
    if (!st.ok()) return fail(st);
    std::cout << "Wrote " << args.out_path << "\n";
    return 0;
  }

  auto text_r = cfgtree::render(tree, ro);
  if (!text_r.ok()) return fail(text_r.status());
  std::cout << text_r.value();
  return 0;
}

int run_merge(const Args& args, const cfgtree::ParseOptions& po) {
  std::vector<cfgtree::MergeDiagnostic> diagnostics;
  auto tree_r = cfgtree::load_layered(args.files, po, &diagnostics);
  if (!tree_r.ok()) return fail(tree_r.status());
  const cfgtree::Tree tree = tree_r.take_value();

  for (const auto& d : diagnostics) {
    std::cerr << "[warn] " << cfgtree::to_string(d.kind) << " " << d.path << ": " << d.detail << "\n";
  }

  if (!args.diagnostics_path.empty()) {
    cfgtree::JsonlDiagnosticSink sink;
    cfgtree::MergeRunInfo run;
    run.out_path = args.diagnostics_path;
    run.sources = args.files;
    run.tree_hash = cfgtree::compute_tree_hash(tree);

    const cfgtree::Status st_open = sink.open(run);
    if (!st_open.ok()) return fail(st_open);
    for (const auto& d : diagnostics) {
      const cfgtree::Status st = sink.emit(d);
      if (!st.ok()) return fail(st);
    }
    const cfgtree::Status st_flush = sink.flush();
    if (!st_flush.ok()) return fail(st_flush);
    sink.close();
  }

  return write_output(args, tree);
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help) {
    print_usage();
    return 0;
  }
  if (!args.error.empty()) {
    std::cerr << args.error << "\n";
    print_usage();
    return 2;
  }

  cfgtree::ParseOptions po;
  po.interpolate = args.interpolate;
  po.overrides = args.overrides;

  if (args.command == "merge") {
    if (args.files.size() < 2) {
      std::cerr << "merge needs a base file and at least one override file\n";
      return 2;
    }
    return run_merge(args, po);
  }

  if (args.command != "render" && args.command != "check" && args.command != "hash") {
    std::cerr << "unknown command: " << args.command << "\n";
    print_usage();
    return 2;
  }
  if (args.files.size() != 1) {
    std::cerr << args.command << " takes exactly one file\n";
    return 2;
  }

  auto tree_r = cfgtree::load_file(args.files.front(), po);
  if (!tree_r.ok()) return fail(tree_r.status());
  const cfgtree::Tree tree = tree_r.take_value();

  if (args.command == "render") return write_output(args, tree);

  const std::string hash = cfgtree::compute_tree_hash(tree);
  if (args.command == "hash") {
    std::cout << hash << "\n";
    return 0;
  }

  std::cout << "OK " << args.files.front() << " (" << tree.size() << " sections, hash " << hash << ")\n";
  return 0;
}
