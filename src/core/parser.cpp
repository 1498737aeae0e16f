// File: src/core/parser.cpp
#include "cfgtree/core/parser.hpp"

#include <cctype>
#include <set>
#include <string>
#include <vector>

#include "cfgtree/core/coerce.hpp"
#include "cfgtree/core/dot_path.hpp"
#include "cfgtree/core/interpolate.hpp"

namespace cfgtree {
namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

std::string_view trim(std::string_view s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::string at_line(std::size_t line_no, const std::string& msg) {
  return "line " + std::to_string(line_no) + ": " + msg;
}

bool is_comment(std::string_view line) { return line.front() == '#' || line.front() == ';'; }

// `line` is trimmed and starts with '['.
Result<std::vector<std::string>> parse_header(std::string_view line, std::size_t line_no) {
  using R = Result<std::vector<std::string>>;

  if (line.size() < 2 || line.back() != ']') {
    return R::err(Status::parse_error(
        at_line(line_no, "malformed section header '" + std::string(line) + "' (missing ']')")));
  }

  const std::string_view inner = trim(line.substr(1, line.size() - 2));
  if (inner.find_first_of("[]") != std::string_view::npos) {
    return R::err(Status::parse_error(
        at_line(line_no, "unbalanced brackets in section header '" + std::string(line) + "'")));
  }
  if (inner.empty()) {
    return R::err(Status::parse_error(at_line(line_no, "empty section name")));
  }

  std::vector<std::string> segments = split_dot_path(inner);
  for (const auto& seg : segments) {
    if (!is_valid_key(seg)) {
      return R::err(Status::parse_error(
          at_line(line_no, "invalid section name '" + std::string(inner) + "'")));
    }
  }
  return R::ok(std::move(segments));
}

// Resolves (creating as needed) the nested section for `segments`.
Result<Tree*> open_section(Tree& root, const std::vector<std::string>& segments,
                           std::size_t line_no) {
  Tree* section = &root;
  std::string path;
  for (const auto& seg : segments) {
    path = child_path(path, seg);
    const auto [it, inserted] = section->try_emplace(seg, Tree{});
    Tree* next = it->second.if_tree();
    if (next == nullptr) {
      return Result<Tree*>::err(Status::parse_error(at_line(
          line_no, "section [" + path + "] conflicts with the " + type_name(it->second.type()) +
                       " value already assigned to '" + path + "'")));
    }
    section = next;
  }
  return Result<Tree*>::ok(section);
}

}  // namespace

Result<Tree> parse_structure(std::string_view text) {
  if (text.substr(0, kUtf8Bom.size()) == kUtf8Bom) text.remove_prefix(kUtf8Bom.size());

  Tree root;
  Tree* current = nullptr;  // points into `root`; map nodes never move
  std::string current_path;

  // Every path opened by a header (including implied parents). Assigning a
  // plain value over one of these is a conflict, not a last-write-wins.
  std::set<std::string> opened;

  std::size_t line_no = 0;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    const std::size_t nl = text.find('\n', pos);
    const std::string_view raw =
        text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
    pos = (nl == std::string_view::npos) ? text.size() + 1 : nl + 1;
    ++line_no;

    const std::string_view line = trim(raw);
    if (line.empty() || is_comment(line)) continue;

    if (line.front() == '[') {
      auto header_r = parse_header(line, line_no);
      if (!header_r.ok()) return Result<Tree>::err(header_r.status());
      const std::vector<std::string> segments = header_r.take_value();

      auto section_r = open_section(root, segments, line_no);
      if (!section_r.ok()) return Result<Tree>::err(section_r.status());
      current = section_r.value();

      current_path.clear();
      for (const auto& seg : segments) {
        current_path = child_path(current_path, seg);
        opened.insert(current_path);
      }
      continue;
    }

    const std::size_t eq = line.find('=');
    if (eq == std::string_view::npos) {
      return Result<Tree>::err(Status::parse_error(at_line(
          line_no, "expected '[section]' or 'key = value', got '" + std::string(line) + "'")));
    }
    if (current == nullptr) {
      return Result<Tree>::err(Status::parse_error(
          at_line(line_no, "assignment '" + std::string(line) + "' before any [section] header")));
    }

    const std::string key(trim(line.substr(0, eq)));
    if (!is_valid_key(key)) {
      return Result<Tree>::err(Status::parse_error(at_line(line_no, "invalid key '" + key + "'")));
    }

    const auto existing = current->find(key);
    if (existing != current->end() && existing->second.is_tree() &&
        opened.count(child_path(current_path, key)) > 0) {
      return Result<Tree>::err(Status::parse_error(
          at_line(line_no, "'" + key + "' is already the section [" +
                               child_path(current_path, key) + "]")));
    }

    (*current)[key] = coerce_value(trim(line.substr(eq + 1)));
  }

  return Result<Tree>::ok(std::move(root));
}

Result<Tree> parse(std::string_view text, const ParseOptions& opts) {
  auto tree_r = parse_structure(text);
  if (!tree_r.ok()) return Result<Tree>::err(tree_r.status());
  return apply_parse_options(tree_r.take_value(), opts);
}

Result<Tree> apply_parse_options(Tree tree, const ParseOptions& opts) {
  if (opts.interpolate) {
    auto interp_r = interpolate(tree);
    if (!interp_r.ok()) return Result<Tree>::err(interp_r.status());
    tree = interp_r.take_value();
  }

  if (!opts.overrides.empty()) {
    auto over_r = apply_overrides(tree, opts.overrides);
    if (!over_r.ok()) return Result<Tree>::err(over_r.status());
    tree = over_r.take_value();

    // An override may itself be a ${...} reference.
    if (opts.interpolate && has_placeholders(tree)) {
      auto interp_r = interpolate(tree);
      if (!interp_r.ok()) return Result<Tree>::err(interp_r.status());
      tree = interp_r.take_value();
    }
  }

  return Result<Tree>::ok(std::move(tree));
}

Result<Tree> apply_overrides(const Tree& tree, const Overrides& overrides) {
  Tree out = tree;

  for (const auto& [path, value] : overrides) {
    const std::vector<std::string> segments = split_dot_path(path);
    if (segments.size() < 2) {
      return Result<Tree>::err(Status::invalid_argument(
          "override '" + path + "' must name a value inside a section (section.key)"));
    }
    for (const auto& seg : segments) {
      if (!is_valid_key(seg)) {
        return Result<Tree>::err(Status::invalid_argument("invalid override path '" + path + "'"));
      }
    }

    Tree* section = &out;
    std::string prefix;
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
      prefix = child_path(prefix, segments[i]);
      const auto it = section->find(segments[i]);
      if (it == section->end() || !it->second.is_tree()) {
        return Result<Tree>::err(Status::invalid_argument(
            "cannot override '" + path + "': section [" + prefix + "] does not exist"));
      }
      section = it->second.if_tree();
    }

    const auto it = section->find(segments.back());
    if (it != section->end() && it->second.is_tree()) {
      return Result<Tree>::err(Status::invalid_argument(
          "cannot override '" + path + "': it is a section, not a value"));
    }
    (*section)[segments.back()] = value;
  }

  return Result<Tree>::ok(std::move(out));
}

}  // namespace cfgtree
