// File: src/core/dot_path.cpp
#include "cfgtree/core/dot_path.hpp"

#include <cctype>

namespace cfgtree {

std::vector<std::string> split_dot_path(std::string_view path) {
  std::vector<std::string> out;
  if (path.empty()) return out;

  std::size_t start = 0;
  while (true) {
    const std::size_t dot = path.find('.', start);
    if (dot == std::string_view::npos) {
      out.emplace_back(path.substr(start));
      break;
    }
    out.emplace_back(path.substr(start, dot - start));
    start = dot + 1;
  }
  return out;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
  std::string out;
  for (std::size_t i = 0; i < segments.size(); ++i) {
    if (i > 0) out += '.';
    out += segments[i];
  }
  return out;
}

std::string child_path(const std::string& prefix, const std::string& key) {
  return prefix.empty() ? key : prefix + "." + key;
}

const Value* find_path(const Tree& root, const std::vector<std::string>& segments) {
  if (segments.empty()) return nullptr;

  const Tree* section = &root;
  for (std::size_t i = 0; i < segments.size(); ++i) {
    const auto it = section->find(segments[i]);
    if (it == section->end()) return nullptr;
    if (i + 1 == segments.size()) return &it->second;
    section = it->second.if_tree();
    if (section == nullptr) return nullptr;
  }
  return nullptr;
}

bool is_valid_key(std::string_view key) {
  if (key.empty()) return false;
  if (key.front() == '#' || key.front() == ';') return false;
  for (char c : key) {
    if (c == '.' || c == '=' || c == '[' || c == ']') return false;
    if (std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

}  // namespace cfgtree
