// File: src/core/value.cpp
#include "cfgtree/core/value.hpp"

#include <cctype>

namespace cfgtree {
namespace {

bool is_path_char(char c) {
  return c != '.' && c != '{' && c != '}' && !std::isspace(static_cast<unsigned char>(c));
}

}  // namespace

const char* type_name(Value::Type type) {
  switch (type) {
    case Value::Type::kNull: return "null";
    case Value::Type::kBool: return "bool";
    case Value::Type::kInt: return "int";
    case Value::Type::kFloat: return "float";
    case Value::Type::kString: return "string";
    case Value::Type::kList: return "list";
    case Value::Type::kTree: return "section";
  }
  return "unknown";
}

std::optional<std::string> placeholder_path(std::string_view text) {
  if (text.size() < 4 || text.substr(0, 2) != "${" || text.back() != '}') return std::nullopt;

  const std::string_view inner = text.substr(2, text.size() - 3);
  bool segment_open = false;
  for (char c : inner) {
    if (c == '.') {
      if (!segment_open) return std::nullopt;  // empty segment
      segment_open = false;
      continue;
    }
    if (!is_path_char(c)) return std::nullopt;
    segment_open = true;
  }
  if (!segment_open) return std::nullopt;
  return std::string(inner);
}

bool is_placeholder(const Value& v) {
  const std::string* s = v.if_string();
  return s != nullptr && placeholder_path(*s).has_value();
}

const Tree::value_type* registry_key(const Tree& section) {
  for (const auto& entry : section) {
    if (!entry.first.empty() && entry.first.front() == '@') return &entry;
  }
  return nullptr;
}

}  // namespace cfgtree
