// File: src/core/merge.cpp
#include "cfgtree/core/merge.hpp"

#include "cfgtree/core/coerce.hpp"
#include "cfgtree/core/dot_path.hpp"

namespace cfgtree {
namespace {

std::string describe_function(const Tree::value_type& ref) {
  return ref.first + " = " + render_literal(ref.second);
}

bool same_function(const Tree::value_type& a, const Tree::value_type& b) {
  return a.first == b.first && a.second == b.second;
}

Tree merge_sections(const Tree& base, const Tree& over, const std::string& path,
                    std::vector<MergeDiagnostic>& diags);

Value merge_values(const Value& base, const Value& over, const std::string& path,
                   std::vector<MergeDiagnostic>& diags) {
  const Tree* base_section = base.if_tree();
  const Tree* over_section = over.if_tree();

  if (base_section != nullptr && over_section != nullptr) {
    const Tree::value_type* base_ref = registry_key(*base_section);
    const Tree::value_type* over_ref = registry_key(*over_section);

    // Arguments of one function are meaningless to another.
    if (base_ref != nullptr && over_ref != nullptr && !same_function(*base_ref, *over_ref)) {
      diags.push_back(MergeDiagnostic{
          MergeDiagnostic::Kind::kFunctionBlockReplaced, path,
          "dropped base block (" + describe_function(*base_ref) + ") for override block (" +
              describe_function(*over_ref) + ")"});
      return over;
    }
    return Value(merge_sections(*base_section, *over_section, path, diags));
  }

  if (base_section != nullptr || over_section != nullptr) {
    diags.push_back(MergeDiagnostic{
        MergeDiagnostic::Kind::kShapeReplaced, path,
        std::string("base ") + type_name(base.type()) + " replaced by override " +
            type_name(over.type())});
    return over;
  }

  if (is_placeholder(base)) {
    if (!(base == over)) {
      diags.push_back(MergeDiagnostic{
          MergeDiagnostic::Kind::kPlaceholderKept, path,
          "kept " + base.as_string() + ", ignored override " + render_literal(over)});
    }
    return base;
  }

  return over;
}

Tree merge_sections(const Tree& base, const Tree& over, const std::string& path,
                    std::vector<MergeDiagnostic>& diags) {
  Tree out = base;
  for (const auto& [key, over_value] : over) {
    const auto it = out.find(key);
    if (it == out.end()) {
      out.emplace(key, over_value);
      continue;
    }
    it->second = merge_values(it->second, over_value, child_path(path, key), diags);
  }
  return out;
}

}  // namespace

const char* to_string(MergeDiagnostic::Kind kind) {
  switch (kind) {
    case MergeDiagnostic::Kind::kPlaceholderKept: return "placeholder_kept";
    case MergeDiagnostic::Kind::kFunctionBlockReplaced: return "function_block_replaced";
    case MergeDiagnostic::Kind::kShapeReplaced: return "shape_replaced";
  }
  return "unknown";
}

MergeResult merge(const Tree& base, const Tree& override_) {
  MergeResult result;
  result.tree = merge_sections(base, override_, "", result.diagnostics);
  return result;
}

}  // namespace cfgtree
