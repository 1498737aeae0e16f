/**
 * @file test_merge.cpp
 * @brief Layered merge: placeholder precedence, function blocks, atomic lists.
 */

#include <iostream>
#include <string>

#include "cfgtree/core/merge.hpp"
#include "cfgtree/core/parser.hpp"
#include "test_helpers.hpp"

using namespace cfgtree;

using Kind = MergeDiagnostic::Kind;

namespace {

Tree parsed(const std::string& text) {
  auto r = parse_structure(text);
  return r.ok() ? r.take_value() : Tree{};
}

}  // namespace

TEST(test_deep_merge) {
  const Tree base = parsed("[a]\nx = 1\ny = 2\n[a.sub]\nk = 1\n[b]\nz = 3\n");
  const Tree over = parsed("[a]\ny = 20\n[a.sub]\nj = 2\n[c]\nw = 4\n");
  const MergeResult m = merge(base, over);
  const Tree expected = parsed(
      "[a]\nx = 1\ny = 20\n[a.sub]\nk = 1\nj = 2\n[b]\nz = 3\n[c]\nw = 4\n");
  ASSERT_TRUE(m.tree == expected, "merged tree");
  ASSERT_TRUE(m.diagnostics.empty(), "no diagnostics");
  PASS("Sections merge key by key, recursively");
}

TEST(test_placeholder_in_base_is_kept) {
  const Tree base = parsed("[training]\ndropout = ${hp.dropout}\n");
  const Tree over = parsed("[training]\ndropout = 0.5\n");
  const MergeResult m = merge(base, over);
  ASSERT_TRUE(*value_at(m.tree, "training.dropout") == Value("${hp.dropout}"), "placeholder kept");
  ASSERT_TRUE(m.diagnostics.size() == 1, "one diagnostic");
  ASSERT_TRUE(m.diagnostics[0].kind == Kind::kPlaceholderKept, "placeholder_kept");
  ASSERT_TRUE(m.diagnostics[0].path == "training.dropout", "diagnostic path");
  PASS("A base placeholder wins over an override literal");
}

TEST(test_same_placeholder_no_diagnostic) {
  const Tree base = parsed("[t]\nd = ${hp.d}\n");
  const MergeResult m = merge(base, base);
  ASSERT_TRUE(m.tree == base, "unchanged");
  ASSERT_TRUE(m.diagnostics.empty(), "nothing was discarded");
  PASS("Merging an identical placeholder is silent");
}

TEST(test_placeholder_in_override_replaces_literal) {
  const Tree base = parsed("[t]\nd = 0.1\n");
  const Tree over = parsed("[t]\nd = ${hp.d}\n");
  const MergeResult m = merge(base, over);
  ASSERT_TRUE(*value_at(m.tree, "t.d") == Value("${hp.d}"), "override placeholder wins");
  ASSERT_TRUE(m.diagnostics.empty(), "no diagnostic");
  PASS("An override placeholder replaces a base literal");
}

TEST(test_different_function_replaces_block) {
  const Tree base = parsed("[opt]\n@optimizers = \"adam.v1\"\nlr = 0.01\nbeta = 0.9\n");
  const Tree over = parsed("[opt]\n@optimizers = \"sgd.v1\"\nlr = 0.1\n");
  const MergeResult m = merge(base, over);
  ASSERT_TRUE(m.tree.at("opt") == over.at("opt"), "override block taken whole");
  ASSERT_TRUE(value_at(m.tree, "opt.beta") == nullptr, "base-only argument dropped");
  ASSERT_TRUE(m.diagnostics.size() == 1, "one diagnostic");
  ASSERT_TRUE(m.diagnostics[0].kind == Kind::kFunctionBlockReplaced, "function_block_replaced");
  ASSERT_TRUE(m.diagnostics[0].path == "opt", "diagnostic path");
  PASS("Different registered functions replace the block");
}

TEST(test_different_registry_replaces_block) {
  const Tree base = parsed("[opt]\n@optimizers = \"adam.v1\"\nlr = 0.01\n");
  const Tree over = parsed("[opt]\n@schedules = \"adam.v1\"\nwarmup = 10\n");
  const MergeResult m = merge(base, over);
  ASSERT_TRUE(m.tree.at("opt") == over.at("opt"), "override block taken whole");
  ASSERT_TRUE(m.diagnostics.size() == 1, "one diagnostic");
  PASS("Different '@' keys count as different functions");
}

TEST(test_same_function_merges_args) {
  const Tree base = parsed("[opt]\n@optimizers = \"adam.v1\"\nlr = 0.01\nbeta = 0.9\n");
  const Tree over = parsed("[opt]\n@optimizers = \"adam.v1\"\nlr = 0.1\n");
  const MergeResult m = merge(base, over);
  const Tree expected = parsed("[opt]\n@optimizers = \"adam.v1\"\nlr = 0.1\nbeta = 0.9\n");
  ASSERT_TRUE(m.tree == expected, "arguments merged");
  ASSERT_TRUE(m.diagnostics.empty(), "no diagnostics");
  PASS("The same function merges its arguments");
}

TEST(test_one_sided_function_block_merges) {
  const Tree base = parsed("[opt]\n@optimizers = \"adam.v1\"\nlr = 0.01\n");
  const Tree over = parsed("[opt]\nlr = 0.1\n");
  const MergeResult m = merge(base, over);
  ASSERT_TRUE(*value_at(m.tree, "opt.@optimizers") == Value("adam.v1"), "function kept");
  ASSERT_TRUE(*value_at(m.tree, "opt.lr") == Value(0.1), "argument overridden");
  PASS("A block with '@' on one side only merges normally");
}

TEST(test_lists_are_atomic) {
  const Tree base = parsed("[a]\nxs = [1, 2, 3]\n");
  const Tree over = parsed("[a]\nxs = [4]\n");
  const MergeResult m = merge(base, over);
  ASSERT_TRUE(*value_at(m.tree, "a.xs") == Value(List{4}), "list replaced, not concatenated");
  PASS("Lists are replaced whole");
}

TEST(test_shape_mismatch) {
  const Tree base = parsed("[a.b]\nk = 1\n");
  const Tree over = parsed("[a]\nb = 5\n");
  const MergeResult m = merge(base, over);
  ASSERT_TRUE(*value_at(m.tree, "a.b") == Value(5), "override wins");
  ASSERT_TRUE(m.diagnostics.size() == 1, "one diagnostic");
  ASSERT_TRUE(m.diagnostics[0].kind == Kind::kShapeReplaced, "shape_replaced");
  ASSERT_TRUE(m.diagnostics[0].path == "a.b", "diagnostic path");

  const MergeResult back = merge(over, base);
  ASSERT_TRUE(*value_at(back.tree, "a.b") == Value(Tree{{"k", 1}}), "section wins when it overrides");
  PASS("Section vs value: the override side wins");
}

TEST(test_inputs_untouched) {
  const Tree base = parsed("[a]\nx = ${b.y}\nz = 1\n[b]\ny = 2\n");
  const Tree over = parsed("[a]\nx = 3\nz = 4\n");
  const Tree base_before = base;
  const Tree over_before = over;
  const MergeResult m = merge(base, over);
  ASSERT_FALSE(m.tree == base, "result differs from base");
  ASSERT_TRUE(base == base_before, "base unchanged");
  ASSERT_TRUE(over == over_before, "override unchanged");
  PASS("merge leaves both inputs unchanged");
}

TEST(test_diagnostic_names) {
  ASSERT_TRUE(std::string(to_string(Kind::kPlaceholderKept)) == "placeholder_kept", "kept");
  ASSERT_TRUE(std::string(to_string(Kind::kFunctionBlockReplaced)) == "function_block_replaced",
              "function");
  ASSERT_TRUE(std::string(to_string(Kind::kShapeReplaced)) == "shape_replaced", "shape");
  PASS("Diagnostic kinds have stable names");
}

int main() {
  std::cout << "=== cfgtree merge tests ===" << std::endl;

  test_deep_merge();
  test_placeholder_in_base_is_kept();
  test_same_placeholder_no_diagnostic();
  test_placeholder_in_override_replaces_literal();
  test_different_function_replaces_block();
  test_different_registry_replaces_block();
  test_same_function_merges_args();
  test_one_sided_function_block_merges();
  test_lists_are_atomic();
  test_shape_mismatch();
  test_inputs_untouched();
  test_diagnostic_names();

  return report("merge");
}
