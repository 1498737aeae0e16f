/**
 * @file test_registry.cpp
 * @brief Function registry and '@' block discovery/validation.
 */

#include <iostream>
#include <string>

#include "cfgtree/core/parser.hpp"
#include "cfgtree/registry/registry.hpp"
#include "test_helpers.hpp"

using namespace cfgtree;

using Code = Status::Code;

namespace {

const Namespace kOptimizers = {"myapp", "optimizers"};

Result<Value> make_adam(const Tree& args) {
  const auto it = args.find("lr");
  if (it == args.end()) return Result<Value>::err(Status::invalid_argument("adam needs lr"));
  return Result<Value>::ok(Value(Tree{{"kind", "adam"}, {"lr", it->second}}));
}

Result<Value> make_sgd(const Tree&) { return Result<Value>::ok(Value("sgd")); }

}  // namespace

// ============================================================================
// Registry
// ============================================================================

TEST(test_create_namespace) {
  Registry reg;
  ASSERT_OK(reg.create_namespace(kOptimizers), "create");
  ASSERT_TRUE(reg.exists(kOptimizers), "namespace exists");
  ASSERT_FALSE(reg.exists({"myapp", "layers"}), "other namespace does not");

  const Status dup = reg.create_namespace(kOptimizers);
  ASSERT_TRUE(dup.code() == Code::kAlreadyExists, "duplicate namespace");
  const Status empty = reg.create_namespace({});
  ASSERT_TRUE(empty.code() == Code::kInvalidArgument, "empty namespace");
  PASS("Namespaces are created once");
}

TEST(test_register_and_lookup) {
  Registry reg;
  ASSERT_OK(reg.create_namespace(kOptimizers), "create");
  ASSERT_OK(reg.register_function(kOptimizers, "adam.v1", make_adam), "register adam");

  auto fn_r = reg.lookup(kOptimizers, "adam.v1");
  ASSERT_OK(fn_r, "lookup adam");
  auto made = fn_r.value()(Tree{{"lr", 0.01}});
  ASSERT_OK(made, "call adam");
  ASSERT_TRUE(*value_at(made.value().as_tree(), "kind") == Value("adam"), "built object");
  ASSERT_TRUE(reg.exists({"myapp", "optimizers", "adam.v1"}), "full key exists");
  PASS("Registered functions can be looked up and called");
}

TEST(test_register_errors) {
  Registry reg;
  const Status no_ns = reg.register_function(kOptimizers, "adam.v1", make_adam);
  ASSERT_TRUE(no_ns.code() == Code::kNotFound, "namespace must exist");

  ASSERT_OK(reg.create_namespace(kOptimizers), "create");
  const Status no_name = reg.register_function(kOptimizers, "", make_adam);
  ASSERT_TRUE(no_name.code() == Code::kInvalidArgument, "empty name");
  const Status no_fn = reg.register_function(kOptimizers, "x", RegisteredFunction{});
  ASSERT_TRUE(no_fn.code() == Code::kInvalidArgument, "empty function");
  PASS("Registration validates its inputs");
}

TEST(test_register_replaces) {
  Registry reg;
  ASSERT_OK(reg.create_namespace(kOptimizers), "create");
  ASSERT_OK(reg.register_function(kOptimizers, "opt", make_adam), "first");
  ASSERT_OK(reg.register_function(kOptimizers, "opt", make_sgd), "second");
  auto fn_r = reg.lookup(kOptimizers, "opt");
  ASSERT_OK(fn_r, "lookup");
  auto made = fn_r.value()(Tree{});
  ASSERT_OK(made, "call");
  ASSERT_TRUE(made.value() == Value("sgd"), "latest registration wins");
  PASS("Registering an existing name replaces it");
}

TEST(test_lookup_missing_lists_names) {
  Registry reg;
  ASSERT_OK(reg.create_namespace(kOptimizers), "create");
  ASSERT_OK(reg.register_function(kOptimizers, "adam.v1", make_adam), "adam");
  ASSERT_OK(reg.register_function(kOptimizers, "sgd.v1", make_sgd), "sgd");

  auto r = reg.lookup(kOptimizers, "rmsprop.v1");
  ASSERT_FALSE(r.ok(), "unknown name");
  ASSERT_TRUE(r.status().code() == Code::kNotFound, "not found");
  ASSERT_TRUE(r.status().message().find("Available names: adam.v1, sgd.v1") != std::string::npos,
              "message lists names: " << r.status().message());
  PASS("A failed lookup lists what is available");
}

TEST(test_get_all_and_remove) {
  Registry reg;
  ASSERT_OK(reg.create_namespace(kOptimizers), "create");
  ASSERT_OK(reg.create_namespace({"myapp", "optimizers", "extra"}), "create nested");
  ASSERT_OK(reg.register_function(kOptimizers, "adam.v1", make_adam), "adam");
  ASSERT_OK(reg.register_function({"myapp", "optimizers", "extra"}, "lamb.v1", make_sgd), "lamb");

  const auto all = reg.get_all(kOptimizers);
  ASSERT_TRUE(all.size() == 1 && all.count("adam.v1") == 1, "direct children only");

  ASSERT_OK(reg.remove(kOptimizers, "adam.v1"), "remove");
  ASSERT_TRUE(reg.get_all(kOptimizers).empty(), "removed");
  const Status again = reg.remove(kOptimizers, "adam.v1");
  ASSERT_TRUE(again.code() == Code::kNotFound, "second remove fails");
  PASS("get_all and remove");
}

// ============================================================================
// '@' blocks in trees
// ============================================================================

const char* kTrainingConfig =
    "[training]\n"
    "epochs = 3\n"
    "[training.optimizer]\n"
    "@optimizers = \"adam.v1\"\n"
    "lr = 0.01\n"
    "[training.optimizer.schedule]\n"
    "@schedules = \"warmup.v1\"\n"
    "steps = 100\n";

TEST(test_collect_registry_refs) {
  auto tree_r = parse(kTrainingConfig);
  ASSERT_OK(tree_r, "parse");
  const auto refs = collect_registry_refs(tree_r.value());
  ASSERT_TRUE(refs.size() == 2, "two blocks");
  ASSERT_TRUE(refs[0].path == "training.optimizer", "outer block first");
  ASSERT_TRUE(refs[0].registry == "optimizers", "registry name");
  ASSERT_TRUE(refs[0].name == "adam.v1", "function name");
  ASSERT_TRUE(refs[0].args.count("lr") == 1 && refs[0].args.count("@optimizers") == 0,
              "args exclude the '@' key");
  ASSERT_TRUE(refs[1].path == "training.optimizer.schedule", "nested block");
  PASS("collect_registry_refs finds every '@' block");
}

TEST(test_check_registry_refs) {
  auto tree_r = parse(kTrainingConfig);
  ASSERT_OK(tree_r, "parse");

  Registry reg;
  ASSERT_OK(reg.create_namespace(kOptimizers), "create optimizers");
  ASSERT_OK(reg.register_function(kOptimizers, "adam.v1", make_adam), "adam");

  const Status missing = check_registry_refs(tree_r.value(), reg, {"myapp"});
  ASSERT_TRUE(missing.code() == Code::kNotFound, "schedules not registered");
  ASSERT_TRUE(missing.message().find("[training.optimizer.schedule]") != std::string::npos,
              "message names the block: " << missing.message());

  ASSERT_OK(reg.create_namespace({"myapp", "schedules"}), "create schedules");
  ASSERT_OK(reg.register_function({"myapp", "schedules"}, "warmup.v1", make_sgd), "warmup");
  ASSERT_OK(check_registry_refs(tree_r.value(), reg, {"myapp"}), "all blocks registered");
  PASS("check_registry_refs validates names without calling anything");
}

TEST(test_check_non_string_name) {
  auto tree_r = parse("[opt]\n@optimizers = 3\n");
  ASSERT_OK(tree_r, "parse");
  Registry reg;
  const Status st = check_registry_refs(tree_r.value(), reg);
  ASSERT_TRUE(st.code() == Code::kInvalidArgument, "non-string function name");
  ASSERT_TRUE(collect_registry_refs(tree_r.value()).empty(), "not collected");
  PASS("A non-string '@' value is rejected");
}

int main() {
  std::cout << "=== cfgtree registry tests ===" << std::endl;

  test_create_namespace();
  test_register_and_lookup();
  test_register_errors();
  test_register_replaces();
  test_lookup_missing_lists_names();
  test_get_all_and_remove();
  test_collect_registry_refs();
  test_check_registry_refs();
  test_check_non_string_name();

  return report("registry");
}
