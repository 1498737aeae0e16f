// include/cfgtree/registry/registry.hpp
#pragma once

#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "cfgtree/core/status.hpp"
#include "cfgtree/core/value.hpp"

namespace cfgtree {

// e.g. {"myapp", "optimizers"}
using Namespace = std::vector<std::string>;

// A registered factory. The arguments are the non-'@' keys of the block that
// names it. The config engine only stores and looks these up; calling them is
// up to whoever resolves a parsed tree into objects.
using RegisteredFunction = std::function<Result<Value>(const Tree& args)>;

// Process-scoped store of named functions, owned by the caller and filled by
// explicit register_function() calls during start-up.
class Registry {
 public:
  Registry() = default;

  // kAlreadyExists if `ns` was created before.
  Status create_namespace(const Namespace& ns);

  // `ns` must have been created. Registering an existing name replaces it.
  Status register_function(const Namespace& ns, const std::string& name, RegisteredFunction fn);

  // kNotFound (listing the available names) if nothing is registered under `name`.
  Result<RegisteredFunction> lookup(const Namespace& ns, const std::string& name) const;

  // True for a created namespace or for a full namespace + name of a registered function.
  [[nodiscard]] bool exists(const Namespace& ns) const;

  // Functions registered directly under `ns`, keyed by name.
  std::map<std::string, RegisteredFunction> get_all(const Namespace& ns) const;

  Status remove(const Namespace& ns, const std::string& name);

 private:
  std::set<Namespace> namespaces_;
  std::map<Namespace, RegisteredFunction> entries_;  // key = namespace + name
};

// One '@' block found in a tree.
struct RegistryRef {
  std::string path;      // dotted path of the block, e.g. "training.optimizer"
  std::string registry;  // the '@' key without '@', e.g. "optimizers"
  std::string name;      // registered name, e.g. "adam.v1"
  Tree args;             // the block's other keys
};

// Every registry block in `tree`, in path order (nested blocks included).
// Blocks whose '@' value is not a string are reported by check_registry_refs().
std::vector<RegistryRef> collect_registry_refs(const Tree& tree);

// Verifies every '@' block names a function registered under
// `prefix + {registry}` without calling anything.
// kInvalidArgument for a non-string name, kNotFound for an unknown one.
Status check_registry_refs(const Tree& tree, const Registry& registry, const Namespace& prefix = {});

}  // namespace cfgtree
