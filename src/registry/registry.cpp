// File: src/registry/registry.cpp
#include "cfgtree/registry/registry.hpp"

#include <algorithm>
#include <functional>

#include "cfgtree/core/coerce.hpp"
#include "cfgtree/core/dot_path.hpp"

namespace cfgtree {
namespace {

std::string describe_namespace(const Namespace& ns) {
  std::string out;
  for (std::size_t i = 0; i < ns.size(); ++i) {
    if (i > 0) out += " -> ";
    out += ns[i];
  }
  return out;
}

Namespace with_name(const Namespace& ns, const std::string& name) {
  Namespace out = ns;
  out.push_back(name);
  return out;
}

// Visits every section that carries an '@' key, depth first in key order.
void walk_blocks(const Tree& section, const std::string& path,
                 const std::function<void(const std::string&, const Tree&,
                                          const Tree::value_type&)>& visit) {
  if (const Tree::value_type* ref = registry_key(section); ref != nullptr && !path.empty()) {
    visit(path, section, *ref);
  }
  for (const auto& [key, value] : section) {
    if (const Tree* child = value.if_tree()) walk_blocks(*child, child_path(path, key), visit);
  }
}

}  // namespace

Status Registry::create_namespace(const Namespace& ns) {
  if (ns.empty()) return Status::invalid_argument("namespace must not be empty");
  if (!namespaces_.insert(ns).second) {
    return Status::already_exists("namespace already exists: " + describe_namespace(ns));
  }
  return Status::ok_status();
}

Status Registry::register_function(const Namespace& ns, const std::string& name,
                                   RegisteredFunction fn) {
  if (namespaces_.count(ns) == 0) {
    return Status::not_found("can't register '" + name + "': namespace " +
                             describe_namespace(ns) + " was never created");
  }
  if (name.empty()) return Status::invalid_argument("registered name must not be empty");
  if (!fn) return Status::invalid_argument("can't register '" + name + "': empty function");

  entries_[with_name(ns, name)] = std::move(fn);
  return Status::ok_status();
}

Result<RegisteredFunction> Registry::lookup(const Namespace& ns, const std::string& name) const {
  const auto it = entries_.find(with_name(ns, name));
  if (it != entries_.end()) return Result<RegisteredFunction>::ok(it->second);

  std::string available;
  for (const auto& entry : get_all(ns)) {
    if (!available.empty()) available += ", ";
    available += entry.first;
  }
  if (available.empty()) available = "none";

  return Result<RegisteredFunction>::err(Status::not_found(
      "can't find '" + name + "' in registry " + describe_namespace(ns) +
      ". Available names: " + available));
}

bool Registry::exists(const Namespace& ns) const {
  return namespaces_.count(ns) > 0 || entries_.count(ns) > 0;
}

std::map<std::string, RegisteredFunction> Registry::get_all(const Namespace& ns) const {
  std::map<std::string, RegisteredFunction> out;
  for (const auto& [key, fn] : entries_) {
    if (key.size() != ns.size() + 1) continue;
    if (!std::equal(ns.begin(), ns.end(), key.begin())) continue;
    out.emplace(key.back(), fn);
  }
  return out;
}

Status Registry::remove(const Namespace& ns, const std::string& name) {
  if (entries_.erase(with_name(ns, name)) == 0) {
    return Status::not_found("can't remove '" + name + "': not in registry " +
                             describe_namespace(ns));
  }
  return Status::ok_status();
}

std::vector<RegistryRef> collect_registry_refs(const Tree& tree) {
  std::vector<RegistryRef> out;
  walk_blocks(tree, "", [&out](const std::string& path, const Tree& section,
                               const Tree::value_type& ref) {
    const std::string* name = ref.second.if_string();
    if (name == nullptr) return;

    RegistryRef r;
    r.path = path;
    r.registry = ref.first.substr(1);
    r.name = *name;
    for (const auto& [key, value] : section) {
      if (key != ref.first) r.args.emplace(key, value);
    }
    out.push_back(std::move(r));
  });
  return out;
}

Status check_registry_refs(const Tree& tree, const Registry& registry, const Namespace& prefix) {
  Status first_error;
  walk_blocks(tree, "", [&](const std::string& path, const Tree&, const Tree::value_type& ref) {
    if (!first_error.ok()) return;

    const std::string* name = ref.second.if_string();
    if (name == nullptr) {
      first_error = Status::invalid_argument("[" + path + "] " + ref.first +
                                             " must name a function, got " +
                                             render_literal(ref.second));
      return;
    }

    const auto fn_r = registry.lookup(with_name(prefix, ref.first.substr(1)), *name);
    if (!fn_r.ok()) first_error = Status(fn_r.status().code(), "[" + path + "] " + fn_r.status().message());
  });
  return first_error;
}

}  // namespace cfgtree
