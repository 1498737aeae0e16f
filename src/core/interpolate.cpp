// File: src/core/interpolate.cpp
#include "cfgtree/core/interpolate.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

#include "cfgtree/core/dot_path.hpp"

namespace cfgtree {
namespace {

// Per-call bookkeeping; discarded when interpolate() returns.
struct InterpolationState {
  std::set<std::string> visiting;
  std::vector<std::string> stack;  // same paths as `visiting`, in visit order
  std::map<std::string, Value> resolved;
};

class Resolver {
 public:
  explicit Resolver(const Tree& root) : root_(root) {}

  // Fully resolved value stored at `segments` (from the root).
  Result<Value> resolve_path(const std::vector<std::string>& segments);

 private:
  // `raw` lives at `segments`, so its section children are addressable by path.
  Result<Value> resolve_value_(const Value& raw, const std::vector<std::string>& segments);

  // Values inside lists have no dotted path of their own.
  Result<Value> resolve_inline_(const Value& raw);

  Result<Value> lookup_(const std::vector<std::string>& segments);

  Status cycle_error_(const std::string& path) const;

  const Tree& root_;
  InterpolationState state_;
};

Result<Value> Resolver::resolve_path(const std::vector<std::string>& segments) {
  const std::string path = join_dot_path(segments);

  const auto memo = state_.resolved.find(path);
  if (memo != state_.resolved.end()) return Result<Value>::ok(memo->second);
  if (state_.visiting.count(path) > 0) return Result<Value>::err(cycle_error_(path));

  state_.visiting.insert(path);
  state_.stack.push_back(path);

  auto raw_r = lookup_(segments);
  if (!raw_r.ok()) return Result<Value>::err(raw_r.status());

  auto value_r = resolve_value_(raw_r.value(), segments);
  if (!value_r.ok()) return Result<Value>::err(value_r.status());

  state_.stack.pop_back();
  state_.visiting.erase(path);
  state_.resolved.emplace(path, value_r.value());
  return value_r;
}

Result<Value> Resolver::resolve_value_(const Value& raw, const std::vector<std::string>& segments) {
  if (const std::string* s = raw.if_string()) {
    if (auto target = placeholder_path(*s)) return resolve_path(split_dot_path(*target));
    return Result<Value>::ok(raw);
  }

  if (const Tree* section = raw.if_tree()) {
    Tree out;
    std::vector<std::string> child = segments;
    for (const auto& entry : *section) {
      child.push_back(entry.first);
      auto r = resolve_path(child);
      if (!r.ok()) return r;
      out.emplace(entry.first, r.take_value());
      child.pop_back();
    }
    return Result<Value>::ok(Value(std::move(out)));
  }

  if (raw.is_list()) return resolve_inline_(raw);
  return Result<Value>::ok(raw);
}

Result<Value> Resolver::resolve_inline_(const Value& raw) {
  if (const std::string* s = raw.if_string()) {
    if (auto target = placeholder_path(*s)) return resolve_path(split_dot_path(*target));
    return Result<Value>::ok(raw);
  }

  if (raw.is_list()) {
    List out;
    out.reserve(raw.as_list().size());
    for (const Value& item : raw.as_list()) {
      auto r = resolve_inline_(item);
      if (!r.ok()) return r;
      out.push_back(r.take_value());
    }
    return Result<Value>::ok(Value(std::move(out)));
  }

  if (const Tree* section = raw.if_tree()) {
    Tree out;
    for (const auto& [key, item] : *section) {
      auto r = resolve_inline_(item);
      if (!r.ok()) return r;
      out.emplace(key, r.take_value());
    }
    return Result<Value>::ok(Value(std::move(out)));
  }

  return Result<Value>::ok(raw);
}

Result<Value> Resolver::lookup_(const std::vector<std::string>& segments) {
  const std::string full = join_dot_path(segments);

  const Tree* section = &root_;
  Value holder;  // keeps a resolved intermediate section alive during the walk
  std::vector<std::string> prefix;

  for (std::size_t i = 0; i < segments.size(); ++i) {
    const auto it = section->find(segments[i]);
    if (it == section->end()) {
      const std::string where = prefix.empty() ? "the top level" : "[" + join_dot_path(prefix) + "]";
      return Result<Value>::err(Status::unresolved_reference(
          "unresolved reference ${" + full + "}: no key '" + segments[i] + "' in " + where));
    }
    prefix.push_back(segments[i]);
    if (i + 1 == segments.size()) return Result<Value>::ok(it->second);

    const Value* next = &it->second;
    if (is_placeholder(*next)) {
      // ${a.b.c} where a.b = ${d}: read c from the resolved d.
      auto r = resolve_path(prefix);
      if (!r.ok()) return r;
      holder = r.take_value();
      next = &holder;
    }

    section = next->if_tree();
    if (section == nullptr) {
      return Result<Value>::err(Status::unresolved_reference(
          "unresolved reference ${" + full + "}: '" + join_dot_path(prefix) + "' is a " +
          type_name(next->type()) + ", not a section"));
    }
  }

  return Result<Value>::err(Status::unresolved_reference("unresolved reference ${}: empty path"));
}

Status Resolver::cycle_error_(const std::string& path) const {
  std::string chain;
  bool in_cycle = false;
  for (const auto& p : state_.stack) {
    if (p == path) in_cycle = true;
    if (!in_cycle) continue;
    chain += p;
    chain += " -> ";
  }
  chain += path;
  return Status::interpolation_cycle("interpolation cycle: " + chain);
}

}  // namespace

Result<Tree> interpolate(const Tree& tree) {
  if (!has_placeholders(tree)) return Result<Tree>::ok(tree);

  Resolver resolver(tree);
  Tree out;
  for (const auto& entry : tree) {
    auto r = resolver.resolve_path({entry.first});
    if (!r.ok()) return Result<Tree>::err(r.status());
    out.emplace(entry.first, r.take_value());
  }
  return Result<Tree>::ok(std::move(out));
}

bool has_placeholders(const Value& value) {
  switch (value.type()) {
    case Value::Type::kString:
      return is_placeholder(value);
    case Value::Type::kList:
      for (const Value& item : value.as_list()) {
        if (has_placeholders(item)) return true;
      }
      return false;
    case Value::Type::kTree:
      return has_placeholders(value.as_tree());
    default:
      return false;
  }
}

bool has_placeholders(const Tree& tree) {
  for (const auto& entry : tree) {
    if (has_placeholders(entry.second)) return true;
  }
  return false;
}

}  // namespace cfgtree
