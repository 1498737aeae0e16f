// File: src/core/serializer.cpp
#include "cfgtree/core/serializer.hpp"

#include <set>
#include <sstream>

#include "cfgtree/core/coerce.hpp"
#include "cfgtree/core/dot_path.hpp"
#include "cfgtree/core/interpolate.hpp"

namespace cfgtree {
namespace {

Status check_key(const std::string& key, const std::string& section_path) {
  if (is_valid_key(key)) return Status::ok_status();
  const std::string where = section_path.empty() ? "at the top level" : "in [" + section_path + "]";
  return Status::invalid_argument("key '" + key + "' " + where +
                                  " cannot be written (empty, or contains '.', '=', brackets, "
                                  "whitespace or a leading comment marker)");
}

// A nested mapping whose keys cannot be spelled in a [header] (e.g. it came
// from `x = {"a.b": 1}`) is written back inline as a JSON object.
bool writes_as_section(const Value& value) {
  const Tree* section = value.if_tree();
  if (section == nullptr) return false;
  for (const auto& entry : *section) {
    if (!is_valid_key(entry.first)) return false;
  }
  return true;
}

Status write_section(std::ostringstream& os, const std::string& path, const Tree& section) {
  if (os.tellp() > 0) os << "\n";
  os << "[" << path << "]\n";

  for (const auto& [key, value] : section) {
    if (writes_as_section(value)) continue;
    CFGTREE_RETURN_IF_ERROR(check_key(key, path));
    if (has_nested_non_finite(value)) {
      return Status::invalid_argument("[" + path + "] " + key +
                                      " holds NaN or Infinity inside a list or object");
    }
    os << key << " = " << render_literal(value) << "\n";
  }

  for (const auto& [key, value] : section) {
    if (!writes_as_section(value)) continue;
    const Tree* child = value.if_tree();
    CFGTREE_RETURN_IF_ERROR(check_key(key, path));
    CFGTREE_RETURN_IF_ERROR(write_section(os, child_path(path, key), *child));
  }
  return Status::ok_status();
}

Status write_top_level(std::ostringstream& os, const std::string& key, const Value& value) {
  CFGTREE_RETURN_IF_ERROR(check_key(key, ""));
  const Tree* section = value.if_tree();
  if (section == nullptr) {
    return Status::invalid_argument("top-level key '" + key + "' holds a " +
                                    type_name(value.type()) +
                                    "; only sections can appear at the top level");
  }
  return write_section(os, key, *section);
}

}  // namespace

Result<std::string> render(const Tree& tree, const RenderOptions& opts) {
  const Tree* source = &tree;
  Tree interpolated;
  if (opts.interpolate) {
    auto interp_r = interpolate(tree);
    if (!interp_r.ok()) return Result<std::string>::err(interp_r.status());
    interpolated = interp_r.take_value();
    source = &interpolated;
  }

  std::ostringstream os;
  std::set<std::string> written;

  for (const auto& name : opts.section_order) {
    const auto it = source->find(name);
    if (it == source->end() || written.count(name) > 0) continue;
    const Status s = write_top_level(os, it->first, it->second);
    if (!s.ok()) return Result<std::string>::err(s);
    written.insert(name);
  }

  for (const auto& [key, value] : *source) {
    if (written.count(key) > 0) continue;
    const Status s = write_top_level(os, key, value);
    if (!s.ok()) return Result<std::string>::err(s);
  }

  return Result<std::string>::ok(os.str());
}

Result<Bytes> to_bytes(const Tree& tree, const RenderOptions& opts) {
  auto text_r = render(tree, opts);
  if (!text_r.ok()) return Result<Bytes>::err(text_r.status());
  const std::string& text = text_r.value();
  return Result<Bytes>::ok(Bytes(text.begin(), text.end()));
}

Result<Tree> from_bytes(const Bytes& bytes, const ParseOptions& opts) {
  const std::string text(bytes.begin(), bytes.end());
  return parse(text, opts);
}

}  // namespace cfgtree
