// File: src/core/util/tree_hash.cpp
#include "cfgtree/core/util/tree_hash.hpp"

#include <bit>
#include <cstdint>
#include <string>

namespace cfgtree {
namespace {

// FNV-1a 64-bit. Not cryptographic. Exactly what we want for fast, stable fingerprints.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }
  void add_u8(std::uint8_t v)   { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) { add_u8(v ? 1u : 0u); }

  void add_string(const std::string& s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }

  void add_double(double v) {
    const std::uint64_t bits = std::bit_cast<std::uint64_t>(v);
    add_u64(bits);
  }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

void add_tree(Fnv1a64& h, const Tree& tree);

void add_value(Fnv1a64& h, const Value& v) {
  // Type tag first so 1 (int), 1.0 (float) and "1" never collide.
  h.add_u8(static_cast<std::uint8_t>(v.type()));

  switch (v.type()) {
    case Value::Type::kNull:
      break;
    case Value::Type::kBool:
      h.add_bool(v.as_bool());
      break;
    case Value::Type::kInt:
      h.add_i64(v.as_int());
      break;
    case Value::Type::kFloat:
      h.add_double(v.as_float());
      break;
    case Value::Type::kString:
      h.add_string(v.as_string());
      break;
    case Value::Type::kList:
      h.add_u64(static_cast<std::uint64_t>(v.as_list().size()));
      for (const Value& item : v.as_list()) add_value(h, item);
      break;
    case Value::Type::kTree:
      add_tree(h, v.as_tree());
      break;
  }
}

void add_tree(Fnv1a64& h, const Tree& tree) {
  // std::map iteration is sorted, so the walk is canonical.
  h.add_u64(static_cast<std::uint64_t>(tree.size()));
  for (const auto& [key, value] : tree) {
    h.add_string(key);
    add_value(h, value);
  }
}

}  // namespace

std::string compute_tree_hash(const Tree& tree) {
  Fnv1a64 h;
  add_tree(h, tree);
  return to_hex(h.h);
}

}  // namespace cfgtree
