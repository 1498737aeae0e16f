// include/cfgtree/core/value.hpp
#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cfgtree {

// -----------------------------
// Value model
// -----------------------------
// A config tree is a map of sections; every leaf is one of a closed set of
// JSON-like types. Copies are always deep: no two trees share storage.

struct Null {
  constexpr bool operator==(const Null&) const noexcept { return true; }
};

class Value;

using List = std::vector<Value>;
using Tree = std::map<std::string, Value>;  // one section; keys iterate alphabetically

class Value {
 public:
  enum class Type : int {
    kNull = 0,
    kBool,
    kInt,
    kFloat,
    kString,
    kList,
    kTree,
  };

  using Storage = std::variant<Null, bool, std::int64_t, double, std::string, List, Tree>;

  Value() = default;  // null
  Value(Null) {}
  Value(bool b) : data_(b) {}
  template <typename I,
            std::enable_if_t<std::is_integral_v<I> && !std::is_same_v<I, bool>, int> = 0>
  Value(I i) : data_(from_integral(i)) {}
  Value(double d) : data_(d) {}
  Value(const char* s) : data_(std::string(s)) {}
  Value(std::string s) : data_(std::move(s)) {}
  Value(List l) : data_(std::move(l)) {}
  Value(Tree t) : data_(std::move(t)) {}

  [[nodiscard]] Type type() const noexcept { return static_cast<Type>(data_.index()); }

  [[nodiscard]] bool is_null() const noexcept { return type() == Type::kNull; }
  [[nodiscard]] bool is_bool() const noexcept { return type() == Type::kBool; }
  [[nodiscard]] bool is_int() const noexcept { return type() == Type::kInt; }
  [[nodiscard]] bool is_float() const noexcept { return type() == Type::kFloat; }
  [[nodiscard]] bool is_string() const noexcept { return type() == Type::kString; }
  [[nodiscard]] bool is_list() const noexcept { return type() == Type::kList; }
  [[nodiscard]] bool is_tree() const noexcept { return type() == Type::kTree; }

  // Checked accessors; calling the wrong one throws std::bad_variant_access.
  [[nodiscard]] bool as_bool() const { return std::get<bool>(data_); }
  [[nodiscard]] std::int64_t as_int() const { return std::get<std::int64_t>(data_); }
  [[nodiscard]] double as_float() const { return std::get<double>(data_); }
  [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data_); }
  [[nodiscard]] const List& as_list() const { return std::get<List>(data_); }
  [[nodiscard]] List& as_list() { return std::get<List>(data_); }
  [[nodiscard]] const Tree& as_tree() const { return std::get<Tree>(data_); }
  [[nodiscard]] Tree& as_tree() { return std::get<Tree>(data_); }

  [[nodiscard]] const std::string* if_string() const noexcept { return std::get_if<std::string>(&data_); }
  [[nodiscard]] const Tree* if_tree() const noexcept { return std::get_if<Tree>(&data_); }
  [[nodiscard]] Tree* if_tree() noexcept { return std::get_if<Tree>(&data_); }

  [[nodiscard]] const Storage& data() const noexcept { return data_; }

  // Structural equality. Int 1 and Float 1.0 are different values.
  bool operator==(const Value& other) const { return data_ == other.data_; }

 private:
  // Unsigned values above int64 keep their magnitude as a float.
  template <typename I>
  static Storage from_integral(I i) {
    if constexpr (std::is_unsigned_v<I>) {
      if (static_cast<std::uint64_t>(i) >
          static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return Storage(static_cast<double>(i));
      }
    }
    return Storage(static_cast<std::int64_t>(i));
  }

  Storage data_;
};

const char* type_name(Value::Type type);

// -----------------------------
// Placeholders
// -----------------------------
// A placeholder is a string that is exactly `${seg.seg...}`. Segments are
// non-empty and contain no '.', '{', '}' or whitespace.

// Returns the dotted path inside `${...}`, or nullopt when `text` is not a placeholder.
std::optional<std::string> placeholder_path(std::string_view text);

[[nodiscard]] bool is_placeholder(const Value& v);

// -----------------------------
// Registry references
// -----------------------------
// A section naming a registered function carries an '@'-prefixed key, e.g.
//   [training.optimizer]
//   @optimizers = "adam.v1"
//   learn_rate = 0.001
// Returns the first such entry (alphabetical), or nullptr for plain sections.
const Tree::value_type* registry_key(const Tree& section);

}  // namespace cfgtree
