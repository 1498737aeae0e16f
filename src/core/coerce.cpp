// File: src/core/coerce.cpp
#include "cfgtree/core/coerce.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

namespace cfgtree {
namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

// JSON number grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
bool scan_json_number(std::string_view s, bool& integral) {
  std::size_t i = 0;
  const auto digits = [&]() {
    const std::size_t start = i;
    while (i < s.size() && is_digit(s[i])) ++i;
    return i - start;
  };

  if (i < s.size() && s[i] == '-') ++i;
  if (i >= s.size()) return false;
  if (s[i] == '0') {
    ++i;
  } else if (is_digit(s[i])) {
    digits();
  } else {
    return false;
  }

  integral = true;
  if (i < s.size() && s[i] == '.') {
    ++i;
    if (digits() == 0) return false;
    integral = false;
  }
  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    if (digits() == 0) return false;
    integral = false;
  }
  return i == s.size();
}

Value number_value(std::string_view s, bool integral) {
  const char* first = s.data();
  const char* last = s.data() + s.size();

  if (integral) {
    std::int64_t i = 0;
    const auto [ptr, ec] = std::from_chars(first, last, i);
    if (ec == std::errc() && ptr == last) return Value(i);
    // Beyond int64: keep the magnitude as a float.
  }

  double d = 0.0;
  const auto [ptr, ec] = std::from_chars(first, last, d);
  if (ec == std::errc::result_out_of_range) {
    // strtod saturates to +-HUGE_VAL / 0 the way JSON readers do.
    return Value(std::strtod(std::string(s).c_str(), nullptr));
  }
  return Value(d);
}

// Bare JSON tokens: true / false / null / numbers, plus the non-finite spellings.
std::optional<Value> json_scalar(std::string_view s) {
  if (s == "true") return Value(true);
  if (s == "false") return Value(false);
  if (s == "null") return Value();
  if (s == "NaN") return Value(std::numeric_limits<double>::quiet_NaN());
  if (s == "Infinity") return Value(std::numeric_limits<double>::infinity());
  if (s == "-Infinity") return Value(-std::numeric_limits<double>::infinity());

  bool integral = false;
  if (scan_json_number(s, integral)) return number_value(s, integral);
  return std::nullopt;
}

// Converts a parsed JSON document. Integers above int64 become floats.
std::optional<Value> from_json(const nlohmann::json& j) {
  using Kind = nlohmann::json::value_t;
  switch (j.type()) {
    case Kind::null:
      return Value();
    case Kind::boolean:
      return Value(j.get<bool>());
    case Kind::number_integer:
      return Value(j.get<std::int64_t>());
    case Kind::number_unsigned:
      return Value(j.get<std::uint64_t>());
    case Kind::number_float:
      return Value(j.get<double>());
    case Kind::string:
      return Value(j.get<std::string>());

    case Kind::array: {
      List out;
      out.reserve(j.size());
      for (const nlohmann::json& item : j) {
        auto v = from_json(item);
        if (!v) return std::nullopt;
        out.push_back(std::move(*v));
      }
      return Value(std::move(out));
    }

    case Kind::object: {
      Tree out;
      for (auto it = j.begin(); it != j.end(); ++it) {
        auto v = from_json(it.value());
        if (!v) return std::nullopt;
        out[it.key()] = std::move(*v);
      }
      return Value(std::move(out));
    }

    case Kind::binary:
    case Kind::discarded:
      break;
  }
  return std::nullopt;
}

// Strict JSON: no comments, no trailing text, no trailing commas.
std::optional<Value> parse_structured(std::string_view text) {
  const nlohmann::json j =
      nlohmann::json::parse(std::string(text), nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) return std::nullopt;  // not a literal; caller keeps the raw text
  return from_json(j);
}

std::string format_float(double d) {
  if (std::isnan(d)) return "NaN";
  if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";

  char buf[64];
  const auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
  if (ec != std::errc()) return "NaN";  // unreachable for finite doubles with this buffer
  std::string out(buf, end);

  // Keep floats floats: "1" would read back as an integer.
  if (out.find_first_of(".eE") == std::string::npos) out += ".0";
  return out;
}

std::string render_json(const Value& v) {
  switch (v.type()) {
    case Value::Type::kNull:
      return "null";
    case Value::Type::kBool:
      return v.as_bool() ? "true" : "false";
    case Value::Type::kInt:
      return std::to_string(v.as_int());
    case Value::Type::kFloat:
      return format_float(v.as_float());
    case Value::Type::kString:
      return json_quote(v.as_string());
    case Value::Type::kList: {
      std::string out = "[";
      const List& items = v.as_list();
      for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += render_json(items[i]);
      }
      out += "]";
      return out;
    }
    case Value::Type::kTree: {
      std::string out = "{";
      bool first = true;
      for (const auto& [key, item] : v.as_tree()) {
        if (!first) out += ", ";
        first = false;
        out += json_quote(key);
        out += ": ";
        out += render_json(item);
      }
      out += "}";
      return out;
    }
  }
  return "null";
}

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool can_stay_bare(const std::string& s) {
  if (s.empty()) return false;
  if (is_space(s.front()) || is_space(s.back())) return false;
  if (s.find_first_of("\r\n") != std::string::npos) return false;
  return coerce_value(s) == Value(s);
}

}  // namespace

Value coerce_value(std::string_view text) {
  if (auto scalar = json_scalar(text)) return std::move(*scalar);

  if (!text.empty() && (text.front() == '[' || text.front() == '{' || text.front() == '"')) {
    if (auto structured = parse_structured(text)) return std::move(*structured);
  }
  return Value(std::string(text));
}

std::string render_literal(const Value& v) {
  if (const std::string* s = v.if_string()) {
    if (can_stay_bare(*s)) return *s;
    return json_quote(*s);
  }
  return render_json(v);
}

bool has_nested_non_finite(const Value& v) {
  if (v.is_list()) {
    for (const Value& item : v.as_list()) {
      if ((item.is_float() && !std::isfinite(item.as_float())) || has_nested_non_finite(item)) {
        return true;
      }
    }
    return false;
  }
  if (const Tree* section = v.if_tree()) {
    for (const auto& entry : *section) {
      const Value& item = entry.second;
      if ((item.is_float() && !std::isfinite(item.as_float())) || has_nested_non_finite(item)) {
        return true;
      }
    }
  }
  return false;
}

std::string json_quote(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  out += '"';
  for (const char ch : s) {
    const auto c = static_cast<unsigned char>(ch);
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      default:
        if (c < 0x20 || c == 0x7f) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out += ch;
        }
    }
  }
  out += '"';
  return out;
}

}  // namespace cfgtree
