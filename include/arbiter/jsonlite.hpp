#pragma once

// arbiter/jsonlite.hpp — Strict JSON parser and canonical serializer.
//
// DETERMINISM GUARANTEES:
//   - to_json() emits objects with sorted keys (std::map iteration order).
//   - Doubles are formatted with "%.6f" and trailing zeros trimmed, so the
//     same value always serializes to the same bytes.
//   - Duplicate keys, NaN/Infinity and trailing data are rejected.
//
// All report, metadata and audit documents are produced through this module,
// which makes them byte-stable across runs for identical inputs.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace arbiter::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::string, std::uint64_t, double, Object, Array> v;
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parse any JSON document. On error, *error is set and a null Value returned.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a document whose root must be an object. Non-object roots yield {}
// and set *error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);

// Compact canonical serialization.
std::string to_json(const Value& v);
// Indented serialization for human-facing artifacts (reports, metadata).
std::string to_json_pretty(const Value& v, int indent = 2);

std::string escape(const std::string& s);
std::string format_double(double d);

// Typed extractors. Missing or mistyped keys return the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
Object get_object(const Object& obj, const std::string& key);
Array get_array(const Object& obj, const std::string& key);

inline bool is_object(const Value& v) { return std::holds_alternative<Object>(v.v); }
inline bool is_array(const Value& v) { return std::holds_alternative<Array>(v.v); }
inline bool is_string(const Value& v) { return std::holds_alternative<std::string>(v.v); }

}  // namespace arbiter::jsonlite
