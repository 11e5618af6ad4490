#pragma once

// ecp/jsonlite.hpp - Minimal strict JSON reader/writer used for every
// persisted record, ledger line and CLI response.
//
// Canonical form: object keys sorted (std::map order), no whitespace,
// doubles printed with format_double(). Two equal Values always serialize
// to the same bytes, which is what the ledger and record digests hash.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ecp::jsonlite {

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Array, Object> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t u) : v(u) {}
  Value(double d) : v(d) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_bool() const { return std::holds_alternative<bool>(v); }
  bool is_u64() const { return std::holds_alternative<std::uint64_t>(v); }
  bool is_number() const { return is_u64() || std::holds_alternative<double>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
};

std::optional<JsonError> validate_strict(const std::string& text);
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error = nullptr);
std::string hash_json_canonical(const std::string& text, std::optional<JsonError>* error = nullptr);

// Parse a document whose top level must be an object. Returns {} on error.
Object parse(const std::string& text, std::optional<JsonError>* error = nullptr);
// Parse any JSON value.
std::optional<Value> parse_value(const std::string& text, std::optional<JsonError>* error = nullptr);

// Canonical serialization.
std::string to_json(const Value& v);
std::string to_json(const Object& o);
std::string format_double(double d);
std::string escape(const std::string& s);

// Type-safe extractors. Missing keys and wrong types yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
Object get_object(const Object& obj, const std::string& key);

// Builders for the common cases.
Array to_array(const std::vector<std::string>& items);
Object to_object(const std::map<std::string, std::string>& items);

}  // namespace ecp::jsonlite
