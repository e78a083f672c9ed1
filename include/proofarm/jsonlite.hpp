#pragma once

// proofarm/jsonlite.hpp — Minimal strict JSON reader/writer.
//
// Used for configuration files, job description files, scanner reports and
// every record the engine serializes (results, artifacts, events).
//
// GUARANTEES:
//   - Objects are std::map: serialization emits keys in sorted order, so the
//     same value always produces the same bytes.
//   - Duplicate keys are a parse error ("json_duplicate_key").
//   - Non-negative integers parse as uint64; negative or fractional numbers
//     parse as double.
//   - \u escapes (including surrogate pairs) decode to UTF-8.
//   - Errors carry the byte offset of the first failure.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace proofarm::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t n) : v(n) {}
  Value(double d) : v(d) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}
};

// Parse a JSON object. Returns an empty object (and sets *error) on failure
// or when the top-level value is not an object.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string format_double(double d);
std::string escape(const std::string& s);

// Type-safe extractors: return def when the key is absent or has another type.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
std::optional<Object> get_object(const Object& obj, const std::string& key);

bool has_key(const Object& obj, const std::string& key);

}  // namespace proofarm::jsonlite
