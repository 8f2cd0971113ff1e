#pragma once

// stagecraft/jsonlite.hpp - Minimal strict JSON reader/writer.
//
// Canonical output: object keys are emitted in sorted order (std::map) and
// numbers use a fixed format, so to_json(parse(x)) is stable across runs and
// platforms. Snapshot records, image descriptors and fingerprint payloads
// are all built as Values and serialized through to_json().

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace stagecraft::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::string, std::uint64_t, std::int64_t,
               double, Object, Array>
      v{nullptr};

  Value() = default;
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(std::uint64_t u) : v(u) {}
  Value(std::int64_t i) : v(i) {}
  Value(double d) : v(d) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}
};

std::optional<JsonError> validate_strict(const std::string& text);
std::string canonicalize_json(const std::string& text,
                              std::optional<JsonError>* error);

// Parse a document whose root must be an object. Returns {} on error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. Missing keys or type mismatches return the default.
std::string get_string(const Object& obj, const std::string& key,
                       const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key,
                           unsigned long long def = 0);
long long get_i64(const Object& obj, const std::string& key, long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj,
                                          const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj,
                                                  const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

Array to_array(const std::vector<std::string>& items);
Object to_object(const std::map<std::string, std::string>& items);

}  // namespace stagecraft::jsonlite
