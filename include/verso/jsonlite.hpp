#pragma once

// verso/jsonlite.hpp - Minimal strict JSON reader/writer.
//
// Used for the per-document journal, the configuration file and CLI output.
// Objects are std::map, so serialized output always has sorted keys.
// Duplicate keys are rejected on parse.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace verso::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  // Negative integers are carried as double.
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;
};

// Parse a JSON document whose top level is an object. Returns an empty object
// and sets *error on failure.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);

std::string to_json(const Value& v);
std::string to_json(const Object& obj);

std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
std::optional<std::string> get_optional_string(const Object& obj, const std::string& key);
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
bool has_key(const Object& obj, const std::string& key);

// Nested object under `key`, or nullptr when absent or not an object.
const Object* get_object(const Object& obj, const std::string& key);

// Escape for embedding inside a JSON string literal (no surrounding quotes).
std::string escape(const std::string& s);

// Quoted and escaped string literal.
std::string quote(const std::string& s);

}  // namespace verso::jsonlite
