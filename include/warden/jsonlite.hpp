#pragma once

// warden/jsonlite.hpp: Minimal strict JSON reader/writer.
//
// Used for plan files, config documents, the durable history log, CAS
// metadata, and the save_json / load_json tools.
//
// DESIGN:
//   - Recursive-descent parser over std::string. Objects are std::map, so
//     to_json() output always has sorted keys (canonical form).
//   - Duplicate object keys are rejected (json_duplicate_key).
//   - Non-negative integers are held as uint64; every other number as double.
//
// EXTENSION_POINT: full_json_schema
//   Current: schema_violations() understands type / required / properties /
//   items / enum, which covers the schemas passed to save_json and load_json.
//   Upgrade path: add $ref, pattern, min/max constraints. Invariant: an empty
//   violation list must keep meaning "document conforms".

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace warden::jsonlite {

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v{nullptr};
};

// Parse any JSON document. On error, *error is set and a null Value returned.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a document whose root must be an object. Returns {} on error or
// non-object root.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);

// Compact canonical serialization (sorted keys, no whitespace).
std::string to_json(const Value& v);
// Indented serialization, `indent` spaces per level, trailing newline omitted.
std::string to_pretty_json(const Value& v, int indent = 2);

// "object", "array", "string", "integer", "number", "boolean" or "null".
std::string type_name(const Value& v);

// Returns human-readable violations of `schema` by `doc`; empty = conforms.
std::vector<std::string> schema_violations(const Value& doc, const Value& schema);

// Type-safe extractors
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);

std::string escape(const std::string& s);

}  // namespace warden::jsonlite
