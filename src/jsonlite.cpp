#include "warden/jsonlite.hpp"

// Architecture notes on jsonlite:
//
// DETERMINISM GUARANTEES:
//   - to_json() emits sorted keys (std::map iteration), so compact output of
//     an equal document is byte-identical and safe to hash.
//   - format_double() always uses 6 decimal places with trailing-zero trimming.
//     No locale dependency: snprintf numeric output always uses '.'.
//
// DETERMINISM RISKS:
//   - std::stod() is locale-sensitive. It is used only for input parsing, not
//     for canonical output. Output uses format_double(). -> safe.

#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace warden::jsonlite {

namespace {

// Append a code point as UTF-8.
void append_utf8(std::string& o, std::uint32_t cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
  } else if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    o += static_cast<char>(0xF0 | (cp >> 18));
    o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

struct Parser {
  const std::string& s;
  size_t i{0};
  std::optional<JsonError> err;
  int depth{0};

  static constexpr int kMaxDepth = 256;

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }
  void fail(const std::string& msg) { if (!err) err = JsonError{"json_parse_error", msg}; }

  bool parse_hex4(std::uint32_t& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = s[i++];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<std::uint32_t>(c - 'A' + 10);
      else return false;
    }
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { fail("expected string"); return {}; }
    std::string o;
    while (i < s.size()) {
      const char c = s[i++];
      if (c == '"') return o;
      if (static_cast<unsigned char>(c) < 0x20) { fail("control character in string"); return {}; }
      if (c != '\\') { o += c; continue; }
      if (i >= s.size()) break;
      const char n = s[i++];
      switch (n) {
        case 'n': o += '\n'; break;
        case 't': o += '\t'; break;
        case 'r': o += '\r'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case '"': o += '"'; break;
        case '\\': o += '\\'; break;
        case '/': o += '/'; break;
        case 'u': {
          std::uint32_t cp = 0;
          if (!parse_hex4(cp)) { fail("invalid \\u escape"); return {}; }
          // Surrogate pair.
          if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
            i += 2;
            std::uint32_t lo = 0;
            if (!parse_hex4(lo) || lo < 0xDC00 || lo > 0xDFFF) { fail("invalid surrogate pair"); return {}; }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          }
          append_utf8(o, cp);
          break;
        }
        default:
          fail("invalid escape");
          return {};
      }
    }
    fail("unterminated string");
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    const size_t start = i;
    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool is_float = false;
    if (i < s.size() && s[i] == '.') {
      is_float = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("invalid number format");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      is_float = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("invalid exponent");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num_str = s.substr(start, i - start);
    try {
      if (is_float || num_str[0] == '-') {
        out_val = Value{std::stod(num_str)};
      } else {
        out_val = Value{static_cast<std::uint64_t>(std::stoull(num_str))};
      }
    } catch (const std::exception&) {
      fail("number out of range");
      return false;
    }
    return true;
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { fail("unexpected eof"); return {}; }
    if (s[i] == '{') return Value{parse_object()};
    if (s[i] == '[') return Value{parse_array()};
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num_val;
    if (parse_number(num_val)) return num_val;
    fail("unexpected token");
    return {};
  }

  Object parse_object() {
    Object out;
    if (++depth > kMaxDepth) { fail("nesting too deep"); return out; }
    eat('{');
    if (eat('}')) { --depth; return out; }
    while (!err) {
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { fail("expected :"); break; }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { fail("expected ,"); break; }
    }
    --depth;
    return out;
  }

  Array parse_array() {
    Array out;
    if (++depth > kMaxDepth) { fail("nesting too deep"); return out; }
    eat('[');
    if (eat(']')) { --depth; return out; }
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { fail("expected ,"); break; }
    }
    --depth;
    return out;
  }

  Value parse_document() {
    Value v = parse_value();
    ws();
    if (!err && i != s.size()) fail("trailing data");
    return v;
  }
};

// MICRO_OPT: Fast path for strings with no escape characters (the common case).
// Pre-scan detects whether escaping is needed; if not, the input is returned as is.
std::string escape_inner(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    } else {
      o += c;
    }
  }
  return o;
}

// Deterministic double formatting: "%.6f" then trim trailing zeros.
std::string format_double(double d) {
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string result(buf, static_cast<size_t>(n));
  while (!result.empty() && result.back() == '0') result.pop_back();
  if (!result.empty() && result.back() == '.') result.push_back('0');
  return result;
}

void write_pretty(std::ostringstream& oss, const Value& v, int indent, int level) {
  const std::string pad(static_cast<size_t>(indent * (level + 1)), ' ');
  const std::string close_pad(static_cast<size_t>(indent * level), ' ');
  if (const auto* obj = std::get_if<Object>(&v.v)) {
    if (obj->empty()) { oss << "{}"; return; }
    oss << "{\n";
    bool first = true;
    for (const auto& [k, vv] : *obj) {
      if (!first) oss << ",\n";
      first = false;
      oss << pad << "\"" << escape_inner(k) << "\": ";
      write_pretty(oss, vv, indent, level + 1);
    }
    oss << "\n" << close_pad << "}";
    return;
  }
  if (const auto* arr = std::get_if<Array>(&v.v)) {
    if (arr->empty()) { oss << "[]"; return; }
    oss << "[\n";
    bool first = true;
    for (const auto& vv : *arr) {
      if (!first) oss << ",\n";
      first = false;
      oss << pad;
      write_pretty(oss, vv, indent, level + 1);
    }
    oss << "\n" << close_pad << "]";
    return;
  }
  oss << to_json(v);
}

bool matches_type(const Value& doc, const std::string& t) {
  const std::string actual = type_name(doc);
  if (t == actual) return true;
  return t == "number" && actual == "integer";
}

void check_schema(const Value& doc, const Value& schema, const std::string& where,
                  std::vector<std::string>& out) {
  const auto* sobj = std::get_if<Object>(&schema.v);
  if (!sobj) return;

  auto t = sobj->find("type");
  if (t != sobj->end()) {
    bool ok = false;
    std::string expected;
    if (const auto* ts = std::get_if<std::string>(&t->second.v)) {
      ok = matches_type(doc, *ts);
      expected = *ts;
    } else if (const auto* ta = std::get_if<Array>(&t->second.v)) {
      for (const auto& alt : *ta) {
        if (const auto* as = std::get_if<std::string>(&alt.v)) {
          if (!expected.empty()) expected += "|";
          expected += *as;
          ok = ok || matches_type(doc, *as);
        }
      }
    } else {
      ok = true;
    }
    if (!ok) {
      out.push_back(where + ": expected " + expected + ", got " + type_name(doc));
      return;
    }
  }

  auto e = sobj->find("enum");
  if (e != sobj->end()) {
    if (const auto* choices = std::get_if<Array>(&e->second.v)) {
      const std::string needle = to_json(doc);
      bool found = false;
      for (const auto& c : *choices) {
        if (to_json(c) == needle) { found = true; break; }
      }
      if (!found) out.push_back(where + ": value not in enum");
    }
  }

  if (const auto* dobj = std::get_if<Object>(&doc.v)) {
    if (const auto* req = get_array(*sobj, "required")) {
      for (const auto& r : *req) {
        const auto* key = std::get_if<std::string>(&r.v);
        if (key && !dobj->contains(*key)) out.push_back(where + ": missing required property '" + *key + "'");
      }
    }
    if (const auto* props = get_object(*sobj, "properties")) {
      for (const auto& [name, sub] : *props) {
        auto it = dobj->find(name);
        if (it != dobj->end()) check_schema(it->second, sub, where + "." + name, out);
      }
    }
  }

  if (const auto* darr = std::get_if<Array>(&doc.v)) {
    auto items = sobj->find("items");
    if (items != sobj->end()) {
      for (size_t k = 0; k < darr->size(); ++k) {
        check_schema((*darr)[k], items->second, where + "[" + std::to_string(k) + "]", out);
      }
    }
  }
}

}  // namespace

std::string to_json(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (std::holds_alternative<bool>(v.v)) return std::get<bool>(v.v) ? "true" : "false";
  if (std::holds_alternative<std::string>(v.v)) return "\"" + escape_inner(std::get<std::string>(v.v)) + "\"";
  if (std::holds_alternative<std::uint64_t>(v.v)) return std::to_string(std::get<std::uint64_t>(v.v));
  if (std::holds_alternative<double>(v.v)) return format_double(std::get<double>(v.v));
  if (std::holds_alternative<Object>(v.v)) {
    std::ostringstream oss; oss << "{"; bool first = true;
    for (const auto& [k, vv] : std::get<Object>(v.v)) { if (!first) oss << ","; first = false; oss << "\"" << escape_inner(k) << "\"" << ":" << to_json(vv); }
    oss << "}"; return oss.str();
  }
  std::ostringstream oss; oss << "["; bool first = true;
  for (const auto& vv : std::get<Array>(v.v)) { if (!first) oss << ","; first = false; oss << to_json(vv); }
  oss << "]"; return oss.str();
}

std::string to_pretty_json(const Value& v, int indent) {
  std::ostringstream oss;
  write_pretty(oss, v, indent < 0 ? 0 : indent, 0);
  return oss.str();
}

std::string type_name(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (std::holds_alternative<bool>(v.v)) return "boolean";
  if (std::holds_alternative<std::string>(v.v)) return "string";
  if (std::holds_alternative<std::uint64_t>(v.v)) return "integer";
  if (std::holds_alternative<double>(v.v)) {
    const double d = std::get<double>(v.v);
    return (std::isfinite(d) && std::floor(d) == d) ? "integer" : "number";
  }
  if (std::holds_alternative<Object>(v.v)) return "object";
  return "array";
}

std::vector<std::string> schema_violations(const Value& doc, const Value& schema) {
  std::vector<std::string> out;
  check_schema(doc, schema, "$", out);
  return out;
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  Value v = p.parse_document();
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

std::optional<JsonError> validate_strict(const std::string& text) {
  Parser p{text};
  (void)p.parse_document();
  return p.err;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_document();
  if (!p.err && !std::holds_alternative<Object>(v.v)) p.fail("root is not an object");
  if (error) *error = p.err;
  if (p.err) return {};
  return std::get<Object>(v.v);
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return def;
  return std::get<std::string>(it->second.v);
}
bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v)) return def;
  return std::get<bool>(it->second.v);
}
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) return def;
  return std::get<std::uint64_t>(it->second.v);
}
std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return out;
  for (const auto& item : std::get<Array>(it->second.v)) {
    if (std::holds_alternative<std::string>(item.v)) out.push_back(std::get<std::string>(item.v));
  }
  return out;
}
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Object>(it->second.v)) return out;
  for (const auto& [k, v] : std::get<Object>(it->second.v)) {
    if (std::holds_alternative<std::string>(v.v)) out[k] = std::get<std::string>(v.v);
  }
  return out;
}
const Array* get_array(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  return std::get_if<Array>(&it->second.v);
}
const Object* get_object(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  return std::get_if<Object>(&it->second.v);
}

std::string escape(const std::string& s) { return escape_inner(s); }

}  // namespace warden::jsonlite
