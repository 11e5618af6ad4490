#include "ecp/jsonlite.hpp"

// DETERMINISM GUARANTEES:
//   - Serialization walks std::map, so object keys always come out sorted.
//   - format_double() emits the shortest text that reparses to the same
//     double (std::to_chars), always with a fraction or an exponent, so
//     distinct doubles never share a canonical form.
//   - \u escapes decode to UTF-8 (surrogate pairs to one 4-byte sequence),
//     so an escaped and a raw character canonicalize identically.
//   - Output never depends on locale.
//
// DETERMINISM RISKS:
//   - strtod() honours LC_NUMERIC. It only runs on input, never on the
//     canonical output path.
//
// STRICTNESS:
//   Duplicate keys fail with json_duplicate_key. NaN/Infinity literals, lone
//   surrogate escapes and anything after the top-level value fail with
//   json_parse_error.

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string_view>
#include <system_error>

#include "ecp/hash.hpp"

namespace ecp::jsonlite {

namespace {

constexpr const char* kParseError = "json_parse_error";
constexpr const char* kDuplicateKey = "json_duplicate_key";

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

void put_codepoint(std::string& out, unsigned cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
    return;
  }
  if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
  }
  out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
}

// Recursive-descent reader. Every read_* returns false after recording the
// first error; callers stop at the first false.
class Reader {
 public:
  explicit Reader(const std::string& text) : text_(text) {}

  bool document(Value& out) {
    if (!read_value(out)) return false;
    skip_ws();
    if (pos_ != text_.size()) return fail(kParseError, "trailing data");
    return true;
  }

  const std::optional<JsonError>& error() const { return error_; }
  void reject(std::string message) { fail(kParseError, std::move(message)); }

 private:
  bool fail(const char* code, std::string message) {
    if (!error_) error_ = JsonError{code, std::move(message) + " at offset " + std::to_string(pos_)};
    return false;
  }

  void skip_ws() {
    while (pos_ < text_.size() && is_space(text_[pos_])) ++pos_;
  }

  bool consume(char c) {
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool literal(const char* word) {
    const std::string_view w(word);
    if (text_.compare(pos_, w.size(), w) != 0) return false;
    pos_ += w.size();
    return true;
  }

  bool read_value(Value& out) {
    skip_ws();
    if (pos_ >= text_.size()) return fail(kParseError, "unexpected end of input");
    switch (text_[pos_]) {
      case '{': {
        Object obj;
        if (!read_members(obj)) return false;
        out = Value{std::move(obj)};
        return true;
      }
      case '[': {
        Array arr;
        if (!read_elements(arr)) return false;
        out = Value{std::move(arr)};
        return true;
      }
      case '"': {
        std::string s;
        if (!read_string(s)) return false;
        out = Value{std::move(s)};
        return true;
      }
      default:
        break;
    }
    if (literal("true")) { out = Value{true}; return true; }
    if (literal("false")) { out = Value{false}; return true; }
    if (literal("null")) { out = Value{nullptr}; return true; }
    if (literal("NaN") || literal("Infinity") || literal("-Infinity")) {
      return fail(kParseError, "NaN/Infinity unsupported");
    }
    return read_number(out);
  }

  bool read_members(Object& out) {
    ++pos_;  // '{'
    if (consume('}')) return true;
    do {
      skip_ws();
      std::string key;
      if (!read_string(key)) return false;
      if (out.count(key) != 0) return fail(kDuplicateKey, "duplicate key: " + key);
      if (!consume(':')) return fail(kParseError, "expected ':'");
      if (!read_value(out[key])) return false;
    } while (consume(','));
    if (!consume('}')) return fail(kParseError, "expected ',' or '}'");
    return true;
  }

  bool read_elements(Array& out) {
    ++pos_;  // '['
    if (consume(']')) return true;
    do {
      out.emplace_back();
      if (!read_value(out.back())) return false;
    } while (consume(','));
    if (!consume(']')) return fail(kParseError, "expected ',' or ']'");
    return true;
  }

  bool read_string(std::string& out) {
    if (pos_ >= text_.size() || text_[pos_] != '"') return fail(kParseError, "expected string");
    ++pos_;
    while (pos_ < text_.size()) {
      const char c = text_[pos_++];
      if (c == '"') return true;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (pos_ >= text_.size()) break;
      const char esc = text_[pos_++];
      switch (esc) {
        case 'n': out.push_back('\n'); break;
        case 't': out.push_back('\t'); break;
        case 'r': out.push_back('\r'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'u': {
          unsigned cp = 0;
          if (!read_hex4(cp)) return false;
          if (cp >= 0xDC00 && cp <= 0xDFFF) return fail(kParseError, "unpaired low surrogate");
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            unsigned low = 0;
            if (!literal("\\u")) return fail(kParseError, "unpaired high surrogate");
            if (!read_hex4(low)) return false;
            if (low < 0xDC00 || low > 0xDFFF) return fail(kParseError, "unpaired high surrogate");
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          }
          put_codepoint(out, cp);
          break;
        }
        default: out.push_back(esc); break;  // '"', '\\', '/'
      }
    }
    return fail(kParseError, "unterminated string");
  }

  bool read_hex4(unsigned& cp) {
    if (text_.size() - pos_ < 4) return fail(kParseError, "truncated \\u escape");
    cp = 0;
    for (int k = 0; k < 4; ++k) {
      const int h = hex_value(text_[pos_++]);
      if (h < 0) return fail(kParseError, "invalid \\u escape");
      cp = (cp << 4) | static_cast<unsigned>(h);
    }
    return true;
  }

  std::size_t skip_digits() {
    const std::size_t from = pos_;
    while (pos_ < text_.size() && is_digit(text_[pos_])) ++pos_;
    return pos_ - from;
  }

  // Non-negative integers stay exact as uint64; anything signed, fractional
  // or with an exponent becomes a double.
  bool read_number(Value& out) {
    const std::size_t start = pos_;
    const bool negative = pos_ < text_.size() && text_[pos_] == '-';
    if (negative) ++pos_;
    if (skip_digits() == 0) return fail(kParseError, "unexpected token");

    bool integral = !negative;
    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      integral = false;
      if (skip_digits() == 0) return fail(kParseError, "invalid number format");
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      integral = false;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
      if (skip_digits() == 0) return fail(kParseError, "invalid exponent");
    }

    const std::string token = text_.substr(start, pos_ - start);
    errno = 0;
    if (integral) {
      const unsigned long long u = std::strtoull(token.c_str(), nullptr, 10);
      if (errno == ERANGE) return fail(kParseError, "number out of range");
      out = Value{static_cast<std::uint64_t>(u)};
    } else {
      const double d = std::strtod(token.c_str(), nullptr);
      if (errno == ERANGE) return fail(kParseError, "number out of range");
      out = Value{d};
    }
    return true;
  }

  const std::string& text_;
  std::size_t pos_{0};
  std::optional<JsonError> error_;
};

void write_escaped(std::string& out, const std::string& s) {
  out.push_back('"');
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back('"');
}

void write_value(std::string& out, const Value& v);

void write_object(std::string& out, const Object& o) {
  out.push_back('{');
  bool first = true;
  for (const auto& [k, item] : o) {
    if (!first) out.push_back(',');
    first = false;
    write_escaped(out, k);
    out.push_back(':');
    write_value(out, item);
  }
  out.push_back('}');
}

void write_value(std::string& out, const Value& v) {
  if (v.is_null()) {
    out += "null";
  } else if (const auto* b = std::get_if<bool>(&v.v)) {
    out += *b ? "true" : "false";
  } else if (const auto* u = std::get_if<std::uint64_t>(&v.v)) {
    out += std::to_string(*u);
  } else if (const auto* d = std::get_if<double>(&v.v)) {
    out += format_double(*d);
  } else if (const auto* s = std::get_if<std::string>(&v.v)) {
    write_escaped(out, *s);
  } else if (const auto* o = std::get_if<Object>(&v.v)) {
    write_object(out, *o);
  } else {
    out.push_back('[');
    bool first = true;
    for (const auto& item : std::get<Array>(v.v)) {
      if (!first) out.push_back(',');
      first = false;
      write_value(out, item);
    }
    out.push_back(']');
  }
}

template <typename T>
const T* find_as(const Object& obj, const std::string& key) {
  const auto it = obj.find(key);
  return it == obj.end() ? nullptr : std::get_if<T>(&it->second.v);
}

}  // namespace

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

std::string format_double(double d) {
  // JSON has no spelling for NaN or infinities.
  if (!std::isfinite(d)) return "null";
  if (d == 0.0) return "0.0";  // also -0.0
  char buf[40];
  const auto res = std::to_chars(buf, buf + sizeof(buf), d);
  if (res.ec != std::errc()) return "null";
  std::string s(buf, res.ptr);
  // "100" would reparse as an integer.
  if (s.find_first_of(".e") == std::string::npos) s += ".0";
  return s;
}

std::string to_json(const Value& v) {
  std::string out;
  write_value(out, v);
  return out;
}

std::string to_json(const Object& o) {
  std::string out;
  write_object(out, o);
  return out;
}

std::string escape(const std::string& s) {
  std::string quoted;
  write_escaped(quoted, s);
  return quoted.substr(1, quoted.size() - 2);
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

std::optional<Value> parse_value(const std::string& text, std::optional<JsonError>* error) {
  Reader reader(text);
  Value v;
  const bool ok = reader.document(v);
  if (error) *error = reader.error();
  if (!ok) return std::nullopt;
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Reader reader(text);
  Value v;
  if (reader.document(v) && !v.is_object()) reader.reject("top-level value is not an object");
  if (error) *error = reader.error();
  if (reader.error()) return {};
  return std::get<Object>(std::move(v.v));
}

std::optional<JsonError> validate_strict(const std::string& text) {
  std::optional<JsonError> err;
  parse_value(text, &err);
  return err;
}

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error) {
  const auto v = parse_value(text, error);
  return v ? to_json(*v) : std::string{};
}

std::string hash_json_canonical(const std::string& text, std::optional<JsonError>* error) {
  const std::string canonical = canonicalize_json(text, error);
  return canonical.empty() ? std::string{} : deterministic_digest(canonical);
}

// ---------------------------------------------------------------------------
// Extractors
// ---------------------------------------------------------------------------

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* s = find_as<std::string>(obj, key);
  return s ? *s : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const auto* b = find_as<bool>(obj, key);
  return b ? *b : def;
}

std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def) {
  const auto* u = find_as<std::uint64_t>(obj, key);
  return u ? *u : def;
}

double get_double(const Object& obj, const std::string& key, double def) {
  if (const auto* d = find_as<double>(obj, key)) return *d;
  if (const auto* u = find_as<std::uint64_t>(obj, key)) return static_cast<double>(*u);
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  if (const auto* arr = find_as<Array>(obj, key)) {
    for (const auto& item : *arr) {
      if (const auto* s = std::get_if<std::string>(&item.v)) out.push_back(*s);
    }
  }
  return out;
}

std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  if (const auto* inner = find_as<Object>(obj, key)) {
    for (const auto& [k, item] : *inner) {
      if (const auto* s = std::get_if<std::string>(&item.v)) out.emplace(k, *s);
    }
  }
  return out;
}

Object get_object(const Object& obj, const std::string& key) {
  const auto* inner = find_as<Object>(obj, key);
  return inner ? *inner : Object{};
}

// ---------------------------------------------------------------------------
// Builders
// ---------------------------------------------------------------------------

Array to_array(const std::vector<std::string>& items) {
  return Array(items.begin(), items.end());
}

Object to_object(const std::map<std::string, std::string>& items) {
  Object out;
  for (const auto& [k, v] : items) out.emplace(k, Value{v});
  return out;
}

}  // namespace ecp::jsonlite
