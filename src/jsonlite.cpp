#include "proofarm/jsonlite.hpp"

// Single-pass reader over a borrowed buffer. The first error is kept and
// every later production short-circuits, so the reported message always
// names the earliest offending offset.

#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace proofarm::jsonlite {

namespace {

constexpr std::size_t kMaxDepth = 64;

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

class Reader {
 public:
  explicit Reader(const std::string& text) : text_(text) {}

  Value document() {
    Value v = value(0);
    skip_space();
    if (!error_ && pos_ != text_.size()) fail("json_parse_error", "trailing data");
    return v;
  }

  const std::optional<JsonError>& error() const { return error_; }

 private:
  void fail(const char* code, const std::string& what) {
    if (!error_) error_ = JsonError{code, what + " at offset " + std::to_string(pos_)};
  }

  void skip_space() {
    while (pos_ < text_.size() && is_space(text_[pos_])) ++pos_;
  }

  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return at_end() ? '\0' : text_[pos_]; }

  bool consume(char c) {
    skip_space();
    if (peek() != c) return false;
    ++pos_;
    return true;
  }

  bool literal(const char* word, std::size_t len) {
    if (text_.compare(pos_, len, word) != 0) return false;
    pos_ += len;
    return true;
  }

  Value value(std::size_t depth) {
    if (depth > kMaxDepth) {
      fail("json_parse_error", "nesting too deep");
      return {};
    }
    skip_space();
    if (at_end()) {
      fail("json_parse_error", "unexpected end of input");
      return {};
    }
    switch (peek()) {
      case '{': return Value{object(depth)};
      case '[': return Value{array(depth)};
      case '"': return Value{string()};
      default: break;
    }
    if (literal("true", 4)) return Value{true};
    if (literal("false", 5)) return Value{false};
    if (literal("null", 4)) return Value{nullptr};
    if (peek() == '-' || is_digit(peek())) return number();
    fail("json_parse_error", "unexpected token");
    return {};
  }

  std::optional<std::uint32_t> hex4() {
    if (pos_ + 4 > text_.size()) return std::nullopt;
    std::uint32_t cp = 0;
    for (int k = 0; k < 4; ++k) {
      const int h = hex_value(text_[pos_ + static_cast<std::size_t>(k)]);
      if (h < 0) return std::nullopt;
      cp = (cp << 4) | static_cast<std::uint32_t>(h);
    }
    pos_ += 4;
    return cp;
  }

  std::string string() {
    if (!consume('"')) {
      fail("json_parse_error", "expected string");
      return {};
    }
    std::string out;
    while (!at_end()) {
      const char c = text_[pos_++];
      if (c == '"') return out;
      if (static_cast<unsigned char>(c) < 0x20) {
        fail("json_parse_error", "control character in string");
        return {};
      }
      if (c != '\\') {
        out += c;
        continue;
      }
      if (at_end()) break;
      const char esc = text_[pos_++];
      switch (esc) {
        case '"': out += '"'; break;
        case '\\': out += '\\'; break;
        case '/': out += '/'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'u': {
          auto cp = hex4();
          if (!cp) {
            fail("json_parse_error", "invalid \\u escape");
            return {};
          }
          if (*cp >= 0xD800 && *cp <= 0xDBFF) {
            // High surrogate must be followed by an escaped low surrogate.
            std::optional<std::uint32_t> lo;
            if (literal("\\u", 2)) lo = hex4();
            if (!lo || *lo < 0xDC00 || *lo > 0xDFFF) {
              fail("json_parse_error", "unpaired surrogate");
              return {};
            }
            *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*lo - 0xDC00);
          }
          append_utf8(out, *cp);
          break;
        }
        default:
          fail("json_parse_error", "invalid escape");
          return {};
      }
    }
    fail("json_parse_error", "unterminated string");
    return {};
  }

  Value number() {
    const std::size_t start = pos_;
    const bool negative = peek() == '-';
    if (negative) ++pos_;
    if (!is_digit(peek())) {
      fail("json_parse_error", "invalid number");
      return {};
    }
    while (is_digit(peek())) ++pos_;
    bool integral = !negative;
    if (peek() == '.') {
      integral = false;
      ++pos_;
      if (!is_digit(peek())) {
        fail("json_parse_error", "invalid fraction");
        return {};
      }
      while (is_digit(peek())) ++pos_;
    }
    if (peek() == 'e' || peek() == 'E') {
      integral = false;
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      if (!is_digit(peek())) {
        fail("json_parse_error", "invalid exponent");
        return {};
      }
      while (is_digit(peek())) ++pos_;
    }

    const std::string token = text_.substr(start, pos_ - start);
    errno = 0;
    if (integral) {
      const unsigned long long n = std::strtoull(token.c_str(), nullptr, 10);
      if (errno == ERANGE) {
        fail("json_parse_error", "integer out of range");
        return {};
      }
      return Value{static_cast<std::uint64_t>(n)};
    }
    const double d = std::strtod(token.c_str(), nullptr);
    if (errno == ERANGE) {
      fail("json_parse_error", "number out of range");
      return {};
    }
    return Value{d};
  }

  Object object(std::size_t depth) {
    Object out;
    consume('{');
    if (consume('}')) return out;
    do {
      std::string key = string();
      if (error_) return out;
      if (out.contains(key)) {
        fail("json_duplicate_key", "duplicate key \"" + key + "\"");
        return out;
      }
      if (!consume(':')) {
        fail("json_parse_error", "expected ':'");
        return out;
      }
      Value v = value(depth + 1);
      if (error_) return out;
      out.emplace(std::move(key), std::move(v));
    } while (consume(','));
    if (!consume('}')) fail("json_parse_error", "expected ',' or '}'");
    return out;
  }

  Array array(std::size_t depth) {
    Array out;
    consume('[');
    if (consume(']')) return out;
    do {
      out.push_back(value(depth + 1));
      if (error_) return out;
    } while (consume(','));
    if (!consume(']')) fail("json_parse_error", "expected ',' or ']'");
    return out;
  }

  const std::string& text_;
  std::size_t pos_{0};
  std::optional<JsonError> error_;
};

void write_string(std::string& out, const std::string& s) {
  out += '"';
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
          out += c;
        }
    }
  }
  out += '"';
}

void write_value(std::string& out, const Value& v) {
  switch (v.v.index()) {
    case 0: out += "null"; break;
    case 1: out += std::get<bool>(v.v) ? "true" : "false"; break;
    case 2: out += std::to_string(std::get<std::uint64_t>(v.v)); break;
    case 3: out += format_double(std::get<double>(v.v)); break;
    case 4: write_string(out, std::get<std::string>(v.v)); break;
    case 5: {
      out += '{';
      bool first = true;
      for (const auto& [k, child] : std::get<Object>(v.v)) {
        if (!first) out += ',';
        first = false;
        write_string(out, k);
        out += ':';
        write_value(out, child);
      }
      out += '}';
      break;
    }
    default: {
      out += '[';
      bool first = true;
      for (const auto& child : std::get<Array>(v.v)) {
        if (!first) out += ',';
        first = false;
        write_value(out, child);
      }
      out += ']';
    }
  }
}

template <typename T>
const T* find_as(const Object& obj, const std::string& key) {
  const auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  return std::get_if<T>(&it->second.v);
}

}  // namespace

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Reader reader(text);
  Value root = reader.document();
  std::optional<JsonError> err = reader.error();
  if (!err && !std::holds_alternative<Object>(root.v)) {
    err = JsonError{"json_parse_error", "top-level value is not an object"};
  }
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(root.v));
}

std::string to_json(const Value& v) {
  std::string out;
  write_value(out, v);
  return out;
}

// Fixed "%.6f" then trailing zeros trimmed, keeping at least one fractional
// digit: 2.0 -> "2.0", 0.25 -> "0.25".
std::string format_double(double d) {
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string s(buf, static_cast<std::size_t>(n));
  while (s.back() == '0') s.pop_back();
  if (s.back() == '.') s += '0';
  return s;
}

std::string escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  write_string(out, s);
  return out.substr(1, out.size() - 2);
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* p = find_as<std::string>(obj, key);
  return p ? *p : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const auto* p = find_as<bool>(obj, key);
  return p ? *p : def;
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const auto* p = find_as<std::uint64_t>(obj, key);
  return p ? *p : def;
}

double get_double(const Object& obj, const std::string& key, double def) {
  if (const auto* d = find_as<double>(obj, key)) return *d;
  if (const auto* n = find_as<std::uint64_t>(obj, key)) return static_cast<double>(*n);
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
  if (const auto* o = find_as<Object>(obj, key)) {
    for (const auto& [k, v] : *o) {
      if (const auto* s = std::get_if<std::string>(&v.v)) out[k] = *s;
    }
  }
  return out;
}

std::optional<Object> get_object(const Object& obj, const std::string& key) {
  if (const auto* o = find_as<Object>(obj, key)) return *o;
  return std::nullopt;
}

bool has_key(const Object& obj, const std::string& key) { return obj.contains(key); }

}  // namespace proofarm::jsonlite
