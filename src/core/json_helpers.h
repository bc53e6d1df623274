/**
 * @file json_helpers.h
 * @brief Compact JSON writer and flat parser for filter configs and results.
 */

#ifndef CHORDLAB_CORE_JSON_HELPERS_H
#define CHORDLAB_CORE_JSON_HELPERS_H

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace chordlab {
namespace json {

/**
 * @brief Escapes special characters in a string for JSON output.
 *
 * Quotes, backslashes and control characters are escaped. UTF-8 bytes
 * (e.g. "♭") pass through unchanged.
 */
inline std::string escape(const std::string& s) {
  static const char* kHex = "0123456789abcdef";
  std::string result;
  result.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          result += "\\u00";
          result += kHex[(c >> 4) & 0x0F];
          result += kHex[c & 0x0F];
        } else {
          result += c;
        }
        break;
    }
  }
  return result;
}

/**
 * @brief Streaming writer producing compact JSON.
 *
 * Fluent API; commas between members and elements are inserted automatically.
 *
 * @example
 * ```cpp
 * std::ostringstream oss;
 * json::Writer w(oss);
 * w.beginObject()
 *     .write("name", "C/E")
 *     .beginArray("octaves").value(3).value(4).endArray()
 * .endObject();
 * // Output: {"name":"C/E","octaves":[3,4]}
 * ```
 */
class Writer {
 public:
  explicit Writer(std::ostream& os) : os_(os) {}

  /// Begins an object, keyed when nested inside another object.
  Writer& beginObject(const char* key = nullptr) {
    open(key, '{');
    return *this;
  }

  Writer& endObject() {
    close('}');
    return *this;
  }

  /// Begins an array, keyed when nested inside an object.
  Writer& beginArray(const char* key = nullptr) {
    open(key, '[');
    return *this;
  }

  Writer& endArray() {
    close(']');
    return *this;
  }

  /// Numeric member. Pass uint8_t fields as int.
  template <typename T>
  Writer& write(const char* key, T value) {
    member(key);
    os_ << value;
    return *this;
  }

  Writer& write(const char* key, bool value) {
    member(key);
    os_ << (value ? "true" : "false");
    return *this;
  }

  Writer& write(const char* key, const std::string& value) {
    member(key);
    quoted(value);
    return *this;
  }

  Writer& write(const char* key, const char* value) { return write(key, std::string(value)); }

  Writer& writeNull(const char* key) {
    member(key);
    os_ << "null";
    return *this;
  }

  /// Numeric array element.
  template <typename T>
  Writer& value(T v) {
    element();
    os_ << v;
    return *this;
  }

  Writer& value(bool v) {
    element();
    os_ << (v ? "true" : "false");
    return *this;
  }

  Writer& value(const std::string& v) {
    element();
    quoted(v);
    return *this;
  }

  Writer& value(const char* v) { return value(std::string(v)); }

 private:
  void element() {
    if (!first_) os_ << ',';
    first_ = false;
  }

  void member(const char* key) {
    element();
    os_ << '"' << key << "\":";
  }

  void open(const char* key, char bracket) {
    if (key) {
      member(key);
    } else {
      element();
    }
    os_ << bracket;
    first_ = true;
  }

  void close(char bracket) {
    os_ << bracket;
    first_ = false;
  }

  void quoted(const std::string& s) { os_ << '"' << escape(s) << '"'; }

  std::ostream& os_;
  bool first_ = true;
};

/**
 * @brief RAII helper that closes an array when it leaves scope.
 */
class ArrayScope {
 public:
  ArrayScope(Writer& w, const char* key = nullptr) : w_(w) { w_.beginArray(key); }
  ~ArrayScope() { w_.endArray(); }

  Writer& writer() { return w_; }

 private:
  Writer& w_;
};

// ============================================================================
// Flat parser for filter configs
// ============================================================================

/**
 * @brief Parser for a single JSON object of scalars, scalar arrays and
 * nested objects.
 *
 * Each value keeps its JSON type, so a quoted "4" is never read as a number
 * and a number is never read as a string. Integers outside the int range
 * are rejected, not wrapped. Malformed input never throws; valid() reports
 * whether the object was closed, and lookups fall back to their defaults.
 *
 * @example
 * ```cpp
 * json::Parser p(R"({"octaves":[3,4],"include_inversions":true,"roots":null})");
 * p.getIntArray("octaves");           // {3, 4}
 * p.getBool("include_inversions");    // true
 * p.isNull("roots");                  // true
 * ```
 */
class Parser {
 public:
  explicit Parser(const std::string& json) : json_(json) { valid_ = parseObject(); }

  /// True if the top-level object was parsed to its closing brace.
  bool valid() const { return valid_; }

  bool has(const std::string& key) const { return entries_.find(key) != entries_.end(); }

  bool isNull(const std::string& key) const { return hasKind(key, Kind::Null); }
  bool isArray(const std::string& key) const { return hasKind(key, Kind::Array); }
  bool isObject(const std::string& key) const { return hasKind(key, Kind::Object); }

  /**
   * @brief Get an integer value.
   * @param default_val Returned when missing, not a number, or outside int range.
   */
  int getInt(const std::string& key, int default_val = 0) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) return default_val;
    int out = default_val;
    return toInt(it->second.scalar, out) ? out : default_val;
  }

  bool getBool(const std::string& key, bool default_val = false) const {
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.scalar.kind != Kind::Bool) return default_val;
    return it->second.scalar.text == "true";
  }

  std::string getString(const std::string& key, const std::string& default_val = "") const {
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.scalar.kind != Kind::String) return default_val;
    return it->second.scalar.text;
  }

  /**
   * @brief String elements of an array.
   * @param ok Set to false if any element is not a string (optional).
   * @return String elements in order; other elements are skipped.
   */
  std::vector<std::string> getStringArray(const std::string& key, bool* ok = nullptr) const {
    std::vector<std::string> result;
    if (ok) *ok = true;
    auto it = entries_.find(key);
    if (it == entries_.end()) return result;
    for (const auto& element : it->second.elements) {
      if (element.kind == Kind::String) {
        result.push_back(element.text);
      } else if (ok) {
        *ok = false;
      }
    }
    return result;
  }

  /**
   * @brief Integer elements of an array.
   * @param ok Set to false if any element is not an in-range integer (optional).
   * @return Parsed elements in order; other elements are skipped.
   */
  std::vector<int> getIntArray(const std::string& key, bool* ok = nullptr) const {
    std::vector<int> result;
    if (ok) *ok = true;
    auto it = entries_.find(key);
    if (it == entries_.end()) return result;
    for (const auto& element : it->second.elements) {
      int v = 0;
      if (toInt(element, v)) {
        result.push_back(v);
      } else if (ok) {
        *ok = false;
      }
    }
    return result;
  }

  /// Nested object as a new Parser ("{}" when missing).
  Parser getObject(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.scalar.kind != Kind::Object) return Parser("{}");
    return Parser(it->second.scalar.text);
  }

 private:
  enum class Kind : uint8_t { Null, Bool, Number, String, Array, Object };

  // For String the unescaped text, for Object the raw source of the object.
  struct Scalar {
    Kind kind = Kind::Null;
    std::string text;
  };

  struct Entry {
    Scalar scalar;
    std::vector<Scalar> elements;  // Array only
  };

  static bool toInt(const Scalar& s, int& out) {
    if (s.kind != Kind::Number || s.text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.text.c_str(), &end, 10);
    if (end == s.text.c_str() || *end != '\0' || errno == ERANGE) return false;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(v);
    return true;
  }

  bool hasKind(const std::string& key, Kind kind) const {
    auto it = entries_.find(key);
    return it != entries_.end() && it->second.scalar.kind == kind;
  }

  static bool isDelimiter(char c) {
    return c == ',' || c == '}' || c == ']' || c == ' ' || c == '\t' || c == '\n' || c == '\r';
  }

  bool parseObject() {
    skipWhitespace();
    if (!consume('{')) return false;

    while (true) {
      skipWhitespace();
      if (atEnd()) return false;
      if (consume('}')) return true;
      if (consume(',')) continue;

      std::string key;
      if (!readString(key)) return false;
      skipWhitespace();
      if (!consume(':')) return false;
      skipWhitespace();
      if (atEnd()) return false;

      Entry entry;
      if (peek() == '[') {
        entry.scalar.kind = Kind::Array;
        if (!readArray(entry.elements)) return false;
      } else {
        entry.scalar = readValue();
      }
      entries_[key] = entry;
    }
  }

  bool readArray(std::vector<Scalar>& elements) {
    ++pos_;  // '['
    while (true) {
      skipWhitespace();
      if (atEnd()) return false;
      if (consume(']')) return true;
      if (consume(',')) continue;
      if (peek() == '}') return false;
      if (peek() == '[') {
        // Nested arrays are outside the config subset; keep a placeholder.
        skipNested();
        elements.push_back(Scalar{Kind::Array, ""});
      } else {
        elements.push_back(readValue());
      }
    }
  }

  Scalar readValue() {
    Scalar value;
    char c = peek();
    if (c == '"') {
      value.kind = Kind::String;
      readString(value.text);
    } else if (c == '{') {
      size_t start = pos_;
      skipNested();
      value.kind = Kind::Object;
      value.text = json_.substr(start, pos_ - start);
    } else {
      while (!atEnd() && !isDelimiter(peek())) {
        value.text += json_[pos_++];
      }
      if (value.text == "null") {
        value.kind = Kind::Null;
      } else if (value.text == "true" || value.text == "false") {
        value.kind = Kind::Bool;
      } else {
        value.kind = Kind::Number;
      }
    }
    return value;
  }

  bool readString(std::string& out) {
    if (!consume('"')) return false;
    out.clear();
    while (!atEnd() && peek() != '"') {
      char c = json_[pos_++];
      if (c == '\\' && !atEnd()) {
        char escaped = json_[pos_++];
        switch (escaped) {
          case 'n':
            out += '\n';
            break;
          case 'r':
            out += '\r';
            break;
          case 't':
            out += '\t';
            break;
          default:
            out += escaped;
            break;
        }
      } else {
        out += c;
      }
    }
    return consume('"');
  }

  void skipNested() {
    int depth = 0;
    while (!atEnd()) {
      char c = json_[pos_++];
      if (c == '{' || c == '[') {
        ++depth;
      } else if (c == '}' || c == ']') {
        if (--depth == 0) return;
      } else if (c == '"') {
        while (!atEnd() && peek() != '"') {
          if (peek() == '\\') ++pos_;
          ++pos_;
        }
        ++pos_;
      }
    }
  }

  void skipWhitespace() {
    while (!atEnd() && (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r')) {
      ++pos_;
    }
  }

  bool atEnd() const { return pos_ >= json_.size(); }
  char peek() const { return json_[pos_]; }

  bool consume(char c) {
    if (atEnd() || peek() != c) return false;
    ++pos_;
    return true;
  }

  std::string json_;
  size_t pos_ = 0;
  bool valid_ = false;
  std::map<std::string, Entry> entries_;
};

}  // namespace json
}  // namespace chordlab

#endif  // CHORDLAB_CORE_JSON_HELPERS_H
