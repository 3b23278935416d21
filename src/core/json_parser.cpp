// Implementation of the JSON document parser.

#include "core/json_parser.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <utility>

namespace stylec {

int JsonValue::asInt(int default_val) const {
  if (type != Number) return default_val;
  if (!(number_val >= static_cast<double>(std::numeric_limits<int>::min()) &&
        number_val <= static_cast<double>(std::numeric_limits<int>::max()))) {
    return default_val;
  }
  return static_cast<int>(number_val);
}

bool JsonValue::asBool(bool default_val) const {
  if (type == Bool) return bool_val;
  return default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

bool JsonValue::isInteger() const {
  return type == Number && std::floor(number_val) == number_val;
}

bool JsonValue::fitsInt() const {
  return isInteger() && number_val >= static_cast<double>(std::numeric_limits<int>::min()) &&
         number_val <= static_cast<double>(std::numeric_limits<int>::max());
}

const JsonValue* JsonValue::find(const std::string& key) const {
  if (type != Object) return nullptr;
  for (const auto& member : members) {
    if (member.key == key) return &member.value;
  }
  return nullptr;
}

const char* JsonValue::typeName() const {
  switch (type) {
    case String: return "string";
    case Number: return "number";
    case Bool:   return "boolean";
    case Null:   return "null";
    case Array:  return "array";
    case Object: return "object";
  }
  return "unknown";
}

namespace {

/// Nesting limit; descriptor files are two or three levels deep.
constexpr int kMaxDepth = 64;

/// @brief Recursive-descent parser over a character buffer.
class Parser {
 public:
  Parser(const char* json, size_t length) : json_(json), length_(length) {}

  bool parseDocument(JsonValue& out) {
    skipWhitespace();
    if (!parseValue(out, 0)) return false;
    skipWhitespace();
    if (pos_ < length_) return setError("unexpected trailing characters");
    return true;
  }

  const std::string& error() const { return error_; }

 private:
  const char* json_;
  size_t length_;
  size_t pos_ = 0;
  std::string error_;

  bool atEnd() const { return pos_ >= length_; }
  char peek() const { return json_[pos_]; }

  /// @brief Record an error at the current position; always returns false.
  bool setError(const std::string& reason) {
    size_t line = 1;
    size_t column = 1;
    for (size_t idx = 0; idx < pos_ && idx < length_; ++idx) {
      if (json_[idx] == '\n') {
        ++line;
        column = 1;
      } else {
        ++column;
      }
    }
    error_ = "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
             reason;
    return false;
  }

  void skipWhitespace() {
    while (!atEnd() && std::isspace(static_cast<unsigned char>(peek()))) ++pos_;
  }

  bool expectLiteral(const char* literal) {
    size_t start = pos_;
    for (const char* chr = literal; *chr != '\0'; ++chr) {
      if (atEnd() || peek() != *chr) {
        pos_ = start;
        return setError(std::string("invalid literal, expected '") + literal + "'");
      }
      ++pos_;
    }
    return true;
  }

  bool parseValue(JsonValue& out, int depth) {
    if (depth > kMaxDepth) return setError("nesting too deep");
    if (atEnd()) return setError("unexpected end of input");

    switch (peek()) {
      case '{':
        return parseObject(out, depth);
      case '[':
        return parseArray(out, depth);
      case '"':
        out.type = JsonValue::String;
        return parseString(out.string_val);
      case 't':
        out.type = JsonValue::Bool;
        out.bool_val = true;
        return expectLiteral("true");
      case 'f':
        out.type = JsonValue::Bool;
        out.bool_val = false;
        return expectLiteral("false");
      case 'n':
        out.type = JsonValue::Null;
        return expectLiteral("null");
      default:
        if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) {
          return parseNumber(out);
        }
        return setError(std::string("unexpected character '") + peek() + "'");
    }
  }

  bool parseObject(JsonValue& out, int depth) {
    out.type = JsonValue::Object;
    ++pos_;  // skip '{'
    skipWhitespace();
    if (!atEnd() && peek() == '}') {
      ++pos_;
      return true;
    }

    while (true) {
      skipWhitespace();
      if (atEnd() || peek() != '"') return setError("expected object key string");
      JsonMember member;
      if (!parseString(member.key)) return false;

      skipWhitespace();
      if (atEnd() || peek() != ':') return setError("expected ':' after object key");
      ++pos_;
      skipWhitespace();
      if (!parseValue(member.value, depth + 1)) return false;
      out.members.push_back(std::move(member));

      skipWhitespace();
      if (atEnd()) return setError("unterminated object");
      if (peek() == ',') {
        ++pos_;
        continue;
      }
      if (peek() == '}') {
        ++pos_;
        return true;
      }
      return setError("expected ',' or '}' in object");
    }
  }

  bool parseArray(JsonValue& out, int depth) {
    out.type = JsonValue::Array;
    ++pos_;  // skip '['
    skipWhitespace();
    if (!atEnd() && peek() == ']') {
      ++pos_;
      return true;
    }

    while (true) {
      skipWhitespace();
      JsonValue item;
      if (!parseValue(item, depth + 1)) return false;
      out.items.push_back(std::move(item));

      skipWhitespace();
      if (atEnd()) return setError("unterminated array");
      if (peek() == ',') {
        ++pos_;
        continue;
      }
      if (peek() == ']') {
        ++pos_;
        return true;
      }
      return setError("expected ',' or ']' in array");
    }
  }

  /// @brief Append a code point to out as UTF-8.
  static void appendUtf8(std::string& out, uint32_t code_point) {
    if (code_point < 0x80) {
      out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
      out += static_cast<char>(0xC0 | (code_point >> 6));
      out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
      out += static_cast<char>(0xE0 | (code_point >> 12));
      out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (code_point >> 18));
      out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
  }

  bool parseHex4(uint32_t& value) {
    value = 0;
    for (int idx = 0; idx < 4; ++idx) {
      if (atEnd()) return setError("truncated \\u escape");
      char chr = peek();
      value <<= 4;
      if (chr >= '0' && chr <= '9') {
        value |= static_cast<uint32_t>(chr - '0');
      } else if (chr >= 'a' && chr <= 'f') {
        value |= static_cast<uint32_t>(chr - 'a' + 10);
      } else if (chr >= 'A' && chr <= 'F') {
        value |= static_cast<uint32_t>(chr - 'A' + 10);
      } else {
        return setError("invalid hex digit in \\u escape");
      }
      ++pos_;
    }
    return true;
  }

  /// @brief Parse a string literal (expects pos at opening quote).
  bool parseString(std::string& out) {
    ++pos_;  // skip opening quote
    out.clear();

    while (!atEnd() && peek() != '"') {
      char chr = peek();
      if (static_cast<unsigned char>(chr) < 0x20) {
        return setError("control character in string");
      }
      if (chr != '\\') {
        out += chr;
        ++pos_;
        continue;
      }

      ++pos_;  // skip backslash
      if (atEnd()) break;
      char esc = peek();
      ++pos_;
      switch (esc) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u': {
          uint32_t code_point = 0;
          if (!parseHex4(code_point)) return false;
          // Surrogate pair: high surrogate must be followed by \u low surrogate.
          if (code_point >= 0xD800 && code_point <= 0xDBFF) {
            if (pos_ + 1 >= length_ || json_[pos_] != '\\' || json_[pos_ + 1] != 'u') {
              return setError("unpaired surrogate in \\u escape");
            }
            pos_ += 2;
            uint32_t low = 0;
            if (!parseHex4(low)) return false;
            if (low < 0xDC00 || low > 0xDFFF) {
              return setError("invalid low surrogate in \\u escape");
            }
            code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
          }
          appendUtf8(out, code_point);
          break;
        }
        default:
          --pos_;
          return setError(std::string("invalid escape '\\") + esc + "'");
      }
    }

    if (atEnd()) return setError("unterminated string");
    ++pos_;  // skip closing quote
    return true;
  }

  /// @brief Parse a number (integer, fraction, exponent).
  bool parseNumber(JsonValue& out) {
    size_t start = pos_;
    if (peek() == '-') ++pos_;
    if (atEnd() || !std::isdigit(static_cast<unsigned char>(peek()))) {
      return setError("invalid number");
    }
    if (peek() == '0') {
      ++pos_;
    } else {
      while (!atEnd() && std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    }
    if (!atEnd() && peek() == '.') {
      ++pos_;
      if (atEnd() || !std::isdigit(static_cast<unsigned char>(peek()))) {
        return setError("expected digit after decimal point");
      }
      while (!atEnd() && std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    }
    if (!atEnd() && (peek() == 'e' || peek() == 'E')) {
      ++pos_;
      if (!atEnd() && (peek() == '+' || peek() == '-')) ++pos_;
      if (atEnd() || !std::isdigit(static_cast<unsigned char>(peek()))) {
        return setError("expected digit in exponent");
      }
      while (!atEnd() && std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    }

    out.type = JsonValue::Number;
    out.number_text.assign(json_ + start, pos_ - start);
    out.number_val = std::strtod(out.number_text.c_str(), nullptr);
    return true;
  }
};

}  // namespace

bool parseJsonDocument(const char* json, size_t length, JsonValue& out, std::string& error) {
  out = JsonValue{};
  if (!json || length == 0) {
    error = "line 1, column 1: empty document";
    return false;
  }

  Parser parser(json, length);
  if (!parser.parseDocument(out)) {
    error = parser.error();
    out = JsonValue{};
    return false;
  }
  error.clear();
  return true;
}

std::map<std::string, JsonValue> jsonObjectToMap(const JsonValue& object) {
  std::map<std::string, JsonValue> result;
  if (object.type != JsonValue::Object) return result;

  for (const auto& member : object.members) {
    result[member.key] = member.value;
  }
  return result;
}

}  // namespace stylec
