// JSON parser for descriptor files and config input (no external dependencies).
//
// parseJsonDocument() builds a full value tree (objects, arrays, scalars) and
// reports the first syntax error with its line and column. jsonObjectToMap()
// flattens a parsed config object for key lookups.

#ifndef STYLEC_CORE_JSON_PARSER_H
#define STYLEC_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace stylec {

struct JsonMember;

/// @brief A JSON value of any type. Object members keep document order.
struct JsonValue {
  enum Type { String, Number, Bool, Null, Array, Object };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  std::string number_text;  // Number as written in the source
  bool bool_val = false;
  std::vector<JsonValue> items;     // Array elements
  std::vector<JsonMember> members;  // Object members

  /// @brief Get value as integer, with default.
  ///
  /// Numbers outside the range of int also yield the default.
  int asInt(int default_val = 0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;

  /// @brief True for a Number with no fractional part.
  bool isInteger() const;

  /// @brief True for an integral Number that fits in int.
  bool fitsInt() const;

  /// @brief Find an object member by key.
  /// @return Pointer to the first member value with that key, or nullptr if
  ///         absent or this value is not an object.
  const JsonValue* find(const std::string& key) const;

  /// @brief Human-readable type name ("string", "object", ...).
  const char* typeName() const;
};

/// @brief Key/value pair of a JSON object.
struct JsonMember {
  std::string key;
  JsonValue value;
};

/// @brief Parse a complete JSON document.
/// @param json Pointer to JSON text.
/// @param length Length of JSON text.
/// @param out Receives the root value on success.
/// @param error Receives "line L, column C: reason" on failure.
/// @return True if the whole input is exactly one valid JSON value.
bool parseJsonDocument(const char* json, size_t length, JsonValue& out, std::string& error);

/// @brief Collect the members of an object value into a key-value map.
///
/// Top-level keys only; later duplicates replace earlier ones.
///
/// @param object Parsed object value.
/// @return Map of key-value pairs. Empty map if the value is not an object.
std::map<std::string, JsonValue> jsonObjectToMap(const JsonValue& object);

}  // namespace stylec

#endif  // STYLEC_CORE_JSON_PARSER_H
