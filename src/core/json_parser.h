// Minimal JSON reader (no external dependencies).
//
// Parses a complete JSON document into a JsonValue tree. Used for the score
// document and the tool configuration file.

#ifndef TUNESCRIPT_CORE_JSON_PARSER_H
#define TUNESCRIPT_CORE_JSON_PARSER_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tunescript {

struct JsonMember;

/// @brief A JSON value: null, boolean, number, string, array or object.
///
/// Object members keep document order.
struct JsonValue {
  enum Type { Null, Bool, Number, String, Array, Object };
  Type type = Null;
  bool bool_val = false;
  double number_val = 0.0;
  std::string string_val;
  std::vector<JsonValue> array_items;
  std::vector<JsonMember> object_members;

  bool isNull() const { return type == Null; }
  bool isBool() const { return type == Bool; }
  bool isNumber() const { return type == Number; }
  bool isString() const { return type == String; }
  bool isArray() const { return type == Array; }
  bool isObject() const { return type == Object; }

  /// @brief Get value as integer (truncated), with default for non-numbers.
  int asInt(int default_val = 0) const;

  /// @brief Get value as double, with default for non-numbers.
  double asDouble(double default_val = 0.0) const;

  /// @brief Get value as boolean, with default for non-booleans.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default for non-strings.
  std::string asString(const std::string& default_val = "") const;

  /// @brief Find an object member by key (first match).
  /// @return Pointer to the member value, or nullptr if absent or not an object.
  const JsonValue* find(std::string_view key) const;
};

/// One key/value pair of a JSON object.
struct JsonMember {
  std::string key;
  JsonValue value;
};

/// @brief Result of parsing a JSON document.
struct JsonParseResult {
  bool success = false;
  JsonValue value;
  std::string error_message;
  size_t error_offset = 0;  ///< Byte offset where parsing failed.
};

/// @brief Parse a complete JSON document.
///
/// Accepts exactly one value surrounded by optional whitespace. Nesting
/// deeper than 256 levels is rejected.
///
/// @param text JSON text.
/// @return Parse result; on failure `success` is false and `error_message`
///         describes the first problem found.
JsonParseResult parseJson(std::string_view text);

}  // namespace tunescript

#endif  // TUNESCRIPT_CORE_JSON_PARSER_H
