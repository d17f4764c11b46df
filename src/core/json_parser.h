// Minimal JSON object parser for tokenizer configs and token files
// (no external dependencies).
//
// Handles a top-level object whose values are strings, numbers, booleans,
// null, or arrays of those (arrays may nest). Nested objects are skipped.

#ifndef REMI_CORE_JSON_PARSER_H
#define REMI_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace remi {

/// @brief A single JSON value (string, number, boolean, null or array).
struct JsonValue {
  enum Type { String, Number, Bool, Null, Array };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;
  std::vector<JsonValue> array_val;

  /// @brief Get value as integer, with default.
  int asInt(int default_val = 0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;

  /// @brief Get an array of numbers as integers (non-numbers are skipped).
  std::vector<int> asIntArray() const;

  bool isArray() const { return type == Array; }
};

/// @brief Parse a JSON object into a key-value map.
///
/// Only handles top-level keys. Nested objects are skipped.
///
/// @param json Pointer to JSON string.
/// @param length Length of JSON string.
/// @return Map of key-value pairs. Empty map on parse error.
std::map<std::string, JsonValue> parseJsonObject(const char* json, size_t length);

/// @brief Convenience overload for std::string input.
std::map<std::string, JsonValue> parseJsonObject(const std::string& json);

}  // namespace remi

#endif  // REMI_CORE_JSON_PARSER_H
