// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach. Used for tokenizer
// config files and token files. Parsing lives in core/json_parser.h.

#ifndef REMI_CORE_JSON_HELPERS_H
#define REMI_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace remi {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("time_division");
///   writer.value(480);
///   writer.key("tokens");
///   writer.stringArray({"Bar_None", "Position_0"});
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"time_division":480,"tokens":["Bar_None","Position_0"]}
/// @endcode
///
/// Tracks comma insertion automatically. Does not validate structure
/// (caller must match begin/end pairs).
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);
  void value(const char* val) { value(std::string_view(val)); }
  void value(int val);
  void value(bool val);

  /// @brief Write an array of integers.
  void intArray(const std::vector<int>& values);

  /// @brief Write an array of strings.
  void stringArray(const std::vector<std::string>& values);

  /// @brief Get the accumulated JSON string.
  std::string toString() const { return buffer_; }

  /// @brief Get the JSON string with one object member per line.
  ///
  /// Arrays of scalars stay on a single line so token lists remain compact.
  /// @param indent_size Number of spaces per indent level (default: 2).
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Write a comma if needed before the next value/key.
  void maybeComma();

  /// Mark the current container as holding at least one element.
  void markWritten();

  /// Escape special characters in a string for JSON output.
  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open container: true once it holds an element.
  std::vector<bool> needs_comma_;
};

}  // namespace remi

#endif  // REMI_CORE_JSON_HELPERS_H
