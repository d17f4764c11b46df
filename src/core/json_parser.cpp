// Implementation of the minimal JSON object parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdlib>

namespace remi {

int JsonValue::asInt(int default_val) const {
  if (type == Number) return static_cast<int>(number_val);
  return default_val;
}

bool JsonValue::asBool(bool default_val) const {
  if (type == Bool) return bool_val;
  return default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

std::vector<int> JsonValue::asIntArray() const {
  std::vector<int> result;
  if (type != Array) return result;
  for (const auto& item : array_val) {
    if (item.type == Number) result.push_back(static_cast<int>(item.number_val));
  }
  return result;
}

namespace {

/// @brief Skip whitespace in JSON string.
void skipWhitespace(const char* json, size_t length, size_t& pos) {
  while (pos < length && std::isspace(static_cast<unsigned char>(json[pos]))) {
    ++pos;
  }
}

/// @brief Parse a JSON string literal (expects pos at opening quote).
/// @return Parsed string, pos advanced past closing quote.
std::string parseString(const char* json, size_t length, size_t& pos) {
  if (pos >= length || json[pos] != '"') return "";
  ++pos;  // skip opening quote

  std::string result;
  while (pos < length && json[pos] != '"') {
    if (json[pos] == '\\' && pos + 1 < length) {
      ++pos;
      switch (json[pos]) {
        case '"':  result += '"'; break;
        case '\\': result += '\\'; break;
        case '/':  result += '/'; break;
        case 'n':  result += '\n'; break;
        case 't':  result += '\t'; break;
        case 'r':  result += '\r'; break;
        default:   result += json[pos]; break;
      }
    } else {
      result += json[pos];
    }
    ++pos;
  }

  if (pos < length) ++pos;  // skip closing quote
  return result;
}

/// @brief Parse a JSON number (integer, fraction, exponent).
JsonValue parseNumber(const char* json, size_t length, size_t& pos) {
  JsonValue val;
  val.type = JsonValue::Number;

  size_t start = pos;
  if (pos < length && (json[pos] == '-' || json[pos] == '+')) ++pos;
  while (pos < length && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
  if (pos < length && json[pos] == '.') {
    ++pos;
    while (pos < length && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
  }
  if (pos < length && (json[pos] == 'e' || json[pos] == 'E')) {
    ++pos;
    if (pos < length && (json[pos] == '-' || json[pos] == '+')) ++pos;
    while (pos < length && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
  }

  std::string num_str(json + start, pos - start);
  val.number_val = std::strtod(num_str.c_str(), nullptr);
  return val;
}

/// @brief Skip a nested object (we don't parse objects below the top level).
void skipObject(const char* json, size_t length, size_t& pos) {
  int depth = 1;
  ++pos;  // skip '{'
  while (pos < length && depth > 0) {
    if (json[pos] == '"') {
      parseString(json, length, pos);
      continue;
    }
    if (json[pos] == '{') ++depth;
    if (json[pos] == '}') --depth;
    ++pos;
  }
}

/// @brief Parse any supported value at pos. Objects yield a Null value.
JsonValue parseValue(const char* json, size_t length, size_t& pos) {
  JsonValue val;
  skipWhitespace(json, length, pos);
  if (pos >= length) return val;

  char chr = json[pos];
  if (chr == '"') {
    val.type = JsonValue::String;
    val.string_val = parseString(json, length, pos);
  } else if (chr == 't' || chr == 'f') {
    val.type = JsonValue::Bool;
    val.bool_val = (chr == 't');
    pos += val.bool_val ? 4 : 5;  // skip "true" / "false"
  } else if (chr == 'n') {
    pos += 4;  // skip "null"
  } else if (chr == '[') {
    val.type = JsonValue::Array;
    ++pos;  // skip '['
    while (pos < length) {
      skipWhitespace(json, length, pos);
      if (pos >= length) break;
      if (json[pos] == ']') {
        ++pos;
        break;
      }
      if (json[pos] == ',') {
        ++pos;
        continue;
      }
      size_t before = pos;
      val.array_val.push_back(parseValue(json, length, pos));
      if (pos == before) ++pos;  // unknown character, avoid spinning
    }
  } else if (chr == '{') {
    skipObject(json, length, pos);
  } else {
    val = parseNumber(json, length, pos);
  }
  return val;
}

}  // namespace

std::map<std::string, JsonValue> parseJsonObject(const char* json, size_t length) {
  std::map<std::string, JsonValue> result;
  if (!json || length == 0) return result;

  size_t pos = 0;
  skipWhitespace(json, length, pos);
  if (pos >= length || json[pos] != '{') return result;
  ++pos;  // skip '{'

  while (pos < length) {
    skipWhitespace(json, length, pos);
    if (pos >= length || json[pos] == '}') break;

    // Skip comma between entries
    if (json[pos] == ',') {
      ++pos;
      skipWhitespace(json, length, pos);
    }

    if (pos >= length || json[pos] == '}') break;

    // Parse key
    if (json[pos] != '"') break;
    std::string key = parseString(json, length, pos);

    // Skip colon
    skipWhitespace(json, length, pos);
    if (pos >= length || json[pos] != ':') break;
    ++pos;
    skipWhitespace(json, length, pos);

    if (pos >= length) break;

    bool is_object = json[pos] == '{';
    JsonValue val = parseValue(json, length, pos);
    if (!is_object) {
      result[key] = val;
    }
  }

  return result;
}

std::map<std::string, JsonValue> parseJsonObject(const std::string& json) {
  return parseJsonObject(json.data(), json.size());
}

}  // namespace remi
