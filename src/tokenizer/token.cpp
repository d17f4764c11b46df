/// @file
/// @brief Token text formatting and the typed parse step.

#include "tokenizer/token.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <utility>

namespace remi {

namespace {

constexpr const char* kNonePayload = "None";

/// @brief Strict integer parse: the whole string must be a base-10 integer.
bool parseInt(const std::string& text, int& out) {
  if (text.empty()) return false;
  const char* begin = text.c_str();
  char* end = nullptr;
  errno = 0;
  long parsed = std::strtol(begin, &end, 10);
  if (errno != 0 || end == begin || *end != '\0') return false;
  if (parsed < INT_MIN || parsed > INT_MAX) return false;
  out = static_cast<int>(parsed);
  return true;
}

/// @brief Parse "a<sep>b" into two integers.
bool parseIntPair(const std::string& text, char sep, int& first, int& second) {
  size_t split = text.find(sep);
  if (split == std::string::npos) return false;
  return parseInt(text.substr(0, split), first) && parseInt(text.substr(split + 1), second);
}

}  // namespace

const char* tokenTypeToString(TokenType type) {
  switch (type) {
    case TokenType::Bar:      return "Bar";
    case TokenType::Position: return "Position";
    case TokenType::Program:  return "Program";
    case TokenType::Pitch:    return "Pitch";
    case TokenType::Velocity: return "Velocity";
    case TokenType::Duration: return "Duration";
    case TokenType::TimeSig:  return "TimeSig";
    case TokenType::Tempo:    return "Tempo";
    case TokenType::Chord:    return "Chord";
    case TokenType::Rest:     return "Rest";
    case TokenType::Special:  return "Special";
    case TokenType::Unknown:  return "Unknown";
  }
  return "Unknown";
}

TokenType tokenTypeFromString(const std::string& name) {
  if (name == "Bar") return TokenType::Bar;
  if (name == "Position") return TokenType::Position;
  if (name == "Program") return TokenType::Program;
  if (name == "Pitch") return TokenType::Pitch;
  if (name == "Velocity") return TokenType::Velocity;
  if (name == "Duration") return TokenType::Duration;
  if (name == "TimeSig") return TokenType::TimeSig;
  if (name == "Tempo") return TokenType::Tempo;
  if (name == "Chord") return TokenType::Chord;
  if (name == "Rest") return TokenType::Rest;
  return TokenType::Unknown;
}

std::string formatToken(const Token& token) {
  switch (token.type) {
    case TokenType::Bar:
      if (token.value == kUnboundedBar) return "Bar_None";
      return "Bar_" + std::to_string(token.value);
    case TokenType::Duration:
    case TokenType::Rest:
      return std::string(tokenTypeToString(token.type)) + "_" + std::to_string(token.value) +
             "." + std::to_string(token.second);
    case TokenType::TimeSig:
      return "TimeSig_" + std::to_string(token.value) + "/" + std::to_string(token.second);
    case TokenType::Chord:
      return "Chord_" + token.text;
    case TokenType::Special:
      return token.text + "_" + kNonePayload;
    case TokenType::Unknown:
      return token.text;
    default:
      return std::string(tokenTypeToString(token.type)) + "_" + std::to_string(token.value);
  }
}

bool parseToken(const std::string& text, Token& out, std::string& error,
                const std::vector<std::string>& special_names) {
  out = Token{};
  size_t split = text.find('_');
  if (split == std::string::npos) {
    out.type = TokenType::Unknown;
    out.text = text;
    return true;
  }
  std::string name = text.substr(0, split);
  std::string payload = text.substr(split + 1);

  out.type = tokenTypeFromString(name);
  switch (out.type) {
    case TokenType::Bar:
      if (payload == kNonePayload) {
        out.value = kUnboundedBar;
        return true;
      }
      break;
    case TokenType::Duration:
    case TokenType::Rest:
      if (parseIntPair(payload, '.', out.value, out.second)) return true;
      error = "Malformed " + name + " value '" + payload + "' (expected beats.subdivision)";
      return false;
    case TokenType::TimeSig:
      if (parseIntPair(payload, '/', out.value, out.second) && out.second > 0) return true;
      error = "Malformed TimeSig value '" + payload + "' (expected numerator/denominator)";
      return false;
    case TokenType::Chord:
      if (payload.empty()) {
        error = "Empty Chord value";
        return false;
      }
      out.text = payload;
      return true;
    case TokenType::Unknown:
      for (const auto& special : special_names) {
        if (name == special && payload == kNonePayload) {
          out.type = TokenType::Special;
          out.text = name;
          return true;
        }
      }
      out.text = text;
      return true;
    default:
      break;
  }

  if (!parseInt(payload, out.value)) {
    error = "Malformed " + name + " value '" + payload + "' (expected an integer)";
    return false;
  }
  return true;
}

bool parseTokens(const std::vector<std::string>& texts, std::vector<Token>& out,
                 std::string& error, const std::vector<std::string>& special_names) {
  out.clear();
  out.reserve(texts.size());
  for (size_t idx = 0; idx < texts.size(); ++idx) {
    Token token;
    std::string token_error;
    if (!parseToken(texts[idx], token, token_error, special_names)) {
      error = "token " + std::to_string(idx) + ": " + token_error;
      return false;
    }
    out.push_back(std::move(token));
  }
  return true;
}

std::vector<std::string> formatTokens(const std::vector<Token>& tokens) {
  std::vector<std::string> texts;
  texts.reserve(tokens.size());
  for (const auto& token : tokens) texts.push_back(formatToken(token));
  return texts;
}

}  // namespace remi
