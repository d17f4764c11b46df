// Typed tokens and their canonical "Type_Value" text form.

#ifndef REMI_TOKENIZER_TOKEN_H
#define REMI_TOKENIZER_TOKEN_H

#include <cstdint>
#include <string>
#include <vector>

namespace remi {

/// Token families of the REMI+ alphabet.
enum class TokenType : uint8_t {
  Bar,
  Position,
  Program,
  Pitch,
  Velocity,
  Duration,
  TimeSig,
  Tempo,
  Chord,
  Rest,
  Special,  ///< PAD / BOS / EOS / MASK and other "NAME_None" markers.
  Unknown   ///< Type name not part of this encoding (decoded as a no-op).
};

/// Bar value carried by Bar_None when the bar count is unbounded.
constexpr int kUnboundedBar = -1;

/// @brief A parsed token: a type plus its payload.
///
/// Scalar families store their value in `value`. Pair-valued families
/// (Duration and Rest "beats.subdivision", TimeSig "numerator/denominator")
/// use `value` and `second`. Chord, Special and Unknown tokens keep their
/// payload text in `text`.
struct Token {
  TokenType type = TokenType::Unknown;
  int value = 0;
  int second = 0;
  std::string text;

  static Token bar(int index) { return {TokenType::Bar, index, 0, {}}; }
  static Token position(int index) { return {TokenType::Position, index, 0, {}}; }
  static Token program(int program) { return {TokenType::Program, program, 0, {}}; }
  static Token pitch(int pitch) { return {TokenType::Pitch, pitch, 0, {}}; }
  static Token velocity(int velocity) { return {TokenType::Velocity, velocity, 0, {}}; }
  static Token duration(int beats, int subdivision) {
    return {TokenType::Duration, beats, subdivision, {}};
  }
  static Token rest(int beats, int subdivision) {
    return {TokenType::Rest, beats, subdivision, {}};
  }
  static Token timeSig(int numerator, int denominator) {
    return {TokenType::TimeSig, numerator, denominator, {}};
  }
  static Token tempo(int tempo) { return {TokenType::Tempo, tempo, 0, {}}; }
  static Token chord(const std::string& label) { return {TokenType::Chord, 0, 0, label}; }
  static Token special(const std::string& name) { return {TokenType::Special, 0, 0, name}; }

  bool operator==(const Token& other) const {
    return type == other.type && value == other.value && second == other.second &&
           text == other.text;
  }
  bool operator!=(const Token& other) const { return !(*this == other); }
};

/// @brief Name of a token family as written before the underscore.
/// Special and Unknown have no fixed name and return "Special" / "Unknown".
const char* tokenTypeToString(TokenType type);

/// @brief Parse a token family name ("Bar", "TimeSig", ...).
/// @return Matching type, TokenType::Unknown for anything else.
TokenType tokenTypeFromString(const std::string& name);

/// @brief Canonical text of a token, e.g. "Pitch_60", "Duration_1.4", "Bar_None".
std::string formatToken(const Token& token);

/// @brief Parse a "Type_Value" string into a typed token.
///
/// The type is the text before the first underscore. Known families must
/// carry a well-formed payload: a malformed number is a format error.
/// Names listed in `special_names` with a "None" payload parse as Special;
/// other unrecognized names parse as Unknown with their payload kept.
///
/// @param text Token string.
/// @param out Receives the parsed token.
/// @param error Receives a message when parsing fails.
/// @param special_names Special token names (without the "_None" suffix).
/// @return False on a format error.
bool parseToken(const std::string& text, Token& out, std::string& error,
                const std::vector<std::string>& special_names = {});

/// @brief Parse a whole sequence, stopping at the first format error.
/// @param error Receives "token N: message" for the failing token.
bool parseTokens(const std::vector<std::string>& texts, std::vector<Token>& out,
                 std::string& error, const std::vector<std::string>& special_names = {});

/// @brief Format a whole sequence.
std::vector<std::string> formatTokens(const std::vector<Token>& tokens);

}  // namespace remi

#endif  // REMI_TOKENIZER_TOKEN_H
