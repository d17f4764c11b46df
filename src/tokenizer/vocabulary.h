// Vocabulary builder: the finite REMI+ token alphabet and id mapping.

#ifndef REMI_TOKENIZER_VOCABULARY_H
#define REMI_TOKENIZER_VOCABULARY_H

#include <string>
#include <unordered_map>
#include <vector>

#include "tokenizer/tokenizer_config.h"

namespace remi {

/// Chord quality templates: intervals above the lowest note.
struct ChordTemplate {
  const char* name;
  std::vector<int> intervals;
};

/// @brief Named chord qualities, in vocabulary order.
const std::vector<ChordTemplate>& chordTemplates();

/// Smallest and largest note count of an unrecognized chord ("Chord_3".."Chord_5").
constexpr int kMinChordNotes = 3;
constexpr int kMaxChordNotes = 5;

/// @brief Enumerate the base vocabulary from configuration.
///
/// Order: Bar, Pitch, Velocity, Duration, Position, TimeSig (optional),
/// Chord (optional), Tempo (optional), Program. Pure function of the
/// config; identical configs produce identical lists.
std::vector<std::string> buildBaseVocabulary(const TokenizerConfig& config);

/// Id returned for tokens outside the vocabulary.
constexpr int kUnknownTokenId = -1;

/// @brief Token <-> id mapping: special tokens first, then the base vocabulary.
class Vocabulary {
 public:
  explicit Vocabulary(const TokenizerConfig& config);

  size_t size() const { return tokens_.size(); }

  /// @brief All tokens in id order.
  const std::vector<std::string>& tokens() const { return tokens_; }

  /// @brief Id of a token, or kUnknownTokenId.
  int tokenToId(const std::string& token) const;

  /// @brief Token text of an id, or an empty string if out of range.
  std::string idToToken(int id) const;

  bool contains(const std::string& token) const { return tokenToId(token) != kUnknownTokenId; }

  /// @brief Map a token sequence to ids.
  /// @param error Receives the first token missing from the vocabulary.
  /// @return False if any token is unknown (ids of known tokens are still filled,
  ///         unknown ones as kUnknownTokenId).
  bool encodeIds(const std::vector<std::string>& tokens, std::vector<int>& ids,
                 std::string& error) const;

  /// @brief Map ids back to token texts.
  /// @param error Receives the first out-of-range id.
  bool decodeIds(const std::vector<int>& ids, std::vector<std::string>& tokens,
                 std::string& error) const;

 private:
  std::vector<std::string> tokens_;
  std::unordered_map<std::string, int> index_;
};

}  // namespace remi

#endif  // REMI_TOKENIZER_VOCABULARY_H
