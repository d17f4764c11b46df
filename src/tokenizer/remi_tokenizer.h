// REMI+ tokenizer facade: score <-> tokens <-> ids.

#ifndef REMI_TOKENIZER_REMI_TOKENIZER_H
#define REMI_TOKENIZER_REMI_TOKENIZER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "tokenizer/token_decoder.h"
#include "tokenizer/tokenizer_config.h"
#include "tokenizer/type_graph.h"
#include "tokenizer/vocabulary.h"

namespace remi {

/// Result of tokenizing a score.
struct TokenizeResult {
  std::vector<std::string> tokens;
  std::vector<int> ids;  ///< kUnknownTokenId for tokens outside the vocabulary.
  bool success = false;
  std::string error_message;
};

/// Result of detokenizing back into a score.
struct DetokenizeResult {
  Score score;
  bool success = false;
  std::string error_message;
};

/// @brief REMI+ tokenizer: preprocessing, chord detection, encoding,
/// vocabulary lookup and decoding behind one object.
///
/// Rest tokens are never emitted by this encoding; a config requesting
/// them is accepted with a warning and rests are turned off.
class RemiTokenizer {
 public:
  explicit RemiTokenizer(const TokenizerConfig& config);

  const TokenizerConfig& config() const { return config_; }
  const Vocabulary& vocabulary() const { return vocab_; }
  const TypeGraph& typeGraph() const { return graph_; }

  /// @brief Tokenize all tracks of a score into one merged sequence.
  ///
  /// Fails on an unsupported time division, or when a token falls outside
  /// the vocabulary (e.g. more bars than num_bars); tokens and ids are
  /// still filled in the latter case.
  TokenizeResult tokenize(const Score& score) const;

  /// @brief Decode token strings into a score at the given time division.
  DetokenizeResult detokenize(const std::vector<std::string>& tokens,
                              uint16_t time_division) const;

  /// @brief Decode vocabulary ids into a score.
  DetokenizeResult detokenizeIds(const std::vector<int>& ids, uint16_t time_division) const;

  /// @brief Grammar check of a token sequence.
  ///
  /// Tokens that fail to parse count as Unknown, so every transition into
  /// or out of them is a type error.
  TypeCheckReport tokenErrors(const std::vector<std::string>& tokens) const;

 private:
  TokenizerConfig config_;
  Vocabulary vocab_;
  TypeGraph graph_;
};

}  // namespace remi

#endif  // REMI_TOKENIZER_REMI_TOKENIZER_H
