// Token decoder: rebuilds per-program notes and tempo / meter timelines
// from a REMI+ token sequence.

#ifndef REMI_TOKENIZER_TOKEN_DECODER_H
#define REMI_TOKENIZER_TOKEN_DECODER_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "tokenizer/token.h"
#include "tokenizer/tokenizer_config.h"

namespace remi {

/// Result of decoding one token sequence.
struct DecodeResult {
  std::vector<Track> tracks;  ///< One bucket per program, in order of first note.
  std::vector<TempoChange> tempo_changes;
  std::vector<TimeSignatureChange> time_signatures;
  Tick max_tick = 0;  ///< Maximum note end tick over all tracks.
  bool success = false;
  std::string error_message;
};

/// @brief Scan state of the decoder.
struct DecoderState {
  Tick current_tick = 0;
  int current_bar = -1;
  Tick bar_start_tick = 0;  ///< Start tick of current_bar.
  Tick ticks_per_bar = 0;
  Tick previous_note_end = 0;
  std::optional<int> last_tempo;             ///< Unset until a Tempo token is recorded.
  std::optional<TimeSignature> last_time_sig;  ///< Unset until a TimeSig token is recorded.
};

/// @brief Decodes REMI+ tokens back into notes and timelines.
///
/// Tolerant of generative output: unknown token types are no-ops and a
/// Pitch token without the surrounding Program / Velocity / Duration run
/// is dropped. Only malformed token text and unrepresentable time
/// signatures fail the decode.
class TokenDecoder {
 public:
  explicit TokenDecoder(const TokenizerConfig& config);

  /// @brief Decode typed tokens at the given time division.
  DecodeResult decode(const std::vector<Token>& tokens, uint16_t time_division) const;

  /// @brief Parse then decode "Type_Value" strings.
  DecodeResult decode(const std::vector<std::string>& tokens, uint16_t time_division) const;

 private:
  TokenizerConfig config_;

  /// Move to the next bar.
  void enterNextBar(DecoderState& state) const;

  /// Duration in ticks of a "beats.subdivision" payload.
  Tick durationTicks(int beats, int subdivision, uint16_t time_division) const;
};

}  // namespace remi

#endif  // REMI_TOKENIZER_TOKEN_DECODER_H
