// Score preprocessing: fits notes, tempos and meters onto the token grid
// before encoding.

#ifndef REMI_TOKENIZER_PREPROCESS_H
#define REMI_TOKENIZER_PREPROCESS_H

#include <string>
#include <vector>

#include "core/basic_types.h"
#include "tokenizer/tokenizer_config.h"

namespace remi {

/// @brief Round a tick to the nearest multiple of `grid` (halves round up).
Tick quantizeTick(Tick tick, Tick grid);

/// @brief Quantize, filter and deduplicate the notes of one track.
///
/// Drops notes outside the pitch range, rounds start and end to the
/// position grid (a note collapsing to zero length is extended by one
/// sample), snaps velocities to the nearest bin, sorts by (start, pitch)
/// and removes notes repeating the pitch, start and end of an earlier one.
void preprocessNotes(std::vector<Note>& notes, const TokenizerConfig& config,
                     uint16_t time_division);

/// @brief Snap tempos to the tempo bins and their ticks to the grid.
///
/// Changes landing on the same tick keep the last one; consecutive
/// changes with the same tempo are merged into the first.
void preprocessTempos(std::vector<TempoChange>& tempos, const TokenizerConfig& config,
                      uint16_t time_division);

/// @brief Reduce time signatures and anchor them to bar boundaries.
///
/// Unsupported signatures are dropped with a warning. Each change is
/// delayed to the next bar boundary of the prevailing signature; a change
/// landing on the tick of the previous one replaces it, and consecutive
/// duplicates are removed.
void preprocessTimeSignatures(std::vector<TimeSignatureChange>& time_sigs,
                              const TokenizerConfig& config, uint16_t time_division);

/// @brief Run the whole preprocessing chain in place.
///
/// Empty tracks are removed and max_tick is recomputed.
/// @param error Receives a message when the time division is unusable.
/// @return False if the score cannot be placed on the grid.
bool preprocessScore(Score& score, const TokenizerConfig& config, std::string& error);

}  // namespace remi

#endif  // REMI_TOKENIZER_PREPROCESS_H
