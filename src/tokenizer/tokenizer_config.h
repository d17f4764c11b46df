// Tokenizer configuration and the tables derived from it (durations,
// velocities, tempos, time signatures).

#ifndef REMI_TOKENIZER_TOKENIZER_CONFIG_H
#define REMI_TOKENIZER_TOKENIZER_CONFIG_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace remi {

/// @brief Sampling resolution for a range of beats: [beat_start, beat_end)
/// is sampled with `resolution` positions per beat.
struct BeatResolution {
  int beat_start = 0;
  int beat_end = 4;
  int resolution = 8;
};

/// @brief One entry of the duration table, labelled "beats.subdivision".
///
/// The subdivision counts samples at the resolution of the beat range the
/// bin was generated from.
struct DurationBin {
  int beats = 0;
  int subdivision = 0;
  int resolution = 1;

  /// @brief Representative length of the bin at a given time division.
  Tick ticks(uint16_t time_division) const;

  /// @brief Token value, e.g. "1.4".
  std::string label() const;
};

/// @brief Bounds of the supported time signatures.
///
/// Denominators are powers of two up to max_denominator; numerators range
/// over [1, denominator * max_bar_beats].
struct TimeSignatureRange {
  int max_denominator = 8;
  int max_bar_beats = 2;
};

/// @brief Configuration of the REMI+ tokenizer.
///
/// Every table the encoder, decoder and vocabulary share is derived from
/// this struct, so two tokenizers built from equal configs agree on every
/// token.
struct TokenizerConfig {
  int pitch_min = 21;   ///< Lowest encoded pitch (inclusive).
  int pitch_max = 108;  ///< Highest encoded pitch (inclusive).
  std::vector<BeatResolution> beat_res = {{0, 4, 8}, {4, 12, 4}};
  int nb_velocities = 32;

  // Optional token families. Program tokens are always present.
  bool use_chords = false;
  bool use_rests = false;  ///< Not emitted by REMI+; Rest tokens are still decoded.
  bool use_tempos = false;
  bool use_time_signatures = false;

  int nb_tempos = 32;
  int tempo_min = 40;
  int tempo_max = 250;
  TimeSignatureRange time_signature_range;

  /// Number of distinct Bar tokens (Bar_0 .. Bar_{n-1}); 0 = unbounded (Bar_None).
  int num_bars = 0;

  /// Special tokens placed first in the vocabulary, as "NAME_None".
  std::vector<std::string> special_tokens = {"PAD", "BOS", "EOS", "MASK"};

  /// Chord detection keeps only chords matching a known quality.
  bool chords_known_only = false;

  /// Decoder adopts the bar length of decoded TimeSig tokens.
  bool resync_ticks_per_bar = false;

  /// @brief Highest resolution of the beat-resolution table.
  int maxResolution() const;

  /// @brief Resolution of the first beat range (chord onset tolerance).
  int firstResolution() const;

  /// @brief Resolution of the beat range containing `beats`.
  /// Beats past the last range use the last range's resolution.
  int resolutionForBeat(int beats) const;

  /// @brief Ticks per position sample: time_division / maxResolution().
  Tick ticksPerSample(uint16_t time_division) const;

  /// @brief True if the time division is a multiple of maxResolution().
  bool supportsTimeDivision(uint16_t time_division) const;

  bool barsUnbounded() const { return num_bars <= 0; }

  /// @brief Number of Position tokens (4 beats at max resolution).
  int positionCount() const { return maxResolution() * 4; }

  /// @brief Ascending duration table. The zero-length bin is excluded.
  std::vector<DurationBin> durationBins() const;

  /// @brief Velocity bins: floor(k * 127 / nb_velocities), k = 1..n.
  std::vector<int> velocityBins() const;

  /// @brief Tempo bins: nb_tempos integers evenly spaced over [tempo_min, tempo_max].
  std::vector<int> tempoBins() const;

  /// @brief Supported (reduced) time signatures, ordered by denominator then numerator.
  std::vector<TimeSignature> timeSignatures() const;

  /// @brief Check the configuration for consistency.
  /// @param error Receives a description of the first problem found.
  /// @return True if the configuration is usable.
  bool validate(std::string& error) const;
};

/// @brief Reduce a time signature to a supported one.
///
/// Rule: a denominator that is not a power of two is rounded down to the
/// nearest power of two; then, while the denominator exceeds the maximum
/// and the numerator is even, both are halved. The result must satisfy
/// denominator <= max_denominator and 1 <= numerator <= denominator *
/// max_bar_beats.
///
/// @return The reduced signature, or nullopt if it cannot be represented.
std::optional<TimeSignature> reduceTimeSignature(int numerator, int denominator,
                                                 const TimeSignatureRange& range);

/// @brief Index of the nearest value in an ascending table.
///
/// Ties resolve to the lowest index. Returns 0 for an empty table.
size_t nearestIndex(const std::vector<int>& table, int64_t value);

/// @brief Index of the duration bin closest to `duration` ticks.
/// Ties resolve to the lowest index.
size_t nearestDurationBin(const std::vector<Tick>& bin_ticks, Tick duration);

}  // namespace remi

#endif  // REMI_TOKENIZER_TOKENIZER_CONFIG_H
