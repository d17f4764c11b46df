// Basic types shared by the REMI+ tokenizer: notes, tracks, tempo and meter.

#ifndef REMI_CORE_BASIC_TYPES_H
#define REMI_CORE_BASIC_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

namespace remi {

/// Tick type for MIDI timing (absolute tick position).
using Tick = uint32_t;

/// Program value used for the drum / percussion bucket.
constexpr int kDrumProgram = -1;

/// MIDI channel (0-based) reserved for percussion by General MIDI.
constexpr uint8_t kDrumChannel = 9;

/// Defaults applied when a piece carries no explicit tempo or meter.
constexpr int kDefaultTempo = 120;
constexpr uint8_t kDefaultNumerator = 4;
constexpr uint8_t kDefaultDenominator = 4;

/// Default time division (ticks per quarter note) for decoded output.
constexpr uint16_t kDefaultTimeDivision = 384;

// ---------------------------------------------------------------------------
// Notes and tracks
// ---------------------------------------------------------------------------

/// Note event -- immutable input of the encoder, output of the decoder.
struct Note {
  uint8_t pitch = 60;
  uint8_t velocity = 100;
  Tick start_tick = 0;
  Tick end_tick = 0;
  int program = 0;  ///< GM program [0,127], kDrumProgram for percussion.

  /// @brief Length of the note in ticks (0 for malformed notes).
  Tick duration() const { return end_tick > start_tick ? end_tick - start_tick : 0; }

  bool isDrum() const { return program == kDrumProgram; }
};

bool operator==(const Note& lhs, const Note& rhs);

/// Track: one program bucket of notes.
struct Track {
  int program = 0;  ///< kDrumProgram for the drum bucket.
  std::string name;
  std::vector<Note> notes;

  bool isDrum() const { return program == kDrumProgram; }
};

// ---------------------------------------------------------------------------
// Tempo / meter timelines
// ---------------------------------------------------------------------------

/// Tempo change in quarter notes per minute.
struct TempoChange {
  double tempo = kDefaultTempo;
  Tick tick = 0;
};

/// Time signature value (numerator / denominator).
struct TimeSignature {
  uint8_t numerator = kDefaultNumerator;
  uint8_t denominator = kDefaultDenominator;

  /// @brief Ticks per bar as used for bar/position accounting.
  ///
  /// Bars span `time_division * numerator`: the denominator does not scale
  /// the bar length in this representation.
  Tick ticksPerBar(uint16_t time_division) const {
    return static_cast<Tick>(time_division) * numerator;
  }

  bool operator==(const TimeSignature& other) const {
    return numerator == other.numerator && denominator == other.denominator;
  }
  bool operator!=(const TimeSignature& other) const { return !(*this == other); }
};

/// Time signature change at a tick position.
struct TimeSignatureChange {
  TimeSignature time_sig;
  Tick tick = 0;
};

/// Chord event supplied by the chord detector.
struct ChordEvent {
  Tick tick = 0;
  std::string label;  ///< Quality name ("maj", "7dom", ...) or note count ("3").
};

// ---------------------------------------------------------------------------
// Score
// ---------------------------------------------------------------------------

/// Complete symbolic piece: tracks plus global timelines.
struct Score {
  uint16_t time_division = kDefaultTimeDivision;  ///< Ticks per quarter note.
  std::vector<Track> tracks;
  std::vector<TempoChange> tempo_changes;
  std::vector<TimeSignatureChange> time_signatures;
  Tick max_tick = 0;  ///< Maximum note end tick over all tracks.

  /// @brief Total number of notes across tracks.
  size_t noteCount() const;

  /// @brief Recompute max_tick from the notes.
  void updateMaxTick();
};

/// @brief Sort notes by (start_tick, pitch), keeping the relative order of ties.
void sortNotes(std::vector<Note>& notes);

/// @brief Human-readable "num/den" form of a time signature.
std::string timeSignatureToString(const TimeSignature& time_sig);

}  // namespace remi

#endif  // REMI_CORE_BASIC_TYPES_H
