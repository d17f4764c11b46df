// Chord detection over simultaneous onsets for Chord tokens.

#ifndef REMI_TOKENIZER_CHORD_DETECTOR_H
#define REMI_TOKENIZER_CHORD_DETECTOR_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace remi {

/// Options of the chord detector.
struct ChordDetectorOptions {
  int onset_resolution = 8;  ///< Onsets within one sample at this resolution group together.
  bool known_only = false;   ///< Drop chords that match no quality template.
  size_t max_simultaneous_notes = 20;
};

/// @brief Match an interval set against the quality templates.
/// @param intervals Semitones above the lowest note, ascending, starting at 0.
/// @return Quality name ("maj", "7dom", ...) or an empty string.
std::string chordQualityName(const std::vector<int>& intervals);

/// @brief Detect chords in a note list.
///
/// Notes are grouped by onset: notes starting within one onset sample of
/// the group's first note. A group whose note ends disagree by more than
/// half a beat is ambiguous and skipped. A short first note (half a beat or
/// less) restricts the group to notes sharing its exact start. Notes ending
/// within half a beat of the first form the chord, which is kept when it
/// has 3 to 5 notes spanning at most two octaves.
///
/// @param notes Notes sorted by (start_tick, pitch). Drum notes are ignored.
/// @param time_division Ticks per quarter note.
/// @param options Detection options.
/// @return Chord events at the earliest onset of each chord, in tick order.
std::vector<ChordEvent> detectChords(const std::vector<Note>& notes, uint16_t time_division,
                                     const ChordDetectorOptions& options = {});

}  // namespace remi

#endif  // REMI_TOKENIZER_CHORD_DETECTOR_H
