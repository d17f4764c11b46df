#pragma once

#include <cstddef>
#include <cstdint>

#include "core/basic_types.h"

namespace test_helpers {

/// @brief Count total notes across all tracks of a result.
/// @tparam Result Any type with a `tracks` member where each track has a `notes` member.
template <typename Result>
size_t totalNoteCount(const Result& result) {
  size_t count = 0;
  for (const auto& track : result.tracks) count += track.notes.size();
  return count;
}

/// @brief Build a note from start and duration.
inline remi::Note makeNote(uint8_t pitch, remi::Tick start, remi::Tick duration,
                           uint8_t velocity = 100, int program = 0) {
  remi::Note note;
  note.pitch = pitch;
  note.velocity = velocity;
  note.start_tick = start;
  note.end_tick = start + duration;
  note.program = program;
  return note;
}

}  // namespace test_helpers
