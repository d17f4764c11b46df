// Implementation of the basic note / score helpers.

#include "core/basic_types.h"

#include <algorithm>

namespace remi {

bool operator==(const Note& lhs, const Note& rhs) {
  return lhs.pitch == rhs.pitch && lhs.velocity == rhs.velocity &&
         lhs.start_tick == rhs.start_tick && lhs.end_tick == rhs.end_tick &&
         lhs.program == rhs.program;
}

size_t Score::noteCount() const {
  size_t count = 0;
  for (const auto& track : tracks) count += track.notes.size();
  return count;
}

void Score::updateMaxTick() {
  max_tick = 0;
  for (const auto& track : tracks) {
    for (const auto& note : track.notes) {
      max_tick = std::max(max_tick, note.end_tick);
    }
  }
}

void sortNotes(std::vector<Note>& notes) {
  std::stable_sort(notes.begin(), notes.end(), [](const Note& lhs, const Note& rhs) {
    if (lhs.start_tick != rhs.start_tick) return lhs.start_tick < rhs.start_tick;
    return lhs.pitch < rhs.pitch;
  });
}

std::string timeSignatureToString(const TimeSignature& time_sig) {
  return std::to_string(time_sig.numerator) + "/" + std::to_string(time_sig.denominator);
}

}  // namespace remi
