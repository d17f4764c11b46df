/// @file
/// @brief Onset-grouping chord detector.

#include "tokenizer/chord_detector.h"

#include <algorithm>
#include <cstdlib>
#include <optional>

#include "tokenizer/vocabulary.h"

namespace remi {

namespace {

/// Widest interval between the lowest and highest chord note.
constexpr int kMaxChordSpan = 24;

}  // namespace

std::string chordQualityName(const std::vector<int>& intervals) {
  for (const auto& chord : chordTemplates()) {
    if (chord.intervals == intervals) return chord.name;
  }
  return {};
}

std::vector<ChordEvent> detectChords(const std::vector<Note>& notes, uint16_t time_division,
                                     const ChordDetectorOptions& options) {
  std::vector<Note> pitched;
  pitched.reserve(notes.size());
  for (const auto& note : notes) {
    if (!note.isDrum()) pitched.push_back(note);
  }

  std::vector<ChordEvent> chords;
  if (pitched.empty() || time_division == 0) return chords;

  const Tick onset_tolerance =
      time_division / static_cast<Tick>(std::max(options.onset_resolution, 1));
  const Tick half_beat = time_division / 2;
  const size_t group_limit = std::max<size_t>(options.max_simultaneous_notes, 1);

  std::optional<Tick> previous_tick;
  size_t count = 0;
  while (count < pitched.size()) {
    if (previous_tick && pitched[count].start_tick == *previous_tick) {
      ++count;
      continue;
    }

    // Notes starting around the same onset.
    const Note& first = pitched[count];
    std::vector<Note> onset;
    for (size_t idx = count; idx < pitched.size() && idx < count + group_limit; ++idx) {
      if (pitched[idx].start_tick > first.start_tick + onset_tolerance) break;
      onset.push_back(pitched[idx]);
    }

    bool ambiguous = std::any_of(onset.begin(), onset.end(), [&](const Note& note) {
      int64_t diff = static_cast<int64_t>(note.end_tick) - static_cast<int64_t>(first.end_tick);
      return std::llabs(diff) > static_cast<int64_t>(half_beat);
    });
    if (ambiguous) {
      count += onset.size();
      continue;
    }

    std::vector<Note> candidates;
    for (const auto& note : onset) {
      if (first.duration() <= half_beat && note.start_tick != first.start_tick) continue;
      candidates.push_back(note);
    }

    std::vector<Note> chord;
    for (const auto& note : candidates) {
      if (note.end_tick <= first.end_tick + half_beat) chord.push_back(note);
    }

    if (chord.size() >= 3 && chord.size() <= 5) {
      std::vector<int> intervals;
      for (const auto& note : chord) {
        intervals.push_back(static_cast<int>(note.pitch) - static_cast<int>(chord.front().pitch));
      }
      if (intervals.back() <= kMaxChordSpan) {
        std::string label = chordQualityName(intervals);
        if (label.empty()) {
          if (options.known_only) {
            count += onset.size();
            continue;
          }
          label = std::to_string(chord.size());
        }
        Tick tick = chord.front().start_tick;
        for (const auto& note : chord) tick = std::min(tick, note.start_tick);
        chords.push_back({tick, label});
      }
    }

    Tick last_start = first.start_tick;
    for (const auto& note : onset) last_start = std::max(last_start, note.start_tick);
    previous_tick = last_start;
    count += onset.size();
  }
  return chords;
}

}  // namespace remi
