/// @file
/// @brief Score preprocessing implementation.

#include "tokenizer/preprocess.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace remi {

Tick quantizeTick(Tick tick, Tick grid) {
  if (grid <= 1) return tick;
  return (tick + grid / 2) / grid * grid;
}

void preprocessNotes(std::vector<Note>& notes, const TokenizerConfig& config,
                     uint16_t time_division) {
  const Tick ticks_per_sample = config.ticksPerSample(time_division);
  const std::vector<int> velocities = config.velocityBins();

  std::vector<Note> kept;
  kept.reserve(notes.size());
  for (Note note : notes) {
    if (note.pitch < config.pitch_min || note.pitch > config.pitch_max) continue;

    note.start_tick = quantizeTick(note.start_tick, ticks_per_sample);
    note.end_tick = quantizeTick(note.end_tick, ticks_per_sample);
    if (note.end_tick <= note.start_tick) note.end_tick = note.start_tick + ticks_per_sample;

    if (!velocities.empty()) {
      note.velocity = static_cast<uint8_t>(velocities[nearestIndex(velocities, note.velocity)]);
    }
    kept.push_back(note);
  }

  sortNotes(kept);

  // Duplicates sort next to each other only when they share start and
  // pitch, so compare against every note of the same onset.
  std::vector<Note> unique;
  unique.reserve(kept.size());
  for (const auto& note : kept) {
    bool duplicate = false;
    for (auto iter = unique.rbegin(); iter != unique.rend(); ++iter) {
      if (iter->start_tick != note.start_tick) break;
      if (iter->pitch == note.pitch && iter->end_tick == note.end_tick) {
        duplicate = true;
        break;
      }
    }
    if (!duplicate) unique.push_back(note);
  }
  notes.swap(unique);
}

void preprocessTempos(std::vector<TempoChange>& tempos, const TokenizerConfig& config,
                      uint16_t time_division) {
  const Tick ticks_per_sample = config.ticksPerSample(time_division);
  const std::vector<int> bins = config.tempoBins();

  std::stable_sort(tempos.begin(), tempos.end(),
                   [](const TempoChange& lhs, const TempoChange& rhs) {
                     return lhs.tick < rhs.tick;
                   });

  std::vector<TempoChange> result;
  result.reserve(tempos.size());
  for (TempoChange change : tempos) {
    if (!bins.empty()) {
      int64_t rounded = std::llround(change.tempo);
      change.tempo = bins[nearestIndex(bins, rounded)];
    }
    change.tick = quantizeTick(change.tick, ticks_per_sample);

    if (!result.empty() && result.back().tick == change.tick) {
      result.pop_back();
    }
    if (!result.empty() && result.back().tempo == change.tempo) continue;
    result.push_back(change);
  }
  tempos.swap(result);
}

void preprocessTimeSignatures(std::vector<TimeSignatureChange>& time_sigs,
                              const TokenizerConfig& config, uint16_t time_division) {
  std::stable_sort(time_sigs.begin(), time_sigs.end(),
                   [](const TimeSignatureChange& lhs, const TimeSignatureChange& rhs) {
                     return lhs.tick < rhs.tick;
                   });

  std::vector<TimeSignatureChange> result;
  result.reserve(time_sigs.size());
  Tick previous_tick = 0;
  Tick ticks_per_bar = TimeSignature{}.ticksPerBar(time_division);

  for (const auto& change : time_sigs) {
    auto reduced = reduceTimeSignature(change.time_sig.numerator, change.time_sig.denominator,
                                       config.time_signature_range);
    if (!reduced) {
      std::fprintf(stderr, "[Preprocess] dropping unsupported time signature %s at tick %u\n",
                   timeSignatureToString(change.time_sig).c_str(), change.tick);
      continue;
    }

    // The first change is anchored to the default 4/4 bars.
    TimeSignatureChange anchored{*reduced, change.tick};
    if (ticks_per_bar > 0 && anchored.tick > previous_tick) {
      Tick offset = anchored.tick - previous_tick;
      Tick bars = (offset + ticks_per_bar - 1) / ticks_per_bar;
      anchored.tick = previous_tick + bars * ticks_per_bar;
    } else {
      anchored.tick = previous_tick;
    }

    if (!result.empty() && result.back().tick == anchored.tick) {
      result.pop_back();
      if (!result.empty()) {
        previous_tick = result.back().tick;
        ticks_per_bar = result.back().time_sig.ticksPerBar(time_division);
      }
    }
    if (!result.empty() && result.back().time_sig == anchored.time_sig) continue;

    result.push_back(anchored);
    previous_tick = anchored.tick;
    ticks_per_bar = anchored.time_sig.ticksPerBar(time_division);
  }
  time_sigs.swap(result);
}

bool preprocessScore(Score& score, const TokenizerConfig& config, std::string& error) {
  if (!config.supportsTimeDivision(score.time_division)) {
    error = "Time division " + std::to_string(score.time_division) +
            " is not a multiple of the maximum beat resolution " +
            std::to_string(config.maxResolution());
    return false;
  }

  for (auto& track : score.tracks) {
    for (auto& note : track.notes) note.program = track.program;
    preprocessNotes(track.notes, config, score.time_division);
  }
  score.tracks.erase(std::remove_if(score.tracks.begin(), score.tracks.end(),
                                    [](const Track& track) { return track.notes.empty(); }),
                     score.tracks.end());

  if (config.use_tempos) preprocessTempos(score.tempo_changes, config, score.time_division);
  if (config.use_time_signatures) {
    preprocessTimeSignatures(score.time_signatures, config, score.time_division);
  }

  score.updateMaxTick();
  return true;
}

}  // namespace remi
