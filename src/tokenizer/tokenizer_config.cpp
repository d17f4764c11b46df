/// @file
/// @brief Tokenizer configuration: derived tables and validation.

#include "tokenizer/tokenizer_config.h"

#include <algorithm>
#include <cstdlib>

namespace remi {

namespace {

/// @brief True if value is a positive power of two.
bool isPowerOfTwo(int value) {
  return value > 0 && (value & (value - 1)) == 0;
}

/// @brief Largest power of two not above value (value >= 1).
int floorPowerOfTwo(int value) {
  int result = 1;
  while (result * 2 <= value) result *= 2;
  return result;
}

/// Largest numerator a MIDI time signature meta event can carry.
constexpr int kMaxNumerator = 255;

}  // namespace

// ---------------------------------------------------------------------------
// DurationBin
// ---------------------------------------------------------------------------

Tick DurationBin::ticks(uint16_t time_division) const {
  return static_cast<Tick>(beats) * time_division +
         static_cast<Tick>(subdivision) * time_division / static_cast<Tick>(resolution);
}

std::string DurationBin::label() const {
  return std::to_string(beats) + "." + std::to_string(subdivision);
}

// ---------------------------------------------------------------------------
// TokenizerConfig
// ---------------------------------------------------------------------------

int TokenizerConfig::maxResolution() const {
  int max_res = 1;
  for (const auto& range : beat_res) max_res = std::max(max_res, range.resolution);
  return max_res;
}

int TokenizerConfig::firstResolution() const {
  return beat_res.empty() ? 1 : beat_res.front().resolution;
}

int TokenizerConfig::resolutionForBeat(int beats) const {
  if (beat_res.empty()) return 1;
  for (const auto& range : beat_res) {
    if (beats >= range.beat_start && beats < range.beat_end) return range.resolution;
  }
  return beat_res.back().resolution;
}

Tick TokenizerConfig::ticksPerSample(uint16_t time_division) const {
  return static_cast<Tick>(time_division) / static_cast<Tick>(maxResolution());
}

bool TokenizerConfig::supportsTimeDivision(uint16_t time_division) const {
  return time_division > 0 && time_division % maxResolution() == 0;
}

std::vector<DurationBin> TokenizerConfig::durationBins() const {
  std::vector<DurationBin> bins;
  for (const auto& range : beat_res) {
    for (int beat = range.beat_start; beat < range.beat_end; ++beat) {
      for (int pos = 0; pos < range.resolution; ++pos) {
        bins.push_back({beat, pos, range.resolution});
      }
    }
  }
  if (beat_res.empty()) return bins;

  // Closing bin: the full length of the last range.
  bins.push_back({beat_res.back().beat_end, 0, beat_res.back().resolution});

  // Drop the zero-length bin (0.0).
  if (!bins.empty() && bins.front().beats == 0 && bins.front().subdivision == 0) {
    bins.erase(bins.begin());
  }
  return bins;
}

std::vector<int> TokenizerConfig::velocityBins() const {
  std::vector<int> bins;
  bins.reserve(static_cast<size_t>(std::max(nb_velocities, 0)));
  for (int idx = 1; idx <= nb_velocities; ++idx) {
    bins.push_back(idx * 127 / nb_velocities);
  }
  return bins;
}

std::vector<int> TokenizerConfig::tempoBins() const {
  std::vector<int> bins;
  if (nb_tempos <= 0) return bins;
  if (nb_tempos == 1) {
    bins.push_back(tempo_min);
    return bins;
  }
  double step = static_cast<double>(tempo_max - tempo_min) / (nb_tempos - 1);
  for (int idx = 0; idx < nb_tempos; ++idx) {
    bins.push_back(static_cast<int>(idx * step + tempo_min));
  }
  bins.back() = tempo_max;
  return bins;
}

std::vector<TimeSignature> TokenizerConfig::timeSignatures() const {
  std::vector<TimeSignature> result;
  for (int den = 1; den <= time_signature_range.max_denominator; den *= 2) {
    int max_num = std::min(den * time_signature_range.max_bar_beats, kMaxNumerator);
    for (int num = 1; num <= max_num; ++num) {
      result.push_back({static_cast<uint8_t>(num), static_cast<uint8_t>(den)});
    }
  }
  return result;
}

bool TokenizerConfig::validate(std::string& error) const {
  if (pitch_min < 0 || pitch_max > 127 || pitch_min > pitch_max) {
    error = "Invalid pitch range: [" + std::to_string(pitch_min) + ", " +
            std::to_string(pitch_max) + "]";
    return false;
  }
  if (beat_res.empty()) {
    error = "Beat resolution table is empty";
    return false;
  }
  int expected_start = 0;
  for (const auto& range : beat_res) {
    if (range.beat_start != expected_start) {
      error = "Beat ranges must be contiguous from beat 0 (gap at beat " +
              std::to_string(expected_start) + ")";
      return false;
    }
    if (range.beat_end <= range.beat_start) {
      error = "Empty beat range starting at beat " + std::to_string(range.beat_start);
      return false;
    }
    if (range.resolution <= 0) {
      error = "Beat resolution must be positive";
      return false;
    }
    expected_start = range.beat_end;
  }
  if (nb_velocities < 1 || nb_velocities > 127) {
    error = "nb_velocities must be in [1, 127]";
    return false;
  }
  if (use_tempos && (nb_tempos < 1 || tempo_min <= 0 || tempo_max < tempo_min)) {
    error = "Invalid tempo bins: " + std::to_string(nb_tempos) + " over [" +
            std::to_string(tempo_min) + ", " + std::to_string(tempo_max) + "]";
    return false;
  }
  if (use_time_signatures) {
    const auto& range = time_signature_range;
    if (!isPowerOfTwo(range.max_denominator) || range.max_denominator > 64) {
      error = "Maximum time signature denominator must be a power of two up to 64";
      return false;
    }
    if (range.max_bar_beats < 1) {
      error = "Maximum bar length must be at least one beat";
      return false;
    }
  }
  if (num_bars < 0) {
    error = "num_bars must not be negative";
    return false;
  }
  for (const auto& name : special_tokens) {
    if (name.empty() || name.find('_') != std::string::npos) {
      error = "Invalid special token name: '" + name + "'";
      return false;
    }
  }
  return true;
}

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

std::optional<TimeSignature> reduceTimeSignature(int numerator, int denominator,
                                                 const TimeSignatureRange& range) {
  if (numerator < 1 || denominator < 1) return std::nullopt;

  if (!isPowerOfTwo(denominator)) {
    denominator = floorPowerOfTwo(denominator);
  }
  while (denominator > range.max_denominator && numerator % 2 == 0) {
    numerator /= 2;
    denominator /= 2;
  }
  if (denominator > range.max_denominator) return std::nullopt;
  if (numerator > denominator * range.max_bar_beats || numerator > kMaxNumerator) {
    return std::nullopt;
  }
  return TimeSignature{static_cast<uint8_t>(numerator), static_cast<uint8_t>(denominator)};
}

size_t nearestIndex(const std::vector<int>& table, int64_t value) {
  size_t best = 0;
  int64_t best_dist = -1;
  for (size_t idx = 0; idx < table.size(); ++idx) {
    int64_t dist = std::llabs(static_cast<int64_t>(table[idx]) - value);
    if (best_dist < 0 || dist < best_dist) {
      best = idx;
      best_dist = dist;
    }
  }
  return best;
}

size_t nearestDurationBin(const std::vector<Tick>& bin_ticks, Tick duration) {
  size_t best = 0;
  int64_t best_dist = -1;
  for (size_t idx = 0; idx < bin_ticks.size(); ++idx) {
    int64_t dist = std::llabs(static_cast<int64_t>(bin_ticks[idx]) -
                              static_cast<int64_t>(duration));
    if (best_dist < 0 || dist < best_dist) {
      best = idx;
      best_dist = dist;
    }
  }
  return best;
}

}  // namespace remi
