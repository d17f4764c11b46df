/// @file
/// @brief REMI+ event encoder implementation.

#include "tokenizer/event_encoder.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace remi {

namespace {

/// @brief Segment in effect at `tick` (last segment starting at or before it).
const MeterSegment& segmentAt(const std::vector<MeterSegment>& meter, Tick tick) {
  auto iter = std::upper_bound(meter.begin(), meter.end(), tick,
                               [](Tick value, const MeterSegment& seg) {
                                 return value < seg.tick;
                               });
  if (iter == meter.begin()) return meter.front();
  return *(iter - 1);
}

}  // namespace

// ---------------------------------------------------------------------------
// Event helpers
// ---------------------------------------------------------------------------

int eventRank(const Event& event) {
  switch (event.token.type) {
    case TokenType::Bar:     return 0;
    case TokenType::TimeSig: return 1;
    case TokenType::Tempo:   return 3;
    case TokenType::Chord:   return 5;
    case TokenType::Rest:    return 7;
    case TokenType::Position:
      if (event.role == EventRole::TempoAnchor) return 2;
      if (event.role == EventRole::ChordAnchor) return 4;
      return 8;
    default:
      return 8;
  }
}

void sortEvents(std::vector<Event>& events) {
  std::stable_sort(events.begin(), events.end(), [](const Event& lhs, const Event& rhs) {
    if (lhs.tick != rhs.tick) return lhs.tick < rhs.tick;
    return eventRank(lhs) < eventRank(rhs);
  });
}

std::vector<Token> eventsToTokens(const std::vector<Event>& events) {
  std::vector<Token> tokens;
  tokens.reserve(events.size());
  for (const auto& event : events) tokens.push_back(event.token);
  return tokens;
}

int barIndexAt(const std::vector<MeterSegment>& meter, Tick tick) {
  const MeterSegment& seg = segmentAt(meter, tick);
  if (tick < seg.tick || seg.ticks_per_bar == 0) return seg.bar;
  return seg.bar + static_cast<int>((tick - seg.tick) / seg.ticks_per_bar);
}

Tick barStartTick(const std::vector<MeterSegment>& meter, int bar) {
  const MeterSegment* found = &meter.front();
  for (const auto& seg : meter) {
    if (seg.bar > bar) break;
    found = &seg;
  }
  if (bar <= found->bar) return found->tick;
  return found->tick + static_cast<Tick>(bar - found->bar) * found->ticks_per_bar;
}

int positionIndexAt(const std::vector<MeterSegment>& meter, Tick tick, Tick ticks_per_sample) {
  const MeterSegment& seg = segmentAt(meter, tick);
  if (tick < seg.tick || seg.ticks_per_bar == 0 || ticks_per_sample == 0) return 0;
  Tick offset = (tick - seg.tick) % seg.ticks_per_bar;
  return static_cast<int>(offset / ticks_per_sample);
}

// ---------------------------------------------------------------------------
// EventEncoder
// ---------------------------------------------------------------------------

EventEncoder::EventEncoder(const TokenizerConfig& config) : config_(config) {}

EncodeResult EventEncoder::encode(const EncoderInput& input) const {
  EncodeResult result;
  if (!config_.supportsTimeDivision(input.time_division)) {
    result.error_message = "Time division " + std::to_string(input.time_division) +
                           " is not a multiple of the maximum beat resolution " +
                           std::to_string(config_.maxResolution());
    return result;
  }

  const uint16_t time_division = input.time_division;
  const Tick ticks_per_sample = config_.ticksPerSample(time_division);

  std::vector<DurationBin> bins = config_.durationBins();
  std::vector<Tick> bin_ticks;
  bin_ticks.reserve(bins.size());
  for (const auto& bin : bins) bin_ticks.push_back(bin.ticks(time_division));

  EncoderState state;
  state.meter.push_back({0, 0, state.time_sig.ticksPerBar(time_division)});

  std::vector<Event>& events = result.events;
  events.reserve(input.notes.size() * 5 + input.chords.size() * 2);

  for (const auto& note : input.notes) {
    const Tick start = note.start_tick;
    if (!state.previous_tick || *state.previous_tick != start) {
      advanceTimeStep(state, input, start, ticks_per_sample, events);
    }

    events.push_back({Token::position(positionIndexAt(state.meter, start, ticks_per_sample)),
                      start, EventRole::Note});
    events.push_back({Token::program(note.program), start, EventRole::Note});
    events.push_back({Token::pitch(note.pitch), start, EventRole::Note});
    events.push_back({Token::velocity(note.velocity), start, EventRole::Note});
    if (!bins.empty()) {
      const DurationBin& bin = bins[nearestDurationBin(bin_ticks, note.duration())];
      events.push_back({Token::duration(bin.beats, bin.subdivision), start, EventRole::Note});
    }
  }

  if (config_.use_chords) {
    for (const auto& chord : input.chords) {
      events.push_back({Token::position(positionIndexAt(state.meter, chord.tick,
                                                        ticks_per_sample)),
                        chord.tick, EventRole::ChordAnchor});
      events.push_back({Token::chord(chord.label), chord.tick, EventRole::Note});
    }
  }

  sortEvents(events);
  result.tokens = eventsToTokens(events);
  result.success = true;
  return result;
}

void EventEncoder::advanceTimeStep(EncoderState& state, const EncoderInput& input, Tick start,
                                   Tick ticks_per_sample, std::vector<Event>& events) const {
  // Meter is adopted first so the bar count uses the signature in effect.
  if (config_.use_time_signatures) {
    adoptTimeSignatures(state, input, start);
  }

  int elapsed = std::max(0, barIndexAt(state.meter, start) - state.current_bar);
  for (int idx = 1; idx <= elapsed; ++idx) {
    int bar = state.current_bar + idx;
    int value = config_.barsUnbounded() ? kUnboundedBar : bar;
    events.push_back({Token::bar(value), barStartTick(state.meter, bar), EventRole::Note});
  }
  state.current_bar += elapsed;

  if (config_.use_time_signatures && elapsed > 0) {
    events.push_back({Token::timeSig(state.time_sig.numerator, state.time_sig.denominator),
                      start, EventRole::Note});
  }

  if (config_.use_tempos) {
    adoptTempos(state, input, start);
    if (elapsed > 0) {
      events.push_back({Token::position(positionIndexAt(state.meter, start, ticks_per_sample)),
                        start, EventRole::TempoAnchor});
      events.push_back({Token::tempo(static_cast<int>(std::lround(state.tempo))), start,
                        EventRole::Note});
    }
  }

  state.previous_tick = start;
}

void EventEncoder::adoptTimeSignatures(EncoderState& state, const EncoderInput& input,
                                       Tick tick) const {
  const auto& changes = input.time_signatures;
  while (state.time_sig_cursor < changes.size() &&
         changes[state.time_sig_cursor].tick <= tick) {
    const TimeSignatureChange& change = changes[state.time_sig_cursor++];
    auto reduced = reduceTimeSignature(change.time_sig.numerator, change.time_sig.denominator,
                                       config_.time_signature_range);
    if (!reduced) {
      std::fprintf(stderr, "[EventEncoder] unsupported time signature %s at tick %u, keeping %s\n",
                   timeSignatureToString(change.time_sig).c_str(), change.tick,
                   timeSignatureToString(state.time_sig).c_str());
      continue;
    }
    state.time_sig = *reduced;
    MeterSegment seg{change.tick, barIndexAt(state.meter, change.tick),
                     reduced->ticksPerBar(input.time_division)};
    if (state.meter.back().tick == change.tick) {
      state.meter.back() = seg;
    } else {
      state.meter.push_back(seg);
    }
  }
}

void EventEncoder::adoptTempos(EncoderState& state, const EncoderInput& input, Tick tick) const {
  const auto& changes = input.tempo_changes;
  while (state.tempo_cursor < changes.size() && changes[state.tempo_cursor].tick <= tick) {
    state.tempo = changes[state.tempo_cursor++].tempo;
  }
}

}  // namespace remi
