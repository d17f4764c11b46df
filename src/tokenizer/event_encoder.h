// Event encoder: bar / position / tempo / time-signature aware scan that
// turns sorted notes into ordered REMI+ events and tokens.

#ifndef REMI_TOKENIZER_EVENT_ENCODER_H
#define REMI_TOKENIZER_EVENT_ENCODER_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "tokenizer/token.h"
#include "tokenizer/tokenizer_config.h"

namespace remi {

/// What a Position event anchors. Decides its rank among same-tick events.
enum class EventRole : uint8_t {
  Note,         ///< Position / Program / Pitch / Velocity / Duration of a note.
  TempoAnchor,  ///< Position preceding a Tempo token.
  ChordAnchor   ///< Position preceding a Chord token.
};

/// Intermediate tick-stamped token. Exists only inside the encoder.
struct Event {
  Token token;
  Tick tick = 0;
  EventRole role = EventRole::Note;
};

/// @brief Tie-break rank of an event among events at the same tick.
///
/// Bar 0 < TimeSig 1 < tempo Position 2 < Tempo 3 < chord Position 4 <
/// Chord 5 < Rest 7 < note events 8.
int eventRank(const Event& event);

/// @brief Stable sort by (tick, rank). Note events keep insertion order.
void sortEvents(std::vector<Event>& events);

/// @brief Strip ticks and roles.
std::vector<Token> eventsToTokens(const std::vector<Event>& events);

/// A stretch of constant meter: bar `bar` starts at `tick`.
struct MeterSegment {
  Tick tick = 0;
  int bar = 0;
  Tick ticks_per_bar = 0;
};

/// @brief Scan state threaded through the encoder, one note at a time.
struct EncoderState {
  int current_bar = -1;
  size_t tempo_cursor = 0;     ///< Next tempo change not yet adopted.
  size_t time_sig_cursor = 0;  ///< Next time signature change not yet adopted.
  double tempo = kDefaultTempo;
  TimeSignature time_sig;
  std::vector<MeterSegment> meter;  ///< Adopted meter, first segment at tick 0.
  std::optional<Tick> previous_tick;

  Tick ticksPerBar() const { return meter.back().ticks_per_bar; }
};

/// Inputs of one encoding pass.
struct EncoderInput {
  std::vector<Note> notes;  ///< Sorted by (start_tick, pitch).
  uint16_t time_division = kDefaultTimeDivision;
  std::vector<TempoChange> tempo_changes;
  std::vector<TimeSignatureChange> time_signatures;
  std::vector<ChordEvent> chords;
};

/// Result of one encoding pass.
struct EncodeResult {
  std::vector<Event> events;
  std::vector<Token> tokens;
  bool success = false;
  std::string error_message;
};

/// @brief Encodes notes and timelines into REMI+ events.
///
/// For each new onset the encoder emits the Bar tokens of every elapsed
/// bar, then (when enabled) a TimeSig token and a tempo-anchored Position
/// + Tempo pair after the Bar run. Every note contributes Position,
/// Program, Pitch, Velocity and Duration. Tempo and meter changes strictly
/// inside a bar without a new Bar are not tokenized.
///
/// Input must be pre-validated: notes sorted, start <= end.
class EventEncoder {
 public:
  explicit EventEncoder(const TokenizerConfig& config);

  /// @brief Run the scan and produce sorted events and tokens.
  EncodeResult encode(const EncoderInput& input) const;

 private:
  TokenizerConfig config_;

  /// Emit bar / meter / tempo events for a new onset.
  void advanceTimeStep(EncoderState& state, const EncoderInput& input, Tick start,
                       Tick ticks_per_sample, std::vector<Event>& events) const;

  /// Adopt every time signature change at or before `tick`.
  void adoptTimeSignatures(EncoderState& state, const EncoderInput& input, Tick tick) const;

  /// Adopt every tempo change at or before `tick`.
  void adoptTempos(EncoderState& state, const EncoderInput& input, Tick tick) const;
};

/// @brief Bar index containing `tick` under an adopted meter.
int barIndexAt(const std::vector<MeterSegment>& meter, Tick tick);

/// @brief Start tick of bar `bar` under an adopted meter.
Tick barStartTick(const std::vector<MeterSegment>& meter, int bar);

/// @brief Position index of `tick` within its bar.
int positionIndexAt(const std::vector<MeterSegment>& meter, Tick tick, Tick ticks_per_sample);

}  // namespace remi

#endif  // REMI_TOKENIZER_EVENT_ENCODER_H
