/// @file
/// @brief REMI+ token decoder implementation.

#include "tokenizer/token_decoder.h"

#include <algorithm>
#include <map>

#include "core/gm_program.h"

namespace remi {

TokenDecoder::TokenDecoder(const TokenizerConfig& config) : config_(config) {}

void TokenDecoder::enterNextBar(DecoderState& state) const {
  if (state.current_bar >= 0) state.bar_start_tick += state.ticks_per_bar;
  ++state.current_bar;
}

Tick TokenDecoder::durationTicks(int beats, int subdivision, uint16_t time_division) const {
  if (beats < 0 || subdivision < 0) return 0;
  Tick res = static_cast<Tick>(config_.resolutionForBeat(beats));
  return static_cast<Tick>(beats) * time_division +
         static_cast<Tick>(subdivision) * time_division / res;
}

DecodeResult TokenDecoder::decode(const std::vector<std::string>& tokens,
                                  uint16_t time_division) const {
  std::vector<Token> parsed;
  std::string error;
  if (!parseTokens(tokens, parsed, error, config_.special_tokens)) {
    DecodeResult result;
    result.error_message = error;
    return result;
  }
  return decode(parsed, time_division);
}

DecodeResult TokenDecoder::decode(const std::vector<Token>& tokens,
                                  uint16_t time_division) const {
  DecodeResult result;
  if (!config_.supportsTimeDivision(time_division)) {
    result.error_message = "Time division " + std::to_string(time_division) +
                           " is not a multiple of the maximum beat resolution " +
                           std::to_string(config_.maxResolution());
    return result;
  }

  const Tick ticks_per_sample = config_.ticksPerSample(time_division);
  const TimeSignature default_time_sig;

  DecoderState state;
  state.ticks_per_bar = default_time_sig.ticksPerBar(time_division);

  std::map<int, size_t> track_index;  // program -> index in result.tracks

  for (size_t idx = 0; idx < tokens.size(); ++idx) {
    const Token& token = tokens[idx];
    switch (token.type) {
      case TokenType::Bar:
        enterNextBar(state);
        state.current_tick = state.bar_start_tick;
        break;

      case TokenType::Rest: {
        if (state.current_bar < 0) enterNextBar(state);
        state.current_tick = std::max(state.current_tick, state.previous_note_end);
        state.current_tick += static_cast<Tick>(std::max(token.value, 0)) * time_division +
                              static_cast<Tick>(std::max(token.second, 0)) * ticks_per_sample;
        while (state.ticks_per_bar > 0 &&
               state.current_tick >= state.bar_start_tick + state.ticks_per_bar) {
          enterNextBar(state);
        }
        break;
      }

      case TokenType::Position:
        if (state.current_bar < 0) enterNextBar(state);
        state.current_tick = state.bar_start_tick +
                             static_cast<Tick>(std::max(token.value, 0)) * ticks_per_sample;
        break;

      case TokenType::Tempo:
        if (!state.last_tempo || *state.last_tempo != token.value) {
          result.tempo_changes.push_back({static_cast<double>(token.value), state.current_tick});
          state.last_tempo = token.value;
        }
        break;

      case TokenType::TimeSig: {
        auto reduced = reduceTimeSignature(token.value, token.second,
                                           config_.time_signature_range);
        if (!reduced) {
          result.tracks.clear();
          result.tempo_changes.clear();
          result.time_signatures.clear();
          result.error_message = "token " + std::to_string(idx) +
                                 ": unsupported time signature " + formatToken(token);
          return result;
        }
        if (!state.last_time_sig || *state.last_time_sig != *reduced) {
          result.time_signatures.push_back({*reduced, state.current_tick});
          state.last_time_sig = *reduced;
        }
        if (config_.resync_ticks_per_bar) {
          state.ticks_per_bar = reduced->ticksPerBar(time_division);
        }
        break;
      }

      case TokenType::Pitch: {
        // A note needs Program before and Velocity, Duration after.
        if (idx == 0 || idx + 2 >= tokens.size()) break;
        const Token& program = tokens[idx - 1];
        const Token& velocity = tokens[idx + 1];
        const Token& duration = tokens[idx + 2];
        if (program.type != TokenType::Program || velocity.type != TokenType::Velocity ||
            duration.type != TokenType::Duration) {
          break;
        }

        Note note;
        note.pitch = static_cast<uint8_t>(std::clamp(token.value, 0, 127));
        note.velocity = static_cast<uint8_t>(std::clamp(velocity.value, 0, 127));
        note.program = program.value;
        note.start_tick = state.current_tick;
        note.end_tick = state.current_tick +
                        durationTicks(duration.value, duration.second, time_division);

        auto iter = track_index.find(note.program);
        if (iter == track_index.end()) {
          Track track;
          track.program = note.program;
          track.name = gmProgramName(note.program);
          result.tracks.push_back(track);
          iter = track_index.emplace(note.program, result.tracks.size() - 1).first;
        }
        result.tracks[iter->second].notes.push_back(note);
        state.previous_note_end = std::max(state.previous_note_end, note.end_tick);
        result.max_tick = std::max(result.max_tick, note.end_tick);
        break;
      }

      default:
        // Program, Velocity and Duration are consumed with their Pitch;
        // Chord, Special and Unknown carry no timing.
        break;
    }
  }

  // The first recorded tempo and meter hold from tick 0; defaults only when none.
  if (result.tempo_changes.empty()) {
    result.tempo_changes.push_back(TempoChange{static_cast<double>(kDefaultTempo), 0});
  } else {
    result.tempo_changes.front().tick = 0;
  }
  if (result.time_signatures.empty()) {
    result.time_signatures.push_back(TimeSignatureChange{default_time_sig, 0});
  } else {
    result.time_signatures.front().tick = 0;
  }

  result.success = true;
  return result;
}

}  // namespace remi
