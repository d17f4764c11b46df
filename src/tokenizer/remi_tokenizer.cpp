/// @file
/// @brief RemiTokenizer facade implementation.

#include "tokenizer/remi_tokenizer.h"

#include <cstdio>
#include <utility>

#include "tokenizer/chord_detector.h"
#include "tokenizer/event_encoder.h"
#include "tokenizer/preprocess.h"
#include "tokenizer/token.h"

namespace remi {

namespace {

/// @brief Copy of the config with the families this encoding cannot emit removed.
TokenizerConfig remiPlusConfig(TokenizerConfig config) {
  if (config.use_rests) {
    std::fprintf(stderr, "[RemiTokenizer] Rest tokens are not supported by REMI+, disabling\n");
    config.use_rests = false;
  }
  return config;
}

}  // namespace

RemiTokenizer::RemiTokenizer(const TokenizerConfig& config)
    : config_(remiPlusConfig(config)), vocab_(config_), graph_(buildTypeGraph(config_)) {}

TokenizeResult RemiTokenizer::tokenize(const Score& score) const {
  TokenizeResult result;

  Score prepared = score;
  if (!preprocessScore(prepared, config_, result.error_message)) return result;

  EncoderInput input;
  input.time_division = prepared.time_division;
  input.tempo_changes = prepared.tempo_changes;
  input.time_signatures = prepared.time_signatures;
  for (const auto& track : prepared.tracks) {
    input.notes.insert(input.notes.end(), track.notes.begin(), track.notes.end());
  }
  sortNotes(input.notes);

  if (config_.use_chords) {
    ChordDetectorOptions options;
    options.onset_resolution = config_.firstResolution();
    options.known_only = config_.chords_known_only;
    input.chords = detectChords(input.notes, input.time_division, options);
  }

  EventEncoder encoder(config_);
  EncodeResult encoded = encoder.encode(input);
  if (!encoded.success) {
    result.error_message = encoded.error_message;
    return result;
  }

  result.tokens = formatTokens(encoded.tokens);
  if (!vocab_.encodeIds(result.tokens, result.ids, result.error_message)) return result;

  result.success = true;
  return result;
}

DetokenizeResult RemiTokenizer::detokenize(const std::vector<std::string>& tokens,
                                           uint16_t time_division) const {
  DetokenizeResult result;
  TokenDecoder decoder(config_);
  DecodeResult decoded = decoder.decode(tokens, time_division);
  if (!decoded.success) {
    result.error_message = decoded.error_message;
    return result;
  }

  result.score.time_division = time_division;
  result.score.tracks = std::move(decoded.tracks);
  result.score.tempo_changes = std::move(decoded.tempo_changes);
  result.score.time_signatures = std::move(decoded.time_signatures);
  result.score.max_tick = decoded.max_tick;
  result.success = true;
  return result;
}

DetokenizeResult RemiTokenizer::detokenizeIds(const std::vector<int>& ids,
                                              uint16_t time_division) const {
  std::vector<std::string> tokens;
  std::string error;
  if (!vocab_.decodeIds(ids, tokens, error)) {
    DetokenizeResult result;
    result.error_message = error;
    return result;
  }
  return detokenize(tokens, time_division);
}

TypeCheckReport RemiTokenizer::tokenErrors(const std::vector<std::string>& tokens) const {
  std::vector<Token> typed;
  typed.reserve(tokens.size());
  for (const auto& text : tokens) {
    Token token;
    std::string error;
    if (!parseToken(text, token, error, config_.special_tokens)) {
      token = Token{};
    }
    typed.push_back(token);
  }
  return checkTokenTypes(graph_, typed);
}

}  // namespace remi
