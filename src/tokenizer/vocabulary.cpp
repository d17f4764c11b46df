/// @file
/// @brief Vocabulary enumeration and token id mapping.

#include "tokenizer/vocabulary.h"

#include "core/gm_program.h"
#include "tokenizer/token.h"

namespace remi {

const std::vector<ChordTemplate>& chordTemplates() {
  static const std::vector<ChordTemplate> kTemplates = {
      {"min", {0, 3, 7}},
      {"maj", {0, 4, 7}},
      {"dim", {0, 3, 6}},
      {"aug", {0, 4, 8}},
      {"sus2", {0, 2, 7}},
      {"sus4", {0, 5, 7}},
      {"7dom", {0, 4, 7, 10}},
      {"7min", {0, 3, 7, 10}},
      {"7maj", {0, 4, 7, 11}},
      {"7halfdim", {0, 3, 6, 10}},
      {"7dim", {0, 3, 6, 9}},
      {"7aug", {0, 4, 8, 11}},
      {"9maj", {0, 4, 7, 10, 14}},
      {"9min", {0, 4, 7, 10, 13}},
  };
  return kTemplates;
}

std::vector<std::string> buildBaseVocabulary(const TokenizerConfig& config) {
  std::vector<std::string> vocab;

  // Bar
  if (config.barsUnbounded()) {
    vocab.push_back(formatToken(Token::bar(kUnboundedBar)));
  } else {
    for (int idx = 0; idx < config.num_bars; ++idx) {
      vocab.push_back(formatToken(Token::bar(idx)));
    }
  }

  // Pitch
  for (int pitch = config.pitch_min; pitch <= config.pitch_max; ++pitch) {
    vocab.push_back(formatToken(Token::pitch(pitch)));
  }

  // Velocity
  for (int velocity : config.velocityBins()) {
    vocab.push_back(formatToken(Token::velocity(velocity)));
  }

  // Duration
  for (const auto& bin : config.durationBins()) {
    vocab.push_back(formatToken(Token::duration(bin.beats, bin.subdivision)));
  }

  // Position: four beats at the highest resolution.
  for (int pos = 0; pos < config.positionCount(); ++pos) {
    vocab.push_back(formatToken(Token::position(pos)));
  }

  if (config.use_time_signatures) {
    for (const auto& time_sig : config.timeSignatures()) {
      vocab.push_back(formatToken(Token::timeSig(time_sig.numerator, time_sig.denominator)));
    }
  }

  if (config.use_chords) {
    // Unrecognized chords are labelled by their note count.
    for (int count = kMinChordNotes; count <= kMaxChordNotes; ++count) {
      vocab.push_back(formatToken(Token::chord(std::to_string(count))));
    }
    for (const auto& chord : chordTemplates()) {
      vocab.push_back(formatToken(Token::chord(chord.name)));
    }
  }

  if (config.use_tempos) {
    for (int tempo : config.tempoBins()) {
      vocab.push_back(formatToken(Token::tempo(tempo)));
    }
  }

  // Program (mandatory): drums first, then the GM programs.
  vocab.push_back(formatToken(Token::program(kDrumProgram)));
  for (int program = GmProgram::kFirst; program <= GmProgram::kLast; ++program) {
    vocab.push_back(formatToken(Token::program(program)));
  }

  return vocab;
}

// ---------------------------------------------------------------------------
// Vocabulary
// ---------------------------------------------------------------------------

Vocabulary::Vocabulary(const TokenizerConfig& config) {
  for (const auto& name : config.special_tokens) {
    tokens_.push_back(formatToken(Token::special(name)));
  }
  std::vector<std::string> base = buildBaseVocabulary(config);
  tokens_.insert(tokens_.end(), base.begin(), base.end());

  index_.reserve(tokens_.size());
  for (size_t idx = 0; idx < tokens_.size(); ++idx) {
    index_.emplace(tokens_[idx], static_cast<int>(idx));
  }
}

int Vocabulary::tokenToId(const std::string& token) const {
  auto iter = index_.find(token);
  return iter == index_.end() ? kUnknownTokenId : iter->second;
}

std::string Vocabulary::idToToken(int id) const {
  if (id < 0 || static_cast<size_t>(id) >= tokens_.size()) return {};
  return tokens_[static_cast<size_t>(id)];
}

bool Vocabulary::encodeIds(const std::vector<std::string>& tokens, std::vector<int>& ids,
                           std::string& error) const {
  ids.clear();
  ids.reserve(tokens.size());
  bool all_known = true;
  for (const auto& token : tokens) {
    int id = tokenToId(token);
    if (id == kUnknownTokenId && all_known) {
      error = "Token not in vocabulary: " + token;
      all_known = false;
    }
    ids.push_back(id);
  }
  return all_known;
}

bool Vocabulary::decodeIds(const std::vector<int>& ids, std::vector<std::string>& tokens,
                           std::string& error) const {
  tokens.clear();
  tokens.reserve(ids.size());
  for (int id : ids) {
    if (id < 0 || static_cast<size_t>(id) >= tokens_.size()) {
      error = "Token id out of range: " + std::to_string(id);
      return false;
    }
    tokens.push_back(tokens_[static_cast<size_t>(id)]);
  }
  return true;
}

}  // namespace remi
