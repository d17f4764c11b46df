// JSON persistence of tokenizer configs and token files.

#ifndef REMI_TOKENIZER_CONFIG_IO_H
#define REMI_TOKENIZER_CONFIG_IO_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/json_parser.h"
#include "tokenizer/tokenizer_config.h"

namespace remi {

/// @brief Build a config from parsed JSON. Missing keys keep their defaults.
///
/// Keys: pitch_range [min, max], beat_res [[start, end, res], ...],
/// nb_velocities, use_chords, use_rests, use_tempos, use_time_signatures,
/// nb_tempos, tempo_range [min, max], time_signature_range
/// [max_denominator, max_bar_beats], num_bars, special_tokens,
/// chords_known_only, resync_ticks_per_bar.
TokenizerConfig configFromJson(const std::map<std::string, JsonValue>& kv);

/// @brief Serialize a config with the keys read by configFromJson.
std::string configToJson(const TokenizerConfig& config);

/// @brief Load and validate a config file.
bool loadConfig(const std::string& path, TokenizerConfig& config, std::string& error);

/// @brief Write a config file.
bool saveConfig(const std::string& path, const TokenizerConfig& config, std::string& error);

/// Contents of a token file.
struct TokenFile {
  uint16_t time_division = kDefaultTimeDivision;
  std::vector<std::string> tokens;
  std::vector<int> ids;
};

/// @brief Serialize as {"time_division": N, "tokens": [...], "ids": [...]}.
std::string tokenFileToJson(const TokenFile& file);

/// @brief Parse a token file. At least one of tokens / ids must be present.
bool tokenFileFromJson(const std::string& json, TokenFile& file, std::string& error);

bool readTokenFile(const std::string& path, TokenFile& file, std::string& error);
bool writeTokenFile(const std::string& path, const TokenFile& file, std::string& error);

/// @brief Read a whole file into a string.
bool readTextFile(const std::string& path, std::string& out, std::string& error);

/// @brief Write a string to a file, replacing its contents.
bool writeTextFile(const std::string& path, const std::string& text, std::string& error);

}  // namespace remi

#endif  // REMI_TOKENIZER_CONFIG_IO_H
