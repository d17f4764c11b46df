/// @file
/// @brief Config and token file JSON persistence.

#include "tokenizer/config_io.h"

#include <cstdio>

#include "core/json_helpers.h"

namespace remi {

namespace {

/// @brief Read a boolean key if present.
void readBool(const std::map<std::string, JsonValue>& kv, const char* name, bool& out) {
  auto it = kv.find(name);
  if (it != kv.end()) out = it->second.asBool(out);
}

/// @brief Read an integer key if present.
void readInt(const std::map<std::string, JsonValue>& kv, const char* name, int& out) {
  auto it = kv.find(name);
  if (it != kv.end() && it->second.type == JsonValue::Number) out = it->second.asInt(out);
}

/// @brief Read a two-element integer array if present.
void readPair(const std::map<std::string, JsonValue>& kv, const char* name, int& first,
              int& second) {
  auto it = kv.find(name);
  if (it == kv.end()) return;
  std::vector<int> values = it->second.asIntArray();
  if (values.size() == 2) {
    first = values[0];
    second = values[1];
  }
}

}  // namespace

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------

TokenizerConfig configFromJson(const std::map<std::string, JsonValue>& kv) {
  TokenizerConfig config;

  readPair(kv, "pitch_range", config.pitch_min, config.pitch_max);

  auto it = kv.find("beat_res");
  if (it != kv.end() && it->second.isArray()) {
    std::vector<BeatResolution> table;
    for (const auto& entry : it->second.array_val) {
      std::vector<int> values = entry.asIntArray();
      if (values.size() == 3) table.push_back({values[0], values[1], values[2]});
    }
    if (!table.empty()) config.beat_res = table;
  }

  readInt(kv, "nb_velocities", config.nb_velocities);
  readBool(kv, "use_chords", config.use_chords);
  readBool(kv, "use_rests", config.use_rests);
  readBool(kv, "use_tempos", config.use_tempos);
  readBool(kv, "use_time_signatures", config.use_time_signatures);
  readInt(kv, "nb_tempos", config.nb_tempos);
  readPair(kv, "tempo_range", config.tempo_min, config.tempo_max);
  readPair(kv, "time_signature_range", config.time_signature_range.max_denominator,
           config.time_signature_range.max_bar_beats);
  readInt(kv, "num_bars", config.num_bars);

  it = kv.find("special_tokens");
  if (it != kv.end() && it->second.isArray()) {
    config.special_tokens.clear();
    for (const auto& entry : it->second.array_val) {
      if (entry.type == JsonValue::String) config.special_tokens.push_back(entry.string_val);
    }
  }

  readBool(kv, "chords_known_only", config.chords_known_only);
  readBool(kv, "resync_ticks_per_bar", config.resync_ticks_per_bar);
  return config;
}

std::string configToJson(const TokenizerConfig& config) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("pitch_range");
  writer.intArray({config.pitch_min, config.pitch_max});
  writer.key("beat_res");
  writer.beginArray();
  for (const auto& range : config.beat_res) {
    writer.intArray({range.beat_start, range.beat_end, range.resolution});
  }
  writer.endArray();
  writer.key("nb_velocities");
  writer.value(config.nb_velocities);
  writer.key("use_chords");
  writer.value(config.use_chords);
  writer.key("use_rests");
  writer.value(config.use_rests);
  writer.key("use_tempos");
  writer.value(config.use_tempos);
  writer.key("use_time_signatures");
  writer.value(config.use_time_signatures);
  writer.key("nb_tempos");
  writer.value(config.nb_tempos);
  writer.key("tempo_range");
  writer.intArray({config.tempo_min, config.tempo_max});
  writer.key("time_signature_range");
  writer.intArray({config.time_signature_range.max_denominator,
                   config.time_signature_range.max_bar_beats});
  writer.key("num_bars");
  writer.value(config.num_bars);
  writer.key("special_tokens");
  writer.stringArray(config.special_tokens);
  writer.key("chords_known_only");
  writer.value(config.chords_known_only);
  writer.key("resync_ticks_per_bar");
  writer.value(config.resync_ticks_per_bar);
  writer.endObject();
  return writer.toPrettyString();
}

bool loadConfig(const std::string& path, TokenizerConfig& config, std::string& error) {
  std::string json;
  if (!readTextFile(path, json, error)) return false;

  auto kv = parseJsonObject(json);
  if (kv.empty()) {
    error = "Invalid or empty JSON object: " + path;
    return false;
  }

  TokenizerConfig loaded = configFromJson(kv);
  if (!loaded.validate(error)) {
    error = path + ": " + error;
    return false;
  }
  config = loaded;
  return true;
}

bool saveConfig(const std::string& path, const TokenizerConfig& config, std::string& error) {
  return writeTextFile(path, configToJson(config) + "\n", error);
}

// ---------------------------------------------------------------------------
// Token files
// ---------------------------------------------------------------------------

std::string tokenFileToJson(const TokenFile& file) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("time_division");
  writer.value(static_cast<int>(file.time_division));
  writer.key("tokens");
  writer.stringArray(file.tokens);
  writer.key("ids");
  writer.intArray(file.ids);
  writer.endObject();
  return writer.toPrettyString();
}

bool tokenFileFromJson(const std::string& json, TokenFile& file, std::string& error) {
  auto kv = parseJsonObject(json);
  if (kv.empty()) {
    error = "Invalid or empty JSON object";
    return false;
  }

  TokenFile parsed;
  auto it = kv.find("time_division");
  if (it != kv.end()) {
    int division = it->second.asInt(0);
    if (division <= 0 || division > 0x7FFF) {
      error = "Invalid time_division: " + std::to_string(division);
      return false;
    }
    parsed.time_division = static_cast<uint16_t>(division);
  }

  bool has_tokens = false;
  it = kv.find("tokens");
  if (it != kv.end() && it->second.isArray()) {
    has_tokens = true;
    for (const auto& entry : it->second.array_val) {
      if (entry.type != JsonValue::String) {
        error = "tokens must be an array of strings";
        return false;
      }
      parsed.tokens.push_back(entry.string_val);
    }
  }

  bool has_ids = false;
  it = kv.find("ids");
  if (it != kv.end() && it->second.isArray()) {
    has_ids = true;
    parsed.ids = it->second.asIntArray();
  }

  if (!has_tokens && !has_ids) {
    error = "Token file has neither tokens nor ids";
    return false;
  }
  file = parsed;
  return true;
}

bool readTokenFile(const std::string& path, TokenFile& file, std::string& error) {
  std::string json;
  if (!readTextFile(path, json, error)) return false;
  if (!tokenFileFromJson(json, file, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

bool writeTokenFile(const std::string& path, const TokenFile& file, std::string& error) {
  return writeTextFile(path, tokenFileToJson(file) + "\n", error);
}

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------

bool readTextFile(const std::string& path, std::string& out, std::string& error) {
  FILE* file = std::fopen(path.c_str(), "rb");
  if (!file) {
    error = "Failed to open file: " + path;
    return false;
  }

  std::string text;
  char buffer[4096];
  size_t count = 0;
  while ((count = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
    text.append(buffer, count);
  }
  bool failed = std::ferror(file) != 0;
  std::fclose(file);

  if (failed) {
    error = "Failed to read file: " + path;
    return false;
  }
  out.swap(text);
  return true;
}

bool writeTextFile(const std::string& path, const std::string& text, std::string& error) {
  FILE* file = std::fopen(path.c_str(), "wb");
  if (!file) {
    error = "Failed to open file for writing: " + path;
    return false;
  }
  size_t written = std::fwrite(text.data(), 1, text.size(), file);
  bool closed = std::fclose(file) == 0;
  if (written != text.size() || !closed) {
    error = "Failed to write file: " + path;
    return false;
  }
  return true;
}

}  // namespace remi
