// Tests for tokenizer/config_io.h -- config and token file JSON.

#include "tokenizer/config_io.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

namespace remi {
namespace {

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------

TEST(ConfigIoTest, MissingKeysKeepDefaults) {
  TokenizerConfig config = configFromJson(parseJsonObject(R"({"use_tempos": true})"));
  EXPECT_TRUE(config.use_tempos);
  EXPECT_EQ(config.pitch_min, 21);
  EXPECT_EQ(config.nb_velocities, 32);
  EXPECT_EQ(config.special_tokens.size(), 4u);
}

TEST(ConfigIoTest, ReadsEveryKey) {
  TokenizerConfig config = configFromJson(parseJsonObject(R"({
    "pitch_range": [30, 90],
    "beat_res": [[0, 2, 4], [2, 8, 2]],
    "nb_velocities": 16,
    "use_chords": true,
    "use_rests": true,
    "use_tempos": true,
    "use_time_signatures": true,
    "nb_tempos": 8,
    "tempo_range": [60, 200],
    "time_signature_range": [16, 3],
    "num_bars": 64,
    "special_tokens": ["PAD", "EOS"],
    "chords_known_only": true,
    "resync_ticks_per_bar": true
  })"));
  EXPECT_EQ(config.pitch_min, 30);
  EXPECT_EQ(config.pitch_max, 90);
  ASSERT_EQ(config.beat_res.size(), 2u);
  EXPECT_EQ(config.beat_res[1].beat_end, 8);
  EXPECT_EQ(config.beat_res[1].resolution, 2);
  EXPECT_EQ(config.nb_velocities, 16);
  EXPECT_TRUE(config.use_chords);
  EXPECT_TRUE(config.use_rests);
  EXPECT_TRUE(config.use_time_signatures);
  EXPECT_EQ(config.nb_tempos, 8);
  EXPECT_EQ(config.tempo_max, 200);
  EXPECT_EQ(config.time_signature_range.max_denominator, 16);
  EXPECT_EQ(config.time_signature_range.max_bar_beats, 3);
  EXPECT_EQ(config.num_bars, 64);
  EXPECT_EQ(config.special_tokens, (std::vector<std::string>{"PAD", "EOS"}));
  EXPECT_TRUE(config.chords_known_only);
  EXPECT_TRUE(config.resync_ticks_per_bar);
}

TEST(ConfigIoTest, WrittenConfigReadsBack) {
  TokenizerConfig config;
  config.pitch_min = 24;
  config.use_chords = true;
  config.num_bars = 16;
  config.beat_res = {{0, 1, 12}, {1, 4, 4}};

  TokenizerConfig loaded = configFromJson(parseJsonObject(configToJson(config)));
  EXPECT_EQ(loaded.pitch_min, 24);
  EXPECT_TRUE(loaded.use_chords);
  EXPECT_EQ(loaded.num_bars, 16);
  ASSERT_EQ(loaded.beat_res.size(), 2u);
  EXPECT_EQ(loaded.beat_res[0].resolution, 12);
  EXPECT_EQ(loaded.maxResolution(), 12);
}

TEST(ConfigIoTest, SaveAndLoadFile) {
  std::string path = "/tmp/remi_config_io_test.json";
  TokenizerConfig config;
  config.use_time_signatures = true;
  std::string error;
  ASSERT_TRUE(saveConfig(path, config, error)) << error;

  TokenizerConfig loaded;
  ASSERT_TRUE(loadConfig(path, loaded, error)) << error;
  EXPECT_TRUE(loaded.use_time_signatures);
  std::remove(path.c_str());
}

TEST(ConfigIoTest, LoadRejectsInvalidConfig) {
  std::string path = "/tmp/remi_config_io_invalid.json";
  std::string error;
  ASSERT_TRUE(writeTextFile(path, R"({"pitch_range": [100, 50]})", error));

  TokenizerConfig loaded;
  EXPECT_FALSE(loadConfig(path, loaded, error));
  EXPECT_NE(error.find(path), std::string::npos);
  EXPECT_EQ(loaded.pitch_min, 21);
  std::remove(path.c_str());
}

TEST(ConfigIoTest, LoadMissingFileFails) {
  TokenizerConfig loaded;
  std::string error;
  EXPECT_FALSE(loadConfig("/tmp/remi_no_such_config_12345.json", loaded, error));
  EXPECT_FALSE(error.empty());
}

// ---------------------------------------------------------------------------
// Token files
// ---------------------------------------------------------------------------

TEST(ConfigIoTest, TokenFileJsonRoundTrip) {
  TokenFile file;
  file.time_division = 480;
  file.tokens = {"Bar_None", "Position_0"};
  file.ids = {4, 218};

  TokenFile parsed;
  std::string error;
  ASSERT_TRUE(tokenFileFromJson(tokenFileToJson(file), parsed, error)) << error;
  EXPECT_EQ(parsed.time_division, 480);
  EXPECT_EQ(parsed.tokens, file.tokens);
  EXPECT_EQ(parsed.ids, file.ids);
}

TEST(ConfigIoTest, TokenFileNeedsTokensOrIds) {
  TokenFile parsed;
  std::string error;
  EXPECT_FALSE(tokenFileFromJson(R"({"time_division": 480})", parsed, error));
  EXPECT_FALSE(error.empty());

  ASSERT_TRUE(tokenFileFromJson(R"({"ids": [4, 5]})", parsed, error)) << error;
  EXPECT_EQ(parsed.time_division, kDefaultTimeDivision);
  EXPECT_TRUE(parsed.tokens.empty());
  EXPECT_EQ(parsed.ids.size(), 2u);
}

TEST(ConfigIoTest, TokenFileRejectsBadContent) {
  TokenFile parsed;
  std::string error;
  EXPECT_FALSE(tokenFileFromJson(R"({"time_division": 0, "tokens": []})", parsed, error));
  EXPECT_FALSE(tokenFileFromJson(R"({"time_division": 40000, "tokens": []})", parsed, error));
  EXPECT_FALSE(tokenFileFromJson(R"({"tokens": ["Bar_None", 3]})", parsed, error));
  EXPECT_FALSE(tokenFileFromJson("not json", parsed, error));
}

TEST(ConfigIoTest, TokenFileOnDisk) {
  std::string path = "/tmp/remi_token_file_test.json";
  TokenFile file;
  file.time_division = 96;
  file.tokens = {"Bar_None"};
  std::string error;
  ASSERT_TRUE(writeTokenFile(path, file, error)) << error;

  TokenFile parsed;
  ASSERT_TRUE(readTokenFile(path, parsed, error)) << error;
  EXPECT_EQ(parsed.time_division, 96);
  EXPECT_EQ(parsed.tokens, file.tokens);
  std::remove(path.c_str());
}

TEST(ConfigIoTest, WriteToInvalidPathFails) {
  std::string error;
  EXPECT_FALSE(writeTextFile("/nonexistent_dir/out.json", "{}", error));
  EXPECT_NE(error.find("/nonexistent_dir/out.json"), std::string::npos);
}

}  // namespace
}  // namespace remi
