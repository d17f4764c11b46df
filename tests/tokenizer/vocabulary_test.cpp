// Tests for tokenizer/vocabulary.h -- alphabet enumeration and id mapping.

#include "tokenizer/vocabulary.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace remi {
namespace {

size_t countPrefix(const std::vector<std::string>& tokens, const std::string& prefix) {
  size_t count = 0;
  for (const auto& token : tokens) {
    if (token.compare(0, prefix.size(), prefix) == 0) ++count;
  }
  return count;
}

// ---------------------------------------------------------------------------
// Base vocabulary
// ---------------------------------------------------------------------------

TEST(VocabularyTest, DefaultBaseVocabularyCounts) {
  TokenizerConfig config;
  auto vocab = buildBaseVocabulary(config);
  EXPECT_EQ(vocab.size(), 346u);
  EXPECT_EQ(countPrefix(vocab, "Bar_"), 1u);
  EXPECT_EQ(countPrefix(vocab, "Pitch_"), 88u);
  EXPECT_EQ(countPrefix(vocab, "Velocity_"), 32u);
  EXPECT_EQ(countPrefix(vocab, "Duration_"), 64u);
  EXPECT_EQ(countPrefix(vocab, "Position_"), 32u);
  EXPECT_EQ(countPrefix(vocab, "Program_"), 129u);
  EXPECT_EQ(countPrefix(vocab, "TimeSig_"), 0u);
  EXPECT_EQ(countPrefix(vocab, "Chord_"), 0u);
  EXPECT_EQ(countPrefix(vocab, "Tempo_"), 0u);
}

TEST(VocabularyTest, FamilyOrder) {
  TokenizerConfig config;
  config.use_chords = true;
  config.use_tempos = true;
  config.use_time_signatures = true;
  auto vocab = buildBaseVocabulary(config);

  auto first = [&](const std::string& token) {
    return std::find(vocab.begin(), vocab.end(), token) - vocab.begin();
  };
  EXPECT_EQ(first("Bar_None"), 0);
  EXPECT_EQ(first("Pitch_21"), 1);
  EXPECT_LT(first("Pitch_108"), first("Velocity_3"));
  EXPECT_LT(first("Velocity_127"), first("Duration_0.1"));
  EXPECT_LT(first("Duration_12.0"), first("Position_0"));
  EXPECT_LT(first("Position_31"), first("TimeSig_1/1"));
  EXPECT_LT(first("TimeSig_16/8"), first("Chord_3"));
  EXPECT_LT(first("Chord_9min"), first("Tempo_40"));
  EXPECT_LT(first("Tempo_250"), first("Program_-1"));
  EXPECT_EQ(vocab.back(), "Program_127");
}

TEST(VocabularyTest, OptionalFamilyCounts) {
  TokenizerConfig config;
  config.use_chords = true;
  config.use_tempos = true;
  config.use_time_signatures = true;
  auto vocab = buildBaseVocabulary(config);
  EXPECT_EQ(countPrefix(vocab, "Chord_"), 17u);
  EXPECT_EQ(countPrefix(vocab, "Tempo_"), 32u);
  EXPECT_EQ(countPrefix(vocab, "TimeSig_"), 30u);
}

TEST(VocabularyTest, BoundedBars) {
  TokenizerConfig config;
  config.num_bars = 8;
  auto vocab = buildBaseVocabulary(config);
  EXPECT_EQ(countPrefix(vocab, "Bar_"), 8u);
  EXPECT_EQ(vocab.front(), "Bar_0");
  EXPECT_EQ(vocab[7], "Bar_7");
  EXPECT_EQ(std::find(vocab.begin(), vocab.end(), "Bar_None"), vocab.end());
}

TEST(VocabularyTest, IdenticalConfigsProduceIdenticalLists) {
  TokenizerConfig config;
  config.use_chords = true;
  EXPECT_EQ(buildBaseVocabulary(config), buildBaseVocabulary(config));
}

TEST(VocabularyTest, NoDuplicates) {
  TokenizerConfig config;
  config.use_chords = true;
  config.use_tempos = true;
  config.use_time_signatures = true;
  auto vocab = buildBaseVocabulary(config);
  std::vector<std::string> sorted = vocab;
  std::sort(sorted.begin(), sorted.end());
  EXPECT_EQ(std::adjacent_find(sorted.begin(), sorted.end()), sorted.end());
}

// ---------------------------------------------------------------------------
// Id mapping
// ---------------------------------------------------------------------------

TEST(VocabularyTest, SpecialTokensComeFirst) {
  TokenizerConfig config;
  Vocabulary vocab(config);
  EXPECT_EQ(vocab.size(), 350u);
  EXPECT_EQ(vocab.idToToken(0), "PAD_None");
  EXPECT_EQ(vocab.idToToken(3), "MASK_None");
  EXPECT_EQ(vocab.idToToken(4), "Bar_None");
  EXPECT_EQ(vocab.tokenToId("Bar_None"), 4);
}

TEST(VocabularyTest, LookupMisses) {
  TokenizerConfig config;
  Vocabulary vocab(config);
  EXPECT_EQ(vocab.tokenToId("Pitch_0"), kUnknownTokenId);
  EXPECT_FALSE(vocab.contains("Tempo_120"));
  EXPECT_TRUE(vocab.contains("Program_-1"));
  EXPECT_EQ(vocab.idToToken(-1), "");
  EXPECT_EQ(vocab.idToToken(350), "");
}

TEST(VocabularyTest, EncodeDecodeIds) {
  TokenizerConfig config;
  Vocabulary vocab(config);
  std::vector<std::string> tokens = {"Bar_None", "Position_0", "Program_0", "Pitch_60"};
  std::vector<int> ids;
  std::string error;
  ASSERT_TRUE(vocab.encodeIds(tokens, ids, error)) << error;
  ASSERT_EQ(ids.size(), 4u);
  EXPECT_EQ(ids[0], 4);

  std::vector<std::string> decoded;
  ASSERT_TRUE(vocab.decodeIds(ids, decoded, error)) << error;
  EXPECT_EQ(decoded, tokens);
}

TEST(VocabularyTest, EncodeIdsFlagsUnknownButFillsRest) {
  TokenizerConfig config;
  Vocabulary vocab(config);
  std::vector<int> ids;
  std::string error;
  EXPECT_FALSE(vocab.encodeIds({"Bar_None", "Tempo_120", "Pitch_60"}, ids, error));
  ASSERT_EQ(ids.size(), 3u);
  EXPECT_EQ(ids[1], kUnknownTokenId);
  EXPECT_NE(ids[2], kUnknownTokenId);
  EXPECT_NE(error.find("Tempo_120"), std::string::npos);
}

TEST(VocabularyTest, DecodeIdsRejectsOutOfRange) {
  TokenizerConfig config;
  Vocabulary vocab(config);
  std::vector<std::string> tokens;
  std::string error;
  EXPECT_FALSE(vocab.decodeIds({4, 1000}, tokens, error));
  EXPECT_NE(error.find("1000"), std::string::npos);
}

TEST(VocabularyTest, CustomSpecialTokens) {
  TokenizerConfig config;
  config.special_tokens = {"PAD"};
  Vocabulary vocab(config);
  EXPECT_EQ(vocab.size(), 347u);
  EXPECT_EQ(vocab.idToToken(1), "Bar_None");
}

}  // namespace
}  // namespace remi
