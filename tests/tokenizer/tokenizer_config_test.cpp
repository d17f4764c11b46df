// Tests for tokenizer/tokenizer_config.h -- derived tables, validation and
// time signature reduction.

#include "tokenizer/tokenizer_config.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace remi {
namespace {

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

TEST(TokenizerConfigTest, Resolutions) {
  TokenizerConfig config;
  EXPECT_EQ(config.maxResolution(), 8);
  EXPECT_EQ(config.firstResolution(), 8);
  EXPECT_EQ(config.resolutionForBeat(0), 8);
  EXPECT_EQ(config.resolutionForBeat(3), 8);
  EXPECT_EQ(config.resolutionForBeat(4), 4);
  EXPECT_EQ(config.resolutionForBeat(40), 4);
  EXPECT_EQ(config.positionCount(), 32);
}

TEST(TokenizerConfigTest, TicksPerSampleAndDivisionSupport) {
  TokenizerConfig config;
  EXPECT_EQ(config.ticksPerSample(480), 60u);
  EXPECT_EQ(config.ticksPerSample(384), 48u);
  EXPECT_TRUE(config.supportsTimeDivision(480));
  EXPECT_FALSE(config.supportsTimeDivision(100));
  EXPECT_FALSE(config.supportsTimeDivision(0));
}

// ---------------------------------------------------------------------------
// Duration bins
// ---------------------------------------------------------------------------

TEST(TokenizerConfigTest, DurationBinsDefault) {
  TokenizerConfig config;
  auto bins = config.durationBins();
  ASSERT_EQ(bins.size(), 64u);

  // Zero-length bin dropped: the table starts one sample in.
  EXPECT_EQ(bins.front().label(), "0.1");
  EXPECT_EQ(bins.front().ticks(480), 60u);

  // Closing bin spans the full last range.
  EXPECT_EQ(bins.back().label(), "12.0");
  EXPECT_EQ(bins.back().ticks(480), 5760u);
}

TEST(TokenizerConfigTest, DurationBinsAscending) {
  TokenizerConfig config;
  auto bins = config.durationBins();
  for (size_t idx = 1; idx < bins.size(); ++idx) {
    EXPECT_LT(bins[idx - 1].ticks(480), bins[idx].ticks(480)) << bins[idx].label();
  }
}

TEST(TokenizerConfigTest, CoarseRangeUsesItsResolution) {
  TokenizerConfig config;
  auto bins = config.durationBins();
  // (4, 1) in the second range is a quarter beat, not an eighth.
  auto iter = std::find_if(bins.begin(), bins.end(), [](const DurationBin& bin) {
    return bin.beats == 4 && bin.subdivision == 1;
  });
  ASSERT_NE(iter, bins.end());
  EXPECT_EQ(iter->ticks(480), 4u * 480u + 120u);
}

// ---------------------------------------------------------------------------
// Velocity / tempo / time signature tables
// ---------------------------------------------------------------------------

TEST(TokenizerConfigTest, VelocityBins) {
  TokenizerConfig config;
  auto bins = config.velocityBins();
  ASSERT_EQ(bins.size(), 32u);
  EXPECT_EQ(bins.front(), 3);
  EXPECT_EQ(bins[24], 99);
  EXPECT_EQ(bins.back(), 127);
}

TEST(TokenizerConfigTest, TempoBins) {
  TokenizerConfig config;
  auto bins = config.tempoBins();
  ASSERT_EQ(bins.size(), 32u);
  EXPECT_EQ(bins.front(), 40);
  EXPECT_EQ(bins[1], 46);
  EXPECT_EQ(bins.back(), 250);
  for (size_t idx = 1; idx < bins.size(); ++idx) EXPECT_LT(bins[idx - 1], bins[idx]);
}

TEST(TokenizerConfigTest, TimeSignatureTable) {
  TokenizerConfig config;
  auto sigs = config.timeSignatures();
  // Denominators 1, 2, 4, 8 with up to 2 bars' worth of beats: 2 + 4 + 8 + 16.
  ASSERT_EQ(sigs.size(), 30u);
  EXPECT_EQ(sigs.front(), (TimeSignature{1, 1}));
  EXPECT_EQ(sigs.back(), (TimeSignature{16, 8}));
  EXPECT_NE(std::find(sigs.begin(), sigs.end(), TimeSignature{4, 4}), sigs.end());
}

// ---------------------------------------------------------------------------
// Reduction
// ---------------------------------------------------------------------------

TEST(ReduceTimeSignatureTest, SupportedPassesThrough) {
  TimeSignatureRange range;
  auto reduced = reduceTimeSignature(3, 4, range);
  ASSERT_TRUE(reduced.has_value());
  EXPECT_EQ(*reduced, (TimeSignature{3, 4}));
}

TEST(ReduceTimeSignatureTest, HalvesLargeDenominator) {
  TimeSignatureRange range;
  auto reduced = reduceTimeSignature(6, 16, range);
  ASSERT_TRUE(reduced.has_value());
  EXPECT_EQ(*reduced, (TimeSignature{3, 8}));
}

TEST(ReduceTimeSignatureTest, OddNumeratorOverLargeDenominatorRejected) {
  TimeSignatureRange range;
  EXPECT_FALSE(reduceTimeSignature(7, 16, range).has_value());
}

TEST(ReduceTimeSignatureTest, NonPowerOfTwoDenominatorRoundsDown) {
  TimeSignatureRange range;
  auto reduced = reduceTimeSignature(4, 3, range);
  ASSERT_TRUE(reduced.has_value());
  EXPECT_EQ(*reduced, (TimeSignature{4, 2}));
}

TEST(ReduceTimeSignatureTest, TooManyBeatsRejected) {
  TimeSignatureRange range;
  EXPECT_FALSE(reduceTimeSignature(9, 4, range).has_value());
  EXPECT_FALSE(reduceTimeSignature(0, 4, range).has_value());
}

// ---------------------------------------------------------------------------
// Nearest-bin lookups
// ---------------------------------------------------------------------------

TEST(NearestIndexTest, TiesResolveLow) {
  std::vector<int> table = {10, 20, 30};
  EXPECT_EQ(nearestIndex(table, 15), 0u);
  EXPECT_EQ(nearestIndex(table, 16), 1u);
  EXPECT_EQ(nearestIndex(table, 100), 2u);
  EXPECT_EQ(nearestIndex({}, 5), 0u);
}

TEST(NearestIndexTest, DurationBins) {
  std::vector<Tick> ticks = {60, 120, 180};
  EXPECT_EQ(nearestDurationBin(ticks, 0), 0u);
  EXPECT_EQ(nearestDurationBin(ticks, 90), 0u);
  EXPECT_EQ(nearestDurationBin(ticks, 1000), 2u);
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

TEST(TokenizerConfigTest, DefaultIsValid) {
  TokenizerConfig config;
  std::string error;
  EXPECT_TRUE(config.validate(error)) << error;
}

TEST(TokenizerConfigTest, InvalidPitchRange) {
  TokenizerConfig config;
  config.pitch_min = 90;
  config.pitch_max = 80;
  std::string error;
  EXPECT_FALSE(config.validate(error));
  EXPECT_NE(error.find("pitch"), std::string::npos);
}

TEST(TokenizerConfigTest, BeatRangesMustBeContiguous) {
  TokenizerConfig config;
  config.beat_res = {{0, 4, 8}, {5, 12, 4}};
  std::string error;
  EXPECT_FALSE(config.validate(error));
}

TEST(TokenizerConfigTest, SpecialTokenWithUnderscoreRejected) {
  TokenizerConfig config;
  config.special_tokens = {"PAD_X"};
  std::string error;
  EXPECT_FALSE(config.validate(error));
}

TEST(TokenizerConfigTest, BadTimeSignatureRangeRejectedOnlyWhenEnabled) {
  TokenizerConfig config;
  config.time_signature_range.max_denominator = 6;
  std::string error;
  EXPECT_TRUE(config.validate(error));
  config.use_time_signatures = true;
  EXPECT_FALSE(config.validate(error));
}

}  // namespace
}  // namespace remi
