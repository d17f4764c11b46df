// Tests for MidiReader -- SMF parsing, round-trip with MidiWriter.

#include "midi/midi_reader.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "midi/midi_stream.h"
#include "midi/midi_writer.h"
#include "test_helpers.h"

namespace remi {
namespace {

using test_helpers::makeNote;

/// @brief Wrap one track payload into a format 0 file.
std::vector<uint8_t> singleTrackFile(const std::vector<uint8_t>& track, uint16_t division) {
  std::vector<uint8_t> header;
  writeBE16(header, 0);
  writeBE16(header, 1);
  writeBE16(header, division);

  std::vector<uint8_t> file;
  writeChunk(file, "MThd", header);
  writeChunk(file, "MTrk", track);
  return file;
}

// ---------------------------------------------------------------------------
// Invalid input
// ---------------------------------------------------------------------------

TEST(MidiReaderTest, ReadNonExistentFileReturnsFalse) {
  MidiReader reader;
  std::string path = "/tmp/remi_nonexistent_file_12345.mid";
  EXPECT_FALSE(reader.read(path));
  EXPECT_NE(reader.getError().find(path), std::string::npos);
}

TEST(MidiReaderTest, ReadEmptyDataReturnsFalse) {
  MidiReader reader;
  std::vector<uint8_t> empty_data;
  EXPECT_FALSE(reader.read(empty_data));
  EXPECT_FALSE(reader.getError().empty());
}

TEST(MidiReaderTest, ReadInvalidMagicBytesReturnsFalse) {
  MidiReader reader;
  std::vector<uint8_t> bad_header = {
      0x00, 0x00, 0x00, 0x00,  // Not "MThd"
      0x00, 0x00, 0x00, 0x06,  // Header length = 6
      0x00, 0x01,              // Format 1
      0x00, 0x00,              // 0 tracks
      0x01, 0xE0               // Division = 480
  };
  EXPECT_FALSE(reader.read(bad_header));
  EXPECT_NE(reader.getError().find("MThd"), std::string::npos);
}

TEST(MidiReaderTest, SmpteDivisionRejected) {
  MidiReader reader;
  std::vector<uint8_t> smpte = {
      0x4D, 0x54, 0x68, 0x64,  // "MThd"
      0x00, 0x00, 0x00, 0x06,
      0x00, 0x00,
      0x00, 0x00,
      0xE7, 0x28               // -25 fps, 40 ticks per frame
  };
  EXPECT_FALSE(reader.read(smpte));
  EXPECT_NE(reader.getError().find("SMPTE"), std::string::npos);
}

TEST(MidiReaderTest, TruncatedTrackChunkFails) {
  MidiReader reader;
  std::vector<uint8_t> file = {
      0x4D, 0x54, 0x68, 0x64, 0x00, 0x00, 0x00, 0x06,
      0x00, 0x01, 0x00, 0x01, 0x01, 0xE0,
      0x4D, 0x54, 0x72, 0x6B, 0x00, 0x00, 0x00, 0x40  // claims 64 bytes
  };
  EXPECT_FALSE(reader.read(file));
}

// ---------------------------------------------------------------------------
// Hand-built track
// ---------------------------------------------------------------------------

TEST(MidiReaderTest, ParsesNotesTempoAndMeter) {
  std::vector<uint8_t> track;
  writeMetaEvent(track, 0, MetaType::kTempo, {0x07, 0xA1, 0x20});  // 500000 us = 120 bpm
  writeMetaEvent(track, 0, MetaType::kTimeSignature, {3, 2, 24, 8});  // 3/4
  // Program change ch 0 -> 40 (violin)
  track.insert(track.end(), {0x00, 0xC0, 40});
  // Note on C4, running status note on E4
  track.insert(track.end(), {0x00, 0x90, 60, 90});
  track.insert(track.end(), {0x00, 64, 80});
  // 480 ticks later: note off via velocity 0 (running status), then E4 off
  track.insert(track.end(), {0x83, 0x60, 60, 0});
  track.insert(track.end(), {0x00, 0x80, 64, 0});
  // Tempo change to 60 bpm at tick 960
  writeMetaEvent(track, 480, MetaType::kTempo, {0x0F, 0x42, 0x40});
  writeMetaEvent(track, 0, MetaType::kEndOfTrack, {});

  MidiReader reader;
  ASSERT_TRUE(reader.read(singleTrackFile(track, 480))) << reader.getError();
  const Score& score = reader.getScore();

  EXPECT_EQ(score.time_division, 480);
  ASSERT_EQ(score.tracks.size(), 1u);
  EXPECT_EQ(score.tracks[0].program, 40);
  ASSERT_EQ(score.tracks[0].notes.size(), 2u);
  EXPECT_EQ(score.tracks[0].notes[0].pitch, 60);
  EXPECT_EQ(score.tracks[0].notes[0].velocity, 90);
  EXPECT_EQ(score.tracks[0].notes[0].end_tick, 480u);
  EXPECT_EQ(score.tracks[0].notes[1].pitch, 64);
  EXPECT_EQ(score.tracks[0].notes[1].program, 40);

  ASSERT_EQ(score.tempo_changes.size(), 2u);
  EXPECT_DOUBLE_EQ(score.tempo_changes[0].tempo, 120.0);
  EXPECT_EQ(score.tempo_changes[1].tick, 960u);
  EXPECT_DOUBLE_EQ(score.tempo_changes[1].tempo, 60.0);

  ASSERT_EQ(score.time_signatures.size(), 1u);
  EXPECT_EQ(score.time_signatures[0].time_sig, (TimeSignature{3, 4}));
  EXPECT_EQ(score.max_tick, 480u);
}

TEST(MidiReaderTest, DrumChannelGoesToDrumBucket) {
  std::vector<uint8_t> track;
  track.insert(track.end(), {0x00, 0x99, 36, 100});  // ch 10 note on
  track.insert(track.end(), {0x00, 0x90, 60, 100});  // ch 1 note on
  track.insert(track.end(), {0x60, 0x89, 36, 0});
  track.insert(track.end(), {0x00, 0x80, 60, 0});
  writeMetaEvent(track, 0, MetaType::kEndOfTrack, {});

  MidiReader reader;
  ASSERT_TRUE(reader.read(singleTrackFile(track, 96))) << reader.getError();
  const Score& score = reader.getScore();
  ASSERT_EQ(score.tracks.size(), 2u);
  EXPECT_TRUE(score.tracks[0].isDrum());
  EXPECT_EQ(score.tracks[0].notes[0].pitch, 36);
  EXPECT_EQ(score.tracks[0].notes[0].program, kDrumProgram);
  EXPECT_EQ(score.tracks[1].program, 0);
}

TEST(MidiReaderTest, OverlappingSamePitchClosesInOrder) {
  std::vector<uint8_t> track;
  track.insert(track.end(), {0x00, 0x90, 60, 100});
  track.insert(track.end(), {0x10, 0x90, 60, 50});
  track.insert(track.end(), {0x10, 0x80, 60, 0});
  track.insert(track.end(), {0x10, 0x80, 60, 0});
  writeMetaEvent(track, 0, MetaType::kEndOfTrack, {});

  MidiReader reader;
  ASSERT_TRUE(reader.read(singleTrackFile(track, 96)));
  const auto& notes = reader.getScore().tracks.at(0).notes;
  ASSERT_EQ(notes.size(), 2u);
  EXPECT_EQ(notes[0].start_tick, 0u);
  EXPECT_EQ(notes[0].end_tick, 32u);
  EXPECT_EQ(notes[0].velocity, 100);
  EXPECT_EQ(notes[1].start_tick, 16u);
  EXPECT_EQ(notes[1].end_tick, 48u);
}

TEST(MidiReaderTest, UnterminatedNoteEndsAtTrackEnd) {
  std::vector<uint8_t> track;
  track.insert(track.end(), {0x00, 0x90, 62, 100});
  writeMetaEvent(track, 200, MetaType::kEndOfTrack, {});

  MidiReader reader;
  ASSERT_TRUE(reader.read(singleTrackFile(track, 96)));
  const auto& notes = reader.getScore().tracks.at(0).notes;
  ASSERT_EQ(notes.size(), 1u);
  EXPECT_EQ(notes[0].end_tick, 200u);
}

// ---------------------------------------------------------------------------
// Round-trip with MidiWriter
// ---------------------------------------------------------------------------

TEST(MidiReaderTest, RoundTripWithWriter) {
  Score score;
  score.time_division = 384;
  Track piano;
  piano.program = 0;
  piano.name = "Piano";
  piano.notes = {makeNote(60, 0, 384, 80), makeNote(67, 384, 192, 64)};
  Track drums;
  drums.program = kDrumProgram;
  drums.notes = {makeNote(38, 192, 96, 110, kDrumProgram)};
  score.tracks = {piano, drums};
  score.tempo_changes = {{100.0, 0}, {150.0, 1536}};
  score.time_signatures = {{{4, 4}, 0}, {{6, 8}, 1536}};

  MidiWriter writer;
  writer.build(score);

  MidiReader reader;
  ASSERT_TRUE(reader.read(writer.toBytes())) << reader.getError();
  const Score& parsed = reader.getScore();

  EXPECT_EQ(reader.getFormat(), 1);
  EXPECT_EQ(parsed.time_division, 384);
  ASSERT_EQ(parsed.tracks.size(), 2u);
  EXPECT_EQ(parsed.tracks[0].name, "Piano");
  ASSERT_EQ(parsed.tracks[0].notes.size(), 2u);
  EXPECT_EQ(parsed.tracks[0].notes[1].pitch, 67);
  EXPECT_EQ(parsed.tracks[0].notes[1].start_tick, 384u);
  EXPECT_EQ(parsed.tracks[0].notes[1].end_tick, 576u);
  EXPECT_EQ(parsed.tracks[0].notes[1].velocity, 64);
  EXPECT_TRUE(parsed.tracks[1].isDrum());

  ASSERT_EQ(parsed.tempo_changes.size(), 2u);
  EXPECT_NEAR(parsed.tempo_changes[0].tempo, 100.0, 0.01);
  EXPECT_NEAR(parsed.tempo_changes[1].tempo, 150.0, 0.01);
  EXPECT_EQ(parsed.tempo_changes[1].tick, 1536u);

  ASSERT_EQ(parsed.time_signatures.size(), 2u);
  EXPECT_EQ(parsed.time_signatures[1].time_sig, (TimeSignature{6, 8}));
  EXPECT_EQ(parsed.time_signatures[1].tick, 1536u);
}

}  // namespace
}  // namespace remi
