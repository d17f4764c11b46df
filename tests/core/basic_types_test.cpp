// Tests for core/basic_types.h and core/gm_program.h.

#include "core/basic_types.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/gm_program.h"
#include "test_helpers.h"

namespace remi {
namespace {

using test_helpers::makeNote;

// ---------------------------------------------------------------------------
// Defaults
// ---------------------------------------------------------------------------

TEST(BasicTypesTest, Defaults) {
  EXPECT_EQ(kDefaultTempo, 120);
  EXPECT_EQ(kDefaultNumerator, 4);
  EXPECT_EQ(kDefaultDenominator, 4);
  EXPECT_EQ(kDefaultTimeDivision, 384);
  EXPECT_EQ(kDrumProgram, -1);
  EXPECT_EQ(kDrumChannel, 9);
}

TEST(BasicTypesTest, NoteDuration) {
  Note note = makeNote(60, 480, 240);
  EXPECT_EQ(note.duration(), 240u);

  // Malformed notes report zero length instead of wrapping.
  note.end_tick = 100;
  EXPECT_EQ(note.duration(), 0u);
}

TEST(BasicTypesTest, DrumFlags) {
  Note note = makeNote(36, 0, 120, 100, kDrumProgram);
  EXPECT_TRUE(note.isDrum());

  Track track;
  EXPECT_FALSE(track.isDrum());
  track.program = kDrumProgram;
  EXPECT_TRUE(track.isDrum());
}

TEST(BasicTypesTest, TicksPerBarUsesNumeratorOnly) {
  TimeSignature four_four;
  EXPECT_EQ(four_four.ticksPerBar(480), 1920u);

  TimeSignature three_eight{3, 8};
  EXPECT_EQ(three_eight.ticksPerBar(480), 1440u);
}

TEST(BasicTypesTest, TimeSignatureEquality) {
  EXPECT_EQ((TimeSignature{3, 4}), (TimeSignature{3, 4}));
  EXPECT_NE((TimeSignature{3, 4}), (TimeSignature{3, 8}));
  EXPECT_EQ(timeSignatureToString({6, 8}), "6/8");
}

// ---------------------------------------------------------------------------
// Score
// ---------------------------------------------------------------------------

TEST(BasicTypesTest, ScoreNoteCountAndMaxTick) {
  Score score;
  Track piano;
  piano.notes = {makeNote(60, 0, 480), makeNote(64, 480, 960)};
  Track bass;
  bass.program = 33;
  bass.notes = {makeNote(36, 0, 1920)};
  score.tracks = {piano, bass};

  EXPECT_EQ(score.noteCount(), 3u);
  score.updateMaxTick();
  EXPECT_EQ(score.max_tick, 1920u);
}

TEST(BasicTypesTest, SortNotesByStartThenPitch) {
  std::vector<Note> notes = {makeNote(67, 480, 10), makeNote(64, 0, 10), makeNote(60, 0, 10),
                             makeNote(60, 480, 10)};
  sortNotes(notes);
  ASSERT_EQ(notes.size(), 4u);
  EXPECT_EQ(notes[0].pitch, 60);
  EXPECT_EQ(notes[1].pitch, 64);
  EXPECT_EQ(notes[2].pitch, 60);
  EXPECT_EQ(notes[3].pitch, 67);
}

TEST(BasicTypesTest, SortNotesKeepsTieOrder) {
  std::vector<Note> notes = {makeNote(60, 0, 10, 100, 5), makeNote(60, 0, 10, 100, 1)};
  sortNotes(notes);
  EXPECT_EQ(notes[0].program, 5);
  EXPECT_EQ(notes[1].program, 1);
}

// ---------------------------------------------------------------------------
// GM program names
// ---------------------------------------------------------------------------

TEST(GmProgramTest, Names) {
  EXPECT_STREQ(gmProgramName(GmProgram::kPiano), "Acoustic Grand Piano");
  EXPECT_STREQ(gmProgramName(kDrumProgram), "Drums");
  EXPECT_STREQ(gmProgramName(128), "Unknown");
  EXPECT_STREQ(gmProgramName(-2), "Unknown");
}

TEST(GmProgramTest, EveryProgramHasAName) {
  for (int program = GmProgram::kFirst; program <= GmProgram::kLast; ++program) {
    std::string name = gmProgramName(program);
    EXPECT_FALSE(name.empty()) << "program " << program;
    EXPECT_NE(name, "Unknown") << "program " << program;
  }
}

}  // namespace
}  // namespace remi
