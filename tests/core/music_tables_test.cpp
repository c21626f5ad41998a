// Tests for core/music_tables.h -- DSL lookup tables.

#include "core/music_tables.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

namespace tunescript {
namespace {

const MusicTables& tables() { return MusicTables::defaults(); }

// ---------------------------------------------------------------------------
// Note names
// ---------------------------------------------------------------------------

TEST(MusicTablesTest, NoteSemitoneHandlesAccidentals) {
  EXPECT_EQ(tables().noteSemitone("C"), 0);
  EXPECT_EQ(tables().noteSemitone("f#"), 6);
  EXPECT_EQ(tables().noteSemitone("Bb"), 10);
  EXPECT_EQ(tables().noteSemitone("Cb"), -1);
  EXPECT_EQ(tables().noteSemitone("B#"), 12);
  EXPECT_FALSE(tables().noteSemitone("H").has_value());
  EXPECT_FALSE(tables().noteSemitone("Cx").has_value());
  EXPECT_FALSE(tables().noteSemitone("").has_value());
}

TEST(MusicTablesTest, NotePitchUsesMiddleCOctaveFour) {
  EXPECT_EQ(notePitch(tables(), "C", 4), 60);
  EXPECT_EQ(notePitch(tables(), "A", 4), 69);
  EXPECT_EQ(notePitch(tables(), "Eb", 3), 51);
  EXPECT_EQ(rawNotePitch(tables(), "G", 9), 127);
  EXPECT_EQ(rawNotePitch(tables(), "B", 9), 131);
  EXPECT_EQ(notePitch(tables(), "B", 9), 127);
  EXPECT_EQ(notePitch(tables(), "Cb", -1), 0);
}

// ---------------------------------------------------------------------------
// Chord qualities
// ---------------------------------------------------------------------------

TEST(MusicTablesTest, ChordIntervalsExactMatches) {
  EXPECT_EQ(tables().chordIntervals(""), (std::vector<int>{0, 4, 7}));
  EXPECT_EQ(tables().chordIntervals("m"), (std::vector<int>{0, 3, 7}));
  EXPECT_EQ(tables().chordIntervals("maj7"), (std::vector<int>{0, 4, 7, 11}));
  EXPECT_EQ(tables().chordIntervals("MAJ7"), (std::vector<int>{0, 4, 7, 11}));
  EXPECT_EQ(tables().chordIntervals("9"), (std::vector<int>{0, 4, 7, 10, 14}));
}

TEST(MusicTablesTest, ChordIntervalsFuzzyFallbacks) {
  EXPECT_EQ(tables().chordIntervals("maj9"), (std::vector<int>{0, 4, 7}));
  EXPECT_EQ(tables().chordIntervals("min"), (std::vector<int>{0, 3, 7}));
  EXPECT_EQ(tables().chordIntervals("min7b5"), (std::vector<int>{0, 3, 7, 10}));
  EXPECT_EQ(tables().chordIntervals("7sus4"), (std::vector<int>{0, 5, 7}));
  EXPECT_EQ(tables().chordIntervals("13"), (std::vector<int>{0, 4, 7}));
  EXPECT_EQ(tables().chordIntervals("7b9"), (std::vector<int>{0, 4, 7, 10}));
  EXPECT_EQ(tables().chordIntervals("aug7"), (std::vector<int>{0, 4, 8}));
}

TEST(MusicTablesTest, UnknownQualityResolvesToMajorTriad) {
  EXPECT_EQ(tables().chordIntervals("blah"), (std::vector<int>{0, 4, 7}));
  EXPECT_FALSE(tables().isKnownQuality("blah"));
  EXPECT_TRUE(tables().isKnownQuality("sus2"));
}

TEST(MusicTablesTest, ChordPitchesClampAndDefaultRoot) {
  EXPECT_EQ(chordPitches(tables(), "C", "maj7", 4), (std::vector<uint8_t>{60, 64, 67, 71}));
  EXPECT_EQ(chordPitches(tables(), "A", "m", 4), (std::vector<uint8_t>{69, 72, 76}));
  EXPECT_EQ(chordPitches(tables(), "G", "", 9), (std::vector<uint8_t>{127, 127, 127}));
  EXPECT_EQ(chordPitches(tables(), "?", "", 4), (std::vector<uint8_t>{60, 64, 67}));
}

// ---------------------------------------------------------------------------
// Durations, dynamics, instruments, drums
// ---------------------------------------------------------------------------

TEST(MusicTablesTest, DurationAndDynamicsCodes) {
  EXPECT_EQ(tables().durationBeats("dq"), 1.5);
  EXPECT_EQ(tables().durationBeats("t"), 0.333);
  EXPECT_FALSE(tables().durationBeats("x").has_value());
  EXPECT_EQ(tables().dynamicsVelocity("ppp"), 0.15);
  EXPECT_EQ(tables().dynamicsVelocity("fff"), 1.0);
  EXPECT_FALSE(tables().dynamicsVelocity("q").has_value());
}

TEST(MusicTablesTest, InstrumentPrograms) {
  EXPECT_EQ(tables().instrumentProgram("piano"), 0);
  EXPECT_EQ(tables().instrumentProgram("BASS"), 33);
  EXPECT_EQ(tables().instrumentProgram("strings"), 48);
  EXPECT_EQ(tables().instrumentProgram("theremin"), kDefaultProgram);
  EXPECT_EQ(tables().instrumentProgram("drums"), kDefaultProgram);
  EXPECT_TRUE(tables().isPercussionInstrument("Kit"));
  EXPECT_FALSE(tables().isPercussionInstrument("piano"));
  EXPECT_TRUE(tables().isKnownInstrument("Electric_Piano"));
  EXPECT_FALSE(tables().isKnownInstrument("theremin"));
}

TEST(MusicTablesTest, DrumPitches) {
  EXPECT_EQ(tables().drumPitch("kick"), 36);
  EXPECT_EQ(tables().drumPitch("snare"), 38);
  EXPECT_EQ(tables().drumPitch("HAT"), 42);
  EXPECT_EQ(tables().drumPitch("crash"), 49);
  EXPECT_EQ(tables().drumPitch("gong"), kDefaultDrumPitch);
}

TEST(MusicTablesTest, ModifiedCopyLeavesDefaultsUntouched) {
  MusicTables custom = MusicTables::makeDefault();
  custom.instrument_programs["theremin"] = 79;
  EXPECT_EQ(custom.instrumentProgram("theremin"), 79);
  EXPECT_EQ(tables().instrumentProgram("theremin"), kDefaultProgram);
}

// ---------------------------------------------------------------------------
// Value conversion
// ---------------------------------------------------------------------------

TEST(MusicTablesTest, VelocityToMidiTruncatesAndClamps) {
  EXPECT_EQ(velocityToMidi(0.7), 88);
  EXPECT_EQ(velocityToMidi(1.0), 127);
  EXPECT_EQ(velocityToMidi(1.5), 127);
  EXPECT_EQ(velocityToMidi(0.0), 0);
  EXPECT_EQ(velocityToMidi(0.0, 1), 1);
  EXPECT_EQ(clampMidi(-5), 0);
  EXPECT_EQ(clampMidi(200), 127);
}

TEST(MusicTablesTest, VelocityToMidiSaturatesExtremeInput) {
  EXPECT_EQ(velocityToMidi(1e300), 127);
  EXPECT_EQ(velocityToMidi(-1e300), 0);
  EXPECT_EQ(velocityToMidi(-1e300, 1), 1);
  EXPECT_EQ(velocityToMidi(std::nan(""), 1), 1);
}

TEST(MusicTablesTest, PanToMidiRoundsToCenter) {
  EXPECT_EQ(panToMidi(0.5), 64);
  EXPECT_EQ(panToMidi(0.0), 0);
  EXPECT_EQ(panToMidi(1.0), 127);
  EXPECT_EQ(panToMidi(0.25), 32);
  EXPECT_EQ(panToMidi(-3.0), 0);
  EXPECT_EQ(panToMidi(7.0), 127);
}

TEST(MusicTablesTest, ExtremeOctavesClampWithoutOverflow) {
  const int max_octave = std::numeric_limits<int>::max();
  const int min_octave = std::numeric_limits<int>::min();
  EXPECT_EQ(chordPitches(tables(), "C", "", max_octave), (std::vector<uint8_t>{127, 127, 127}));
  EXPECT_EQ(chordPitches(tables(), "C", "", min_octave), (std::vector<uint8_t>{0, 0, 0}));
  EXPECT_EQ(notePitch(tables(), "B", max_octave), 127);
  EXPECT_EQ(notePitch(tables(), "C", min_octave), 0);
}

}  // namespace
}  // namespace tunescript
