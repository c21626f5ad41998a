// Tests for dsl/pattern_parser.h -- instrument and drum slot parsing.

#include "dsl/pattern_parser.h"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

namespace tunescript {
namespace {

class PatternParserTest : public ::testing::Test {
 protected:
  PatternParser parser_{MusicTables::defaults()};

  InstrumentTrack parseTrack(const std::string& pattern) {
    InstrumentTrack track;
    track.name = "Piano";
    track.instrument = "piano";
    parser_.parseInstrumentPattern(pattern, track, warnings_);
    return track;
  }

  std::vector<std::string> warnings_;
};

// ---------------------------------------------------------------------------
// Item scanning
// ---------------------------------------------------------------------------

TEST(PatternScanTest, FindsPitchedItemsLeftToRight) {
  auto items = findPitchedItems("C4(q) Am7 (h, mf)  x(q) F#m(e)");
  ASSERT_EQ(items.size(), 3u);
  EXPECT_EQ(items[0].token, "C4");
  EXPECT_EQ(items[0].params, "q");
  EXPECT_EQ(items[1].token, "Am7");
  EXPECT_EQ(items[1].params, "h, mf");
  EXPECT_EQ(items[2].token, "F#m");
}

TEST(PatternScanTest, PitchedItemNeedsParams) {
  EXPECT_TRUE(findPitchedItems("C4 E4 G4").empty());
  EXPECT_TRUE(findPitchedItems("C4()").empty());
  EXPECT_TRUE(findPitchedItems("C4(q").empty());
}

TEST(PatternScanTest, PitchedItemMayStartInsideAWord) {
  // "Hello(q)" has no match at 'H' but matches from the 'e'.
  auto items = findPitchedItems("Hello(q)");
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].token, "ello");
}

TEST(PatternScanTest, FindsDrumItems) {
  auto items = findDrumItems("kick(1,3) snare (2, 4) hat(8ths)");
  ASSERT_EQ(items.size(), 3u);
  EXPECT_EQ(items[0].token, "kick");
  EXPECT_EQ(items[1].token, "snare");
  EXPECT_EQ(items[1].params, "2, 4");
  EXPECT_EQ(items[2].params, "8ths");
}

TEST(PatternScanTest, NoteTokenShape) {
  EXPECT_TRUE(isNoteToken("C4"));
  EXPECT_TRUE(isNoteToken("f#3"));
  EXPECT_TRUE(isNoteToken("Bb0"));
  EXPECT_TRUE(isNoteToken("G7"));
  EXPECT_FALSE(isNoteToken("Am"));
  EXPECT_FALSE(isNoteToken("C#"));
  EXPECT_FALSE(isNoteToken("C10"));
  EXPECT_FALSE(isNoteToken("H4"));
}

TEST(PatternScanTest, RestSlots) {
  EXPECT_TRUE(isRestSlot(""));
  EXPECT_TRUE(isRestSlot("  _ "));
  EXPECT_FALSE(isRestSlot("__"));
  EXPECT_FALSE(isRestSlot("C4(q)"));
}

// ---------------------------------------------------------------------------
// Drum beats
// ---------------------------------------------------------------------------

TEST(PatternScanTest, DrumBeatsEighths) {
  auto hits = parseDrumBeats("8ths");
  ASSERT_EQ(hits.size(), 8u);
  for (size_t idx = 0; idx < hits.size(); ++idx) {
    EXPECT_DOUBLE_EQ(hits[idx].first, idx * 0.5);
    EXPECT_DOUBLE_EQ(hits[idx].second, 0.7);
  }
  EXPECT_EQ(parseDrumBeats(" Eighths ").size(), 8u);
}

TEST(PatternScanTest, DrumBeatsSixteenths) {
  auto hits = parseDrumBeats("16THS");
  ASSERT_EQ(hits.size(), 16u);
  EXPECT_DOUBLE_EQ(hits[15].first, 3.75);
  EXPECT_DOUBLE_EQ(hits[15].second, 0.6);
  EXPECT_EQ(parseDrumBeats("sixteenths").size(), 16u);
}

TEST(PatternScanTest, DrumBeatsList) {
  auto hits = parseDrumBeats("1, 2.5 ,4,");
  ASSERT_EQ(hits.size(), 3u);
  EXPECT_DOUBLE_EQ(hits[0].first, 0.0);
  EXPECT_DOUBLE_EQ(hits[1].first, 1.5);
  EXPECT_DOUBLE_EQ(hits[2].first, 3.0);
  EXPECT_DOUBLE_EQ(hits[0].second, 0.8);
}

TEST(PatternScanTest, DrumBeatsNonNumericListEmitsNothing) {
  EXPECT_TRUE(parseDrumBeats("1, two, 3").empty());
  EXPECT_TRUE(parseDrumBeats("quarters").empty());
  EXPECT_TRUE(parseDrumBeats("nan").empty());
  EXPECT_TRUE(parseDrumBeats("0x2").empty());
}

TEST(PatternScanTest, DrumBeatsBelowOneAreSkipped) {
  auto hits = parseDrumBeats("0, 0.5, 1");
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_DOUBLE_EQ(hits[0].first, 0.0);
}

// ---------------------------------------------------------------------------
// Params and chord symbols
// ---------------------------------------------------------------------------

TEST_F(PatternParserTest, ParamsDecodeDurationAndDynamics) {
  NoteParams params = parser_.parseParams(" H , FF ");
  EXPECT_DOUBLE_EQ(params.duration, 2.0);
  EXPECT_DOUBLE_EQ(params.velocity, 0.95);

  params = parser_.parseParams("staccato, dq");
  EXPECT_DOUBLE_EQ(params.duration, 1.5);
  EXPECT_DOUBLE_EQ(params.velocity, 0.7);

  params = parser_.parseParams("q, e");
  EXPECT_DOUBLE_EQ(params.duration, 0.5) << "last duration code wins";
}

TEST_F(PatternParserTest, ChordSymbolQualityAndOctave) {
  auto symbol = parser_.parseChordSymbol("Am");
  ASSERT_TRUE(symbol.has_value());
  EXPECT_EQ(symbol->root, "A");
  EXPECT_EQ(symbol->quality, "m");
  EXPECT_EQ(symbol->octave, 4);

  symbol = parser_.parseChordSymbol("bbmaj7");
  EXPECT_EQ(symbol->root, "Bb");
  EXPECT_EQ(symbol->quality, "maj7");

  symbol = parser_.parseChordSymbol("Cmaj73");
  EXPECT_EQ(symbol->quality, "maj7");
  EXPECT_EQ(symbol->octave, 3);

  symbol = parser_.parseChordSymbol("Dm9");
  EXPECT_EQ(symbol->quality, "m");
  EXPECT_EQ(symbol->octave, 9);

  symbol = parser_.parseChordSymbol("C9");
  EXPECT_EQ(symbol->quality, "9");
  EXPECT_EQ(symbol->octave, 4);

  symbol = parser_.parseChordSymbol("Cblah");
  EXPECT_EQ(symbol->quality, "blah");

  EXPECT_FALSE(parser_.parseChordSymbol("Xm").has_value());
}

// ---------------------------------------------------------------------------
// Instrument patterns
// ---------------------------------------------------------------------------

TEST_F(PatternParserTest, ItemsPlayBackToBackWithinSlot) {
  InstrumentTrack track = parseTrack("C4(q) E4(e) G4(h, f)");
  ASSERT_EQ(track.notes.size(), 3u);
  EXPECT_EQ(track.notes[0].pitch, 60);
  EXPECT_DOUBLE_EQ(track.notes[0].start, 0.0);
  EXPECT_EQ(track.notes[1].pitch, 64);
  EXPECT_DOUBLE_EQ(track.notes[1].start, 1.0);
  EXPECT_DOUBLE_EQ(track.notes[1].duration, 0.5);
  EXPECT_EQ(track.notes[2].pitch, 67);
  EXPECT_DOUBLE_EQ(track.notes[2].start, 1.5);
  EXPECT_DOUBLE_EQ(track.notes[2].velocity, 0.85);
  EXPECT_TRUE(warnings_.empty());
}

TEST_F(PatternParserTest, SlotsAdvanceFourBeatsAndRestsOnlyAdvance) {
  InstrumentTrack track = parseTrack("C4(w) | _ |  | Am(h) G4(h)");
  ASSERT_EQ(track.notes.size(), 2u);
  ASSERT_EQ(track.chords.size(), 1u);
  EXPECT_DOUBLE_EQ(track.notes[0].start, 0.0);
  EXPECT_DOUBLE_EQ(track.chords[0].start, 12.0);
  EXPECT_EQ(track.chords[0].root, "A");
  EXPECT_EQ(track.chords[0].quality, "m");
  EXPECT_DOUBLE_EQ(track.notes[1].start, 14.0);
}

TEST_F(PatternParserTest, OverfullSlotDoesNotShiftNextSlot) {
  InstrumentTrack track = parseTrack("C4(w) D4(w) | E4(q)");
  ASSERT_EQ(track.notes.size(), 3u);
  EXPECT_DOUBLE_EQ(track.notes[1].start, 4.0);
  EXPECT_DOUBLE_EQ(track.notes[2].start, 4.0);
}

TEST_F(PatternParserTest, AccidentalsAndFlatRootsKeepCase) {
  InstrumentTrack track = parseTrack("Bb3(q) f#4(q) ebm(q)");
  ASSERT_EQ(track.notes.size(), 2u);
  EXPECT_EQ(track.notes[0].pitch, 58);
  EXPECT_EQ(track.notes[1].pitch, 66);
  ASSERT_EQ(track.chords.size(), 1u);
  EXPECT_EQ(track.chords[0].root, "Eb");
  EXPECT_EQ(track.chords[0].quality, "m");
}

TEST_F(PatternParserTest, OutOfRangeNoteIsClampedWithWarning) {
  InstrumentTrack track = parseTrack("B9(q) Cb0(q)");
  ASSERT_EQ(track.notes.size(), 2u);
  EXPECT_EQ(track.notes[0].pitch, 127);
  EXPECT_EQ(track.notes[1].pitch, 11);
  ASSERT_EQ(warnings_.size(), 1u);
  EXPECT_NE(warnings_[0].find("B9"), std::string::npos);
}

TEST_F(PatternParserTest, MalformedItemsAreSkipped) {
  InstrumentTrack track = parseTrack("C4 q) (q) Z4(q) | ???");
  EXPECT_TRUE(track.notes.empty());
  EXPECT_TRUE(track.chords.empty());
}

// ---------------------------------------------------------------------------
// Drum patterns
// ---------------------------------------------------------------------------

TEST_F(PatternParserTest, DrumPatternUsesSlotIndexForBarStart) {
  DrumTrack drums = parser_.parseDrumPattern("Kick(1,3) | _ | snare(2)");
  ASSERT_EQ(drums.hits.size(), 3u);
  EXPECT_EQ(drums.hits[0].drum, "kick");
  EXPECT_DOUBLE_EQ(drums.hits[0].start, 0.0);
  EXPECT_DOUBLE_EQ(drums.hits[1].start, 2.0);
  EXPECT_EQ(drums.hits[2].drum, "snare");
  EXPECT_DOUBLE_EQ(drums.hits[2].start, 9.0);
  EXPECT_EQ(drums.name, "Drums");
}

TEST_F(PatternParserTest, HatEighthsProducesEightHits) {
  DrumTrack drums = parser_.parseDrumPattern("hat(8ths)");
  ASSERT_EQ(drums.hits.size(), 8u);
  for (size_t idx = 0; idx < 8; ++idx) {
    EXPECT_DOUBLE_EQ(drums.hits[idx].start, idx * 0.5);
    EXPECT_DOUBLE_EQ(drums.hits[idx].velocity, 0.7);
  }
}

TEST_F(PatternParserTest, DrumItemWithBadListIsDroppedOthersKept) {
  DrumTrack drums = parser_.parseDrumPattern("kick(1, x) snare(2)");
  ASSERT_EQ(drums.hits.size(), 1u);
  EXPECT_EQ(drums.hits[0].drum, "snare");
}

}  // namespace
}  // namespace tunescript
