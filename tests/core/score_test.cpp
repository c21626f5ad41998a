// Tests for core/score.h -- Score model equality and derived quantities.

#include "core/score.h"

#include <gtest/gtest.h>

namespace tunescript {
namespace {

Section makeSection(const std::string& name, int bars) {
  Section section;
  section.name = name;
  section.bars = bars;
  return section;
}

TEST(ScoreTest, DefaultsMatchModel) {
  Score score;
  EXPECT_EQ(score.title, "Untitled");
  EXPECT_EQ(score.tempo, 120);
  EXPECT_EQ(score.key, "C");
  EXPECT_EQ(score.time_signature, "4/4");
  EXPECT_TRUE(score.sections.empty());

  InstrumentTrack track;
  EXPECT_DOUBLE_EQ(track.volume, 0.8);
  EXPECT_DOUBLE_EQ(track.pan, 0.5);
  EXPECT_DOUBLE_EQ(Note().velocity, 0.7);
  EXPECT_DOUBLE_EQ(DrumHit().velocity, 0.8);
  EXPECT_EQ(Chord().octave, 4);
  EXPECT_EQ(DrumTrack().name, "Drums");
}

TEST(ScoreTest, DerivedDurations) {
  Score score;
  score.tempo = 90;
  score.sections.push_back(makeSection("Intro", 4));
  score.sections.push_back(makeSection("Verse", 8));

  EXPECT_EQ(score.totalBars(), 12);
  EXPECT_DOUBLE_EQ(score.totalBeats(), 48.0);
  EXPECT_DOUBLE_EQ(score.durationSeconds(), 32.0);
  EXPECT_DOUBLE_EQ(score.sections[1].durationBeats(), 32.0);
  EXPECT_DOUBLE_EQ(secondsPerBeat(120), 0.5);
}

TEST(ScoreTest, AssignStartBarsAccumulates) {
  Score score;
  score.sections.push_back(makeSection("A", 4));
  score.sections.push_back(makeSection("B", 2));
  score.sections.push_back(makeSection("C", 8));
  score.assignStartBars();

  EXPECT_EQ(score.sections[0].start_bar, 0);
  EXPECT_EQ(score.sections[1].start_bar, 4);
  EXPECT_EQ(score.sections[2].start_bar, 6);
}

TEST(ScoreTest, HasDrumHitsIgnoresEmptyDrumTracks) {
  Score score;
  score.sections.push_back(makeSection("A", 4));
  score.sections[0].drums = DrumTrack();
  EXPECT_FALSE(score.hasDrumHits());

  DrumHit hit;
  hit.drum = "kick";
  score.sections[0].drums->hits.push_back(hit);
  EXPECT_TRUE(score.hasDrumHits());
}

TEST(ScoreTest, EqualityIsFieldForField) {
  Score lhs;
  lhs.sections.push_back(makeSection("Verse", 4));
  Score rhs = lhs;
  EXPECT_EQ(lhs, rhs);

  rhs.sections[0].key = "C";
  EXPECT_NE(lhs, rhs) << "present vs absent optional key must differ";

  rhs = lhs;
  Note note;
  note.pitch = 60;
  rhs.sections[0].tracks.push_back(InstrumentTrack());
  rhs.sections[0].tracks[0].notes.push_back(note);
  EXPECT_NE(lhs, rhs);

  lhs = rhs;
  lhs.sections[0].tracks[0].notes[0].duration = 0.5;
  EXPECT_NE(lhs, rhs);
}

}  // namespace
}  // namespace tunescript
