// Tests for MidiReader -- SMF parsing of hand-built files.

#include "midi/midi_reader.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "midi/midi_stream.h"

namespace tunescript {
namespace {

std::vector<uint8_t> makeHeader(uint16_t format, uint16_t num_tracks, uint16_t division) {
  std::vector<uint8_t> header;
  writeBE16(header, format);
  writeBE16(header, num_tracks);
  writeBE16(header, division);
  std::vector<uint8_t> out;
  appendChunk(out, "MThd", header);
  return out;
}

std::vector<uint8_t> makeFile(const std::vector<std::vector<uint8_t>>& tracks) {
  std::vector<uint8_t> out = makeHeader(1, static_cast<uint16_t>(tracks.size()), 480);
  for (const auto& body : tracks) appendChunk(out, "MTrk", body);
  return out;
}

// ---------------------------------------------------------------------------
// Reading from non-existent file
// ---------------------------------------------------------------------------

TEST(MidiReaderTest, ReadNonExistentFileReturnsFalse) {
  MidiReader reader;
  std::string path = "/tmp/tunescript_nonexistent_file_12345.mid";
  EXPECT_FALSE(reader.read(path));
  EXPECT_NE(reader.getError().find(path), std::string::npos);
}

// ---------------------------------------------------------------------------
// Reading from invalid data
// ---------------------------------------------------------------------------

TEST(MidiReaderTest, ReadEmptyDataReturnsFalse) {
  MidiReader reader;
  EXPECT_FALSE(reader.read(std::vector<uint8_t>{}));
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

TEST(MidiReaderTest, UnsupportedFormatReturnsError) {
  MidiReader reader;
  EXPECT_FALSE(reader.read(makeHeader(2, 0, 480)));
  EXPECT_NE(reader.getError().find("format"), std::string::npos);
}

TEST(MidiReaderTest, MissingTrackChunkReturnsError) {
  MidiReader reader;
  EXPECT_FALSE(reader.read(makeHeader(1, 1, 480)));
  EXPECT_FALSE(reader.getError().empty());
}

TEST(MidiReaderTest, TrackLongerThanDataReturnsError) {
  std::vector<uint8_t> data = makeHeader(1, 1, 480);
  data.insert(data.end(), {'M', 'T', 'r', 'k', 0x00, 0x00, 0x01, 0x00, 0x00});
  MidiReader reader;
  EXPECT_FALSE(reader.read(data));
  EXPECT_NE(reader.getError().find("exceeds"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Parse basic MIDI header
// ---------------------------------------------------------------------------

TEST(MidiReaderTest, ParseValidHeaderFormat0) {
  MidiReader reader;
  ASSERT_TRUE(reader.read(makeHeader(0, 0, 240)));
  const SmfFile& midi = reader.getFile();
  EXPECT_EQ(midi.format, 0);
  EXPECT_EQ(midi.num_tracks, 0);
  EXPECT_EQ(midi.division, 240);
  EXPECT_FALSE(midi.has_tempo);
  EXPECT_EQ(midi.bpm(), 120);
}

TEST(MidiReaderTest, GetTrackByNameReturnsNullptrWhenNotFound) {
  SmfFile midi;
  EXPECT_EQ(midi.getTrack("nonexistent"), nullptr);
}

// ---------------------------------------------------------------------------
// Track contents
// ---------------------------------------------------------------------------

TEST(MidiReaderTest, ReadsTempoAndTimeSignature) {
  std::vector<uint8_t> conductor;
  std::vector<uint8_t> tempo;
  writeBE24(tempo, 600000);
  writeMetaEvent(conductor, 0, kMetaTempo, tempo);
  writeMetaEvent(conductor, 0, kMetaTimeSignature, {3, 2, 24, 8});
  writeTextMeta(conductor, 0, kMetaTrackName, "Song");
  writeEndOfTrack(conductor);

  MidiReader reader;
  ASSERT_TRUE(reader.read(makeFile({conductor})));
  const SmfFile& midi = reader.getFile();
  EXPECT_TRUE(midi.has_tempo);
  EXPECT_EQ(midi.tempo_usec, 600000u);
  EXPECT_EQ(midi.bpm(), 100);
  EXPECT_EQ(midi.time_sig_numerator, 3);
  EXPECT_EQ(midi.time_sig_denominator_pow2, 2);
  ASSERT_NE(midi.getTrack("Song"), nullptr);
}

TEST(MidiReaderTest, PairsNotesAndReadsChannelMessages) {
  std::vector<uint8_t> body;
  writeTextMeta(body, 0, kMetaTrackName, "Bass");
  body.insert(body.end(), {0x00, 0xC3, 33});        // Program 33, channel 3
  body.insert(body.end(), {0x00, 0xB3, 7, 90});     // CC7
  body.insert(body.end(), {0x00, 0xB3, 7, 20});     // Later CC7 ignored
  body.insert(body.end(), {0x00, 0x93, 40, 100});   // On
  body.insert(body.end(), {0x83, 0x60, 0x83, 40, 0});  // Off after 480
  body.insert(body.end(), {0x00, 0x93, 43, 70});    // On
  body.insert(body.end(), {0x81, 0x70, 43, 0});     // Running status, velocity 0 = off
  writeEndOfTrack(body);

  MidiReader reader;
  ASSERT_TRUE(reader.read(makeFile({body})));
  const SmfTrack* bass = reader.getFile().getTrack("Bass");
  ASSERT_NE(bass, nullptr);
  EXPECT_EQ(bass->channel, 3);
  EXPECT_TRUE(bass->has_program);
  EXPECT_EQ(bass->program, 33);
  EXPECT_EQ(bass->controls.at(7), 90);

  ASSERT_EQ(bass->notes.size(), 2u);
  EXPECT_EQ(bass->notes[0].pitch, 40);
  EXPECT_EQ(bass->notes[0].start_tick, 0u);
  EXPECT_EQ(bass->notes[0].duration, 480u);
  EXPECT_EQ(bass->notes[0].velocity, 100);
  EXPECT_EQ(bass->notes[1].pitch, 43);
  EXPECT_EQ(bass->notes[1].start_tick, 480u);
  EXPECT_EQ(bass->notes[1].duration, 240u);
  EXPECT_EQ(bass->notes[1].velocity, 70);
}

TEST(MidiReaderTest, UnterminatedNoteIsDropped) {
  std::vector<uint8_t> body = {0x00, 0x90, 60, 100};
  writeEndOfTrack(body);
  MidiReader reader;
  ASSERT_TRUE(reader.read(makeFile({body})));
  EXPECT_TRUE(reader.getFile().tracks[0].notes.empty());
}

TEST(MidiReaderTest, DataByteWithoutStatusIsAnError) {
  std::vector<uint8_t> body = {0x00, 0x40, 0x40};
  MidiReader reader;
  EXPECT_FALSE(reader.read(makeFile({body})));
  EXPECT_NE(reader.getError().find("without status"), std::string::npos);
}

TEST(MidiReaderTest, SecondReadResetsState) {
  MidiReader reader;
  EXPECT_FALSE(reader.read(std::vector<uint8_t>{}));
  EXPECT_FALSE(reader.getError().empty());

  ASSERT_TRUE(reader.read(makeHeader(1, 0, 480)));
  EXPECT_TRUE(reader.getError().empty());
  EXPECT_EQ(reader.getFile().division, 480);
}

}  // namespace
}  // namespace tunescript
