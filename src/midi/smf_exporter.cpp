/// @file
/// @brief SMF Type 1 export of a Score.

#include "midi/smf_exporter.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <set>

#include "core/log.h"
#include "core/string_utils.h"
#include "midi/midi_stream.h"

namespace tunescript {

namespace {

constexpr uint8_t kNoteOff = 0x80;
constexpr uint8_t kNoteOn = 0x90;
constexpr uint8_t kControlChange = 0xB0;
constexpr uint8_t kProgramChange = 0xC0;
constexpr uint8_t kCcVolume = 7;
constexpr uint8_t kCcPan = 10;
// Largest value the 3-byte tempo meta can carry (about 3.58 BPM).
constexpr uint32_t kMaxTempoMicroseconds = 0xFFFFFF;

/// @brief Channel message queued for sorting before writing.
struct WriteEvent {
  uint32_t tick = 0;
  uint8_t status = 0;
  uint8_t data1 = 0;
  uint8_t data2 = 0;
  int priority = 0;  // Lower = earlier at same tick (note-off before note-on)
};

void addNote(std::vector<WriteEvent>& events, uint8_t channel, int pitch, double start_beats,
             double duration_beats, double velocity) {
  uint8_t out_pitch = clampMidi(pitch);
  uint32_t start = beatsToTicks(start_beats);
  uint32_t end = beatsToTicks(start_beats + std::max(duration_beats, kMinExportBeats));

  WriteEvent on_event;
  on_event.tick = start;
  on_event.status = static_cast<uint8_t>(kNoteOn | (channel & 0x0F));
  on_event.data1 = out_pitch;
  on_event.data2 = velocityToMidi(velocity, 1);
  on_event.priority = 1;
  events.push_back(on_event);

  WriteEvent off_event;
  off_event.tick = end;
  off_event.status = static_cast<uint8_t>(kNoteOff | (channel & 0x0F));
  off_event.data1 = out_pitch;
  off_event.data2 = 0;
  off_event.priority = 0;
  events.push_back(off_event);
}

void writeChannelEvent(std::vector<uint8_t>& buf, uint32_t delta, uint8_t status, uint8_t data1) {
  writeVariableLength(buf, delta);
  buf.push_back(status);
  buf.push_back(data1 & 0x7F);
}

void writeChannelEvent(std::vector<uint8_t>& buf, uint32_t delta, uint8_t status, uint8_t data1,
                       uint8_t data2) {
  writeChannelEvent(buf, delta, status, data1);
  buf.push_back(data2 & 0x7F);
}

/// @brief Sort queued notes and append them with delta times.
void flushEvents(std::vector<uint8_t>& buf, std::vector<WriteEvent>& events) {
  std::stable_sort(events.begin(), events.end(), [](const WriteEvent& lhs, const WriteEvent& rhs) {
    if (lhs.tick != rhs.tick) return lhs.tick < rhs.tick;
    return lhs.priority < rhs.priority;
  });

  uint32_t prev_tick = 0;
  for (const auto& evt : events) {
    writeChannelEvent(buf, evt.tick - prev_tick, evt.status, evt.data1, evt.data2);
    prev_tick = evt.tick;
  }
}

}  // namespace

uint32_t beatsToTicks(double beats) {
  if (!(beats > 0.0)) return 0;
  double ticks = std::round(beats * kTicksPerBeat);
  if (ticks >= static_cast<double>(kMaxVariableLength)) return kMaxVariableLength;
  return static_cast<uint32_t>(ticks);
}

bool parseTimeSignature(const std::string& text, uint8_t& numerator, uint8_t& denominator_pow2) {
  numerator = 4;
  denominator_pow2 = 2;

  std::vector<std::string> parts = split(text, '/');
  if (parts.size() != 2) return false;

  int values[2] = {0, 0};
  for (int idx = 0; idx < 2; ++idx) {
    std::string digits = trim(parts[idx]);
    if (digits.empty() || digits.size() > 3) return false;
    for (char chr : digits) {
      if (!isDigit(chr)) return false;
      values[idx] = values[idx] * 10 + (chr - '0');
    }
  }

  if (values[0] < 1 || values[0] > 255) return false;
  int power = 0;
  while ((1 << power) < values[1] && power < 7) ++power;
  if ((1 << power) != values[1]) return false;

  numerator = static_cast<uint8_t>(values[0]);
  denominator_pow2 = static_cast<uint8_t>(power);
  return true;
}

// ---------------------------------------------------------------------------
// SmfExporter
// ---------------------------------------------------------------------------

bool SmfExporter::build(const Score& score) {
  data_.clear();
  layout_.clear();
  error_.clear();

  if (score.sections.empty()) {
    error_ = "Score has no sections to export";
    return false;
  }
  if (score.tempo <= 0) {
    error_ = "Score tempo must be positive (got " + std::to_string(score.tempo) + ")";
    return false;
  }

  layout_ = planTracks(score);

  std::vector<uint8_t> header;
  writeBE16(header, 1);  // Format 1
  writeBE16(header, static_cast<uint16_t>(layout_.size() + 1));
  writeBE16(header, kTicksPerBeat);
  appendChunk(data_, "MThd", header);

  appendChunk(data_, "MTrk", buildTempoTrack(score));
  for (const auto& track : layout_) {
    appendChunk(data_, "MTrk", track.is_drums ? buildDrumTrack(score, track.volume)
                                              : buildInstrumentTrack(score, track));
  }

  logMessage(LogLevel::Debug, "smf", "built %zu tracks, %zu bytes", layout_.size() + 1,
             data_.size());
  return true;
}

bool SmfExporter::writeToFile(const std::string& path) const {
  FILE* file = std::fopen(path.c_str(), "wb");
  if (!file) {
    return false;
  }
  size_t written = std::fwrite(data_.data(), 1, data_.size(), file);
  bool closed = std::fclose(file) == 0;
  return written == data_.size() && closed;
}

std::vector<SmfTrackLayout> SmfExporter::planTracks(const Score& score) const {
  std::set<std::string> names;
  for (const auto& section : score.sections) {
    for (const auto& track : section.tracks) names.insert(track.name);
  }

  std::vector<SmfTrackLayout> layout;
  int index = 0;
  for (const auto& name : names) {
    const InstrumentTrack* first = nullptr;
    for (const auto& section : score.sections) {
      for (const auto& track : section.tracks) {
        if (track.name == name) {
          first = &track;
          break;
        }
      }
      if (first) break;
    }

    SmfTrackLayout entry;
    entry.name = name;
    entry.instrument = first->instrument;
    entry.channel = static_cast<uint8_t>(std::min(index, 15));
    if (entry.channel == kDrumChannel) entry.channel = kDrumChannel + 1;
    entry.has_program = !tables_.isPercussionInstrument(first->instrument);
    entry.program = tables_.instrumentProgram(first->instrument);
    entry.volume = velocityToMidi(first->volume);
    entry.pan = panToMidi(first->pan);
    layout.push_back(std::move(entry));
    ++index;
  }

  if (score.hasDrumHits()) {
    SmfTrackLayout drums;
    drums.name = "Drums";
    drums.channel = kDrumChannel;
    drums.has_program = false;
    drums.is_drums = true;
    for (const auto& section : score.sections) {
      if (section.hasDrumHits()) {
        drums.volume = velocityToMidi(section.drums->volume);
        break;
      }
    }
    layout.push_back(std::move(drums));
  }
  return layout;
}

std::vector<uint8_t> SmfExporter::buildTempoTrack(const Score& score) const {
  std::vector<uint8_t> buf;

  uint32_t usec_per_beat = kMicrosecondsPerMinute / static_cast<uint32_t>(score.tempo);
  if (usec_per_beat > kMaxTempoMicroseconds) {
    logMessage(LogLevel::Warn, "smf", "tempo %d BPM too slow for SMF, writing the slowest tempo",
               score.tempo);
    usec_per_beat = kMaxTempoMicroseconds;
  }
  std::vector<uint8_t> tempo;
  writeBE24(tempo, usec_per_beat);
  writeMetaEvent(buf, 0, kMetaTempo, tempo);

  uint8_t numerator = 4;
  uint8_t denominator_pow2 = 2;
  if (!parseTimeSignature(score.time_signature, numerator, denominator_pow2)) {
    logMessage(LogLevel::Info, "smf", "time signature '%s' not exportable, writing 4/4",
               score.time_signature.c_str());
  }
  // 24 MIDI clocks per click, 8 thirty-seconds per quarter.
  writeMetaEvent(buf, 0, kMetaTimeSignature, {numerator, denominator_pow2, 0x18, 0x08});

  writeTextMeta(buf, 0, kMetaTrackName, score.title);
  writeEndOfTrack(buf);
  return buf;
}

std::vector<uint8_t> SmfExporter::buildInstrumentTrack(const Score& score,
                                                       const SmfTrackLayout& layout) const {
  std::vector<uint8_t> buf;
  const uint8_t channel = layout.channel & 0x0F;

  writeTextMeta(buf, 0, kMetaTrackName, layout.name);
  if (layout.has_program) {
    writeChannelEvent(buf, 0, static_cast<uint8_t>(kProgramChange | channel), layout.program);
  }
  writeChannelEvent(buf, 0, static_cast<uint8_t>(kControlChange | channel), kCcVolume,
                    layout.volume);
  writeChannelEvent(buf, 0, static_cast<uint8_t>(kControlChange | channel), kCcPan, layout.pan);

  std::vector<WriteEvent> events;
  for (const auto& section : score.sections) {
    const double section_start = static_cast<double>(section.start_bar) * kBeatsPerBar;
    for (const auto& track : section.tracks) {
      if (track.name != layout.name) continue;

      for (const auto& note : track.notes) {
        addNote(events, channel, note.pitch, section_start + note.start, note.duration,
                note.velocity);
      }
      for (const auto& chord : track.chords) {
        for (uint8_t pitch : chordPitches(tables_, chord.root, chord.quality, chord.octave)) {
          addNote(events, channel, pitch, section_start + chord.start, chord.duration,
                  chord.velocity);
        }
      }
    }
  }

  flushEvents(buf, events);
  writeEndOfTrack(buf);
  return buf;
}

std::vector<uint8_t> SmfExporter::buildDrumTrack(const Score& score, uint8_t drums_volume) const {
  std::vector<uint8_t> buf;
  writeTextMeta(buf, 0, kMetaTrackName, "Drums");
  writeChannelEvent(buf, 0, static_cast<uint8_t>(kControlChange | kDrumChannel), kCcVolume,
                    drums_volume);

  std::vector<WriteEvent> events;
  for (const auto& section : score.sections) {
    if (!section.drums) continue;
    const double section_start = static_cast<double>(section.start_bar) * kBeatsPerBar;
    for (const auto& hit : section.drums->hits) {
      addNote(events, kDrumChannel, tables_.drumPitch(hit.drum), section_start + hit.start,
              kExportDrumBeats, hit.velocity);
    }
  }

  flushEvents(buf, events);
  writeEndOfTrack(buf);
  return buf;
}

bool exportScoreToSmf(const Score& score, const std::string& path, std::string& error,
                      const MusicTables& tables) {
  SmfExporter exporter(tables);
  if (!exporter.build(score)) {
    error = exporter.getError();
    return false;
  }
  if (!exporter.writeToFile(path)) {
    error = "Failed to write MIDI file: " + path;
    return false;
  }
  return true;
}

}  // namespace tunescript
