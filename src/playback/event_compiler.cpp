// Implementation of the timed-event compiler.

#include "playback/event_compiler.h"

#include <algorithm>
#include <map>
#include <string>

namespace tunescript {

namespace {

void addNotePair(std::vector<TimedEvent>& events, double start, double end, uint8_t channel,
                 uint8_t pitch, double velocity) {
  TimedEvent on;
  on.time_seconds = start;
  on.kind = TimedEventKind::NoteOn;
  on.channel = channel;
  on.pitch = pitch;
  on.velocity = velocityToMidi(velocity);
  events.push_back(on);

  TimedEvent off = on;
  off.time_seconds = end;
  off.kind = TimedEventKind::NoteOff;
  off.velocity = 0;
  events.push_back(off);
}

}  // namespace

std::vector<uint8_t> EventCompiler::chordPitches(const Chord& chord) const {
  return tunescript::chordPitches(tables_, chord.root, chord.quality, chord.octave);
}

std::vector<ChannelAssignment> EventCompiler::assignChannels(const Score& score) const {
  std::vector<ChannelAssignment> channels;
  int next_channel = 0;

  for (const auto& section : score.sections) {
    for (const auto& track : section.tracks) {
      bool seen = std::any_of(channels.begin(), channels.end(),
                              [&](const ChannelAssignment& ch) { return ch.name == track.name; });
      if (seen) continue;

      ChannelAssignment assignment;
      assignment.name = track.name;
      assignment.instrument = track.instrument;
      assignment.channel = static_cast<uint8_t>(std::min<int>(next_channel, kMaxChannel));
      assignment.program = tables_.instrumentProgram(track.instrument);
      channels.push_back(std::move(assignment));

      ++next_channel;
      if (next_channel == kDrumChannel) ++next_channel;
    }
  }

  if (score.hasDrumHits()) {
    ChannelAssignment drums;
    drums.name = "Drums";
    drums.channel = kDrumChannel;
    drums.is_drums = true;
    channels.push_back(std::move(drums));
  }
  return channels;
}

CompiledScore EventCompiler::compile(const Score& score) const {
  CompiledScore compiled;
  compiled.channels = assignChannels(score);
  compiled.duration_seconds = score.durationSeconds();

  std::map<std::string, uint8_t> channel_of;
  for (const auto& assignment : compiled.channels) {
    if (!assignment.is_drums) channel_of[assignment.name] = assignment.channel;
  }

  const double sec_per_beat = secondsPerBeat(score.tempo);
  auto& events = compiled.events;

  for (const auto& section : score.sections) {
    const double section_start = section.start_bar * kBeatsPerBar * sec_per_beat;

    for (const auto& track : section.tracks) {
      const uint8_t channel = channel_of[track.name];

      for (const auto& note : track.notes) {
        double start = section_start + note.start * sec_per_beat;
        double end = start + note.duration * sec_per_beat;
        addNotePair(events, start, end, channel, clampMidi(note.pitch), note.velocity);
      }

      for (const auto& chord : track.chords) {
        double start = section_start + chord.start * sec_per_beat;
        double end = start + chord.duration * sec_per_beat;
        for (uint8_t pitch : chordPitches(chord)) {
          addNotePair(events, start, end, channel, pitch, chord.velocity);
        }
      }
    }

    if (section.drums) {
      for (const auto& hit : section.drums->hits) {
        double start = section_start + hit.start * sec_per_beat;
        addNotePair(events, start, start + kDrumHitSeconds, kDrumChannel,
                    tables_.drumPitch(hit.drum), hit.velocity);
      }
    }
  }

  std::stable_sort(events.begin(), events.end(), [](const TimedEvent& lhs, const TimedEvent& rhs) {
    return lhs.time_seconds < rhs.time_seconds;
  });
  return compiled;
}

}  // namespace tunescript
