// Score -> time-ordered note events in seconds.

#ifndef TUNESCRIPT_PLAYBACK_EVENT_COMPILER_H
#define TUNESCRIPT_PLAYBACK_EVENT_COMPILER_H

#include <vector>

#include "core/music_tables.h"
#include "core/score.h"
#include "playback/timed_event.h"

namespace tunescript {

/// Length of every drum hit in seconds.
constexpr double kDrumHitSeconds = 0.1;

/// Highest channel an instrument track can get.
constexpr uint8_t kMaxChannel = 15;

/// @brief Flattens a Score into NoteOn/NoteOff events for the live player.
///
/// All timing uses the song tempo; section tempos are informational.
/// Instrument track names get channels 0, 1, 2, ... in first-seen order,
/// skipping the drum channel and saturating at 15. The kit gets channel 9
/// only when some section has a drum hit.
class EventCompiler {
 public:
  explicit EventCompiler(const MusicTables& tables) : tables_(tables) {}

  /// @brief Compile a score. Never modifies the input.
  /// @return Events stably sorted by time (ties keep section, track,
  ///         note, chord, drum-hit order), channel table and duration.
  CompiledScore compile(const Score& score) const;

  /// @brief Assign channels and programs to the score's tracks.
  std::vector<ChannelAssignment> assignChannels(const Score& score) const;

  /// @brief Absolute MIDI pitches of a chord (clamped to 0-127).
  std::vector<uint8_t> chordPitches(const Chord& chord) const;

 private:
  const MusicTables& tables_;
};

}  // namespace tunescript

#endif  // TUNESCRIPT_PLAYBACK_EVENT_COMPILER_H
