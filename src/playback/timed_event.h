// Timed note events: the flat, seconds-based form of a Score used for
// realtime playback.

#ifndef TUNESCRIPT_PLAYBACK_TIMED_EVENT_H
#define TUNESCRIPT_PLAYBACK_TIMED_EVENT_H

#include <cstdint>
#include <string>
#include <vector>

namespace tunescript {

/// Kind of a timed event.
enum class TimedEventKind : uint8_t {
  NoteOn,
  NoteOff
};

/// One note-on or note-off at an absolute time.
struct TimedEvent {
  double time_seconds = 0.0;
  TimedEventKind kind = TimedEventKind::NoteOn;
  uint8_t channel = 0;   // 0-15
  uint8_t pitch = 0;     // 0-127
  uint8_t velocity = 0;  // 0-127, always 0 for NoteOff

  bool operator==(const TimedEvent& other) const {
    return time_seconds == other.time_seconds && kind == other.kind &&
           channel == other.channel && pitch == other.pitch && velocity == other.velocity;
  }
  bool operator!=(const TimedEvent& other) const { return !(*this == other); }
};

/// Channel and program chosen for a track name.
struct ChannelAssignment {
  std::string name;        // Track display name, "Drums" for the kit
  std::string instrument;  // Program table key ("" for the kit)
  uint8_t channel = 0;
  uint8_t program = 0;
  bool is_drums = false;
};

/// Output of the event compiler. Immutable once returned.
struct CompiledScore {
  std::vector<TimedEvent> events;           // Non-decreasing time_seconds
  std::vector<ChannelAssignment> channels;  // First-seen order, drums last
  double duration_seconds = 0.0;

  /// @brief Find the assignment for a track name.
  /// @return Pointer into channels, or nullptr.
  const ChannelAssignment* findChannel(const std::string& name) const {
    for (const auto& assignment : channels) {
      if (assignment.name == name) return &assignment;
    }
    return nullptr;
  }
};

/// @brief Convert TimedEventKind to a string ("NoteOn", "NoteOff").
inline const char* timedEventKindToString(TimedEventKind kind) {
  return kind == TimedEventKind::NoteOn ? "NoteOn" : "NoteOff";
}

}  // namespace tunescript

#endif  // TUNESCRIPT_PLAYBACK_TIMED_EVENT_H
