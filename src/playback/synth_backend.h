// Narrow synthesizer interface driven by the live player.

#ifndef TUNESCRIPT_PLAYBACK_SYNTH_BACKEND_H
#define TUNESCRIPT_PLAYBACK_SYNTH_BACKEND_H

#include <cstdint>
#include <cstdio>

namespace tunescript {

/// MIDI controller numbers sent by the player.
constexpr uint8_t kControlVolume = 7;
constexpr uint8_t kControlPan = 10;
constexpr uint8_t kControlExpression = 11;

/// @brief Channel-message sink for realtime playback.
///
/// Implementations wrap a soundfont synthesizer, a MIDI output port or a
/// test recorder. The player calls these from its worker thread, never
/// concurrently.
class SynthBackend {
 public:
  virtual ~SynthBackend() = default;

  virtual void noteOn(uint8_t channel, uint8_t pitch, uint8_t velocity) = 0;
  virtual void noteOff(uint8_t channel, uint8_t pitch) = 0;
  virtual void programChange(uint8_t channel, uint8_t program) = 0;
  virtual void controlChange(uint8_t channel, uint8_t controller, uint8_t value) = 0;

  /// @brief Silence every sounding note on every channel.
  virtual void allNotesOff() = 0;
};

/// @brief Backend that prints each message as a text line (dry-run playback).
class ConsoleSynthBackend : public SynthBackend {
 public:
  explicit ConsoleSynthBackend(std::FILE* out = stdout) : out_(out) {}

  void noteOn(uint8_t channel, uint8_t pitch, uint8_t velocity) override;
  void noteOff(uint8_t channel, uint8_t pitch) override;
  void programChange(uint8_t channel, uint8_t program) override;
  void controlChange(uint8_t channel, uint8_t controller, uint8_t value) override;
  void allNotesOff() override;

 private:
  std::FILE* out_;
};

}  // namespace tunescript

#endif  // TUNESCRIPT_PLAYBACK_SYNTH_BACKEND_H
