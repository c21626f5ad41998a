// Score -> Standard MIDI File (format 1) exporter.

#ifndef TUNESCRIPT_MIDI_SMF_EXPORTER_H
#define TUNESCRIPT_MIDI_SMF_EXPORTER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/music_tables.h"
#include "core/score.h"

namespace tunescript {

/// Ticks per quarter note in exported files.
constexpr uint16_t kTicksPerBeat = 480;

/// Shortest exported note, in beats.
constexpr double kMinExportBeats = 0.1;

/// Exported length of every drum hit, in beats.
constexpr double kExportDrumBeats = 0.25;

/// Channel and program of one exported MTrk (tempo track excluded).
struct SmfTrackLayout {
  std::string name;
  std::string instrument;
  uint8_t channel = 0;
  uint8_t program = 0;
  bool has_program = true;  // False for the kit and percussion-named tracks
  bool is_drums = false;
  uint8_t volume = 0;       // CC7
  uint8_t pan = 64;         // CC10, not sent on the kit
};

/// @brief Writes a Score as an SMF Type 1 file.
///
/// Track 0 carries tempo, time signature and the song title. Then one track
/// per distinct instrument track name in sorted order, and a trailing
/// "Drums" track on channel 9 when any section has drum hits. The k-th
/// sorted name plays on channel min(k, 15), with 9 moved to 10.
class SmfExporter {
 public:
  explicit SmfExporter(const MusicTables& tables) : tables_(tables) {}

  /// @brief Build the file image.
  /// @return False (see getError()) if the score has no sections or a bad tempo.
  bool build(const Score& score);

  /// @brief Binary SMF data from the last successful build().
  std::vector<uint8_t> toBytes() const { return data_; }

  /// @brief Write the built data to a file.
  /// @return True if every byte was written.
  bool writeToFile(const std::string& path) const;

  /// @brief Track layout chosen by the last build().
  const std::vector<SmfTrackLayout>& getTrackLayout() const { return layout_; }

  const std::string& getError() const { return error_; }

 private:
  std::vector<SmfTrackLayout> planTracks(const Score& score) const;
  std::vector<uint8_t> buildTempoTrack(const Score& score) const;
  std::vector<uint8_t> buildInstrumentTrack(const Score& score, const SmfTrackLayout& layout) const;
  std::vector<uint8_t> buildDrumTrack(const Score& score, uint8_t drums_volume) const;

  const MusicTables& tables_;
  std::vector<uint8_t> data_;
  std::vector<SmfTrackLayout> layout_;
  std::string error_;
};

/// @brief Convert beats to ticks at kTicksPerBeat (rounded, negative -> 0).
uint32_t beatsToTicks(double beats);

/// @brief Parse "N/D" into numerator and log2(denominator).
/// @return False (and 4/4) unless N is 1-255 and D a power of two up to 128.
bool parseTimeSignature(const std::string& text, uint8_t& numerator, uint8_t& denominator_pow2);

/// @brief Build and write a score in one call.
/// @param error Receives the failure reason.
bool exportScoreToSmf(const Score& score, const std::string& path, std::string& error,
                      const MusicTables& tables = MusicTables::defaults());

}  // namespace tunescript

#endif  // TUNESCRIPT_MIDI_SMF_EXPORTER_H
