// Standard MIDI File reader used to inspect exported files.

#ifndef TUNESCRIPT_MIDI_MIDI_READER_H
#define TUNESCRIPT_MIDI_MIDI_READER_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tunescript {

/// A note-on/note-off pair recovered from a track.
struct SmfNote {
  uint32_t start_tick = 0;
  uint32_t duration = 0;
  uint8_t channel = 0;
  uint8_t pitch = 0;
  uint8_t velocity = 0;
};

/// One MTrk chunk.
struct SmfTrack {
  std::string name;
  uint8_t channel = 0;     // Channel of the first channel message
  bool has_program = false;
  uint8_t program = 0;
  std::map<uint8_t, uint8_t> controls;  // Controller -> first value seen
  std::vector<SmfNote> notes;           // Sorted by start tick
};

/// Decoded file contents.
struct SmfFile {
  uint16_t format = 0;
  uint16_t num_tracks = 0;
  uint16_t division = 480;
  bool has_tempo = false;
  uint32_t tempo_usec = 500000;  // First tempo meta event
  uint8_t time_sig_numerator = 4;
  uint8_t time_sig_denominator_pow2 = 2;
  std::vector<SmfTrack> tracks;

  /// @brief Tempo in beats per minute (rounded).
  int bpm() const;

  /// @brief Find a track by name.
  /// @return Pointer to the track, or nullptr if not found.
  const SmfTrack* getTrack(const std::string& name) const;
};

/// @brief Reads back SMF format 0/1 data: track names, first program and
///        controller values, tempo, time signature and paired notes.
class MidiReader {
 public:
  /// @brief Read and parse a file from disk.
  /// @return True on success. On failure, call getError() for details.
  bool read(const std::string& path);

  /// @brief Parse an in-memory file image.
  /// @return True on success. On failure, call getError() for details.
  bool read(const std::vector<uint8_t>& data);

  const SmfFile& getFile() const { return file_; }
  const std::string& getError() const { return error_; }

 private:
  SmfFile file_;
  std::string error_;
};

}  // namespace tunescript

#endif  // TUNESCRIPT_MIDI_MIDI_READER_H
