// Lookup tables for the song DSL: note names, chord qualities, durations,
// dynamics, GM instrument programs and GM percussion keys.

#ifndef TUNESCRIPT_CORE_MUSIC_TABLES_H
#define TUNESCRIPT_CORE_MUSIC_TABLES_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tunescript {

/// Program value marking an instrument name as the percussion kit.
constexpr int kPercussionProgram = -1;

/// Fallbacks for lookup misses.
constexpr uint8_t kDefaultProgram = 0;      // Acoustic Grand Piano
constexpr uint8_t kDefaultDrumPitch = 36;   // Bass Drum 1
constexpr uint8_t kDrumChannel = 9;         // GM channel 10

/// @brief Immutable lookup data injected into the parser, compiler and exporter.
///
/// All consumers take a `const MusicTables&`; MusicTables::defaults() is the
/// built-in set. Tests and the tool configuration build modified copies.
struct MusicTables {
  /// Natural note letter (upper-case) -> semitone within the octave.
  std::map<char, int> note_semitones;

  /// Chord quality suffix (lower-case, "" = major) -> semitone intervals.
  std::map<std::string, std::vector<int>> chord_intervals;

  /// Duration code -> length in beats.
  std::map<std::string, double> durations;

  /// Dynamics code -> velocity 0.0-1.0.
  std::map<std::string, double> dynamics;

  /// Instrument name (lower-case) -> GM program, or kPercussionProgram.
  std::map<std::string, int> instrument_programs;

  /// Drum name (lower-case) -> GM percussion key.
  std::map<std::string, uint8_t> drum_pitches;

  /// @brief Built-in tables (constructed once, never mutated).
  static const MusicTables& defaults();

  /// @brief Build a fresh copy of the built-in tables.
  static MusicTables makeDefault();

  /// @brief Semitone of a note name: letter plus optional '#' or 'b'.
  /// @param name Note name such as "C", "f#", "Bb". Case of the letter is ignored.
  /// @return Semitone offset from C (may be -1 for "Cb" or 12 for "B#"),
  ///         or nullopt if the name is not a note.
  std::optional<int> noteSemitone(std::string_view name) const;

  /// @brief Check whether a quality suffix has an exact table entry.
  bool isKnownQuality(std::string_view quality) const;

  /// @brief Resolve a quality suffix to its interval set.
  ///
  /// Exact (lower-cased) lookup first, then substring fallbacks in the order
  /// maj7, maj, m7/min7, m.../min, sus4, sus2, dim7, dim, aug, 7. Anything
  /// else resolves to the major triad.
  std::vector<int> chordIntervals(std::string_view quality) const;

  /// @brief Duration in beats for a duration code, or nullopt.
  std::optional<double> durationBeats(std::string_view code) const;

  /// @brief Velocity for a dynamics code, or nullopt.
  std::optional<double> dynamicsVelocity(std::string_view code) const;

  /// @brief Check whether an instrument name is in the program table.
  bool isKnownInstrument(std::string_view instrument) const;

  /// @brief Check whether an instrument name maps to the percussion kit.
  bool isPercussionInstrument(std::string_view instrument) const;

  /// @brief GM program for an instrument name (kDefaultProgram when unknown
  ///        or percussion).
  uint8_t instrumentProgram(std::string_view instrument) const;

  /// @brief GM percussion key for a drum name (kDefaultDrumPitch when unknown).
  uint8_t drumPitch(std::string_view drum) const;
};

/// @brief MIDI pitch of a note name in an octave (C4 = 60), clamped to 0-127.
/// @param tables Note-name table.
/// @param name Note name ("C", "F#", "Bb").
/// @param octave Octave number (-1 is the lowest).
/// @return Pitch, or nullopt if the name is not a note.
std::optional<uint8_t> notePitch(const MusicTables& tables, std::string_view name, int octave);

/// @brief Unclamped MIDI number of a note name in an octave (C4 = 60).
std::optional<int> rawNotePitch(const MusicTables& tables, std::string_view name, int octave);

/// @brief Absolute pitches of a chord symbol, clamped to 0-127.
///
/// The quality resolves through MusicTables::chordIntervals(). A root that
/// is not a note name is treated as C.
std::vector<uint8_t> chordPitches(const MusicTables& tables, std::string_view root,
                                  std::string_view quality, int octave);

/// @brief Clamp an integer to the MIDI data range 0-127.
uint8_t clampMidi(int value);

/// @brief Convert a 0.0-1.0 velocity to MIDI (truncating, clamped to [min_value, 127]).
uint8_t velocityToMidi(double velocity, uint8_t min_value = 0);

/// @brief Convert a 0.0-1.0 pan position to CC10, rounding so 0.5 is center (64).
uint8_t panToMidi(double pan);

}  // namespace tunescript

#endif  // TUNESCRIPT_CORE_MUSIC_TABLES_H
