// Bar-slot pattern parsing for instrument and drum lines.

#ifndef TUNESCRIPT_DSL_PATTERN_PARSER_H
#define TUNESCRIPT_DSL_PATTERN_PARSER_H

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/music_tables.h"
#include "core/score.h"

namespace tunescript {

/// Drum hit velocities per beat form.
constexpr double kEighthsHitVelocity = 0.7;
constexpr double kSixteenthsHitVelocity = 0.6;
constexpr double kListedHitVelocity = 0.8;

/// Text that marks an explicit rest slot.
constexpr std::string_view kRestSlot = "_";

/// One `<token>(<params>)` occurrence inside a slot.
struct PatternItem {
  std::string token;
  std::string params;
};

/// Duration and velocity decoded from an item's parameter list.
struct NoteParams {
  Beat duration = 1.0;
  double velocity = kDefaultNoteVelocity;
};

/// Root, quality and octave of a chord token.
struct ChordSymbol {
  std::string root;     ///< Upper-case letter + optional '#'/'b'
  std::string quality;  ///< Suffix as written ("" = major)
  int octave = kDefaultChordOctave;
};

/// @brief Find pitched items (`[A-Ga-g][#b]?\w*` followed by `(params)`) left to right.
std::vector<PatternItem> findPitchedItems(std::string_view slot);

/// @brief Find drum items (`\w+` followed by `(beats)`) left to right.
std::vector<PatternItem> findDrumItems(std::string_view slot);

/// @brief True if a token is exactly letter, optional accidental, one octave digit.
bool isNoteToken(std::string_view token);

/// @brief Check whether a trimmed slot is a rest (empty or "_").
bool isRestSlot(std::string_view slot);

/// @brief Parse beat positions of a drum item.
///
/// "8ths"/"eighths" and "16ths"/"sixteenths" (any case) expand to evenly
/// spaced hits; otherwise a comma-separated list of 1-based beat numbers.
/// Returns nothing if any list entry is not a number; entries below 1 are
/// skipped.
///
/// @param beats Text between the parentheses.
/// @return (offset within the bar, velocity) pairs in order.
std::vector<std::pair<Beat, double>> parseDrumBeats(std::string_view beats);

/// @brief Decodes instrument and drum patterns using injected lookup tables.
class PatternParser {
 public:
  explicit PatternParser(const MusicTables& tables) : tables_(tables) {}

  /// @brief Decode a comma-separated parameter list (duration and dynamics codes).
  /// Unknown codes are ignored; defaults are a quarter note at velocity 0.7.
  NoteParams parseParams(std::string_view params) const;

  /// @brief Split a chord token into root, quality and octave.
  ///
  /// The suffix after the root is the quality unless it is not a known
  /// quality while the suffix without its trailing digit is (or is empty);
  /// then that digit is the octave.
  /// @return Chord symbol, or nullopt if the token does not start with a note letter.
  std::optional<ChordSymbol> parseChordSymbol(std::string_view token) const;

  /// @brief Parse an instrument pattern into notes and chords of a track.
  ///
  /// Each '|' slot is one 4-beat bar; rests only advance the bar cursor.
  /// Items inside a slot are laid out back to back from the slot start.
  ///
  /// @param pattern Text after "NAME:".
  /// @param track Track receiving the notes and chords.
  /// @param warnings Receives a message for each clamped pitch.
  void parseInstrumentPattern(std::string_view pattern, InstrumentTrack& track,
                              std::vector<std::string>& warnings) const;

  /// @brief Parse a drum pattern. Slot i starts at beat 4*i; rests are skipped.
  DrumTrack parseDrumPattern(std::string_view pattern) const;

 private:
  const MusicTables& tables_;
};

}  // namespace tunescript

#endif  // TUNESCRIPT_DSL_PATTERN_PARSER_H
