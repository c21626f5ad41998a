// Song DSL parser: cleaned LLM text -> Score.

#ifndef TUNESCRIPT_DSL_DSL_PARSER_H
#define TUNESCRIPT_DSL_DSL_PARSER_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/music_tables.h"
#include "core/score.h"

namespace tunescript {

/// Parser behavior switches.
struct ParserOptions {
  bool debug = false;  ///< Emit [parser] diagnostics through the logger.
};

/// Outcome of one parse call.
struct ParseResult {
  std::optional<Score> score;         ///< Absent on fatal errors.
  std::vector<std::string> errors;    ///< Fatal problems (at most one).
  std::vector<std::string> warnings;  ///< Informational, never block loading.

  /// @brief True when a score was produced.
  bool success() const { return score.has_value(); }
};

/// Song-level header fields found in the cleaned text.
struct SongHeader {
  std::string title = "Untitled";
  int tempo = kDefaultTempo;
  std::string key = "C";
};

/// Name and length parsed from a "SECTION: ..." header line.
struct SectionHeader {
  std::string name = "Section";
  int bars = kDefaultSectionBars;
};

/// @brief Parses song DSL text into a Score.
///
/// The parser holds no per-call state: diagnostics are returned in the
/// ParseResult, so one instance can be shared between threads.
///
/// Accepted layout:
/// @code
///   SONG: Title
///   TEMPO: 120
///   KEY: Am
///   SECTION: Verse [4 bars]
///     PIANO: C4(q) Am(h,mf) | _ | Dm7(w)
///     DRUMS: kick(1,3) snare(2,4) hat(8ths) | ...
/// @endcode
class DslParser {
 public:
  explicit DslParser(const MusicTables& tables, ParserOptions options = {});

  /// @brief Parse raw (possibly messy) song text.
  /// @param text Raw model output.
  /// @return Score plus warnings, or errors without a score.
  ParseResult parse(std::string_view text) const;

 private:
  const MusicTables& tables_;
  ParserOptions options_;
};

/// @brief Extract SONG:, TEMPO: and KEY: from cleaned text.
/// @param warnings Receives a message when TEMPO is present but unusable.
SongHeader parseSongHeader(std::string_view cleaned, std::vector<std::string>& warnings);

/// @brief Parse a section header line ("SECTION: Chorus (8 bars)").
/// @param warnings Receives a message when the bar count is zero or too large.
SectionHeader parseSectionHeader(std::string_view line, std::vector<std::string>& warnings);

/// @brief Split cleaned text into blocks that each start with "SECTION:".
/// Text before the first marker is dropped.
std::vector<std::string_view> splitSectionBlocks(std::string_view cleaned);

/// @brief Parse with the built-in tables and default options.
ParseResult parseSongText(std::string_view text);

}  // namespace tunescript

#endif  // TUNESCRIPT_DSL_DSL_PARSER_H
