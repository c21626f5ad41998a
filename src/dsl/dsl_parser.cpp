// Implementation of the song DSL parser.

#include "dsl/dsl_parser.h"

#include <utility>

#include "core/log.h"
#include "core/string_utils.h"
#include "dsl/dsl_line.h"
#include "dsl/pattern_parser.h"
#include "dsl/text_normalizer.h"

namespace tunescript {

namespace {

constexpr std::string_view kSongMarker = "SONG:";
constexpr std::string_view kTempoMarker = "TEMPO:";
constexpr std::string_view kKeyMarker = "KEY:";

/// Longest digit run accepted as a number before it counts as an overflow.
constexpr size_t kMaxNumberDigits = 6;

size_t skipSpaces(std::string_view text, size_t pos) {
  while (pos < text.size() && isSpace(text[pos])) ++pos;
  return pos;
}

size_t digitRunEnd(std::string_view text, size_t pos) {
  while (pos < text.size() && isDigit(text[pos])) ++pos;
  return pos;
}

/// @brief Convert a digit run to an int.
/// @return Value, or -1 if the run is too long to be a sensible count.
int digitsToInt(std::string_view digits) {
  size_t first = digits.find_first_not_of('0');
  if (first == std::string_view::npos) return 0;
  if (digits.size() - first > kMaxNumberDigits) return -1;
  int value = 0;
  for (size_t idx = first; idx < digits.size(); ++idx) {
    value = value * 10 + (digits[idx] - '0');
  }
  return value;
}

bool isKeyLetter(char chr) {
  return (chr >= 'A' && chr <= 'G') || (chr >= 'a' && chr <= 'g');
}

std::optional<std::string> findTitle(std::string_view cleaned) {
  size_t pos = 0;
  while ((pos = findIgnoreCase(cleaned, kSongMarker, pos)) != std::string_view::npos) {
    pos = skipSpaces(cleaned, pos + kSongMarker.size());
    size_t eol = cleaned.find('\n', pos);
    std::string title = trim(cleaned.substr(pos, eol == std::string_view::npos ? eol : eol - pos));
    if (!title.empty()) return title;
  }
  return std::nullopt;
}

/// @return Digits following the first TEMPO: marker that has any.
std::optional<std::string_view> findTempoDigits(std::string_view cleaned) {
  size_t pos = 0;
  while ((pos = findIgnoreCase(cleaned, kTempoMarker, pos)) != std::string_view::npos) {
    pos = skipSpaces(cleaned, pos + kTempoMarker.size());
    size_t end = digitRunEnd(cleaned, pos);
    if (end > pos) return cleaned.substr(pos, end - pos);
  }
  return std::nullopt;
}

/// @return Key name ("C", "F#", "Am", "Bbm") after the first KEY: marker that has one.
std::optional<std::string> findKey(std::string_view cleaned) {
  size_t pos = 0;
  while ((pos = findIgnoreCase(cleaned, kKeyMarker, pos)) != std::string_view::npos) {
    pos = skipSpaces(cleaned, pos + kKeyMarker.size());
    if (pos >= cleaned.size() || !isKeyLetter(cleaned[pos])) continue;

    size_t end = pos + 1;
    if (end < cleaned.size() && (cleaned[end] == '#' || cleaned[end] == 'b' || cleaned[end] == 'B')) {
      ++end;
    }
    if (end < cleaned.size() && (cleaned[end] == 'm' || cleaned[end] == 'M')) ++end;
    return std::string(cleaned.substr(pos, end - pos));
  }
  return std::nullopt;
}

/// @brief Find the first "<digits>\s*bar" in a header line.
/// @return Digit run, or nullopt when the header declares no length.
std::optional<std::string_view> findBarCount(std::string_view line) {
  size_t pos = 0;
  while (pos < line.size()) {
    if (!isDigit(line[pos])) {
      ++pos;
      continue;
    }
    size_t end = digitRunEnd(line, pos);
    size_t word = skipSpaces(line, end);
    if (findIgnoreCase(line.substr(word, 3), "bar") == 0) {
      return line.substr(pos, end - pos);
    }
    pos = end;
  }
  return std::nullopt;
}

}  // namespace

// ---------------------------------------------------------------------------
// Header helpers
// ---------------------------------------------------------------------------

SongHeader parseSongHeader(std::string_view cleaned, std::vector<std::string>& warnings) {
  SongHeader header;
  if (auto title = findTitle(cleaned)) header.title = std::move(*title);

  if (auto digits = findTempoDigits(cleaned)) {
    int tempo = digitsToInt(*digits);
    if (tempo > 0) {
      header.tempo = tempo;
    } else {
      warnings.push_back("Invalid tempo '" + std::string(*digits) + "'; using " +
                         std::to_string(kDefaultTempo) + " BPM");
    }
  }

  if (auto key = findKey(cleaned)) header.key = std::move(*key);
  return header;
}

SectionHeader parseSectionHeader(std::string_view line, std::vector<std::string>& warnings) {
  SectionHeader header;

  size_t marker = findIgnoreCase(line, kSectionMarker);
  if (marker != std::string_view::npos) {
    size_t pos = skipSpaces(line, marker + kSectionMarker.size());
    std::string_view rest = line.substr(pos);
    if (!rest.empty()) {
      // The name takes at least one character before a bracket can end it.
      size_t bracket = rest.find_first_of("[(", 1);
      std::string name = trim(rest.substr(0, bracket));
      if (!name.empty()) header.name = std::move(name);
    }
  }

  if (auto digits = findBarCount(line)) {
    int bars = digitsToInt(*digits);
    if (bars > 0) {
      header.bars = bars;
    } else {
      warnings.push_back("Section '" + header.name + "' has invalid length '" +
                         std::string(*digits) + " bars'; using " +
                         std::to_string(kDefaultSectionBars));
    }
  }
  return header;
}

std::vector<std::string_view> splitSectionBlocks(std::string_view cleaned) {
  std::vector<std::string_view> blocks;
  size_t start = findIgnoreCase(cleaned, kSectionMarker);
  while (start != std::string_view::npos) {
    size_t next = findIgnoreCase(cleaned, kSectionMarker, start + kSectionMarker.size());
    size_t len = (next == std::string_view::npos) ? std::string_view::npos : next - start;
    blocks.push_back(cleaned.substr(start, len));
    start = next;
  }
  return blocks;
}

// ---------------------------------------------------------------------------
// DslParser
// ---------------------------------------------------------------------------

DslParser::DslParser(const MusicTables& tables, ParserOptions options)
    : tables_(tables), options_(options) {}

ParseResult DslParser::parse(std::string_view text) const {
  ParseResult result;
  const bool debug = options_.debug;

  std::string cleaned = clean(normalize(text));
  if (debug) {
    logMessage(LogLevel::Debug, "parser", "cleaned text (%zu chars):\n%.500s", cleaned.size(),
               cleaned.c_str());
  }
  if (cleaned.empty()) {
    result.errors.push_back("No DSL content found");
    return result;
  }

  Score score;
  SongHeader song = parseSongHeader(cleaned, result.warnings);
  score.title = song.title;
  score.tempo = song.tempo;
  score.key = song.key;

  PatternParser patterns(tables_);
  int bar_cursor = 0;

  for (std::string_view block : splitSectionBlocks(cleaned)) {
    std::vector<std::string> lines = split(block, '\n');
    SectionHeader header = parseSectionHeader(lines.front(), result.warnings);

    Section section;
    section.name = header.name;
    section.bars = header.bars;
    section.start_bar = bar_cursor;
    section.key = score.key;
    section.tempo = score.tempo;

    for (size_t idx = 1; idx < lines.size(); ++idx) {
      DslLine line = classifyBodyLine(trim(lines[idx]));
      switch (line.kind) {
        case DslLineKind::Drums:
          section.drums = patterns.parseDrumPattern(line.pattern);
          break;

        case DslLineKind::Instrument: {
          std::string instrument = toLower(line.label);
          if (tables_.isPercussionInstrument(instrument)) {
            result.warnings.push_back("Track '" + line.label + "' in section '" + section.name +
                                      "' names the percussion kit; use DRUMS:");
            break;
          }
          if (!tables_.isKnownInstrument(instrument)) {
            result.warnings.push_back("Unknown instrument '" + line.label +
                                      "'; it will play as piano");
          }

          InstrumentTrack track;
          track.name = titleCase(line.label);
          track.instrument = instrument;
          patterns.parseInstrumentPattern(line.pattern, track, result.warnings);
          if (debug) {
            logMessage(LogLevel::Debug, "parser", "track %s: %zu notes, %zu chords",
                       track.name.c_str(), track.notes.size(), track.chords.size());
          }
          section.tracks.push_back(std::move(track));
          break;
        }

        case DslLineKind::Unrecognized:
          break;
      }
    }

    if (debug) {
      logMessage(LogLevel::Debug, "parser", "section %s: start bar %d, %d bars, %zu tracks%s",
                 section.name.c_str(), section.start_bar, section.bars, section.tracks.size(),
                 section.drums ? ", drums" : "");
    }
    bar_cursor += section.bars;
    score.sections.push_back(std::move(section));
  }

  if (score.sections.empty()) {
    result.errors.push_back("No sections found");
    return result;
  }

  for (const std::string& warning : result.warnings) {
    logMessage(LogLevel::Info, "parser", "%s", warning.c_str());
  }
  result.score = std::move(score);
  return result;
}

ParseResult parseSongText(std::string_view text) {
  return DslParser(MusicTables::defaults()).parse(text);
}

}  // namespace tunescript
