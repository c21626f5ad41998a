/// @file
/// @brief Instrument and drum pattern slot parsing.

#include "dsl/pattern_parser.h"

#include <cmath>
#include <cstdlib>

#include "core/string_utils.h"

namespace tunescript {

namespace {

constexpr int kEighthsPerBar = 8;
constexpr int kSixteenthsPerBar = 16;

bool isNoteLetter(char chr) {
  return (chr >= 'A' && chr <= 'G') || (chr >= 'a' && chr <= 'g');
}

bool isAccidental(char chr) {
  return chr == '#' || chr == 'b';
}

/// @brief Match `\s*\(([^)]+)\)` at pos.
/// @return True with params and end position set on success.
bool matchParams(std::string_view text, size_t pos, std::string& params, size_t& end) {
  while (pos < text.size() && isSpace(text[pos])) ++pos;
  if (pos >= text.size() || text[pos] != '(') return false;
  size_t close = text.find(')', pos + 1);
  if (close == std::string_view::npos || close == pos + 1) return false;
  params = std::string(text.substr(pos + 1, close - pos - 1));
  end = close + 1;
  return true;
}

/// @brief Scan for `<token>(<params>)` items where token_end(pos) returns the
///        end of a token starting at pos, or pos when no token starts there.
template <typename TokenEnd>
std::vector<PatternItem> findItems(std::string_view slot, TokenEnd token_end) {
  std::vector<PatternItem> items;
  size_t pos = 0;
  while (pos < slot.size()) {
    size_t end_of_token = token_end(slot, pos);
    std::string params;
    size_t end = 0;
    if (end_of_token > pos && matchParams(slot, end_of_token, params, end)) {
      items.push_back({std::string(slot.substr(pos, end_of_token - pos)), std::move(params)});
      pos = end;
    } else {
      ++pos;
    }
  }
  return items;
}

/// @brief Parse a whole string as a finite decimal number.
std::optional<double> parseNumber(const std::string& text) {
  if (text.empty()) return std::nullopt;
  char first = text[0];
  if (!isDigit(first) && first != '.' && first != '+' && first != '-') return std::nullopt;
  if (text.find_first_of("xX") != std::string::npos) return std::nullopt;

  char* end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || !std::isfinite(value)) return std::nullopt;
  return value;
}

}  // namespace

std::vector<PatternItem> findPitchedItems(std::string_view slot) {
  return findItems(slot, [](std::string_view text, size_t pos) {
    if (!isNoteLetter(text[pos])) return pos;
    size_t end = pos + 1;
    if (end < text.size() && isAccidental(text[end])) ++end;
    while (end < text.size() && isWordChar(text[end])) ++end;
    return end;
  });
}

std::vector<PatternItem> findDrumItems(std::string_view slot) {
  return findItems(slot, [](std::string_view text, size_t pos) {
    size_t end = pos;
    while (end < text.size() && isWordChar(text[end])) ++end;
    return end;
  });
}

bool isNoteToken(std::string_view token) {
  if (token.size() == 2) {
    return isNoteLetter(token[0]) && isDigit(token[1]);
  }
  if (token.size() == 3) {
    return isNoteLetter(token[0]) && isAccidental(token[1]) && isDigit(token[2]);
  }
  return false;
}

bool isRestSlot(std::string_view slot) {
  std::string trimmed = trim(slot);
  return trimmed.empty() || trimmed == kRestSlot;
}

std::vector<std::pair<Beat, double>> parseDrumBeats(std::string_view beats) {
  std::vector<std::pair<Beat, double>> hits;
  std::string form = toLower(trim(beats));

  if (form == "8ths" || form == "eighths") {
    for (int idx = 0; idx < kEighthsPerBar; ++idx) {
      hits.emplace_back(idx * 0.5, kEighthsHitVelocity);
    }
    return hits;
  }
  if (form == "16ths" || form == "sixteenths") {
    for (int idx = 0; idx < kSixteenthsPerBar; ++idx) {
      hits.emplace_back(idx * 0.25, kSixteenthsHitVelocity);
    }
    return hits;
  }

  for (const std::string& entry : split(form, ',')) {
    std::string beat_text = trim(entry);
    if (beat_text.empty()) continue;
    std::optional<double> beat = parseNumber(beat_text);
    if (!beat) return {};  // Non-numeric list: discard the whole item.
    if (*beat < 1.0) continue;
    hits.emplace_back(*beat - 1.0, kListedHitVelocity);
  }
  return hits;
}

NoteParams PatternParser::parseParams(std::string_view params) const {
  NoteParams result;
  for (const std::string& raw : split(params, ',')) {
    std::string code = toLower(trim(raw));
    if (auto duration = tables_.durationBeats(code)) {
      result.duration = *duration;
    } else if (auto velocity = tables_.dynamicsVelocity(code)) {
      result.velocity = *velocity;
    }
  }
  return result;
}

std::optional<ChordSymbol> PatternParser::parseChordSymbol(std::string_view token) const {
  if (token.empty() || !isNoteLetter(token[0])) return std::nullopt;

  ChordSymbol symbol;
  size_t root_len = (token.size() > 1 && isAccidental(token[1])) ? 2 : 1;
  symbol.root = toUpper(token.substr(0, 1));
  if (root_len == 2) symbol.root += token[1];

  std::string_view suffix = token.substr(root_len);
  symbol.quality = std::string(suffix);

  if (!tables_.isKnownQuality(suffix) && !suffix.empty() && isDigit(suffix.back())) {
    std::string_view base = suffix.substr(0, suffix.size() - 1);
    if (base.empty() || tables_.isKnownQuality(base)) {
      symbol.quality = std::string(base);
      symbol.octave = suffix.back() - '0';
    }
  }
  return symbol;
}

void PatternParser::parseInstrumentPattern(std::string_view pattern, InstrumentTrack& track,
                                           std::vector<std::string>& warnings) const {
  Beat bar_start = 0.0;
  for (const std::string& raw_slot : split(pattern, '|')) {
    std::string slot = trim(raw_slot);
    if (isRestSlot(slot)) {
      bar_start += kBeatsPerBar;
      continue;
    }

    Beat offset = 0.0;
    for (const PatternItem& item : findPitchedItems(slot)) {
      NoteParams params = parseParams(item.params);
      Beat start = bar_start + offset;

      if (isNoteToken(item.token)) {
        std::string_view token(item.token);
        std::string_view name = token.substr(0, token.size() - 1);
        int octave = token.back() - '0';
        int raw_pitch = rawNotePitch(tables_, name, octave).value_or(0);
        if (raw_pitch < 0 || raw_pitch > 127) {
          warnings.push_back("Note " + item.token + " in track " + track.name +
                             " is outside the MIDI range; clamped");
        }

        Note note;
        note.pitch = clampMidi(raw_pitch);
        note.start = start;
        note.duration = params.duration;
        note.velocity = params.velocity;
        track.notes.push_back(note);
      } else if (auto symbol = parseChordSymbol(item.token)) {
        Chord chord;
        chord.root = symbol->root;
        chord.quality = symbol->quality;
        chord.octave = symbol->octave;
        chord.start = start;
        chord.duration = params.duration;
        chord.velocity = params.velocity;
        track.chords.push_back(std::move(chord));
      }

      offset += params.duration;
    }

    bar_start += kBeatsPerBar;
  }
}

DrumTrack PatternParser::parseDrumPattern(std::string_view pattern) const {
  DrumTrack drums;
  std::vector<std::string> slots = split(pattern, '|');
  for (size_t bar_idx = 0; bar_idx < slots.size(); ++bar_idx) {
    std::string slot = trim(slots[bar_idx]);
    if (isRestSlot(slot)) continue;

    Beat bar_start = static_cast<Beat>(bar_idx) * kBeatsPerBar;
    for (const PatternItem& item : findDrumItems(slot)) {
      std::string drum = toLower(item.token);
      for (const auto& [offset, velocity] : parseDrumBeats(item.params)) {
        DrumHit hit;
        hit.drum = drum;
        hit.start = bar_start + offset;
        hit.velocity = velocity;
        drums.hits.push_back(hit);
      }
    }
  }
  return drums;
}

}  // namespace tunescript
