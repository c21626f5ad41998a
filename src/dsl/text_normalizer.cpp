// Implementation of the song text normalizer and cleaner.

#include "dsl/text_normalizer.h"

#include <algorithm>
#include <vector>

#include "core/string_utils.h"

namespace tunescript {

namespace {

/// Normalization only fires below this newline count.
constexpr size_t kCollapsedNewlineLimit = 5;

constexpr std::string_view kStructuralKeywords[] = {"SONG:", "TEMPO:", "KEY:", "SECTION:"};

constexpr std::string_view kInstrumentMarkers[] = {
    "GUITAR", "PIANO", "BASS",  "DRUMS", "STRINGS", "PAD",    "LEAD",
    "SYNTH",  "ORGAN", "BRASS", "CHOIR", "FLUTE",   "VIOLIN", "CELLO"};

/// @brief True if only whitespace precedes pos on its line.
bool startsLine(const std::string& text, size_t pos) {
  for (size_t idx = pos; idx > 0; --idx) {
    char chr = text[idx - 1];
    if (chr == '\n') return true;
    if (!isSpace(chr)) return false;
  }
  return true;
}

/// @brief Replace the whitespace before each occurrence of needle with breaker.
void breakBefore(std::string& text, std::string_view needle, std::string_view breaker) {
  size_t pos = findIgnoreCase(text, needle, 0);
  while (pos != std::string::npos) {
    size_t next_from = pos + needle.size();
    if (pos > 0 && isSpace(text[pos - 1]) && !startsLine(text, pos)) {
      text.replace(pos - 1, 1, breaker);
      next_from += breaker.size() - 1;
    }
    pos = findIgnoreCase(text, needle, next_from);
  }
}

}  // namespace

std::string normalize(std::string_view raw) {
  std::string text(raw);
  size_t newlines = static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
  if (newlines >= kCollapsedNewlineLimit || !containsIgnoreCase(text, kSectionMarker)) {
    return text;
  }

  for (std::string_view keyword : kStructuralKeywords) {
    breakBefore(text, keyword, "\n");
  }
  for (std::string_view marker : kInstrumentMarkers) {
    std::string needle(marker);
    needle += ':';
    breakBefore(text, needle, "\n  ");
  }
  return text;
}

std::string clean(std::string_view text) {
  std::vector<std::string> kept;
  for (const std::string& raw_line : split(text, '\n')) {
    std::string line = trim(raw_line);
    if (line.empty() || startsWith(line, "```")) continue;

    bool comment = startsWith(line, "#") || startsWith(line, "//") || startsWith(line, "*");
    if (comment && !containsIgnoreCase(line, "SECTION")) continue;

    size_t inline_comment = line.find("//");
    if (inline_comment != std::string::npos) {
      line = trim(std::string_view(line).substr(0, inline_comment));
    }
    if (!line.empty()) kept.push_back(std::move(line));
  }

  std::string result;
  for (size_t idx = 0; idx < kept.size(); ++idx) {
    if (idx > 0) result += '\n';
    result += kept[idx];
  }
  return result;
}

}  // namespace tunescript
