// Repair and cleanup of raw song text before structural parsing.

#ifndef TUNESCRIPT_DSL_TEXT_NORMALIZER_H
#define TUNESCRIPT_DSL_TEXT_NORMALIZER_H

#include <string>
#include <string_view>

namespace tunescript {

/// Marker that opens a section block.
constexpr std::string_view kSectionMarker = "SECTION:";

/// @brief Restore line structure when a song was collapsed onto few lines.
///
/// Fires only when the text has fewer than 5 newlines and contains
/// "SECTION:" (case-insensitive). Then the whitespace character before each
/// structural keyword (SONG:, TEMPO:, KEY:, SECTION:) becomes a newline and
/// the whitespace before each instrument marker (PIANO:, BASS:, ...) becomes
/// a newline plus two-space indent. Keywords that already start their line
/// are left alone, so normalize(normalize(x)) == normalize(x). Never removes
/// non-whitespace content.
std::string normalize(std::string_view raw);

/// @brief Drop noise lines and inline comments.
///
/// Per line (trimmed): blank lines and code fences (```) are dropped; lines
/// starting with '#', '//' or '*' are dropped unless they mention SECTION;
/// anything after an inline '//' is cut. Surviving lines are joined by '\n'.
std::string clean(std::string_view text);

}  // namespace tunescript

#endif  // TUNESCRIPT_DSL_TEXT_NORMALIZER_H
