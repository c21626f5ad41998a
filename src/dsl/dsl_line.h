// Classification of section body lines ("<label>: <pattern>").

#ifndef TUNESCRIPT_DSL_DSL_LINE_H
#define TUNESCRIPT_DSL_DSL_LINE_H

#include <cstdint>
#include <string>
#include <string_view>

namespace tunescript {

/// Kinds of line that can appear inside a section block.
enum class DslLineKind : uint8_t {
  Drums,         ///< "DRUMS: kick(1,3) | ..."
  Instrument,    ///< "<NAME>: C4(q) Am(h) | ..."
  Unrecognized   ///< Anything else; skipped by the parser.
};

/// A classified body line.
struct DslLine {
  DslLineKind kind = DslLineKind::Unrecognized;
  std::string label;    ///< Word before the colon, as written.
  std::string pattern;  ///< Text after the colon and following whitespace.
};

/// @brief Classify one trimmed body line.
///
/// A line has the shape `<word>\s*:\s*<rest>` where word is one or more
/// letters, digits or underscores at the start of the line and rest is
/// non-empty. DRUMS (any case) selects the drum kind; other words are
/// instrument tracks. Lines of any other shape are Unrecognized.
DslLine classifyBodyLine(std::string_view line);

/// @brief Convert DslLineKind to a string ("Drums", "Instrument", "Unrecognized").
const char* dslLineKindToString(DslLineKind kind);

}  // namespace tunescript

#endif  // TUNESCRIPT_DSL_DSL_LINE_H
