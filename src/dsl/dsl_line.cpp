// Implementation of section body line classification.

#include "dsl/dsl_line.h"

#include "core/string_utils.h"

namespace tunescript {

DslLine classifyBodyLine(std::string_view line) {
  DslLine result;

  size_t pos = 0;
  while (pos < line.size() && isWordChar(line[pos])) ++pos;
  if (pos == 0) return result;
  std::string_view word = line.substr(0, pos);

  while (pos < line.size() && isSpace(line[pos])) ++pos;
  if (pos >= line.size() || line[pos] != ':') return result;
  ++pos;
  while (pos < line.size() && isSpace(line[pos])) ++pos;
  if (pos >= line.size()) return result;

  result.label = std::string(word);
  result.pattern = std::string(line.substr(pos));
  result.kind = equalsIgnoreCase(word, "DRUMS") ? DslLineKind::Drums : DslLineKind::Instrument;
  return result;
}

const char* dslLineKindToString(DslLineKind kind) {
  switch (kind) {
    case DslLineKind::Drums:        return "Drums";
    case DslLineKind::Instrument:   return "Instrument";
    case DslLineKind::Unrecognized: return "Unrecognized";
  }
  return "Unknown";
}

}  // namespace tunescript
