// Score <-> JSON document (project save/load format).

#ifndef TUNESCRIPT_CORE_SCORE_JSON_H
#define TUNESCRIPT_CORE_SCORE_JSON_H

#include <string>
#include <string_view>

#include "core/score.h"

namespace tunescript {

/// @brief Result of reading a score document.
struct ScoreLoadResult {
  bool success = false;
  Score score;
  std::string error_message;
};

/// @brief Serialize a score to the JSON document layout.
///
/// Absent optional section fields (key, tempo, drums) are written as null so
/// they read back as absent rather than as defaults.
///
/// @param score Score to serialize.
/// @param pretty Indent with two spaces when true, compact otherwise.
/// @return JSON text.
std::string scoreToJson(const Score& score, bool pretty = true);

/// @brief Deserialize a score from JSON text.
///
/// Missing optional fields take the model defaults. Missing required fields
/// (section name/bars, note pitch/start/duration, chord root/quality/octave/
/// start/duration, track name/instrument, hit drum/start) or malformed JSON
/// fail the load.
ScoreLoadResult scoreFromJson(std::string_view json);

/// @brief Write scoreToJson(score) to a file.
/// @return True if the whole document was written.
bool saveScoreFile(const Score& score, const std::string& path);

/// @brief Read and deserialize a score document from a file.
ScoreLoadResult loadScoreFile(const std::string& path);

}  // namespace tunescript

#endif  // TUNESCRIPT_CORE_SCORE_JSON_H
