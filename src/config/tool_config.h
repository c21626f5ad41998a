// Tool configuration file: logging, defaults and lookup-table overrides.

#ifndef TUNESCRIPT_CONFIG_TOOL_CONFIG_H
#define TUNESCRIPT_CONFIG_TOOL_CONFIG_H

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "core/log.h"
#include "core/music_tables.h"

namespace tunescript {

/// Default MIDI output path.
constexpr const char* kDefaultOutputPath = "output.mid";

/// @brief Settings read from a JSON configuration file.
///
/// @code
///   {
///     "log_level": "info",
///     "debug_parser": false,
///     "output": "song.mid",
///     "instruments": { "harpsichord": 6, "kit": -1 },
///     "drums": { "cowbell": 56 }
///   }
/// @endcode
struct ToolConfig {
  LogLevel log_level = LogLevel::Warn;
  bool debug_parser = false;
  std::string output_path = kDefaultOutputPath;
  /// Lower-case instrument name -> GM program, or kPercussionProgram.
  std::map<std::string, int> instrument_overrides;
  /// Lower-case drum name -> GM percussion key.
  std::map<std::string, uint8_t> drum_overrides;

  /// @brief Built-in tables with the overrides applied.
  MusicTables buildTables() const;
};

/// Outcome of loading a configuration.
struct ToolConfigResult {
  bool success = false;
  ToolConfig config;
  std::string error_message;
  std::vector<std::string> warnings;  ///< Unknown keys, unknown level names
};

/// @brief Parse configuration JSON text.
///
/// Fails on malformed JSON, a non-object document, or out-of-range table
/// entries. Unknown keys are reported as warnings and otherwise ignored.
ToolConfigResult parseToolConfig(std::string_view json);

/// @brief Read and parse a configuration file.
ToolConfigResult loadToolConfig(const std::string& path);

/// @brief Apply instrument and drum overrides to a table set.
void applyTableOverrides(const ToolConfig& config, MusicTables& tables);

}  // namespace tunescript

#endif  // TUNESCRIPT_CONFIG_TOOL_CONFIG_H
