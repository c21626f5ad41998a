// Implementation of the tool configuration loader.

#include "config/tool_config.h"

#include <cmath>
#include <fstream>
#include <sstream>

#include "core/json_parser.h"
#include "core/string_utils.h"

namespace tunescript {

namespace {

bool isWholeNumber(const JsonValue& value) {
  return value.isNumber() && std::floor(value.number_val) == value.number_val;
}

/// @brief Read an object of name -> integer within [min_value, max_value].
/// @return False with error set on the first bad entry.
bool readNumberTable(const JsonValue& node, const char* field, int min_value, int max_value,
                     std::map<std::string, int>& out, std::string& error) {
  if (!node.isObject()) {
    error = std::string(field) + ": expected an object";
    return false;
  }
  for (const auto& member : node.object_members) {
    const std::string name = toLower(trim(member.key));
    if (name.empty()) {
      error = std::string(field) + ": empty name";
      return false;
    }
    const JsonValue& value = member.value;
    if (!isWholeNumber(value) || value.number_val < min_value || value.number_val > max_value) {
      error = std::string(field) + "." + member.key + ": expected an integer in " +
              std::to_string(min_value) + ".." + std::to_string(max_value);
      return false;
    }
    out[name] = value.asInt();
  }
  return true;
}

}  // namespace

MusicTables ToolConfig::buildTables() const {
  MusicTables tables = MusicTables::makeDefault();
  applyTableOverrides(*this, tables);
  return tables;
}

void applyTableOverrides(const ToolConfig& config, MusicTables& tables) {
  for (const auto& [name, program] : config.instrument_overrides) {
    tables.instrument_programs[name] = program;
  }
  for (const auto& [name, key] : config.drum_overrides) {
    tables.drum_pitches[name] = key;
  }
}

ToolConfigResult parseToolConfig(std::string_view json) {
  ToolConfigResult result;

  JsonParseResult parsed = parseJson(json);
  if (!parsed.success) {
    result.error_message = "Invalid config JSON at offset " +
                           std::to_string(parsed.error_offset) + ": " + parsed.error_message;
    return result;
  }
  if (!parsed.value.isObject()) {
    result.error_message = "Config root must be a JSON object";
    return result;
  }

  ToolConfig& config = result.config;
  for (const auto& member : parsed.value.object_members) {
    const std::string& key = member.key;
    const JsonValue& value = member.value;

    if (key == "log_level") {
      if (!value.isString()) {
        result.error_message = "log_level: expected a string";
        return result;
      }
      std::string level = toLower(trim(value.string_val));
      config.log_level = logLevelFromString(level);
      if (config.log_level == LogLevel::Warn && level != "warn" && level != "warning") {
        result.warnings.push_back("log_level: unknown level '" + value.string_val +
                                  "', using warn");
      }
    } else if (key == "debug_parser") {
      if (!value.isBool()) {
        result.error_message = "debug_parser: expected true or false";
        return result;
      }
      config.debug_parser = value.bool_val;
    } else if (key == "output") {
      if (!value.isString() || value.string_val.empty()) {
        result.error_message = "output: expected a non-empty string";
        return result;
      }
      config.output_path = value.string_val;
    } else if (key == "instruments") {
      if (!readNumberTable(value, "instruments", kPercussionProgram, 127,
                           config.instrument_overrides, result.error_message)) {
        return result;
      }
    } else if (key == "drums") {
      std::map<std::string, int> keys;
      if (!readNumberTable(value, "drums", 0, 127, keys, result.error_message)) {
        return result;
      }
      for (const auto& [name, note] : keys) {
        config.drum_overrides[name] = static_cast<uint8_t>(note);
      }
    } else {
      result.warnings.push_back("Unknown config key '" + key + "' ignored");
    }
  }

  result.success = true;
  return result;
}

ToolConfigResult loadToolConfig(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    ToolConfigResult result;
    result.error_message = "Failed to open config file: " + path;
    return result;
  }
  std::ostringstream contents;
  contents << file.rdbuf();

  ToolConfigResult result = parseToolConfig(contents.str());
  if (!result.success) result.error_message = path + ": " + result.error_message;
  return result;
}

}  // namespace tunescript
