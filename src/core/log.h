// Leveled diagnostic logging to stderr.

#ifndef TUNESCRIPT_CORE_LOG_H
#define TUNESCRIPT_CORE_LOG_H

#include <cstdint>
#include <string>

namespace tunescript {

/// Severity of a log message. Messages below the active level are dropped.
enum class LogLevel : uint8_t {
  Debug,
  Info,
  Warn,
  Error,
  Off
};

/// @brief Set the process-wide minimum level (default: Warn).
void setLogLevel(LogLevel level);

/// @brief Get the process-wide minimum level.
LogLevel getLogLevel();

/// @brief Check whether a message at the given level would be printed.
bool isLogEnabled(LogLevel level);

/// @brief Print "[tag] LEVEL: message" to stderr (printf-style formatting).
/// @param level Message severity.
/// @param tag Short component tag such as "parser" or "player".
/// @param fmt printf format string.
void logMessage(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

/// @brief Convert LogLevel to its upper-case label ("DEBUG", "WARN", ...).
const char* logLevelToString(LogLevel level);

/// @brief Parse a level name ("debug", "info", "warn", "error", "off").
/// @return Parsed level. Defaults to LogLevel::Warn on unrecognized input.
LogLevel logLevelFromString(const std::string& str);

}  // namespace tunescript

#endif  // TUNESCRIPT_CORE_LOG_H
