/// @file
/// @brief stderr logger implementation.

#include "core/log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>

#include "core/string_utils.h"

namespace tunescript {

namespace {

std::atomic<LogLevel> g_log_level{LogLevel::Warn};

}  // namespace

void setLogLevel(LogLevel level) {
  g_log_level.store(level, std::memory_order_relaxed);
}

LogLevel getLogLevel() {
  return g_log_level.load(std::memory_order_relaxed);
}

bool isLogEnabled(LogLevel level) {
  if (level == LogLevel::Off) return false;
  return static_cast<uint8_t>(level) >= static_cast<uint8_t>(getLogLevel());
}

void logMessage(LogLevel level, const char* tag, const char* fmt, ...) {
  if (!isLogEnabled(level)) return;

  std::fprintf(stderr, "[%s] %s: ", tag, logLevelToString(level));
  va_list args;
  va_start(args, fmt);
  std::vfprintf(stderr, fmt, args);
  va_end(args);
  std::fputc('\n', stderr);
}

const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF";
  }
  return "?";
}

LogLevel logLevelFromString(const std::string& str) {
  std::string lower = toLower(trim(str));
  if (lower == "debug") return LogLevel::Debug;
  if (lower == "info") return LogLevel::Info;
  if (lower == "warn" || lower == "warning") return LogLevel::Warn;
  if (lower == "error") return LogLevel::Error;
  if (lower == "off" || lower == "none") return LogLevel::Off;
  return LogLevel::Warn;
}

}  // namespace tunescript
