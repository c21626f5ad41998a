// Minimal JSON writer (no external dependencies).
//
// Builds JSON text incrementally for the score document and CLI reports.
// Reading is handled separately by core/json_parser.h.

#ifndef TUNESCRIPT_CORE_JSON_HELPERS_H
#define TUNESCRIPT_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tunescript {

/// @brief Streaming JSON writer with optional indentation.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("pitch");
///   writer.value(60);
///   writer.key("drum");
///   writer.value("kick");
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"pitch":60,"drum":"kick"}
/// @endcode
///
/// Commas and (when indent_size > 0) line breaks are inserted automatically.
/// Does not validate structure (caller must match begin/end pairs).
class JsonWriter {
 public:
  /// @param indent_size Spaces per nesting level; 0 writes compact JSON.
  explicit JsonWriter(int indent_size = 0) : indent_size_(indent_size) {}

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value or container).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);
  void value(const char* val) { value(std::string_view(val)); }

  void value(int val);
  void value(uint32_t val);

  /// @brief Write a double with the shortest text that reads back exactly.
  /// NaN and infinity are written as null.
  void value(double val);

  void value(bool val);
  void valueNull();

  /// @brief Get the accumulated JSON text.
  const std::string& toString() const { return buffer_; }

  /// @brief Format a double as the shortest decimal that round-trips through strtod.
  static std::string formatDouble(double val);

  /// @brief Escape special characters in a string for JSON output.
  static std::string escapeString(std::string_view input);

 private:
  struct Frame {
    bool has_items = false;
    bool after_key = false;
  };

  /// Emit the separator (and indentation) that precedes a value.
  void beforeValue();

  /// Emit a line break followed by indentation for the given depth.
  void newline(size_t depth);

  void closeContainer(char closer);

  std::string buffer_;
  std::vector<Frame> stack_;
  int indent_size_ = 0;
};

}  // namespace tunescript

#endif  // TUNESCRIPT_CORE_JSON_HELPERS_H
