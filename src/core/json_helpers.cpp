/// @file
/// @brief Implementation of the minimal JSON writer.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace tunescript {

void JsonWriter::beginObject() {
  beforeValue();
  buffer_ += '{';
  stack_.push_back(Frame{});
}

void JsonWriter::endObject() {
  closeContainer('}');
}

void JsonWriter::beginArray() {
  beforeValue();
  buffer_ += '[';
  stack_.push_back(Frame{});
}

void JsonWriter::endArray() {
  closeContainer(']');
}

void JsonWriter::key(std::string_view name) {
  if (!stack_.empty()) {
    Frame& frame = stack_.back();
    if (frame.has_items) buffer_ += ',';
    if (indent_size_ > 0) newline(stack_.size());
    frame.has_items = true;
    frame.after_key = true;
  }
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += indent_size_ > 0 ? "\": " : "\":";
}

void JsonWriter::value(std::string_view val) {
  beforeValue();
  buffer_ += '"';
  buffer_ += escapeString(val);
  buffer_ += '"';
}

void JsonWriter::value(int val) {
  beforeValue();
  buffer_ += std::to_string(val);
}

void JsonWriter::value(uint32_t val) {
  beforeValue();
  buffer_ += std::to_string(val);
}

void JsonWriter::value(double val) {
  beforeValue();
  if (std::isnan(val) || std::isinf(val)) {
    buffer_ += "null";
  } else {
    buffer_ += formatDouble(val);
  }
}

void JsonWriter::value(bool val) {
  beforeValue();
  buffer_ += val ? "true" : "false";
}

void JsonWriter::valueNull() {
  beforeValue();
  buffer_ += "null";
}

std::string JsonWriter::formatDouble(double val) {
  char buf[32];
  // 17 significant digits always round-trip an IEEE double; try shorter first.
  for (int precision = 1; precision <= 17; ++precision) {
    std::snprintf(buf, sizeof(buf), "%.*g", precision, val);
    if (std::strtod(buf, nullptr) == val) break;
  }
  return buf;
}

void JsonWriter::beforeValue() {
  if (stack_.empty()) return;
  Frame& frame = stack_.back();
  if (frame.after_key) {
    // Value belongs to the key just written.
    frame.after_key = false;
    return;
  }
  if (frame.has_items) buffer_ += ',';
  if (indent_size_ > 0) newline(stack_.size());
  frame.has_items = true;
}

void JsonWriter::newline(size_t depth) {
  buffer_ += '\n';
  buffer_.append(depth * static_cast<size_t>(indent_size_), ' ');
}

void JsonWriter::closeContainer(char closer) {
  bool had_items = false;
  if (!stack_.empty()) {
    had_items = stack_.back().has_items;
    stack_.pop_back();
  }
  // Empty containers stay compact: {} or [].
  if (had_items && indent_size_ > 0) newline(stack_.size());
  buffer_ += closer;
}

std::string JsonWriter::escapeString(std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (char chr : input) {
    switch (chr) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\b': result += "\\b";  break;
      case '\f': result += "\\f";  break;
      case '\n': result += "\\n";  break;
      case '\r': result += "\\r";  break;
      case '\t': result += "\\t";  break;
      default:
        // Control characters (0x00-0x1F) as \u00XX.
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          result += hex_buf;
        } else {
          result += chr;
        }
        break;
    }
  }

  return result;
}

}  // namespace tunescript
