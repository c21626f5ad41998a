// Implementation of the minimal JSON reader.

#include "core/json_parser.h"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace tunescript {

int JsonValue::asInt(int default_val) const {
  if (type == Number) return static_cast<int>(number_val);
  return default_val;
}

double JsonValue::asDouble(double default_val) const {
  if (type == Number) return number_val;
  return default_val;
}

bool JsonValue::asBool(bool default_val) const {
  if (type == Bool) return bool_val;
  return default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

const JsonValue* JsonValue::find(std::string_view key) const {
  if (type != Object) return nullptr;
  for (const auto& member : object_members) {
    if (member.key == key) return &member.value;
  }
  return nullptr;
}

namespace {

constexpr int kMaxDepth = 256;

/// @brief Recursive-descent reader over a JSON text buffer.
class JsonReader {
 public:
  explicit JsonReader(std::string_view text) : text_(text) {}

  JsonParseResult run() {
    JsonParseResult result;
    skipWhitespace();
    if (!parseValue(result.value, 0)) {
      result.error_message = error_;
      result.error_offset = pos_;
      return result;
    }
    skipWhitespace();
    if (pos_ != text_.size()) {
      result.error_message = "Unexpected trailing characters";
      result.error_offset = pos_;
      return result;
    }
    result.success = true;
    return result;
  }

 private:
  std::string_view text_;
  size_t pos_ = 0;
  std::string error_;

  bool fail(const char* message) {
    error_ = message;
    return false;
  }

  void skipWhitespace() {
    while (pos_ < text_.size() &&
           (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n' ||
            text_[pos_] == '\r')) {
      ++pos_;
    }
  }

  bool parseValue(JsonValue& out, int depth) {
    if (depth > kMaxDepth) return fail("Nesting too deep");
    if (pos_ >= text_.size()) return fail("Unexpected end of input");

    char chr = text_[pos_];
    switch (chr) {
      case '{': return parseObject(out, depth);
      case '[': return parseArray(out, depth);
      case '"':
        out.type = JsonValue::String;
        return parseString(out.string_val);
      case 't':
        out.type = JsonValue::Bool;
        out.bool_val = true;
        return parseLiteral("true");
      case 'f':
        out.type = JsonValue::Bool;
        out.bool_val = false;
        return parseLiteral("false");
      case 'n':
        out.type = JsonValue::Null;
        return parseLiteral("null");
      default:
        if (chr == '-' || std::isdigit(static_cast<unsigned char>(chr))) {
          return parseNumber(out);
        }
        return fail("Unexpected character");
    }
  }

  bool parseLiteral(std::string_view literal) {
    if (text_.substr(pos_, literal.size()) != literal) return fail("Invalid literal");
    pos_ += literal.size();
    return true;
  }

  bool parseNumber(JsonValue& out) {
    size_t start = pos_;
    if (text_[pos_] == '-') ++pos_;

    size_t int_start = pos_;
    while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    if (pos_ == int_start) return fail("Invalid number");

    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      size_t frac_start = pos_;
      while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
      if (pos_ == frac_start) return fail("Invalid number fraction");
    }

    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
      size_t exp_start = pos_;
      while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
      if (pos_ == exp_start) return fail("Invalid number exponent");
    }

    std::string num_str(text_.substr(start, pos_ - start));
    out.type = JsonValue::Number;
    out.number_val = std::strtod(num_str.c_str(), nullptr);
    if (std::isinf(out.number_val)) return fail("Number out of range");
    return true;
  }

  static void appendUtf8(std::string& out, uint32_t code) {
    if (code < 0x80) {
      out += static_cast<char>(code);
    } else if (code < 0x800) {
      out += static_cast<char>(0xC0 | (code >> 6));
      out += static_cast<char>(0x80 | (code & 0x3F));
    } else if (code < 0x10000) {
      out += static_cast<char>(0xE0 | (code >> 12));
      out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (code >> 18));
      out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (code & 0x3F));
    }
  }

  bool parseHex4(uint32_t& code) {
    if (pos_ + 4 > text_.size()) return fail("Truncated unicode escape");
    code = 0;
    for (int idx = 0; idx < 4; ++idx) {
      char chr = text_[pos_++];
      code <<= 4;
      if (chr >= '0' && chr <= '9') {
        code |= static_cast<uint32_t>(chr - '0');
      } else if (chr >= 'a' && chr <= 'f') {
        code |= static_cast<uint32_t>(chr - 'a' + 10);
      } else if (chr >= 'A' && chr <= 'F') {
        code |= static_cast<uint32_t>(chr - 'A' + 10);
      } else {
        return fail("Invalid unicode escape");
      }
    }
    return true;
  }

  bool parseString(std::string& out) {
    ++pos_;  // opening quote
    out.clear();
    while (pos_ < text_.size()) {
      char chr = text_[pos_++];
      if (chr == '"') return true;
      if (static_cast<unsigned char>(chr) < 0x20) return fail("Control character in string");
      if (chr != '\\') {
        out += chr;
        continue;
      }

      if (pos_ >= text_.size()) break;
      char esc = text_[pos_++];
      switch (esc) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u': {
          uint32_t code = 0;
          if (!parseHex4(code)) return false;
          // Combine a surrogate pair when the low half follows.
          if (code >= 0xD800 && code <= 0xDBFF && pos_ + 6 <= text_.size() &&
              text_[pos_] == '\\' && text_[pos_ + 1] == 'u') {
            size_t saved = pos_;
            pos_ += 2;
            uint32_t low = 0;
            if (!parseHex4(low)) return false;
            if (low >= 0xDC00 && low <= 0xDFFF) {
              code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
            } else {
              pos_ = saved;
            }
          }
          appendUtf8(out, code);
          break;
        }
        default:
          return fail("Invalid escape sequence");
      }
    }
    return fail("Unterminated string");
  }

  bool parseArray(JsonValue& out, int depth) {
    ++pos_;  // '['
    out.type = JsonValue::Array;
    skipWhitespace();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }

    while (true) {
      skipWhitespace();
      JsonValue item;
      if (!parseValue(item, depth + 1)) return false;
      out.array_items.push_back(std::move(item));

      skipWhitespace();
      if (pos_ >= text_.size()) return fail("Unterminated array");
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return fail("Expected ',' or ']'");
    }
  }

  bool parseObject(JsonValue& out, int depth) {
    ++pos_;  // '{'
    out.type = JsonValue::Object;
    skipWhitespace();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return true;
    }

    while (true) {
      skipWhitespace();
      if (pos_ >= text_.size() || text_[pos_] != '"') return fail("Expected object key");

      JsonMember member;
      if (!parseString(member.key)) return false;

      skipWhitespace();
      if (pos_ >= text_.size() || text_[pos_] != ':') return fail("Expected ':'");
      ++pos_;
      skipWhitespace();

      if (!parseValue(member.value, depth + 1)) return false;
      out.object_members.push_back(std::move(member));

      skipWhitespace();
      if (pos_ >= text_.size()) return fail("Unterminated object");
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return fail("Expected ',' or '}'");
    }
  }
};

}  // namespace

JsonParseResult parseJson(std::string_view text) {
  JsonReader reader(text);
  return reader.run();
}

}  // namespace tunescript
