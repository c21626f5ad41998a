// Implementation of ASCII string helpers.

#include "core/string_utils.h"

#include <cctype>

namespace tunescript {

bool isSpace(char chr) {
  return std::isspace(static_cast<unsigned char>(chr)) != 0;
}

bool isWordChar(char chr) {
  return std::isalnum(static_cast<unsigned char>(chr)) != 0 || chr == '_';
}

bool isDigit(char chr) {
  return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

std::string trim(std::string_view str) {
  size_t begin = 0;
  size_t end = str.size();
  while (begin < end && isSpace(str[begin])) ++begin;
  while (end > begin && isSpace(str[end - 1])) --end;
  return std::string(str.substr(begin, end - begin));
}

std::string toLower(std::string_view str) {
  std::string result(str);
  for (char& chr : result) {
    chr = static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
  }
  return result;
}

std::string toUpper(std::string_view str) {
  std::string result(str);
  for (char& chr : result) {
    chr = static_cast<char>(std::toupper(static_cast<unsigned char>(chr)));
  }
  return result;
}

std::string titleCase(std::string_view str) {
  std::string result;
  result.reserve(str.size());
  bool prev_alpha = false;
  for (char chr : str) {
    unsigned char uch = static_cast<unsigned char>(chr);
    bool alpha = std::isalpha(uch) != 0;
    if (alpha) {
      result += static_cast<char>(prev_alpha ? std::tolower(uch) : std::toupper(uch));
    } else {
      result += chr;
    }
    prev_alpha = alpha;
  }
  return result;
}

size_t findIgnoreCase(std::string_view haystack, std::string_view needle, size_t pos) {
  if (needle.empty()) return pos <= haystack.size() ? pos : std::string_view::npos;
  if (needle.size() > haystack.size()) return std::string_view::npos;

  for (size_t idx = pos; idx + needle.size() <= haystack.size(); ++idx) {
    bool match = true;
    for (size_t off = 0; off < needle.size(); ++off) {
      if (std::tolower(static_cast<unsigned char>(haystack[idx + off])) !=
          std::tolower(static_cast<unsigned char>(needle[off]))) {
        match = false;
        break;
      }
    }
    if (match) return idx;
  }
  return std::string_view::npos;
}

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) return false;
  for (size_t idx = 0; idx < lhs.size(); ++idx) {
    if (std::tolower(static_cast<unsigned char>(lhs[idx])) !=
        std::tolower(static_cast<unsigned char>(rhs[idx]))) {
      return false;
    }
  }
  return true;
}

bool startsWith(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(std::string_view str, char delimiter) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t pos = str.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(str.substr(start));
      break;
    }
    parts.emplace_back(str.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

}  // namespace tunescript
