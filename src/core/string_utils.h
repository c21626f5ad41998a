// ASCII string helpers shared by the DSL front end and the config loader.

#ifndef TUNESCRIPT_CORE_STRING_UTILS_H
#define TUNESCRIPT_CORE_STRING_UTILS_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tunescript {

/// @brief Strip leading and trailing ASCII whitespace.
std::string trim(std::string_view str);

/// @brief Lower-case ASCII letters.
std::string toLower(std::string_view str);

/// @brief Upper-case ASCII letters.
std::string toUpper(std::string_view str);

/// @brief Capitalize the first letter of every letter run, lower-case the rest.
///
/// "ELECTRIC_PIANO" -> "Electric_Piano", "synth2lead" -> "Synth2Lead".
std::string titleCase(std::string_view str);

/// @brief Case-insensitive search for needle in haystack starting at pos.
/// @return Index of the first match, or std::string_view::npos.
size_t findIgnoreCase(std::string_view haystack, std::string_view needle, size_t pos = 0);

/// @brief Case-insensitive containment test.
inline bool containsIgnoreCase(std::string_view haystack, std::string_view needle) {
  return findIgnoreCase(haystack, needle) != std::string_view::npos;
}

/// @brief Case-insensitive equality.
bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs);

/// @brief Check whether str begins with prefix (case-sensitive).
bool startsWith(std::string_view str, std::string_view prefix);

/// @brief Split on a delimiter, keeping empty pieces ("a||b" -> {"a","","b"}).
std::vector<std::string> split(std::string_view str, char delimiter);

/// @brief ASCII whitespace test (space, tab, newline, CR, VT, FF).
bool isSpace(char chr);

/// @brief Regex "\w" equivalent: ASCII letter, digit or underscore.
bool isWordChar(char chr);

/// @brief ASCII digit test.
bool isDigit(char chr);

}  // namespace tunescript

#endif  // TUNESCRIPT_CORE_STRING_UTILS_H
