#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <algorithm>
#include <cctype>
#include <regex>
#include <string>
#include <string_view>

namespace StringUtils {

inline std::string toLower(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

inline std::string toUpper(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return result;
}

inline std::string trim(std::string_view str) {
  const auto start = std::find_if_not(
      str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });

  const auto end =
      std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
      }).base();

  return (start < end) ? std::string(start, end) : std::string{};
}

inline bool startsWith(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

inline bool endsWith(std::string_view str, std::string_view suffix) {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Masks credentials in connection strings and URIs before they reach a log
// line or a stored job error:
//   "Server=x;Password=secret;" -> "Server=x;Password=***;"
//   "host=x password=secret"     -> "host=x password=***"
//   "mongodb://u:p@h/db"         -> "mongodb://***@h/db"
inline std::string redactSecrets(const std::string &text) {
  static const std::regex keyValue(R"(((?:password|pwd)\s*=\s*)('[^']*'|[^;\s]*))",
                                   std::regex::icase);
  static const std::regex uriCredentials(R"(([a-zA-Z][a-zA-Z0-9+.-]*://)[^/\s@]+@)");

  std::string result = std::regex_replace(text, keyValue, "$1***");
  return std::regex_replace(result, uriCredentials, "$1***@");
}

} // namespace StringUtils

#endif
