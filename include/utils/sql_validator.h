#ifndef SQL_VALIDATOR_H
#define SQL_VALIDATOR_H

#include "core/relay_defaults.h"
#include "utils/string_utils.h"
#include <regex>
#include <stdexcept>
#include <string>
#include <utility>

// Identifier and predicate checks applied before any name or fragment is
// spliced into generated SQL.
namespace SqlValidator {

inline bool isValidTableName(const std::string &name) {
  static const std::regex pattern(
      R"(^[a-zA-Z_][a-zA-Z0-9_]*(\.[a-zA-Z_][a-zA-Z0-9_]*)?$)");
  if (name.empty() || name.length() > RelayDefaults::MAX_IDENTIFIER_LENGTH)
    return false;
  return std::regex_match(name, pattern);
}

inline bool isValidColumnName(const std::string &name) {
  static const std::regex pattern(R"(^[a-zA-Z_][a-zA-Z0-9_]*$)");
  if (name.empty() || name.length() > RelayDefaults::MAX_IDENTIFIER_LENGTH)
    return false;
  return std::regex_match(name, pattern);
}

// Splits "schema.table"; a bare table name returns an empty schema.
inline std::pair<std::string, std::string>
splitTableName(const std::string &name) {
  auto dot = name.find('.');
  if (dot == std::string::npos)
    return {"", name};
  return {name.substr(0, dot), name.substr(dot + 1)};
}

inline std::string quoteMssqlIdentifier(const std::string &identifier) {
  std::string escaped;
  escaped.reserve(identifier.size() + 2);
  escaped += '[';
  for (char c : identifier) {
    if (c == ']')
      escaped += "]]";
    else
      escaped += c;
  }
  escaped += ']';
  return escaped;
}

inline std::string quotePostgresIdentifier(const std::string &identifier) {
  std::string escaped = "\"";
  for (char c : identifier) {
    if (c == '"')
      escaped += "\"\"";
    else
      escaped += c;
  }
  escaped += '"';
  return escaped;
}

// [schema].[table] or [table]. Throws std::invalid_argument on names that
// fail isValidTableName.
inline std::string safeMssqlTableName(const std::string &name) {
  if (!isValidTableName(name))
    throw std::invalid_argument("Invalid table name: " + name);
  auto parts = splitTableName(name);
  if (parts.first.empty())
    return quoteMssqlIdentifier(parts.second);
  return quoteMssqlIdentifier(parts.first) + "." +
         quoteMssqlIdentifier(parts.second);
}

inline std::string safePostgresTableName(const std::string &name) {
  if (!isValidTableName(name))
    throw std::invalid_argument("Invalid table name: " + name);
  auto parts = splitTableName(name);
  if (parts.first.empty())
    return quotePostgresIdentifier(parts.second);
  return quotePostgresIdentifier(parts.first) + "." +
         quotePostgresIdentifier(parts.second);
}

inline std::string escapeStringLiteral(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (char c : value) {
    if (c == '\'')
      escaped += "''";
    else
      escaped += c;
  }
  return escaped;
}

// A delete predicate is a single boolean expression. Statement separators,
// comments and DDL/DML keywords are refused.
inline bool isSafePredicate(const std::string &predicate) {
  std::string trimmed = StringUtils::trim(predicate);
  if (trimmed.empty())
    return false;

  static const char *const forbiddenFragments[] = {";", "--", "/*", "*/",
                                                   "xp_", "sp_"};
  for (const char *fragment : forbiddenFragments) {
    if (trimmed.find(fragment) != std::string::npos)
      return false;
  }

  static const std::regex forbiddenKeywords(
      R"(\b(drop|alter|create|truncate|insert|update|delete|exec|execute|grant|revoke|shutdown|merge)\b)",
      std::regex::icase);
  return !std::regex_search(trimmed, forbiddenKeywords);
}

} // namespace SqlValidator

#endif
