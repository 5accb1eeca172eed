#include "engines/relational_connection.h"

std::string columnTypeToString(ColumnType type) {
  switch (type) {
  case ColumnType::Integer:
    return "integer";
  case ColumnType::Float:
    return "float";
  case ColumnType::Boolean:
    return "boolean";
  case ColumnType::Timestamp:
    return "timestamp";
  case ColumnType::Text:
  default:
    return "text";
  }
}
