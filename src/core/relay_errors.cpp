#include "core/relay_errors.h"
#include <unordered_map>

std::string errorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::Validation:
    return "Validation";
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::Connectivity:
    return "Connectivity";
  case ErrorKind::DataError:
    return "DataError";
  case ErrorKind::Cancelled:
    return "Cancelled";
  case ErrorKind::Internal:
    return "Internal";
  default:
    return "Internal";
  }
}

ErrorKind errorKindFromString(const std::string &name) {
  static const std::unordered_map<std::string, ErrorKind> kinds = {
      {"None", ErrorKind::None},
      {"Validation", ErrorKind::Validation},
      {"NotFound", ErrorKind::NotFound},
      {"Connectivity", ErrorKind::Connectivity},
      {"DataError", ErrorKind::DataError},
      {"Cancelled", ErrorKind::Cancelled},
      {"Internal", ErrorKind::Internal}};
  auto it = kinds.find(name);
  return it != kinds.end() ? it->second : ErrorKind::Internal;
}
