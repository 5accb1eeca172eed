#ifndef RELAY_ERRORS_H
#define RELAY_ERRORS_H

#include <stdexcept>
#include <string>

enum class ErrorKind {
  None,
  Validation,
  NotFound,
  Connectivity,
  DataError,
  Cancelled,
  Internal
};

std::string errorKindToString(ErrorKind kind);
ErrorKind errorKindFromString(const std::string &name);

class RelayError : public std::runtime_error {
  ErrorKind kind_;

public:
  RelayError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }
};

class ValidationError : public RelayError {
public:
  explicit ValidationError(const std::string &message)
      : RelayError(ErrorKind::Validation, message) {}
};

class NotFoundError : public RelayError {
public:
  explicit NotFoundError(const std::string &message)
      : RelayError(ErrorKind::NotFound, message) {}
};

class ConnectivityError : public RelayError {
public:
  explicit ConnectivityError(const std::string &message)
      : RelayError(ErrorKind::Connectivity, message) {}
};

class DataError : public RelayError {
public:
  explicit DataError(const std::string &message)
      : RelayError(ErrorKind::DataError, message) {}
};

#endif
