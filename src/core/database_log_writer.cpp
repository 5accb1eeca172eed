#include "core/database_log_writer.h"
#include "utils/sql_validator.h"
#include <iostream>

namespace {

constexpr const char *INSERT_STATEMENT = "datarelay_log_insert";
constexpr size_t MAX_MESSAGE_LENGTH = 10000;

// Keeps printable ASCII and well-formed UTF-8 sequences; libpq rejects the
// whole row otherwise.
std::string keepValidUtf8(const std::string &input) {
  std::string out;
  out.reserve(input.size());
  size_t i = 0;
  while (i < input.size()) {
    unsigned char lead = static_cast<unsigned char>(input[i]);
    size_t length = 0;
    if (lead < 0x80)
      length = (lead >= 0x20 || lead == '\n' || lead == '\t') ? 1 : 0;
    else if ((lead & 0xE0) == 0xC0)
      length = 2;
    else if ((lead & 0xF0) == 0xE0)
      length = 3;
    else if ((lead & 0xF8) == 0xF0)
      length = 4;

    bool complete = length > 0 && i + length <= input.size();
    for (size_t k = 1; complete && k < length; ++k) {
      complete = (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80;
    }
    if (complete) {
      out.append(input, i, length);
      i += length;
    } else {
      ++i;
    }
  }
  return out;
}

} // namespace

DatabaseLogWriter::DatabaseLogWriter(const std::string &connectionString,
                                     const std::string &tableName)
    : tableName_(tableName) {
  if (!SqlValidator::isValidTableName(tableName_)) {
    std::cerr << "DatabaseLogWriter: invalid log table name '" << tableName_
              << "'" << std::endl;
    return;
  }

  try {
    conn_ = std::make_unique<pqxx::connection>(connectionString);
    ensureTable();
    conn_->prepare(INSERT_STATEMENT,
                   "INSERT INTO " +
                       SqlValidator::safePostgresTableName(tableName_) +
                       " (ts, level, category, function, message) "
                       "VALUES (NOW(), $1, $2, $3, $4)");
    enabled_ = true;
  } catch (const std::exception &e) {
    conn_.reset();
    std::cerr << "DatabaseLogWriter: disabled, " << e.what() << std::endl;
  }
}

void DatabaseLogWriter::ensureTable() {
  auto parts = SqlValidator::splitTableName(tableName_);
  pqxx::work txn(*conn_);
  if (!parts.first.empty()) {
    txn.exec("CREATE SCHEMA IF NOT EXISTS " +
             SqlValidator::quotePostgresIdentifier(parts.first));
  }
  txn.exec("CREATE TABLE IF NOT EXISTS " +
           SqlValidator::safePostgresTableName(tableName_) +
           " (id BIGSERIAL PRIMARY KEY, ts TIMESTAMP NOT NULL, "
           "level VARCHAR(16), category VARCHAR(32), function VARCHAR(255), "
           "message TEXT)");
  txn.commit();
}

bool DatabaseLogWriter::append(const LogRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enabled_ || !conn_)
    return false;

  std::string message = record.message;
  if (message.size() > MAX_MESSAGE_LENGTH)
    message.resize(MAX_MESSAGE_LENGTH);

  try {
    pqxx::work txn(*conn_);
    txn.exec_prepared(INSERT_STATEMENT, record.level, record.category,
                      keepValidUtf8(record.function), keepValidUtf8(message));
    txn.commit();
    return true;
  } catch (const pqxx::broken_connection &e) {
    enabled_ = false;
    conn_.reset();
    std::cerr << "DatabaseLogWriter: connection lost, database logging "
                 "disabled: "
              << e.what() << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "DatabaseLogWriter: dropped log record: " << e.what()
              << std::endl;
  }
  return false;
}

void DatabaseLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  conn_.reset();
  enabled_ = false;
}

bool DatabaseLogWriter::isEnabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return enabled_;
}
