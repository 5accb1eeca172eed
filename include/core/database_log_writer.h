#ifndef DATABASE_LOG_WRITER_H
#define DATABASE_LOG_WRITER_H

#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

struct LogRecord {
  std::string level;
  std::string category;
  std::string function;
  std::string message;
};

// Appends log records to a PostgreSQL table, one row per record. The writer
// disables itself on the first broken connection and never throws.
class DatabaseLogWriter {
  std::unique_ptr<pqxx::connection> conn_;
  std::string tableName_;
  bool enabled_ = false;
  mutable std::mutex mutex_;

  void ensureTable();

public:
  DatabaseLogWriter(const std::string &connectionString,
                    const std::string &tableName);
  ~DatabaseLogWriter() { close(); }

  DatabaseLogWriter(const DatabaseLogWriter &) = delete;
  DatabaseLogWriter &operator=(const DatabaseLogWriter &) = delete;

  bool append(const LogRecord &record);
  void close();
  bool isEnabled() const;
};

#endif
