#ifndef LOGGER_H
#define LOGGER_H

#include "core/database_log_writer.h"
#include "core/log_writer.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

enum class LogLevel { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

enum class LogCategory {
  SYSTEM,
  DATABASE,
  TRANSFER,
  CONFIG,
  VALIDATION,
  JOBS,
  QUEUE
};

std::string logLevelToString(LogLevel level);
std::string logCategoryToString(LogCategory category);

// Process-wide log facade. Lines go to one line sink (stderr until
// initialize() runs, or a rotating file) and optionally to a PostgreSQL table.
class Logger {
  static std::unique_ptr<ILogWriter> lineWriter_;
  static std::unique_ptr<DatabaseLogWriter> dbWriter_;
  static std::mutex sinkMutex_;
  static std::atomic<int> minimumLevel_;

  static void write(LogLevel level, LogCategory category,
                    const std::string &function, const std::string &message);

public:
  // Reads level and sinks from ServiceConfig. Each call replaces the
  // previous sinks.
  static void initialize();
  static void shutdown();

  static void debug(LogCategory category, const std::string &function,
                    const std::string &message) {
    write(LogLevel::DEBUG, category, function, message);
  }
  static void info(LogCategory category, const std::string &function,
                   const std::string &message) {
    write(LogLevel::INFO, category, function, message);
  }
  static void warning(LogCategory category, const std::string &function,
                      const std::string &message) {
    write(LogLevel::WARNING, category, function, message);
  }
  static void error(LogCategory category, const std::string &function,
                    const std::string &message) {
    write(LogLevel::ERROR, category, function, message);
  }
  static void critical(LogCategory category, const std::string &function,
                       const std::string &message) {
    write(LogLevel::CRITICAL, category, function, message);
  }

  static void setLogLevel(LogLevel level);
  // DEBUG, INFO, WARN/WARNING, ERROR, FATAL/CRITICAL in any case. Unknown
  // names leave the level unchanged and return false.
  static bool setLogLevel(const std::string &name);
  static LogLevel getLogLevel();
  static bool isEnabled(LogLevel level);

  static void setWriter(std::unique_ptr<ILogWriter> writer);
};

#endif
