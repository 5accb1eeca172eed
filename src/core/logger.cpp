#include "core/logger.h"
#include "core/file_log_writer.h"
#include "core/service_config.h"
#include "utils/string_utils.h"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

std::unique_ptr<ILogWriter> Logger::lineWriter_;
std::unique_ptr<DatabaseLogWriter> Logger::dbWriter_;
std::mutex Logger::sinkMutex_;
std::atomic<int> Logger::minimumLevel_{static_cast<int>(LogLevel::INFO)};

namespace {

std::string localTimestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  int millis = static_cast<int>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          now.time_since_epoch())
          .count() %
      1000);

  std::tm tm{};
  localtime_r(&seconds, &tm);
  char buffer[32];
  size_t length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
  std::snprintf(buffer + length, sizeof(buffer) - length, ".%03d", millis);
  return buffer;
}

} // namespace

std::string logLevelToString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

std::string logCategoryToString(LogCategory category) {
  switch (category) {
  case LogCategory::SYSTEM:
    return "SYSTEM";
  case LogCategory::DATABASE:
    return "DATABASE";
  case LogCategory::TRANSFER:
    return "TRANSFER";
  case LogCategory::CONFIG:
    return "CONFIG";
  case LogCategory::VALIDATION:
    return "VALIDATION";
  case LogCategory::JOBS:
    return "JOBS";
  case LogCategory::QUEUE:
    return "QUEUE";
  }
  return "UNKNOWN";
}

void Logger::write(LogLevel level, LogCategory category,
                   const std::string &function, const std::string &message) {
  if (!isEnabled(level))
    return;

  LogRecord record{logLevelToString(level), logCategoryToString(category),
                   function, message};
  std::string line = "[" + localTimestamp() + "] [" + record.level + "] [" +
                     record.category + "]";
  if (!function.empty())
    line += " [" + function + "]";
  line += " " + message;

  std::lock_guard<std::mutex> lock(sinkMutex_);
  if (!lineWriter_ || !lineWriter_->write(line))
    std::cerr << line << '\n';
  if (dbWriter_)
    dbWriter_->append(record);
}

void Logger::initialize() {
  setLogLevel(ServiceConfig::getLogLevel());

  std::unique_ptr<ILogWriter> lineWriter;
  std::string logFile = ServiceConfig::getLogFile();
  if (!logFile.empty()) {
    auto fileWriter = std::make_unique<FileLogWriter>(logFile);
    if (fileWriter->isOpen())
      lineWriter = std::move(fileWriter);
    else
      std::cerr << "Could not open log file '" << logFile
                << "', logging to stderr" << std::endl;
  }
  if (!lineWriter)
    lineWriter = std::make_unique<ConsoleLogWriter>();

  std::unique_ptr<DatabaseLogWriter> dbWriter;
  std::string logDatabase = ServiceConfig::getLogDatabaseConnectionString();
  if (!logDatabase.empty()) {
    dbWriter = std::make_unique<DatabaseLogWriter>(
        logDatabase, ServiceConfig::getLogDatabaseTable());
    if (!dbWriter->isEnabled())
      dbWriter.reset();
  }

  std::lock_guard<std::mutex> lock(sinkMutex_);
  lineWriter_ = std::move(lineWriter);
  dbWriter_ = std::move(dbWriter);
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(sinkMutex_);
  if (lineWriter_) {
    lineWriter_->flush();
    lineWriter_->close();
    lineWriter_.reset();
  }
  dbWriter_.reset();
}

void Logger::setWriter(std::unique_ptr<ILogWriter> writer) {
  std::lock_guard<std::mutex> lock(sinkMutex_);
  lineWriter_ = std::move(writer);
}

void Logger::setLogLevel(LogLevel level) {
  minimumLevel_ = static_cast<int>(level);
}

bool Logger::setLogLevel(const std::string &name) {
  std::string upper = StringUtils::toUpper(StringUtils::trim(name));
  if (upper == "DEBUG")
    setLogLevel(LogLevel::DEBUG);
  else if (upper == "INFO")
    setLogLevel(LogLevel::INFO);
  else if (upper == "WARN" || upper == "WARNING")
    setLogLevel(LogLevel::WARNING);
  else if (upper == "ERROR")
    setLogLevel(LogLevel::ERROR);
  else if (upper == "FATAL" || upper == "CRITICAL")
    setLogLevel(LogLevel::CRITICAL);
  else
    return false;
  return true;
}

LogLevel Logger::getLogLevel() {
  return static_cast<LogLevel>(minimumLevel_.load());
}

bool Logger::isEnabled(LogLevel level) {
  return static_cast<int>(level) >= minimumLevel_.load();
}
