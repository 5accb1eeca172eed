#ifndef FILE_LOG_WRITER_H
#define FILE_LOG_WRITER_H

#include "core/log_writer.h"
#include <fstream>
#include <mutex>
#include <string>

// Appends lines to a file and rotates it once it grows past maxBytes:
// datarelay.log -> datarelay.log.1 -> ... -> datarelay.log.<backups>.
class FileLogWriter : public ILogWriter {
  std::string path_;
  size_t maxBytes_;
  int backups_;
  size_t bytesWritten_ = 0;
  std::ofstream out_;
  mutable std::mutex mutex_;

  void openUnlocked();
  void rotateUnlocked();

public:
  explicit FileLogWriter(const std::string &path,
                         size_t maxBytes = 10 * 1024 * 1024, int backups = 5);
  ~FileLogWriter() override { close(); }

  bool write(const std::string &formattedMessage) override;
  void flush() override;
  void close() override;
  bool isOpen() const override;
};

#endif
