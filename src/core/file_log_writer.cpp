#include "core/file_log_writer.h"
#include <filesystem>

namespace fs = std::filesystem;

FileLogWriter::FileLogWriter(const std::string &path, size_t maxBytes,
                             int backups)
    : path_(path), maxBytes_(maxBytes), backups_(backups) {
  std::error_code ec;
  fs::path parent = fs::path(path_).parent_path();
  if (!parent.empty())
    fs::create_directories(parent, ec);

  std::lock_guard<std::mutex> lock(mutex_);
  openUnlocked();
}

void FileLogWriter::openUnlocked() {
  out_.open(path_, std::ios::app);
  std::error_code ec;
  auto size = fs::file_size(path_, ec);
  bytesWritten_ = ec ? 0 : static_cast<size_t>(size);
}

bool FileLogWriter::write(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!out_.is_open())
    return false;

  if (maxBytes_ > 0 && bytesWritten_ + formattedMessage.size() + 1 > maxBytes_)
    rotateUnlocked();

  out_ << formattedMessage << '\n';
  bytesWritten_ += formattedMessage.size() + 1;
  return out_.good();
}

void FileLogWriter::rotateUnlocked() {
  out_.close();

  std::error_code ec;
  if (backups_ <= 0) {
    fs::remove(path_, ec);
  } else {
    fs::remove(path_ + "." + std::to_string(backups_), ec);
    for (int index = backups_ - 1; index >= 1; --index) {
      std::string from = path_ + "." + std::to_string(index);
      if (fs::exists(from, ec))
        fs::rename(from, path_ + "." + std::to_string(index + 1), ec);
    }
    fs::rename(path_, path_ + ".1", ec);
  }

  openUnlocked();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (out_.is_open())
    out_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (out_.is_open())
    out_.close();
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return out_.is_open();
}
