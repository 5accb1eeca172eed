#include "core/log_writer.h"
#include <iostream>

bool ConsoleLogWriter::write(const std::string &formattedMessage) {
  std::cerr << formattedMessage << '\n';
  return static_cast<bool>(std::cerr);
}

void ConsoleLogWriter::flush() { std::cerr.flush(); }
