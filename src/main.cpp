#include "core/logger.h"
#include "core/relay_config.h"
#include "core/service_config.h"
#include "engines/connection_factory.h"
#include "jobs/command_handler.h"
#include "jobs/job_processor.h"
#include "jobs/job_queue.h"
#include "jobs/job_service.h"
#include "jobs/job_store.h"
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <poll.h>
#include <unistd.h>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_CONFIG_ERROR = 1;
constexpr int EXIT_RUNTIME_ERROR = 2;
constexpr int STDIN_POLL_MS = 200;

std::atomic<bool> g_shutdownRequested{false};

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdownRequested.store(true);
  }
}

void cleanupLogger() {
  try {
    Logger::shutdown();
  } catch (const std::exception &e) {
    std::cerr << "Error shutting down logger: " << e.what() << std::endl;
  }
}

// Feeds complete stdin lines to the handler until end of input or a shutdown
// signal. Polling keeps signals from being stuck behind a blocking read.
void serveCommands(CommandHandler &handler) {
  std::string buffer;
  char chunk[4096];

  while (!g_shutdownRequested.load()) {
    struct pollfd fds;
    fds.fd = STDIN_FILENO;
    fds.events = POLLIN;
    fds.revents = 0;

    int ready = poll(&fds, 1, STDIN_POLL_MS);
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      throw std::runtime_error("poll on stdin failed: " +
                               std::string(std::strerror(errno)));
    }
    if (ready == 0)
      continue;

    ssize_t n = read(STDIN_FILENO, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw std::runtime_error("read on stdin failed: " +
                               std::string(std::strerror(errno)));
    }
    if (n == 0) {
      if (!buffer.empty()) {
        std::cout << handler.handleLine(buffer) << std::endl;
      }
      Logger::info(LogCategory::SYSTEM, "serveCommands", "End of input");
      return;
    }

    buffer.append(chunk, static_cast<size_t>(n));
    size_t newline;
    while ((newline = buffer.find('\n')) != std::string::npos) {
      std::string line = buffer.substr(0, newline);
      buffer.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      if (line.find_first_not_of(" \t") == std::string::npos)
        continue;
      std::cout << handler.handleLine(line) << std::endl;
    }
  }
  Logger::info(LogCategory::SYSTEM, "serveCommands",
               "Shutdown signal received");
}
} // namespace

int main(int argc, char *argv[]) {
  std::string configPath = argc > 1 ? argv[1] : "config.json";

  try {
    ServiceConfig::loadFromFile(configPath);
  } catch (const std::exception &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return EXIT_CONFIG_ERROR;
  }

  try {
    Logger::initialize();
  } catch (const std::exception &e) {
    std::cerr << "Logger initialization failed: " << e.what() << std::endl;
    return EXIT_CONFIG_ERROR;
  }

  if (std::signal(SIGINT, signalHandler) == SIG_ERR ||
      std::signal(SIGTERM, signalHandler) == SIG_ERR) {
    std::cerr << "Error: Failed to register signal handlers" << std::endl;
    cleanupLogger();
    return EXIT_RUNTIME_ERROR;
  }

  int exitCode = EXIT_SUCCESS_CODE;
  try {
    Logger::info(LogCategory::SYSTEM, "main",
                 "DataRelay starting (queue capacity " +
                     std::to_string(RelayConfig::getQueueCapacity()) + ", " +
                     std::to_string(ServiceConfig::getConnections().size()) +
                     " connection(s))");

    InMemoryJobStore store;
    BoundedJobQueue queue(RelayConfig::getQueueCapacity());

    std::map<std::string, ConnectionReference> connections =
        ServiceConfig::getConnections();
    ConnectionFactoryProvider factoryProvider = [connections]() {
      return std::make_unique<EngineConnectionFactory>(connections);
    };

    JobProcessor processor(store, queue, factoryProvider);
    JobService service(store, queue);
    CommandHandler handler(service);

    processor.start();
    try {
      serveCommands(handler);
    } catch (const std::exception &e) {
      Logger::critical(LogCategory::SYSTEM, "main",
                       "Command loop failed: " + std::string(e.what()));
      exitCode = EXIT_RUNTIME_ERROR;
    }

    processor.stop(
        std::chrono::seconds(RelayConfig::getShutdownGraceSeconds()));
    Logger::info(LogCategory::SYSTEM, "main", "DataRelay stopped");
  } catch (const std::exception &e) {
    std::cerr << "Runtime error: " << e.what() << std::endl;
    cleanupLogger();
    return EXIT_RUNTIME_ERROR;
  }

  cleanupLogger();
  return exitCode;
}
