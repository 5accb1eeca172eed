#ifndef SERVICE_CONFIG_H
#define SERVICE_CONFIG_H

#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using json = nlohmann::json;

struct ConnectionReference {
  std::string engine;
  std::string connectionString;
};

// Process-wide settings loaded once at startup: logging sinks and the named
// connection references jobs point at. Numeric tunables are forwarded to
// RelayConfig.
class ServiceConfig {
private:
  static std::string logLevel_;
  static std::string logFile_;
  static std::string logDatabase_;
  static std::string logDatabaseTable_;
  static std::map<std::string, ConnectionReference> connections_;
  static bool initialized_;
  static std::mutex configMutex_;

  static void applyEnvUnlocked();
  static ConnectionReference parseConnection(const std::string &name,
                                             const json &entry);

public:
  static const char *const SUPPORTED_ENGINES[];

  // Falls back to loadFromEnv() when the file is missing or is not valid
  // JSON. Out-of-range values throw std::invalid_argument.
  static void loadFromFile(const std::string &configPath = "config.json");
  static void loadFromEnv();
  static void loadFromJson(const json &config);
  static void reset();

  static bool isSupportedEngine(const std::string &engine);
  static void registerConnection(const std::string &name,
                                 const ConnectionReference &reference);
  static std::optional<ConnectionReference>
  getConnection(const std::string &name);
  static std::string getConnectionForLogging(const std::string &name);
  static std::map<std::string, ConnectionReference> getConnections();

  static std::string getLogLevel() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return logLevel_;
  }
  static std::string getLogFile() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return logFile_;
  }
  static std::string getLogDatabaseConnectionString() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return logDatabase_;
  }
  static std::string getLogDatabaseTable() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return logDatabaseTable_;
  }
  static bool isInitialized() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return initialized_;
  }
};

#endif
