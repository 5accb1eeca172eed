#include "core/service_config.h"
#include "core/logger.h"
#include "core/relay_config.h"
#include "core/relay_defaults.h"
#include "utils/string_utils.h"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <vector>

extern char **environ;

std::string ServiceConfig::logLevel_ = "INFO";
std::string ServiceConfig::logFile_ = "";
std::string ServiceConfig::logDatabase_ = "";
std::string ServiceConfig::logDatabaseTable_ = RelayDefaults::DEFAULT_LOG_TABLE;
std::map<std::string, ConnectionReference> ServiceConfig::connections_;
bool ServiceConfig::initialized_ = false;
std::mutex ServiceConfig::configMutex_;

const char *const ServiceConfig::SUPPORTED_ENGINES[] = {"mssql", "postgres",
                                                        "mongodb"};

namespace {

constexpr const char *CONNECTION_ENV_PREFIX = "DATARELAY_CONNECTION_";

size_t readSize(const json &section, const std::string &key,
                const std::string &path) {
  const json &value = section.at(key);
  if (!value.is_number_integer() || value.get<long long>() < 0) {
    throw std::invalid_argument(path + "." + key +
                                " must be a non-negative integer");
  }
  return value.get<size_t>();
}

size_t parseSizeEnv(const char *name, const char *value) {
  try {
    size_t pos = 0;
    long long parsed = std::stoll(value, &pos);
    if (pos != std::strlen(value) || parsed < 0)
      throw std::invalid_argument(value);
    return static_cast<size_t>(parsed);
  } catch (const std::exception &) {
    throw std::invalid_argument(std::string(name) +
                                " must be a non-negative integer, got '" +
                                value + "'");
  }
}

} // namespace

bool ServiceConfig::isSupportedEngine(const std::string &engine) {
  for (const char *supported : SUPPORTED_ENGINES) {
    if (engine == supported)
      return true;
  }
  return false;
}

ConnectionReference ServiceConfig::parseConnection(const std::string &name,
                                                   const json &entry) {
  if (!entry.is_object() || !entry.contains("engine") ||
      !entry.contains("connection_string") || !entry["engine"].is_string() ||
      !entry["connection_string"].is_string()) {
    throw std::invalid_argument("connections." + name +
                                " needs string fields 'engine' and "
                                "'connection_string'");
  }

  ConnectionReference reference;
  reference.engine = StringUtils::toLower(entry["engine"].get<std::string>());
  reference.connectionString = entry["connection_string"].get<std::string>();
  if (!isSupportedEngine(reference.engine)) {
    throw std::invalid_argument("connections." + name +
                                ": unsupported engine '" + reference.engine +
                                "'");
  }
  return reference;
}

// Layout:
// {
//   "queue":    {"capacity": 200},
//   "worker":   {"shutdown_grace_seconds": 30},
//   "transfer": {"default_batch_size": 1000, "schema_sample_size": 100,
//                "unmappable_document_policy": "skip"},
//   "logging":  {"level": "INFO", "file": "", "database": "",
//                "database_table": "datarelay.logs"},
//   "connections": {"<name>": {"engine": "...", "connection_string": "..."}}
// }
// Every section is optional.
void ServiceConfig::loadFromJson(const json &config) {
  if (!config.is_object())
    throw std::invalid_argument("configuration root must be a JSON object");

  if (config.contains("queue") && config["queue"].contains("capacity")) {
    RelayConfig::setQueueCapacity(
        readSize(config["queue"], "capacity", "queue"));
  }

  if (config.contains("worker") &&
      config["worker"].contains("shutdown_grace_seconds")) {
    RelayConfig::setShutdownGraceSeconds(
        readSize(config["worker"], "shutdown_grace_seconds", "worker"));
  }

  if (config.contains("transfer")) {
    const json &transfer = config["transfer"];
    if (transfer.contains("default_batch_size"))
      RelayConfig::setDefaultBatchSize(
          readSize(transfer, "default_batch_size", "transfer"));
    if (transfer.contains("schema_sample_size"))
      RelayConfig::setSchemaSampleSize(
          readSize(transfer, "schema_sample_size", "transfer"));
    if (transfer.contains("unmappable_document_policy"))
      RelayConfig::setUnmappablePolicy(
          transfer["unmappable_document_policy"].get<std::string>());
  }

  std::map<std::string, ConnectionReference> parsedConnections;
  if (config.contains("connections")) {
    const json &connections = config["connections"];
    if (!connections.is_object())
      throw std::invalid_argument("'connections' must be a JSON object");
    for (auto it = connections.begin(); it != connections.end(); ++it) {
      parsedConnections[it.key()] = parseConnection(it.key(), it.value());
    }
  }

  std::lock_guard<std::mutex> lock(configMutex_);
  if (config.contains("logging")) {
    const json &logging = config["logging"];
    if (logging.contains("level"))
      logLevel_ = logging["level"].get<std::string>();
    if (logging.contains("file"))
      logFile_ = logging["file"].get<std::string>();
    if (logging.contains("database"))
      logDatabase_ = logging["database"].get<std::string>();
    if (logging.contains("database_table"))
      logDatabaseTable_ = logging["database_table"].get<std::string>();
  }
  for (auto &entry : parsedConnections) {
    connections_[entry.first] = entry.second;
  }
  initialized_ = true;
}

void ServiceConfig::loadFromFile(const std::string &configPath) {
  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    Logger::warning(LogCategory::CONFIG, "ServiceConfig",
                    "Could not open config file '" + configPath +
                        "', using defaults and environment variables");
    loadFromEnv();
    return;
  }

  json config;
  try {
    configFile >> config;
  } catch (const json::parse_error &e) {
    Logger::error(LogCategory::CONFIG, "ServiceConfig",
                  "Config file '" + configPath +
                      "' is not valid JSON: " + std::string(e.what()) +
                      ", falling back to environment variables");
    loadFromEnv();
    return;
  }

  try {
    loadFromJson(config);
  } catch (const json::exception &e) {
    throw std::invalid_argument("Config file '" + configPath +
                                "' has a value of the wrong type: " +
                                std::string(e.what()));
  }
  loadFromEnv();
}

// Environment variables override whatever the file set:
//   DATARELAY_QUEUE_CAPACITY, DATARELAY_SHUTDOWN_GRACE_SECONDS,
//   DATARELAY_BATCH_SIZE, DATARELAY_LOG_LEVEL, DATARELAY_LOG_FILE,
//   DATARELAY_CONNECTION_<NAME>=<engine>|<connection string>
void ServiceConfig::loadFromEnv() {
  const char *capacity = std::getenv("DATARELAY_QUEUE_CAPACITY");
  const char *grace = std::getenv("DATARELAY_SHUTDOWN_GRACE_SECONDS");
  const char *batch = std::getenv("DATARELAY_BATCH_SIZE");

  if (capacity && std::strlen(capacity) > 0)
    RelayConfig::setQueueCapacity(
        parseSizeEnv("DATARELAY_QUEUE_CAPACITY", capacity));
  if (grace && std::strlen(grace) > 0)
    RelayConfig::setShutdownGraceSeconds(
        parseSizeEnv("DATARELAY_SHUTDOWN_GRACE_SECONDS", grace));
  if (batch && std::strlen(batch) > 0)
    RelayConfig::setDefaultBatchSize(
        parseSizeEnv("DATARELAY_BATCH_SIZE", batch));

  std::vector<std::pair<std::string, ConnectionReference>> envConnections;
  for (char **env = environ; env && *env; ++env) {
    std::string entry(*env);
    if (!StringUtils::startsWith(entry, CONNECTION_ENV_PREFIX))
      continue;
    auto eq = entry.find('=');
    if (eq == std::string::npos)
      continue;
    std::string name = StringUtils::toLower(
        entry.substr(std::strlen(CONNECTION_ENV_PREFIX),
                     eq - std::strlen(CONNECTION_ENV_PREFIX)));
    std::string value = entry.substr(eq + 1);
    auto bar = value.find('|');
    if (name.empty() || bar == std::string::npos) {
      Logger::warning(LogCategory::CONFIG, "ServiceConfig",
                      "Ignoring malformed connection variable for '" + name +
                          "', expected <engine>|<connection string>");
      continue;
    }
    ConnectionReference reference{StringUtils::toLower(value.substr(0, bar)),
                                  value.substr(bar + 1)};
    if (!isSupportedEngine(reference.engine)) {
      throw std::invalid_argument("DATARELAY_CONNECTION_" + name +
                                  ": unsupported engine '" + reference.engine +
                                  "'");
    }
    envConnections.emplace_back(name, reference);
  }

  std::lock_guard<std::mutex> lock(configMutex_);
  applyEnvUnlocked();
  for (auto &entry : envConnections) {
    connections_[entry.first] = entry.second;
  }
  initialized_ = true;
}

void ServiceConfig::applyEnvUnlocked() {
  const char *level = std::getenv("DATARELAY_LOG_LEVEL");
  const char *file = std::getenv("DATARELAY_LOG_FILE");

  if (level && std::strlen(level) > 0)
    logLevel_ = level;
  if (file && std::strlen(file) > 0)
    logFile_ = file;
}

void ServiceConfig::reset() {
  RelayConfig::resetToDefaults();
  std::lock_guard<std::mutex> lock(configMutex_);
  logLevel_ = "INFO";
  logFile_.clear();
  logDatabase_.clear();
  logDatabaseTable_ = RelayDefaults::DEFAULT_LOG_TABLE;
  connections_.clear();
  initialized_ = false;
}

void ServiceConfig::registerConnection(const std::string &name,
                                       const ConnectionReference &reference) {
  if (name.empty())
    throw std::invalid_argument("connection name must not be empty");
  if (!isSupportedEngine(reference.engine))
    throw std::invalid_argument("unsupported engine '" + reference.engine +
                                "'");
  std::lock_guard<std::mutex> lock(configMutex_);
  connections_[name] = reference;
}

std::optional<ConnectionReference>
ServiceConfig::getConnection(const std::string &name) {
  std::lock_guard<std::mutex> lock(configMutex_);
  auto it = connections_.find(name);
  if (it == connections_.end())
    return std::nullopt;
  return it->second;
}

std::string ServiceConfig::getConnectionForLogging(const std::string &name) {
  auto reference = getConnection(name);
  if (!reference)
    return "<unknown connection '" + name + "'>";
  return reference->engine + ":" +
         StringUtils::redactSecrets(reference->connectionString);
}

std::map<std::string, ConnectionReference> ServiceConfig::getConnections() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return connections_;
}
