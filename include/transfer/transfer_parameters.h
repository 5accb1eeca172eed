#ifndef TRANSFER_PARAMETERS_H
#define TRANSFER_PARAMETERS_H

#include "core/relay_config.h"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

struct CommonTransferOptions {
  size_t batchSize = RelayConfig::DEFAULT_BATCH;
  int timeoutSeconds = 300;
  bool createTableIfNotExists = false;
  bool truncateTargetTable = false;

  static CommonTransferOptions fromJson(const json &params);
  void appendTo(json &out) const;
  void validate() const;
};

struct DataTransferParameters {
  std::string source;
  std::string target;
  std::string sourceQuery;
  std::string targetTable;
  std::map<std::string, std::string> columnMappings;
  CommonTransferOptions options;

  static DataTransferParameters fromJson(const json &params);
  json toJson() const;
  void validate() const;
};

enum class SyncScope { FullTable, KeyMatch, Predicate };

std::string syncScopeToString(SyncScope scope);
SyncScope parseSyncScope(const std::string &name);

struct DataSyncParameters {
  std::string source;
  std::string target;
  std::string sourceQuery;
  std::string targetTable;
  std::map<std::string, std::string> columnMappings;
  SyncScope scope = SyncScope::FullTable;
  // Named in target-column terms.
  std::vector<std::string> keyColumns;
  std::string deletePredicate;
  CommonTransferOptions options;

  static DataSyncParameters fromJson(const json &params);
  json toJson() const;
  void validate() const;
};

enum class ArrayHandling { Serialize, Skip, FirstElement };

std::string arrayHandlingToString(ArrayHandling handling);
ArrayHandling parseArrayHandling(const std::string &name);

struct DocumentTransferParameters {
  std::string source;
  std::string target;
  std::string collection;
  std::string targetTable;
  json filter = json::object();
  json pipeline = json::array();
  bool jsonMode = false;
  bool flattenNestedDocuments = true;
  std::string flattenSeparator = "_";
  ArrayHandling arrayHandling = ArrayHandling::Serialize;
  std::vector<std::string> includeFields;
  std::vector<std::string> excludeFields;
  std::map<std::string, std::string> fieldMappings;
  size_t schemaSampleSize = RelayConfig::DEFAULT_SCHEMA_SAMPLE;
  UnmappablePolicy unmappablePolicy = UnmappablePolicy::SKIP;
  CommonTransferOptions options;

  static DocumentTransferParameters fromJson(const json &params);
  json toJson() const;
  void validate() const;

  // Physical table the transfer writes: targetTable, or targetTable + "_JSON"
  // in json mode.
  std::string effectiveTargetTable() const;
};

#endif
