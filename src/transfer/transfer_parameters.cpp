#include "transfer/transfer_parameters.h"
#include "core/relay_defaults.h"
#include "core/relay_errors.h"
#include "utils/sql_validator.h"
#include "utils/string_utils.h"

namespace {

void requireObject(const json &params) {
  if (!params.is_object()) {
    throw ValidationError("Job parameters must be a JSON object");
  }
}

std::string readString(const json &params, const std::string &key) {
  if (!params.contains(key) || params[key].is_null())
    return "";
  if (!params[key].is_string()) {
    throw ValidationError("Parameter '" + key + "' must be a string");
  }
  return params[key].get<std::string>();
}

bool readBool(const json &params, const std::string &key, bool fallback) {
  if (!params.contains(key) || params[key].is_null())
    return fallback;
  if (!params[key].is_boolean()) {
    throw ValidationError("Parameter '" + key + "' must be a boolean");
  }
  return params[key].get<bool>();
}

int64_t readInteger(const json &params, const std::string &key,
                    int64_t fallback) {
  if (!params.contains(key) || params[key].is_null())
    return fallback;
  if (!params[key].is_number_integer()) {
    throw ValidationError("Parameter '" + key + "' must be an integer");
  }
  return params[key].get<int64_t>();
}

std::vector<std::string> readStringList(const json &params,
                                        const std::string &key) {
  std::vector<std::string> out;
  if (!params.contains(key) || params[key].is_null())
    return out;
  if (!params[key].is_array()) {
    throw ValidationError("Parameter '" + key + "' must be an array of strings");
  }
  for (const auto &item : params[key]) {
    if (!item.is_string()) {
      throw ValidationError("Parameter '" + key +
                            "' must be an array of strings");
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

std::map<std::string, std::string> readStringMap(const json &params,
                                                 const std::string &key) {
  std::map<std::string, std::string> out;
  if (!params.contains(key) || params[key].is_null())
    return out;
  if (!params[key].is_object()) {
    throw ValidationError("Parameter '" + key +
                          "' must be an object of string values");
  }
  for (auto it = params[key].begin(); it != params[key].end(); ++it) {
    if (!it.value().is_string()) {
      throw ValidationError("Parameter '" + key + "." + it.key() +
                            "' must be a string");
    }
    out[it.key()] = it.value().get<std::string>();
  }
  return out;
}

void requireNonEmpty(const std::string &value, const std::string &name) {
  if (StringUtils::trim(value).empty()) {
    throw ValidationError("Parameter '" + name + "' is required");
  }
}

void requireTableName(const std::string &table, const std::string &name) {
  requireNonEmpty(table, name);
  if (!SqlValidator::isValidTableName(table)) {
    throw ValidationError("Parameter '" + name + "' is not a valid table name: " +
                          table);
  }
}

void requireColumnNames(const std::map<std::string, std::string> &mappings,
                        const std::string &name) {
  for (const auto &[from, to] : mappings) {
    if (from.empty()) {
      throw ValidationError("Parameter '" + name + "' has an empty source key");
    }
    if (!SqlValidator::isValidColumnName(to)) {
      throw ValidationError("Parameter '" + name + "' maps '" + from +
                            "' to invalid column name '" + to + "'");
    }
  }
}

} // namespace

CommonTransferOptions CommonTransferOptions::fromJson(const json &params) {
  CommonTransferOptions options;
  int64_t batchSize = readInteger(
      params, "batchSize", static_cast<int64_t>(RelayConfig::getDefaultBatchSize()));
  if (batchSize <= 0) {
    throw ValidationError("Parameter 'batchSize' must be greater than zero");
  }
  options.batchSize = static_cast<size_t>(batchSize);

  int64_t timeout = readInteger(params, "timeoutSeconds",
                                RelayDefaults::DEFAULT_TIMEOUT_SECONDS);
  if (timeout < 0) {
    throw ValidationError("Parameter 'timeoutSeconds' must not be negative");
  }
  options.timeoutSeconds = static_cast<int>(timeout);
  options.createTableIfNotExists =
      readBool(params, "createTableIfNotExists", false);
  options.truncateTargetTable = readBool(params, "truncateTargetTable", false);
  return options;
}

void CommonTransferOptions::appendTo(json &out) const {
  out["batchSize"] = batchSize;
  out["timeoutSeconds"] = timeoutSeconds;
  out["createTableIfNotExists"] = createTableIfNotExists;
  out["truncateTargetTable"] = truncateTargetTable;
}

void CommonTransferOptions::validate() const {
  if (batchSize == 0 || batchSize > RelayConfig::MAX_BATCH_SIZE) {
    throw ValidationError("Parameter 'batchSize' must be between 1 and " +
                          std::to_string(RelayConfig::MAX_BATCH_SIZE));
  }
  if (timeoutSeconds < 0) {
    throw ValidationError("Parameter 'timeoutSeconds' must not be negative");
  }
}

DataTransferParameters DataTransferParameters::fromJson(const json &params) {
  requireObject(params);
  DataTransferParameters p;
  p.source = readString(params, "source");
  p.target = readString(params, "target");
  p.sourceQuery = readString(params, "sourceQuery");
  p.targetTable = readString(params, "targetTable");
  p.columnMappings = readStringMap(params, "columnMappings");
  p.options = CommonTransferOptions::fromJson(params);
  return p;
}

json DataTransferParameters::toJson() const {
  json out = {{"source", source},
              {"target", target},
              {"sourceQuery", sourceQuery},
              {"targetTable", targetTable},
              {"columnMappings", columnMappings}};
  options.appendTo(out);
  return out;
}

void DataTransferParameters::validate() const {
  requireNonEmpty(source, "source");
  requireNonEmpty(target, "target");
  requireNonEmpty(sourceQuery, "sourceQuery");
  requireTableName(targetTable, "targetTable");
  requireColumnNames(columnMappings, "columnMappings");
  options.validate();
}

std::string syncScopeToString(SyncScope scope) {
  switch (scope) {
  case SyncScope::FullTable:
    return "full";
  case SyncScope::KeyMatch:
    return "keys";
  case SyncScope::Predicate:
    return "predicate";
  default:
    return "full";
  }
}

SyncScope parseSyncScope(const std::string &name) {
  std::string lowered = StringUtils::toLower(name);
  if (lowered.empty() || lowered == "full")
    return SyncScope::FullTable;
  if (lowered == "keys")
    return SyncScope::KeyMatch;
  if (lowered == "predicate")
    return SyncScope::Predicate;
  throw ValidationError("Parameter 'syncScope' must be 'full', 'keys' or "
                        "'predicate', got '" +
                        name + "'");
}

DataSyncParameters DataSyncParameters::fromJson(const json &params) {
  requireObject(params);
  DataSyncParameters p;
  p.source = readString(params, "source");
  p.target = readString(params, "target");
  p.sourceQuery = readString(params, "sourceQuery");
  p.targetTable = readString(params, "targetTable");
  p.columnMappings = readStringMap(params, "columnMappings");
  p.scope = parseSyncScope(readString(params, "syncScope"));
  p.keyColumns = readStringList(params, "keyColumns");
  p.deletePredicate = readString(params, "deletePredicate");
  p.options = CommonTransferOptions::fromJson(params);
  return p;
}

json DataSyncParameters::toJson() const {
  json out = {{"source", source},
              {"target", target},
              {"sourceQuery", sourceQuery},
              {"targetTable", targetTable},
              {"columnMappings", columnMappings},
              {"syncScope", syncScopeToString(scope)},
              {"keyColumns", keyColumns},
              {"deletePredicate", deletePredicate}};
  options.appendTo(out);
  return out;
}

void DataSyncParameters::validate() const {
  requireNonEmpty(source, "source");
  requireNonEmpty(target, "target");
  requireNonEmpty(sourceQuery, "sourceQuery");
  requireTableName(targetTable, "targetTable");
  requireColumnNames(columnMappings, "columnMappings");
  options.validate();

  if (scope == SyncScope::KeyMatch) {
    if (keyColumns.empty()) {
      throw ValidationError(
          "Parameter 'keyColumns' is required when syncScope is 'keys'");
    }
    for (const auto &key : keyColumns) {
      if (!SqlValidator::isValidColumnName(key)) {
        throw ValidationError("Invalid key column name: " + key);
      }
    }
  }
  if (scope == SyncScope::Predicate) {
    requireNonEmpty(deletePredicate, "deletePredicate");
    if (!SqlValidator::isSafePredicate(deletePredicate)) {
      throw ValidationError("Parameter 'deletePredicate' contains forbidden "
                            "SQL: " +
                            deletePredicate);
    }
  }
}

std::string arrayHandlingToString(ArrayHandling handling) {
  switch (handling) {
  case ArrayHandling::Serialize:
    return "serialize";
  case ArrayHandling::Skip:
    return "skip";
  case ArrayHandling::FirstElement:
    return "firstelement";
  default:
    return "serialize";
  }
}

ArrayHandling parseArrayHandling(const std::string &name) {
  std::string lowered = StringUtils::toLower(name);
  if (lowered.empty() || lowered == "serialize")
    return ArrayHandling::Serialize;
  if (lowered == "skip")
    return ArrayHandling::Skip;
  if (lowered == "firstelement")
    return ArrayHandling::FirstElement;
  throw ValidationError("Parameter 'arrayHandling' must be 'serialize', "
                        "'skip' or 'firstelement', got '" +
                        name + "'");
}

DocumentTransferParameters
DocumentTransferParameters::fromJson(const json &params) {
  requireObject(params);
  DocumentTransferParameters p;
  p.source = readString(params, "source");
  p.target = readString(params, "target");
  p.collection = readString(params, "collection");
  p.targetTable = readString(params, "targetTable");

  if (params.contains("filter") && !params["filter"].is_null()) {
    if (!params["filter"].is_object()) {
      throw ValidationError("Parameter 'filter' must be a JSON object");
    }
    p.filter = params["filter"];
  }
  if (params.contains("pipeline") && !params["pipeline"].is_null()) {
    if (!params["pipeline"].is_array()) {
      throw ValidationError("Parameter 'pipeline' must be a JSON array");
    }
    p.pipeline = params["pipeline"];
  }

  p.jsonMode = readBool(params, "jsonMode", false);
  p.flattenNestedDocuments = readBool(params, "flattenNestedDocuments", true);
  std::string separator = readString(params, "flattenSeparator");
  if (!separator.empty())
    p.flattenSeparator = separator;
  p.arrayHandling = parseArrayHandling(readString(params, "arrayHandling"));
  p.includeFields = readStringList(params, "includeFields");
  p.excludeFields = readStringList(params, "excludeFields");
  p.fieldMappings = readStringMap(params, "fieldMappings");

  int64_t sample =
      readInteger(params, "schemaSampleSize",
                  static_cast<int64_t>(RelayConfig::getSchemaSampleSize()));
  if (sample <= 0) {
    throw ValidationError(
        "Parameter 'schemaSampleSize' must be greater than zero");
  }
  p.schemaSampleSize = static_cast<size_t>(sample);

  std::string policy = readString(params, "unmappablePolicy");
  if (policy.empty()) {
    p.unmappablePolicy = RelayConfig::getUnmappablePolicy();
  } else {
    try {
      p.unmappablePolicy =
          RelayConfig::parseUnmappablePolicy(StringUtils::toLower(policy));
    } catch (const std::invalid_argument &e) {
      throw ValidationError(e.what());
    }
  }

  p.options = CommonTransferOptions::fromJson(params);
  return p;
}

json DocumentTransferParameters::toJson() const {
  json out = {
      {"source", source},
      {"target", target},
      {"collection", collection},
      {"targetTable", targetTable},
      {"filter", filter},
      {"pipeline", pipeline},
      {"jsonMode", jsonMode},
      {"flattenNestedDocuments", flattenNestedDocuments},
      {"flattenSeparator", flattenSeparator},
      {"arrayHandling", arrayHandlingToString(arrayHandling)},
      {"includeFields", includeFields},
      {"excludeFields", excludeFields},
      {"fieldMappings", fieldMappings},
      {"schemaSampleSize", schemaSampleSize},
      {"unmappablePolicy",
       unmappablePolicy == UnmappablePolicy::ABORT ? "abort" : "skip"}};
  options.appendTo(out);
  return out;
}

void DocumentTransferParameters::validate() const {
  requireNonEmpty(source, "source");
  requireNonEmpty(target, "target");
  requireNonEmpty(collection, "collection");
  requireTableName(targetTable, "targetTable");
  options.validate();

  if (jsonMode && !SqlValidator::isValidTableName(effectiveTargetTable())) {
    throw ValidationError("Parameter 'targetTable' is too long for json mode: " +
                          effectiveTargetTable());
  }
  // The separator ends up inside column names.
  if (!SqlValidator::isValidColumnName("a" + flattenSeparator + "b")) {
    throw ValidationError("Parameter 'flattenSeparator' may only contain "
                          "identifier characters");
  }
  if (schemaSampleSize < RelayConfig::MIN_SCHEMA_SAMPLE ||
      schemaSampleSize > RelayConfig::MAX_SCHEMA_SAMPLE) {
    throw ValidationError("Parameter 'schemaSampleSize' must be between " +
                          std::to_string(RelayConfig::MIN_SCHEMA_SAMPLE) +
                          " and " +
                          std::to_string(RelayConfig::MAX_SCHEMA_SAMPLE));
  }
  requireColumnNames(fieldMappings, "fieldMappings");
}

std::string DocumentTransferParameters::effectiveTargetTable() const {
  if (jsonMode)
    return targetTable + RelayDefaults::JSON_TABLE_SUFFIX;
  return targetTable;
}
