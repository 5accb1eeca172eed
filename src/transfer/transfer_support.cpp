#include "transfer/transfer_support.h"
#include "core/logger.h"
#include "core/relay_errors.h"
#include "utils/sql_validator.h"

namespace TransferSupport {

ErrorKind errorKindOf(const std::exception &e) {
  if (const auto *relayError = dynamic_cast<const RelayError *>(&e))
    return relayError->kind();
  return ErrorKind::Internal;
}

std::vector<std::string>
mapTargetColumns(const std::vector<std::string> &sourceColumns,
                 const std::map<std::string, std::string> &mappings) {
  std::vector<std::string> targetColumns;
  targetColumns.reserve(sourceColumns.size());
  for (const auto &column : sourceColumns) {
    auto it = mappings.find(column);
    std::string name = it != mappings.end() ? it->second : column;
    if (!SqlValidator::isValidColumnName(name)) {
      throw DataError("Source column '" + column +
                      "' does not map to a valid target column name");
    }
    targetColumns.push_back(name);
  }
  return targetColumns;
}

std::vector<ColumnDefinition>
columnDefinitions(const std::vector<std::string> &names,
                  const std::vector<ColumnType> &types) {
  std::vector<ColumnDefinition> definitions;
  definitions.reserve(names.size());
  for (size_t i = 0; i < names.size(); ++i) {
    ColumnDefinition column;
    column.name = names[i];
    column.type = i < types.size() ? types[i] : ColumnType::Text;
    definitions.push_back(column);
  }
  return definitions;
}

void prepareTargetTable(IRelationalConnection &target, const std::string &table,
                        const std::vector<ColumnDefinition> &columns,
                        const CommonTransferOptions &options, bool allowTruncate,
                        TransferResult &result) {
  if (!target.tableExists(table)) {
    if (!options.createTableIfNotExists) {
      throw DataError("Target table " + table + " does not exist on " +
                      target.engineName());
    }
    target.createTable(table, columns);
    result.warnings.push_back("Created target table " + table);
    Logger::info(LogCategory::TRANSFER, "prepareTargetTable",
                 "Created target table " + table + " on " +
                     target.engineName());
  } else if (options.truncateTargetTable) {
    if (allowTruncate) {
      target.truncate(table);
      result.warnings.push_back("Truncated target table " + table);
      Logger::info(LogCategory::TRANSFER, "prepareTargetTable",
                   "Truncated target table " + table);
    } else {
      result.warnings.push_back(
          "truncateTargetTable ignored; the sync scope controls deletion");
    }
  }
  result.touchTable(table);
}

std::string describeRows(size_t offset, size_t count) {
  if (count == 0)
    return "starting at source row " + std::to_string(offset);
  return "source rows " + std::to_string(offset) + "-" +
         std::to_string(offset + count - 1);
}

int64_t elapsedMs(std::chrono::steady_clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - started)
      .count();
}

} // namespace TransferSupport
