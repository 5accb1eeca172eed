#include "transfer/delete_insert_sync.h"
#include "core/logger.h"
#include "core/relay_errors.h"
#include "engines/transaction_scope.h"
#include "transfer/transfer_support.h"
#include <algorithm>

using namespace TransferSupport;

size_t DeleteInsertSync::clearScope(IRelationalConnection &target,
                                    const DataSyncParameters &params) const {
  switch (params.scope) {
  case SyncScope::FullTable:
    return target.deleteAll(params.targetTable);
  case SyncScope::Predicate:
    return target.deleteWhere(params.targetTable, params.deletePredicate);
  case SyncScope::KeyMatch:
  default:
    return 0;
  }
}

std::string
DeleteInsertSync::describeTargetState(const DataSyncParameters &params,
                                      size_t committedBatches,
                                      size_t rowsWritten,
                                      bool rollbackFailed) const {
  const std::string &table = params.targetTable;
  if (rollbackFailed) {
    return "Rollback of the batch failed; target table " + table +
           " may be left empty or partial.";
  }
  if (committedBatches == 0) {
    return "No batch was committed; target table " + table + " is unchanged.";
  }

  std::string committed = std::to_string(committedBatches) + " batch(es) (" +
                          std::to_string(rowsWritten) + " rows)";
  switch (params.scope) {
  case SyncScope::FullTable:
    return "Target table " + table + " is left partial: all previous rows were "
           "deleted and it holds only the " + committed +
           " committed before the failure.";
  case SyncScope::Predicate:
    return "Target table " + table + " is left partial: rows matching the "
           "delete predicate were removed and only " + committed +
           " of replacements were committed.";
  case SyncScope::KeyMatch:
  default:
    return "Target table " + table + " is left partial: " + committed +
           " were synced and later source rows were not.";
  }
}

TransferOutcome DeleteInsertSync::run(IRelationalConnection &source,
                                      IRelationalConnection &target,
                                      const DataSyncParameters &params,
                                      const CancellationToken &token,
                                      const ProgressCallback &progress) const {
  auto started = std::chrono::steady_clock::now();
  TransferResult result;
  size_t committedBatches = 0;
  size_t rowOffset = 0;
  bool scopeCleared = false;
  const std::string &table = params.targetTable;

  Logger::info(LogCategory::TRANSFER, "DeleteInsertSync::run",
               "Syncing into " + table + " (scope " +
                   syncScopeToString(params.scope) + ", batch size " +
                   std::to_string(params.options.batchSize) + ")");

  std::unique_ptr<IRowReader> reader;
  std::vector<std::string> columns;
  std::vector<size_t> keyIndexes;
  try {
    source.setStatementTimeout(params.options.timeoutSeconds);
    target.setStatementTimeout(params.options.timeoutSeconds);
    reader = source.openReader(params.sourceQuery);
    columns = mapTargetColumns(reader->columns(), params.columnMappings);

    if (params.scope == SyncScope::KeyMatch) {
      for (const auto &key : params.keyColumns) {
        auto it = std::find(columns.begin(), columns.end(), key);
        if (it == columns.end()) {
          throw DataError("Key column " + key +
                          " is not produced by the source query");
        }
        keyIndexes.push_back(static_cast<size_t>(it - columns.begin()));
      }
    }

    prepareTargetTable(target, table,
                       columnDefinitions(columns, reader->columnTypes()),
                       params.options, false, result);
  } catch (const std::exception &e) {
    result.executionTimeMs = elapsedMs(started);
    std::string message = "Sync into " + table +
                          " failed before the first batch: " + e.what() +
                          " Target table " + table + " is unchanged.";
    Logger::error(LogCategory::TRANSFER, "DeleteInsertSync::run", message);
    return TransferOutcome::failed(errorKindOf(e), message, std::move(result));
  }

  std::vector<Row> rows;
  while (true) {
    size_t batchIndex = committedBatches + 1;
    if (token.isCancelled()) {
      result.executionTimeMs = elapsedMs(started);
      std::string message =
          "Sync cancelled before batch " + std::to_string(batchIndex) + ". " +
          describeTargetState(params, committedBatches, result.rowsWritten,
                              false);
      Logger::warning(LogCategory::TRANSFER, "DeleteInsertSync::run", message);
      return TransferOutcome::cancelled(message, std::move(result));
    }

    rows.clear();
    size_t read = 0;
    bool rollbackFailed = false;
    try {
      read = reader->readBatch(params.options.batchSize, rows);
      if (read == 0)
        break;
      result.rowsRead += read;

      TransactionScope transaction(target);
      try {
        size_t deleted = 0;
        if (!scopeCleared)
          deleted += clearScope(target, params);
        if (params.scope == SyncScope::KeyMatch) {
          std::vector<Row> keyRows;
          keyRows.reserve(rows.size());
          for (const auto &row : rows) {
            Row key;
            for (size_t index : keyIndexes)
              key.push_back(row[index]);
            keyRows.push_back(std::move(key));
          }
          deleted += target.deleteMatching(table, params.keyColumns, keyRows);
        }
        size_t written = target.bulkInsert(table, columns, rows);
        transaction.commit();

        scopeCleared = true;
        result.rowsDeleted += deleted;
        result.rowsWritten += written;
      } catch (const std::exception &) {
        rollbackFailed = !transaction.rollback();
        throw;
      }
    } catch (const std::exception &e) {
      result.failedBatchIndex = batchIndex;
      result.failedRowOffset = rowOffset;
      result.executionTimeMs = elapsedMs(started);
      std::string message =
          "Sync into " + table + " failed at batch " +
          std::to_string(batchIndex) + " (" + describeRows(rowOffset, read) +
          "): " + e.what() + " " +
          describeTargetState(params, committedBatches, result.rowsWritten,
                              rollbackFailed);
      Logger::error(LogCategory::TRANSFER, "DeleteInsertSync::run", message);
      return TransferOutcome::failed(errorKindOf(e), message, std::move(result));
    }

    ++committedBatches;
    result.batchCount = committedBatches;
    rowOffset += read;
    Logger::debug(LogCategory::TRANSFER, "DeleteInsertSync::run",
                  "Batch " + std::to_string(batchIndex) + " committed (" +
                      std::to_string(read) + " rows)");
    if (progress)
      progress(batchIndex, result.rowsWritten);
  }

  // An empty source still clears the scope.
  if (!scopeCleared && params.scope != SyncScope::KeyMatch) {
    bool rollbackFailed = false;
    try {
      TransactionScope transaction(target);
      try {
        result.rowsDeleted += clearScope(target, params);
        transaction.commit();
      } catch (const std::exception &) {
        rollbackFailed = !transaction.rollback();
        throw;
      }
    } catch (const std::exception &e) {
      result.executionTimeMs = elapsedMs(started);
      std::string message = "Sync into " + table +
                            " failed clearing the target for an empty source: " +
                            e.what() + " " +
                            describeTargetState(params, 0, 0, rollbackFailed);
      Logger::error(LogCategory::TRANSFER, "DeleteInsertSync::run", message);
      return TransferOutcome::failed(errorKindOf(e), message, std::move(result));
    }
  }

  result.executionTimeMs = elapsedMs(started);
  Logger::info(LogCategory::TRANSFER, "DeleteInsertSync::run",
               "Sync into " + table + " completed: " +
                   std::to_string(result.rowsDeleted) + " deleted, " +
                   std::to_string(result.rowsWritten) + " inserted in " +
                   std::to_string(result.batchCount) + " batch(es)");
  return TransferOutcome::completed(std::move(result));
}
