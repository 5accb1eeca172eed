#include "transfer/bulk_data_transfer.h"
#include "core/logger.h"
#include "engines/transaction_scope.h"
#include "transfer/transfer_support.h"

using namespace TransferSupport;

namespace {

std::string committedSummary(size_t batches, size_t rows) {
  if (batches == 0)
    return "No earlier batch was committed.";
  return std::to_string(rows) + " rows from " + std::to_string(batches) +
         " earlier batch(es) remain committed and were not rolled back.";
}

} // namespace

TransferOutcome BulkDataTransfer::run(IRelationalConnection &source,
                                      IRelationalConnection &target,
                                      const DataTransferParameters &params,
                                      const CancellationToken &token,
                                      const ProgressCallback &progress) const {
  auto started = std::chrono::steady_clock::now();
  TransferResult result;
  const std::string &table = params.targetTable;

  Logger::info(LogCategory::TRANSFER, "BulkDataTransfer::run",
               "Transferring into " + table + " from " + source.engineName() +
                   " (batch size " + std::to_string(params.options.batchSize) +
                   ")");

  std::unique_ptr<IRowReader> reader;
  std::vector<std::string> columns;
  try {
    source.setStatementTimeout(params.options.timeoutSeconds);
    target.setStatementTimeout(params.options.timeoutSeconds);
    reader = source.openReader(params.sourceQuery);
    columns = mapTargetColumns(reader->columns(), params.columnMappings);
    prepareTargetTable(target, table,
                       columnDefinitions(columns, reader->columnTypes()),
                       params.options, true, result);
  } catch (const std::exception &e) {
    result.executionTimeMs = elapsedMs(started);
    std::string message = "Transfer into " + table +
                          " failed before the first batch: " + e.what();
    Logger::error(LogCategory::TRANSFER, "BulkDataTransfer::run", message);
    return TransferOutcome::failed(errorKindOf(e), message, std::move(result));
  }

  std::vector<Row> rows;
  size_t rowOffset = 0;
  while (true) {
    size_t batchIndex = result.batchCount + 1;
    if (token.isCancelled()) {
      result.executionTimeMs = elapsedMs(started);
      std::string message = "Transfer cancelled before batch " +
                            std::to_string(batchIndex) + ". " +
                            committedSummary(result.batchCount,
                                             result.rowsWritten);
      Logger::warning(LogCategory::TRANSFER, "BulkDataTransfer::run", message);
      return TransferOutcome::cancelled(message, std::move(result));
    }

    rows.clear();
    size_t read = 0;
    try {
      read = reader->readBatch(params.options.batchSize, rows);
      if (read == 0)
        break;
      result.rowsRead += read;

      TransactionScope transaction(target);
      size_t written = target.bulkInsert(table, columns, rows);
      transaction.commit();
      result.rowsWritten += written;
    } catch (const std::exception &e) {
      result.failedBatchIndex = batchIndex;
      result.failedRowOffset = rowOffset;
      result.executionTimeMs = elapsedMs(started);
      std::string message = "Transfer into " + table + " failed at batch " +
                            std::to_string(batchIndex) + " (" +
                            describeRows(rowOffset, read) + "): " + e.what() +
                            " " +
                            committedSummary(result.batchCount,
                                             result.rowsWritten);
      Logger::error(LogCategory::TRANSFER, "BulkDataTransfer::run", message);
      return TransferOutcome::failed(errorKindOf(e), message, std::move(result));
    }

    ++result.batchCount;
    rowOffset += read;
    Logger::debug(LogCategory::TRANSFER, "BulkDataTransfer::run",
                  "Batch " + std::to_string(batchIndex) + " committed (" +
                      std::to_string(read) + " rows)");
    if (progress)
      progress(batchIndex, result.rowsWritten);
  }

  result.executionTimeMs = elapsedMs(started);
  Logger::info(LogCategory::TRANSFER, "BulkDataTransfer::run",
               "Transfer into " + table + " completed: " +
                   std::to_string(result.rowsWritten) + " rows in " +
                   std::to_string(result.batchCount) + " batch(es)");
  return TransferOutcome::completed(std::move(result));
}
