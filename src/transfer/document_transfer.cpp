#include "transfer/document_transfer.h"
#include "core/logger.h"
#include "core/relay_errors.h"
#include "engines/transaction_scope.h"
#include "transfer/transfer_support.h"
#include <set>

using namespace TransferSupport;

namespace {

DocumentQuery queryFor(const DocumentTransferParameters &params) {
  DocumentQuery query;
  query.collection = params.collection;
  query.filter = params.filter;
  query.pipeline = params.pipeline;
  return query;
}

std::string committedSummary(size_t batches, size_t rows) {
  if (batches == 0)
    return "No earlier batch was committed.";
  return std::to_string(rows) + " rows from " + std::to_string(batches) +
         " earlier batch(es) remain committed.";
}

TransferOutcome cancelledBefore(size_t batchIndex, TransferResult result,
                                std::chrono::steady_clock::time_point started) {
  result.executionTimeMs = elapsedMs(started);
  std::string message = "Document transfer cancelled before batch " +
                        std::to_string(batchIndex) + ". " +
                        committedSummary(result.batchCount, result.rowsWritten);
  Logger::warning(LogCategory::TRANSFER, "DocumentToRelationalTransfer::run",
                  message);
  return TransferOutcome::cancelled(message, std::move(result));
}

TransferOutcome failedAt(const std::string &table, size_t batchIndex,
                         size_t offset, size_t count, const std::exception &e,
                         TransferResult result,
                         std::chrono::steady_clock::time_point started) {
  result.failedBatchIndex = batchIndex;
  result.failedRowOffset = offset;
  result.executionTimeMs = elapsedMs(started);
  std::string message =
      "Document transfer into " + table + " failed at batch " +
      std::to_string(batchIndex) + " (documents " + std::to_string(offset) +
      (count > 0 ? "-" + std::to_string(offset + count - 1) : "+") +
      "): " + e.what() + " " +
      committedSummary(result.batchCount, result.rowsWritten);
  Logger::error(LogCategory::TRANSFER, "DocumentToRelationalTransfer::run",
                message);
  return TransferOutcome::failed(errorKindOf(e), message, std::move(result));
}

} // namespace

std::vector<ColumnDefinition> DocumentToRelationalTransfer::jsonTableColumns() {
  ColumnDefinition id;
  id.name = "Id";
  id.type = ColumnType::Integer;
  id.nullable = false;
  id.identity = true;

  ColumnDefinition data;
  data.name = "JsonData";
  data.type = ColumnType::Text;
  data.nullable = false;

  ColumnDefinition created;
  created.name = "CreatedAt";
  created.type = ColumnType::Timestamp;
  created.nullable = false;
  created.defaultCurrentTimestamp = true;

  return {id, data, created};
}

TransferOutcome
DocumentToRelationalTransfer::run(IDocumentSource &source,
                                  IRelationalConnection &target,
                                  const DocumentTransferParameters &params,
                                  const CancellationToken &token,
                                  const ProgressCallback &progress) const {
  Logger::info(LogCategory::TRANSFER, "DocumentToRelationalTransfer::run",
               "Transferring collection " + params.collection + " into " +
                   params.effectiveTargetTable() +
                   (params.jsonMode ? " (json mode)" : ""));
  if (params.jsonMode)
    return runJsonMode(source, target, params, token, progress);
  return runFlattened(source, target, params, token, progress);
}

TransferOutcome DocumentToRelationalTransfer::runJsonMode(
    IDocumentSource &source, IRelationalConnection &target,
    const DocumentTransferParameters &params, const CancellationToken &token,
    const ProgressCallback &progress) const {
  auto started = std::chrono::steady_clock::now();
  TransferResult result;
  const std::string table = params.effectiveTargetTable();

  try {
    target.setStatementTimeout(params.options.timeoutSeconds);
    CommonTransferOptions options = params.options;
    options.createTableIfNotExists = true;
    prepareTargetTable(target, table, jsonTableColumns(), options, true,
                       result);
    source.open(queryFor(params));
  } catch (const std::exception &e) {
    result.executionTimeMs = elapsedMs(started);
    std::string message = "Document transfer into " + table +
                          " failed before the first batch: " + e.what();
    Logger::error(LogCategory::TRANSFER, "DocumentToRelationalTransfer::run",
                  message);
    return TransferOutcome::failed(errorKindOf(e), message, std::move(result));
  }

  const std::vector<std::string> columns = {"JsonData"};
  std::vector<json> documents;
  std::vector<Row> rows;
  size_t offset = 0;
  while (true) {
    size_t batchIndex = result.batchCount + 1;
    if (token.isCancelled())
      return cancelledBefore(batchIndex, std::move(result), started);

    documents.clear();
    size_t read = 0;
    try {
      read = source.readBatch(params.options.batchSize, documents);
      if (read == 0)
        break;
      result.rowsRead += read;

      rows.clear();
      rows.reserve(documents.size());
      for (const auto &document : documents)
        rows.push_back(Row{json(document.dump())});

      TransactionScope transaction(target);
      size_t written = target.bulkInsert(table, columns, rows);
      transaction.commit();
      result.rowsWritten += written;
    } catch (const std::exception &e) {
      return failedAt(table, batchIndex, offset, read, e, std::move(result),
                      started);
    }

    ++result.batchCount;
    offset += read;
    if (progress)
      progress(batchIndex, result.rowsWritten);
  }

  result.executionTimeMs = elapsedMs(started);
  Logger::info(LogCategory::TRANSFER, "DocumentToRelationalTransfer::run",
               "Stored " + std::to_string(result.rowsWritten) +
                   " documents in " + table);
  return TransferOutcome::completed(std::move(result));
}

TransferOutcome DocumentToRelationalTransfer::runFlattened(
    IDocumentSource &source, IRelationalConnection &target,
    const DocumentTransferParameters &params, const CancellationToken &token,
    const ProgressCallback &progress) const {
  auto started = std::chrono::steady_clock::now();
  TransferResult result;
  const std::string &table = params.targetTable;
  DocumentFlattener flattener(FlattenOptions::fromParameters(params));

  std::vector<json> pending;
  DocumentSchema schema;
  try {
    target.setStatementTimeout(params.options.timeoutSeconds);
    source.open(queryFor(params));
    source.readBatch(params.schemaSampleSize, pending);

    if (pending.empty()) {
      result.executionTimeMs = elapsedMs(started);
      result.warnings.push_back("Collection " + params.collection +
                                " returned no documents");
      Logger::info(LogCategory::TRANSFER, "DocumentToRelationalTransfer::run",
                   "Collection " + params.collection +
                       " returned no documents; nothing to transfer");
      return TransferOutcome::completed(std::move(result));
    }

    schema = flattener.inferSchema(pending);
    if (schema.empty()) {
      throw DataError("No mappable fields found in the first " +
                      std::to_string(pending.size()) + " documents");
    }
    Logger::debug(LogCategory::TRANSFER, "DocumentToRelationalTransfer::run",
                  "Inferred " + std::to_string(schema.columns.size()) +
                      " columns from " + std::to_string(pending.size()) +
                      " sampled documents");
    prepareTargetTable(target, table, schema.columns, params.options, true,
                       result);
  } catch (const std::exception &e) {
    result.executionTimeMs = elapsedMs(started);
    std::string message = "Document transfer into " + table +
                          " failed before the first batch: " + e.what();
    Logger::error(LogCategory::TRANSFER, "DocumentToRelationalTransfer::run",
                  message);
    return TransferOutcome::failed(errorKindOf(e), message, std::move(result));
  }

  const std::vector<std::string> columns = schema.columnNames();
  std::set<std::string> droppedColumns;
  size_t pendingPos = 0;
  std::vector<json> documents;
  std::vector<Row> rows;
  size_t offset = 0;

  while (true) {
    size_t batchIndex = result.batchCount + 1;
    if (token.isCancelled())
      return cancelledBefore(batchIndex, std::move(result), started);

    documents.clear();
    size_t read = 0;
    try {
      while (documents.size() < params.options.batchSize &&
             pendingPos < pending.size()) {
        documents.push_back(std::move(pending[pendingPos++]));
      }
      if (pendingPos == pending.size() && !pending.empty()) {
        pending.clear();
        pendingPos = 0;
      }
      if (documents.size() < params.options.batchSize) {
        source.readBatch(params.options.batchSize - documents.size(),
                         documents);
      }
      read = documents.size();
      if (read == 0)
        break;
      result.rowsRead += read;

      rows.clear();
      for (size_t i = 0; i < documents.size(); ++i) {
        RowMapping mapping = flattener.mapDocument(documents[i], schema);
        for (const auto &column : mapping.unknownColumns) {
          if (droppedColumns.insert(column).second) {
            result.warnings.push_back("Field " + column +
                                      " is not in the inferred schema; its "
                                      "values were dropped");
          }
        }
        if (!mapping.mapped) {
          if (params.unmappablePolicy == UnmappablePolicy::ABORT) {
            throw DataError("Document " + std::to_string(offset + i) +
                            " cannot be mapped: " + mapping.reason);
          }
          ++result.skippedDocuments;
          Logger::debug(LogCategory::TRANSFER,
                        "DocumentToRelationalTransfer::run",
                        "Skipping document " + std::to_string(offset + i) +
                            ": " + mapping.reason);
          continue;
        }
        rows.push_back(std::move(mapping.row));
      }

      if (!rows.empty()) {
        TransactionScope transaction(target);
        size_t written = target.bulkInsert(table, columns, rows);
        transaction.commit();
        result.rowsWritten += written;
      }
    } catch (const std::exception &e) {
      return failedAt(table, batchIndex, offset, read, e, std::move(result),
                      started);
    }

    ++result.batchCount;
    offset += read;
    if (progress)
      progress(batchIndex, result.rowsWritten);
  }

  if (result.skippedDocuments > 0) {
    result.warnings.push_back(std::to_string(result.skippedDocuments) +
                              " document(s) skipped because they did not "
                              "match the inferred schema");
  }
  result.executionTimeMs = elapsedMs(started);
  Logger::info(LogCategory::TRANSFER, "DocumentToRelationalTransfer::run",
               "Transferred " + std::to_string(result.rowsWritten) +
                   " documents into " + table + " (" +
                   std::to_string(result.skippedDocuments) + " skipped)");
  return TransferOutcome::completed(std::move(result));
}
