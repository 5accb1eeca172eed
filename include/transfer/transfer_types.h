#ifndef TRANSFER_TYPES_H
#define TRANSFER_TYPES_H

#include "core/relay_errors.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

// Cooperative stop flag. Transfers look at it between batches only.
class CancellationToken {
  std::atomic<bool> cancelled_{false};

public:
  void cancel() { cancelled_ = true; }
  bool isCancelled() const { return cancelled_.load(); }
};

enum class TransferStatus { Completed, Failed, Cancelled };

std::string transferStatusToString(TransferStatus status);

struct TransferResult {
  size_t rowsRead = 0;
  size_t rowsWritten = 0;
  size_t rowsDeleted = 0;
  size_t batchCount = 0;
  size_t skippedDocuments = 0;
  std::vector<std::string> tablesTouched;
  std::vector<std::string> warnings;
  int64_t executionTimeMs = 0;
  // 1-based index and 0-based first-row offset of the batch that failed.
  std::optional<size_t> failedBatchIndex;
  std::optional<size_t> failedRowOffset;

  void touchTable(const std::string &table);
  json toJson() const;
};

struct TransferOutcome {
  TransferStatus status = TransferStatus::Completed;
  ErrorKind errorKind = ErrorKind::None;
  std::string message;
  TransferResult result;

  static TransferOutcome completed(TransferResult result);
  static TransferOutcome failed(ErrorKind kind, const std::string &message,
                                TransferResult result);
  static TransferOutcome cancelled(const std::string &message,
                                   TransferResult result);
};

// Called after every committed batch with its 1-based index and the running
// number of rows written.
using ProgressCallback =
    std::function<void(size_t batchIndex, size_t rowsWritten)>;

#endif
