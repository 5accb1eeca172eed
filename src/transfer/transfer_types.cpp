#include "transfer/transfer_types.h"
#include <algorithm>

std::string transferStatusToString(TransferStatus status) {
  switch (status) {
  case TransferStatus::Completed:
    return "Completed";
  case TransferStatus::Failed:
    return "Failed";
  case TransferStatus::Cancelled:
    return "Cancelled";
  default:
    return "Failed";
  }
}

void TransferResult::touchTable(const std::string &table) {
  if (std::find(tablesTouched.begin(), tablesTouched.end(), table) ==
      tablesTouched.end()) {
    tablesTouched.push_back(table);
  }
}

json TransferResult::toJson() const {
  json out = {{"rowsRead", rowsRead},
              {"rowsWritten", rowsWritten},
              {"rowsDeleted", rowsDeleted},
              {"batchCount", batchCount},
              {"skippedDocuments", skippedDocuments},
              {"tablesTouched", tablesTouched},
              {"warnings", warnings},
              {"executionTimeMs", executionTimeMs}};
  if (failedBatchIndex)
    out["failedBatchIndex"] = *failedBatchIndex;
  if (failedRowOffset)
    out["failedRowOffset"] = *failedRowOffset;
  return out;
}

TransferOutcome TransferOutcome::completed(TransferResult result) {
  TransferOutcome outcome;
  outcome.status = TransferStatus::Completed;
  outcome.result = std::move(result);
  return outcome;
}

TransferOutcome TransferOutcome::failed(ErrorKind kind,
                                        const std::string &message,
                                        TransferResult result) {
  TransferOutcome outcome;
  outcome.status = TransferStatus::Failed;
  outcome.errorKind = kind;
  outcome.message = message;
  outcome.result = std::move(result);
  return outcome;
}

TransferOutcome TransferOutcome::cancelled(const std::string &message,
                                           TransferResult result) {
  TransferOutcome outcome;
  outcome.status = TransferStatus::Cancelled;
  outcome.errorKind = ErrorKind::Cancelled;
  outcome.message = message;
  outcome.result = std::move(result);
  return outcome;
}
