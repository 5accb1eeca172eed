#ifndef DELETE_INSERT_SYNC_H
#define DELETE_INSERT_SYNC_H

#include "engines/relational_connection.h"
#include "transfer/transfer_parameters.h"
#include "transfer/transfer_types.h"

// Replaces the rows selected by the sync scope with freshly read source rows.
// Each batch runs in its own target transaction; the scope delete (full or
// predicate) rides in the first batch's transaction, the key delete in every
// batch's. A failed batch is rolled back and stops the sync.
class DeleteInsertSync {
public:
  TransferOutcome run(IRelationalConnection &source,
                      IRelationalConnection &target,
                      const DataSyncParameters &params,
                      const CancellationToken &token,
                      const ProgressCallback &progress = nullptr) const;

private:
  size_t clearScope(IRelationalConnection &target,
                    const DataSyncParameters &params) const;
  std::string describeTargetState(const DataSyncParameters &params,
                                  size_t committedBatches, size_t rowsWritten,
                                  bool rollbackFailed) const;
};

#endif
