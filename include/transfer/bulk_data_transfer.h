#ifndef BULK_DATA_TRANSFER_H
#define BULK_DATA_TRANSFER_H

#include "engines/relational_connection.h"
#include "transfer/transfer_parameters.h"
#include "transfer/transfer_types.h"

// Streams a source query into a target table one page at a time. Each page is
// written in its own transaction; a failed page stops the transfer and
// earlier pages stay committed.
class BulkDataTransfer {
public:
  TransferOutcome run(IRelationalConnection &source,
                      IRelationalConnection &target,
                      const DataTransferParameters &params,
                      const CancellationToken &token,
                      const ProgressCallback &progress = nullptr) const;
};

#endif
