#ifndef DOCUMENT_TRANSFER_H
#define DOCUMENT_TRANSFER_H

#include "engines/document_source.h"
#include "engines/relational_connection.h"
#include "transfer/document_flattener.h"
#include "transfer/transfer_parameters.h"
#include "transfer/transfer_types.h"

// Moves documents from a document store into a relational table. In json
// mode every document lands whole in <targetTable>_JSON (Id, JsonData,
// CreatedAt); otherwise documents are flattened against a schema inferred
// from the first schemaSampleSize documents.
class DocumentToRelationalTransfer {
public:
  TransferOutcome run(IDocumentSource &source, IRelationalConnection &target,
                      const DocumentTransferParameters &params,
                      const CancellationToken &token,
                      const ProgressCallback &progress = nullptr) const;

  static std::vector<ColumnDefinition> jsonTableColumns();

private:
  TransferOutcome runJsonMode(IDocumentSource &source,
                              IRelationalConnection &target,
                              const DocumentTransferParameters &params,
                              const CancellationToken &token,
                              const ProgressCallback &progress) const;
  TransferOutcome runFlattened(IDocumentSource &source,
                               IRelationalConnection &target,
                               const DocumentTransferParameters &params,
                               const CancellationToken &token,
                               const ProgressCallback &progress) const;
};

#endif
