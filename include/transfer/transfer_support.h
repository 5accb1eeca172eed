#ifndef TRANSFER_SUPPORT_H
#define TRANSFER_SUPPORT_H

#include "engines/relational_connection.h"
#include "transfer/transfer_parameters.h"
#include "transfer/transfer_types.h"
#include <chrono>
#include <exception>
#include <map>
#include <string>
#include <vector>

namespace TransferSupport {

ErrorKind errorKindOf(const std::exception &e);

// Renames source columns through mappings; unmapped columns keep their name.
// Throws DataError if a resulting name is not a valid identifier.
std::vector<std::string>
mapTargetColumns(const std::vector<std::string> &sourceColumns,
                 const std::map<std::string, std::string> &mappings);

std::vector<ColumnDefinition>
columnDefinitions(const std::vector<std::string> &names,
                  const std::vector<ColumnType> &types);

// Creates the table when it is missing and creation is allowed, truncates it
// when asked to. Throws DataError if the table is missing otherwise.
void prepareTargetTable(IRelationalConnection &target, const std::string &table,
                        const std::vector<ColumnDefinition> &columns,
                        const CommonTransferOptions &options, bool allowTruncate,
                        TransferResult &result);

std::string describeRows(size_t offset, size_t count);

int64_t elapsedMs(std::chrono::steady_clock::time_point started);

} // namespace TransferSupport

#endif
