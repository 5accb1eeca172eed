#ifndef RELAY_DEFAULTS_H
#define RELAY_DEFAULTS_H

#include <cstddef>

namespace RelayDefaults {
constexpr int BUFFER_SIZE = 1024;
constexpr int ODBC_CONNECT_RETRIES = 3;
constexpr int ODBC_INITIAL_BACKOFF_MS = 100;
constexpr int DEFAULT_TIMEOUT_SECONDS = 300;
constexpr size_t MAX_IDENTIFIER_LENGTH = 128;
// SQL Server rejects INSERT ... VALUES lists longer than this.
constexpr size_t MSSQL_MAX_ROWS_PER_INSERT = 1000;
constexpr size_t POSTGRES_MAX_ROWS_PER_INSERT = 1000;
constexpr size_t JOB_ID_LENGTH = 32;
constexpr size_t DEFAULT_LIST_LIMIT = 50;
constexpr size_t MAX_LIST_LIMIT = 1000;
constexpr const char *JSON_TABLE_SUFFIX = "_JSON";
constexpr const char *DEFAULT_LOG_TABLE = "datarelay.logs";
constexpr const char *MONGO_APP_NAME = "DataRelay";
} // namespace RelayDefaults

#endif
