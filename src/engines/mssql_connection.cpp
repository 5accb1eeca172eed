#include "engines/mssql_connection.h"
#include "core/logger.h"
#include "core/relay_defaults.h"
#include "core/relay_errors.h"
#include "utils/sql_validator.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <chrono>
#include <sstream>
#include <thread>

namespace {

std::string odbcSqlState(SQLSMALLINT handleType, SQLHANDLE handle) {
  SQLCHAR sqlState[6] = {0};
  SQLCHAR msg[SQL_MAX_MESSAGE_LENGTH];
  SQLINTEGER nativeError = 0;
  SQLSMALLINT msgLen = 0;
  if (SQL_SUCCEEDED(SQLGetDiagRec(handleType, handle, 1, sqlState,
                                  &nativeError, msg, sizeof(msg), &msgLen))) {
    return std::string(reinterpret_cast<char *>(sqlState));
  }
  return "";
}

// SQLSTATE class 08 is a connection exception. Everything else is reported
// as a data error.
void throwOdbcError(SQLSMALLINT handleType, SQLHANDLE handle,
                    const std::string &context) {
  std::string state = odbcSqlState(handleType, handle);
  std::string message = context + ": " + odbcDiagnostic(handleType, handle);
  if (StringUtils::startsWith(state, "08")) {
    throw ConnectivityError(message);
  }
  throw DataError(message);
}

std::string tableIdentifier(const std::string &table) {
  try {
    return SqlValidator::safeMssqlTableName(table);
  } catch (const std::invalid_argument &e) {
    throw DataError(e.what());
  }
}

std::string columnIdentifier(const std::string &column) {
  if (!SqlValidator::isValidColumnName(column)) {
    throw DataError("Invalid column name: " + column);
  }
  return SqlValidator::quoteMssqlIdentifier(column);
}

ColumnType columnTypeFromOdbc(SQLSMALLINT dataType) {
  switch (dataType) {
  case SQL_TINYINT:
  case SQL_SMALLINT:
  case SQL_INTEGER:
  case SQL_BIGINT:
    return ColumnType::Integer;
  case SQL_REAL:
  case SQL_FLOAT:
  case SQL_DOUBLE:
    return ColumnType::Float;
  case SQL_BIT:
    return ColumnType::Boolean;
  case SQL_TYPE_DATE:
  case SQL_TYPE_TIME:
  case SQL_TYPE_TIMESTAMP:
    return ColumnType::Timestamp;
  default:
    // DECIMAL/NUMERIC stay text to keep their precision.
    return ColumnType::Text;
  }
}

} // namespace

std::string odbcDiagnostic(SQLSMALLINT handleType, SQLHANDLE handle) {
  SQLCHAR sqlState[6] = {0};
  SQLCHAR msg[SQL_MAX_MESSAGE_LENGTH] = {0};
  SQLINTEGER nativeError = 0;
  SQLSMALLINT msgLen = 0;
  if (handle == SQL_NULL_HANDLE ||
      !SQL_SUCCEEDED(SQLGetDiagRec(handleType, handle, 1, sqlState,
                                   &nativeError, msg, sizeof(msg), &msgLen))) {
    return "no diagnostic available";
  }
  return "[" + std::string(reinterpret_cast<char *>(sqlState)) + "] " +
         std::string(reinterpret_cast<char *>(msg));
}

ODBCConnection::ODBCConnection(const std::string &connectionString) {
  SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &env_);
  if (!SQL_SUCCEEDED(ret)) {
    env_ = SQL_NULL_HANDLE;
    lastError_ = "Failed to allocate environment handle";
    return;
  }

  ret = SQLSetEnvAttr(env_, SQL_ATTR_ODBC_VERSION, (SQLPOINTER)SQL_OV_ODBC3, 0);
  if (!SQL_SUCCEEDED(ret)) {
    lastError_ = "Failed to set ODBC version";
    release();
    return;
  }

  ret = SQLAllocHandle(SQL_HANDLE_DBC, env_, &dbc_);
  if (!SQL_SUCCEEDED(ret)) {
    dbc_ = SQL_NULL_HANDLE;
    lastError_ = "Failed to allocate connection handle";
    release();
    return;
  }

  SQLCHAR outConnStr[RelayDefaults::BUFFER_SIZE];
  SQLSMALLINT outConnStrLen;
  ret = SQLDriverConnect(dbc_, nullptr, (SQLCHAR *)connectionString.c_str(),
                         SQL_NTS, outConnStr, sizeof(outConnStr),
                         &outConnStrLen, SQL_DRIVER_NOPROMPT);
  if (!SQL_SUCCEEDED(ret)) {
    lastError_ = odbcDiagnostic(SQL_HANDLE_DBC, dbc_);
    SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
    dbc_ = SQL_NULL_HANDLE;
    release();
    return;
  }

  valid_ = true;
}

ODBCConnection::~ODBCConnection() { release(); }

void ODBCConnection::release() {
  if (dbc_ != SQL_NULL_HANDLE) {
    if (valid_)
      SQLDisconnect(dbc_);
    SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
    dbc_ = SQL_NULL_HANDLE;
  }
  if (env_ != SQL_NULL_HANDLE) {
    SQLFreeHandle(SQL_HANDLE_ENV, env_);
    env_ = SQL_NULL_HANDLE;
  }
  valid_ = false;
}

ODBCConnection::ODBCConnection(ODBCConnection &&other) noexcept
    : env_(other.env_), dbc_(other.dbc_), valid_(other.valid_),
      lastError_(std::move(other.lastError_)) {
  other.env_ = SQL_NULL_HANDLE;
  other.dbc_ = SQL_NULL_HANDLE;
  other.valid_ = false;
}

ODBCConnection &ODBCConnection::operator=(ODBCConnection &&other) noexcept {
  if (this != &other) {
    release();

    env_ = other.env_;
    dbc_ = other.dbc_;
    valid_ = other.valid_;
    lastError_ = std::move(other.lastError_);

    other.env_ = SQL_NULL_HANDLE;
    other.dbc_ = SQL_NULL_HANDLE;
    other.valid_ = false;
  }
  return *this;
}

ODBCStatement::ODBCStatement(SQLHDBC dbc) {
  SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_STMT, dbc, &stmt_);
  if (!SQL_SUCCEEDED(ret)) {
    stmt_ = SQL_NULL_HANDLE;
    throwOdbcError(SQL_HANDLE_DBC, dbc, "Failed to allocate statement handle");
  }
}

ODBCStatement::~ODBCStatement() {
  if (stmt_ != SQL_NULL_HANDLE) {
    SQLFreeHandle(SQL_HANDLE_STMT, stmt_);
  }
}

MSSQLRowReader::MSSQLRowReader(std::unique_ptr<ODBCStatement> stmt,
                               std::vector<std::string> columns,
                               std::vector<ColumnType> types)
    : stmt_(std::move(stmt)), columns_(std::move(columns)),
      types_(std::move(types)) {}

json MSSQLRowReader::readCell(SQLUSMALLINT column, ColumnType type) {
  std::string value;
  char buffer[RelayDefaults::BUFFER_SIZE];

  while (true) {
    SQLLEN indicator = 0;
    SQLRETURN ret = SQLGetData(stmt_->get(), column, SQL_C_CHAR, buffer,
                               sizeof(buffer), &indicator);
    if (ret == SQL_NO_DATA)
      break;
    if (!SQL_SUCCEEDED(ret)) {
      throwOdbcError(SQL_HANDLE_STMT, stmt_->get(),
                     "Failed to read column " + columns_[column - 1]);
    }
    if (indicator == SQL_NULL_DATA)
      return json(nullptr);

    size_t chunk = (indicator == SQL_NO_TOTAL ||
                    indicator >= static_cast<SQLLEN>(sizeof(buffer)))
                       ? sizeof(buffer) - 1
                       : static_cast<size_t>(indicator);
    value.append(buffer, chunk);
    if (ret == SQL_SUCCESS)
      break;
  }

  try {
    switch (type) {
    case ColumnType::Integer:
      return json(static_cast<int64_t>(std::stoll(value)));
    case ColumnType::Float:
      return json(std::stod(value));
    case ColumnType::Boolean:
      return json(value == "1");
    default:
      return json(value);
    }
  } catch (const std::exception &) {
    return json(value);
  }
}

size_t MSSQLRowReader::readBatch(size_t maxRows, std::vector<Row> &rows) {
  size_t appended = 0;
  while (!exhausted_ && appended < maxRows) {
    SQLRETURN ret = SQLFetch(stmt_->get());
    if (ret == SQL_NO_DATA) {
      exhausted_ = true;
      break;
    }
    if (!SQL_SUCCEEDED(ret)) {
      throwOdbcError(SQL_HANDLE_STMT, stmt_->get(), "SQLFetch failed");
    }

    Row row;
    row.reserve(columns_.size());
    for (size_t i = 0; i < columns_.size(); ++i) {
      row.push_back(readCell(static_cast<SQLUSMALLINT>(i + 1), types_[i]));
    }
    rows.push_back(std::move(row));
    ++appended;
  }
  return appended;
}

MSSQLConnection::MSSQLConnection(std::string connectionString)
    : connectionString_(std::move(connectionString)),
      timeoutSeconds_(RelayDefaults::DEFAULT_TIMEOUT_SECONDS) {
  conn_ = createConnection(connectionString_);
}

MSSQLConnection::~MSSQLConnection() {
  if (inTransaction_) {
    try {
      rollback();
    } catch (const std::exception &e) {
      Logger::warning(LogCategory::DATABASE, "MSSQLConnection",
                      "Rollback on close failed: " + std::string(e.what()));
    }
  }
}

// Three attempts with 100ms, 200ms backoff between them.
std::unique_ptr<ODBCConnection>
MSSQLConnection::createConnection(const std::string &connectionString) {
  std::string lastError;
  for (int attempt = 1; attempt <= RelayDefaults::ODBC_CONNECT_RETRIES;
       ++attempt) {
    auto conn = std::make_unique<ODBCConnection>(connectionString);
    if (conn->isValid()) {
      if (attempt > 1) {
        Logger::info(LogCategory::DATABASE, "MSSQLConnection",
                     "Connection successful on attempt " +
                         std::to_string(attempt));
      }
      return conn;
    }
    lastError = conn->lastError();

    if (attempt < RelayDefaults::ODBC_CONNECT_RETRIES) {
      int backoffMs = RelayDefaults::ODBC_INITIAL_BACKOFF_MS * (1 << (attempt - 1));
      Logger::warning(LogCategory::DATABASE, "MSSQLConnection",
                      "Connection attempt " + std::to_string(attempt) +
                          " failed, retrying in " + std::to_string(backoffMs) +
                          "ms...");
      std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
    }
  }

  throw ConnectivityError(
      "Failed to connect to SQL Server after " +
      std::to_string(RelayDefaults::ODBC_CONNECT_RETRIES) +
      " attempts: " + StringUtils::redactSecrets(lastError));
}

std::unique_ptr<ODBCStatement> MSSQLConnection::prepareStatement() {
  auto stmt = std::make_unique<ODBCStatement>(conn_->getDbc());
  if (timeoutSeconds_ > 0) {
    SQLSetStmtAttr(stmt->get(), SQL_ATTR_QUERY_TIMEOUT,
                   (SQLPOINTER)(SQLULEN)timeoutSeconds_, 0);
  }
  return stmt;
}

size_t MSSQLConnection::executeNonQuery(const std::string &sql) {
  auto stmt = prepareStatement();
  SQLRETURN ret = SQLExecDirect(stmt->get(), (SQLCHAR *)sql.c_str(), SQL_NTS);
  if (ret == SQL_NO_DATA)
    return 0;
  if (!SQL_SUCCEEDED(ret)) {
    throwOdbcError(SQL_HANDLE_STMT, stmt->get(), "Statement failed");
  }

  SQLLEN affected = 0;
  if (!SQL_SUCCEEDED(SQLRowCount(stmt->get(), &affected)) || affected < 0)
    return 0;
  return static_cast<size_t>(affected);
}

std::unique_ptr<IRowReader>
MSSQLConnection::openReader(const std::string &query) {
  auto stmt = prepareStatement();
  SQLRETURN ret =
      SQLExecDirect(stmt->get(), (SQLCHAR *)query.c_str(), SQL_NTS);
  if (!SQL_SUCCEEDED(ret)) {
    throwOdbcError(SQL_HANDLE_STMT, stmt->get(), "Source query failed");
  }

  SQLSMALLINT numCols = 0;
  ret = SQLNumResultCols(stmt->get(), &numCols);
  if (!SQL_SUCCEEDED(ret) || numCols <= 0) {
    throw DataError("Source query did not return a result set");
  }

  std::vector<std::string> columns;
  std::vector<ColumnType> types;
  for (SQLUSMALLINT i = 1; i <= static_cast<SQLUSMALLINT>(numCols); ++i) {
    SQLCHAR name[256] = {0};
    SQLSMALLINT nameLen = 0;
    SQLSMALLINT dataType = 0;
    SQLULEN columnSize = 0;
    SQLSMALLINT decimalDigits = 0;
    SQLSMALLINT nullable = 0;
    ret = SQLDescribeCol(stmt->get(), i, name, sizeof(name), &nameLen,
                         &dataType, &columnSize, &decimalDigits, &nullable);
    if (!SQL_SUCCEEDED(ret)) {
      throwOdbcError(SQL_HANDLE_STMT, stmt->get(), "SQLDescribeCol failed");
    }
    columns.emplace_back(reinterpret_cast<char *>(name));
    types.push_back(columnTypeFromOdbc(dataType));
  }

  return std::make_unique<MSSQLRowReader>(std::move(stmt), std::move(columns),
                                          std::move(types));
}

void MSSQLConnection::beginTransaction() {
  if (inTransaction_) {
    throw DataError("A transaction is already active on this connection");
  }
  SQLRETURN ret = SQLSetConnectAttr(conn_->getDbc(), SQL_ATTR_AUTOCOMMIT,
                                    (SQLPOINTER)SQL_AUTOCOMMIT_OFF,
                                    SQL_IS_UINTEGER);
  if (!SQL_SUCCEEDED(ret)) {
    throwOdbcError(SQL_HANDLE_DBC, conn_->getDbc(),
                   "Failed to begin transaction");
  }
  inTransaction_ = true;
}

void MSSQLConnection::endTransaction(SQLSMALLINT completionType) {
  SQLRETURN ret = SQLEndTran(SQL_HANDLE_DBC, conn_->getDbc(), completionType);
  inTransaction_ = false;
  SQLSetConnectAttr(conn_->getDbc(), SQL_ATTR_AUTOCOMMIT,
                    (SQLPOINTER)SQL_AUTOCOMMIT_ON, SQL_IS_UINTEGER);
  if (!SQL_SUCCEEDED(ret)) {
    throwOdbcError(SQL_HANDLE_DBC, conn_->getDbc(),
                   completionType == SQL_COMMIT ? "Commit failed"
                                                : "Rollback failed");
  }
}

void MSSQLConnection::commit() {
  if (!inTransaction_) {
    throw DataError("Commit called without an active transaction");
  }
  endTransaction(SQL_COMMIT);
}

void MSSQLConnection::rollback() {
  if (!inTransaction_)
    return;
  endTransaction(SQL_ROLLBACK);
}

std::string MSSQLConnection::formatLiteral(const json &value) {
  if (value.is_null())
    return "NULL";
  if (value.is_boolean())
    return value.get<bool>() ? "1" : "0";
  if (value.is_number())
    return value.dump();
  if (value.is_string())
    return "N'" + SqlValidator::escapeStringLiteral(value.get<std::string>()) +
           "'";
  return "N'" + SqlValidator::escapeStringLiteral(value.dump()) + "'";
}

std::string MSSQLConnection::nativeType(ColumnType type) {
  switch (type) {
  case ColumnType::Integer:
    return "BIGINT";
  case ColumnType::Float:
    return "FLOAT";
  case ColumnType::Boolean:
    return "BIT";
  case ColumnType::Timestamp:
    return "DATETIME2";
  case ColumnType::Text:
  default:
    return "NVARCHAR(MAX)";
  }
}

// One INSERT per MSSQL_MAX_ROWS_PER_INSERT rows, the engine's limit for a
// VALUES list.
size_t MSSQLConnection::bulkInsert(const std::string &table,
                                   const std::vector<std::string> &columns,
                                   const std::vector<Row> &rows) {
  if (rows.empty())
    return 0;
  if (columns.empty())
    throw DataError("bulkInsert into " + table + " without columns");

  std::ostringstream header;
  header << "INSERT INTO " << tableIdentifier(table) << " (";
  for (size_t i = 0; i < columns.size(); ++i) {
    if (i > 0)
      header << ", ";
    header << columnIdentifier(columns[i]);
  }
  header << ") VALUES ";
  const std::string prefix = header.str();

  size_t written = 0;
  for (size_t start = 0; start < rows.size();
       start += RelayDefaults::MSSQL_MAX_ROWS_PER_INSERT) {
    size_t end =
        std::min(start + RelayDefaults::MSSQL_MAX_ROWS_PER_INSERT, rows.size());
    std::ostringstream sql;
    sql << prefix;
    for (size_t r = start; r < end; ++r) {
      const Row &row = rows[r];
      if (row.size() != columns.size()) {
        throw DataError("Row " + std::to_string(r) + " has " +
                        std::to_string(row.size()) + " values, expected " +
                        std::to_string(columns.size()));
      }
      if (r > start)
        sql << ", ";
      sql << "(";
      for (size_t c = 0; c < row.size(); ++c) {
        if (c > 0)
          sql << ", ";
        sql << formatLiteral(row[c]);
      }
      sql << ")";
    }
    executeNonQuery(sql.str());
    written += end - start;
  }
  return written;
}

size_t MSSQLConnection::deleteAll(const std::string &table) {
  return executeNonQuery("DELETE FROM " + tableIdentifier(table));
}

size_t MSSQLConnection::deleteWhere(const std::string &table,
                                    const std::string &predicate) {
  if (!SqlValidator::isSafePredicate(predicate)) {
    throw DataError("Refusing unsafe delete predicate");
  }
  return executeNonQuery("DELETE FROM " + tableIdentifier(table) + " WHERE " +
                         predicate);
}

size_t MSSQLConnection::deleteMatching(const std::string &table,
                                       const std::vector<std::string> &keyColumns,
                                       const std::vector<Row> &keyRows) {
  if (keyRows.empty())
    return 0;
  if (keyColumns.empty())
    throw DataError("deleteMatching on " + table + " without key columns");

  std::vector<std::string> quotedKeys;
  for (const auto &key : keyColumns) {
    quotedKeys.push_back(columnIdentifier(key));
  }

  const size_t chunkSize = RelayDefaults::MSSQL_MAX_ROWS_PER_INSERT / 2;
  size_t deleted = 0;
  for (size_t start = 0; start < keyRows.size(); start += chunkSize) {
    size_t end = std::min(start + chunkSize, keyRows.size());
    std::ostringstream sql;
    sql << "DELETE FROM " << tableIdentifier(table) << " WHERE ";
    for (size_t r = start; r < end; ++r) {
      if (r > start)
        sql << " OR ";
      sql << "(";
      for (size_t k = 0; k < quotedKeys.size(); ++k) {
        if (k > 0)
          sql << " AND ";
        const json &value = keyRows[r].at(k);
        if (value.is_null())
          sql << quotedKeys[k] << " IS NULL";
        else
          sql << quotedKeys[k] << " = " << formatLiteral(value);
      }
      sql << ")";
    }
    deleted += executeNonQuery(sql.str());
  }
  return deleted;
}

void MSSQLConnection::truncate(const std::string &table) {
  executeNonQuery("TRUNCATE TABLE " + tableIdentifier(table));
}

bool MSSQLConnection::tableExists(const std::string &table) {
  std::string safeName = tableIdentifier(table);
  auto reader = openReader(
      "SELECT CASE WHEN OBJECT_ID(N'" +
      SqlValidator::escapeStringLiteral(safeName) +
      "', N'U') IS NULL THEN 0 ELSE 1 END");
  std::vector<Row> rows;
  reader->readBatch(1, rows);
  return !rows.empty() && !rows[0].empty() && rows[0][0].is_number() &&
         rows[0][0].get<int64_t>() == 1;
}

void MSSQLConnection::createTable(const std::string &table,
                                  const std::vector<ColumnDefinition> &columns) {
  if (columns.empty())
    throw DataError("Cannot create table " + table + " without columns");

  auto parts = SqlValidator::splitTableName(table);
  if (!parts.first.empty()) {
    executeNonQuery("IF NOT EXISTS (SELECT * FROM sys.schemas WHERE name = N'" +
                    parts.first + "') EXEC('CREATE SCHEMA " +
                    SqlValidator::quoteMssqlIdentifier(parts.first) + "')");
  }

  std::ostringstream ddl;
  ddl << "CREATE TABLE " << tableIdentifier(table) << " (";
  for (size_t i = 0; i < columns.size(); ++i) {
    const ColumnDefinition &column = columns[i];
    if (i > 0)
      ddl << ", ";
    ddl << columnIdentifier(column.name) << " " << nativeType(column.type);
    if (column.identity) {
      ddl << " IDENTITY(1,1) NOT NULL PRIMARY KEY";
      continue;
    }
    ddl << (column.nullable ? " NULL" : " NOT NULL");
    if (column.defaultCurrentTimestamp)
      ddl << " DEFAULT SYSUTCDATETIME()";
  }
  ddl << ")";

  executeNonQuery(ddl.str());
  Logger::info(LogCategory::DATABASE, "MSSQLConnection::createTable",
               "Created table " + table);
}
