#include "engines/postgres_connection.h"
#include "core/logger.h"
#include "core/relay_defaults.h"
#include "core/relay_errors.h"
#include "utils/sql_validator.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <atomic>
#include <sstream>

namespace {

std::atomic<unsigned long> cursorCounter{0};

std::string tableIdentifier(const std::string &table) {
  try {
    return SqlValidator::safePostgresTableName(table);
  } catch (const std::invalid_argument &e) {
    throw DataError(e.what());
  }
}

std::string columnIdentifier(const std::string &column) {
  if (!SqlValidator::isValidColumnName(column)) {
    throw DataError("Invalid column name: " + column);
  }
  return SqlValidator::quotePostgresIdentifier(column);
}

json convertField(const pqxx::field &field, ColumnType type) {
  if (field.is_null())
    return json(nullptr);

  std::string value = field.c_str();
  try {
    switch (type) {
    case ColumnType::Integer:
      return json(static_cast<int64_t>(std::stoll(value)));
    case ColumnType::Float:
      return json(std::stod(value));
    case ColumnType::Boolean:
      return json(value == "t" || value == "true");
    default:
      return json(value);
    }
  } catch (const std::exception &) {
    return json(value);
  }
}

} // namespace

PostgresRowReader::PostgresRowReader(pqxx::connection &conn,
                                     const std::string &query)
    : cursorName_("datarelay_reader_" + std::to_string(++cursorCounter)) {
  try {
    txn_ = std::make_unique<pqxx::work>(conn);

    pqxx::result shape =
        txn_->exec("SELECT * FROM (" + query + ") AS datarelay_source LIMIT 0");
    for (pqxx::row_size_type i = 0; i < shape.columns(); ++i) {
      columns_.emplace_back(shape.column_name(i));
      types_.push_back(
          PostgresConnection::columnTypeFromOid(shape.column_type(i)));
    }

    txn_->exec("DECLARE " + cursorName_ + " NO SCROLL CURSOR FOR " + query);
  } catch (const pqxx::broken_connection &e) {
    throw ConnectivityError("PostgreSQL connection lost: " +
                            std::string(e.what()));
  } catch (const std::exception &e) {
    throw DataError("Source query failed: " + std::string(e.what()));
  }
}

size_t PostgresRowReader::readBatch(size_t maxRows, std::vector<Row> &rows) {
  if (exhausted_ || maxRows == 0)
    return 0;

  pqxx::result batch;
  try {
    batch = txn_->exec("FETCH FORWARD " + std::to_string(maxRows) + " FROM " +
                       cursorName_);
  } catch (const pqxx::broken_connection &e) {
    throw ConnectivityError("PostgreSQL connection lost: " +
                            std::string(e.what()));
  } catch (const std::exception &e) {
    throw DataError("FETCH failed: " + std::string(e.what()));
  }

  for (const auto &dbRow : batch) {
    Row row;
    row.reserve(columns_.size());
    for (size_t i = 0; i < columns_.size(); ++i) {
      row.push_back(
          convertField(dbRow[static_cast<pqxx::row_size_type>(i)], types_[i]));
    }
    rows.push_back(std::move(row));
  }

  if (batch.size() < maxRows)
    exhausted_ = true;
  return batch.size();
}

PostgresConnection::PostgresConnection(const std::string &connectionString) {
  try {
    conn_ = std::make_unique<pqxx::connection>(connectionString);
  } catch (const std::exception &e) {
    throw ConnectivityError("Failed to connect to PostgreSQL: " +
                            StringUtils::redactSecrets(e.what()));
  }
  if (!conn_->is_open()) {
    throw ConnectivityError("PostgreSQL connection is not open");
  }
}

PostgresConnection::~PostgresConnection() {
  if (txn_) {
    try {
      txn_->abort();
    } catch (const std::exception &e) {
      Logger::warning(LogCategory::DATABASE, "PostgresConnection",
                      "Abort on close failed: " + std::string(e.what()));
    }
    txn_.reset();
  }
}

ColumnType PostgresConnection::columnTypeFromOid(pqxx::oid type) {
  switch (type) {
  case 20:
  case 21:
  case 23:
    return ColumnType::Integer;
  case 700:
  case 701:
    return ColumnType::Float;
  case 16:
    return ColumnType::Boolean;
  case 1082:
  case 1083:
  case 1114:
  case 1184:
    return ColumnType::Timestamp;
  default:
    return ColumnType::Text;
  }
}

std::string PostgresConnection::nativeType(ColumnType type) {
  switch (type) {
  case ColumnType::Integer:
    return "BIGINT";
  case ColumnType::Float:
    return "DOUBLE PRECISION";
  case ColumnType::Boolean:
    return "BOOLEAN";
  case ColumnType::Timestamp:
    return "TIMESTAMP";
  case ColumnType::Text:
  default:
    return "TEXT";
  }
}

// Runs inside the open transaction when there is one, otherwise in its own
// short transaction.
pqxx::result PostgresConnection::execute(const std::string &sql) {
  try {
    if (txn_) {
      return txn_->exec(sql);
    }
    pqxx::work txn(*conn_);
    pqxx::result result = txn.exec(sql);
    txn.commit();
    return result;
  } catch (const pqxx::broken_connection &e) {
    txn_.reset();
    throw ConnectivityError("PostgreSQL connection lost: " +
                            std::string(e.what()));
  } catch (const pqxx::sql_error &e) {
    throw DataError("Statement failed: " + std::string(e.what()));
  } catch (const std::exception &e) {
    throw DataError("Statement failed: " + std::string(e.what()));
  }
}

std::unique_ptr<IRowReader>
PostgresConnection::openReader(const std::string &query) {
  if (txn_) {
    throw DataError("Cannot open a reader while a write transaction is active");
  }
  return std::make_unique<PostgresRowReader>(*conn_, query);
}

void PostgresConnection::beginTransaction() {
  if (txn_) {
    throw DataError("A transaction is already active on this connection");
  }
  try {
    txn_ = std::make_unique<pqxx::work>(*conn_);
  } catch (const pqxx::broken_connection &e) {
    throw ConnectivityError("PostgreSQL connection lost: " +
                            std::string(e.what()));
  } catch (const std::exception &e) {
    throw DataError("Failed to begin transaction: " + std::string(e.what()));
  }
}

void PostgresConnection::commit() {
  if (!txn_) {
    throw DataError("Commit called without an active transaction");
  }
  std::unique_ptr<pqxx::work> txn = std::move(txn_);
  try {
    txn->commit();
  } catch (const pqxx::broken_connection &e) {
    throw ConnectivityError("PostgreSQL connection lost during commit: " +
                            std::string(e.what()));
  } catch (const std::exception &e) {
    throw DataError("Commit failed: " + std::string(e.what()));
  }
}

void PostgresConnection::rollback() {
  if (!txn_)
    return;
  std::unique_ptr<pqxx::work> txn = std::move(txn_);
  try {
    txn->abort();
  } catch (const std::exception &e) {
    throw DataError("Rollback failed: " + std::string(e.what()));
  }
}

std::string PostgresConnection::formatLiteral(const json &value) const {
  if (value.is_null())
    return "NULL";
  if (value.is_boolean())
    return value.get<bool>() ? "TRUE" : "FALSE";
  if (value.is_number())
    return value.dump();
  if (value.is_string())
    return conn_->quote(value.get<std::string>());
  return conn_->quote(value.dump());
}

size_t PostgresConnection::bulkInsert(const std::string &table,
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
       start += RelayDefaults::POSTGRES_MAX_ROWS_PER_INSERT) {
    size_t end = std::min(start + RelayDefaults::POSTGRES_MAX_ROWS_PER_INSERT,
                          rows.size());
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
    execute(sql.str());
    written += end - start;
  }
  return written;
}

size_t PostgresConnection::deleteAll(const std::string &table) {
  return execute("DELETE FROM " + tableIdentifier(table)).affected_rows();
}

size_t PostgresConnection::deleteWhere(const std::string &table,
                                       const std::string &predicate) {
  if (!SqlValidator::isSafePredicate(predicate)) {
    throw DataError("Refusing unsafe delete predicate");
  }
  return execute("DELETE FROM " + tableIdentifier(table) + " WHERE " +
                 predicate)
      .affected_rows();
}

size_t PostgresConnection::deleteMatching(
    const std::string &table, const std::vector<std::string> &keyColumns,
    const std::vector<Row> &keyRows) {
  if (keyRows.empty())
    return 0;
  if (keyColumns.empty())
    throw DataError("deleteMatching on " + table + " without key columns");

  std::vector<std::string> quotedKeys;
  for (const auto &key : keyColumns) {
    quotedKeys.push_back(columnIdentifier(key));
  }

  std::ostringstream sql;
  sql << "DELETE FROM " << tableIdentifier(table) << " WHERE ";
  for (size_t r = 0; r < keyRows.size(); ++r) {
    if (r > 0)
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
  return execute(sql.str()).affected_rows();
}

void PostgresConnection::truncate(const std::string &table) {
  execute("TRUNCATE TABLE " + tableIdentifier(table));
}

bool PostgresConnection::tableExists(const std::string &table) {
  pqxx::result result =
      execute("SELECT to_regclass(" + conn_->quote(tableIdentifier(table)) +
              ") IS NOT NULL");
  return !result.empty() && std::string(result[0][0].c_str()) == "t";
}

void PostgresConnection::createTable(
    const std::string &table, const std::vector<ColumnDefinition> &columns) {
  if (columns.empty())
    throw DataError("Cannot create table " + table + " without columns");

  auto parts = SqlValidator::splitTableName(table);
  if (!parts.first.empty()) {
    execute("CREATE SCHEMA IF NOT EXISTS " +
            SqlValidator::quotePostgresIdentifier(parts.first));
  }

  std::ostringstream ddl;
  ddl << "CREATE TABLE " << tableIdentifier(table) << " (";
  for (size_t i = 0; i < columns.size(); ++i) {
    const ColumnDefinition &column = columns[i];
    if (i > 0)
      ddl << ", ";
    ddl << columnIdentifier(column.name) << " " << nativeType(column.type);
    if (column.identity) {
      ddl << " GENERATED BY DEFAULT AS IDENTITY PRIMARY KEY";
      continue;
    }
    if (!column.nullable)
      ddl << " NOT NULL";
    if (column.defaultCurrentTimestamp)
      ddl << " DEFAULT NOW()";
  }
  ddl << ")";

  execute(ddl.str());
  Logger::info(LogCategory::DATABASE, "PostgresConnection::createTable",
               "Created table " + table);
}

void PostgresConnection::setStatementTimeout(int seconds) {
  if (seconds < 0)
    return;
  try {
    pqxx::nontransaction ntx(*conn_);
    ntx.exec("SET statement_timeout = " + std::to_string(seconds * 1000));
  } catch (const std::exception &e) {
    throw DataError("Failed to set statement timeout: " +
                    std::string(e.what()));
  }
}
