#ifndef MSSQL_CONNECTION_H
#define MSSQL_CONNECTION_H

#include "engines/relational_connection.h"
#include <memory>
#include <sql.h>
#include <sqlext.h>
#include <string>

// Owns an ODBC environment and connection handle pair. A failed connect
// leaves isValid() false and the driver diagnostic in lastError().
class ODBCConnection {
  SQLHENV env_{SQL_NULL_HANDLE};
  SQLHDBC dbc_{SQL_NULL_HANDLE};
  bool valid_{false};
  std::string lastError_;

public:
  explicit ODBCConnection(const std::string &connectionString);
  ~ODBCConnection();

  ODBCConnection(const ODBCConnection &) = delete;
  ODBCConnection &operator=(const ODBCConnection &) = delete;

  ODBCConnection(ODBCConnection &&other) noexcept;
  ODBCConnection &operator=(ODBCConnection &&other) noexcept;

  SQLHDBC getDbc() const { return dbc_; }
  bool isValid() const { return valid_; }
  const std::string &lastError() const { return lastError_; }

private:
  void release();
};

class ODBCStatement {
  SQLHSTMT stmt_{SQL_NULL_HANDLE};

public:
  explicit ODBCStatement(SQLHDBC dbc);
  ~ODBCStatement();

  ODBCStatement(const ODBCStatement &) = delete;
  ODBCStatement &operator=(const ODBCStatement &) = delete;

  SQLHSTMT get() const { return stmt_; }
};

std::string odbcDiagnostic(SQLSMALLINT handleType, SQLHANDLE handle);

class MSSQLRowReader : public IRowReader {
  std::unique_ptr<ODBCStatement> stmt_;
  std::vector<std::string> columns_;
  std::vector<ColumnType> types_;
  bool exhausted_{false};

public:
  MSSQLRowReader(std::unique_ptr<ODBCStatement> stmt,
                 std::vector<std::string> columns,
                 std::vector<ColumnType> types);

  const std::vector<std::string> &columns() const override { return columns_; }
  const std::vector<ColumnType> &columnTypes() const override {
    return types_;
  }
  size_t readBatch(size_t maxRows, std::vector<Row> &rows) override;

private:
  json readCell(SQLUSMALLINT column, ColumnType type);
};

class MSSQLConnection : public IRelationalConnection {
  std::string connectionString_;
  std::unique_ptr<ODBCConnection> conn_;
  bool inTransaction_{false};
  int timeoutSeconds_;

public:
  // Connects immediately with retry; throws ConnectivityError when every
  // attempt fails.
  explicit MSSQLConnection(std::string connectionString);
  ~MSSQLConnection() override;

  std::string engineName() const override { return "mssql"; }

  std::unique_ptr<IRowReader> openReader(const std::string &query) override;

  void beginTransaction() override;
  void commit() override;
  void rollback() override;
  bool inTransaction() const override { return inTransaction_; }

  size_t bulkInsert(const std::string &table,
                    const std::vector<std::string> &columns,
                    const std::vector<Row> &rows) override;
  size_t deleteAll(const std::string &table) override;
  size_t deleteWhere(const std::string &table,
                     const std::string &predicate) override;
  size_t deleteMatching(const std::string &table,
                        const std::vector<std::string> &keyColumns,
                        const std::vector<Row> &keyRows) override;
  void truncate(const std::string &table) override;

  bool tableExists(const std::string &table) override;
  void createTable(const std::string &table,
                   const std::vector<ColumnDefinition> &columns) override;

  void setStatementTimeout(int seconds) override { timeoutSeconds_ = seconds; }

  static std::string formatLiteral(const json &value);
  static std::string nativeType(ColumnType type);

private:
  static std::unique_ptr<ODBCConnection>
  createConnection(const std::string &connectionString);
  std::unique_ptr<ODBCStatement> prepareStatement();
  size_t executeNonQuery(const std::string &sql);
  void endTransaction(SQLSMALLINT completionType);
};

#endif
