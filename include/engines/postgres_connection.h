#ifndef POSTGRES_CONNECTION_H
#define POSTGRES_CONNECTION_H

#include "engines/relational_connection.h"
#include <memory>
#include <pqxx/pqxx>
#include <string>

// Streams a query through a server-side cursor. The reader owns the
// connection's only transaction until it is destroyed, so it must not
// outlive the PostgresConnection that created it.
class PostgresRowReader : public IRowReader {
  std::unique_ptr<pqxx::work> txn_;
  std::string cursorName_;
  std::vector<std::string> columns_;
  std::vector<ColumnType> types_;
  bool exhausted_{false};

public:
  PostgresRowReader(pqxx::connection &conn, const std::string &query);

  const std::vector<std::string> &columns() const override { return columns_; }
  const std::vector<ColumnType> &columnTypes() const override {
    return types_;
  }
  size_t readBatch(size_t maxRows, std::vector<Row> &rows) override;
};

class PostgresConnection : public IRelationalConnection {
  std::unique_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> txn_;

public:
  // Throws ConnectivityError when the server cannot be reached.
  explicit PostgresConnection(const std::string &connectionString);
  ~PostgresConnection() override;

  std::string engineName() const override { return "postgres"; }

  std::unique_ptr<IRowReader> openReader(const std::string &query) override;

  void beginTransaction() override;
  void commit() override;
  void rollback() override;
  bool inTransaction() const override { return txn_ != nullptr; }

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

  void setStatementTimeout(int seconds) override;

  static std::string nativeType(ColumnType type);
  static ColumnType columnTypeFromOid(pqxx::oid type);

private:
  std::string formatLiteral(const json &value) const;
  pqxx::result execute(const std::string &sql);
};

#endif
