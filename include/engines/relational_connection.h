#ifndef RELATIONAL_CONNECTION_H
#define RELATIONAL_CONNECTION_H

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

// One row as JSON scalars (null, bool, integer, float, string), positionally
// aligned with the column list it travels with.
using Row = std::vector<json>;

// Engine-neutral column types; each connection maps them to native DDL.
enum class ColumnType { Integer, Float, Boolean, Text, Timestamp };

std::string columnTypeToString(ColumnType type);

struct ColumnDefinition {
  std::string name;
  ColumnType type = ColumnType::Text;
  bool nullable = true;
  bool identity = false;
  bool defaultCurrentTimestamp = false;
};

class IRowReader {
public:
  virtual ~IRowReader() = default;

  virtual const std::vector<std::string> &columns() const = 0;
  virtual const std::vector<ColumnType> &columnTypes() const = 0;
  // Appends up to maxRows rows; returns the number appended. Zero means the
  // result set is exhausted.
  virtual size_t readBatch(size_t maxRows, std::vector<Row> &rows) = 0;
};

// A live connection to a relational store. Every method throws DataError on
// statement failure and ConnectivityError when the link is gone.
class IRelationalConnection {
public:
  virtual ~IRelationalConnection() = default;

  virtual std::string engineName() const = 0;

  virtual std::unique_ptr<IRowReader> openReader(const std::string &query) = 0;

  virtual void beginTransaction() = 0;
  virtual void commit() = 0;
  virtual void rollback() = 0;
  virtual bool inTransaction() const = 0;

  // Writes all rows through the engine's multi-row load path. Returns the
  // number of rows written.
  virtual size_t bulkInsert(const std::string &table,
                            const std::vector<std::string> &columns,
                            const std::vector<Row> &rows) = 0;

  virtual size_t deleteAll(const std::string &table) = 0;
  virtual size_t deleteWhere(const std::string &table,
                             const std::string &predicate) = 0;
  // Deletes every target row whose keyColumns equal one of keyRows.
  virtual size_t deleteMatching(const std::string &table,
                                const std::vector<std::string> &keyColumns,
                                const std::vector<Row> &keyRows) = 0;
  virtual void truncate(const std::string &table) = 0;

  virtual bool tableExists(const std::string &table) = 0;
  virtual void createTable(const std::string &table,
                           const std::vector<ColumnDefinition> &columns) = 0;

  virtual void setStatementTimeout(int seconds) = 0;
};

#endif
