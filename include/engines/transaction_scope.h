#ifndef TRANSACTION_SCOPE_H
#define TRANSACTION_SCOPE_H

#include "core/logger.h"
#include "engines/relational_connection.h"
#include <exception>

// Opens a transaction on construction and rolls it back on destruction unless
// commit() was reached.
class TransactionScope {
  IRelationalConnection &connection_;
  bool finished_ = false;

public:
  explicit TransactionScope(IRelationalConnection &connection)
      : connection_(connection) {
    connection_.beginTransaction();
  }

  ~TransactionScope() {
    if (!finished_)
      rollback();
  }

  TransactionScope(const TransactionScope &) = delete;
  TransactionScope &operator=(const TransactionScope &) = delete;

  void commit() {
    connection_.commit();
    finished_ = true;
  }

  // Returns false when the rollback itself failed.
  bool rollback() {
    if (finished_)
      return true;
    finished_ = true;
    if (!connection_.inTransaction())
      return true;
    try {
      connection_.rollback();
      return true;
    } catch (const std::exception &e) {
      Logger::error(LogCategory::DATABASE, "TransactionScope::rollback",
                    "Rollback failed on " + connection_.engineName() + ": " +
                        std::string(e.what()));
      return false;
    }
  }
};

#endif
