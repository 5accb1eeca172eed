#ifndef MONGODB_SOURCE_H
#define MONGODB_SOURCE_H

#include "engines/document_source.h"
#include <bson/bson.h>
#include <mongoc/mongoc.h>
#include <string>

class MongoDocumentSource : public IDocumentSource {
  std::string databaseName_;
  mongoc_client_t *client_{nullptr};
  mongoc_collection_t *collection_{nullptr};
  mongoc_cursor_t *cursor_{nullptr};

public:
  // Connects and pings the database named in the URI. Throws
  // ConnectivityError on a bad URI, a missing database name or a failed ping.
  explicit MongoDocumentSource(const std::string &connectionString);
  ~MongoDocumentSource() override;

  MongoDocumentSource(const MongoDocumentSource &) = delete;
  MongoDocumentSource &operator=(const MongoDocumentSource &) = delete;

  void open(const DocumentQuery &query) override;
  size_t readBatch(size_t maxDocuments, std::vector<json> &documents) override;

  const std::string &databaseName() const { return databaseName_; }

private:
  void closeCursor();
};

#endif
