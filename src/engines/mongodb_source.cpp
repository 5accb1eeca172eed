#include "engines/mongodb_source.h"
#include "core/logger.h"
#include "core/relay_defaults.h"
#include "core/relay_errors.h"
#include "utils/string_utils.h"
#include <mutex>

namespace {

bson_t *bsonFromJson(const json &value, const std::string &what) {
  std::string text = value.dump();
  bson_error_t error;
  bson_t *doc = bson_new_from_json(
      reinterpret_cast<const uint8_t *>(text.c_str()),
      static_cast<ssize_t>(text.length()), &error);
  if (!doc) {
    throw DataError("Invalid " + what + ": " + std::string(error.message));
  }
  return doc;
}

bool isConnectivityDomain(uint32_t domain) {
  return domain == MONGOC_ERROR_STREAM || domain == MONGOC_ERROR_SERVER_SELECTION ||
         domain == MONGOC_ERROR_CLIENT;
}

} // namespace

MongoDocumentSource::MongoDocumentSource(const std::string &connectionString) {
  static std::once_flag initFlag;
  std::call_once(initFlag, []() { mongoc_init(); });

  bson_error_t error;
  mongoc_uri_t *uri = mongoc_uri_new_with_error(connectionString.c_str(), &error);
  if (!uri) {
    throw ConnectivityError("Invalid MongoDB connection string: " +
                            StringUtils::redactSecrets(error.message));
  }

  const char *database = mongoc_uri_get_database(uri);
  if (!database || std::string(database).empty()) {
    mongoc_uri_destroy(uri);
    throw ConnectivityError("MongoDB connection string must name a database");
  }
  databaseName_ = database;

  client_ = mongoc_client_new_from_uri(uri);
  mongoc_uri_destroy(uri);
  if (!client_) {
    throw ConnectivityError("Failed to create MongoDB client");
  }
  mongoc_client_set_appname(client_, RelayDefaults::MONGO_APP_NAME);

  bson_t *ping = BCON_NEW("ping", BCON_INT32(1));
  mongoc_database_t *db =
      mongoc_client_get_database(client_, databaseName_.c_str());
  bool ok = mongoc_database_command_simple(db, ping, nullptr, nullptr, &error);
  bson_destroy(ping);
  mongoc_database_destroy(db);

  if (!ok) {
    mongoc_client_destroy(client_);
    client_ = nullptr;
    throw ConnectivityError("Failed to ping MongoDB: " +
                            StringUtils::redactSecrets(error.message));
  }

  Logger::info(LogCategory::DATABASE, "MongoDocumentSource",
               "Connected to MongoDB database " + databaseName_);
}

MongoDocumentSource::~MongoDocumentSource() {
  closeCursor();
  if (client_) {
    mongoc_client_destroy(client_);
    client_ = nullptr;
  }
}

void MongoDocumentSource::closeCursor() {
  if (cursor_) {
    mongoc_cursor_destroy(cursor_);
    cursor_ = nullptr;
  }
  if (collection_) {
    mongoc_collection_destroy(collection_);
    collection_ = nullptr;
  }
}

void MongoDocumentSource::open(const DocumentQuery &query) {
  closeCursor();

  collection_ = mongoc_client_get_collection(client_, databaseName_.c_str(),
                                             query.collection.c_str());
  if (!collection_) {
    throw DataError("Failed to open collection " + query.collection);
  }

  if (query.pipeline.is_array() && !query.pipeline.empty()) {
    bson_t *pipeline =
        bsonFromJson(json{{"pipeline", query.pipeline}}, "aggregation pipeline");
    cursor_ = mongoc_collection_aggregate(collection_, MONGOC_QUERY_NONE,
                                          pipeline, nullptr, nullptr);
    bson_destroy(pipeline);
  } else {
    json filter = query.filter.is_object() ? query.filter : json::object();
    bson_t *filterBson = bsonFromJson(filter, "filter");
    cursor_ =
        mongoc_collection_find_with_opts(collection_, filterBson, nullptr, nullptr);
    bson_destroy(filterBson);
  }

  if (!cursor_) {
    throw DataError("Failed to open cursor on collection " + query.collection);
  }
}

size_t MongoDocumentSource::readBatch(size_t maxDocuments,
                                      std::vector<json> &documents) {
  if (!cursor_)
    throw DataError("readBatch called before open");

  size_t appended = 0;
  const bson_t *doc = nullptr;
  while (appended < maxDocuments && mongoc_cursor_next(cursor_, &doc)) {
    char *text = bson_as_relaxed_extended_json(doc, nullptr);
    if (!text) {
      throw DataError("Failed to convert document to JSON");
    }
    try {
      documents.push_back(json::parse(text));
    } catch (const json::parse_error &e) {
      bson_free(text);
      throw DataError("Failed to parse document JSON: " + std::string(e.what()));
    }
    bson_free(text);
    ++appended;
  }

  bson_error_t error;
  if (mongoc_cursor_error(cursor_, &error)) {
    std::string message = "MongoDB cursor error: " + std::string(error.message);
    if (isConnectivityDomain(error.domain))
      throw ConnectivityError(message);
    throw DataError(message);
  }
  return appended;
}
