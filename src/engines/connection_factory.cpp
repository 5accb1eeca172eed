#include "engines/connection_factory.h"
#include "core/logger.h"
#include "core/relay_errors.h"
#include "engines/mongodb_source.h"
#include "engines/mssql_connection.h"
#include "engines/postgres_connection.h"

EngineConnectionFactory::EngineConnectionFactory(
    std::map<std::string, ConnectionReference> connections)
    : connections_(std::move(connections)) {}

const ConnectionReference &
EngineConnectionFactory::resolve(const std::string &reference) const {
  auto it = connections_.find(reference);
  if (it == connections_.end()) {
    throw ConnectivityError("Unknown connection reference '" + reference + "'");
  }
  return it->second;
}

std::unique_ptr<IRelationalConnection>
EngineConnectionFactory::openRelational(const std::string &reference) {
  const ConnectionReference &target = resolve(reference);
  Logger::debug(LogCategory::DATABASE, "openRelational",
                "Opening " + target.engine + " connection '" + reference + "'");

  if (target.engine == "mssql")
    return std::make_unique<MSSQLConnection>(target.connectionString);
  if (target.engine == "postgres")
    return std::make_unique<PostgresConnection>(target.connectionString);

  throw ConnectivityError("Connection '" + reference + "' uses engine '" +
                          target.engine + "', which is not relational");
}

std::unique_ptr<IDocumentSource>
EngineConnectionFactory::openDocumentSource(const std::string &reference) {
  const ConnectionReference &target = resolve(reference);
  Logger::debug(LogCategory::DATABASE, "openDocumentSource",
                "Opening " + target.engine + " connection '" + reference + "'");

  if (target.engine == "mongodb")
    return std::make_unique<MongoDocumentSource>(target.connectionString);

  throw ConnectivityError("Connection '" + reference + "' uses engine '" +
                          target.engine + "', which is not a document store");
}
