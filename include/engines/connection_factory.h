#ifndef CONNECTION_FACTORY_H
#define CONNECTION_FACTORY_H

#include "core/service_config.h"
#include "engines/document_source.h"
#include "engines/relational_connection.h"
#include <functional>
#include <map>
#include <memory>
#include <string>

// Resolves named connection references to live connections. Every failure
// (unknown name, wrong engine family, unreachable server) is reported as
// ConnectivityError.
class IConnectionFactory {
public:
  virtual ~IConnectionFactory() = default;

  virtual std::unique_ptr<IRelationalConnection>
  openRelational(const std::string &reference) = 0;
  virtual std::unique_ptr<IDocumentSource>
  openDocumentSource(const std::string &reference) = 0;
};

// Builds a fresh factory, and with it fresh connections, for each job.
using ConnectionFactoryProvider =
    std::function<std::unique_ptr<IConnectionFactory>()>;

class EngineConnectionFactory : public IConnectionFactory {
  std::map<std::string, ConnectionReference> connections_;

public:
  explicit EngineConnectionFactory(
      std::map<std::string, ConnectionReference> connections);

  std::unique_ptr<IRelationalConnection>
  openRelational(const std::string &reference) override;
  std::unique_ptr<IDocumentSource>
  openDocumentSource(const std::string &reference) override;

private:
  const ConnectionReference &resolve(const std::string &reference) const;
};

#endif
