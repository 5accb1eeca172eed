#include "../common/test_runner.h"
#include "core/logger.h"
#include "core/relay_config.h"
#include "core/relay_errors.h"
#include "core/service_config.h"
#include "transfer/transfer_parameters.h"

int main() {
  TestRunner runner;
  Logger::setLogLevel(LogLevel::CRITICAL);

  std::cout << "\n========================================" << std::endl;
  std::cout << "RELAY CONFIGURATION TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("QUEUE_CAPACITY bounds", [&]() {
    RelayConfig::resetToDefaults();
    runner.assertThrows<std::invalid_argument>(
        []() { RelayConfig::setQueueCapacity(0); }, "Capacity 0 rejected");
    runner.assertThrows<std::invalid_argument>(
        []() { RelayConfig::setQueueCapacity(RelayConfig::MAX_QUEUE_CAPACITY + 1); },
        "Capacity above max rejected");
    RelayConfig::setQueueCapacity(64);
    runner.assertEquals(64, RelayConfig::getQueueCapacity(), "Value applied");
  });

  runner.runTest("Batch size and sample size bounds", [&]() {
    RelayConfig::resetToDefaults();
    runner.assertThrows<std::invalid_argument>(
        []() { RelayConfig::setDefaultBatchSize(0); }, "Batch 0 rejected");
    runner.assertThrows<std::invalid_argument>(
        []() { RelayConfig::setSchemaSampleSize(0); }, "Sample 0 rejected");
    runner.assertThrows<std::invalid_argument>(
        []() { RelayConfig::setShutdownGraceSeconds(7200); },
        "Grace above max rejected");
    RelayConfig::setShutdownGraceSeconds(0);
    runner.assertEquals(0, RelayConfig::getShutdownGraceSeconds(),
                        "Zero grace allowed");
  });

  runner.runTest("Unmappable policy parsing", [&]() {
    RelayConfig::resetToDefaults();
    runner.assertTrue(RelayConfig::getUnmappablePolicy() ==
                          UnmappablePolicy::SKIP,
                      "Skip by default");
    RelayConfig::setUnmappablePolicy("abort");
    runner.assertTrue(RelayConfig::getUnmappablePolicy() ==
                          UnmappablePolicy::ABORT,
                      "Abort applied");
    runner.assertThrows<std::invalid_argument>(
        []() { RelayConfig::setUnmappablePolicy("ignore"); },
        "Unknown policy rejected");
    RelayConfig::resetToDefaults();
  });

  runner.runTest("ServiceConfig loads sections from JSON", [&]() {
    ServiceConfig::reset();
    json config = json::parse(R"({
      "queue": {"capacity": 12},
      "worker": {"shutdown_grace_seconds": 5},
      "transfer": {"default_batch_size": 250, "schema_sample_size": 20,
                   "unmappable_document_policy": "abort"},
      "logging": {"level": "DEBUG"},
      "connections": {
        "warehouse": {"engine": "MSSQL",
                      "connection_string": "Server=db;Password=hunter2;"},
        "events": {"engine": "mongodb",
                   "connection_string": "mongodb://u:p@mongo/app"}
      }
    })");
    ServiceConfig::loadFromJson(config);

    runner.assertEquals(12, RelayConfig::getQueueCapacity(), "Capacity");
    runner.assertEquals(5, RelayConfig::getShutdownGraceSeconds(), "Grace");
    runner.assertEquals(250, RelayConfig::getDefaultBatchSize(), "Batch size");
    runner.assertEquals(20, RelayConfig::getSchemaSampleSize(), "Sample size");
    runner.assertEquals(std::string("DEBUG"), ServiceConfig::getLogLevel(),
                        "Log level");
    runner.assertTrue(ServiceConfig::isInitialized(), "Initialized");

    auto warehouse = ServiceConfig::getConnection("warehouse");
    runner.assertTrue(warehouse.has_value(), "Connection registered");
    runner.assertEquals(std::string("mssql"), warehouse->engine,
                        "Engine lower-cased");

    std::string logged = ServiceConfig::getConnectionForLogging("warehouse");
    runner.assertFalse(logged.find("hunter2") != std::string::npos,
                       "Password masked for logging");
    std::string mongoLogged = ServiceConfig::getConnectionForLogging("events");
    runner.assertContains(mongoLogged, "mongodb://***@mongo/app",
                          "URI credentials masked");
    ServiceConfig::reset();
  });

  runner.runTest("ServiceConfig rejects bad sections", [&]() {
    ServiceConfig::reset();
    runner.assertThrows<std::invalid_argument>(
        []() {
          ServiceConfig::loadFromJson(json{{"queue", {{"capacity", 0}}}});
        },
        "Capacity 0 rejected");
    runner.assertThrows<std::invalid_argument>(
        []() {
          ServiceConfig::loadFromJson(json::parse(
              R"({"connections": {"x": {"engine": "oracle",
                                         "connection_string": "a"}}})"));
        },
        "Unsupported engine rejected");
    runner.assertThrows<std::invalid_argument>(
        []() { ServiceConfig::loadFromJson(json::array()); },
        "Non-object root rejected");
    runner.assertFalse(ServiceConfig::getConnection("x").has_value(),
                       "Nothing registered from a rejected file");
    ServiceConfig::reset();
  });

  runner.runTest("Error kinds round-trip through their names", [&]() {
    const ErrorKind kinds[] = {ErrorKind::Validation, ErrorKind::NotFound,
                               ErrorKind::Connectivity, ErrorKind::DataError,
                               ErrorKind::Cancelled, ErrorKind::Internal};
    for (ErrorKind kind : kinds) {
      runner.assertTrue(errorKindFromString(errorKindToString(kind)) == kind,
                        "Round trip for " + errorKindToString(kind));
    }
    runner.assertTrue(errorKindFromString("bogus") == ErrorKind::Internal,
                      "Unknown names map to Internal");

    try {
      throw ConnectivityError("down");
    } catch (const RelayError &e) {
      runner.assertTrue(e.kind() == ErrorKind::Connectivity,
                        "Subclass carries its kind");
    }
  });

  runner.runTest("Transfer parameters take defaults from RelayConfig", [&]() {
    RelayConfig::resetToDefaults();
    RelayConfig::setDefaultBatchSize(333);
    DataTransferParameters p = DataTransferParameters::fromJson(
        json{{"source", "a"},
             {"target", "b"},
             {"sourceQuery", "SELECT 1"},
             {"targetTable", "dbo.items"}});
    runner.assertEquals(333, p.options.batchSize, "Default batch size");
    runner.assertEquals(300, p.options.timeoutSeconds, "Default timeout");
    p.validate();
    RelayConfig::resetToDefaults();
  });

  runner.runTest("Transfer parameter validation", [&]() {
    runner.assertThrows<ValidationError>(
        []() {
          DataTransferParameters::fromJson(json{{"batchSize", 0}});
        },
        "batchSize 0 rejected");
    runner.assertThrows<ValidationError>(
        []() {
          DataTransferParameters::fromJson(json{{"batchSize", -5}});
        },
        "Negative batchSize rejected");
    runner.assertThrows<ValidationError>(
        []() { DataTransferParameters::fromJson(json{{"source", 7}}); },
        "Wrong type rejected");
    runner.assertThrows<ValidationError>(
        []() {
          DataTransferParameters p;
          p.source = "a";
          p.target = "b";
          p.sourceQuery = "SELECT 1";
          p.targetTable = "items; DROP TABLE x";
          p.validate();
        },
        "Unsafe table name rejected");
  });

  runner.runTest("Sync scope parameters", [&]() {
    json base = {{"source", "a"},
                 {"target", "b"},
                 {"sourceQuery", "SELECT * FROM t"},
                 {"targetTable", "t"}};

    DataSyncParameters full = DataSyncParameters::fromJson(base);
    runner.assertTrue(full.scope == SyncScope::FullTable, "Full by default");
    full.validate();

    json keys = base;
    keys["syncScope"] = "keys";
    runner.assertThrows<ValidationError>(
        [&]() { DataSyncParameters::fromJson(keys).validate(); },
        "Key scope needs key columns");
    keys["keyColumns"] = json::array({"id"});
    DataSyncParameters keyed = DataSyncParameters::fromJson(keys);
    keyed.validate();
    runner.assertTrue(keyed.scope == SyncScope::KeyMatch, "Key scope parsed");

    json predicate = base;
    predicate["syncScope"] = "predicate";
    predicate["deletePredicate"] = "1=1; DROP TABLE t";
    runner.assertThrows<ValidationError>(
        [&]() { DataSyncParameters::fromJson(predicate).validate(); },
        "Unsafe predicate rejected");

    json unknown = base;
    unknown["syncScope"] = "everything";
    runner.assertThrows<ValidationError>(
        [&]() { DataSyncParameters::fromJson(unknown); },
        "Unknown scope rejected");
  });

  runner.runTest("Document parameters", [&]() {
    RelayConfig::resetToDefaults();
    json params = {{"source", "mongo"},
                   {"target", "mssql"},
                   {"collection", "orders"},
                   {"targetTable", "orders"},
                   {"jsonMode", true},
                   {"arrayHandling", "FirstElement"},
                   {"unmappablePolicy", "ABORT"}};
    DocumentTransferParameters p = DocumentTransferParameters::fromJson(params);
    p.validate();
    runner.assertEquals(std::string("orders_JSON"), p.effectiveTargetTable(),
                        "Json mode table name");
    runner.assertTrue(p.arrayHandling == ArrayHandling::FirstElement,
                      "Array handling parsed case-insensitively");
    runner.assertTrue(p.unmappablePolicy == UnmappablePolicy::ABORT,
                      "Policy parsed");
    runner.assertEquals(100, p.schemaSampleSize, "Default sample size");

    params["filter"] = json::array();
    runner.assertThrows<ValidationError>(
        [&]() { DocumentTransferParameters::fromJson(params); },
        "Filter must be an object");

    DocumentTransferParameters bad = p;
    bad.flattenSeparator = ".";
    runner.assertThrows<ValidationError>([&]() { bad.validate(); },
                                         "Separator must be identifier-safe");
  });

  runner.printSummary();
  return 0;
}
