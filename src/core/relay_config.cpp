#include "core/relay_config.h"

std::atomic<size_t> RelayConfig::QUEUE_CAPACITY =
    RelayConfig::DEFAULT_QUEUE_CAPACITY;
std::atomic<size_t> RelayConfig::SHUTDOWN_GRACE_SECONDS =
    RelayConfig::DEFAULT_SHUTDOWN_GRACE;
std::atomic<size_t> RelayConfig::DEFAULT_BATCH_SIZE =
    RelayConfig::DEFAULT_BATCH;
std::atomic<size_t> RelayConfig::SCHEMA_SAMPLE_SIZE =
    RelayConfig::DEFAULT_SCHEMA_SAMPLE;
std::atomic<int> RelayConfig::UNMAPPABLE_POLICY =
    static_cast<int>(UnmappablePolicy::SKIP);
