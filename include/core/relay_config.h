#ifndef RELAY_CONFIG_H
#define RELAY_CONFIG_H

#include <atomic>
#include <stdexcept>
#include <string>

enum class UnmappablePolicy { SKIP = 0, ABORT = 1 };

// Runtime tunables shared by the queue, the worker and the transfer engine.
struct RelayConfig {
  static std::atomic<size_t> QUEUE_CAPACITY;
  static std::atomic<size_t> SHUTDOWN_GRACE_SECONDS;
  static std::atomic<size_t> DEFAULT_BATCH_SIZE;
  static std::atomic<size_t> SCHEMA_SAMPLE_SIZE;
  static std::atomic<int> UNMAPPABLE_POLICY;

  static constexpr size_t DEFAULT_QUEUE_CAPACITY = 200;
  static constexpr size_t DEFAULT_SHUTDOWN_GRACE = 30;
  static constexpr size_t DEFAULT_BATCH = 1000;
  static constexpr size_t DEFAULT_SCHEMA_SAMPLE = 100;

  static constexpr size_t MIN_QUEUE_CAPACITY = 1;
  static constexpr size_t MAX_QUEUE_CAPACITY = 100000;
  static constexpr size_t MAX_SHUTDOWN_GRACE = 3600;
  static constexpr size_t MIN_BATCH_SIZE = 1;
  static constexpr size_t MAX_BATCH_SIZE = 100000;
  static constexpr size_t MIN_SCHEMA_SAMPLE = 1;
  static constexpr size_t MAX_SCHEMA_SAMPLE = 10000;

  static void setQueueCapacity(size_t v) {
    if (v < MIN_QUEUE_CAPACITY || v > MAX_QUEUE_CAPACITY) {
      throw std::invalid_argument("QUEUE_CAPACITY must be between " +
                                  std::to_string(MIN_QUEUE_CAPACITY) + " and " +
                                  std::to_string(MAX_QUEUE_CAPACITY));
    }
    QUEUE_CAPACITY = v;
  }

  static size_t getQueueCapacity() { return QUEUE_CAPACITY; }

  static void setShutdownGraceSeconds(size_t v) {
    if (v > MAX_SHUTDOWN_GRACE) {
      throw std::invalid_argument("SHUTDOWN_GRACE_SECONDS must be between 0 "
                                  "and " +
                                  std::to_string(MAX_SHUTDOWN_GRACE));
    }
    SHUTDOWN_GRACE_SECONDS = v;
  }

  static size_t getShutdownGraceSeconds() { return SHUTDOWN_GRACE_SECONDS; }

  static void setDefaultBatchSize(size_t v) {
    if (v < MIN_BATCH_SIZE || v > MAX_BATCH_SIZE) {
      throw std::invalid_argument("DEFAULT_BATCH_SIZE must be between " +
                                  std::to_string(MIN_BATCH_SIZE) + " and " +
                                  std::to_string(MAX_BATCH_SIZE));
    }
    DEFAULT_BATCH_SIZE = v;
  }

  static size_t getDefaultBatchSize() { return DEFAULT_BATCH_SIZE; }

  static void setSchemaSampleSize(size_t v) {
    if (v < MIN_SCHEMA_SAMPLE || v > MAX_SCHEMA_SAMPLE) {
      throw std::invalid_argument("SCHEMA_SAMPLE_SIZE must be between " +
                                  std::to_string(MIN_SCHEMA_SAMPLE) + " and " +
                                  std::to_string(MAX_SCHEMA_SAMPLE));
    }
    SCHEMA_SAMPLE_SIZE = v;
  }

  static size_t getSchemaSampleSize() { return SCHEMA_SAMPLE_SIZE; }

  static void setUnmappablePolicy(UnmappablePolicy policy) {
    UNMAPPABLE_POLICY = static_cast<int>(policy);
  }

  static void setUnmappablePolicy(const std::string &name) {
    setUnmappablePolicy(parseUnmappablePolicy(name));
  }

  static UnmappablePolicy getUnmappablePolicy() {
    return static_cast<UnmappablePolicy>(UNMAPPABLE_POLICY.load());
  }

  static UnmappablePolicy parseUnmappablePolicy(const std::string &name) {
    if (name == "skip")
      return UnmappablePolicy::SKIP;
    if (name == "abort")
      return UnmappablePolicy::ABORT;
    throw std::invalid_argument("unmappable_document_policy must be 'skip' or "
                                "'abort', got '" +
                                name + "'");
  }

  static void resetToDefaults() {
    QUEUE_CAPACITY = DEFAULT_QUEUE_CAPACITY;
    SHUTDOWN_GRACE_SECONDS = DEFAULT_SHUTDOWN_GRACE;
    DEFAULT_BATCH_SIZE = DEFAULT_BATCH;
    SCHEMA_SAMPLE_SIZE = DEFAULT_SCHEMA_SAMPLE;
    UNMAPPABLE_POLICY = static_cast<int>(UnmappablePolicy::SKIP);
  }
};

#endif
