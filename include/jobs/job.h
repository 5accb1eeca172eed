#ifndef JOB_H
#define JOB_H

#include "core/relay_errors.h"
#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using json = nlohmann::json;

enum class JobKind { DataTransfer, DataSync, MongoToMssql };

enum class JobStatus { Pending, Running, Completed, Failed, Cancelled };

std::string jobKindToString(JobKind kind);
JobKind parseJobKind(const std::string &name);
std::string jobStatusToString(JobStatus status);
JobStatus parseJobStatus(const std::string &name);
bool isTerminalStatus(JobStatus status);

struct JobError {
  ErrorKind kind = ErrorKind::Internal;
  std::string message;
  // TransferResult JSON of whatever was committed before the job stopped.
  json partialProgress;

  json toJson() const;
};

struct Job {
  using Clock = std::chrono::system_clock;

  std::string id;
  JobKind kind = JobKind::DataTransfer;
  json parameters;
  JobStatus status = JobStatus::Pending;
  Clock::time_point createdAt;
  std::optional<Clock::time_point> startedAt;
  std::optional<Clock::time_point> completedAt;
  std::optional<json> result;
  std::optional<JobError> error;
  int progress = 0;
  std::string progressMessage;

  bool isFinished() const { return isTerminalStatus(status); }
  std::optional<int64_t> durationMs() const;
  json toJson() const;

  static std::string generateId();
};

std::string formatTimestamp(std::chrono::system_clock::time_point time);

#endif
