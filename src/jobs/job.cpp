#include "jobs/job.h"
#include "core/relay_defaults.h"
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

std::string jobKindToString(JobKind kind) {
  switch (kind) {
  case JobKind::DataTransfer:
    return "DataTransfer";
  case JobKind::DataSync:
    return "DataSync";
  case JobKind::MongoToMssql:
    return "MongoToMssql";
  default:
    return "DataTransfer";
  }
}

JobKind parseJobKind(const std::string &name) {
  if (name == "DataTransfer")
    return JobKind::DataTransfer;
  if (name == "DataSync")
    return JobKind::DataSync;
  if (name == "MongoToMssql")
    return JobKind::MongoToMssql;
  throw ValidationError("Unknown job kind '" + name +
                        "' (expected DataTransfer, DataSync or MongoToMssql)");
}

std::string jobStatusToString(JobStatus status) {
  switch (status) {
  case JobStatus::Pending:
    return "Pending";
  case JobStatus::Running:
    return "Running";
  case JobStatus::Completed:
    return "Completed";
  case JobStatus::Failed:
    return "Failed";
  case JobStatus::Cancelled:
    return "Cancelled";
  default:
    return "Pending";
  }
}

JobStatus parseJobStatus(const std::string &name) {
  if (name == "Pending")
    return JobStatus::Pending;
  if (name == "Running")
    return JobStatus::Running;
  if (name == "Completed")
    return JobStatus::Completed;
  if (name == "Failed")
    return JobStatus::Failed;
  if (name == "Cancelled")
    return JobStatus::Cancelled;
  throw ValidationError("Unknown job status '" + name + "'");
}

bool isTerminalStatus(JobStatus status) {
  return status == JobStatus::Completed || status == JobStatus::Failed ||
         status == JobStatus::Cancelled;
}

json JobError::toJson() const {
  json out = {{"kind", errorKindToString(kind)}, {"message", message}};
  if (!partialProgress.is_null())
    out["partialProgress"] = partialProgress;
  return out;
}

std::optional<int64_t> Job::durationMs() const {
  if (!startedAt)
    return std::nullopt;
  Clock::time_point end = completedAt ? *completedAt : Clock::now();
  return std::chrono::duration_cast<std::chrono::milliseconds>(end - *startedAt)
      .count();
}

json Job::toJson() const {
  json out = {{"id", id},
              {"kind", jobKindToString(kind)},
              {"status", jobStatusToString(status)},
              {"parameters", parameters},
              {"createdAt", formatTimestamp(createdAt)},
              {"startedAt", nullptr},
              {"completedAt", nullptr},
              {"progress", progress},
              {"progressMessage", progressMessage},
              {"isFinished", isFinished()},
              {"durationMs", nullptr},
              {"result", nullptr},
              {"error", nullptr}};
  if (startedAt)
    out["startedAt"] = formatTimestamp(*startedAt);
  if (completedAt)
    out["completedAt"] = formatTimestamp(*completedAt);
  if (auto duration = durationMs())
    out["durationMs"] = *duration;
  if (result)
    out["result"] = *result;
  if (error)
    out["error"] = error->toJson();
  return out;
}

std::string Job::generateId() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dis;

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < RelayDefaults::JOB_ID_LENGTH / 16; ++i)
    oss << std::setw(16) << dis(gen);
  return oss.str();
}

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
  auto timeT = std::chrono::system_clock::to_time_t(time);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    time.time_since_epoch()) %
                1000;
  std::tm tm{};
  gmtime_r(&timeT, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << millis.count() << 'Z';
  return oss.str();
}
