#include "jobs/job_service.h"
#include "core/logger.h"
#include "core/relay_defaults.h"
#include "transfer/transfer_parameters.h"
#include <algorithm>

json SubmitResult::toJson() const {
  json out = {{"jobId", jobId}, {"queueSaturated", queueSaturated}};
  if (droppedJobId)
    out["droppedJobId"] = *droppedJobId;
  return out;
}

JobService::JobService(InMemoryJobStore &store, BoundedJobQueue &queue)
    : store_(store), queue_(queue) {}

json JobService::normalizeParameters(JobKind kind, const json &parameters) {
  switch (kind) {
  case JobKind::DataTransfer: {
    auto params = DataTransferParameters::fromJson(parameters);
    params.validate();
    return params.toJson();
  }
  case JobKind::DataSync: {
    auto params = DataSyncParameters::fromJson(parameters);
    params.validate();
    return params.toJson();
  }
  case JobKind::MongoToMssql: {
    auto params = DocumentTransferParameters::fromJson(parameters);
    params.validate();
    return params.toJson();
  }
  default:
    throw ValidationError("Unsupported job kind");
  }
}

SubmitResult JobService::submitJob(JobKind kind, const json &parameters) {
  json normalized;
  try {
    normalized = normalizeParameters(kind, parameters);
  } catch (const ValidationError &e) {
    Logger::warning(LogCategory::VALIDATION, "JobService::submitJob",
                    "Rejected " + jobKindToString(kind) +
                        " submission: " + e.what());
    throw;
  }

  Job job = store_.create(kind, normalized);
  EnqueueResult enqueued = queue_.enqueue(job.id);
  if (!enqueued.accepted) {
    store_.tryCancel(job.id, "Service is shutting down");
    throw RelayError(ErrorKind::Internal,
                     "Job queue is closed; the service is shutting down");
  }

  SubmitResult result;
  result.jobId = job.id;
  result.queueSaturated = enqueued.saturated;
  result.droppedJobId = enqueued.droppedJobId;
  if (enqueued.droppedJobId) {
    store_.tryCancel(*enqueued.droppedJobId,
                     "Dropped from a saturated queue before it started");
  }

  Logger::info(LogCategory::JOBS, "JobService::submitJob",
               "Submitted " + jobKindToString(kind) + " job " + job.id);
  return result;
}

SubmitResult JobService::submitJob(const std::string &kind,
                                   const json &parameters) {
  return submitJob(parseJobKind(kind), parameters);
}

Job JobService::getJobStatus(const std::string &jobId) const {
  std::optional<Job> job = store_.get(jobId);
  if (!job) {
    throw NotFoundError("Job " + jobId + " not found");
  }
  return *job;
}

size_t JobService::clampLimit(size_t limit) {
  if (limit == 0)
    return RelayDefaults::DEFAULT_LIST_LIMIT;
  return std::min(limit, RelayDefaults::MAX_LIST_LIMIT);
}

std::vector<Job> JobService::listRecentJobs(size_t limit) const {
  return store_.list(clampLimit(limit));
}

std::vector<Job> JobService::listJobsByStatus(JobStatus status,
                                              size_t limit) const {
  return store_.listByStatus(status, clampLimit(limit));
}

bool JobService::cancelJob(const std::string &jobId) {
  if (!store_.get(jobId)) {
    throw NotFoundError("Job " + jobId + " not found");
  }
  return store_.tryCancel(jobId);
}
