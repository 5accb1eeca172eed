#ifndef JOB_SERVICE_H
#define JOB_SERVICE_H

#include "jobs/job.h"
#include "jobs/job_queue.h"
#include "jobs/job_store.h"
#include <optional>
#include <string>
#include <vector>

struct SubmitResult {
  std::string jobId;
  bool queueSaturated = false;
  std::optional<std::string> droppedJobId;

  json toJson() const;
};

// Caller-facing job API. Submission validates, records and enqueues; it never
// runs a transfer.
class JobService {
  InMemoryJobStore &store_;
  BoundedJobQueue &queue_;

public:
  JobService(InMemoryJobStore &store, BoundedJobQueue &queue);

  // Throws ValidationError for bad parameters; no job is created then.
  SubmitResult submitJob(JobKind kind, const json &parameters);
  SubmitResult submitJob(const std::string &kind, const json &parameters);

  // Throws NotFoundError for unknown ids.
  Job getJobStatus(const std::string &jobId) const;
  std::vector<Job> listRecentJobs(size_t limit) const;
  std::vector<Job> listJobsByStatus(JobStatus status, size_t limit) const;
  // True only for a Pending -> Cancelled transition. Throws NotFoundError for
  // unknown ids.
  bool cancelJob(const std::string &jobId);

  static json normalizeParameters(JobKind kind, const json &parameters);

private:
  static size_t clampLimit(size_t limit);
};

#endif
