#ifndef JOB_STORE_H
#define JOB_STORE_H

#include "jobs/job.h"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Owns every job record for the lifetime of the process. Status changes are
// compare-and-set against the expected prior status; a mismatch is rejected,
// logged and reported as false.
class InMemoryJobStore {
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Job> jobs_;
  // Ids in creation order.
  std::vector<std::string> order_;

public:
  Job create(JobKind kind, const json &parameters);
  std::optional<Job> get(const std::string &id) const;
  std::vector<Job> list(size_t limit) const;
  std::vector<Job> listByStatus(JobStatus status, size_t limit) const;
  size_t size() const;

  // Pending -> Cancelled.
  bool tryCancel(const std::string &id,
                 const std::string &reason = "Cancelled by request");
  // Pending -> Running.
  bool markRunning(const std::string &id);
  // Running -> Completed / Failed / Cancelled.
  bool markCompleted(const std::string &id, const json &result);
  bool markFailed(const std::string &id, const JobError &error);
  bool markCancelled(const std::string &id, const JobError &error);

  // Running jobs only.
  bool updateProgress(const std::string &id, const std::string &message);

private:
  bool transition(const std::string &id, JobStatus expected, JobStatus next,
                  const std::function<void(Job &)> &apply);
  std::vector<Job> collect(size_t limit,
                           const std::function<bool(const Job &)> &match) const;
};

#endif
