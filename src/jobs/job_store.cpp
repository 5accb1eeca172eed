#include "jobs/job_store.h"
#include "core/logger.h"

Job InMemoryJobStore::create(JobKind kind, const json &parameters) {
  Job job;
  job.kind = kind;
  job.parameters = parameters;
  job.status = JobStatus::Pending;
  job.createdAt = Job::Clock::now();
  job.progressMessage = "Queued";

  std::lock_guard<std::mutex> lock(mutex_);
  do {
    job.id = Job::generateId();
  } while (jobs_.count(job.id) > 0);

  jobs_.emplace(job.id, job);
  order_.push_back(job.id);
  return job;
}

std::optional<Job> InMemoryJobStore::get(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end())
    return std::nullopt;
  return it->second;
}

std::vector<Job> InMemoryJobStore::collect(
    size_t limit, const std::function<bool(const Job &)> &match) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Job> out;
  for (auto it = order_.rbegin(); it != order_.rend() && out.size() < limit;
       ++it) {
    const Job &job = jobs_.at(*it);
    if (match(job))
      out.push_back(job);
  }
  return out;
}

std::vector<Job> InMemoryJobStore::list(size_t limit) const {
  return collect(limit, [](const Job &) { return true; });
}

std::vector<Job> InMemoryJobStore::listByStatus(JobStatus status,
                                                size_t limit) const {
  return collect(limit,
                 [status](const Job &job) { return job.status == status; });
}

size_t InMemoryJobStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

bool InMemoryJobStore::transition(const std::string &id, JobStatus expected,
                                  JobStatus next,
                                  const std::function<void(Job &)> &apply) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    Logger::warning(LogCategory::JOBS, "InMemoryJobStore::transition",
                    "Rejected " + jobStatusToString(expected) + " -> " +
                        jobStatusToString(next) + " for unknown job " + id);
    return false;
  }

  Job &job = it->second;
  if (job.status != expected) {
    Logger::warning(LogCategory::JOBS, "InMemoryJobStore::transition",
                    "Rejected " + jobStatusToString(expected) + " -> " +
                        jobStatusToString(next) + " for job " + id +
                        ": current status is " +
                        jobStatusToString(job.status));
    return false;
  }

  job.status = next;
  apply(job);
  Logger::info(LogCategory::JOBS, "InMemoryJobStore::transition",
               "Job " + id + " (" + jobKindToString(job.kind) + ") " +
                   jobStatusToString(expected) + " -> " +
                   jobStatusToString(next));
  return true;
}

bool InMemoryJobStore::tryCancel(const std::string &id,
                                 const std::string &reason) {
  return transition(id, JobStatus::Pending, JobStatus::Cancelled,
                    [&reason](Job &job) {
                      job.completedAt = Job::Clock::now();
                      job.error = JobError{ErrorKind::Cancelled, reason, json()};
                      job.progressMessage = reason;
                    });
}

bool InMemoryJobStore::markRunning(const std::string &id) {
  return transition(id, JobStatus::Pending, JobStatus::Running, [](Job &job) {
    job.startedAt = Job::Clock::now();
    job.progress = 0;
    job.progressMessage = "Running";
  });
}

bool InMemoryJobStore::markCompleted(const std::string &id,
                                     const json &result) {
  return transition(id, JobStatus::Running, JobStatus::Completed,
                    [&result](Job &job) {
                      job.completedAt = Job::Clock::now();
                      job.result = result;
                      job.progress = 100;
                      job.progressMessage = "Completed";
                    });
}

bool InMemoryJobStore::markFailed(const std::string &id,
                                  const JobError &error) {
  return transition(id, JobStatus::Running, JobStatus::Failed,
                    [&error](Job &job) {
                      job.completedAt = Job::Clock::now();
                      job.error = error;
                      job.progressMessage = "Failed";
                    });
}

bool InMemoryJobStore::markCancelled(const std::string &id,
                                     const JobError &error) {
  return transition(id, JobStatus::Running, JobStatus::Cancelled,
                    [&error](Job &job) {
                      job.completedAt = Job::Clock::now();
                      job.error = error;
                      job.progressMessage = "Cancelled";
                    });
}

bool InMemoryJobStore::updateProgress(const std::string &id,
                                      const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end() || it->second.status != JobStatus::Running)
    return false;
  it->second.progressMessage = message;
  return true;
}
