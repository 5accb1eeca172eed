#ifndef JOB_PROCESSOR_H
#define JOB_PROCESSOR_H

#include "engines/connection_factory.h"
#include "jobs/job_queue.h"
#include "jobs/job_store.h"
#include "transfer/transfer_types.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

// The single consumer of the job queue. Each dequeued job gets its own
// connection factory, so nothing a failed job opened survives into the next.
class JobProcessor {
  InMemoryJobStore &store_;
  BoundedJobQueue &queue_;
  ConnectionFactoryProvider factoryProvider_;

  std::thread worker_;
  std::atomic<bool> running_{false};
  // Signalled when the shutdown grace period runs out.
  CancellationToken shutdownToken_;

  std::mutex exitMutex_;
  std::condition_variable exitCondition_;
  bool exited_ = false;

public:
  JobProcessor(InMemoryJobStore &store, BoundedJobQueue &queue,
               ConnectionFactoryProvider factoryProvider);
  ~JobProcessor();

  JobProcessor(const JobProcessor &) = delete;
  JobProcessor &operator=(const JobProcessor &) = delete;

  void start();
  // Closes the queue, cancels the jobs still queued, lets the in-flight job
  // run for up to grace, then signals it to stop and joins the worker.
  void stop(std::chrono::seconds grace);
  bool isRunning() const { return running_.load(); }

  // Runs one job to a terminal state on the calling thread.
  void processJob(const std::string &jobId);

private:
  void workerLoop();
  TransferOutcome execute(const Job &job, IConnectionFactory &factory,
                          const ProgressCallback &progress);
};

#endif
