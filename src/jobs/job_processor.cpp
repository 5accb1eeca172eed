#include "jobs/job_processor.h"
#include "core/logger.h"
#include "transfer/bulk_data_transfer.h"
#include "transfer/delete_insert_sync.h"
#include "transfer/document_transfer.h"
#include "transfer/transfer_parameters.h"
#include "transfer/transfer_support.h"
#include "utils/string_utils.h"

JobProcessor::JobProcessor(InMemoryJobStore &store, BoundedJobQueue &queue,
                           ConnectionFactoryProvider factoryProvider)
    : store_(store), queue_(queue),
      factoryProvider_(std::move(factoryProvider)) {}

JobProcessor::~JobProcessor() { stop(std::chrono::seconds(0)); }

void JobProcessor::start() {
  if (running_.exchange(true))
    return;
  worker_ = std::thread(&JobProcessor::workerLoop, this);
  Logger::info(LogCategory::JOBS, "JobProcessor::start", "Job worker started");
}

void JobProcessor::stop(std::chrono::seconds grace) {
  if (!running_.exchange(false))
    return;

  std::vector<std::string> abandoned = queue_.close();
  for (const auto &jobId : abandoned) {
    store_.tryCancel(jobId, "Abandoned at shutdown before it started");
  }
  if (!abandoned.empty()) {
    Logger::warning(LogCategory::JOBS, "JobProcessor::stop",
                    std::to_string(abandoned.size()) +
                        " queued job(s) were abandoned at shutdown");
  }

  // Waits on the worker thread itself: a job popped just before close() is
  // not visible in the queue but still holds the worker.
  {
    std::unique_lock<std::mutex> lock(exitMutex_);
    if (!exitCondition_.wait_for(lock, grace, [this] { return exited_; })) {
      Logger::warning(LogCategory::JOBS, "JobProcessor::stop",
                      "Worker did not exit within " +
                          std::to_string(grace.count()) +
                          "s; signalling cancellation to the in-flight job");
      shutdownToken_.cancel();
    }
  }

  if (worker_.joinable())
    worker_.join();
  Logger::info(LogCategory::JOBS, "JobProcessor::stop", "Job worker stopped");
}

void JobProcessor::workerLoop() {
  std::string jobId;
  while (queue_.dequeue(jobId)) {
    processJob(jobId);
  }
  {
    std::lock_guard<std::mutex> lock(exitMutex_);
    exited_ = true;
  }
  exitCondition_.notify_all();
  Logger::debug(LogCategory::JOBS, "JobProcessor::workerLoop",
                "Queue closed; worker loop exiting");
}

void JobProcessor::processJob(const std::string &jobId) {
  std::optional<Job> job = store_.get(jobId);
  if (!job) {
    Logger::warning(LogCategory::JOBS, "JobProcessor::processJob",
                    "Job " + jobId + " not found; skipping");
    return;
  }
  if (!store_.markRunning(jobId)) {
    Logger::info(LogCategory::JOBS, "JobProcessor::processJob",
                 "Job " + jobId + " is no longer Pending; skipping");
    return;
  }

  ProgressCallback progress = [this, &jobId](size_t batchIndex,
                                             size_t rowsWritten) {
    store_.updateProgress(jobId, "Batch " + std::to_string(batchIndex) +
                                     " committed, " +
                                     std::to_string(rowsWritten) +
                                     " rows written");
  };

  TransferOutcome outcome;
  try {
    std::unique_ptr<IConnectionFactory> factory = factoryProvider_();
    outcome = execute(*job, *factory, progress);
  } catch (const std::exception &e) {
    outcome = TransferOutcome::failed(TransferSupport::errorKindOf(e), e.what(),
                                      TransferResult());
  }

  std::string message = StringUtils::redactSecrets(outcome.message);
  switch (outcome.status) {
  case TransferStatus::Completed:
    store_.markCompleted(jobId, outcome.result.toJson());
    break;
  case TransferStatus::Cancelled:
    store_.markCancelled(jobId, JobError{ErrorKind::Cancelled, message,
                                         outcome.result.toJson()});
    break;
  case TransferStatus::Failed:
  default:
    Logger::error(LogCategory::JOBS, "JobProcessor::processJob",
                  "Job " + jobId + " failed (" +
                      errorKindToString(outcome.errorKind) + "): " + message);
    store_.markFailed(jobId, JobError{outcome.errorKind, message,
                                      outcome.result.toJson()});
    break;
  }
}

TransferOutcome JobProcessor::execute(const Job &job,
                                      IConnectionFactory &factory,
                                      const ProgressCallback &progress) {
  switch (job.kind) {
  case JobKind::DataTransfer: {
    DataTransferParameters params =
        DataTransferParameters::fromJson(job.parameters);
    params.validate();
    auto source = factory.openRelational(params.source);
    auto target = factory.openRelational(params.target);
    return BulkDataTransfer().run(*source, *target, params, shutdownToken_,
                                  progress);
  }
  case JobKind::DataSync: {
    DataSyncParameters params = DataSyncParameters::fromJson(job.parameters);
    params.validate();
    auto source = factory.openRelational(params.source);
    auto target = factory.openRelational(params.target);
    return DeleteInsertSync().run(*source, *target, params, shutdownToken_,
                                  progress);
  }
  case JobKind::MongoToMssql: {
    DocumentTransferParameters params =
        DocumentTransferParameters::fromJson(job.parameters);
    params.validate();
    auto source = factory.openDocumentSource(params.source);
    auto target = factory.openRelational(params.target);
    return DocumentToRelationalTransfer().run(*source, *target, params,
                                              shutdownToken_, progress);
  }
  default:
    throw RelayError(ErrorKind::Internal,
                     "Unhandled job kind " + jobKindToString(job.kind));
  }
}
