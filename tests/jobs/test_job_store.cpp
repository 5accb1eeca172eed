#include "../common/test_runner.h"
#include "core/logger.h"
#include "jobs/job_store.h"
#include <atomic>
#include <thread>
#include <vector>

int main() {
  TestRunner runner;
  Logger::setLogLevel(LogLevel::CRITICAL);

  std::cout << "\n========================================" << std::endl;
  std::cout << "JOB STORE TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Create assigns a unique id and Pending status", [&]() {
    InMemoryJobStore store;
    Job a = store.create(JobKind::DataSync, json{{"x", 1}});
    Job b = store.create(JobKind::DataTransfer, json::object());
    runner.assertEquals(32, a.id.size(), "Job id is 32 hex characters");
    runner.assertTrue(a.id != b.id, "Ids are unique");
    runner.assertEquals(std::string("Pending"), jobStatusToString(a.status),
                        "New jobs are Pending");
    runner.assertFalse(a.startedAt.has_value(), "startedAt unset");
    runner.assertFalse(a.result.has_value() || a.error.has_value(),
                       "Neither result nor error is set");

    auto loaded = store.get(a.id);
    runner.assertTrue(loaded.has_value(), "Job can be read back");
    runner.assertEquals(1, loaded->parameters["x"].get<int>(),
                        "Parameters stored as given");
  });

  runner.runTest("Get on unknown id returns nothing", [&]() {
    InMemoryJobStore store;
    runner.assertFalse(store.get("missing").has_value(), "Unknown id");
  });

  runner.runTest("Happy path Pending -> Running -> Completed", [&]() {
    InMemoryJobStore store;
    Job job = store.create(JobKind::DataTransfer, json::object());
    runner.assertTrue(store.markRunning(job.id), "Pending -> Running");
    runner.assertTrue(store.get(job.id)->startedAt.has_value(),
                      "startedAt recorded");
    runner.assertTrue(store.markCompleted(job.id, json{{"rowsWritten", 5}}),
                      "Running -> Completed");

    Job done = *store.get(job.id);
    runner.assertEquals(std::string("Completed"), jobStatusToString(done.status),
                        "Status Completed");
    runner.assertTrue(done.result.has_value(), "Result set");
    runner.assertFalse(done.error.has_value(), "Error not set");
    runner.assertTrue(done.completedAt.has_value(), "completedAt recorded");
    runner.assertEquals(100, done.progress, "Progress is 100");
    runner.assertTrue(done.isFinished(), "isFinished");
  });

  runner.runTest("Illegal transitions are rejected", [&]() {
    InMemoryJobStore store;
    Job job = store.create(JobKind::DataSync, json::object());
    runner.assertFalse(store.markCompleted(job.id, json::object()),
                       "Pending -> Completed is illegal");
    runner.assertFalse(store.markFailed(job.id, JobError{}),
                       "Pending -> Failed is illegal");
    runner.assertTrue(store.markRunning(job.id), "Pending -> Running");
    runner.assertFalse(store.markRunning(job.id),
                       "Running -> Running is illegal");
    runner.assertFalse(store.tryCancel(job.id),
                       "Running job cannot be cancelled");
    runner.assertTrue(
        store.markFailed(job.id,
                         JobError{ErrorKind::DataError, "boom", json()}),
        "Running -> Failed");
    runner.assertFalse(store.markCompleted(job.id, json::object()),
                       "Failed is terminal");
    runner.assertFalse(store.markRunning(job.id), "Failed cannot re-run");

    Job failed = *store.get(job.id);
    runner.assertEquals(std::string("DataError"),
                        errorKindToString(failed.error->kind),
                        "Error kind recorded");
    runner.assertFalse(failed.result.has_value(), "No result on failure");
  });

  runner.runTest("Cancel succeeds only while Pending", [&]() {
    InMemoryJobStore store;
    Job job = store.create(JobKind::MongoToMssql, json::object());
    runner.assertTrue(store.tryCancel(job.id), "Pending job cancels");
    runner.assertFalse(store.tryCancel(job.id), "Second cancel fails");
    runner.assertFalse(store.markRunning(job.id),
                       "Cancelled job never runs");

    Job cancelled = *store.get(job.id);
    runner.assertEquals(std::string("Cancelled"),
                        jobStatusToString(cancelled.status), "Status");
    runner.assertTrue(cancelled.error.has_value(),
                      "Cancellation reason recorded");
    runner.assertFalse(store.tryCancel("unknown"), "Unknown id");
  });

  runner.runTest("Cancel races dequeue: exactly one wins", [&]() {
    for (int round = 0; round < 50; ++round) {
      InMemoryJobStore store;
      Job job = store.create(JobKind::DataTransfer, json::object());
      std::atomic<bool> cancelled{false};
      std::atomic<bool> started{false};
      std::thread canceller([&]() { cancelled = store.tryCancel(job.id); });
      std::thread worker([&]() { started = store.markRunning(job.id); });
      canceller.join();
      worker.join();
      runner.assertTrue(cancelled.load() != started.load(),
                        "Exactly one transition should win");
    }
  });

  runner.runTest("List is most-recent-first and honours limit", [&]() {
    InMemoryJobStore store;
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i)
      ids.push_back(store.create(JobKind::DataSync, json{{"n", i}}).id);

    std::vector<Job> recent = store.list(3);
    runner.assertEquals(3, recent.size(), "Limit applied");
    runner.assertEquals(ids[4], recent[0].id, "Newest first");
    runner.assertEquals(ids[2], recent[2].id, "Third newest last");
  });

  runner.runTest("ListByStatus filters", [&]() {
    InMemoryJobStore store;
    Job a = store.create(JobKind::DataSync, json::object());
    Job b = store.create(JobKind::DataSync, json::object());
    store.create(JobKind::DataSync, json::object());
    store.tryCancel(a.id);
    store.tryCancel(b.id);

    runner.assertEquals(2, store.listByStatus(JobStatus::Cancelled, 10).size(),
                        "Two cancelled");
    runner.assertEquals(1, store.listByStatus(JobStatus::Pending, 10).size(),
                        "One pending");
  });

  runner.runTest("Progress updates apply only to Running jobs", [&]() {
    InMemoryJobStore store;
    Job job = store.create(JobKind::DataTransfer, json::object());
    runner.assertFalse(store.updateProgress(job.id, "Batch 1"),
                       "Pending job ignores progress");
    store.markRunning(job.id);
    runner.assertTrue(store.updateProgress(job.id, "Batch 1 committed"),
                      "Running job accepts progress");
    runner.assertEquals(std::string("Batch 1 committed"),
                        store.get(job.id)->progressMessage, "Message stored");
  });

  runner.runTest("Job JSON carries derived fields", [&]() {
    InMemoryJobStore store;
    Job job = store.create(JobKind::DataSync, json::object());
    json pending = store.get(job.id)->toJson();
    runner.assertEquals(std::string("Pending"),
                        pending["status"].get<std::string>(), "status");
    runner.assertFalse(pending["isFinished"].get<bool>(), "not finished");
    runner.assertTrue(pending["durationMs"].is_null(),
                      "No duration before start");

    store.markRunning(job.id);
    store.markCompleted(job.id, json{{"rowsWritten", 1}});
    json done = store.get(job.id)->toJson();
    runner.assertTrue(done["isFinished"].get<bool>(), "finished");
    runner.assertTrue(done["durationMs"].is_number_integer(),
                      "Duration reported");
    runner.assertEquals(1, done["result"]["rowsWritten"].get<int>(),
                        "Result embedded");
  });

  runner.printSummary();
  return 0;
}
