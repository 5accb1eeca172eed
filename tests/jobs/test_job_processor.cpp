#include "../common/test_runner.h"
#include "../fakes/in_memory_stores.h"
#include "core/logger.h"
#include "jobs/command_handler.h"
#include "jobs/job_processor.h"
#include "jobs/job_service.h"
#include <atomic>
#include <chrono>
#include <thread>

namespace {

json transferParams(const std::string &target) {
  return {{"source", "src"},
          {"target", target},
          {"sourceQuery", "SELECT * FROM people"},
          {"targetTable", "people_copy"},
          {"batchSize", 2}};
}

std::shared_ptr<InMemoryDatabase> sourceDatabase() {
  auto db = std::make_shared<InMemoryDatabase>();
  db->addTable("people", {"id", "name"},
               {ColumnType::Integer, ColumnType::Text},
               {{1, "ada"}, {2, "grace"}, {3, "linus"}});
  return db;
}

std::shared_ptr<InMemoryDatabase> targetDatabase() {
  auto db = std::make_shared<InMemoryDatabase>();
  db->addTable("people_copy", {"id", "name"},
               {ColumnType::Integer, ColumnType::Text});
  return db;
}

bool waitForTerminal(InMemoryJobStore &store, const std::string &id,
                     std::chrono::milliseconds timeout =
                         std::chrono::milliseconds(5000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    auto job = store.get(id);
    if (job && job->isFinished())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return false;
}

} // namespace

int main() {
  TestRunner runner;
  Logger::setLogLevel(LogLevel::CRITICAL);

  std::cout << "\n========================================" << std::endl;
  std::cout << "JOB SERVICE AND PROCESSOR TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  auto src = sourceDatabase();
  auto dst = targetDatabase();
  auto provider = [src, dst]() {
    auto factory = std::make_unique<FakeConnectionFactory>();
    factory->databases["src"] = src;
    factory->databases["dst"] = dst;
    return std::unique_ptr<IConnectionFactory>(std::move(factory));
  };

  runner.runTest("Submitted job is Pending immediately", [&]() {
    InMemoryJobStore store;
    BoundedJobQueue queue(10);
    JobService service(store, queue);

    SubmitResult submitted =
        service.submitJob(JobKind::DataTransfer, transferParams("dst"));
    runner.assertNotEmpty(submitted.jobId, "Job id returned");
    runner.assertFalse(submitted.queueSaturated, "Queue not saturated");
    runner.assertEquals(std::string("Pending"),
                        jobStatusToString(
                            service.getJobStatus(submitted.jobId).status),
                        "Status right after submit");
    runner.assertEquals(1, queue.size(), "Id was enqueued");
  });

  runner.runTest("Invalid parameters create no job", [&]() {
    InMemoryJobStore store;
    BoundedJobQueue queue(10);
    JobService service(store, queue);

    json params = transferParams("dst");
    params["batchSize"] = 0;
    runner.assertThrows<ValidationError>(
        [&]() { service.submitJob(JobKind::DataTransfer, params); },
        "batchSize 0 is rejected");

    json badTable = transferParams("dst");
    badTable["targetTable"] = "people; DROP TABLE x";
    runner.assertThrows<ValidationError>(
        [&]() { service.submitJob(JobKind::DataTransfer, badTable); },
        "Unsafe table name is rejected");

    runner.assertThrows<ValidationError>(
        [&]() { service.submitJob("Replicate", json::object()); },
        "Unknown kind is rejected");

    runner.assertEquals(0, store.size(), "No job records created");
    runner.assertEquals(0, queue.size(), "Nothing enqueued");
  });

  runner.runTest("Saturated queue cancels the dropped job", [&]() {
    InMemoryJobStore store;
    BoundedJobQueue queue(2);
    JobService service(store, queue);

    SubmitResult first = service.submitJob(JobKind::DataTransfer,
                                           transferParams("dst"));
    service.submitJob(JobKind::DataTransfer, transferParams("dst"));
    SubmitResult third = service.submitJob(JobKind::DataTransfer,
                                           transferParams("dst"));

    runner.assertTrue(third.queueSaturated, "Saturation surfaced");
    runner.assertEquals(first.jobId, third.droppedJobId.value_or(""),
                        "Oldest job dropped");
    runner.assertEquals(std::string("Cancelled"),
                        jobStatusToString(
                            service.getJobStatus(first.jobId).status),
                        "Dropped job is Cancelled");
    runner.assertEquals(2, queue.size(), "Queue holds capacity");
  });

  runner.runTest("Status and cancel on unknown ids are NotFound", [&]() {
    InMemoryJobStore store;
    BoundedJobQueue queue(2);
    JobService service(store, queue);
    runner.assertThrows<NotFoundError>(
        [&]() { service.getJobStatus("nope"); }, "status");
    runner.assertThrows<NotFoundError>([&]() { service.cancelJob("nope"); },
                                       "cancel");
  });

  runner.runTest("Cancel is true only while Pending", [&]() {
    InMemoryJobStore store;
    BoundedJobQueue queue(10);
    JobService service(store, queue);
    JobProcessor processor(store, queue, provider);

    SubmitResult pending = service.submitJob(JobKind::DataTransfer,
                                             transferParams("dst"));
    runner.assertTrue(service.cancelJob(pending.jobId), "Pending cancels");

    SubmitResult ran = service.submitJob(JobKind::DataTransfer,
                                         transferParams("dst"));
    processor.processJob(pending.jobId);
    runner.assertEquals(std::string("Cancelled"),
                        jobStatusToString(
                            service.getJobStatus(pending.jobId).status),
                        "Cancelled job is skipped by the worker");

    processor.processJob(ran.jobId);
    runner.assertFalse(service.cancelJob(ran.jobId),
                       "Finished job cannot be cancelled");
  });

  runner.runTest("Worker runs a transfer to Completed", [&]() {
    dst->tables["people_copy"].rows.clear();
    InMemoryJobStore store;
    BoundedJobQueue queue(10);
    JobService service(store, queue);
    JobProcessor processor(store, queue, provider);
    processor.start();

    SubmitResult submitted = service.submitJob(JobKind::DataTransfer,
                                               transferParams("dst"));
    runner.assertTrue(waitForTerminal(store, submitted.jobId),
                      "Job finishes");
    processor.stop(std::chrono::seconds(5));

    Job job = service.getJobStatus(submitted.jobId);
    runner.assertEquals(std::string("Completed"),
                        jobStatusToString(job.status), "Completed");
    runner.assertTrue(job.result.has_value(), "Result present");
    runner.assertFalse(job.error.has_value(), "No error");
    runner.assertEquals(3, (*job.result)["rowsWritten"].get<int>(),
                        "Three rows written");
    runner.assertEquals(2, (*job.result)["batchCount"].get<int>(),
                        "Two batches of size 2");
    runner.assertTrue(job.startedAt.has_value() && job.completedAt.has_value(),
                      "Timestamps recorded");
    runner.assertEquals(3, dst->rowsOf("people_copy").size(),
                        "Target holds the rows");
  });

  runner.runTest("Unreachable target fails with Connectivity and the loop "
                 "continues",
                 [&]() {
                   dst->tables["people_copy"].rows.clear();
                   InMemoryJobStore store;
                   BoundedJobQueue queue(10);
                   JobService service(store, queue);
                   JobProcessor processor(store, queue, provider);
                   processor.start();

                   SubmitResult broken = service.submitJob(
                       JobKind::DataTransfer, transferParams("nowhere"));
                   SubmitResult healthy = service.submitJob(
                       JobKind::DataTransfer, transferParams("dst"));
                   runner.assertTrue(waitForTerminal(store, broken.jobId),
                                     "Broken job finishes");
                   runner.assertTrue(waitForTerminal(store, healthy.jobId),
                                     "Next job finishes");
                   processor.stop(std::chrono::seconds(5));

                   Job failed = service.getJobStatus(broken.jobId);
                   runner.assertEquals(std::string("Failed"),
                                       jobStatusToString(failed.status),
                                       "Broken job Failed");
                   runner.assertEquals(std::string("Connectivity"),
                                       errorKindToString(failed.error->kind),
                                       "Connectivity kind");
                   runner.assertFalse(failed.result.has_value(),
                                      "No result on failure");

                   Job next = service.getJobStatus(healthy.jobId);
                   runner.assertEquals(std::string("Completed"),
                                       jobStatusToString(next.status),
                                       "Worker kept going");
                 });

  runner.runTest("Each job gets a fresh connection factory", [&]() {
    std::atomic<int> built{0};
    auto countingProvider = [&built, provider]() {
      ++built;
      return provider();
    };
    InMemoryJobStore store;
    BoundedJobQueue queue(10);
    JobService service(store, queue);
    JobProcessor processor(store, queue, countingProvider);

    SubmitResult a = service.submitJob(JobKind::DataTransfer,
                                       transferParams("dst"));
    SubmitResult b = service.submitJob(JobKind::DataTransfer,
                                       transferParams("dst"));
    processor.processJob(a.jobId);
    processor.processJob(b.jobId);
    runner.assertEquals(2, built.load(), "One factory per job");
  });

  runner.runTest("Failed batch stores partial progress on the job", [&]() {
    auto failing = targetDatabase();
    failing->failBulkInsertOnCall = 2;
    auto failingProvider = [src, failing]() {
      auto factory = std::make_unique<FakeConnectionFactory>();
      factory->databases["src"] = src;
      factory->databases["dst"] = failing;
      return std::unique_ptr<IConnectionFactory>(std::move(factory));
    };
    InMemoryJobStore store;
    BoundedJobQueue queue(10);
    JobService service(store, queue);
    JobProcessor processor(store, queue, failingProvider);

    SubmitResult submitted = service.submitJob(JobKind::DataTransfer,
                                               transferParams("dst"));
    processor.processJob(submitted.jobId);

    Job job = service.getJobStatus(submitted.jobId);
    runner.assertEquals(std::string("Failed"), jobStatusToString(job.status),
                        "Failed");
    runner.assertEquals(std::string("DataError"),
                        errorKindToString(job.error->kind), "DataError kind");
    runner.assertEquals(2,
                        job.error->partialProgress["failedBatchIndex"].get<int>(),
                        "Failed batch index");
    runner.assertEquals(2, job.error->partialProgress["rowsWritten"].get<int>(),
                        "Committed rows reported");
  });

  runner.runTest("Stop abandons queued jobs and cancels the in-flight one",
                 [&]() {
                   std::atomic<bool> release{false};
                   std::atomic<bool> entered{false};
                   auto slowProvider = [&release, &entered, provider]() {
                     entered = true;
                     while (!release.load())
                       std::this_thread::sleep_for(
                           std::chrono::milliseconds(5));
                     return provider();
                   };
                   InMemoryJobStore store;
                   BoundedJobQueue queue(10);
                   JobService service(store, queue);
                   JobProcessor processor(store, queue, slowProvider);
                   processor.start();

                   SubmitResult inFlight = service.submitJob(
                       JobKind::DataTransfer, transferParams("dst"));
                   while (!entered.load())
                     std::this_thread::sleep_for(std::chrono::milliseconds(5));
                   SubmitResult queued = service.submitJob(
                       JobKind::DataTransfer, transferParams("dst"));

                   std::thread releaser([&release]() {
                     std::this_thread::sleep_for(
                         std::chrono::milliseconds(100));
                     release = true;
                   });
                   processor.stop(std::chrono::seconds(0));
                   releaser.join();

                   runner.assertEquals(
                       std::string("Cancelled"),
                       jobStatusToString(
                           service.getJobStatus(queued.jobId).status),
                       "Queued job abandoned");
                   runner.assertEquals(
                       std::string("Cancelled"),
                       jobStatusToString(
                           service.getJobStatus(inFlight.jobId).status),
                       "In-flight job observed the shutdown signal");
                   runner.assertThrows<RelayError>(
                       [&]() {
                         service.submitJob(JobKind::DataTransfer,
                                           transferParams("dst"));
                       },
                       "Submissions after shutdown are refused");
                 });

  runner.runTest("Cancel is refused once the worker has started the job",
                 [&]() {
                   std::atomic<bool> release{false};
                   std::atomic<bool> entered{false};
                   auto blockingProvider = [&release, &entered, provider]() {
                     entered = true;
                     while (!release.load())
                       std::this_thread::sleep_for(
                           std::chrono::milliseconds(5));
                     return provider();
                   };
                   dst->tables["people_copy"].rows.clear();
                   InMemoryJobStore store;
                   BoundedJobQueue queue(10);
                   JobService service(store, queue);
                   JobProcessor processor(store, queue, blockingProvider);
                   processor.start();

                   SubmitResult running = service.submitJob(
                       JobKind::DataTransfer, transferParams("dst"));
                   while (!entered.load())
                     std::this_thread::sleep_for(std::chrono::milliseconds(5));

                   runner.assertEquals(
                       std::string("Running"),
                       jobStatusToString(
                           service.getJobStatus(running.jobId).status),
                       "Worker moved the job to Running");
                   runner.assertFalse(service.cancelJob(running.jobId),
                                      "Running job cannot be cancelled");

                   release = true;
                   runner.assertTrue(waitForTerminal(store, running.jobId),
                                     "Job finishes");
                   processor.stop(std::chrono::seconds(5));
                   runner.assertEquals(
                       std::string("Completed"),
                       jobStatusToString(
                           service.getJobStatus(running.jobId).status),
                       "Refused cancel left the job running to completion");
                 });

  runner.runTest("Stop right after start still cancels a just-dequeued job",
                 [&]() {
                   auto delayedProvider = [provider]() {
                     std::this_thread::sleep_for(std::chrono::milliseconds(20));
                     return provider();
                   };
                   dst->tables["people_copy"].rows.clear();
                   int notCancelled = 0;
                   auto slowest = std::chrono::milliseconds(0);
                   for (int round = 0; round < 50; ++round) {
                     InMemoryJobStore store;
                     BoundedJobQueue queue(10);
                     JobService service(store, queue);
                     JobProcessor processor(store, queue, delayedProvider);
                     processor.start();
                     SubmitResult submitted = service.submitJob(
                         JobKind::DataTransfer, transferParams("dst"));

                     auto began = std::chrono::steady_clock::now();
                     processor.stop(std::chrono::seconds(0));
                     auto took =
                         std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - began);
                     if (took > slowest)
                       slowest = took;

                     if (service.getJobStatus(submitted.jobId).status !=
                         JobStatus::Cancelled)
                       ++notCancelled;
                   }
                   runner.assertEquals(0, notCancelled,
                                       "Every round ends Cancelled");
                   runner.assertTrue(slowest < std::chrono::milliseconds(2000),
                                     "Stop returns promptly");
                   runner.assertEquals(0, dst->rowsOf("people_copy").size(),
                                       "No batch was written");
                 });

  runner.runTest("Command handler round trip", [&]() {
    InMemoryJobStore store;
    BoundedJobQueue queue(10);
    JobService service(store, queue);
    CommandHandler handler(service);

    json submit = json::parse(handler.handleLine(
        json{{"op", "submit"},
             {"kind", "DataTransfer"},
             {"parameters", transferParams("dst")}}
            .dump()));
    runner.assertTrue(submit["ok"].get<bool>(), "submit ok");
    std::string jobId = submit["jobId"].get<std::string>();

    json status = handler.handle({{"op", "status"}, {"jobId", jobId}});
    runner.assertEquals(std::string("Pending"),
                        status["job"]["status"].get<std::string>(),
                        "status reports Pending");

    json list = handler.handle({{"op", "list"}, {"limit", 5}});
    runner.assertEquals(1, list["jobs"].size(), "list returns the job");

    json cancel = handler.handle({{"op", "cancel"}, {"jobId", jobId}});
    runner.assertTrue(cancel["cancelled"].get<bool>(), "cancel succeeded");

    json filtered = handler.handle(
        {{"op", "list"}, {"status", "Cancelled"}});
    runner.assertEquals(1, filtered["jobs"].size(), "status filter");

    json missing = handler.handle({{"op", "status"}, {"jobId", "zzz"}});
    runner.assertFalse(missing["ok"].get<bool>(), "unknown job fails");
    runner.assertEquals(std::string("NotFound"),
                        missing["errorKind"].get<std::string>(), "NotFound");

    json garbage = json::parse(handler.handleLine("{not json"));
    runner.assertEquals(std::string("Validation"),
                        garbage["errorKind"].get<std::string>(),
                        "Bad JSON is a Validation error");

    json unknown = handler.handle({{"op", "explode"}});
    runner.assertEquals(std::string("Validation"),
                        unknown["errorKind"].get<std::string>(),
                        "Unknown op is a Validation error");
  });

  runner.printSummary();
  return 0;
}
