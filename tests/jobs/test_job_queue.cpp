#include "../common/test_runner.h"
#include "core/logger.h"
#include "jobs/job_queue.h"
#include <atomic>
#include <chrono>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

int main() {
  TestRunner runner;
  Logger::setLogLevel(LogLevel::ERROR);

  std::cout << "\n========================================" << std::endl;
  std::cout << "BOUNDED JOB QUEUE TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Dequeue returns ids in FIFO order", [&]() {
    BoundedJobQueue queue(10);
    queue.enqueue("a");
    queue.enqueue("b");
    queue.enqueue("c");

    std::string id;
    runner.assertTrue(queue.tryDequeue(id), "First dequeue should succeed");
    runner.assertEquals(std::string("a"), id, "First id");
    runner.assertTrue(queue.tryDequeue(id), "Second dequeue should succeed");
    runner.assertEquals(std::string("b"), id, "Second id");
    runner.assertTrue(queue.tryDequeue(id), "Third dequeue should succeed");
    runner.assertEquals(std::string("c"), id, "Third id");
    runner.assertFalse(queue.tryDequeue(id), "Queue should now be empty");
  });

  runner.runTest("Zero capacity is rejected", [&]() {
    runner.assertThrows<std::invalid_argument>(
        []() { BoundedJobQueue queue(0); }, "Capacity 0 should throw");
  });

  runner.runTest("Full queue drops the oldest entry", [&]() {
    BoundedJobQueue queue(2);
    EnqueueResult first = queue.enqueue("j1");
    EnqueueResult second = queue.enqueue("j2");
    runner.assertTrue(first.accepted && !first.saturated,
                      "First enqueue should not saturate");
    runner.assertTrue(second.accepted && !second.saturated,
                      "Second enqueue should not saturate");

    EnqueueResult third = queue.enqueue("j3");
    runner.assertTrue(third.accepted, "Over-capacity enqueue is accepted");
    runner.assertTrue(third.saturated, "Saturation should be signalled");
    runner.assertTrue(third.droppedJobId.has_value(),
                      "Dropped id should be reported");
    runner.assertEquals(std::string("j1"), third.droppedJobId.value_or(""),
                        "Oldest id is the one dropped");
    runner.assertEquals(2, queue.size(), "Size stays at capacity");

    std::string id;
    queue.tryDequeue(id);
    runner.assertEquals(std::string("j2"), id, "j2 is now first");
    queue.tryDequeue(id);
    runner.assertEquals(std::string("j3"), id, "j3 follows");
  });

  runner.runTest("Enqueue never blocks when saturated", [&]() {
    BoundedJobQueue queue(5);
    auto start = std::chrono::steady_clock::now();
    size_t saturated = 0;
    for (int i = 0; i < 1000; ++i) {
      if (queue.enqueue("job" + std::to_string(i)).saturated)
        ++saturated;
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    runner.assertEquals(995, saturated, "Every enqueue past capacity saturates");
    runner.assertEquals(5, queue.size(), "Size bounded by capacity");
    runner.assertTrue(elapsed < std::chrono::seconds(5),
                      "1000 enqueues should finish promptly");

    std::string id;
    queue.tryDequeue(id);
    runner.assertEquals(std::string("job995"), id,
                        "Survivors are the newest entries");
  });

  runner.runTest("Close wakes a blocked consumer", [&]() {
    BoundedJobQueue queue(4);
    std::atomic<bool> returned{false};
    std::atomic<bool> result{true};
    std::thread consumer([&]() {
      std::string id;
      result = queue.dequeue(id);
      returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    runner.assertFalse(returned.load(), "Consumer should be blocked");
    queue.close();
    consumer.join();
    runner.assertTrue(returned.load(), "Consumer should return after close");
    runner.assertFalse(result.load(), "Dequeue reports no more input");
  });

  runner.runTest("Close returns queued ids and refuses new ones", [&]() {
    BoundedJobQueue queue(4);
    queue.enqueue("x");
    queue.enqueue("y");
    std::vector<std::string> abandoned = queue.close();
    runner.assertEquals(2, abandoned.size(), "Both ids are abandoned");
    runner.assertEquals(std::string("x"), abandoned[0], "Order preserved");
    runner.assertTrue(queue.isClosed(), "Queue reports closed");

    EnqueueResult late = queue.enqueue("z");
    runner.assertFalse(late.accepted, "Enqueue after close is refused");

    std::string id;
    runner.assertFalse(queue.dequeueFor(id, std::chrono::milliseconds(10)),
                       "Nothing to dequeue after close");
    runner.assertTrue(queue.close().empty(), "Second close is a no-op");
  });

  runner.runTest("dequeueFor times out on an empty queue", [&]() {
    BoundedJobQueue queue(4);
    std::string id;
    runner.assertFalse(queue.dequeueFor(id, std::chrono::milliseconds(20)),
                       "Should time out");
  });

  runner.runTest("Concurrent producers lose nothing below capacity", [&]() {
    BoundedJobQueue queue(1000);
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
      producers.emplace_back([&queue, p]() {
        for (int i = 0; i < 100; ++i)
          queue.enqueue(std::to_string(p) + "-" + std::to_string(i));
      });
    }

    std::set<std::string> seen;
    std::thread consumer([&]() {
      std::string id;
      while (queue.dequeue(id))
        seen.insert(id);
    });

    for (auto &producer : producers)
      producer.join();
    while (queue.size() > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    consumer.join();

    runner.assertEquals(400, seen.size(), "All 400 ids should be consumed");
  });

  runner.printSummary();
  return 0;
}
