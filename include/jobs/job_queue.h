#ifndef JOB_QUEUE_H
#define JOB_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct EnqueueResult {
  bool accepted = false;
  bool saturated = false;
  std::optional<std::string> droppedJobId;
};

// Fixed-capacity FIFO of job ids. A full queue drops its oldest entry to make
// room, so enqueue never waits. Once closed, enqueue is refused and dequeue
// returns false.
class BoundedJobQueue {
  mutable std::mutex mutex_;
  std::condition_variable notEmpty_;
  std::deque<std::string> items_;
  const size_t capacity_;
  bool closed_ = false;

public:
  explicit BoundedJobQueue(size_t capacity);

  BoundedJobQueue(const BoundedJobQueue &) = delete;
  BoundedJobQueue &operator=(const BoundedJobQueue &) = delete;

  EnqueueResult enqueue(const std::string &jobId);

  // Blocks until an id is available or the queue is closed.
  bool dequeue(std::string &jobId);
  bool dequeueFor(std::string &jobId, std::chrono::milliseconds timeout);
  bool tryDequeue(std::string &jobId);

  // Returns the ids that were still queued; they will never be dequeued.
  std::vector<std::string> close();

  bool isClosed() const;
  size_t size() const;
  size_t capacity() const { return capacity_; }
};

#endif
