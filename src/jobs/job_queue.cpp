#include "jobs/job_queue.h"
#include "core/logger.h"
#include <stdexcept>

BoundedJobQueue::BoundedJobQueue(size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("Job queue capacity must be greater than zero");
  }
}

EnqueueResult BoundedJobQueue::enqueue(const std::string &jobId) {
  EnqueueResult result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
      return result;

    if (items_.size() >= capacity_) {
      result.saturated = true;
      result.droppedJobId = items_.front();
      items_.pop_front();
    }
    items_.push_back(jobId);
    result.accepted = true;
  }
  notEmpty_.notify_one();

  if (result.saturated) {
    Logger::warning(LogCategory::QUEUE, "BoundedJobQueue::enqueue",
                    "Queue at capacity " + std::to_string(capacity_) +
                        "; dropped oldest job " + *result.droppedJobId);
  }
  return result;
}

bool BoundedJobQueue::dequeue(std::string &jobId) {
  std::unique_lock<std::mutex> lock(mutex_);
  notEmpty_.wait(lock, [this] { return !items_.empty() || closed_; });
  if (closed_)
    return false;
  jobId = std::move(items_.front());
  items_.pop_front();
  return true;
}

bool BoundedJobQueue::dequeueFor(std::string &jobId,
                                 std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!notEmpty_.wait_for(lock, timeout,
                          [this] { return !items_.empty() || closed_; })) {
    return false;
  }
  if (closed_)
    return false;
  jobId = std::move(items_.front());
  items_.pop_front();
  return true;
}

bool BoundedJobQueue::tryDequeue(std::string &jobId) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || items_.empty())
    return false;
  jobId = std::move(items_.front());
  items_.pop_front();
  return true;
}

std::vector<std::string> BoundedJobQueue::close() {
  std::vector<std::string> abandoned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
      return abandoned;
    closed_ = true;
    abandoned.assign(items_.begin(), items_.end());
    items_.clear();
  }
  notEmpty_.notify_all();
  Logger::info(LogCategory::QUEUE, "BoundedJobQueue::close",
               "Queue closed with " + std::to_string(abandoned.size()) +
                   " job(s) still queued");
  return abandoned;
}

bool BoundedJobQueue::isClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t BoundedJobQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}
