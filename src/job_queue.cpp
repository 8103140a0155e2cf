/**
 * @file job_queue.cpp
 * @brief Job queue implementation
 */

#include "reel_cut/job_queue.hpp"

namespace reel_cut {

bool JobQueue::push(JobId id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_.load())
      return false;
    ids_.push(std::move(id));
  }
  cv_.notify_one();
  return true;
}

bool JobQueue::pop(JobId &id) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !ids_.empty() || done_.load(); });

  if (done_.load())
    return false;

  id = std::move(ids_.front());
  ids_.pop();
  return true;
}

void JobQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

} // namespace reel_cut
