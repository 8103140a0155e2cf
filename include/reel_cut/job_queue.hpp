/**
 * @file job_queue.hpp
 * @brief Thread-safe FIFO of job ids for the worker pool
 *
 * @details Producer-consumer hand-off between submit() and the job workers:
 *
 *          - JobManager::submit pushes the id of every accepted job
 *
 *          - Each worker pops ids in a loop and runs one pipeline at a time
 *
 *          - finish() wakes every worker for shutdown
 */

#ifndef REEL_CUT_JOB_QUEUE_HPP
#define REEL_CUT_JOB_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>

#include "types.hpp"

namespace reel_cut {

/**
 * @class JobQueue
 * @brief Blocking queue of job ids.
 *
 * @attention USAGE:
 *
 *   - push() after the job record is in the store
 *
 *   - pop() blocks until an id is available or the queue is finished
 *
 *   - After finish(), pop() returns false immediately; queued ids are dropped
 */
class JobQueue {
public:
  /**
   * @brief Push a job id to the queue.
   * @return false if the queue is already finished
   */
  bool push(JobId id);

  /**
   * @brief Pop a job id (blocking).
   * @param id Output: next job id
   * @return true if an id was retrieved, false if the queue is finished
   */
  bool pop(JobId &id);

  /**
   * @brief Stop accepting ids and wake all waiting workers.
   */
  void finish();

  bool is_finished() const { return done_.load(); }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ids_.size();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<JobId> ids_;
  std::atomic<bool> done_{false};
};

} // namespace reel_cut

#endif // REEL_CUT_JOB_QUEUE_HPP
