/**
 * @file job_manager.hpp
 * @brief Bounded worker pool driving job pipelines
 *
 * @details The JobManager owns the scheduling side of the service:
 *
 *          - MAX_ACTIVE_JOBS worker threads drain a FIFO JobQueue, each
 *            running one JobPipeline at a time
 *
 *          - submit() validates a request and inserts a Queued record
 *
 *          - remove() implements deletion: queued jobs are dropped, running
 *            jobs are cancelled at their next suspension point, finished
 *            jobs are erased together with their outputs
 *
 *          - A janitor thread evicts terminal jobs older than the retention
 *            window and sweeps old files from the temp directory
 *
 * @note The JobStore is injected and outlives the manager.
 */

#ifndef REEL_CUT_JOB_MANAGER_HPP
#define REEL_CUT_JOB_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "job_queue.hpp"
#include "job_store.hpp"
#include "pipeline.hpp"
#include "validation.hpp"

namespace reel_cut {

/// Builds the collaborators of one job (fresh analyzer set per job)
using CollaboratorFactory = std::function<PipelineCollaborators()>;

/**
 * @struct JobManagerOptions
 * @brief Scheduling and retention settings, filled by from_config().
 */
struct JobManagerOptions {
  int max_active_jobs = 1;
  std::chrono::seconds retention{std::chrono::hours(24)};
  std::chrono::milliseconds janitor_interval{std::chrono::seconds(60)};
  bool run_janitor = true;
  PipelineOptions pipeline;

  static JobManagerOptions from_config();
};

/**
 * @struct SubmitResult
 * @brief Outcome of submit(): a job id or a validation error.
 */
struct SubmitResult {
  bool ok = false;
  JobId id;
  ValidationError error = ValidationError::None;
  std::string message;
  explicit operator bool() const noexcept { return ok; }
};

enum class RemoveOutcome : uint8_t {
  NotFound = 0,
  Removed,        //< Record and artifacts are gone
  CancelRequested //< Running; its worker cancels, cleans up and erases it
};

class JobManager {
public:
  JobManager(JobStore &store, CollaboratorFactory factory,
             JobManagerOptions options);
  ~JobManager();

  JobManager(const JobManager &) = delete;
  JobManager &operator=(const JobManager &) = delete;

  /**
   * @brief Prepare the temp directory, sweep stale files, start threads.
   * @return false if the temp directory cannot be created
   */
  bool start();

  /**
   * @brief Cancel running jobs, fail queued ones and join every thread.
   * @note Idempotent. Rendered outputs are kept.
   */
  void shutdown();

  SubmitResult submit(const JobRequest &request);

  bool snapshot(const JobId &id, Job &out) const;

  /// Status surface of a job, or null when the id is unknown
  nlohmann::json status_json(const JobId &id) const;

  RemoveOutcome remove(const JobId &id);

  /**
   * @brief Block until the job is terminal or removed.
   * @param on_change Optional callback receiving each observed snapshot whose
   *                  progress or message changed
   * @return false if the timeout expired or the job vanished
   */
  bool wait(const JobId &id, std::chrono::milliseconds timeout,
            const std::function<void(const Job &)> &on_change = nullptr);

  /// Evict terminal jobs older than the retention window; returns count
  size_t evict_expired(std::chrono::system_clock::time_point now);

  /**
   * @brief Age-based sweep of downloads/ and outputs/.
   * @note The media file and output directory of every unfinished job are
   *       kept whatever their age.
   * @return Number of entries deleted
   */
  int sweep_files();

  int worker_count() const { return static_cast<int>(workers_.size()); }

private:
  /**
   * @struct ActiveJob
   * @brief Cancellation state of a job known to the manager.
   */
  struct ActiveJob {
    std::shared_ptr<std::atomic<bool>> cancel;
    bool running = false;
    bool delete_requested = false;
  };

  JobStore &store_;
  CollaboratorFactory factory_;
  JobManagerOptions options_;
  JobQueue queue_;

  mutable std::mutex mutex_; //< Guards active_
  std::unordered_map<JobId, ActiveJob> active_;

  std::vector<std::thread> workers_;
  std::thread janitor_;
  std::mutex janitor_mutex_;
  std::condition_variable janitor_cv_;
  bool stopping_ = false; //< Guarded by janitor_mutex_
  std::atomic<bool> started_{false};

  void worker_loop(int worker_id);
  void run_job(int worker_id, const JobId &id,
               const std::shared_ptr<std::atomic<bool>> &cancel);
  void janitor_loop();
};

} // namespace reel_cut

#endif // REEL_CUT_JOB_MANAGER_HPP
