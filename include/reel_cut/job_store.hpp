/**
 * @file job_store.hpp
 * @brief Thread-safe map of job records with atomic snapshots
 *
 * @details One JobStore instance is created by the owner of the job manager
 *          and injected wherever jobs are read or driven. The pipeline of a
 *          job is its only writer; pollers read copies taken under the lock,
 *          so a reader never observes a partially written record.
 *
 * @attention STATE RULES (enforced here, not by callers):
 *
 *   - Progress never decreases and stays within [0, 100]
 *
 *   - Stages only move forward
 *
 *   - A job becomes terminal exactly once, after which it is read-only
 *
 *   - Failed freezes progress at its last value
 */

#ifndef REEL_CUT_JOB_STORE_HPP
#define REEL_CUT_JOB_STORE_HPP

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "job.hpp"

namespace reel_cut {

class JobStore {
public:
  JobStore() = default;
  JobStore(const JobStore &) = delete;
  JobStore &operator=(const JobStore &) = delete;

  /// Insert a new record; false if the id already exists
  bool insert(Job job);

  /// Copy of a record; false if absent
  bool snapshot(const JobId &id, Job &out) const;

  bool contains(const JobId &id) const;

  /**
   * @brief Enter a later stage.
   * @return false if absent, terminal, or the stage is not later
   * @note Terminal stages are reached through complete() and fail() only.
   */
  bool advance(const JobId &id, Stage stage, int progress,
               const std::string &message);

  /**
   * @brief Raise progress (never lowers it) and optionally set the message.
   * @return false if absent or terminal
   */
  bool report_progress(const JobId &id, int progress,
                       const std::string &message = std::string());

  /// Record the media handle of a job (Downloading result)
  bool set_media(const JobId &id, const MediaHandle &media);

  /// Record analyzers that did not contribute to the job
  bool set_unavailable_analyzers(const JobId &id,
                                 std::vector<std::string> names);

  /// Completed at 100 with the final segment list; false if terminal
  bool complete(const JobId &id, std::vector<Segment> segments,
                const std::string &message);

  /// Failed with the error; progress frozen; false if terminal
  bool fail(const JobId &id, JobError error);

  bool erase(const JobId &id);

  std::vector<JobId> ids() const;

  /// Terminal jobs that finished before now - retention
  std::vector<JobId> expired(std::chrono::system_clock::time_point now,
                             std::chrono::seconds retention) const;

  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<JobId, Job> jobs_;

  Job *find_active(const JobId &id);
};

} // namespace reel_cut

#endif // REEL_CUT_JOB_STORE_HPP
