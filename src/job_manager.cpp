/**
 * @file job_manager.cpp
 * @brief Worker pool, deletion and retention implementation
 */

#include "reel_cut/job_manager.hpp"

#include <algorithm>
#include <set>

#include <fmt/core.h>

#include "reel_cut/cleanup.hpp"
#include "reel_cut/config.hpp"
#include "reel_cut/logging.hpp"
#include "reel_cut/system.hpp"

namespace reel_cut {

namespace {

/// Poll period of wait()
constexpr auto WAIT_POLL_INTERVAL = std::chrono::milliseconds(100);

JobError cancelled_error(const std::string &message) {
  JobError error;
  error.kind = ErrorKind::Cancelled;
  error.message = message;
  return error;
}

} // namespace

// **---- Options ----**

JobManagerOptions JobManagerOptions::from_config() {
  JobManagerOptions o;
  o.max_active_jobs = Config::max_active_jobs();
  if (o.max_active_jobs <= 0)
    o.max_active_jobs = std::max(1, detect_cpu_limit() / 2);
  o.retention = std::chrono::hours(std::max(0, Config::job_retention_hours()));
  o.janitor_interval =
      std::chrono::seconds(std::max(1, Config::janitor_interval_sec()));
  o.pipeline = PipelineOptions::from_config();
  return o;
}

// **---- Lifecycle ----**

JobManager::JobManager(JobStore &store, CollaboratorFactory factory,
                       JobManagerOptions options)
    : store_(store), factory_(std::move(factory)),
      options_(std::move(options)) {}

JobManager::~JobManager() { shutdown(); }

bool JobManager::start() {
  if (started_.load())
    return true;

  const auto &temp_dir = options_.pipeline.temp_dir;
  if (!ensure_temp_directories(temp_dir))
    return false;

  int swept = sweep_files();
  if (swept > 0)
    LOG_INFO("Startup cleanup removed {} stale items", swept);

  started_.store(true);
  int n = std::max(1, options_.max_active_jobs);
  workers_.reserve(n);
  for (int i = 0; i < n; ++i)
    workers_.emplace_back(&JobManager::worker_loop, this, i);

  if (options_.run_janitor)
    janitor_ = std::thread(&JobManager::janitor_loop, this);

  LOG_INFO("Job manager started ({} workers, retention {}h)", n,
           std::chrono::duration_cast<std::chrono::hours>(options_.retention)
               .count());
  return true;
}

void JobManager::shutdown() {
  if (!started_.exchange(false))
    return;

  {
    std::lock_guard<std::mutex> lock(janitor_mutex_);
    stopping_ = true;
  }
  janitor_cv_.notify_all();
  queue_.finish();

  std::vector<JobId> queued;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = active_.begin(); it != active_.end();) {
      if (it->second.running) {
        it->second.cancel->store(true);
        ++it;
      } else {
        queued.push_back(it->first);
        it = active_.erase(it);
      }
    }
  }
  for (const auto &id : queued)
    store_.fail(id, cancelled_error("Service shutting down"));

  for (auto &w : workers_)
    if (w.joinable())
      w.join();
  workers_.clear();

  if (janitor_.joinable())
    janitor_.join();
}

// **---- Submission ----**

SubmitResult JobManager::submit(const JobRequest &request) {
  SubmitResult result;
  ValidationResult valid = validate_request(request);
  if (!valid) {
    result.error = valid.error;
    result.message = valid.message;
    LOG_WARN("Rejected request: {}", valid.message);
    return result;
  }
  if (!started_.load()) {
    result.message = "Job manager is not running";
    return result;
  }

  Job job;
  job.id = generate_job_id();
  job.request = request;
  job.stage = Stage::Queued;
  job.progress = 0;
  job.message = "Job queued";
  job.created_at = std::chrono::system_clock::now();

  JobId id = job.id;
  if (!store_.insert(std::move(job))) {
    result.message = "Job id collision";
    return result;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    ActiveJob active;
    active.cancel = std::make_shared<std::atomic<bool>>(false);
    active_.emplace(id, std::move(active));
  }

  if (!queue_.push(id)) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      active_.erase(id);
    }
    store_.fail(id, cancelled_error("Service shutting down"));
    result.message = "Job manager is shutting down";
    return result;
  }

  LOG_INFO("[Job {}] Queued: {} ({} x {}s)", id.substr(0, 8),
           request.source_url, request.clip_count, request.clip_duration);
  result.ok = true;
  result.id = id;
  return result;
}

// **---- Queries ----**

bool JobManager::snapshot(const JobId &id, Job &out) const {
  return store_.snapshot(id, out);
}

nlohmann::json JobManager::status_json(const JobId &id) const {
  Job job;
  if (!store_.snapshot(id, job))
    return nullptr;
  return to_status_json(job);
}

bool JobManager::wait(const JobId &id, std::chrono::milliseconds timeout,
                      const std::function<void(const Job &)> &on_change) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  int last_progress = -1;
  std::string last_message;
  Stage last_stage = Stage::Queued;

  while (true) {
    Job job;
    if (!store_.snapshot(id, job))
      return false;

    if (on_change && (job.progress != last_progress ||
                      job.message != last_message || job.stage != last_stage)) {
      on_change(job);
      last_progress = job.progress;
      last_message = job.message;
      last_stage = job.stage;
    }
    if (is_terminal(job.stage))
      return true;
    if (std::chrono::steady_clock::now() >= deadline)
      return false;
    std::this_thread::sleep_for(WAIT_POLL_INTERVAL);
  }
}

// **---- Deletion ----**

RemoveOutcome JobManager::remove(const JobId &id) {
  const auto &temp_dir = options_.pipeline.temp_dir;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it != active_.end()) {
      if (it->second.running) {
        it->second.cancel->store(true);
        it->second.delete_requested = true;
        LOG_INFO("[Job {}] Cancellation requested", id.substr(0, 8));
        return RemoveOutcome::CancelRequested;
      }
      // Still queued: the worker skips ids missing from active_
      active_.erase(it);
      lock.unlock();
      store_.fail(id, cancelled_error("Job deleted before start"));
      store_.erase(id);
      remove_job_artifacts(temp_dir, id);
      LOG_INFO("[Job {}] Deleted before start", id.substr(0, 8));
      return RemoveOutcome::Removed;
    }
  }

  if (!store_.erase(id))
    return RemoveOutcome::NotFound;
  remove_job_artifacts(temp_dir, id);
  LOG_INFO("[Job {}] Deleted", id.substr(0, 8));
  return RemoveOutcome::Removed;
}

// **---- Workers ----**

void JobManager::worker_loop(int worker_id) {
  JobId id;
  while (queue_.pop(id)) {
    std::shared_ptr<std::atomic<bool>> cancel;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = active_.find(id);
      if (it == active_.end())
        continue;
      it->second.running = true;
      cancel = it->second.cancel;
    }

    run_job(worker_id, id, cancel);

    bool delete_requested = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = active_.find(id);
      if (it != active_.end()) {
        delete_requested = it->second.delete_requested;
        active_.erase(it);
      }
    }
    if (delete_requested) {
      remove_job_artifacts(options_.pipeline.temp_dir, id);
      store_.erase(id);
      LOG_INFO("[Job {}] Deleted after cancellation", id.substr(0, 8));
    }
  }
}

void JobManager::run_job(int worker_id,
                         const JobId &id,
                         const std::shared_ptr<std::atomic<bool>> &cancel) {
  Job job;
  if (!store_.snapshot(id, job) || job.stage != Stage::Queued)
    return;

  LOG_DEBUG("[Job {}] Picked up by worker {}", id.substr(0, 8), worker_id);
  try {
    PipelineCollaborators collaborators = factory_();
    if (!collaborators.fetcher || !collaborators.renderer) {
      JobError error;
      error.kind = ErrorKind::System;
      error.message = "Media collaborators are not configured";
      store_.fail(id, std::move(error));
      return;
    }
    JobPipeline pipeline(id, store_, collaborators, options_.pipeline,
                         *cancel);
    pipeline.run();
  } catch (const std::exception &e) {
    LOG_ERROR("[Job {}] Worker {} crashed: {}", id.substr(0, 8), worker_id,
              e.what());
    TimingCollector::clear(id);
    JobError error;
    error.kind = ErrorKind::System;
    error.message = "Internal error while processing the job";
    store_.fail(id, std::move(error));
  }
}

// **---- Retention ----**

size_t JobManager::evict_expired(std::chrono::system_clock::time_point now) {
  size_t evicted = 0;
  for (const auto &id : store_.expired(now, options_.retention)) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (active_.count(id) > 0)
        continue;
    }
    if (store_.erase(id)) {
      remove_job_artifacts(options_.pipeline.temp_dir, id);
      ++evicted;
    }
  }
  if (evicted > 0)
    LOG_INFO("Evicted {} expired jobs", evicted);
  return evicted;
}

int JobManager::sweep_files() {
  const auto &temp_dir = options_.pipeline.temp_dir;
  std::set<std::string> in_use;
  for (const auto &id : store_.ids()) {
    Job job;
    if (!store_.snapshot(id, job) || is_terminal(job.stage))
      continue;
    if (!job.media.path.empty())
      in_use.insert(artifact_key(job.media.path));
    in_use.insert(artifact_key(job_output_dir(temp_dir, id)));
  }
  return cleanup_old_files(temp_dir, options_.retention, in_use);
}

void JobManager::janitor_loop() {
  std::unique_lock<std::mutex> lock(janitor_mutex_);
  while (!stopping_) {
    if (janitor_cv_.wait_for(lock, options_.janitor_interval,
                             [this] { return stopping_; }))
      break;

    lock.unlock();
    evict_expired(std::chrono::system_clock::now());
    int swept = sweep_files();
    if (swept > 0)
      LOG_INFO("Janitor removed {} stale items", swept);
    StorageUsage usage = storage_usage(options_.pipeline.temp_dir);
    LOG_DEBUG("Janitor: {} jobs tracked, {} files, {:.1f} MB on disk",
              store_.size(), usage.files, usage.bytes / (1024.0 * 1024.0));
    lock.lock();
  }
}

} // namespace reel_cut
