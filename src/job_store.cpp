/**
 * @file job_store.cpp
 * @brief JobStore implementation
 */

#include "reel_cut/job_store.hpp"

#include <algorithm>

namespace reel_cut {

namespace {

int clamp_progress(int progress) { return std::min(100, std::max(0, progress)); }

} // namespace

Job *JobStore::find_active(const JobId &id) {
  auto it = jobs_.find(id);
  if (it == jobs_.end() || is_terminal(it->second.stage))
    return nullptr;
  return &it->second;
}

bool JobStore::insert(Job job) {
  std::lock_guard<std::mutex> lock(mutex_);
  JobId id = job.id;
  job.progress = clamp_progress(job.progress);
  return jobs_.emplace(std::move(id), std::move(job)).second;
}

bool JobStore::snapshot(const JobId &id, Job &out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end())
    return false;
  out = it->second;
  return true;
}

bool JobStore::contains(const JobId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.count(id) > 0;
}

bool JobStore::advance(const JobId &id, Stage stage, int progress,
                       const std::string &message) {
  if (is_terminal(stage))
    return false;
  std::lock_guard<std::mutex> lock(mutex_);
  Job *job = find_active(id);
  if (job == nullptr || stage <= job->stage)
    return false;
  job->stage = stage;
  job->progress = std::max(job->progress, clamp_progress(progress));
  job->message = message;
  return true;
}

bool JobStore::report_progress(const JobId &id, int progress,
                               const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  Job *job = find_active(id);
  if (job == nullptr)
    return false;
  job->progress = std::max(job->progress, clamp_progress(progress));
  if (!message.empty())
    job->message = message;
  return true;
}

bool JobStore::set_media(const JobId &id, const MediaHandle &media) {
  std::lock_guard<std::mutex> lock(mutex_);
  Job *job = find_active(id);
  if (job == nullptr)
    return false;
  job->media = media;
  return true;
}

bool JobStore::set_unavailable_analyzers(const JobId &id,
                                         std::vector<std::string> names) {
  std::lock_guard<std::mutex> lock(mutex_);
  Job *job = find_active(id);
  if (job == nullptr)
    return false;
  job->unavailable_analyzers = std::move(names);
  return true;
}

bool JobStore::complete(const JobId &id, std::vector<Segment> segments,
                        const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  Job *job = find_active(id);
  if (job == nullptr)
    return false;
  job->stage = Stage::Completed;
  job->progress = 100;
  job->message = message;
  job->segments = std::move(segments);
  job->finished_at = std::chrono::system_clock::now();
  return true;
}

bool JobStore::fail(const JobId &id, JobError error) {
  std::lock_guard<std::mutex> lock(mutex_);
  Job *job = find_active(id);
  if (job == nullptr)
    return false;
  job->stage = Stage::Failed;
  job->message = error.message;
  job->error = std::move(error);
  job->finished_at = std::chrono::system_clock::now();
  return true;
}

bool JobStore::erase(const JobId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.erase(id) > 0;
}

std::vector<JobId> JobStore::ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<JobId> out;
  out.reserve(jobs_.size());
  for (const auto &kv : jobs_)
    out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<JobId> JobStore::expired(std::chrono::system_clock::time_point now,
                                     std::chrono::seconds retention) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<JobId> out;
  for (const auto &kv : jobs_) {
    const Job &job = kv.second;
    if (is_terminal(job.stage) && job.finished_at + retention <= now)
      out.push_back(kv.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

size_t JobStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

} // namespace reel_cut
