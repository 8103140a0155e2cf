/**
 * @file cleanup.cpp
 * @brief Artifact eviction implementation
 */

#include "reel_cut/cleanup.hpp"

#include <system_error>

#include "reel_cut/logging.hpp"

namespace fs = std::filesystem;

namespace reel_cut {

namespace {

bool held(const fs::path &p, const std::set<std::string> &in_use) {
  return !in_use.empty() && in_use.count(artifact_key(p)) > 0;
}

bool older_than(const fs::path &p, fs::file_time_type threshold,
                bool everything) {
  if (everything)
    return true;
  std::error_code ec;
  auto mtime = fs::last_write_time(p, ec);
  return !ec && mtime < threshold;
}

} // namespace

std::string artifact_key(const fs::path &p) {
  std::error_code ec;
  fs::path abs = fs::absolute(p, ec);
  return (ec ? p : abs).lexically_normal().string();
}

fs::path downloads_dir(const fs::path &temp_dir) {
  return temp_dir / "downloads";
}

fs::path outputs_dir(const fs::path &temp_dir) { return temp_dir / "outputs"; }

fs::path job_output_dir(const fs::path &temp_dir, const std::string &job_id) {
  return outputs_dir(temp_dir) / job_id;
}

bool ensure_temp_directories(const fs::path &temp_dir) {
  std::error_code ec;
  fs::create_directories(downloads_dir(temp_dir), ec);
  if (ec) {
    LOG_ERROR("Cannot create {}: {}", downloads_dir(temp_dir).string(),
              ec.message());
    return false;
  }
  fs::create_directories(outputs_dir(temp_dir), ec);
  if (ec) {
    LOG_ERROR("Cannot create {}: {}", outputs_dir(temp_dir).string(),
              ec.message());
    return false;
  }
  return true;
}

int cleanup_old_files(const fs::path &temp_dir, std::chrono::seconds max_age,
                      const std::set<std::string> &in_use) {
  int deleted = 0;
  std::error_code ec;
  if (!fs::exists(temp_dir, ec))
    return 0;

  const bool everything = max_age.count() == 0;
  const auto threshold = fs::file_time_type::clock::now() - max_age;

  fs::path downloads = downloads_dir(temp_dir);
  if (fs::is_directory(downloads, ec)) {
    for (const auto &entry : fs::directory_iterator(downloads, ec)) {
      if (held(entry.path(), in_use) ||
          !older_than(entry.path(), threshold, everything))
        continue;
      std::error_code rm_ec;
      fs::remove_all(entry.path(), rm_ec);
      if (rm_ec) {
        LOG_ERROR("Error deleting {}: {}", entry.path().string(),
                  rm_ec.message());
        continue;
      }
      ++deleted;
      LOG_INFO("Deleted old download: {}", entry.path().filename().string());
    }
  }

  fs::path outputs = outputs_dir(temp_dir);
  if (fs::is_directory(outputs, ec)) {
    for (const auto &entry : fs::directory_iterator(outputs, ec)) {
      std::error_code dir_ec;
      if (!entry.is_directory(dir_ec) || held(entry.path(), in_use) ||
          !older_than(entry.path(), threshold, everything))
        continue;
      std::error_code rm_ec;
      fs::remove_all(entry.path(), rm_ec);
      if (rm_ec) {
        LOG_ERROR("Error deleting {}: {}", entry.path().string(),
                  rm_ec.message());
        continue;
      }
      ++deleted;
      LOG_INFO("Deleted old job directory: {}",
               entry.path().filename().string());
    }
  }
  return deleted;
}

bool remove_job_artifacts(const fs::path &temp_dir, const std::string &job_id) {
  if (job_id.empty())
    return false;
  std::error_code ec;
  fs::remove_all(job_output_dir(temp_dir, job_id), ec);
  if (ec) {
    LOG_WARN("Could not remove artifacts of job {}: {}", job_id, ec.message());
    return false;
  }
  return true;
}

StorageUsage storage_usage(const fs::path &temp_dir) {
  StorageUsage usage;
  std::error_code ec;
  if (!fs::exists(temp_dir, ec))
    return usage;

  for (auto it = fs::recursive_directory_iterator(temp_dir, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code file_ec;
    if (!it->is_regular_file(file_ec))
      continue;
    uintmax_t size = it->file_size(file_ec);
    if (file_ec)
      continue;
    usage.bytes += size;
    ++usage.files;
  }
  return usage;
}

} // namespace reel_cut
