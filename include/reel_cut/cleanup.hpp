/**
 * @file cleanup.hpp
 * @brief Time-based eviction of on-disk job artifacts
 *
 * @details Layout under the temp directory:
 *
 *          - downloads/<video_id>.mp4   shared download cache
 *
 *          - outputs/<job_id>/clip_N.mp4 rendered clips of one job
 */

#ifndef REEL_CUT_CLEANUP_HPP
#define REEL_CUT_CLEANUP_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>

namespace reel_cut {

std::filesystem::path downloads_dir(const std::filesystem::path &temp_dir);
std::filesystem::path outputs_dir(const std::filesystem::path &temp_dir);
std::filesystem::path job_output_dir(const std::filesystem::path &temp_dir,
                                     const std::string &job_id);

/// Create downloads/ and outputs/; false on filesystem error
bool ensure_temp_directories(const std::filesystem::path &temp_dir);

/// Absolute, lexically normal form used to compare artifact paths
std::string artifact_key(const std::filesystem::path &p);

/**
 * @brief Delete downloads and job output directories older than max_age.
 * @param max_age 0 deletes everything
 * @param in_use artifact_key() of entries held by unfinished jobs; never
 *               deleted whatever their age
 * @return Number of entries deleted
 */
int cleanup_old_files(const std::filesystem::path &temp_dir,
                      std::chrono::seconds max_age,
                      const std::set<std::string> &in_use = {});

/// Remove outputs/<job_id>; true if it is gone afterwards
bool remove_job_artifacts(const std::filesystem::path &temp_dir,
                          const std::string &job_id);

struct StorageUsage {
  uintmax_t bytes = 0;
  size_t files = 0;
};

/// Total size and count of regular files under the temp directory
StorageUsage storage_usage(const std::filesystem::path &temp_dir);

} // namespace reel_cut

#endif // REEL_CUT_CLEANUP_HPP
