/**
 * @file job.hpp
 * @brief Job record and its externally observable status
 */

#ifndef REEL_CUT_JOB_HPP
#define REEL_CUT_JOB_HPP

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "media.hpp"
#include "types.hpp"

namespace reel_cut {

/**
 * @struct JobRequest
 * @brief What the caller asked for.
 */
struct JobRequest {
  std::string source_url;
  int clip_duration = 60; //< Seconds, one of ALLOWED_DURATIONS
  int clip_count = 5;     //< One of ALLOWED_CLIP_COUNTS
};

/**
 * @struct JobError
 * @brief Terminal error of a job.
 */
struct JobError {
  ErrorKind kind = ErrorKind::None;
  std::string sub_kind; //< e.g. "private", "no_signals"
  std::string message;
};

/**
 * @struct Job
 * @brief One job record as held by the JobStore.
 */
struct Job {
  JobId id;
  JobRequest request;
  Stage stage = Stage::Queued;
  int progress = 0; //< 0..100, never decreases
  std::string message;
  std::vector<Segment> segments;
  JobError error;
  MediaHandle media;
  std::vector<std::string> unavailable_analyzers;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point finished_at; //< Set when terminal
};

/**
 * @brief Status surface of a job.
 * @details {job_id, stage, progress, message, segments | null, error | null}.
 *          segments stays null until the job is Completed.
 */
nlohmann::json to_status_json(const Job &job);

/**
 * @brief Generate a random job id (RFC 4122 version 4 layout).
 */
JobId generate_job_id();

} // namespace reel_cut

#endif // REEL_CUT_JOB_HPP
