/**
 * @file validation.hpp
 * @brief Request validation performed before a job is created
 */

#ifndef REEL_CUT_VALIDATION_HPP
#define REEL_CUT_VALIDATION_HPP

#include <array>
#include <cstdint>
#include <string>

#include "job.hpp"

namespace reel_cut {

/// Accepted clip durations (seconds)
constexpr std::array<int, 5> ALLOWED_DURATIONS = {30, 60, 90, 120, 180};

/// Accepted clip counts
constexpr std::array<int, 3> ALLOWED_CLIP_COUNTS = {5, 10, 15};

enum class ValidationError : uint8_t {
  None = 0,
  InvalidUrl,
  InvalidDuration,
  InvalidClipCount
};

/**
 * @struct ValidationResult
 * @brief Outcome of validate_request().
 */
struct ValidationResult {
  bool ok = false;
  ValidationError error = ValidationError::None;
  std::string message;
  explicit operator bool() const noexcept { return ok; }
};

/// watch, embed, v, youtu.be and shorts forms with an 11-char id
bool is_youtube_url(const std::string &url);

/// The 11-char video id, or empty when the URL has none
std::string extract_video_id(const std::string &url);

bool is_allowed_duration(int seconds);
bool is_allowed_clip_count(int count);

ValidationResult validate_request(const JobRequest &request);

} // namespace reel_cut

#endif // REEL_CUT_VALIDATION_HPP
