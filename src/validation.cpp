/**
 * @file validation.cpp
 * @brief Request validation implementation
 */

#include "reel_cut/validation.hpp"

#include <algorithm>
#include <regex>

#include <fmt/core.h>

namespace reel_cut {

namespace {

const std::array<std::regex, 5> &youtube_patterns() {
  static const std::array<std::regex, 5> patterns = {
      std::regex(R"(^(?:https?://)?(?:www\.|m\.)?youtube\.com/watch\?(?:.*&)?v=([A-Za-z0-9_-]{11}))"),
      std::regex(R"(^(?:https?://)?(?:www\.)?youtube\.com/embed/([A-Za-z0-9_-]{11}))"),
      std::regex(R"(^(?:https?://)?(?:www\.)?youtube\.com/v/([A-Za-z0-9_-]{11}))"),
      std::regex(R"(^(?:https?://)?youtu\.be/([A-Za-z0-9_-]{11}))"),
      std::regex(R"(^(?:https?://)?(?:www\.)?youtube\.com/shorts/([A-Za-z0-9_-]{11}))"),
  };
  return patterns;
}

} // namespace

std::string extract_video_id(const std::string &url) {
  std::smatch match;
  for (const auto &pattern : youtube_patterns()) {
    if (std::regex_search(url, match, pattern))
      return match[1].str();
  }
  return std::string();
}

bool is_youtube_url(const std::string &url) {
  return !extract_video_id(url).empty();
}

bool is_allowed_duration(int seconds) {
  return std::find(ALLOWED_DURATIONS.begin(), ALLOWED_DURATIONS.end(),
                   seconds) != ALLOWED_DURATIONS.end();
}

bool is_allowed_clip_count(int count) {
  return std::find(ALLOWED_CLIP_COUNTS.begin(), ALLOWED_CLIP_COUNTS.end(),
                   count) != ALLOWED_CLIP_COUNTS.end();
}

ValidationResult validate_request(const JobRequest &request) {
  ValidationResult r;
  if (!is_youtube_url(request.source_url)) {
    r.error = ValidationError::InvalidUrl;
    r.message = "Invalid YouTube URL. Please provide a valid YouTube video link.";
    return r;
  }
  if (!is_allowed_duration(request.clip_duration)) {
    r.error = ValidationError::InvalidDuration;
    r.message = fmt::format("Duration must be one of 30, 60, 90, 120 or 180 "
                            "seconds (got {})",
                            request.clip_duration);
    return r;
  }
  if (!is_allowed_clip_count(request.clip_count)) {
    r.error = ValidationError::InvalidClipCount;
    r.message = fmt::format("Clip count must be 5, 10 or 15 (got {})",
                            request.clip_count);
    return r;
  }
  r.ok = true;
  return r;
}

} // namespace reel_cut
