/**
 * @file types.cpp
 * @brief Display names for the core and collaborator enumerations
 */

#include "reel_cut/types.hpp"
#include "reel_cut/media.hpp"

namespace reel_cut {

const char *analyzer_name(AnalyzerKind kind) {
  switch (kind) {
  case AnalyzerKind::Semantic:
    return "semantic";
  case AnalyzerKind::Audio:
    return "audio";
  case AnalyzerKind::Motion:
    return "motion";
  case AnalyzerKind::Scene:
    return "scene";
  case AnalyzerKind::Faces:
    return "faces";
  }
  return "unknown";
}

const char *stage_name(Stage stage) {
  switch (stage) {
  case Stage::Queued:
    return "queued";
  case Stage::Downloading:
    return "downloading";
  case Stage::Analyzing:
    return "analyzing";
  case Stage::Processing:
    return "processing";
  case Stage::Completed:
    return "completed";
  case Stage::Failed:
    return "failed";
  }
  return "unknown";
}

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::Validation:
    return "validation_error";
  case ErrorKind::Download:
    return "download_error";
  case ErrorKind::Analysis:
    return "analysis_error";
  case ErrorKind::Render:
    return "render_error";
  case ErrorKind::System:
    return "system_error";
  case ErrorKind::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

const char *fetch_error_name(FetchError error) {
  switch (error) {
  case FetchError::None:
    return "none";
  case FetchError::InvalidSource:
    return "invalid_source";
  case FetchError::Unavailable:
    return "unavailable";
  case FetchError::Private:
    return "private";
  case FetchError::RegionLocked:
    return "region_locked";
  case FetchError::TooLong:
    return "too_long";
  case FetchError::LiveStream:
    return "live_stream";
  case FetchError::ToolFailure:
    return "tool_failure";
  case FetchError::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

const char *render_error_name(RenderError error) {
  switch (error) {
  case RenderError::None:
    return "none";
  case RenderError::InvalidWindow:
    return "invalid_window";
  case RenderError::EncodeFailed:
    return "encode_failed";
  case RenderError::OutputMissing:
    return "output_missing";
  }
  return "unknown";
}

} // namespace reel_cut
