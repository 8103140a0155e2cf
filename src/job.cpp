/**
 * @file job.cpp
 * @brief Job status serialization and id generation
 */

#include "reel_cut/job.hpp"

#include <cmath>
#include <filesystem>
#include <random>

#include <fmt/core.h>

namespace reel_cut {

namespace {

double round2(double v) { return std::round(v * 100.0) / 100.0; }

nlohmann::json segment_json(const Segment &s) {
  nlohmann::json j;
  j["index"] = s.index;
  j["rank"] = s.rank;
  j["start_time"] = round2(s.start);
  j["end_time"] = round2(s.end);
  j["duration"] = round2(s.end - s.start);
  j["score"] = round2(s.score);
  j["reasons"] = s.reasons;
  if (s.rendered())
    j["filename"] = std::filesystem::path(s.output).filename().string();
  else
    j["filename"] = nullptr;
  if (s.render_error.empty())
    j["render_error"] = nullptr;
  else
    j["render_error"] = s.render_error;
  return j;
}

} // namespace

nlohmann::json to_status_json(const Job &job) {
  nlohmann::json j;
  j["job_id"] = job.id;
  j["stage"] = stage_name(job.stage);
  j["progress"] = job.progress;
  j["message"] = job.message;

  if (job.stage == Stage::Completed) {
    j["segments"] = nlohmann::json::array();
    for (const auto &s : job.segments)
      j["segments"].push_back(segment_json(s));
  } else {
    j["segments"] = nullptr;
  }

  if (job.stage == Stage::Failed) {
    nlohmann::json e;
    e["kind"] = error_kind_name(job.error.kind);
    if (!job.error.sub_kind.empty())
      e["sub_kind"] = job.error.sub_kind;
    e["message"] = job.error.message;
    j["error"] = e;
  } else {
    j["error"] = nullptr;
  }
  return j;
}

JobId generate_job_id() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  uint64_t hi = rng();
  uint64_t lo = rng();

  // Version 4, variant 10
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                     static_cast<uint32_t>(hi >> 32),
                     static_cast<uint32_t>((hi >> 16) & 0xFFFF),
                     static_cast<uint32_t>(hi & 0xFFFF),
                     static_cast<uint32_t>(lo >> 48),
                     lo & 0xFFFFFFFFFFFFULL);
}

} // namespace reel_cut
