/**
 * @file reel_cut_curve.cpp
 * @brief Engagement curve dump utility
 *
 * @details Runs the five analyzers, fusion and selection on a local media
 *          file and prints the result as JSON. No download, no rendering.
 *          Log lines precede the JSON document, which starts at the first
 *          line beginning with '{'.
 *
 * @usage
 *   reel_cut_curve video.mp4 [duration_sec] [clip_count] > curve.json
 */

#include <atomic>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "reel_cut/collaborators.hpp"
#include "reel_cut/logging.hpp"
#include "reel_cut/media_decoder.hpp"
#include "reel_cut/pipeline.hpp"

using json = nlohmann::json;
using namespace reel_cut;

static double round2(double v) { return std::round(v * 100.0) / 100.0; }

int main(int argc, char **argv) {
  if (argc < 2) {
    LOG_WARN("Usage: {} <media_file> [duration_sec] [clip_count]", argv[0]);
    return 1;
  }

  const std::string path = argv[1];
  const double clip_duration = argc > 2 ? std::atof(argv[2]) : 60.0;
  const int clip_count = argc > 3 ? std::atoi(argv[3]) : 5;
  if (clip_duration <= 0 || clip_count <= 0) {
    LOG_ERROR("Duration and clip count must be positive");
    return 1;
  }

  MediaHandle media;
  std::string error;
  if (!probe_media(path, media, error)) {
    LOG_ERROR("Cannot open {}: {}", path, error);
    return 1;
  }
  LOG_INFO("{}: {}x{} @ {:.2f} fps, {}, audio: {}", path, media.width,
           media.height, media.fps, format_time(media.duration),
           media.has_audio ? "yes" : "no");

  auto analyzers = make_default_analyzers();
  std::atomic<bool> cancel{false};
  AnalysisOutcome outcome;

  bool ok = JobPipeline::analyze_media(
      "curve", media, analyzers, PipelineOptions::from_config(),
      clip_duration, clip_count, cancel,
      [](double f) { LOG_DEBUG("Analysis {:.0f}%", f * 100.0); }, outcome);
  if (!ok) {
    LOG_ERROR("No analyzer produced a usable signal");
    return 2;
  }

  json out;
  out["media"] = {{"path", media.path},
                  {"duration", media.duration},
                  {"width", media.width},
                  {"height", media.height}};

  json analyzers_json = json::object();
  for (const auto &r : outcome.results) {
    analyzers_json[analyzer_name(r.kind)] = {
        {"available", r.available},
        {"reason", r.available ? json(nullptr) : json(r.reason)},
        {"samples", r.points.size()},
        {"weight", round2(outcome.weights[r.kind])}};
  }
  out["analyzers"] = analyzers_json;

  json curve = json::array();
  for (const auto &p : outcome.curve.points)
    curve.push_back({{"t", p.timestamp},
                     {"score", round2(p.score)},
                     {"reasons", p.reasons}});
  out["curve"] = curve;

  json segments = json::array();
  for (const auto &s : outcome.segments)
    segments.push_back({{"index", s.index},
                        {"rank", s.rank},
                        {"start_time", s.start},
                        {"end_time", s.end},
                        {"score", round2(s.score)},
                        {"reasons", s.reasons}});
  out["segments"] = segments;

  fmt::print("{}\n", out.dump(2));
  return 0;
}
