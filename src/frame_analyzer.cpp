/**
 * @file frame_analyzer.cpp
 * @brief Frame analyzer driver implementation
 */

#include "reel_cut/frame_analyzer.hpp"

#include <algorithm>

#include "reel_cut/logging.hpp"

namespace reel_cut {

AnalyzerResult FrameAnalyzer::analyze(const MediaHandle &media,
                                      const AnalyzeContext &ctx) {
  FrameSampler sampler(media.path);
  std::string error;
  if (!sampler.initialize(error))
    return AnalyzerResult::unavailable(kind(), error);

  FrameGeometry geo = geometry(media);
  if (geo.width > 0 && geo.height <= 0) {
    int src_w = std::max(1, sampler.source_width());
    int src_h = std::max(1, sampler.source_height());
    // Even height keeps chroma-subsampled scalers happy
    geo.height = std::max(2, (geo.width * src_h / src_w) & ~1);
  }

  const double interval =
      std::max(0.05, effective_interval(media, ctx.sample_interval));
  const double duration = media.duration > 0 ? media.duration : 1.0;

  AnalyzerResult result;
  result.kind = kind();
  result.available = true;
  result.sample_interval = interval;

  begin();
  SampleStatus status = sampler.sample(
      interval, geo.width, geo.height, geo.layout,
      [&](const SampledFrame &f) {
        if (ctx.cancelled())
          return false;

        const int type = f.layout == PixelLayout::Gray ? CV_8UC1 : CV_8UC3;
        cv::Mat mat(f.height, f.width, type, const_cast<uint8_t *>(f.data),
                    static_cast<size_t>(f.stride));

        ScorePoint p;
        p.timestamp = f.timestamp;
        if (score_frame(mat, f.timestamp, p.score))
          result.points.push_back(std::move(p));

        ctx.report(f.timestamp / duration);
        return true;
      });

  if (status == SampleStatus::Stopped)
    return AnalyzerResult::unavailable(kind(), "cancelled");
  if (status == SampleStatus::Failed && result.points.empty())
    return AnalyzerResult::unavailable(kind(), "video decoding failed");

  // Decoders may emit out-of-order timestamps around edit lists
  std::stable_sort(result.points.begin(), result.points.end(),
                   [](const ScorePoint &a, const ScorePoint &b) {
                     return a.timestamp < b.timestamp;
                   });
  result.points.erase(
      std::unique(result.points.begin(), result.points.end(),
                  [](const ScorePoint &a, const ScorePoint &b) {
                    return a.timestamp == b.timestamp;
                  }),
      result.points.end());

  LOG_DEBUG("{}: {} samples every {:.2f}s", analyzer_name(kind()),
            result.points.size(), interval);
  return result;
}

} // namespace reel_cut
