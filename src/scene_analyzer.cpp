/**
 * @file scene_analyzer.cpp
 * @brief Scene-change analyzer implementation
 */

#include "reel_cut/scene_analyzer.hpp"

#include "reel_cut/config.hpp"
#include "reel_cut/scoring.hpp"

namespace reel_cut {

double SceneAnalyzer::default_interval() const {
  return Config::frame_sample_sec();
}

FrameGeometry SceneAnalyzer::geometry(const MediaHandle &media) const {
  (void)media;
  return {FRAME_WIDTH, FRAME_HEIGHT, PixelLayout::Gray};
}

bool SceneAnalyzer::score_frame(const cv::Mat &frame, double timestamp,
                                AnalyzerScore &out) {
  (void)timestamp;
  if (prev_.empty()) {
    prev_ = frame.clone();
    return false;
  }

  cv::Mat diff;
  cv::absdiff(prev_, frame, diff);
  out.value = scene_score(cv::mean(diff)[0]);
  frame.copyTo(prev_);
  return true;
}

} // namespace reel_cut
