/**
 * @file motion_analyzer.cpp
 * @brief Dense optical-flow motion analyzer implementation
 */

#include "reel_cut/motion_analyzer.hpp"

#include <opencv2/imgproc.hpp>
#include <opencv2/video/tracking.hpp>

#include "reel_cut/config.hpp"
#include "reel_cut/scoring.hpp"

namespace reel_cut {

double MotionAnalyzer::default_interval() const {
  return Config::frame_sample_sec();
}

FrameGeometry MotionAnalyzer::geometry(const MediaHandle &media) const {
  (void)media;
  return {FRAME_WIDTH, FRAME_HEIGHT, PixelLayout::Gray};
}

bool MotionAnalyzer::score_frame(const cv::Mat &frame, double timestamp,
                                 AnalyzerScore &out) {
  (void)timestamp;
  if (prev_.empty()) {
    prev_ = frame.clone();
    return false;
  }

  cv::Mat flow;
  cv::calcOpticalFlowFarneback(prev_, frame, flow, 0.5, 3, 15, 3, 5, 1.2, 0);

  cv::Mat parts[2];
  cv::split(flow, parts);
  cv::Mat magnitude;
  cv::magnitude(parts[0], parts[1], magnitude);
  double mean = cv::mean(magnitude)[0];

  out.value = motion_score(mean);
  out.meta.motion_magnitude = mean;
  frame.copyTo(prev_);
  return true;
}

} // namespace reel_cut
