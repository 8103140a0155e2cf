/**
 * @file motion_analyzer.hpp
 * @brief Dense optical-flow motion analyzer
 */

#ifndef REEL_CUT_MOTION_ANALYZER_HPP
#define REEL_CUT_MOTION_ANALYZER_HPP

#include <opencv2/core.hpp>

#include "frame_analyzer.hpp"

namespace reel_cut {

/**
 * @class MotionAnalyzer
 * @brief Farneback flow between consecutive 320x180 gray samples.
 * @note score = min(100, 10 x mean flow magnitude)
 */
class MotionAnalyzer : public FrameAnalyzer {
  cv::Mat prev_;

public:
  static constexpr int FRAME_WIDTH = 320;
  static constexpr int FRAME_HEIGHT = 180;

  AnalyzerKind kind() const override { return AnalyzerKind::Motion; }
  double default_interval() const override;

protected:
  FrameGeometry geometry(const MediaHandle &media) const override;
  void begin() override { prev_.release(); }
  bool score_frame(const cv::Mat &frame, double timestamp,
                   AnalyzerScore &out) override;
};

} // namespace reel_cut

#endif // REEL_CUT_MOTION_ANALYZER_HPP
