/**
 * @file scene_analyzer.hpp
 * @brief Scene-change analyzer
 */

#ifndef REEL_CUT_SCENE_ANALYZER_HPP
#define REEL_CUT_SCENE_ANALYZER_HPP

#include <opencv2/core.hpp>

#include "frame_analyzer.hpp"

namespace reel_cut {

/**
 * @class SceneAnalyzer
 * @brief Mean absolute difference of consecutive 160x90 gray samples.
 */
class SceneAnalyzer : public FrameAnalyzer {
  cv::Mat prev_;

public:
  static constexpr int FRAME_WIDTH = 160;
  static constexpr int FRAME_HEIGHT = 90;

  AnalyzerKind kind() const override { return AnalyzerKind::Scene; }
  double default_interval() const override;

protected:
  FrameGeometry geometry(const MediaHandle &media) const override;
  void begin() override { prev_.release(); }
  bool score_frame(const cv::Mat &frame, double timestamp,
                   AnalyzerScore &out) override;
};

} // namespace reel_cut

#endif // REEL_CUT_SCENE_ANALYZER_HPP
