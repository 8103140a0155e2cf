/**
 * @file face_analyzer.hpp
 * @brief Face-presence analyzer
 */

#ifndef REEL_CUT_FACE_ANALYZER_HPP
#define REEL_CUT_FACE_ANALYZER_HPP

#include <string>
#include <vector>

#include <opencv2/objdetect.hpp>

#include "frame_analyzer.hpp"

namespace reel_cut {

/// Summed detection area over frame area; overlapping boxes count twice
double face_area_ratio(const std::vector<cv::Rect> &faces, cv::Size frame);

/**
 * @class FaceAnalyzer
 * @brief Haar frontal-face detection on gray samples.
 * @note score = min(100, 500 x face area ratio + 10 x face count)
 * @attention cv::CascadeClassifier is not thread-safe: one instance per job.
 */
class FaceAnalyzer : public FrameAnalyzer {
  std::string cascade_path_;
  cv::CascadeClassifier cascade_;

public:
  static constexpr int FRAME_WIDTH = 640;

  explicit FaceAnalyzer(std::string cascade_path);

  AnalyzerKind kind() const override { return AnalyzerKind::Faces; }
  double default_interval() const override;

  /// Loads the cascade; unavailable when the file is missing or invalid
  bool prepare(const MediaHandle &media, std::string &why) override;

protected:
  FrameGeometry geometry(const MediaHandle &media) const override;
  bool score_frame(const cv::Mat &frame, double timestamp,
                   AnalyzerScore &out) override;
};

} // namespace reel_cut

#endif // REEL_CUT_FACE_ANALYZER_HPP
