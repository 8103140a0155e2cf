/**
 * @file face_analyzer.cpp
 * @brief Face-presence analyzer implementation
 */

#include "reel_cut/face_analyzer.hpp"

#include <vector>

#include <opencv2/imgproc.hpp>

#include "reel_cut/config.hpp"
#include "reel_cut/scoring.hpp"

namespace reel_cut {

double face_area_ratio(const std::vector<cv::Rect> &faces, cv::Size frame) {
  double face_area = 0;
  for (const auto &r : faces)
    face_area += static_cast<double>(r.area());
  double frame_area = static_cast<double>(frame.width) * frame.height;
  return frame_area > 0 ? face_area / frame_area : 0.0;
}

FaceAnalyzer::FaceAnalyzer(std::string cascade_path)
    : cascade_path_(std::move(cascade_path)) {}

double FaceAnalyzer::default_interval() const {
  return Config::face_sample_sec();
}

bool FaceAnalyzer::prepare(const MediaHandle &media, std::string &why) {
  (void)media;
  if (!cascade_.empty())
    return true;
  if (!cascade_.load(cascade_path_)) {
    why = "cannot load face cascade " + cascade_path_;
    return false;
  }
  return true;
}

FrameGeometry FaceAnalyzer::geometry(const MediaHandle &media) const {
  (void)media;
  return {FRAME_WIDTH, 0, PixelLayout::Gray};
}

bool FaceAnalyzer::score_frame(const cv::Mat &frame, double timestamp,
                               AnalyzerScore &out) {
  (void)timestamp;
  cv::Mat equalized;
  cv::equalizeHist(frame, equalized);

  std::vector<cv::Rect> faces;
  cascade_.detectMultiScale(equalized, faces, 1.1, 5, 0, cv::Size(30, 30));

  double ratio = face_area_ratio(faces, frame.size());
  out.value = face_score(ratio, static_cast<int>(faces.size()));
  out.meta.face_count = static_cast<int>(faces.size());
  out.meta.has_person = !faces.empty();
  return true;
}

} // namespace reel_cut
