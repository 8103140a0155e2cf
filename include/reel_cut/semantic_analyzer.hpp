/**
 * @file semantic_analyzer.hpp
 * @brief Vision-model engagement analyzer
 */

#ifndef REEL_CUT_SEMANTIC_ANALYZER_HPP
#define REEL_CUT_SEMANTIC_ANALYZER_HPP

#include <memory>
#include <string>

#include "frame_analyzer.hpp"
#include "vision_client.hpp"

namespace reel_cut {

/// Prompt sent with every frame; the reply is parsed by parse_semantic_reply
extern const char *const ENGAGEMENT_PROMPT;

/**
 * @class SemanticAnalyzer
 * @brief Rates sparse BGR frames with a vision model.
 *
 * @details Frames are JPEG encoded (quality 85) and described one at a time.
 *          The interval is stretched so at most SEMANTIC_MAX_FRAMES requests
 *          are made per job. A single failed request skips that frame;
 *          MAX_CONSECUTIVE_FAILURES failures in a row before any success make
 *          the whole analyzer unavailable.
 */
class SemanticAnalyzer : public FrameAnalyzer {
  std::shared_ptr<VisionClient> client_;
  int successes_ = 0;
  int consecutive_failures_ = 0;

public:
  static constexpr int FRAME_WIDTH = 768;
  static constexpr int JPEG_QUALITY = 85;
  static constexpr int MAX_CONSECUTIVE_FAILURES = 3;

  explicit SemanticAnalyzer(std::shared_ptr<VisionClient> client);

  AnalyzerKind kind() const override { return AnalyzerKind::Semantic; }
  double default_interval() const override;

  /// Unavailable when disabled by ENABLE_SEMANTIC or the model is unreachable
  bool prepare(const MediaHandle &media, std::string &why) override;

protected:
  FrameGeometry geometry(const MediaHandle &media) const override;
  double effective_interval(const MediaHandle &media,
                            double requested) const override;
  void begin() override;
  bool score_frame(const cv::Mat &frame, double timestamp,
                   AnalyzerScore &out) override;
};

} // namespace reel_cut

#endif // REEL_CUT_SEMANTIC_ANALYZER_HPP
