/**
 * @file semantic_analyzer.cpp
 * @brief Vision-model engagement analyzer implementation
 */

#include "reel_cut/semantic_analyzer.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <fmt/core.h>
#include <opencv2/imgcodecs.hpp>

#include "reel_cut/config.hpp"
#include "reel_cut/logging.hpp"
#include "reel_cut/scoring.hpp"

namespace reel_cut {

const char *const ENGAGEMENT_PROMPT =
    R"(Analyze this video frame for short-form video potential.

Rate the ENGAGEMENT SCORE from 0-100 based on:
- Visual interest and composition
- Action or movement present
- Emotional content (reactions, expressions)
- Viral potential for platforms like TikTok/YouTube Shorts

Respond in this exact JSON format only:
{
    "score": <0-100>,
    "description": "<brief 10-word description>",
    "content_type": "<action|reaction|tutorial|entertainment|other>",
    "has_person": <true|false>,
    "has_text": <true|false>,
    "mood": "<exciting|funny|emotional|informative|calm>",
    "viral_potential": "<high|medium|low>"
})";

SemanticAnalyzer::SemanticAnalyzer(std::shared_ptr<VisionClient> client)
    : client_(std::move(client)) {}

double SemanticAnalyzer::default_interval() const {
  return Config::semantic_sample_sec();
}

bool SemanticAnalyzer::prepare(const MediaHandle &media, std::string &why) {
  (void)media;
  if (!Config::enable_semantic()) {
    why = "disabled (ENABLE_SEMANTIC=0)";
    return false;
  }
  if (!client_) {
    why = "no vision client configured";
    return false;
  }
  return client_->check_available(why);
}

FrameGeometry SemanticAnalyzer::geometry(const MediaHandle &media) const {
  (void)media;
  return {FRAME_WIDTH, 0, PixelLayout::BGR};
}

double SemanticAnalyzer::effective_interval(const MediaHandle &media,
                                            double requested) const {
  const int max_frames = std::max(1, Config::semantic_max_frames());
  return std::max(requested, media.duration / max_frames);
}

void SemanticAnalyzer::begin() {
  successes_ = 0;
  consecutive_failures_ = 0;
}

bool SemanticAnalyzer::score_frame(const cv::Mat &frame, double timestamp,
                                   AnalyzerScore &out) {
  std::vector<uint8_t> jpeg;
  if (!cv::imencode(".jpg", frame, jpeg,
                    {cv::IMWRITE_JPEG_QUALITY, JPEG_QUALITY}))
    throw std::runtime_error("JPEG encoding failed");

  std::string reply, error;
  if (!client_->describe(jpeg, ENGAGEMENT_PROMPT, reply, error)) {
    ++consecutive_failures_;
    LOG_WARN("Semantic: frame at {:.1f}s skipped: {}", timestamp, error);
    if (successes_ == 0 && consecutive_failures_ >= MAX_CONSECUTIVE_FAILURES)
      throw std::runtime_error(
          fmt::format("vision model unreachable: {}", error));
    return false;
  }

  consecutive_failures_ = 0;
  ++successes_;
  out = parse_semantic_reply(reply);
  LOG_DEBUG("Semantic: {:.1f}s score={:.0f} ({})", timestamp, out.value,
            out.meta.content_type);
  return true;
}

} // namespace reel_cut
