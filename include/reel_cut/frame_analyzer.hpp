/**
 * @file frame_analyzer.hpp
 * @brief Common driver for analyzers that score sampled video frames
 */

#ifndef REEL_CUT_FRAME_ANALYZER_HPP
#define REEL_CUT_FRAME_ANALYZER_HPP

#include <opencv2/core.hpp>

#include "analyzer.hpp"
#include "media_decoder.hpp"

namespace reel_cut {

/**
 * @struct FrameGeometry
 * @brief Size and pixel layout frames are scaled to before scoring.
 * @note A zero height keeps the source aspect ratio for the given width.
 */
struct FrameGeometry {
  int width = 0;
  int height = 0;
  PixelLayout layout = PixelLayout::Gray;
};

/**
 * @class FrameAnalyzer
 * @brief Decodes frames at the sampling interval and scores each one.
 *
 * @details Subclasses provide the frame geometry and score_frame(). The
 *          driver owns the decoder, wraps each frame in a cv::Mat without
 *          copying, polls cancellation and reports progress.
 */
class FrameAnalyzer : public Analyzer {
public:
  AnalyzerResult analyze(const MediaHandle &media,
                         const AnalyzeContext &ctx) override;

protected:
  virtual FrameGeometry geometry(const MediaHandle &media) const = 0;

  /// Effective interval; subclasses may stretch the requested one
  virtual double effective_interval(const MediaHandle &media,
                                    double requested) const {
    (void)media;
    return requested;
  }

  /// Called once before the first frame
  virtual void begin() {}

  /**
   * @brief Score one frame.
   * @param frame Scaled frame, valid only during the call
   * @param timestamp Seconds from media start
   * @param out Output score
   * @return false when the frame yields no point (e.g. first frame of a
   *         difference pair)
   * @throws std::runtime_error to mark the analyzer unavailable
   */
  virtual bool score_frame(const cv::Mat &frame, double timestamp,
                           AnalyzerScore &out) = 0;
};

} // namespace reel_cut

#endif // REEL_CUT_FRAME_ANALYZER_HPP
