/**
 * @file analyzer.hpp
 * @brief Signal analyzer capability interface
 *
 * @details Every signal source (audio, motion, scene, faces, semantic) is a
 *          variant behind this one interface. The pipeline resolves the set of
 *          usable analyzers once per job with prepare(), then fans analyze()
 *          out on one thread per analyzer.
 *
 * @attention FAILURE MODEL:
 *
 *   - An analyzer that errors or cannot reach a dependency reports itself
 *     unavailable for the whole job (AnalyzerResult::unavailable)
 *
 *   - It never fails individual samples
 *
 *   - It polls AnalyzeContext::cancelled() between samples and returns
 *     promptly once it is set (job cancellation or analyzer deadline)
 */

#ifndef REEL_CUT_ANALYZER_HPP
#define REEL_CUT_ANALYZER_HPP

#include <atomic>
#include <functional>
#include <string>

#include "media.hpp"
#include "types.hpp"

namespace reel_cut {

/**
 * @struct AnalyzeContext
 * @brief Per-run parameters handed to an analyzer.
 */
struct AnalyzeContext {
  double sample_interval = 1.0;             //< Requested spacing (s)
  const std::atomic<bool> *cancel = nullptr; //< Raised to stop early
  std::function<void(double)> progress;      //< Fraction done in [0, 1]

  bool cancelled() const {
    return cancel != nullptr && cancel->load(std::memory_order_relaxed);
  }

  void report(double fraction) const {
    if (progress)
      progress(fraction);
  }
};

/**
 * @class Analyzer
 * @brief Produces one normalized signal over time from the media.
 */
class Analyzer {
public:
  virtual ~Analyzer() = default;

  virtual AnalyzerKind kind() const = 0;

  /// Sampling interval used when the pipeline has no override
  virtual double default_interval() const = 0;

  /**
   * @brief Resolve availability before the fan-out.
   * @param media The fetched media
   * @param why Output: reason when unavailable
   * @return false if this analyzer cannot run for this job
   */
  virtual bool prepare(const MediaHandle &media, std::string &why) {
    (void)media;
    (void)why;
    return true;
  }

  /**
   * @brief Score the media.
   * @return Points with ascending timestamps, or an unavailable result
   */
  virtual AnalyzerResult analyze(const MediaHandle &media,
                                 const AnalyzeContext &ctx) = 0;
};

} // namespace reel_cut

#endif // REEL_CUT_ANALYZER_HPP
