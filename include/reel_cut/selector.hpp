/**
 * @file selector.hpp
 * @brief Top-K non-overlapping segment selection over an engagement curve
 *
 * @details Candidate windows of clip_duration slide over the curve at a fixed
 *          stride and are scored by the mean (or peak) fused score of the
 *          curve points inside [start, end). Candidates are taken greedily in
 *          descending score order, earlier start first on equal scores, and a
 *          candidate is accepted only if its start is at least
 *          clip_duration + min_gap away from every accepted start.
 *
 * @attention WINDOW RULES:
 *
 *   - No candidate exists when the media is shorter than one clip
 *
 *   - Window ends are clipped to the media duration
 *
 *   - Windows clipped below min_window_fraction x clip_duration are discarded
 */

#ifndef REEL_CUT_SELECTOR_HPP
#define REEL_CUT_SELECTOR_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "types.hpp"

namespace reel_cut {

enum class WindowAggregate : uint8_t { Mean = 0, Peak };

/**
 * @struct SelectorOptions
 * @brief Selection tuning, filled from Config by from_config().
 */
struct SelectorOptions {
  double min_gap = 2.0;
  double stride = 1.0;
  WindowAggregate aggregate = WindowAggregate::Mean;
  double min_window_fraction = 0.5;

  static SelectorOptions from_config();
};

/**
 * @struct Candidate
 * @brief A scored window before selection.
 */
struct Candidate {
  double start = 0;
  double end = 0;
  double score = 0;
};

/**
 * @brief All admissible windows in start order.
 */
std::vector<Candidate> generate_candidates(const EngagementCurve &curve,
                                           double clip_duration,
                                           const SelectorOptions &options);

/**
 * @brief Select up to clip_count non-overlapping segments.
 * @return Segments ordered by start time; index is chronological (1-based),
 *         rank is the descending-score acceptance order (1-based)
 * @note Returns fewer segments, possibly none, when not enough candidates
 *       fit. Never fails.
 */
std::vector<Segment> select_segments(const EngagementCurve &curve,
                                     double clip_duration, int clip_count,
                                     const SelectorOptions &options);

/// select_segments() with default options and the given min_gap
std::vector<Segment> select_segments(const EngagementCurve &curve,
                                     double clip_duration, int clip_count,
                                     double min_gap);

} // namespace reel_cut

#endif // REEL_CUT_SELECTOR_HPP
