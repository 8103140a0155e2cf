/**
 * @file fusion.hpp
 * @brief Weighted fusion of analyzer scores into an engagement curve
 *
 * @details Fusion works on a common 1-second grid t = 0, 1, ..,
 *          floor(duration) - 1. Each analyzer contributes the value of its
 *          nearest sample within a tolerance equal to its sampling interval
 *          (at least 1 s); equidistant samples resolve to the earlier one.
 *          A missing sample contributes 0.
 *
 * @note fuse() is a pure function of its inputs.
 */

#ifndef REEL_CUT_FUSION_HPP
#define REEL_CUT_FUSION_HPP

#include <array>
#include <string>
#include <vector>

#include "types.hpp"

namespace reel_cut {

/**
 * @struct WeightTable
 * @brief Per-analyzer weight in [0, 1], indexed by AnalyzerKind.
 */
struct WeightTable {
  std::array<double, ANALYZER_COUNT> weights{};

  double operator[](AnalyzerKind kind) const { return weights[index_of(kind)]; }
  double &operator[](AnalyzerKind kind) { return weights[index_of(kind)]; }

  double sum() const;
};

/// semantic 0.30, audio 0.20, motion 0.20, scene 0.15, faces 0.15
WeightTable default_weights();

/// Four-signal table without semantic: audio 0.30, motion 0.25, scene 0.20,
/// faces 0.25
WeightTable fallback_weights();

/**
 * @brief Zero the inactive analyzers and rescale the rest to sum to 1.
 * @note Relative ratios of the active weights are preserved. If no active
 *       analyzer has weight, every weight is 0.
 */
WeightTable renormalize(const WeightTable &base,
                        const std::array<bool, ANALYZER_COUNT> &active);

/**
 * @brief Weight table for one job run.
 * @details Starts from default_weights() when the semantic analyzer produced
 *          scores, from fallback_weights() otherwise, then renormalizes over
 *          the analyzers that produced scores.
 */
WeightTable resolve_weights(const std::vector<AnalyzerResult> &results);

/**
 * @brief Short human readable label for an analyzer's contribution.
 */
std::string reason_label(AnalyzerKind kind, const ScoreMetadata &meta);

/**
 * @brief Fuse analyzer outputs into an engagement curve.
 * @param results Resolved analyzer results (unavailable ones are ignored)
 * @param weights Weight table, normally from resolve_weights()
 * @param media_duration Seconds
 * @return Curve with strictly increasing timestamps and scores in [0, 100];
 *         each point carries the top-2 contributing reasons
 */
EngagementCurve fuse(const std::vector<AnalyzerResult> &results,
                     const WeightTable &weights, double media_duration);

} // namespace reel_cut

#endif // REEL_CUT_FUSION_HPP
