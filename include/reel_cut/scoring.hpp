/**
 * @file scoring.hpp
 * @brief Per-analyzer scoring formulas
 *
 * @details The analyzers in the media library extract raw measurements
 *          (flow magnitude, pixel differences, face boxes, RMS, model
 *          replies). Turning a measurement into a normalized [0, 100] score
 *          happens here, independent of FFmpeg and OpenCV.
 */

#ifndef REEL_CUT_SCORING_HPP
#define REEL_CUT_SCORING_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace reel_cut {

// **---- NORMALIZATION ----**

/// Clamp to [0, MAX_SCORE]; NaN maps to 0
double clamp_score(double value);

/**
 * @brief Min-max scale a series into [0, top].
 * @note A constant series maps to all zeros.
 */
std::vector<double> minmax_scale(const std::vector<double> &values,
                                 double top);

// **---- AUDIO ----**

/// Samples per onset hop at 22050 Hz
constexpr size_t ONSET_HOP = 512;

/**
 * @brief Combine per-window RMS and onset strength into audio scores.
 * @param rms RMS energy per window
 * @param onset Mean onset strength per window (same length as rms)
 * @return RMS scaled to [0, 100] plus onset scaled to [0, 50], capped at 100
 */
std::vector<double> audio_scores(const std::vector<double> &rms,
                                 const std::vector<double> &onset);

// **---- VISUAL ----**

/// min(100, 10 x mean optical-flow magnitude)
double motion_score(double mean_magnitude);

/// mean |a - b| of 8-bit gray frames scaled to [0, 100]
double scene_score(double mean_abs_diff);

/**
 * @brief Face presence score.
 * @param area_ratio Summed face box area over frame area
 * @param face_count Number of faces detected
 */
double face_score(double area_ratio, int face_count);

// **---- SEMANTIC ----**

int viral_bonus(const std::string &viral_potential);
int content_type_bonus(const std::string &content_type);

/// min(100, clamp(base) + viral bonus + content bonus)
double semantic_score(double base, const std::string &viral_potential,
                      const std::string &content_type);

/**
 * @brief Parse a vision model reply into a semantic score.
 * @param reply Free text containing one JSON object
 * @return Parsed score and metadata, or the neutral default (50,
 *         "Analysis unavailable") when no object can be parsed
 */
AnalyzerScore parse_semantic_reply(const std::string &reply);

} // namespace reel_cut

#endif // REEL_CUT_SCORING_HPP
