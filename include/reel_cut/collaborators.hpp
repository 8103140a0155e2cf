/**
 * @file collaborators.hpp
 * @brief Production wiring of fetcher, analyzers and renderer
 */

#ifndef REEL_CUT_COLLABORATORS_HPP
#define REEL_CUT_COLLABORATORS_HPP

#include <memory>
#include <vector>

#include "pipeline.hpp"

namespace reel_cut {

/// Fresh set of the five analyzers in kind order, configured from Config
std::vector<std::unique_ptr<Analyzer>> make_default_analyzers();

/**
 * @brief Collaborators for one job.
 * @note yt-dlp fetcher and ffmpeg renderer are stateless and shared; the
 *       analyzers hold per-job state (OpenCV classifiers, frame history).
 */
PipelineCollaborators make_default_collaborators();

} // namespace reel_cut

#endif // REEL_CUT_COLLABORATORS_HPP
