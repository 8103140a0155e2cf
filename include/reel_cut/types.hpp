/**
 * @file types.hpp
 * @brief Core data types and constants for Reel Cut
 *
 * @details Contains the value types shared by every stage of a job:
 *
 *          - Analyzer identities and normalized scores
 *
 *          - Engagement curve points
 *
 *          - Selected segments
 *
 *          - Job stages and error kinds
 */

#ifndef REEL_CUT_TYPES_HPP
#define REEL_CUT_TYPES_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace reel_cut {

// **----- CONSTANTS -----**

/**
 * @brief CPU cache line size for alignment.
 * @note Progress counters updated by concurrent analyzers live on separate
 *       cache lines.
 */
constexpr size_t CACHE_LINE_SIZE = 64;

/// Upper bound of every normalized score
constexpr double MAX_SCORE = 100.0;

/// Number of analyzer variants
constexpr size_t ANALYZER_COUNT = 5;

// **----- ANALYZERS -----**

/**
 * @brief Analyzer identities.
 * @note The enumerator order is also the deterministic tie-break order used
 *       when two analyzers contribute equally to a fused score.
 */
enum class AnalyzerKind : uint8_t { Semantic = 0, Audio, Motion, Scene, Faces };

constexpr std::array<AnalyzerKind, ANALYZER_COUNT> ALL_ANALYZERS = {
    AnalyzerKind::Semantic, AnalyzerKind::Audio, AnalyzerKind::Motion,
    AnalyzerKind::Scene, AnalyzerKind::Faces};

constexpr size_t index_of(AnalyzerKind kind) {
  return static_cast<size_t>(kind);
}

const char *analyzer_name(AnalyzerKind kind);

/**
 * @struct ScoreMetadata
 * @brief Descriptive side data an analyzer may attach to a score.
 * @note Only the fields meaningful for the producing analyzer are set.
 */
struct ScoreMetadata {
  int face_count = 0;           //< Faces detected in the frame
  double motion_magnitude = 0;  //< Mean optical-flow magnitude (pixels)
  double rms = 0;               //< Raw audio RMS of the window
  std::string content_type;     //< Semantic category (action, reaction, ...)
  std::string viral_potential;  //< high | medium | low
  std::string mood;             //< exciting | funny | emotional | ...
  std::string description;      //< Short scene description
  bool has_person = false;
  bool has_text = false;
};

/**
 * @struct AnalyzerScore
 * @brief Normalized analyzer output in [0, 100] plus metadata.
 */
struct AnalyzerScore {
  double value = 0;
  ScoreMetadata meta;
};

/**
 * @struct ScorePoint
 * @brief One analyzer score at a timestamp (seconds from start).
 */
struct ScorePoint {
  double timestamp = 0;
  AnalyzerScore score;
};

/**
 * @struct AnalyzerResult
 * @brief Outcome of one analyzer over a whole job.
 * @note An unavailable analyzer carries no points. An available analyzer with
 *       no points is "empty" and does not take part in weighting either.
 */
struct AnalyzerResult {
  AnalyzerKind kind = AnalyzerKind::Audio;
  bool available = false;
  std::string reason;             //< Why the analyzer is unavailable
  double sample_interval = 1.0;   //< Effective spacing of the points (s)
  std::vector<ScorePoint> points; //< Ascending timestamps

  bool produced_scores() const { return available && !points.empty(); }

  static AnalyzerResult unavailable(AnalyzerKind kind, std::string why) {
    AnalyzerResult r;
    r.kind = kind;
    r.available = false;
    r.reason = std::move(why);
    return r;
  }
};

// **----- ENGAGEMENT CURVE -----**

/**
 * @struct CurvePoint
 * @brief Fused score at one grid timestamp.
 */
struct CurvePoint {
  double timestamp = 0;
  double score = 0;                                //< Always in [0, 100]
  std::array<double, ANALYZER_COUNT> contribution{}; //< weight x value
  std::vector<std::string> reasons;                //< Top-2 labels
};

/**
 * @struct EngagementCurve
 * @brief Strictly increasing sequence of curve points over the media.
 */
struct EngagementCurve {
  double media_duration = 0;
  std::vector<CurvePoint> points;
};

// **----- SEGMENTS -----**

/**
 * @struct Segment
 * @brief A selected clip window and its render outcome.
 */
struct Segment {
  int index = 0;       //< 1-based, chronological
  int rank = 0;        //< 1-based, by descending score
  double start = 0;    //< Seconds
  double end = 0;      //< Seconds, clipped to media bounds
  double score = 0;    //< Aggregate fused score of the window
  std::vector<std::string> reasons;
  std::string output;       //< Rendered file, empty until rendered
  std::string render_error; //< Set when rendering this segment failed

  bool rendered() const { return !output.empty(); }
};

// **----- JOBS -----**

/// Opaque job identifier
using JobId = std::string;

/**
 * @brief Pipeline stages.
 */
enum class Stage : uint8_t {
  Queued = 0,
  Downloading,
  Analyzing,
  Processing,
  Completed,
  Failed
};

const char *stage_name(Stage stage);

inline bool is_terminal(Stage stage) {
  return stage == Stage::Completed || stage == Stage::Failed;
}

/**
 * @brief Error taxonomy of a job.
 */
enum class ErrorKind : uint8_t {
  None = 0,
  Validation,
  Download,
  Analysis,
  Render,
  System,
  Cancelled
};

const char *error_kind_name(ErrorKind kind);

/**
 * @struct PaddedAtomic
 * @brief Cache-line aligned atomic to prevent false sharing.
 */
template <typename T> struct alignas(CACHE_LINE_SIZE) PaddedAtomic {
  std::atomic<T> value{0};

  PaddedAtomic() = default;
  explicit PaddedAtomic(T v) : value(v) {}

  T load(std::memory_order order = std::memory_order_seq_cst) const {
    return value.load(order);
  }
  void store(T v, std::memory_order order = std::memory_order_seq_cst) {
    value.store(v, order);
  }
};

} // namespace reel_cut

#endif // REEL_CUT_TYPES_HPP
