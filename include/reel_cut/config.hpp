/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          See config/reel_cut.env for an annotated example of every
 *          parameter.
 *
 * @note Core components never call these accessors directly. Option structs
 *       (PipelineOptions, SelectorOptions, JobManagerOptions) are filled from
 *       here by their from_config() factories so tests can inject values.
 */

#ifndef REEL_CUT_CONFIG_HPP
#define REEL_CUT_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <string>

namespace reel_cut {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Value or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

// **---- STORAGE ----**

/// Root directory for downloads/ and outputs/
inline const std::string &temp_dir() {
  static std::string val = get_env_string("REEL_CUT_TEMP_DIR", "./temp");
  return val;
}

/// Longest source accepted by the fetcher (seconds, default 180 minutes)
inline int max_video_duration() {
  static int val = get_env_int("MAX_VIDEO_DURATION", 10800);
  return val;
}

/// Terminal jobs older than this are evicted together with their outputs
inline int job_retention_hours() {
  static int val = get_env_int("JOB_RETENTION_HOURS", 24);
  return val;
}

/// Seconds between janitor sweeps
inline int janitor_interval_sec() {
  static int val = get_env_int("JANITOR_INTERVAL_SEC", 60);
  return val;
}

// **---- SCHEDULING ----**

/**
 * @brief Maximum number of simultaneously active pipelines
 * @note 0 = auto: half of the cgroup-aware CPU count, at least 1.
 *       Download, analysis and render are each CPU or I/O heavy.
 */
inline int max_active_jobs() {
  static int val = get_env_int("MAX_ACTIVE_JOBS", 0);
  return val;
}

/**
 * @brief Per-analyzer deadline measured from the Analyzing fan-out
 * @note An analyzer still running at the deadline is cancelled and treated
 *       as unavailable for the job.
 */
inline double analyzer_timeout_sec() {
  static double val = get_env_double("ANALYZER_TIMEOUT_SEC", 900.0);
  return val;
}

// **---- SAMPLING ----**

/// Frame spacing for the motion and scene analyzers
inline double frame_sample_sec() {
  static double val = get_env_double("FRAME_SAMPLE_SEC", 0.5);
  return val;
}

/// Frame spacing for the face analyzer
inline double face_sample_sec() {
  static double val = get_env_double("FACE_SAMPLE_SEC", 1.0);
  return val;
}

/// Frame spacing for the semantic analyzer
inline double semantic_sample_sec() {
  static double val = get_env_double("SEMANTIC_SAMPLE_SEC", 3.0);
  return val;
}

/**
 * @brief Maximum number of frames sent to the vision model per job
 * @note Longer media stretch the semantic interval so the cap covers the
 *       whole duration.
 */
inline int semantic_max_frames() {
  static int val = get_env_int("SEMANTIC_MAX_FRAMES", 50);
  return val;
}

// **---- SELECTION ----**

/// Minimum separation between two selected clips (seconds)
inline double min_gap_sec() {
  static double val = get_env_double("MIN_GAP_SEC", 2.0);
  return val;
}

/// Candidate window stride (seconds)
inline double select_stride_sec() {
  static double val = get_env_double("SELECT_STRIDE_SEC", 1.0);
  return val;
}

/// Window aggregate: "mean" or "peak"
inline const std::string &select_aggregate() {
  static std::string val = get_env_string("SELECT_AGGREGATE", "mean");
  return val;
}

/// Windows clipped below this fraction of the clip duration are discarded
inline double min_window_fraction() {
  static double val = get_env_double("MIN_WINDOW_FRACTION", 0.5);
  return val;
}

// **---- SEMANTIC ANALYZER ----**

/// Set ENABLE_SEMANTIC=0 to never contact the vision model
inline bool enable_semantic() {
  static bool val = (get_env_int("ENABLE_SEMANTIC", 1) != 0);
  return val;
}

inline const std::string &ollama_host() {
  static std::string val =
      get_env_string("OLLAMA_HOST", "http://localhost:11434");
  return val;
}

inline const std::string &ollama_model() {
  static std::string val = get_env_string("OLLAMA_MODEL", "llava");
  return val;
}

/// Per-request timeout for the vision model (seconds)
inline int ollama_timeout_sec() {
  static int val = get_env_int("OLLAMA_TIMEOUT_SEC", 60);
  return val;
}

// **---- FACE ANALYZER ----**

inline const std::string &face_cascade_path() {
  static std::string val = get_env_string(
      "FACE_CASCADE_PATH",
      "/usr/share/opencv4/haarcascades/haarcascade_frontalface_default.xml");
  return val;
}

// **---- RENDERING ----**

inline int output_width() {
  static int val = get_env_int("OUTPUT_WIDTH", 1080);
  return val;
}

inline int output_height() {
  static int val = get_env_int("OUTPUT_HEIGHT", 1920);
  return val;
}

/// Wall-clock limit for one ffmpeg render (seconds)
inline int render_timeout_sec() {
  static int val = get_env_int("RENDER_TIMEOUT_SEC", 300);
  return val;
}

// **---- EXTERNAL TOOLS ----**

inline const std::string &ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

inline const std::string &ytdlp_bin() {
  static std::string val = get_env_string("YTDLP_BIN", "yt-dlp");
  return val;
}

inline const std::string &curl_bin() {
  static std::string val = get_env_string("CURL_BIN", "curl");
  return val;
}

// **---- DIAGNOSTICS ----**

/// REEL_CUT_DEBUG=1 enables LOG_DEBUG output
inline bool debug_logging() {
  static bool val = (get_env_int("REEL_CUT_DEBUG", 0) != 0);
  return val;
}

} // namespace Config
} // namespace reel_cut

#endif // REEL_CUT_CONFIG_HPP
