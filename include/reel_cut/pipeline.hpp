/**
 * @file pipeline.hpp
 * @brief Per-job stage state machine
 *
 * @details The JobPipeline drives one job through its stages:
 *
 *          1. Downloading  fetch the source (progress 10..25)
 *
 *          2. Analyzing    fan out one thread per analyzer, join with a
 *                          deadline, fuse and select (progress 30..60)
 *
 *          3. Processing   render each selected segment (progress 60..100)
 *
 *          4. Completed or Failed
 *
 * @note The pipeline is the only writer of its job record. It checks the
 *       cancel flag at every suspension point: before and during the fetch,
 *       while joining analyzers, and between renders.
 */

#ifndef REEL_CUT_PIPELINE_HPP
#define REEL_CUT_PIPELINE_HPP

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "analyzer.hpp"
#include "fusion.hpp"
#include "job_store.hpp"
#include "media.hpp"
#include "selector.hpp"
#include "types.hpp"

namespace reel_cut {

/**
 * @struct PipelineOptions
 * @brief Pipeline tuning, filled from Config by from_config().
 */
struct PipelineOptions {
  std::filesystem::path temp_dir = "./temp";
  double analyzer_timeout_sec = 900.0;
  std::string target_aspect = "9:16";
  SelectorOptions selector;

  static PipelineOptions from_config();
};

/**
 * @struct PipelineCollaborators
 * @brief Media fetcher, analyzer set and renderer used by one job.
 * @note Analyzers are created per job; fetcher and renderer may be shared.
 */
struct PipelineCollaborators {
  std::shared_ptr<MediaFetcher> fetcher;
  std::vector<std::unique_ptr<Analyzer>> analyzers;
  std::shared_ptr<MediaRenderer> renderer;
};

/**
 * @struct AnalysisOutcome
 * @brief Joined analyzer results and what fusion and selection made of them.
 */
struct AnalysisOutcome {
  std::vector<AnalyzerResult> results;
  WeightTable weights;
  EngagementCurve curve;
  std::vector<Segment> segments;
};

/**
 * @class JobPipeline
 * @brief Runs one job from Queued to a terminal stage.
 */
class JobPipeline {
  JobId id_;
  JobStore &store_;
  PipelineCollaborators &collaborators_;
  PipelineOptions options_;
  const std::atomic<bool> &cancel_;
  std::string tag_; //< Log prefix: first 8 chars of the id

  bool cancelled() const { return cancel_.load(std::memory_order_relaxed); }

  /**
   * @brief Move the job to Failed.
   * @return Always 1, the failing exit code of run()
   */
  int fail(ErrorKind kind, const std::string &sub_kind,
           const std::string &message);
  int fail_cancelled();

  bool download(const JobRequest &request, MediaHandle &media, int &rc);
  bool analyze(const JobRequest &request, const MediaHandle &media,
               AnalysisOutcome &outcome, int &rc);
  int process(const JobRequest &request, const MediaHandle &media,
              std::vector<Segment> segments);

  /**
   * @brief Log a message with the job prefix.
   */
  void log_info(const std::string &msg);
  void log_phase(const std::string &msg);
  void log_warn(const std::string &msg);

public:
  /**
   * @brief Construct a pipeline for a job already inserted in the store.
   * @param cancel Raised by the job manager when the job is deleted
   */
  JobPipeline(JobId id, JobStore &store, PipelineCollaborators &collaborators,
              PipelineOptions options, const std::atomic<bool> &cancel);

  /**
   * @brief Run the complete pipeline.
   * @return 0 when the job Completed, non-zero when it Failed
   */
  int run();

  /**
   * @brief Run the Analyzing stage alone against a local media handle.
   * @details Fans out, joins with the deadline, fuses and selects without
   *          touching the job store. Used by the curve dump tool.
   * @param tag Log prefix
   * @param progress Receives the mean analyzer fraction in [0, 1]
   * @return false if no analyzer produced a usable signal
   */
  static bool analyze_media(const std::string &tag, const MediaHandle &media,
                            std::vector<std::unique_ptr<Analyzer>> &analyzers,
                            const PipelineOptions &options, double clip_duration,
                            int clip_count, const std::atomic<bool> &cancel,
                            const std::function<void(double)> &progress,
                            AnalysisOutcome &outcome);
};

} // namespace reel_cut

#endif // REEL_CUT_PIPELINE_HPP
