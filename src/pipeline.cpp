/**
 * @file pipeline.cpp
 * @brief Per-job stage state machine implementation
 *
 * @details Progress mapping:
 *
 *          - Queued       0
 *
 *          - Downloading  10 + 15 x fetched fraction, 25 when done
 *
 *          - Analyzing    30 + 30 x mean analyzer fraction
 *
 *          - Processing   60 + 39 x rendered / selected
 *
 *          - Completed    100
 *
 * @note All log messages are prefixed with [Job <id prefix>].
 */

#include "reel_cut/pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <system_error>
#include <thread>

#include <fmt/core.h>

#include "reel_cut/cleanup.hpp"
#include "reel_cut/config.hpp"
#include "reel_cut/logging.hpp"
#include "reel_cut/system.hpp"

namespace fs = std::filesystem;

namespace reel_cut {

namespace {

constexpr int PROGRESS_DOWNLOAD_START = 10;
constexpr int PROGRESS_DOWNLOAD_END = 25;
constexpr int PROGRESS_ANALYZE_START = 30;
constexpr int PROGRESS_ANALYZE_END = 60;
constexpr int PROGRESS_PROCESS_END = 100;

/// Upper bound on the join wait between two progress publications
constexpr auto JOIN_POLL_INTERVAL = std::chrono::milliseconds(250);

int scale_progress(int from, int to, double fraction) {
  fraction = std::min(1.0, std::max(0.0, fraction));
  return from + static_cast<int>((to - from) * fraction);
}

/**
 * @struct AnalyzerSlot
 * @brief Join state of one analyzer thread.
 * @note done and abandoned are guarded by the join mutex. An abandoned slot
 *       keeps its timeout result; the late analyzer output is dropped.
 */
struct AnalyzerSlot {
  Analyzer *analyzer = nullptr;
  AnalyzerResult result;
  bool done = false;
  bool abandoned = false;
  std::atomic<bool> cancel{false};
  PaddedAtomic<double> fraction{0.0};
};

} // namespace

// **---- Options ----**

PipelineOptions PipelineOptions::from_config() {
  PipelineOptions o;
  o.temp_dir = Config::temp_dir();
  o.analyzer_timeout_sec = Config::analyzer_timeout_sec();
  o.selector = SelectorOptions::from_config();
  return o;
}

// **---- Constructor ----**

JobPipeline::JobPipeline(JobId id, JobStore &store,
                         PipelineCollaborators &collaborators,
                         PipelineOptions options,
                         const std::atomic<bool> &cancel)
    : id_(std::move(id)), store_(store), collaborators_(collaborators),
      options_(std::move(options)), cancel_(cancel),
      tag_(id_.substr(0, 8)) {}

// **---- Logging Helpers ----**

void JobPipeline::log_info(const std::string &msg) {
  LOG_INFO("[Job {}] {}", tag_, msg);
}

void JobPipeline::log_phase(const std::string &msg) {
  LOG_PHASE("[Job {}] {}", tag_, msg);
}

void JobPipeline::log_warn(const std::string &msg) {
  LOG_WARN("[Job {}] {}", tag_, msg);
}

// **---- Failure ----**

int JobPipeline::fail(ErrorKind kind, const std::string &sub_kind,
                      const std::string &message) {
  LOG_ERROR("[Job {}] {}: {}", tag_, error_kind_name(kind), message);
  JobError error;
  error.kind = kind;
  error.sub_kind = sub_kind;
  error.message = message;
  store_.fail(id_, std::move(error));
  return 1;
}

int JobPipeline::fail_cancelled() {
  log_warn("Cancelled");
  JobError error;
  error.kind = ErrorKind::Cancelled;
  error.message = "Job cancelled";
  store_.fail(id_, std::move(error));
  return 1;
}

// **---- Main Processing ----**

int JobPipeline::run() {
  TIMER_START(total_run);

  Job job;
  if (!store_.snapshot(id_, job)) {
    LOG_ERROR("[Job {}] Not found in the job store", tag_);
    return 1;
  }

  int rc = 0;
  MediaHandle media;
  AnalysisOutcome outcome;

  if (!download(job.request, media, rc) ||
      !analyze(job.request, media, outcome, rc)) {
    TIMER_END(id_, total_run);
    TimingCollector::print_summary(id_);
    TimingCollector::clear(id_);
    return rc;
  }

  rc = process(job.request, media, std::move(outcome.segments));

  TIMER_END(id_, total_run);
  TimingCollector::print_summary(id_);
  TimingCollector::clear(id_);
  return rc;
}

// **----- STAGE: DOWNLOADING -----**

bool JobPipeline::download(const JobRequest &request, MediaHandle &media,
                           int &rc) {
  if (cancelled()) {
    rc = fail_cancelled();
    return false;
  }

  store_.advance(id_, Stage::Downloading, PROGRESS_DOWNLOAD_START,
                 "Downloading video...");
  log_phase(fmt::format("Downloading {}", request.source_url));

  TIMER_START(download);
  FetchResult fetched = collaborators_.fetcher->fetch(
      request.source_url, [this](double fraction) {
        if (cancelled())
          return false;
        int p = scale_progress(PROGRESS_DOWNLOAD_START, PROGRESS_DOWNLOAD_END,
                               fraction);
        store_.report_progress(
            id_, p,
            fmt::format("Downloading video... {:.0f}%", fraction * 100.0));
        return true;
      });
  TIMER_END(id_, download);

  if (cancelled() || fetched.error == FetchError::Cancelled) {
    rc = fail_cancelled();
    return false;
  }
  if (!fetched) {
    rc = fail(ErrorKind::Download, fetch_error_name(fetched.error),
              fetched.message);
    return false;
  }

  media = fetched.media;
  store_.set_media(id_, media);
  store_.report_progress(id_, PROGRESS_DOWNLOAD_END,
                         media.cached ? "Using cached video"
                                      : "Download complete");
  log_info(fmt::format("{} {} ({}x{}, {:.1f}fps{})",
                       media.cached ? "Cached" : "Downloaded",
                       format_time(media.duration), media.width, media.height,
                       media.fps, media.has_audio ? ", audio" : ""));
  return true;
}

// **----- STAGE: ANALYZING -----**

bool JobPipeline::analyze_media(
    const std::string &tag, const MediaHandle &media,
    std::vector<std::unique_ptr<Analyzer>> &analyzers,
    const PipelineOptions &options, double clip_duration, int clip_count,
    const std::atomic<bool> &cancel,
    const std::function<void(double)> &progress, AnalysisOutcome &outcome) {
  std::vector<std::unique_ptr<AnalyzerSlot>> slots;
  slots.reserve(analyzers.size());

  std::mutex join_mutex;
  std::condition_variable join_cv;
  std::vector<std::thread> threads;

  // **----- SUB-PHASE: Resolve availability -----**

  for (auto &analyzer : analyzers) {
    auto slot = std::make_unique<AnalyzerSlot>();
    slot->analyzer = analyzer.get();
    std::string why;
    if (!analyzer->prepare(media, why)) {
      LOG_WARN("[Job {}] {} analyzer unavailable: {}", tag,
               analyzer_name(analyzer->kind()), why);
      slot->result = AnalyzerResult::unavailable(analyzer->kind(), why);
      slot->done = true;
      slot->fraction.store(1.0);
    }
    slots.push_back(std::move(slot));
  }

  // **----- SUB-PHASE: Fan out -----**

  for (auto &owned : slots) {
    AnalyzerSlot *slot = owned.get();
    if (slot->done)
      continue;

    threads.emplace_back([slot, &media, &join_mutex, &join_cv, &tag]() {
      const AnalyzerKind kind = slot->analyzer->kind();
      AnalyzeContext ctx;
      ctx.sample_interval = slot->analyzer->default_interval();
      ctx.cancel = &slot->cancel;
      ctx.progress = [slot](double f) {
        slot->fraction.store(std::min(1.0, std::max(0.0, f)),
                             std::memory_order_relaxed);
      };

      AnalyzerResult result;
      try {
        result = slot->analyzer->analyze(media, ctx);
      } catch (const std::exception &e) {
        LOG_WARN("[Job {}] {} analyzer failed: {}", tag, analyzer_name(kind),
                 e.what());
        result = AnalyzerResult::unavailable(kind, e.what());
      }
      result.kind = kind;
      if (!(result.sample_interval > 0))
        result.sample_interval = ctx.sample_interval;

      {
        std::lock_guard<std::mutex> lock(join_mutex);
        if (!slot->abandoned)
          slot->result = std::move(result);
        slot->done = true;
      }
      slot->fraction.store(1.0);
      join_cv.notify_all();
    });
  }

  // **----- SUB-PHASE: Join with deadline -----**

  const auto deadline =
      std::chrono::steady_clock::now() +
      std::chrono::milliseconds(
          static_cast<long>(options.analyzer_timeout_sec * 1000.0));

  auto mean_fraction = [&slots]() {
    if (slots.empty())
      return 1.0;
    double sum = 0;
    for (const auto &s : slots)
      sum += s->fraction.load(std::memory_order_relaxed);
    return sum / static_cast<double>(slots.size());
  };

  {
    std::unique_lock<std::mutex> lock(join_mutex);
    while (true) {
      bool all_done = std::all_of(slots.begin(), slots.end(),
                                  [](const auto &s) { return s->done; });
      if (all_done)
        break;

      if (cancel.load(std::memory_order_relaxed)) {
        for (auto &s : slots)
          s->cancel.store(true);
        break;
      }

      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        for (auto &s : slots) {
          if (s->done)
            continue;
          AnalyzerKind kind = s->analyzer->kind();
          LOG_WARN("[Job {}] {} analyzer timed out after {:.0f}s", tag,
                   analyzer_name(kind), options.analyzer_timeout_sec);
          s->abandoned = true;
          s->cancel.store(true);
          s->result = AnalyzerResult::unavailable(
              kind, fmt::format("timed out after {:.0f}s",
                                options.analyzer_timeout_sec));
        }
        break;
      }

      join_cv.wait_until(lock, std::min(deadline, now + JOIN_POLL_INTERVAL));

      lock.unlock();
      if (progress)
        progress(mean_fraction());
      lock.lock();
    }
  }

  // Cancelled analyzers observe their flag and return
  for (auto &t : threads)
    t.join();

  if (cancel.load(std::memory_order_relaxed))
    return false;

  // **----- SUB-PHASE: Fuse and select -----**

  outcome.results.clear();
  for (auto &s : slots)
    outcome.results.push_back(std::move(s->result));

  size_t usable = std::count_if(
      outcome.results.begin(), outcome.results.end(),
      [](const AnalyzerResult &r) { return r.produced_scores(); });
  if (usable == 0)
    return false;

  outcome.weights = resolve_weights(outcome.results);
  outcome.curve = fuse(outcome.results, outcome.weights, media.duration);
  outcome.segments = select_segments(outcome.curve, clip_duration, clip_count,
                                     options.selector);
  return true;
}

bool JobPipeline::analyze(const JobRequest &request, const MediaHandle &media,
                          AnalysisOutcome &outcome, int &rc) {
  if (cancelled()) {
    rc = fail_cancelled();
    return false;
  }

  store_.advance(id_, Stage::Analyzing, PROGRESS_ANALYZE_START,
                 "Analyzing video content...");
  log_phase(fmt::format("Analyzing ({} analyzers, {:.0f}s deadline)...",
                        collaborators_.analyzers.size(),
                        options_.analyzer_timeout_sec));

  TIMER_START(analysis);
  bool ok = analyze_media(
      tag_, media, collaborators_.analyzers, options_, request.clip_duration,
      request.clip_count, cancel_,
      [this](double fraction) {
        store_.report_progress(id_,
                               scale_progress(PROGRESS_ANALYZE_START,
                                              PROGRESS_ANALYZE_END, fraction));
      },
      outcome);
  TIMER_END(id_, analysis);

  if (cancelled()) {
    rc = fail_cancelled();
    return false;
  }

  std::vector<std::string> unavailable;
  for (const auto &r : outcome.results) {
    if (r.produced_scores())
      continue;
    unavailable.push_back(r.available ? fmt::format("{} (no samples)",
                                                    analyzer_name(r.kind))
                                      : fmt::format("{} ({})",
                                                    analyzer_name(r.kind),
                                                    r.reason));
  }
  store_.set_unavailable_analyzers(id_, unavailable);

  if (!ok) {
    rc = fail(ErrorKind::Analysis, "no_signals",
              "No usable analysis signal: every analyzer was unavailable or "
              "produced no samples");
    return false;
  }

  for (AnalyzerKind kind : ALL_ANALYZERS) {
    if (outcome.weights[kind] > 0)
      log_info(fmt::format("  {:<9} weight {:.3f}", analyzer_name(kind),
                           outcome.weights[kind]));
  }
  log_info(fmt::format("Curve: {} points, selected {} of {} clips",
                       outcome.curve.points.size(), outcome.segments.size(),
                       request.clip_count));

  store_.report_progress(id_, PROGRESS_ANALYZE_END,
                         fmt::format("Found {} engaging segments",
                                     outcome.segments.size()));
  return true;
}

// **----- STAGE: PROCESSING -----**

int JobPipeline::process(const JobRequest &request, const MediaHandle &media,
                         std::vector<Segment> segments) {
  if (cancelled())
    return fail_cancelled();

  const int requested = request.clip_count;

  if (segments.empty()) {
    std::string message =
        media.duration < request.clip_duration
            ? fmt::format("Video is shorter than {}s, no clips generated",
                          request.clip_duration)
            : std::string("No clips selected");
    log_warn(message);
    store_.complete(id_, {}, message);
    return 0;
  }

  store_.advance(id_, Stage::Processing, PROGRESS_ANALYZE_END,
                 fmt::format("Generating {} clips...", segments.size()));
  log_phase(fmt::format("Rendering {} clips...", segments.size()));

  fs::path out_dir = job_output_dir(options_.temp_dir, id_);
  std::error_code ec;
  fs::create_directories(out_dir, ec);
  if (ec)
    return fail(ErrorKind::System, "",
                fmt::format("Cannot create output directory: {}",
                            ec.message()));

  TIMER_START(render);
  size_t rendered = 0;
  std::string first_error;
  for (size_t i = 0; i < segments.size(); ++i) {
    if (cancelled())
      return fail_cancelled();

    Segment &seg = segments[i];
    fs::path output = out_dir / fmt::format("clip_{}.mp4", seg.index);
    RenderResult result = collaborators_.renderer->render(
        media, seg.start, seg.end, output.string(), options_.target_aspect);

    if (result) {
      seg.output = result.output.empty() ? output.string() : result.output;
      ++rendered;
      log_info(fmt::format("Clip {} [{} - {}] score {:.1f}", seg.index,
                           format_time(seg.start), format_time(seg.end),
                           seg.score));
    } else {
      seg.render_error = fmt::format("{}: {}", render_error_name(result.error),
                                     result.message);
      if (first_error.empty())
        first_error = seg.render_error;
      log_warn(fmt::format("Clip {} failed: {}", seg.index, seg.render_error));
    }

    store_.report_progress(
        id_,
        scale_progress(PROGRESS_ANALYZE_END, PROGRESS_PROCESS_END - 1,
                       static_cast<double>(i + 1) / segments.size()),
        fmt::format("Generated clip {}/{}", i + 1, segments.size()));
  }
  TIMER_END(id_, render);

  if (rendered == 0)
    return fail(ErrorKind::Render, "all_failed",
                fmt::format("All {} clip renders failed ({})",
                            segments.size(), first_error));

  std::string message =
      rendered == segments.size()
          ? fmt::format("Generated {} clips", rendered)
          : fmt::format("Generated {} of {} clips", rendered, segments.size());
  if (segments.size() < static_cast<size_t>(requested))
    message += fmt::format(" ({} requested)", requested);

  store_.complete(id_, std::move(segments), message);
  LOG_SUCCESS("[Job {}] {}", tag_, message);
  return 0;
}

} // namespace reel_cut
