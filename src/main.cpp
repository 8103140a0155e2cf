/**
 * @file main.cpp
 * @brief Entry point for the reel_cut command-line tool
 *
 * @details Submits one job to an in-process JobManager and follows it:
 *
 *          - Argument parsing and request validation
 *
 *          - Progress lines on every stage/progress/message change
 *
 *          - Final status JSON on stdout
 *
 * @note Exit code is 0 only when the job reaches Completed.
 */

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>

#include <fmt/core.h>

#include "reel_cut/cleanup.hpp"
#include "reel_cut/collaborators.hpp"
#include "reel_cut/config.hpp"
#include "reel_cut/job_manager.hpp"
#include "reel_cut/job.hpp"
#include "reel_cut/job_store.hpp"
#include "reel_cut/logging.hpp"

using namespace reel_cut;

namespace {

volatile std::sig_atomic_t interrupted = 0;

void on_signal(int) { interrupted = 1; }

bool parse_int(const char *text, int &out) {
  char *end = nullptr;
  long v = std::strtol(text, &end, 10);
  if (end == text || *end != '\0')
    return false;
  out = static_cast<int>(v);
  return true;
}

void print_usage(const char *prog) {
  LOG_WARN("Usage: {} <youtube_url> [duration_sec] [clip_count]", prog);
  LOG_WARN("  duration_sec: 30, 60, 90, 120 or 180 (default 60)");
  LOG_WARN("  clip_count:   5, 10 or 15 (default 5)");
}

} // namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2 || argc > 4) {
    print_usage(argv[0]);
    return 1;
  }

  JobRequest request;
  request.source_url = argv[1];
  if ((argc > 2 && !parse_int(argv[2], request.clip_duration)) ||
      (argc > 3 && !parse_int(argv[3], request.clip_count))) {
    print_usage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  JobStore store;
  JobManager manager(store, make_default_collaborators,
                     JobManagerOptions::from_config());
  if (!manager.start()) {
    LOG_ERROR("Cannot prepare temp directory {}", Config::temp_dir());
    return 1;
  }

  SubmitResult submitted = manager.submit(request);
  if (!submitted) {
    LOG_ERROR("{}", submitted.message);
    return 2;
  }
  LOG_PHASE("reel_cut job {}", submitted.id);

  bool cancel_sent = false;
  bool finished = false;
  while (!finished) {
    finished = manager.wait(
        submitted.id, std::chrono::milliseconds(500), [](const Job &job) {
          LOG_INFO("[{:>11}] {:3d}% {}", stage_name(job.stage), job.progress,
                   job.message);
        });
    if (interrupted && !cancel_sent) {
      LOG_WARN("Interrupted, cancelling job");
      if (manager.remove(submitted.id) == RemoveOutcome::NotFound)
        break;
      cancel_sent = true;
    }
    if (!finished && !store.contains(submitted.id))
      break; //< Erased after cancellation
  }

  Job job;
  if (!manager.snapshot(submitted.id, job)) {
    LOG_WARN("Job {} was cancelled and deleted", submitted.id);
    manager.shutdown();
    return 3;
  }

  fmt::print("{}\n", to_status_json(job).dump(2));
  manager.shutdown();

  if (job.stage == Stage::Completed) {
    size_t rendered = 0;
    for (const auto &seg : job.segments)
      rendered += seg.rendered() ? 1 : 0;
    LOG_SUCCESS("{} clips written to {}", rendered,
                job_output_dir(Config::temp_dir(), job.id).string());
    return 0;
  }
  return 1;
}
