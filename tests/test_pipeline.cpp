#include <gtest/gtest.h>

#include <filesystem>
#include <thread>

#include "fakes.hpp"
#include "reel_cut/job.hpp"
#include "reel_cut/pipeline.hpp"

using namespace reel_cut;
using namespace reel_cut::testing_fakes;
namespace fs = std::filesystem;

class PipelineTest : public ::testing::Test {
protected:
  JobStore store;
  JobId id;
  std::atomic<bool> cancel{false};
  PipelineOptions options;
  std::shared_ptr<FakeFetcher> fetcher = std::make_shared<FakeFetcher>();
  std::shared_ptr<FakeRenderer> renderer = std::make_shared<FakeRenderer>();
  PipelineCollaborators collaborators;

  void SetUp() override {
    id = generate_job_id();
    options.temp_dir = fs::temp_directory_path() / ("reel_cut_pipe_" + id);
    options.analyzer_timeout_sec = 30;

    Job job;
    job.id = id;
    job.request.source_url = "https://youtu.be/dQw4w9WgXcQ";
    job.request.clip_duration = 60;
    job.request.clip_count = 5;
    job.message = "Job queued";
    ASSERT_TRUE(store.insert(job));

    collaborators.fetcher = fetcher;
    collaborators.renderer = renderer;
    collaborators.analyzers = five_analyzers();
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(options.temp_dir, ec);
  }

  FakeAnalyzer &analyzer(AnalyzerKind kind) {
    return static_cast<FakeAnalyzer &>(
        *collaborators.analyzers[index_of(kind)]);
  }

  int run() {
    JobPipeline pipeline(id, store, collaborators, options, cancel);
    return pipeline.run();
  }

  Job job() {
    Job j;
    EXPECT_TRUE(store.snapshot(id, j));
    return j;
  }
};

TEST_F(PipelineTest, CompletesWithRequestedClips) {
  EXPECT_EQ(run(), 0);

  Job j = job();
  EXPECT_EQ(j.stage, Stage::Completed);
  EXPECT_EQ(j.progress, 100);
  ASSERT_EQ(j.segments.size(), 5u);
  EXPECT_EQ(renderer->calls(), 5u);
  for (size_t i = 0; i < j.segments.size(); ++i) {
    EXPECT_EQ(j.segments[i].index, static_cast<int>(i) + 1);
    EXPECT_TRUE(j.segments[i].rendered());
    EXPECT_TRUE(j.segments[i].render_error.empty());
    if (i > 0)
      EXPECT_GE(j.segments[i].start - j.segments[i - 1].start, 62.0);
  }
  EXPECT_EQ(renderer->aspects.front(), "9:16");
  EXPECT_TRUE(j.unavailable_analyzers.empty());
  EXPECT_DOUBLE_EQ(j.media.duration, 300.0);
}

TEST_F(PipelineTest, SemanticUnavailableStillCompletes) {
  analyzer(AnalyzerKind::Semantic).mode = FakeAnalyzer::Mode::Unavailable;
  // A single loud stretch the audio analyzer should steer selection to
  analyzer(AnalyzerKind::Audio).value = [](double t) {
    return t >= 200 && t < 260 ? 100.0 : 0.0;
  };

  EXPECT_EQ(run(), 0);
  Job j = job();
  EXPECT_EQ(j.stage, Stage::Completed);
  ASSERT_EQ(j.unavailable_analyzers.size(), 1u);
  EXPECT_EQ(j.unavailable_analyzers[0], "semantic (not installed)");

  bool found = false;
  for (const auto &s : j.segments)
    if (s.rank == 1) {
      EXPECT_DOUBLE_EQ(s.start, 200.0);
      found = true;
    }
  EXPECT_TRUE(found);
}

TEST_F(PipelineTest, ShortMediaCompletesWithoutClips) {
  fetcher->media.duration = 20;
  EXPECT_EQ(run(), 0);

  Job j = job();
  EXPECT_EQ(j.stage, Stage::Completed);
  EXPECT_EQ(j.progress, 100);
  EXPECT_TRUE(j.segments.empty());
  EXPECT_EQ(j.message, "Video is shorter than 60s, no clips generated");
  EXPECT_EQ(renderer->calls(), 0u);
  EXPECT_TRUE(to_status_json(j)["segments"].is_array());
}

TEST_F(PipelineTest, AllRendersFailingFailsTheJob) {
  renderer->fail_all = true;
  EXPECT_NE(run(), 0);

  Job j = job();
  EXPECT_EQ(j.stage, Stage::Failed);
  EXPECT_EQ(j.error.kind, ErrorKind::Render);
  EXPECT_EQ(j.error.sub_kind, "all_failed");
  EXPECT_GE(j.progress, 60);
  EXPECT_LT(j.progress, 100);
  EXPECT_EQ(renderer->calls(), 5u);
}

TEST_F(PipelineTest, PartialRenderFailureIsRecordedOnSegment) {
  renderer->failing_calls = {2};
  EXPECT_EQ(run(), 0);

  Job j = job();
  EXPECT_EQ(j.stage, Stage::Completed);
  ASSERT_EQ(j.segments.size(), 5u);
  int failed = 0;
  for (const auto &s : j.segments) {
    if (!s.rendered()) {
      ++failed;
      EXPECT_EQ(s.render_error, "encode_failed: encoder crashed");
    }
  }
  EXPECT_EQ(failed, 1);
  EXPECT_EQ(j.message, "Generated 4 of 5 clips");
}

TEST_F(PipelineTest, DownloadErrorFailsWithSubKind) {
  fetcher->error = FetchError::Private;
  fetcher->error_message = "Video is private";
  EXPECT_NE(run(), 0);

  Job j = job();
  EXPECT_EQ(j.stage, Stage::Failed);
  EXPECT_EQ(j.error.kind, ErrorKind::Download);
  EXPECT_EQ(j.error.sub_kind, "private");
  EXPECT_EQ(j.message, "Video is private");
  EXPECT_LE(j.progress, 25);
  EXPECT_EQ(renderer->calls(), 0u);
}

TEST_F(PipelineTest, NoUsableSignalFailsAnalysis) {
  for (AnalyzerKind k : ALL_ANALYZERS)
    analyzer(k).mode = FakeAnalyzer::Mode::Unavailable;
  analyzer(AnalyzerKind::Scene).mode = FakeAnalyzer::Mode::Empty;
  EXPECT_NE(run(), 0);

  Job j = job();
  EXPECT_EQ(j.stage, Stage::Failed);
  EXPECT_EQ(j.error.kind, ErrorKind::Analysis);
  EXPECT_EQ(j.error.sub_kind, "no_signals");
  EXPECT_EQ(j.unavailable_analyzers.size(), 5u);
}

TEST_F(PipelineTest, ThrowingAnalyzerIsTreatedAsUnavailable) {
  analyzer(AnalyzerKind::Motion).mode = FakeAnalyzer::Mode::Throws;
  EXPECT_EQ(run(), 0);

  Job j = job();
  EXPECT_EQ(j.stage, Stage::Completed);
  ASSERT_EQ(j.unavailable_analyzers.size(), 1u);
  EXPECT_EQ(j.unavailable_analyzers[0], "motion (decoder exploded)");
}

TEST_F(PipelineTest, HungAnalyzerTimesOut) {
  std::atomic<bool> observed{false};
  analyzer(AnalyzerKind::Faces).mode = FakeAnalyzer::Mode::HangsUntilCancelled;
  analyzer(AnalyzerKind::Faces).observed_cancel = &observed;
  options.analyzer_timeout_sec = 0.3;

  EXPECT_EQ(run(), 0);
  Job j = job();
  EXPECT_EQ(j.stage, Stage::Completed);
  ASSERT_EQ(j.unavailable_analyzers.size(), 1u);
  EXPECT_NE(j.unavailable_analyzers[0].find("timed out"), std::string::npos);
  EXPECT_TRUE(observed.load());
}

TEST_F(PipelineTest, CancelledBeforeStart) {
  cancel = true;
  EXPECT_NE(run(), 0);
  Job j = job();
  EXPECT_EQ(j.stage, Stage::Failed);
  EXPECT_EQ(j.error.kind, ErrorKind::Cancelled);
  EXPECT_EQ(fetcher->calls.load(), 0);
}

TEST_F(PipelineTest, CancelDuringDownloadStopsFetch) {
  fetcher->raise_on_fetch = &cancel;
  fetcher->wait_for_abort = true;
  EXPECT_NE(run(), 0);

  Job j = job();
  EXPECT_EQ(j.stage, Stage::Failed);
  EXPECT_EQ(j.error.kind, ErrorKind::Cancelled);
  EXPECT_EQ(renderer->calls(), 0u);
}

TEST_F(PipelineTest, CancelDuringAnalysisStopsAnalyzers) {
  std::atomic<bool> observed{false};
  auto &hung = analyzer(AnalyzerKind::Scene);
  hung.mode = FakeAnalyzer::Mode::HangsUntilCancelled;
  hung.observed_cancel = &observed;
  analyzer(AnalyzerKind::Audio).raise_on_analyze = &cancel;

  EXPECT_NE(run(), 0);
  Job j = job();
  EXPECT_EQ(j.stage, Stage::Failed);
  EXPECT_EQ(j.error.kind, ErrorKind::Cancelled);
  EXPECT_TRUE(observed.load());
  EXPECT_EQ(renderer->calls(), 0u);
}

TEST_F(PipelineTest, CancelBetweenRendersStopsProcessing) {
  renderer->raise_on_render = &cancel;
  EXPECT_NE(run(), 0);

  Job j = job();
  EXPECT_EQ(j.stage, Stage::Failed);
  EXPECT_EQ(j.error.kind, ErrorKind::Cancelled);
  EXPECT_EQ(renderer->calls(), 1u);
}

TEST_F(PipelineTest, StagesRunInOrder) {
  StageProbe probe;
  probe.store = &store;
  probe.id = id;
  fetcher->probe = &probe;
  analyzer(AnalyzerKind::Audio).probe = &probe;
  renderer->probe = &probe;

  EXPECT_EQ(run(), 0);
  ASSERT_EQ(probe.seen.size(), 1u + 1u + 5u);
  EXPECT_EQ(probe.seen[0], Stage::Downloading);
  EXPECT_EQ(probe.seen[1], Stage::Analyzing);
  for (size_t i = 2; i < probe.seen.size(); ++i)
    EXPECT_EQ(probe.seen[i], Stage::Processing);
}

TEST_F(PipelineTest, ProgressNeverDecreases) {
  fetcher->fractions = {0.9, 0.2, 0.95, 1.0};
  std::atomic<bool> finished{false};
  std::atomic<int> violations{0};

  std::thread observer([&] {
    int last = 0;
    while (!finished) {
      Job j;
      if (store.snapshot(id, j)) {
        if (j.progress < last)
          ++violations;
        last = j.progress;
      }
    }
  });

  EXPECT_EQ(run(), 0);
  finished = true;
  observer.join();
  EXPECT_EQ(violations.load(), 0);
  EXPECT_EQ(job().progress, 100);
}

TEST_F(PipelineTest, CachedMediaIsReported) {
  fetcher->media.cached = true;
  fetcher->fractions.clear();
  EXPECT_EQ(run(), 0);
  EXPECT_EQ(job().stage, Stage::Completed);
}

TEST(AnalyzeMediaTest, ReturnsWeightsCurveAndSegments) {
  MediaHandle media;
  media.duration = 120;
  auto analyzers = five_analyzers();
  static_cast<FakeAnalyzer &>(*analyzers[0]).mode =
      FakeAnalyzer::Mode::Unavailable;

  PipelineOptions options;
  std::atomic<bool> cancel{false};
  AnalysisOutcome outcome;
  double last_fraction = 0;
  ASSERT_TRUE(JobPipeline::analyze_media(
      "test", media, analyzers, options, 30, 3, cancel,
      [&](double f) { last_fraction = f; }, outcome));
  (void)last_fraction;

  ASSERT_EQ(outcome.results.size(), 5u);
  EXPECT_FALSE(outcome.results[0].available);
  EXPECT_DOUBLE_EQ(outcome.weights[AnalyzerKind::Semantic], 0.0);
  EXPECT_NEAR(outcome.weights[AnalyzerKind::Audio], 0.30, 1e-9);
  EXPECT_EQ(outcome.curve.points.size(), 120u);
  EXPECT_EQ(outcome.segments.size(), 3u);
}
