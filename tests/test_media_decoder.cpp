#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "reel_cut/audio_analyzer.hpp"
#include "reel_cut/job.hpp"
#include "reel_cut/media_decoder.hpp"
#include "reel_cut/motion_analyzer.hpp"
#include "reel_cut/scene_analyzer.hpp"
#include "reel_cut/scoring.hpp"
#include "reel_cut/system.hpp"

using namespace reel_cut;
namespace fs = std::filesystem;

/**
 * Four seconds of 320x240 testsrc at 25 fps with a 44.1 kHz track that is
 * silent for two seconds and then plays a 440 Hz tone.
 */
class MediaClipTest : public ::testing::Test {
protected:
  static fs::path dir;
  static fs::path clip;
  static std::string skip_reason;

  static void SetUpTestSuite() {
    dir = fs::temp_directory_path() / ("reel_cut_media_" + generate_job_id());
    std::error_code ec;
    fs::create_directories(dir, ec);
    clip = dir / "clip.mp4";

    std::string cmd = fmt::format(
        "ffmpeg -hide_banner -loglevel error -y "
        "-f lavfi -i {} -f lavfi -i {} "
        "-c:v mpeg4 -q:v 5 -c:a aac -b:a 96k -shortest {} 2>&1",
        shell_quote("testsrc=size=320x240:rate=25:duration=4"),
        shell_quote("aevalsrc=if(lt(t\\,2)\\,0\\,0.5*sin(2*PI*440*t))"
                    ":s=44100:d=4"),
        shell_quote(clip.string()));
    CommandResult r = run_command(cmd);
    if (r.exit_code != 0 || !fs::exists(clip, ec))
      skip_reason = fmt::format("cannot generate test clip (exit {}): {}",
                                r.exit_code, r.output);
  }

  static void TearDownTestSuite() {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  void SetUp() override {
    if (!skip_reason.empty())
      GTEST_SKIP() << skip_reason;
  }

  static MediaHandle clip_media() {
    MediaHandle media;
    std::string error;
    EXPECT_TRUE(probe_media(clip.string(), media, error)) << error;
    return media;
  }
};

fs::path MediaClipTest::dir;
fs::path MediaClipTest::clip;
std::string MediaClipTest::skip_reason;

TEST_F(MediaClipTest, ReadsGeometryAndAudio) {
  MediaHandle media = clip_media();
  EXPECT_NEAR(media.duration, 4.0, 0.15);
  EXPECT_EQ(media.width, 320);
  EXPECT_EQ(media.height, 240);
  EXPECT_NEAR(media.fps, 25.0, 0.01);
  EXPECT_TRUE(media.has_audio);
}

TEST_F(MediaClipTest, RejectsGarbageContainers) {
  fs::path bogus = dir / "bogus.mp4";
  {
    std::ofstream out(bogus, std::ios::binary);
    out << "this is not a media container";
  }
  MediaHandle media;
  std::string error;
  EXPECT_FALSE(probe_media(bogus.string(), media, error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(probe_media((dir / "missing.mp4").string(), media, error));
}

TEST_F(MediaClipTest, FrameSamplerEmitsOneFramePerInterval) {
  FrameSampler sampler(clip.string());
  std::string error;
  ASSERT_TRUE(sampler.initialize(error)) << error;
  EXPECT_EQ(sampler.source_width(), 320);
  EXPECT_EQ(sampler.source_height(), 240);

  std::vector<double> stamps;
  SampleStatus status = sampler.sample(
      1.0, 160, 120, PixelLayout::Gray, [&](const SampledFrame &f) {
        EXPECT_EQ(f.width, 160);
        EXPECT_EQ(f.height, 120);
        EXPECT_GE(f.stride, 160);
        EXPECT_NE(f.data, nullptr);
        stamps.push_back(f.timestamp);
        return true;
      });
  EXPECT_EQ(status, SampleStatus::Completed);
  ASSERT_EQ(stamps.size(), 4u);
  for (size_t i = 0; i < stamps.size(); ++i)
    EXPECT_NEAR(stamps[i], static_cast<double>(i), 0.05);
}

TEST_F(MediaClipTest, FrameSamplerStopsOnRequest) {
  FrameSampler sampler(clip.string());
  std::string error;
  ASSERT_TRUE(sampler.initialize(error)) << error;
  int frames = 0;
  SampleStatus status =
      sampler.sample(0.5, 0, 0, PixelLayout::BGR, [&](const SampledFrame &f) {
        EXPECT_EQ(f.width, 320);
        EXPECT_GE(f.stride, 320 * 3);
        return ++frames < 2;
      });
  EXPECT_EQ(status, SampleStatus::Stopped);
  EXPECT_EQ(frames, 2);
}

TEST_F(MediaClipTest, AudioSamplerStreamsWholeTrack) {
  AudioSampler sampler(clip.string(), AudioAnalyzer::SAMPLE_RATE);
  std::string error;
  ASSERT_TRUE(sampler.initialize(error)) << error;

  size_t total = 0;
  double last_position = -1;
  SampleStatus status = sampler.stream(
      ONSET_HOP, [&](const float *samples, size_t count, double position) {
        EXPECT_NE(samples, nullptr);
        EXPECT_LE(count, ONSET_HOP);
        EXPECT_GT(position, last_position);
        last_position = position;
        total += count;
        return true;
      });
  EXPECT_EQ(status, SampleStatus::Completed);
  EXPECT_NEAR(static_cast<double>(total) / AudioAnalyzer::SAMPLE_RATE, 4.0,
              0.1);
}

TEST_F(MediaClipTest, AudioAnalyzerScoresLoudSecondsHigher) {
  MediaHandle media = clip_media();
  AudioAnalyzer analyzer;
  std::string why;
  ASSERT_TRUE(analyzer.prepare(media, why)) << why;

  double progress = 0;
  AnalyzeContext ctx;
  ctx.sample_interval = 1.0;
  ctx.progress = [&](double f) { progress = f; };
  AnalyzerResult result = analyzer.analyze(media, ctx);

  ASSERT_TRUE(result.available) << result.reason;
  ASSERT_GE(result.points.size(), 4u);
  for (size_t i = 0; i < result.points.size(); ++i)
    EXPECT_DOUBLE_EQ(result.points[i].timestamp, static_cast<double>(i));

  const auto &p = result.points;
  EXPECT_GT(p[2].score.value, p[0].score.value + 50.0);
  EXPECT_GT(p[3].score.value, p[1].score.value);
  EXPECT_GT(p[3].score.meta.rms, 0.1);
  EXPECT_GT(p[2].score.meta.rms, 10 * p[1].score.meta.rms);
  EXPECT_LT(p[0].score.meta.rms, 0.01);
  EXPECT_GT(progress, 0.5);
}

TEST_F(MediaClipTest, AudioAnalyzerHonorsCancellation) {
  MediaHandle media = clip_media();
  std::atomic<bool> cancel{true};
  AnalyzeContext ctx;
  ctx.cancel = &cancel;
  AnalyzerResult result = AudioAnalyzer().analyze(media, ctx);
  EXPECT_FALSE(result.available);
  EXPECT_EQ(result.reason, "cancelled");
}

TEST_F(MediaClipTest, FrameAnalyzersScoreSampledPairs) {
  MediaHandle media = clip_media();
  AnalyzeContext ctx;
  ctx.sample_interval = 1.0;

  AnalyzerResult motion = MotionAnalyzer().analyze(media, ctx);
  ASSERT_TRUE(motion.available) << motion.reason;
  // The first sampled frame only seeds the pair
  ASSERT_EQ(motion.points.size(), 3u);
  EXPECT_NEAR(motion.points.front().timestamp, 1.0, 0.05);
  for (const auto &p : motion.points) {
    EXPECT_GE(p.score.value, 0.0);
    EXPECT_LE(p.score.value, 100.0);
  }

  AnalyzerResult scene = SceneAnalyzer().analyze(media, ctx);
  ASSERT_TRUE(scene.available) << scene.reason;
  EXPECT_EQ(scene.points.size(), 3u);
  EXPECT_DOUBLE_EQ(scene.sample_interval, 1.0);
}

TEST_F(MediaClipTest, MissingFileMakesFrameAnalyzerUnavailable) {
  MediaHandle media = clip_media();
  media.path = (dir / "missing.mp4").string();
  AnalyzeContext ctx;
  AnalyzerResult result = SceneAnalyzer().analyze(media, ctx);
  EXPECT_FALSE(result.available);
  EXPECT_FALSE(result.reason.empty());
}
