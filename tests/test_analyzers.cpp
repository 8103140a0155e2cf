#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <deque>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "reel_cut/audio_analyzer.hpp"
#include "reel_cut/config.hpp"
#include "reel_cut/face_analyzer.hpp"
#include "reel_cut/motion_analyzer.hpp"
#include "reel_cut/scene_analyzer.hpp"
#include "reel_cut/scoring.hpp"
#include "reel_cut/semantic_analyzer.hpp"

using namespace reel_cut;

namespace {

/// Answers describe() from a script of outcomes, one per call
class ScriptedVisionClient : public VisionClient {
public:
  std::deque<bool> outcomes;
  std::string reply = R"({"score": 80, "description": "crowd cheering",
      "content_type": "reaction", "has_person": true, "has_text": false,
      "mood": "exciting", "viral_potential": "high"})";
  int calls = 0;
  size_t last_jpeg_size = 0;
  std::string last_prompt;

  bool check_available(std::string &why) override {
    (void)why;
    return true;
  }

  bool describe(const std::vector<uint8_t> &jpeg, const std::string &prompt,
                std::string &out, std::string &error) override {
    ++calls;
    last_jpeg_size = jpeg.size();
    last_prompt = prompt;
    bool ok = outcomes.empty() ? true : outcomes.front();
    if (!outcomes.empty())
      outcomes.pop_front();
    if (!ok) {
      error = "connection refused";
      return false;
    }
    out = reply;
    return true;
  }
};

class ExposedSemantic : public SemanticAnalyzer {
public:
  using SemanticAnalyzer::SemanticAnalyzer;
  using SemanticAnalyzer::begin;
  using SemanticAnalyzer::effective_interval;
  using SemanticAnalyzer::score_frame;
};

class ExposedMotion : public MotionAnalyzer {
public:
  using MotionAnalyzer::begin;
  using MotionAnalyzer::score_frame;
};

class ExposedScene : public SceneAnalyzer {
public:
  using SceneAnalyzer::begin;
  using SceneAnalyzer::score_frame;
};

class ExposedFaces : public FaceAnalyzer {
public:
  using FaceAnalyzer::FaceAnalyzer;
  using FaceAnalyzer::score_frame;
};

cv::Mat color_frame() {
  return cv::Mat(432, 768, CV_8UC3, cv::Scalar(40, 90, 160));
}

/// Smooth random texture so optical flow has something to track
cv::Mat textured_gray(int w, int h) {
  cv::Mat noise(h, w, CV_8UC1);
  cv::RNG rng(7);
  rng.fill(noise, cv::RNG::UNIFORM, 0, 255);
  cv::Mat smooth;
  cv::GaussianBlur(noise, smooth, cv::Size(9, 9), 2.5);
  return smooth;
}

} // namespace

// **---- Semantic ----**

TEST(SemanticAnalyzerTest, GivesUpAfterConsecutiveFailuresWithoutSuccess) {
  auto client = std::make_shared<ScriptedVisionClient>();
  client->outcomes = {false, false, false};
  ExposedSemantic analyzer(client);
  analyzer.begin();

  AnalyzerScore out;
  cv::Mat frame = color_frame();
  EXPECT_FALSE(analyzer.score_frame(frame, 0.0, out));
  EXPECT_FALSE(analyzer.score_frame(frame, 12.0, out));
  EXPECT_THROW(analyzer.score_frame(frame, 24.0, out), std::runtime_error);
  EXPECT_EQ(client->calls, SemanticAnalyzer::MAX_CONSECUTIVE_FAILURES);
}

TEST(SemanticAnalyzerTest, FailuresAfterSuccessOnlySkipFrames) {
  auto client = std::make_shared<ScriptedVisionClient>();
  client->outcomes = {true, false, false, false, false, true};
  ExposedSemantic analyzer(client);
  analyzer.begin();

  AnalyzerScore out;
  cv::Mat frame = color_frame();
  ASSERT_TRUE(analyzer.score_frame(frame, 0.0, out));
  EXPECT_EQ(out.meta.mood, "exciting");
  EXPECT_EQ(out.meta.content_type, "reaction");
  EXPECT_GT(out.value, 0.0);
  EXPECT_GT(client->last_jpeg_size, 0u);
  EXPECT_EQ(client->last_prompt, ENGAGEMENT_PROMPT);

  for (int i = 1; i <= 4; ++i) {
    AnalyzerScore skipped;
    EXPECT_NO_THROW(
        EXPECT_FALSE(analyzer.score_frame(frame, 3.0 * i, skipped)));
  }
  EXPECT_TRUE(analyzer.score_frame(frame, 15.0, out));
}

TEST(SemanticAnalyzerTest, BeginResetsFailureCount) {
  auto client = std::make_shared<ScriptedVisionClient>();
  client->outcomes = {true, false, false, false, false, false};
  ExposedSemantic analyzer(client);
  analyzer.begin();

  AnalyzerScore out;
  cv::Mat frame = color_frame();
  ASSERT_TRUE(analyzer.score_frame(frame, 0.0, out));
  EXPECT_FALSE(analyzer.score_frame(frame, 3.0, out));
  EXPECT_FALSE(analyzer.score_frame(frame, 6.0, out));

  // A new run forgets the earlier success
  analyzer.begin();
  EXPECT_FALSE(analyzer.score_frame(frame, 0.0, out));
  EXPECT_FALSE(analyzer.score_frame(frame, 3.0, out));
  EXPECT_THROW(analyzer.score_frame(frame, 6.0, out), std::runtime_error);
}

TEST(SemanticAnalyzerTest, IntervalStretchedToFrameBudget) {
  ExposedSemantic analyzer(std::make_shared<ScriptedVisionClient>());
  const int budget = std::max(1, Config::semantic_max_frames());

  MediaHandle longer;
  longer.duration = 600;
  double interval = analyzer.effective_interval(longer, 3.0);
  EXPECT_DOUBLE_EQ(interval, std::max(3.0, 600.0 / budget));
  EXPECT_LE(longer.duration / interval, budget + 1e-9);

  MediaHandle shorter;
  shorter.duration = 3.0 * budget / 2;
  EXPECT_DOUBLE_EQ(analyzer.effective_interval(shorter, 3.0), 3.0);
}

// **---- Motion ----**

TEST(MotionAnalyzerTest, FirstFrameOfPairYieldsNoPoint) {
  ExposedMotion analyzer;
  analyzer.begin();
  cv::Mat frame = textured_gray(MotionAnalyzer::FRAME_WIDTH,
                                MotionAnalyzer::FRAME_HEIGHT);
  AnalyzerScore out;
  EXPECT_FALSE(analyzer.score_frame(frame, 0.0, out));
  ASSERT_TRUE(analyzer.score_frame(frame, 0.5, out));
  EXPECT_LT(out.value, 1.0);
  EXPECT_LT(out.meta.motion_magnitude, 0.1);

  // begin() forgets the previous frame
  analyzer.begin();
  EXPECT_FALSE(analyzer.score_frame(frame, 0.0, out));
}

TEST(MotionAnalyzerTest, ShiftedFrameScoresMotion) {
  ExposedMotion analyzer;
  analyzer.begin();
  cv::Mat frame = textured_gray(MotionAnalyzer::FRAME_WIDTH,
                                MotionAnalyzer::FRAME_HEIGHT);
  cv::Mat shift = (cv::Mat_<double>(2, 3) << 1, 0, 3, 0, 1, 0);
  cv::Mat moved;
  cv::warpAffine(frame, moved, shift, frame.size(), cv::INTER_LINEAR,
                 cv::BORDER_REFLECT);

  AnalyzerScore out;
  ASSERT_FALSE(analyzer.score_frame(frame, 0.0, out));
  ASSERT_TRUE(analyzer.score_frame(moved, 0.5, out));
  EXPECT_GT(out.meta.motion_magnitude, 1.0);
  EXPECT_DOUBLE_EQ(out.value, motion_score(out.meta.motion_magnitude));
  EXPECT_GT(out.value, 10.0);
}

// **---- Scene ----**

TEST(SceneAnalyzerTest, ScoresMeanAbsoluteDifference) {
  ExposedScene analyzer;
  analyzer.begin();
  const cv::Size size(SceneAnalyzer::FRAME_WIDTH, SceneAnalyzer::FRAME_HEIGHT);
  cv::Mat black(size, CV_8UC1, cv::Scalar(0));
  cv::Mat white(size, CV_8UC1, cv::Scalar(255));
  cv::Mat gray(size, CV_8UC1, cv::Scalar(128));

  AnalyzerScore out;
  EXPECT_FALSE(analyzer.score_frame(black, 0.0, out));
  ASSERT_TRUE(analyzer.score_frame(white, 0.5, out));
  EXPECT_DOUBLE_EQ(out.value, 100.0);

  // Compared against the frame just scored, not the first one
  ASSERT_TRUE(analyzer.score_frame(gray, 1.0, out));
  EXPECT_NEAR(out.value, 127.0 / 255.0 * 100.0, 1e-9);

  analyzer.begin();
  EXPECT_FALSE(analyzer.score_frame(black, 0.0, out));
  ASSERT_TRUE(analyzer.score_frame(gray, 0.5, out));
  EXPECT_NEAR(out.value, 50.2, 0.05);
  ASSERT_TRUE(analyzer.score_frame(gray, 1.0, out));
  EXPECT_DOUBLE_EQ(out.value, 0.0);
}

// **---- Faces ----**

TEST(FaceAnalyzerTest, AreaRatio) {
  const cv::Size frame(640, 360);
  EXPECT_DOUBLE_EQ(face_area_ratio({}, frame), 0.0);
  EXPECT_DOUBLE_EQ(face_area_ratio({cv::Rect(0, 0, 64, 36)}, frame), 0.01);
  EXPECT_DOUBLE_EQ(
      face_area_ratio({cv::Rect(0, 0, 64, 36), cv::Rect(0, 0, 64, 36)}, frame),
      0.02);
  EXPECT_DOUBLE_EQ(face_area_ratio({cv::Rect(0, 0, 10, 10)}, cv::Size(0, 0)),
                   0.0);
  EXPECT_DOUBLE_EQ(face_score(face_area_ratio({cv::Rect(0, 0, 64, 36)}, frame),
                              1),
                   15.0);
}

TEST(FaceAnalyzerTest, MissingCascadeMakesAnalyzerUnavailable) {
  FaceAnalyzer analyzer("/nonexistent/haarcascade_frontalface_default.xml");
  MediaHandle media;
  std::string why;
  EXPECT_FALSE(analyzer.prepare(media, why));
  EXPECT_NE(why.find("haarcascade"), std::string::npos);
}

TEST(FaceAnalyzerTest, BlankFrameHasNoFaces) {
  ExposedFaces analyzer(Config::face_cascade_path());
  MediaHandle media;
  std::string why;
  if (!analyzer.prepare(media, why))
    GTEST_SKIP() << "face cascade not installed: " << why;

  cv::Mat blank(360, FaceAnalyzer::FRAME_WIDTH, CV_8UC1, cv::Scalar(90));
  AnalyzerScore out;
  ASSERT_TRUE(analyzer.score_frame(blank, 0.0, out));
  EXPECT_EQ(out.meta.face_count, 0);
  EXPECT_FALSE(out.meta.has_person);
  EXPECT_DOUBLE_EQ(out.value, 0.0);
}

// **---- Audio windowing ----**

TEST(AudioWindowerTest, WindowsSplitHopsAtBoundaries) {
  // 1000 Hz and 300-sample hops: every third hop straddles a boundary
  AudioWindower windower(1000, 1000);
  std::vector<float> samples(3000);
  for (size_t i = 0; i < samples.size(); ++i)
    samples[i] = 0.1f * static_cast<float>(i / 1000 + 1);

  for (size_t at = 0; at < samples.size(); at += 300)
    windower.add(samples.data() + at, std::min<size_t>(300, 3000 - at));
  windower.finish();

  ASSERT_EQ(windower.rms().size(), 3u);
  EXPECT_EQ(windower.starts(), (std::vector<double>{0.0, 1.0, 2.0}));
  EXPECT_NEAR(windower.rms()[0], 0.1, 1e-6);
  EXPECT_NEAR(windower.rms()[1], 0.2, 1e-6);
  EXPECT_NEAR(windower.rms()[2], 0.3, 1e-6);
}

TEST(AudioWindowerTest, OnsetCountsTowardWindowWhereHopStarts) {
  AudioWindower windower(1000, 1000);
  std::vector<float> quiet(512, 0.1f);
  std::vector<float> loud(512, 0.5f);

  // Hops start at 0, 512, 1024, 1536 (quiet) then 2048, 2560 (loud)
  for (int i = 0; i < 4; ++i)
    windower.add(quiet.data(), quiet.size());
  windower.add(loud.data(), loud.size());
  windower.add(loud.data(), loud.size());
  windower.finish();

  // The 72 samples past 3000 are under half a window and are dropped
  ASSERT_EQ(windower.onset().size(), 3u);
  EXPECT_EQ(windower.starts(), (std::vector<double>{0.0, 1.0, 2.0}));
  EXPECT_NEAR(windower.onset()[0], 0.0, 1e-6);
  EXPECT_NEAR(windower.onset()[1], 0.0, 1e-6);
  EXPECT_NEAR(windower.onset()[2], std::log(25.0) / 2.0, 1e-4);

  EXPECT_NEAR(windower.rms()[1], 0.1, 1e-6);
  EXPECT_NEAR(windower.rms()[2],
              std::sqrt((48 * 0.01 + 952 * 0.25) / 1000.0), 1e-6);
}

TEST(AudioWindowerTest, KeepsTrailingHalfWindow) {
  AudioWindower windower(1000, 1000);
  std::vector<float> block(500, 0.2f);
  for (int i = 0; i < 3; ++i)
    windower.add(block.data(), block.size());
  windower.finish();
  EXPECT_EQ(windower.starts(), (std::vector<double>{0.0, 1.0}));
  EXPECT_NEAR(windower.rms()[1], 0.2, 1e-6);
}

TEST(AudioAnalyzerTest, SilentTrackIsUnavailable) {
  AudioAnalyzer analyzer;
  MediaHandle media;
  media.has_audio = false;
  std::string why;
  EXPECT_FALSE(analyzer.prepare(media, why));
  EXPECT_EQ(why, "no audio track");
}
