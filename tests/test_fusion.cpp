#include <gtest/gtest.h>

#include <vector>

#include "reel_cut/fusion.hpp"

using namespace reel_cut;

namespace {

AnalyzerResult series(AnalyzerKind kind, const std::vector<double> &values,
                      double interval = 1.0, double offset = 0.0) {
  AnalyzerResult r;
  r.kind = kind;
  r.available = true;
  r.sample_interval = interval;
  for (size_t i = 0; i < values.size(); ++i) {
    ScorePoint p;
    p.timestamp = offset + static_cast<double>(i) * interval;
    p.score.value = values[i];
    r.points.push_back(p);
  }
  return r;
}

std::array<bool, ANALYZER_COUNT> all_active() {
  std::array<bool, ANALYZER_COUNT> a{};
  a.fill(true);
  return a;
}

} // namespace

TEST(FusionTest, DefaultTableWhenAllAnalyzersProduceScores) {
  std::vector<AnalyzerResult> results;
  for (AnalyzerKind k : ALL_ANALYZERS)
    results.push_back(series(k, {10, 20}));

  WeightTable w = resolve_weights(results);
  EXPECT_NEAR(w[AnalyzerKind::Semantic], 0.30, 1e-9);
  EXPECT_NEAR(w[AnalyzerKind::Audio], 0.20, 1e-9);
  EXPECT_NEAR(w[AnalyzerKind::Motion], 0.20, 1e-9);
  EXPECT_NEAR(w[AnalyzerKind::Scene], 0.15, 1e-9);
  EXPECT_NEAR(w[AnalyzerKind::Faces], 0.15, 1e-9);
  EXPECT_NEAR(w.sum(), 1.0, 1e-9);
}

TEST(FusionTest, FallbackTableWithoutSemantic) {
  std::vector<AnalyzerResult> results = {
      AnalyzerResult::unavailable(AnalyzerKind::Semantic, "model missing"),
      series(AnalyzerKind::Audio, {1}), series(AnalyzerKind::Motion, {1}),
      series(AnalyzerKind::Scene, {1}), series(AnalyzerKind::Faces, {1})};

  WeightTable w = resolve_weights(results);
  EXPECT_DOUBLE_EQ(w[AnalyzerKind::Semantic], 0.0);
  EXPECT_NEAR(w[AnalyzerKind::Audio], 0.30, 1e-9);
  EXPECT_NEAR(w[AnalyzerKind::Motion], 0.25, 1e-9);
  EXPECT_NEAR(w[AnalyzerKind::Scene], 0.20, 1e-9);
  EXPECT_NEAR(w[AnalyzerKind::Faces], 0.25, 1e-9);
}

TEST(FusionTest, RenormalizePreservesRatios) {
  auto active = all_active();
  active[index_of(AnalyzerKind::Faces)] = false;
  WeightTable w = renormalize(default_weights(), active);

  EXPECT_DOUBLE_EQ(w[AnalyzerKind::Faces], 0.0);
  EXPECT_NEAR(w.sum(), 1.0, 1e-12);
  EXPECT_NEAR(w[AnalyzerKind::Semantic] / w[AnalyzerKind::Audio], 1.5, 1e-12);
  EXPECT_NEAR(w[AnalyzerKind::Motion] / w[AnalyzerKind::Scene], 0.20 / 0.15,
              1e-12);
}

TEST(FusionTest, EmptyAnalyzerDoesNotTakeWeight) {
  AnalyzerResult empty;
  empty.kind = AnalyzerKind::Motion;
  empty.available = true;
  std::vector<AnalyzerResult> results = {series(AnalyzerKind::Audio, {5}),
                                         empty};
  WeightTable w = resolve_weights(results);
  EXPECT_NEAR(w[AnalyzerKind::Audio], 1.0, 1e-12);
  EXPECT_DOUBLE_EQ(w[AnalyzerKind::Motion], 0.0);
}

TEST(FusionTest, NoActiveAnalyzerGivesZeroTable) {
  std::array<bool, ANALYZER_COUNT> none{};
  EXPECT_DOUBLE_EQ(renormalize(default_weights(), none).sum(), 0.0);
}

TEST(FusionTest, GridCoversWholeSeconds) {
  std::vector<AnalyzerResult> results = {
      series(AnalyzerKind::Audio, {10, 20, 30, 40, 50, 60})};
  WeightTable w = resolve_weights(results);

  EngagementCurve curve = fuse(results, w, 5.7);
  ASSERT_EQ(curve.points.size(), 5u);
  for (size_t i = 0; i < curve.points.size(); ++i) {
    EXPECT_DOUBLE_EQ(curve.points[i].timestamp, static_cast<double>(i));
    EXPECT_DOUBLE_EQ(curve.points[i].score, 10.0 * (i + 1));
  }

  EXPECT_EQ(fuse(results, w, 0.4).points.size(), 1u);
  EXPECT_TRUE(fuse(results, w, 0.0).points.empty());
}

TEST(FusionTest, MissingSampleContributesZero) {
  std::vector<AnalyzerResult> results = {
      series(AnalyzerKind::Audio, {80}), // only t=0
      series(AnalyzerKind::Scene, {40, 40, 40, 40, 40})};
  WeightTable w = resolve_weights(results);
  EngagementCurve curve = fuse(results, w, 5);

  const double wa = w[AnalyzerKind::Audio];
  const double ws = w[AnalyzerKind::Scene];
  EXPECT_NEAR(curve.points[0].score, wa * 80 + ws * 40, 1e-9);
  EXPECT_NEAR(curve.points[1].score, wa * 80 + ws * 40, 1e-9); // within 1 s
  EXPECT_NEAR(curve.points[2].score, ws * 40, 1e-9);
  EXPECT_DOUBLE_EQ(curve.points[2].contribution[index_of(AnalyzerKind::Audio)],
                   0.0);
}

TEST(FusionTest, EquidistantSamplesResolveToEarlier) {
  std::vector<AnalyzerResult> results = {
      series(AnalyzerKind::Motion, {10, 90}, 1.0, 0.5)};
  WeightTable w = resolve_weights(results);
  EngagementCurve curve = fuse(results, w, 2);
  ASSERT_EQ(curve.points.size(), 2u);
  EXPECT_DOUBLE_EQ(curve.points[1].score, 10.0);
}

TEST(FusionTest, ScoresStayInRange) {
  WeightTable heavy;
  heavy[AnalyzerKind::Audio] = 1.0;
  heavy[AnalyzerKind::Motion] = 1.0;
  std::vector<AnalyzerResult> results = {series(AnalyzerKind::Audio, {100}),
                                         series(AnalyzerKind::Motion, {100})};
  EngagementCurve curve = fuse(results, heavy, 1);
  ASSERT_EQ(curve.points.size(), 1u);
  EXPECT_DOUBLE_EQ(curve.points[0].score, 100.0);
}

TEST(FusionTest, UnavailableResultIsIgnored) {
  AnalyzerResult stale = series(AnalyzerKind::Faces, {100});
  stale.available = false;
  WeightTable w;
  w[AnalyzerKind::Faces] = 1.0;
  EngagementCurve curve = fuse({stale}, w, 1);
  EXPECT_DOUBLE_EQ(curve.points[0].score, 0.0);
  EXPECT_TRUE(curve.points[0].reasons.empty());
}

TEST(FusionTest, ReasonsAreTopTwoContributors) {
  AnalyzerResult faces = series(AnalyzerKind::Faces, {80});
  faces.points[0].score.meta.face_count = 3;
  std::vector<AnalyzerResult> results = {
      series(AnalyzerKind::Audio, {80}), series(AnalyzerKind::Scene, {10}),
      faces};
  EngagementCurve curve = fuse(results, resolve_weights(results), 1);

  ASSERT_EQ(curve.points[0].reasons.size(), 2u);
  EXPECT_EQ(curve.points[0].reasons[0], "High audio energy");
  EXPECT_EQ(curve.points[0].reasons[1], "Multiple faces detected");
}

TEST(FusionTest, EqualContributionsFollowAnalyzerOrder) {
  WeightTable w;
  w[AnalyzerKind::Motion] = 0.5;
  w[AnalyzerKind::Scene] = 0.5;
  std::vector<AnalyzerResult> results = {series(AnalyzerKind::Scene, {50}),
                                         series(AnalyzerKind::Motion, {50})};
  EngagementCurve curve = fuse(results, w, 1);
  ASSERT_EQ(curve.points[0].reasons.size(), 2u);
  EXPECT_EQ(curve.points[0].reasons[0], "High motion");
  EXPECT_EQ(curve.points[0].reasons[1], "Scene change");
}

TEST(FusionTest, SemanticReasonLabels) {
  ScoreMetadata meta;
  meta.viral_potential = "high";
  meta.description = "Dog surfing a wave";
  EXPECT_EQ(reason_label(AnalyzerKind::Semantic, meta),
            "High viral potential: Dog surfing a wave");

  meta.viral_potential = "low";
  meta.content_type = "tutorial";
  EXPECT_EQ(reason_label(AnalyzerKind::Semantic, meta),
            "AI detected: tutorial content");

  meta.content_type = "other";
  EXPECT_EQ(reason_label(AnalyzerKind::Semantic, meta), "Engaging content");

  meta.mood = "funny";
  EXPECT_EQ(reason_label(AnalyzerKind::Semantic, meta), "Funny moment");
  meta.mood = "emotional";
  EXPECT_EQ(reason_label(AnalyzerKind::Semantic, meta), "Emotional moment");
  meta.mood = "calm";
  EXPECT_EQ(reason_label(AnalyzerKind::Semantic, meta), "Engaging content");

  ScoreMetadata one_face;
  one_face.face_count = 1;
  EXPECT_EQ(reason_label(AnalyzerKind::Faces, one_face), "Face detected");
}

TEST(FusionTest, FusionIsPure) {
  std::vector<AnalyzerResult> results = {
      series(AnalyzerKind::Audio, {5, 60, 30}),
      series(AnalyzerKind::Motion, {70, 10}, 0.5)};
  WeightTable w = resolve_weights(results);
  EngagementCurve a = fuse(results, w, 3);
  EngagementCurve b = fuse(results, w, 3);
  ASSERT_EQ(a.points.size(), b.points.size());
  for (size_t i = 0; i < a.points.size(); ++i) {
    EXPECT_EQ(a.points[i].score, b.points[i].score);
    EXPECT_EQ(a.points[i].reasons, b.points[i].reasons);
  }
}
