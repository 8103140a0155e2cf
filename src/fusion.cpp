/**
 * @file fusion.cpp
 * @brief Weighted fusion implementation
 */

#include "reel_cut/fusion.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <fmt/core.h>

#include "reel_cut/scoring.hpp"

namespace reel_cut {

namespace {

/// Reasons attached to each curve point
constexpr size_t REASONS_PER_POINT = 2;

/**
 * @brief Nearest sample of an analyzer to t within tolerance.
 * @return Pointer into result.points, or nullptr when absent
 */
const ScorePoint *nearest_sample(const AnalyzerResult &result, double t) {
  const auto &pts = result.points;
  if (pts.empty())
    return nullptr;

  double tolerance = std::max(1.0, result.sample_interval);
  auto it = std::lower_bound(
      pts.begin(), pts.end(), t,
      [](const ScorePoint &p, double value) { return p.timestamp < value; });

  const ScorePoint *best = nullptr;
  double best_dist = 0;
  if (it != pts.begin()) {
    const ScorePoint &before = *(it - 1);
    best = &before;
    best_dist = t - before.timestamp;
  }
  // Strict comparison keeps the earlier sample on ties
  if (it != pts.end() && (best == nullptr || it->timestamp - t < best_dist)) {
    best = &*it;
    best_dist = it->timestamp - t;
  }

  if (best == nullptr || best_dist > tolerance)
    return nullptr;
  return best;
}

} // namespace

double WeightTable::sum() const {
  double total = 0;
  for (double w : weights)
    total += w;
  return total;
}

WeightTable default_weights() {
  WeightTable t;
  t[AnalyzerKind::Semantic] = 0.30;
  t[AnalyzerKind::Audio] = 0.20;
  t[AnalyzerKind::Motion] = 0.20;
  t[AnalyzerKind::Scene] = 0.15;
  t[AnalyzerKind::Faces] = 0.15;
  return t;
}

WeightTable fallback_weights() {
  WeightTable t;
  t[AnalyzerKind::Semantic] = 0.0;
  t[AnalyzerKind::Audio] = 0.30;
  t[AnalyzerKind::Motion] = 0.25;
  t[AnalyzerKind::Scene] = 0.20;
  t[AnalyzerKind::Faces] = 0.25;
  return t;
}

WeightTable renormalize(const WeightTable &base,
                        const std::array<bool, ANALYZER_COUNT> &active) {
  WeightTable out;
  double total = 0;
  for (size_t i = 0; i < ANALYZER_COUNT; ++i) {
    if (active[i] && base.weights[i] > 0) {
      out.weights[i] = base.weights[i];
      total += base.weights[i];
    }
  }
  if (total <= 0)
    return WeightTable{};

  for (double &w : out.weights)
    w /= total;
  return out;
}

WeightTable resolve_weights(const std::vector<AnalyzerResult> &results) {
  std::array<bool, ANALYZER_COUNT> active{};
  for (const auto &r : results)
    if (r.produced_scores())
      active[index_of(r.kind)] = true;

  const WeightTable base = active[index_of(AnalyzerKind::Semantic)]
                               ? default_weights()
                               : fallback_weights();
  return renormalize(base, active);
}

std::string reason_label(AnalyzerKind kind, const ScoreMetadata &meta) {
  switch (kind) {
  case AnalyzerKind::Semantic:
    if (meta.viral_potential == "high" && !meta.description.empty())
      return fmt::format("High viral potential: {}", meta.description);
    if (!meta.content_type.empty() && meta.content_type != "other")
      return fmt::format("AI detected: {} content", meta.content_type);
    if (meta.mood == "exciting" || meta.mood == "funny" ||
        meta.mood == "emotional") {
      std::string mood = meta.mood;
      mood[0] = static_cast<char>(
          std::toupper(static_cast<unsigned char>(mood[0])));
      return mood + " moment";
    }
    return "Engaging content";
  case AnalyzerKind::Audio:
    return "High audio energy";
  case AnalyzerKind::Motion:
    return "High motion";
  case AnalyzerKind::Scene:
    return "Scene change";
  case AnalyzerKind::Faces:
    return meta.face_count > 1 ? "Multiple faces detected" : "Face detected";
  }
  return "Engaging content";
}

EngagementCurve fuse(const std::vector<AnalyzerResult> &results,
                     const WeightTable &weights, double media_duration) {
  EngagementCurve curve;
  curve.media_duration = media_duration;
  if (!(media_duration > 0))
    return curve;

  size_t steps = static_cast<size_t>(std::floor(media_duration));
  if (steps == 0)
    steps = 1;
  curve.points.reserve(steps);

  for (size_t step = 0; step < steps; ++step) {
    CurvePoint point;
    point.timestamp = static_cast<double>(step);

    std::array<const ScoreMetadata *, ANALYZER_COUNT> meta{};
    double total = 0;
    for (const auto &r : results) {
      if (!r.produced_scores())
        continue;
      size_t k = index_of(r.kind);
      double w = weights.weights[k];
      if (w <= 0)
        continue;
      const ScorePoint *sample = nearest_sample(r, point.timestamp);
      if (sample == nullptr)
        continue;

      double value = clamp_score(sample->score.value);
      point.contribution[k] = w * value;
      meta[k] = &sample->score.meta;
      total += point.contribution[k];
    }
    point.score = clamp_score(total);

    // Top contributors, ties resolved by analyzer order
    std::array<size_t, ANALYZER_COUNT> order{};
    for (size_t i = 0; i < ANALYZER_COUNT; ++i)
      order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
      return point.contribution[a] > point.contribution[b];
    });
    for (size_t i = 0; i < REASONS_PER_POINT; ++i) {
      size_t k = order[i];
      if (point.contribution[k] <= 0 || meta[k] == nullptr)
        break;
      point.reasons.push_back(
          reason_label(ALL_ANALYZERS[k], *meta[k]));
    }

    curve.points.push_back(std::move(point));
  }
  return curve;
}

} // namespace reel_cut
