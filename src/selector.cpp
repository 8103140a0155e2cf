/**
 * @file selector.cpp
 * @brief Segment selection implementation
 */

#include "reel_cut/selector.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include "reel_cut/config.hpp"

namespace reel_cut {

namespace {

/// Slack for comparisons on sums of seconds
constexpr double EPSILON = 1e-9;

/// Reasons kept per segment
constexpr size_t REASONS_PER_SEGMENT = 3;

/**
 * @brief Score the curve points inside [start, end).
 * @note Summation runs front to back for every window so identical windows
 *       always produce bit-identical scores.
 */
double window_score(const std::vector<CurvePoint> &points, double start,
                    double end, WindowAggregate aggregate, bool &any) {
  auto first = std::lower_bound(
      points.begin(), points.end(), start,
      [](const CurvePoint &p, double t) { return p.timestamp < t - EPSILON; });

  double sum = 0;
  double peak = 0;
  size_t n = 0;
  for (auto it = first; it != points.end() && it->timestamp < end - EPSILON;
       ++it) {
    sum += it->score;
    peak = std::max(peak, it->score);
    ++n;
  }
  any = n > 0;
  if (n == 0)
    return 0;
  return aggregate == WindowAggregate::Peak ? peak
                                            : sum / static_cast<double>(n);
}

std::vector<std::string> window_reasons(const std::vector<CurvePoint> &points,
                                        double start, double end) {
  // label -> (count, first position)
  std::map<std::string, std::pair<int, size_t>> tally;
  size_t position = 0;
  for (const auto &p : points) {
    if (p.timestamp < start - EPSILON || p.timestamp >= end - EPSILON)
      continue;
    for (const auto &r : p.reasons) {
      auto it = tally.find(r);
      if (it == tally.end())
        tally.emplace(r, std::make_pair(1, position++));
      else
        ++it->second.first;
    }
  }

  std::vector<std::pair<std::string, std::pair<int, size_t>>> ranked(
      tally.begin(), tally.end());
  std::sort(ranked.begin(), ranked.end(), [](const auto &a, const auto &b) {
    if (a.second.first != b.second.first)
      return a.second.first > b.second.first;
    return a.second.second < b.second.second;
  });

  std::vector<std::string> out;
  for (size_t i = 0; i < ranked.size() && i < REASONS_PER_SEGMENT; ++i)
    out.push_back(ranked[i].first);
  return out;
}

} // namespace

SelectorOptions SelectorOptions::from_config() {
  SelectorOptions o;
  o.min_gap = Config::min_gap_sec();
  o.stride = Config::select_stride_sec();
  o.aggregate = Config::select_aggregate() == "peak" ? WindowAggregate::Peak
                                                      : WindowAggregate::Mean;
  o.min_window_fraction = Config::min_window_fraction();
  return o;
}

std::vector<Candidate> generate_candidates(const EngagementCurve &curve,
                                           double clip_duration,
                                           const SelectorOptions &options) {
  std::vector<Candidate> out;
  const double duration = curve.media_duration;
  if (!(clip_duration > 0) || !(options.stride > 0) ||
      duration + EPSILON < clip_duration)
    return out;

  const double min_length = options.min_window_fraction * clip_duration;
  for (size_t k = 0;; ++k) {
    double start = static_cast<double>(k) * options.stride;
    if (start >= duration)
      break;
    double end = std::min(start + clip_duration, duration);
    if (end - start + EPSILON < min_length)
      break;

    bool any = false;
    double score =
        window_score(curve.points, start, end, options.aggregate, any);
    if (!any)
      continue;
    out.push_back({start, end, score});
  }
  return out;
}

std::vector<Segment> select_segments(const EngagementCurve &curve,
                                     double clip_duration, int clip_count,
                                     const SelectorOptions &options) {
  std::vector<Segment> accepted;
  if (clip_count <= 0)
    return accepted;

  std::vector<Candidate> candidates =
      generate_candidates(curve, clip_duration, options);
  std::sort(candidates.begin(), candidates.end(),
            [](const Candidate &a, const Candidate &b) {
              if (a.score != b.score)
                return a.score > b.score;
              return a.start < b.start;
            });

  const double separation = clip_duration + std::max(0.0, options.min_gap);
  for (const auto &c : candidates) {
    if (accepted.size() >= static_cast<size_t>(clip_count))
      break;

    bool clear = std::all_of(
        accepted.begin(), accepted.end(), [&](const Segment &s) {
          return std::fabs(c.start - s.start) + EPSILON >= separation;
        });
    if (!clear)
      continue;

    Segment seg;
    seg.rank = static_cast<int>(accepted.size()) + 1;
    seg.start = c.start;
    seg.end = c.end;
    seg.score = c.score;
    seg.reasons = window_reasons(curve.points, c.start, c.end);
    accepted.push_back(std::move(seg));
  }

  std::sort(accepted.begin(), accepted.end(),
            [](const Segment &a, const Segment &b) { return a.start < b.start; });
  for (size_t i = 0; i < accepted.size(); ++i)
    accepted[i].index = static_cast<int>(i) + 1;
  return accepted;
}

std::vector<Segment> select_segments(const EngagementCurve &curve,
                                     double clip_duration, int clip_count,
                                     double min_gap) {
  SelectorOptions options;
  options.min_gap = min_gap;
  return select_segments(curve, clip_duration, clip_count, options);
}

} // namespace reel_cut
