/**
 * @file audio_analyzer.hpp
 * @brief Audio energy and onset analyzer
 */

#ifndef REEL_CUT_AUDIO_ANALYZER_HPP
#define REEL_CUT_AUDIO_ANALYZER_HPP

#include <cstddef>
#include <vector>

#include "analyzer.hpp"

namespace reel_cut {

/**
 * @class AudioWindower
 * @brief Folds a stream of hop-sized sample blocks into fixed windows.
 *
 * @details Window k covers exactly samples [k * window, (k + 1) * window),
 *          so a hop that straddles a boundary is split between two windows.
 *          A hop's log-energy flux counts toward the window it starts in.
 */
class AudioWindower {
  size_t window_;
  int sample_rate_;

  std::vector<double> starts_;
  std::vector<double> rms_;
  std::vector<double> onset_;

  double sum_sq_ = 0;
  size_t window_samples_ = 0;
  double flux_sum_ = 0;
  size_t hops_ = 0;
  double prev_log_energy_ = 0;
  bool have_prev_ = false;

  void close_window();

public:
  AudioWindower(size_t window, int sample_rate);

  /// Feed one hop of mono samples
  void add(const float *samples, size_t count);

  /// Close a trailing partial window of at least half the window length
  void finish();

  const std::vector<double> &starts() const { return starts_; } //< Seconds
  const std::vector<double> &rms() const { return rms_; }
  const std::vector<double> &onset() const { return onset_; }
};

/**
 * @class AudioAnalyzer
 * @brief Scores each window by RMS energy plus an onset-strength bonus.
 *
 * @details The track is decoded to mono float at 22050 Hz. Per window:
 *
 *          - RMS over all samples, min-max scaled to [0, 100]
 *
 *          - Mean positive log-energy flux over 512-sample hops, min-max
 *            scaled to [0, 50] and added, capped at 100
 */
class AudioAnalyzer : public Analyzer {
public:
  static constexpr int SAMPLE_RATE = 22050;

  AnalyzerKind kind() const override { return AnalyzerKind::Audio; }
  double default_interval() const override { return 1.0; }

  bool prepare(const MediaHandle &media, std::string &why) override;
  AnalyzerResult analyze(const MediaHandle &media,
                         const AnalyzeContext &ctx) override;
};

} // namespace reel_cut

#endif // REEL_CUT_AUDIO_ANALYZER_HPP
