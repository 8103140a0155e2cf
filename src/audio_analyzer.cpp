/**
 * @file audio_analyzer.cpp
 * @brief Audio energy and onset analyzer implementation
 */

#include "reel_cut/audio_analyzer.hpp"

#include <algorithm>
#include <cmath>

#include "reel_cut/logging.hpp"
#include "reel_cut/media_decoder.hpp"
#include "reel_cut/scoring.hpp"

namespace reel_cut {

// **---- Windowing ----**

AudioWindower::AudioWindower(size_t window, int sample_rate)
    : window_(window), sample_rate_(sample_rate) {}

void AudioWindower::close_window() {
  starts_.push_back(static_cast<double>(starts_.size() * window_) /
                    sample_rate_);
  rms_.push_back(std::sqrt(sum_sq_ / static_cast<double>(window_samples_)));
  onset_.push_back(hops_ > 0 ? flux_sum_ / static_cast<double>(hops_) : 0.0);
  sum_sq_ = 0;
  window_samples_ = 0;
  flux_sum_ = 0;
  hops_ = 0;
}

void AudioWindower::add(const float *samples, size_t count) {
  if (count == 0)
    return;

  double energy = 0;
  for (size_t i = 0; i < count; ++i)
    energy += static_cast<double>(samples[i]) * samples[i];

  double log_energy = std::log(energy / count + 1e-10);
  if (have_prev_) {
    flux_sum_ += std::max(0.0, log_energy - prev_log_energy_);
    ++hops_;
  }
  prev_log_energy_ = log_energy;
  have_prev_ = true;

  size_t offset = 0;
  while (offset < count) {
    size_t take = std::min(count - offset, window_ - window_samples_);
    for (size_t i = offset; i < offset + take; ++i)
      sum_sq_ += static_cast<double>(samples[i]) * samples[i];
    window_samples_ += take;
    offset += take;
    if (window_samples_ == window_)
      close_window();
  }
}

void AudioWindower::finish() {
  if (window_samples_ > 0 && window_samples_ >= window_ / 2)
    close_window();
}

// **---- Analyzer ----**

bool AudioAnalyzer::prepare(const MediaHandle &media, std::string &why) {
  if (!media.has_audio) {
    why = "no audio track";
    return false;
  }
  return true;
}

AnalyzerResult AudioAnalyzer::analyze(const MediaHandle &media,
                                      const AnalyzeContext &ctx) {
  AudioSampler sampler(media.path, SAMPLE_RATE);
  std::string error;
  if (!sampler.initialize(error))
    return AnalyzerResult::unavailable(kind(), error);

  const double interval = std::max(ctx.sample_interval, 0.1);
  const size_t window =
      static_cast<size_t>(std::lround(interval * SAMPLE_RATE));
  const double duration = media.duration > 0 ? media.duration : 1.0;

  AudioWindower windower(std::max<size_t>(window, 1), SAMPLE_RATE);

  SampleStatus status = sampler.stream(
      ONSET_HOP, [&](const float *samples, size_t count, double position) {
        if (ctx.cancelled())
          return false;
        windower.add(samples, count);
        ctx.report(position / duration);
        return true;
      });

  if (status == SampleStatus::Stopped)
    return AnalyzerResult::unavailable(kind(), "cancelled");
  if (status == SampleStatus::Failed)
    return AnalyzerResult::unavailable(kind(), "audio decoding failed");

  windower.finish();
  const std::vector<double> &rms = windower.rms();

  AnalyzerResult result;
  result.kind = kind();
  result.available = true;
  result.sample_interval = interval;

  std::vector<double> scores = audio_scores(rms, windower.onset());
  result.points.reserve(scores.size());
  for (size_t i = 0; i < scores.size(); ++i) {
    ScorePoint p;
    p.timestamp = windower.starts()[i];
    p.score.value = scores[i];
    p.score.meta.rms = rms[i];
    result.points.push_back(std::move(p));
  }

  LOG_DEBUG("Audio: {} windows", result.points.size());
  return result;
}

} // namespace reel_cut
