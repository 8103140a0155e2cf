/**
 * @file scoring.cpp
 * @brief Per-analyzer scoring formulas implementation
 */

#include "reel_cut/scoring.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

#include <nlohmann/json.hpp>

#include "reel_cut/logging.hpp"

namespace reel_cut {

// **---- NORMALIZATION ----**

double clamp_score(double value) {
  if (!std::isfinite(value))
    return value > 0 ? MAX_SCORE : 0.0;
  return std::min(MAX_SCORE, std::max(0.0, value));
}

std::vector<double> minmax_scale(const std::vector<double> &values,
                                 double top) {
  std::vector<double> scaled(values.size(), 0.0);
  if (values.empty())
    return scaled;

  auto [lo, hi] = std::minmax_element(values.begin(), values.end());
  double range = *hi - *lo;
  if (range <= 0)
    return scaled;

  for (size_t i = 0; i < values.size(); ++i)
    scaled[i] = (values[i] - *lo) / range * top;
  return scaled;
}

// **---- AUDIO ----**

std::vector<double> audio_scores(const std::vector<double> &rms,
                                 const std::vector<double> &onset) {
  std::vector<double> energy = minmax_scale(rms, MAX_SCORE);
  std::vector<double> bonus = minmax_scale(onset, MAX_SCORE / 2);

  for (size_t i = 0; i < energy.size() && i < bonus.size(); ++i)
    energy[i] = clamp_score(energy[i] + bonus[i]);
  return energy;
}

// **---- VISUAL ----**

double motion_score(double mean_magnitude) {
  return clamp_score(10.0 * mean_magnitude);
}

double scene_score(double mean_abs_diff) {
  return clamp_score(mean_abs_diff / 255.0 * MAX_SCORE);
}

double face_score(double area_ratio, int face_count) {
  return clamp_score(500.0 * area_ratio + 10.0 * face_count);
}

// **---- SEMANTIC ----**

int viral_bonus(const std::string &viral_potential) {
  if (viral_potential == "high")
    return 15;
  if (viral_potential == "medium")
    return 5;
  return 0;
}

int content_type_bonus(const std::string &content_type) {
  if (content_type == "reaction")
    return 12;
  if (content_type == "action" || content_type == "entertainment")
    return 10;
  if (content_type == "tutorial")
    return 8;
  return 0;
}

double semantic_score(double base, const std::string &viral_potential,
                      const std::string &content_type) {
  return clamp_score(clamp_score(base) + viral_bonus(viral_potential) +
                     content_type_bonus(content_type));
}

namespace {

AnalyzerScore neutral_semantic_score() {
  AnalyzerScore s;
  s.value = 50;
  s.meta.description = "Analysis unavailable";
  s.meta.content_type = "other";
  s.meta.mood = "calm";
  s.meta.viral_potential = "low";
  return s;
}

std::string string_field(const nlohmann::json &j, const char *key,
                         const char *fallback) {
  auto it = j.find(key);
  if (it != j.end() && it->is_string())
    return it->get<std::string>();
  return fallback;
}

bool bool_field(const nlohmann::json &j, const char *key) {
  auto it = j.find(key);
  return it != j.end() && it->is_boolean() && it->get<bool>();
}

} // namespace

AnalyzerScore parse_semantic_reply(const std::string &reply) {
  size_t open = reply.find('{');
  size_t close = reply.rfind('}');
  if (open == std::string::npos || close == std::string::npos || close < open)
    return neutral_semantic_score();

  nlohmann::json data = nlohmann::json::parse(
      reply.begin() + open, reply.begin() + close + 1, nullptr, false);
  if (data.is_discarded() || !data.is_object()) {
    LOG_DEBUG("Unparsable vision model reply: {}", reply.substr(0, 120));
    return neutral_semantic_score();
  }

  double base = 50;
  auto it = data.find("score");
  if (it != data.end()) {
    if (it->is_number()) {
      base = it->get<double>();
    } else if (it->is_string()) {
      // Models sometimes quote the number
      const std::string &text = it->get_ref<const std::string &>();
      char *end = nullptr;
      double parsed = std::strtod(text.c_str(), &end);
      if (end != text.c_str())
        base = parsed;
    }
  }

  AnalyzerScore s;
  s.meta.description = string_field(data, "description", "Unknown content");
  s.meta.content_type = string_field(data, "content_type", "other");
  s.meta.mood = string_field(data, "mood", "calm");
  s.meta.viral_potential = string_field(data, "viral_potential", "low");
  s.meta.has_person = bool_field(data, "has_person");
  s.meta.has_text = bool_field(data, "has_text");
  s.value =
      semantic_score(base, s.meta.viral_potential, s.meta.content_type);
  return s;
}

} // namespace reel_cut
