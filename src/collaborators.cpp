/**
 * @file collaborators.cpp
 * @brief Production collaborator factory
 */

#include "reel_cut/collaborators.hpp"

#include "reel_cut/audio_analyzer.hpp"
#include "reel_cut/config.hpp"
#include "reel_cut/face_analyzer.hpp"
#include "reel_cut/ffmpeg_renderer.hpp"
#include "reel_cut/motion_analyzer.hpp"
#include "reel_cut/scene_analyzer.hpp"
#include "reel_cut/semantic_analyzer.hpp"
#include "reel_cut/vision_client.hpp"
#include "reel_cut/ytdlp_fetcher.hpp"

namespace reel_cut {

std::vector<std::unique_ptr<Analyzer>> make_default_analyzers() {
  std::vector<std::unique_ptr<Analyzer>> analyzers;
  analyzers.push_back(std::make_unique<SemanticAnalyzer>(
      std::make_shared<OllamaClient>(OllamaClient::from_config())));
  analyzers.push_back(std::make_unique<AudioAnalyzer>());
  analyzers.push_back(std::make_unique<MotionAnalyzer>());
  analyzers.push_back(std::make_unique<SceneAnalyzer>());
  analyzers.push_back(
      std::make_unique<FaceAnalyzer>(Config::face_cascade_path()));
  return analyzers;
}

PipelineCollaborators make_default_collaborators() {
  static const auto fetcher =
      std::make_shared<YtDlpFetcher>(YtDlpFetcher::from_config());
  static const auto renderer =
      std::make_shared<FfmpegRenderer>(FfmpegRenderer::from_config());

  PipelineCollaborators c;
  c.fetcher = fetcher;
  c.analyzers = make_default_analyzers();
  c.renderer = renderer;
  return c;
}

} // namespace reel_cut
