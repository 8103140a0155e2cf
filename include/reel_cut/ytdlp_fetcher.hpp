/**
 * @file ytdlp_fetcher.hpp
 * @brief YouTube media fetcher backed by the yt-dlp CLI
 *
 * @details Fetch sequence:
 *
 *          1. Extract the 11-character video id (cache key)
 *
 *          2. Cache hit: downloads/<id>.mp4 exists and probes cleanly
 *
 *          3. Metadata probe with `yt-dlp -J`: live streams and sources
 *             longer than MAX_VIDEO_DURATION are rejected before download
 *
 *          4. Download merged to mp4, byte progress via --progress-template
 *
 *          5. Probe the result with libavformat
 */

#ifndef REEL_CUT_YTDLP_FETCHER_HPP
#define REEL_CUT_YTDLP_FETCHER_HPP

#include <filesystem>
#include <string>

#include "media.hpp"

namespace reel_cut {

/// yt-dlp format selector: mp4 up to 1080p plus m4a audio
extern const char *const YTDLP_FORMAT;

/**
 * @brief Map yt-dlp diagnostics to a download error kind.
 * @return FetchError::None when nothing recognizable was found
 */
FetchError classify_download_error(const std::string &output);

/**
 * @brief Parse one line emitted by our progress template.
 * @param fraction Output: downloaded / total in [0, 1]
 * @return false for any other line or when the total is unknown
 */
bool parse_progress_line(const std::string &line, double &fraction);

class YtDlpFetcher : public MediaFetcher {
  std::filesystem::path temp_dir_;
  std::string ytdlp_bin_;
  int max_duration_;

  FetchResult probe_source(const std::string &url) const;
  FetchResult download(const std::string &url, const std::string &video_id,
                       const FetchProgress &progress) const;

public:
  YtDlpFetcher(std::filesystem::path temp_dir, std::string ytdlp_bin,
               int max_duration);

  static YtDlpFetcher from_config();

  /// yt-dlp invocation that saves downloads/<video_id>.mp4; the file keeps
  /// the local write time so retention ages it from the download
  std::string build_download_command(const std::string &url,
                                     const std::string &video_id) const;

  FetchResult fetch(const std::string &source_url,
                    const FetchProgress &progress) override;
};

} // namespace reel_cut

#endif // REEL_CUT_YTDLP_FETCHER_HPP
