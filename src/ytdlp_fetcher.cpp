/**
 * @file ytdlp_fetcher.cpp
 * @brief yt-dlp media fetcher implementation
 */

#include "reel_cut/ytdlp_fetcher.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <system_error>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "reel_cut/cleanup.hpp"
#include "reel_cut/config.hpp"
#include "reel_cut/logging.hpp"
#include "reel_cut/media_decoder.hpp"
#include "reel_cut/system.hpp"
#include "reel_cut/validation.hpp"

namespace fs = std::filesystem;

namespace reel_cut {

const char *const YTDLP_FORMAT =
    "bestvideo[ext=mp4][height<=1080]+bestaudio[ext=m4a]/best[ext=mp4]/best";

namespace {

constexpr const char *PROGRESS_TAG = "RCPROG";

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

/// Last line mentioning ERROR, or the tail of the output
std::string error_excerpt(const std::string &output) {
  std::istringstream in(output);
  std::string line, last_error;
  while (std::getline(in, line))
    if (line.find("ERROR") != std::string::npos)
      last_error = line;
  if (!last_error.empty())
    return last_error;
  return output.size() > 200 ? output.substr(output.size() - 200) : output;
}

bool parse_number(const std::string &token, double &out) {
  if (token.empty() || token == "NA" || token == "None")
    return false;
  char *end = nullptr;
  out = std::strtod(token.c_str(), &end);
  return end != token.c_str();
}

void remove_partials(const fs::path &dir, const std::string &video_id) {
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(dir, ec)) {
    const std::string name = entry.path().filename().string();
    if (name.rfind(video_id, 0) == 0 && name != video_id + ".mp4")
      fs::remove(entry.path(), ec);
  }
}

} // namespace

FetchError classify_download_error(const std::string &output) {
  const std::string text = lowercase(output);
  if (text.find("private video") != std::string::npos ||
      text.find("members-only") != std::string::npos ||
      text.find("sign in to confirm your age") != std::string::npos)
    return FetchError::Private;
  if (text.find("available in your country") != std::string::npos ||
      text.find("blocked it in your country") != std::string::npos ||
      text.find("geo restrict") != std::string::npos)
    return FetchError::RegionLocked;
  if (text.find("video unavailable") != std::string::npos ||
      text.find("this video is unavailable") != std::string::npos ||
      text.find("has been removed") != std::string::npos ||
      text.find("http error 404") != std::string::npos)
    return FetchError::Unavailable;
  if (text.find("is not a valid url") != std::string::npos ||
      text.find("unsupported url") != std::string::npos)
    return FetchError::InvalidSource;
  return FetchError::None;
}

bool parse_progress_line(const std::string &line, double &fraction) {
  std::istringstream in(line);
  std::string tag, done_s, total_s, estimate_s;
  if (!(in >> tag) || tag != PROGRESS_TAG)
    return false;
  in >> done_s >> total_s >> estimate_s;

  double done = 0, total = 0;
  if (!parse_number(done_s, done))
    return false;
  if (!parse_number(total_s, total) || total <= 0) {
    if (!parse_number(estimate_s, total) || total <= 0)
      return false;
  }
  fraction = std::clamp(done / total, 0.0, 1.0);
  return true;
}

// **---- YtDlpFetcher ----**

YtDlpFetcher::YtDlpFetcher(fs::path temp_dir, std::string ytdlp_bin,
                           int max_duration)
    : temp_dir_(std::move(temp_dir)), ytdlp_bin_(std::move(ytdlp_bin)),
      max_duration_(max_duration) {}

YtDlpFetcher YtDlpFetcher::from_config() {
  return YtDlpFetcher(Config::temp_dir(), Config::ytdlp_bin(),
                      Config::max_video_duration());
}

FetchResult YtDlpFetcher::fetch(const std::string &source_url,
                                const FetchProgress &progress) {
  const std::string video_id = extract_video_id(source_url);
  if (video_id.empty())
    return FetchResult::failure(FetchError::InvalidSource,
                                "Invalid YouTube URL");

  const fs::path dir = downloads_dir(temp_dir_);
  std::error_code ec;
  fs::create_directories(dir, ec);

  const fs::path cached = fs::absolute(dir / (video_id + ".mp4"), ec);
  if (fs::exists(cached, ec) && fs::file_size(cached, ec) > 0) {
    FetchResult r;
    std::string error;
    if (probe_media(cached.string(), r.media, error)) {
      LOG_INFO("Using cached video {}", cached.string());
      fs::last_write_time(cached, fs::file_time_type::clock::now(), ec);
      if (ec)
        LOG_WARN("Cannot refresh timestamp of {}: {}", cached.string(),
                 ec.message());
      r.ok = true;
      r.media.source_id = video_id;
      r.media.cached = true;
      return r;
    }
    LOG_WARN("Discarding unreadable cached file {}: {}", cached.string(),
             error);
    fs::remove(cached, ec);
  }

  FetchResult probed = probe_source(source_url);
  if (!probed)
    return probed;

  FetchResult r = download(source_url, video_id, progress);
  if (!r)
    return r;

  std::string error;
  if (!probe_media(cached.string(), r.media, error)) {
    fs::remove(cached, ec);
    return FetchResult::failure(
        FetchError::ToolFailure,
        fmt::format("Downloaded file is not playable: {}", error));
  }
  r.media.source_id = video_id;
  r.media.cached = false;
  return r;
}

FetchResult YtDlpFetcher::probe_source(const std::string &url) const {
  std::string cmd = fmt::format("{} -J --no-playlist --no-warnings {} 2>&1",
                                shell_quote(ytdlp_bin_), shell_quote(url));
  CommandResult r = run_command(cmd);

  if (r.exit_code == 127)
    return FetchResult::failure(FetchError::ToolFailure,
                                ytdlp_bin_ + " not found");

  // stderr is merged: the info JSON is the line that starts with '{'
  nlohmann::json info = nlohmann::json::value_t::discarded;
  std::istringstream in(r.output);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.front() == '{') {
      info = nlohmann::json::parse(line, nullptr, false);
      break;
    }
  }

  if (r.exit_code != 0 || info.is_discarded() || !info.is_object()) {
    FetchError kind = classify_download_error(r.output);
    if (kind == FetchError::None)
      kind = FetchError::Unavailable;
    LOG_WARN("yt-dlp probe failed ({}): {}", fetch_error_name(kind),
             error_excerpt(r.output));
    return FetchResult::failure(
        kind, fmt::format("Could not retrieve video info: {}",
                          error_excerpt(r.output)));
  }

  const bool is_live = (info.contains("is_live") &&
                        info["is_live"].is_boolean() &&
                        info["is_live"].get<bool>()) ||
                       (info.contains("live_status") &&
                        info["live_status"].is_string() &&
                        info["live_status"] != "not_live" &&
                        info["live_status"] != "was_live" &&
                        info["live_status"] != "post_live");
  if (is_live)
    return FetchResult::failure(FetchError::LiveStream,
                                "Cannot process live streams");

  double duration = 0;
  if (info.contains("duration") && info["duration"].is_number())
    duration = info["duration"].get<double>();
  if (duration > max_duration_)
    return FetchResult::failure(
        FetchError::TooLong,
        fmt::format("Video is too long ({}s). Maximum allowed is {}s ({} "
                    "minutes)",
                    static_cast<int>(duration), max_duration_,
                    max_duration_ / 60));

  FetchResult ok;
  ok.ok = true;
  ok.media.duration = duration;
  LOG_INFO("Source probed: \"{}\" ({})", (info.contains("title") && info["title"].is_string()
                ? info["title"].get<std::string>()
                : std::string("untitled")),
           format_time(duration));
  return ok;
}

std::string
YtDlpFetcher::build_download_command(const std::string &url,
                                     const std::string &video_id) const {
  const fs::path dir = downloads_dir(temp_dir_);
  const std::string templ = (dir / (video_id + ".%(ext)s")).string();
  const std::string progress_template =
      fmt::format("download:{} %(progress.downloaded_bytes)s "
                  "%(progress.total_bytes)s %(progress.total_bytes_estimate)s",
                  PROGRESS_TAG);

  return fmt::format(
      "{} --no-playlist --no-warnings --no-mtime -f {} "
      "--merge-output-format mp4 --newline --progress-template {} -o {} {} "
      "2>&1",
      shell_quote(ytdlp_bin_), shell_quote(YTDLP_FORMAT),
      shell_quote(progress_template), shell_quote(templ), shell_quote(url));
}

FetchResult YtDlpFetcher::download(const std::string &url,
                                   const std::string &video_id,
                                   const FetchProgress &progress) const {
  const fs::path dir = downloads_dir(temp_dir_);
  std::string cmd = build_download_command(url, video_id);

  LOG_INFO("Downloading {}", url);
  CommandResult r = run_command(cmd, [&](const std::string &line) {
    double fraction = 0;
    if (parse_progress_line(line, fraction) && progress)
      return progress(fraction);
    return true;
  });

  std::error_code ec;
  if (r.stopped) {
    remove_partials(dir, video_id);
    fs::remove(dir / (video_id + ".mp4"), ec);
    return FetchResult::failure(FetchError::Cancelled, "Download cancelled");
  }
  if (r.exit_code != 0) {
    remove_partials(dir, video_id);
    FetchError kind = r.exit_code == 127
                          ? FetchError::ToolFailure
                          : classify_download_error(r.output);
    if (kind == FetchError::None)
      kind = FetchError::ToolFailure;
    LOG_ERROR("yt-dlp exited with {}: {}", r.exit_code,
              error_excerpt(r.output));
    return FetchResult::failure(
        kind, fmt::format("Download failed: {}", error_excerpt(r.output)));
  }

  const fs::path file = dir / (video_id + ".mp4");
  if (!fs::exists(file, ec)) {
    remove_partials(dir, video_id);
    return FetchResult::failure(FetchError::ToolFailure,
                                "Download completed but file not found");
  }
  FetchResult ok;
  ok.ok = true;
  ok.media.path = fs::absolute(file, ec).string();
  return ok;
}

} // namespace reel_cut
