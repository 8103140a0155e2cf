/**
 * @file media.hpp
 * @brief Media collaborator contracts: fetcher and renderer
 *
 * @details The job pipeline talks to media I/O only through these abstract
 *          classes. Concrete implementations (yt-dlp fetcher, ffmpeg renderer)
 *          live in the media library; tests substitute in-process fakes.
 */

#ifndef REEL_CUT_MEDIA_HPP
#define REEL_CUT_MEDIA_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace reel_cut {

/**
 * @struct MediaHandle
 * @brief A local media file and its probed properties.
 */
struct MediaHandle {
  std::string path;      //< Absolute path to the local file
  std::string source_id; //< Source video id (cache key)
  double duration = 0;   //< Seconds
  int width = 0;
  int height = 0;
  double fps = 0;
  bool has_audio = false;
  bool cached = false; //< Served from the download cache
};

// **---- FETCHER ----**

enum class FetchError : uint8_t {
  None = 0,
  InvalidSource,
  Unavailable,
  Private,
  RegionLocked,
  TooLong,
  LiveStream,
  ToolFailure,
  Cancelled
};

const char *fetch_error_name(FetchError error);

/**
 * @struct FetchResult
 * @brief Outcome of a fetch: a media handle or a typed download error.
 */
struct FetchResult {
  bool ok = false;
  MediaHandle media;
  FetchError error = FetchError::None;
  std::string message;
  explicit operator bool() const noexcept { return ok; }

  static FetchResult failure(FetchError error, std::string message) {
    FetchResult r;
    r.error = error;
    r.message = std::move(message);
    return r;
  }
};

/// Fraction of bytes fetched in [0, 1]; return false to abort the fetch.
using FetchProgress = std::function<bool(double fraction)>;

/**
 * @class MediaFetcher
 * @brief Turns a source reference into a local media file.
 */
class MediaFetcher {
public:
  virtual ~MediaFetcher() = default;

  /**
   * @brief Fetch a source.
   * @param source_url Validated source reference
   * @param progress Optional byte progress callback
   * @return Local media handle or a typed DownloadError
   * @note Implementations enforce the maximum source duration.
   */
  virtual FetchResult fetch(const std::string &source_url,
                            const FetchProgress &progress) = 0;
};

// **---- RENDERER ----**

enum class RenderError : uint8_t {
  None = 0,
  InvalidWindow,
  EncodeFailed,
  OutputMissing
};

const char *render_error_name(RenderError error);

/**
 * @struct RenderResult
 * @brief Outcome of rendering one segment.
 */
struct RenderResult {
  bool ok = false;
  std::string output; //< Rendered file on success
  RenderError error = RenderError::None;
  std::string message;
  explicit operator bool() const noexcept { return ok; }
};

/**
 * @class MediaRenderer
 * @brief Cuts a window out of a media file into a vertical clip.
 */
class MediaRenderer {
public:
  virtual ~MediaRenderer() = default;

  /**
   * @brief Render [start, end) of the media into output_path.
   * @param target_aspect "W:H", "9:16" for vertical shorts
   */
  virtual RenderResult render(const MediaHandle &media, double start,
                              double end, const std::string &output_path,
                              const std::string &target_aspect) = 0;
};

} // namespace reel_cut

#endif // REEL_CUT_MEDIA_HPP
