/**
 * @file ffmpeg_renderer.cpp
 * @brief ffmpeg renderer implementation
 */

#include "reel_cut/ffmpeg_renderer.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "reel_cut/config.hpp"
#include "reel_cut/logging.hpp"
#include "reel_cut/system.hpp"

namespace fs = std::filesystem;

namespace reel_cut {

namespace {

int even_floor(long v) { return static_cast<int>(std::max(2L, v & ~1L)); }

} // namespace

bool parse_aspect(const std::string &aspect, int &num, int &den) {
  size_t colon = aspect.find(':');
  if (colon == std::string::npos)
    return false;
  const std::string a = aspect.substr(0, colon);
  const std::string b = aspect.substr(colon + 1);
  if (a.empty() || b.empty() ||
      a.find_first_not_of("0123456789") != std::string::npos ||
      b.find_first_not_of("0123456789") != std::string::npos)
    return false;
  num = std::atoi(a.c_str());
  den = std::atoi(b.c_str());
  return num > 0 && den > 0;
}

std::string build_crop_filter(int in_w, int in_h, int aspect_num,
                              int aspect_den, int out_w, int out_h) {
  // Compare in_w/in_h with num/den without floating point
  const long lhs = static_cast<long>(in_w) * aspect_den;
  const long rhs = static_cast<long>(in_h) * aspect_num;

  if (lhs > rhs) {
    int crop_w = even_floor(rhs / aspect_den);
    int crop_x = (in_w - crop_w) / 2;
    return fmt::format("crop={}:{}:{}:0,scale={}:{}", crop_w, in_h, crop_x,
                       out_w, out_h);
  }
  int crop_h = even_floor(static_cast<long>(in_w) * aspect_den / aspect_num);
  int crop_y = (in_h - crop_h) / 2;
  return fmt::format("crop={}:{}:0:{},scale={}:{}", in_w, crop_h, crop_y,
                     out_w, out_h);
}

// **---- FfmpegRenderer ----**

FfmpegRenderer::FfmpegRenderer(std::string ffmpeg_bin, int output_width,
                               int output_height, int timeout_sec)
    : ffmpeg_bin_(std::move(ffmpeg_bin)), output_width_(output_width),
      output_height_(output_height), timeout_sec_(timeout_sec) {}

FfmpegRenderer FfmpegRenderer::from_config() {
  return FfmpegRenderer(Config::ffmpeg_bin(), Config::output_width(),
                        Config::output_height(), Config::render_timeout_sec());
}

int FfmpegRenderer::output_width(int aspect_num, int aspect_den) const {
  if (static_cast<long>(output_width_) * aspect_den ==
      static_cast<long>(output_height_) * aspect_num)
    return output_width_;
  return even_floor(static_cast<long>(output_height_) * aspect_num /
                    aspect_den);
}

std::string FfmpegRenderer::build_command(const MediaHandle &media,
                                          double start, double end,
                                          const std::string &output_path,
                                          int aspect_num,
                                          int aspect_den) const {
  const std::string filter =
      build_crop_filter(media.width, media.height, aspect_num, aspect_den,
                        output_width(aspect_num, aspect_den), output_height_);

  std::string audio = media.has_audio ? "-c:a aac -b:a 128k" : "-an";

  return fmt::format(
      "timeout {} {} -y -hide_banner -loglevel error -ss {:.3f} -i {} "
      "-t {:.3f} -vf {} -c:v libx264 -preset medium -crf 23 {} "
      "-movflags +faststart -pix_fmt yuv420p {} 2>&1",
      timeout_sec_, shell_quote(ffmpeg_bin_), start, shell_quote(media.path),
      end - start, shell_quote(filter), audio, shell_quote(output_path));
}

RenderResult FfmpegRenderer::render(const MediaHandle &media, double start,
                                    double end,
                                    const std::string &output_path,
                                    const std::string &target_aspect) {
  RenderResult result;
  int num = 0, den = 0;
  if (!parse_aspect(target_aspect, num, den)) {
    result.error = RenderError::InvalidWindow;
    result.message = "invalid target aspect " + target_aspect;
    return result;
  }
  if (!(end > start) || start < 0 || media.width <= 0 || media.height <= 0) {
    result.error = RenderError::InvalidWindow;
    result.message = fmt::format("invalid window [{:.2f}, {:.2f})", start, end);
    return result;
  }

  std::error_code ec;
  fs::create_directories(fs::path(output_path).parent_path(), ec);

  LOG_DEBUG("Rendering {} [{} - {}]",
            fs::path(output_path).filename().string(), format_time(start),
            format_time(end));

  CommandResult r = run_command(
      build_command(media, start, end, output_path, num, den));
  if (r.exit_code != 0) {
    fs::remove(output_path, ec);
    result.error = RenderError::EncodeFailed;
    result.message =
        r.exit_code == 124
            ? fmt::format("ffmpeg timed out after {}s", timeout_sec_)
            : fmt::format("ffmpeg failed with status {}: {}", r.exit_code,
                          r.output.substr(0, 300));
    return result;
  }

  if (!fs::exists(output_path, ec) || fs::file_size(output_path, ec) == 0) {
    result.error = RenderError::OutputMissing;
    result.message = "ffmpeg produced no output";
    return result;
  }

  result.ok = true;
  result.output = output_path;
  return result;
}

} // namespace reel_cut
