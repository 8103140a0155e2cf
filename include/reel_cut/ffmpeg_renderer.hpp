/**
 * @file ffmpeg_renderer.hpp
 * @brief Vertical clip renderer driving the ffmpeg CLI
 */

#ifndef REEL_CUT_FFMPEG_RENDERER_HPP
#define REEL_CUT_FFMPEG_RENDERER_HPP

#include <string>

#include "media.hpp"

namespace reel_cut {

/**
 * @brief Parse an aspect string "W:H".
 * @return false unless both parts are positive integers
 */
bool parse_aspect(const std::string &aspect, int &num, int &den);

/**
 * @brief Center-crop then scale filter for the target geometry.
 * @details Wider sources lose their sides, taller sources their top and
 *          bottom. Crop sizes are rounded down to even values.
 */
std::string build_crop_filter(int in_w, int in_h, int aspect_num,
                              int aspect_den, int out_w, int out_h);

/**
 * @class FfmpegRenderer
 * @brief Re-encodes one window of the media as an H.264/AAC mp4.
 */
class FfmpegRenderer : public MediaRenderer {
  std::string ffmpeg_bin_;
  int output_width_;
  int output_height_;
  int timeout_sec_;

public:
  FfmpegRenderer(std::string ffmpeg_bin, int output_width, int output_height,
                 int timeout_sec);

  static FfmpegRenderer from_config();

  /// OUTPUT_WIDTH when the aspect matches the configured frame, else an even
  /// width derived from the output height
  int output_width(int aspect_num, int aspect_den) const;

  /// Full command line for one render (used by render() and tests)
  std::string build_command(const MediaHandle &media, double start, double end,
                            const std::string &output_path, int aspect_num,
                            int aspect_den) const;

  RenderResult render(const MediaHandle &media, double start, double end,
                      const std::string &output_path,
                      const std::string &target_aspect) override;
};

} // namespace reel_cut

#endif // REEL_CUT_FFMPEG_RENDERER_HPP
