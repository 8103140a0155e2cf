/**
 * @file media_decoder.hpp
 * @brief FFmpeg based media probing, frame sampling and audio streaming
 *
 * @details Decoders read the media from a memory-mapped buffer through a
 *          custom AVIO context, as MemoryLoader provides.
 *
 * @attention THREAD MODEL:
 *            - Each analyzer thread creates its own FrameSampler or
 *              AudioSampler instance.
 *
 *            - This is necessary because FFmpeg decoder state is not
 *              thread-safe.
 */

#ifndef REEL_CUT_MEDIA_DECODER_HPP
#define REEL_CUT_MEDIA_DECODER_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "media.hpp"
#include "memory_io.hpp"

namespace reel_cut {

/**
 * @brief Probe a local media file.
 * @param path Media file
 * @param out Output: duration, geometry, fps and audio presence
 * @param error Output: reason on failure
 * @return false if the file cannot be opened or has no video stream
 */
bool probe_media(const std::string &path, MediaHandle &out,
                 std::string &error);

/**
 * @brief Outcome of a sampling pass.
 */
enum class SampleStatus : uint8_t { Completed = 0, Stopped, Failed };

/**
 * @class MediaInput
 * @brief Demuxer over a memory-mapped file.
 *
 * @attention
 * `MANAGEMENT`:
 *
 *            - Uses AVFMT_FLAG_CUSTOM_IO for proper cleanup of custom I/O
 *
 *            - Destructor handles partial initialization failures
 */
class MediaInput {
  MappedFile file_;
  MemReaderState mem_state_{};
  AVFormatContext *fmt_ctx_ = nullptr;
  AVIOContext *avio_ctx_ = nullptr;
  uint8_t *avio_buffer_ = nullptr;

public:
  MediaInput() = default;
  ~MediaInput();

  MediaInput(const MediaInput &) = delete;
  MediaInput &operator=(const MediaInput &) = delete;

  /**
   * @brief Map the file and open the demuxer.
   * @return true on success; error holds the reason otherwise
   */
  bool open(const std::string &path, std::string &error);

  AVFormatContext *context() const { return fmt_ctx_; }

  /// Container duration in seconds, 0 if unknown
  double duration() const;

  /// Start offset of a stream in seconds
  double start_time(int stream_index) const;

  /**
   * @brief Open a decoder for the best stream of a type.
   * @param type AVMEDIA_TYPE_VIDEO or AVMEDIA_TYPE_AUDIO
   * @param stream_index Output: chosen stream
   * @return Decoder context owned by the caller, or nullptr
   */
  AVCodecContext *open_decoder(AVMediaType type, int &stream_index,
                               std::string &error);
};

// **---- FRAMES ----**

enum class PixelLayout : uint8_t { Gray = 0, BGR };

/**
 * @struct SampledFrame
 * @brief A scaled frame handed to the frame callback.
 * @note data is only valid during the callback.
 */
struct SampledFrame {
  double timestamp = 0; //< Seconds from media start
  int width = 0;
  int height = 0;
  int stride = 0; //< Bytes per row
  PixelLayout layout = PixelLayout::Gray;
  const uint8_t *data = nullptr;
};

/// Return false to stop sampling
using FrameCallback = std::function<bool(const SampledFrame &)>;

/**
 * @class FrameSampler
 * @brief Decodes the video stream and emits one scaled frame per interval.
 */
class FrameSampler {
  std::string path_;
  MediaInput input_;
  AVCodecContext *dec_ctx_ = nullptr;
  AVFrame *frame_ = nullptr;
  AVPacket *pkt_ = nullptr;
  SwsContext *sws_ctx_ = nullptr;
  int video_stream_idx_ = -1;
  double time_base_ = 0;
  double start_offset_ = 0;

  /// Pre-allocated destination buffer (avoid malloc in hot loop)
  std::vector<uint8_t> scaled_;

public:
  explicit FrameSampler(std::string path);
  ~FrameSampler();

  FrameSampler(const FrameSampler &) = delete;
  FrameSampler &operator=(const FrameSampler &) = delete;

  /**
   * @brief Open the media and the video decoder.
   * @return true on success, false on failure (see error)
   */
  bool initialize(std::string &error);

  double get_duration() const { return input_.duration(); }
  double get_fps() const;
  int source_width() const { return dec_ctx_ ? dec_ctx_->width : 0; }
  int source_height() const { return dec_ctx_ ? dec_ctx_->height : 0; }

  /**
   * @brief Decode the whole stream, emitting frames spaced by interval.
   * @param interval Seconds between emitted frames
   * @param out_w Output width (0 keeps the source width)
   * @param out_h Output height (0 keeps the source height)
   * @param layout Gray (1 byte) or BGR (3 bytes) pixels
   * @param on_frame Receives each sampled frame; false stops the pass
   */
  SampleStatus sample(double interval, int out_w, int out_h,
                      PixelLayout layout, const FrameCallback &on_frame);

private:
  bool emit(double timestamp, int out_w, int out_h, PixelLayout layout,
            const FrameCallback &on_frame, bool &keep_going);
};

// **---- AUDIO ----**

/// Mono float samples; return false to stop streaming
using AudioBlockCallback =
    std::function<bool(const float *samples, size_t count, double position)>;

/**
 * @class AudioSampler
 * @brief Decodes the audio stream to mono float PCM at a fixed rate.
 */
class AudioSampler {
  std::string path_;
  MediaInput input_;
  AVCodecContext *dec_ctx_ = nullptr;
  AVFrame *frame_ = nullptr;
  AVPacket *pkt_ = nullptr;
  SwrContext *swr_ctx_ = nullptr;
  int audio_stream_idx_ = -1;
  int sample_rate_ = 22050;

public:
  explicit AudioSampler(std::string path, int sample_rate = 22050);
  ~AudioSampler();

  AudioSampler(const AudioSampler &) = delete;
  AudioSampler &operator=(const AudioSampler &) = delete;

  /**
   * @brief Open the media, the audio decoder and the resampler.
   * @return false if there is no decodable audio stream
   */
  bool initialize(std::string &error);

  int sample_rate() const { return sample_rate_; }
  double get_duration() const { return input_.duration(); }

  /**
   * @brief Stream the whole track in blocks of block_size samples.
   * @note The last block may be shorter. position is the time of the first
   *       sample of the block in seconds.
   */
  SampleStatus stream(size_t block_size, const AudioBlockCallback &on_block);
};

} // namespace reel_cut

#endif // REEL_CUT_MEDIA_DECODER_HPP
