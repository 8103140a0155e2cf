/**
 * @file media_decoder.cpp
 * @brief FFmpeg based probing, frame sampling and audio streaming
 *
 * @details Both samplers decode the full stream front to back. Seeking per
 *          sample would decode the same GOP many times at sub-second
 *          intervals.
 */

#include "reel_cut/media_decoder.hpp"

#include <algorithm>
#include <cmath>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
}

#include <fmt/core.h>

#include "reel_cut/logging.hpp"

namespace reel_cut {

namespace {

std::string av_error_text(int code) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(code, buf, sizeof(buf));
  return buf;
}

} // namespace

// **---- MediaInput ----**

MediaInput::~MediaInput() {
  if (fmt_ctx_) {
    /// avformat_close_input leaves custom I/O alone (AVFMT_FLAG_CUSTOM_IO)
    avformat_close_input(&fmt_ctx_);
  }
  if (avio_ctx_) {
    /// The context owns whichever buffer it currently uses
    av_freep(&avio_ctx_->buffer);
    avio_context_free(&avio_ctx_);
  } else if (avio_buffer_) {
    av_free(avio_buffer_);
  }
}

bool MediaInput::open(const std::string &path, std::string &error) {
  if (!MemoryLoader::load_file(path, file_, error))
    return false;

  fmt_ctx_ = avformat_alloc_context();
  if (!fmt_ctx_) {
    error = "failed to allocate AVFormatContext";
    return false;
  }

  avio_buffer_ = static_cast<uint8_t *>(av_malloc(AVIO_BUFFER_SIZE));
  if (!avio_buffer_) {
    error = "failed to allocate AVIO buffer";
    return false;
  }

  mem_state_ = {file_.data(), file_.size(), 0};

  avio_ctx_ = avio_alloc_context(avio_buffer_, AVIO_BUFFER_SIZE, 0,
                                 &mem_state_, MemoryLoader::read, nullptr,
                                 MemoryLoader::seek);
  if (!avio_ctx_) {
    error = "failed to allocate AVIOContext";
    return false;
  }

  fmt_ctx_->pb = avio_ctx_;
  ///\note Keeps avformat_close_input from touching our AVIO context
  fmt_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;

  int ret = avformat_open_input(&fmt_ctx_, "RAM", nullptr, nullptr);
  if (ret < 0) {
    ///\note On failure avformat_open_input frees fmt_ctx and nulls it
    error = fmt::format("avformat_open_input failed: {}", av_error_text(ret));
    return false;
  }

  ret = avformat_find_stream_info(fmt_ctx_, nullptr);
  if (ret < 0) {
    error = fmt::format("avformat_find_stream_info failed: {}",
                        av_error_text(ret));
    return false;
  }
  return true;
}

double MediaInput::duration() const {
  if (!fmt_ctx_ || fmt_ctx_->duration == AV_NOPTS_VALUE)
    return 0.0;
  return fmt_ctx_->duration / static_cast<double>(AV_TIME_BASE);
}

double MediaInput::start_time(int stream_index) const {
  if (!fmt_ctx_ || stream_index < 0)
    return 0.0;
  const AVStream *st = fmt_ctx_->streams[stream_index];
  if (st->start_time == AV_NOPTS_VALUE)
    return 0.0;
  return st->start_time * av_q2d(st->time_base);
}

AVCodecContext *MediaInput::open_decoder(AVMediaType type, int &stream_index,
                                         std::string &error) {
  stream_index = av_find_best_stream(fmt_ctx_, type, -1, -1, nullptr, 0);
  if (stream_index < 0) {
    error = fmt::format("no {} stream", av_get_media_type_string(type));
    return nullptr;
  }

  /// Discard the other streams to save demuxing work
  for (unsigned int i = 0; i < fmt_ctx_->nb_streams; i++) {
    if (i != static_cast<unsigned int>(stream_index))
      fmt_ctx_->streams[i]->discard = AVDISCARD_ALL;
  }

  AVCodecParameters *param = fmt_ctx_->streams[stream_index]->codecpar;
  const AVCodec *codec = avcodec_find_decoder(param->codec_id);
  if (!codec) {
    error = fmt::format("no decoder for codec {}",
                        avcodec_get_name(param->codec_id));
    return nullptr;
  }

  AVCodecContext *ctx = avcodec_alloc_context3(codec);
  if (!ctx) {
    error = "failed to allocate decoder context";
    return nullptr;
  }
  int ret = avcodec_parameters_to_context(ctx, param);
  if (ret < 0) {
    error = fmt::format("avcodec_parameters_to_context failed: {}",
                        av_error_text(ret));
    avcodec_free_context(&ctx);
    return nullptr;
  }
  ctx->pkt_timebase = fmt_ctx_->streams[stream_index]->time_base;

  /// Single-threaded decoding (analyzers already run in parallel)
  ctx->thread_count = 1;

  ret = avcodec_open2(ctx, codec, nullptr);
  if (ret < 0) {
    error = fmt::format("avcodec_open2 failed: {}", av_error_text(ret));
    avcodec_free_context(&ctx);
    return nullptr;
  }
  return ctx;
}

// **---- Probe ----**

bool probe_media(const std::string &path, MediaHandle &out,
                 std::string &error) {
  MediaInput input;
  if (!input.open(path, error))
    return false;

  AVFormatContext *fmt_ctx = input.context();
  int video = av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1,
                                  nullptr, 0);
  if (video < 0) {
    error = "no video stream";
    return false;
  }
  int audio = av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1,
                                  nullptr, 0);

  const AVStream *st = fmt_ctx->streams[video];
  out.path = path;
  out.duration = input.duration();
  if (out.duration <= 0 && st->duration != AV_NOPTS_VALUE)
    out.duration = st->duration * av_q2d(st->time_base);
  out.width = st->codecpar->width;
  out.height = st->codecpar->height;
  AVRational r = st->avg_frame_rate;
  out.fps = (r.den > 0 && r.num > 0) ? av_q2d(r) : 25.0;
  out.has_audio = audio >= 0;

  if (out.duration <= 0) {
    error = "unknown media duration";
    return false;
  }
  return true;
}

// **---- FrameSampler ----**

FrameSampler::FrameSampler(std::string path) : path_(std::move(path)) {
  frame_ = av_frame_alloc();
  pkt_ = av_packet_alloc();
}

FrameSampler::~FrameSampler() {
  if (sws_ctx_)
    sws_freeContext(sws_ctx_);
  if (dec_ctx_)
    avcodec_free_context(&dec_ctx_);
  av_frame_free(&frame_);
  av_packet_free(&pkt_);
}

bool FrameSampler::initialize(std::string &error) {
  if (!frame_ || !pkt_) {
    error = "failed to allocate frame or packet";
    return false;
  }
  if (!input_.open(path_, error))
    return false;

  dec_ctx_ = input_.open_decoder(AVMEDIA_TYPE_VIDEO, video_stream_idx_, error);
  if (!dec_ctx_)
    return false;

  ///\note Skip B-frames: sampling at half-second spacing never needs them
  dec_ctx_->skip_frame = AVDISCARD_BIDIR;

  const AVStream *st = input_.context()->streams[video_stream_idx_];
  time_base_ = av_q2d(st->time_base);
  start_offset_ = input_.start_time(video_stream_idx_);
  return true;
}

double FrameSampler::get_fps() const {
  if (video_stream_idx_ < 0)
    return 25.0;
  AVRational r = input_.context()->streams[video_stream_idx_]->avg_frame_rate;
  return (r.den > 0 && r.num > 0) ? av_q2d(r) : 25.0;
}

bool FrameSampler::emit(double timestamp, int out_w, int out_h,
                        PixelLayout layout, const FrameCallback &on_frame,
                        bool &keep_going) {
  const int w = out_w > 0 ? out_w : frame_->width;
  const int h = out_h > 0 ? out_h : frame_->height;
  const AVPixelFormat dst_fmt =
      layout == PixelLayout::Gray ? AV_PIX_FMT_GRAY8 : AV_PIX_FMT_BGR24;
  const int channels = layout == PixelLayout::Gray ? 1 : 3;

  sws_ctx_ = sws_getCachedContext(
      sws_ctx_, frame_->width, frame_->height,
      static_cast<AVPixelFormat>(frame_->format), w, h, dst_fmt, SWS_BILINEAR,
      nullptr, nullptr, nullptr);
  if (!sws_ctx_)
    return false;

  const int stride = w * channels;
  scaled_.resize(static_cast<size_t>(stride) * h);
  uint8_t *dst[4] = {scaled_.data(), nullptr, nullptr, nullptr};
  int dst_stride[4] = {stride, 0, 0, 0};
  sws_scale(sws_ctx_, frame_->data, frame_->linesize, 0, frame_->height, dst,
            dst_stride);

  SampledFrame sf;
  sf.timestamp = timestamp;
  sf.width = w;
  sf.height = h;
  sf.stride = stride;
  sf.layout = layout;
  sf.data = scaled_.data();
  keep_going = on_frame(sf);
  return true;
}

SampleStatus FrameSampler::sample(double interval, int out_w, int out_h,
                                  PixelLayout layout,
                                  const FrameCallback &on_frame) {
  if (!dec_ctx_)
    return SampleStatus::Failed;
  interval = std::max(interval, 0.01);

  double next_sample = 0;
  int64_t frame_count = 0;
  const double fps = get_fps();
  bool keep_going = true;
  bool draining = false;

  auto receive_all = [&]() -> bool {
    while (keep_going) {
      int ret = avcodec_receive_frame(dec_ctx_, frame_);
      if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
        return true;
      if (ret < 0)
        return false;

      int64_t pts = frame_->best_effort_timestamp;
      double t = (pts != AV_NOPTS_VALUE)
                     ? pts * time_base_ - start_offset_
                     : static_cast<double>(frame_count) / fps;
      ++frame_count;

      if (t + 1e-6 < next_sample) {
        av_frame_unref(frame_);
        continue;
      }
      while (next_sample <= t + 1e-6)
        next_sample += interval;

      bool ok = emit(std::max(0.0, t), out_w, out_h, layout, on_frame,
                     keep_going);
      av_frame_unref(frame_);
      if (!ok)
        return false;
    }
    return true;
  };

  while (keep_going) {
    int ret = av_read_frame(input_.context(), pkt_);
    if (ret < 0) {
      /// End of stream: flush the decoder
      draining = true;
      avcodec_send_packet(dec_ctx_, nullptr);
      if (!receive_all())
        return SampleStatus::Failed;
      break;
    }

    if (pkt_->stream_index == video_stream_idx_) {
      int send_ret = avcodec_send_packet(dec_ctx_, pkt_);
      if (send_ret < 0 && send_ret != AVERROR(EAGAIN)) {
        LOG_DEBUG("Skipping undecodable packet: {}", av_error_text(send_ret));
      } else if (!receive_all()) {
        av_packet_unref(pkt_);
        return SampleStatus::Failed;
      }
    }
    av_packet_unref(pkt_);
  }

  if (!keep_going)
    return SampleStatus::Stopped;
  return (draining && frame_count > 0) ? SampleStatus::Completed
                                       : SampleStatus::Failed;
}

// **---- AudioSampler ----**

AudioSampler::AudioSampler(std::string path, int sample_rate)
    : path_(std::move(path)), sample_rate_(sample_rate) {
  frame_ = av_frame_alloc();
  pkt_ = av_packet_alloc();
}

AudioSampler::~AudioSampler() {
  if (swr_ctx_)
    swr_free(&swr_ctx_);
  if (dec_ctx_)
    avcodec_free_context(&dec_ctx_);
  av_frame_free(&frame_);
  av_packet_free(&pkt_);
}

bool AudioSampler::initialize(std::string &error) {
  if (!frame_ || !pkt_) {
    error = "failed to allocate frame or packet";
    return false;
  }
  if (!input_.open(path_, error))
    return false;

  dec_ctx_ = input_.open_decoder(AVMEDIA_TYPE_AUDIO, audio_stream_idx_, error);
  if (!dec_ctx_)
    return false;

  AVChannelLayout in_layout;
  if (dec_ctx_->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC)
    av_channel_layout_default(&in_layout, dec_ctx_->ch_layout.nb_channels);
  else if (av_channel_layout_copy(&in_layout, &dec_ctx_->ch_layout) < 0) {
    error = "cannot copy channel layout";
    return false;
  }

  AVChannelLayout out_layout;
  av_channel_layout_default(&out_layout, 1);

  int ret = swr_alloc_set_opts2(&swr_ctx_, &out_layout, AV_SAMPLE_FMT_FLT,
                                sample_rate_, &in_layout, dec_ctx_->sample_fmt,
                                dec_ctx_->sample_rate, 0, nullptr);
  av_channel_layout_uninit(&in_layout);
  av_channel_layout_uninit(&out_layout);
  if (ret < 0 || !swr_ctx_) {
    error = fmt::format("swr_alloc_set_opts2 failed: {}", av_error_text(ret));
    return false;
  }
  ret = swr_init(swr_ctx_);
  if (ret < 0) {
    error = fmt::format("swr_init failed: {}", av_error_text(ret));
    return false;
  }
  return true;
}

SampleStatus AudioSampler::stream(size_t block_size,
                                  const AudioBlockCallback &on_block) {
  if (!dec_ctx_ || !swr_ctx_ || block_size == 0)
    return SampleStatus::Failed;

  std::vector<float> pending;
  pending.reserve(block_size * 2);
  std::vector<float> converted;
  size_t emitted = 0; //< Samples handed out so far
  bool keep_going = true;

  auto flush_blocks = [&](bool final_block) {
    size_t offset = 0;
    while (keep_going && pending.size() - offset >= block_size) {
      double position = static_cast<double>(emitted) / sample_rate_;
      keep_going = on_block(pending.data() + offset, block_size, position);
      offset += block_size;
      emitted += block_size;
    }
    if (keep_going && final_block && pending.size() > offset) {
      double position = static_cast<double>(emitted) / sample_rate_;
      size_t rest = pending.size() - offset;
      keep_going = on_block(pending.data() + offset, rest, position);
      offset += rest;
      emitted += rest;
    }
    pending.erase(pending.begin(), pending.begin() + offset);
  };

  auto convert = [&](const uint8_t **in, int in_count) -> bool {
    int capacity = swr_get_out_samples(swr_ctx_, in_count);
    if (capacity <= 0)
      return true;
    converted.resize(static_cast<size_t>(capacity));
    uint8_t *out[1] = {reinterpret_cast<uint8_t *>(converted.data())};
    int n = swr_convert(swr_ctx_, out, capacity, in, in_count);
    if (n < 0)
      return false;
    pending.insert(pending.end(), converted.begin(), converted.begin() + n);
    return true;
  };

  auto receive_all = [&]() -> bool {
    while (keep_going) {
      int ret = avcodec_receive_frame(dec_ctx_, frame_);
      if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
        return true;
      if (ret < 0)
        return false;
      bool ok = convert(const_cast<const uint8_t **>(frame_->extended_data),
                        frame_->nb_samples);
      av_frame_unref(frame_);
      if (!ok)
        return false;
      flush_blocks(false);
    }
    return true;
  };

  while (keep_going) {
    int ret = av_read_frame(input_.context(), pkt_);
    if (ret < 0) {
      avcodec_send_packet(dec_ctx_, nullptr);
      if (!receive_all())
        return SampleStatus::Failed;
      /// Drain the resampler
      if (keep_going && !convert(nullptr, 0))
        return SampleStatus::Failed;
      flush_blocks(true);
      break;
    }

    if (pkt_->stream_index == audio_stream_idx_) {
      int send_ret = avcodec_send_packet(dec_ctx_, pkt_);
      if (send_ret < 0 && send_ret != AVERROR(EAGAIN)) {
        LOG_DEBUG("Skipping undecodable audio packet: {}",
                  av_error_text(send_ret));
      } else if (!receive_all()) {
        av_packet_unref(pkt_);
        return SampleStatus::Failed;
      }
    }
    av_packet_unref(pkt_);
  }

  return keep_going ? SampleStatus::Completed : SampleStatus::Stopped;
}

} // namespace reel_cut
