// Repository: Segweave
// Component: Segment Readers Implementation
// Copyright (c) 2025 Segweave

#include "compile/SegmentReader.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/samplefmt.h>
}

#include "segweave/util/Logger.hpp"

namespace segweave::compile {

using segweave::util::Logger;

namespace {

// Decoded frames within this distance after the requested time still count
// as "at" it.
constexpr double kFrameTimeTolerance = 1e-3;

}  // namespace

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

// =============================================================================
// StreamDecoder
// =============================================================================

bool StreamDecoder::Open(const std::string& path, AVMediaType type, double start_s,
                         std::string* error) {
  AVFormatContext* raw = nullptr;
  int ret = avformat_open_input(&raw, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    *error = "open_input " + path + ": " + AvErrorString(ret);
    return false;
  }
  fmt_.reset(raw);

  ret = avformat_find_stream_info(fmt_.get(), nullptr);
  if (ret < 0) {
    *error = "find_stream_info " + path + ": " + AvErrorString(ret);
    return false;
  }

  const AVCodec* decoder = nullptr;
  ret = av_find_best_stream(fmt_.get(), type, -1, -1, &decoder, 0);
  if (ret < 0 || !decoder) {
    *error = std::string("no decodable ") + av_get_media_type_string(type) +
             " stream in " + path;
    return false;
  }
  stream_index_ = ret;
  AVStream* stream = fmt_->streams[stream_index_];

  codec_.reset(avcodec_alloc_context3(decoder));
  if (!codec_) {
    *error = "failed to allocate decoder context";
    return false;
  }
  if (avcodec_parameters_to_context(codec_.get(), stream->codecpar) < 0) {
    *error = "failed to copy decoder parameters";
    return false;
  }
  codec_->thread_count = 0;  // Auto
  ret = avcodec_open2(codec_.get(), decoder, nullptr);
  if (ret < 0) {
    *error = "failed to open decoder: " + AvErrorString(ret);
    return false;
  }

  packet_.reset(av_packet_alloc());
  if (!packet_) {
    *error = "failed to allocate packet";
    return false;
  }

  time_base_ = av_q2d(stream->time_base);
  start_pts_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;

  if (start_s > 0.0) {
    int64_t ts = start_pts_ + av_rescale_q(std::llround(start_s * AV_TIME_BASE),
                                           {1, AV_TIME_BASE}, stream->time_base);
    ret = av_seek_frame(fmt_.get(), stream_index_, ts, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
      // Not fatal: decoding from the top still reaches the offset.
      std::ostringstream oss;
      oss << "[SegmentReader] SEEK_FAILED path=" << path << " start_s=" << start_s
          << " err=" << AvErrorString(ret);
      Logger::Debug(oss.str());
    } else {
      avcodec_flush_buffers(codec_.get());
    }
  }
  return true;
}

bool StreamDecoder::Next(AVFrame* out, double* frame_time_s, std::string* error) {
  while (true) {
    int ret = avcodec_receive_frame(codec_.get(), out);
    if (ret >= 0) {
      int64_t pts = out->pts != AV_NOPTS_VALUE ? out->pts : out->best_effort_timestamp;
      if (pts == AV_NOPTS_VALUE) pts = start_pts_;
      *frame_time_s = static_cast<double>(pts - start_pts_) * time_base_;
      return true;
    }
    if (ret == AVERROR_EOF) return false;
    if (ret != AVERROR(EAGAIN)) {
      *error = "receive_frame: " + AvErrorString(ret);
      return false;
    }
    if (draining_) return false;

    // Decoder wants input.
    while (true) {
      ret = av_read_frame(fmt_.get(), packet_.get());
      if (ret < 0) {
        // End of file, or a read error treated as end of media.
        draining_ = true;
        avcodec_send_packet(codec_.get(), nullptr);
        break;
      }
      if (packet_->stream_index != stream_index_) {
        av_packet_unref(packet_.get());
        continue;
      }
      ret = avcodec_send_packet(codec_.get(), packet_.get());
      av_packet_unref(packet_.get());
      if (ret < 0 && ret != AVERROR(EAGAIN)) {
        // Corrupt packet: skip it and keep going.
        Logger::Debug("[SegmentReader] SEND_PACKET_FAILED err=" + AvErrorString(ret));
        continue;
      }
      break;
    }
  }
}

// =============================================================================
// VideoSegmentReader
// =============================================================================

VideoSegmentReader::VideoSegmentReader(int width, int height)
    : width_(width), height_(height) {}

bool VideoSegmentReader::Open(const std::string& path, double source_offset_s,
                              std::string* error) {
  if (!decoder_.Open(path, AVMEDIA_TYPE_VIDEO, source_offset_s, error)) {
    return false;
  }

  next_.reset(av_frame_alloc());
  current_.reset(av_frame_alloc());
  if (!next_ || !current_) {
    *error = "failed to allocate video frames";
    return false;
  }

  current_->format = AV_PIX_FMT_YUV420P;
  current_->width = width_;
  current_->height = height_;
  int ret = av_frame_get_buffer(current_.get(), 32);
  if (ret < 0) {
    *error = "failed to allocate scaled frame: " + AvErrorString(ret);
    return false;
  }
  return true;
}

const AVFrame* VideoSegmentReader::FrameAt(double t_s, std::string* error) {
  while (true) {
    if (!has_next_) {
      if (eof_) break;
      std::string decode_error;
      if (!decoder_.Next(next_.get(), &next_time_s_, &decode_error)) {
        eof_ = true;
        if (!decode_error.empty()) {
          Logger::Warn("[SegmentReader] VIDEO_DECODE_STOPPED err=" + decode_error);
        }
        break;
      }
      has_next_ = true;
    }
    // The first frame is shown even when it lies past t_s.
    if (has_current_ && next_time_s_ > t_s + kFrameTimeTolerance) break;
    if (!Promote(error)) return nullptr;
  }
  return has_current_ ? current_.get() : nullptr;
}

bool VideoSegmentReader::Promote(std::string* error) {
  SwsContext* ctx = sws_getCachedContext(
      sws_.release(),
      next_->width, next_->height, static_cast<AVPixelFormat>(next_->format),
      width_, height_, AV_PIX_FMT_YUV420P,
      SWS_BILINEAR, nullptr, nullptr, nullptr);
  sws_.reset(ctx);
  if (!sws_) {
    *error = "failed to create scaler context";
    return false;
  }

  int ret = av_frame_make_writable(current_.get());
  if (ret < 0) {
    *error = "av_frame_make_writable failed: " + AvErrorString(ret);
    return false;
  }

  sws_scale(sws_.get(), next_->data, next_->linesize, 0, next_->height,
            current_->data, current_->linesize);
  av_frame_unref(next_.get());
  has_next_ = false;
  has_current_ = true;
  return true;
}

// =============================================================================
// AudioSegmentReader
// =============================================================================

AudioSegmentReader::AudioSegmentReader(int sample_rate, int channels)
    : sample_rate_(sample_rate), channels_(channels) {}

bool AudioSegmentReader::Open(const std::string& path, double source_offset_s,
                              std::string* error) {
  source_offset_s_ = source_offset_s;
  if (!decoder_.Open(path, AVMEDIA_TYPE_AUDIO, source_offset_s, error)) {
    return false;
  }
  AVCodecContext* codec = decoder_.codec();

  AVChannelLayout in_layout;
  av_channel_layout_uninit(&in_layout);
  if (codec->ch_layout.order != AV_CHANNEL_ORDER_UNSPEC && codec->ch_layout.nb_channels > 0) {
    if (av_channel_layout_copy(&in_layout, &codec->ch_layout) < 0) {
      *error = "failed to copy source channel layout";
      return false;
    }
  } else {
    av_channel_layout_default(&in_layout, std::max(1, codec->ch_layout.nb_channels));
  }

  AVChannelLayout out_layout;
  av_channel_layout_uninit(&out_layout);
  av_channel_layout_default(&out_layout, channels_);

  SwrContext* raw = nullptr;
  int ret = swr_alloc_set_opts2(&raw,
                                &out_layout, AV_SAMPLE_FMT_FLTP, sample_rate_,
                                &in_layout, codec->sample_fmt, codec->sample_rate,
                                0, nullptr);
  swr_.reset(raw);
  // swr_alloc_set_opts2 copies the layouts.
  av_channel_layout_uninit(&in_layout);
  av_channel_layout_uninit(&out_layout);
  if (ret != 0 || !swr_) {
    *error = "failed to set resampler options";
    return false;
  }
  ret = swr_init(swr_.get());
  if (ret < 0) {
    *error = "failed to initialize resampler: " + AvErrorString(ret);
    return false;
  }

  buffer_.reset(av_audio_fifo_alloc(AV_SAMPLE_FMT_FLTP, channels_, sample_rate_));
  decoded_.reset(av_frame_alloc());
  scratch_.reset(av_frame_alloc());
  if (!buffer_ || !decoded_ || !scratch_) {
    *error = "failed to allocate audio buffers";
    return false;
  }
  return true;
}

int64_t AudioSegmentReader::ReadInto(AVAudioFifo* out, int64_t n, std::string* error) {
  while (av_audio_fifo_size(buffer_.get()) < n && !eof_) {
    if (!DecodeMore(error)) return -1;
  }

  const int64_t available = std::min<int64_t>(n, av_audio_fifo_size(buffer_.get()));
  int64_t moved = 0;
  while (moved < available) {
    const int chunk = static_cast<int>(std::min<int64_t>(available - moved, 4096));

    av_frame_unref(scratch_.get());
    scratch_->format = AV_SAMPLE_FMT_FLTP;
    av_channel_layout_default(&scratch_->ch_layout, channels_);
    scratch_->sample_rate = sample_rate_;
    scratch_->nb_samples = chunk;
    int ret = av_frame_get_buffer(scratch_.get(), 0);
    if (ret < 0) {
      *error = "failed to allocate audio scratch: " + AvErrorString(ret);
      return -1;
    }

    int got = av_audio_fifo_read(buffer_.get(),
                                 reinterpret_cast<void**>(scratch_->extended_data), chunk);
    if (got <= 0) break;
    if (av_audio_fifo_write(out, reinterpret_cast<void**>(scratch_->extended_data), got) < got) {
      *error = "audio fifo write failed";
      return -1;
    }
    moved += got;
  }
  return moved;
}

bool AudioSegmentReader::DecodeMore(std::string* error) {
  const uint8_t** in = nullptr;
  int in_samples = 0;

  double frame_time_s = 0.0;
  std::string decode_error;
  if (decoder_.Next(decoded_.get(), &frame_time_s, &decode_error)) {
    if (pending_skip_ < 0) {
      pending_skip_ = std::max<int64_t>(
          0, std::llround((source_offset_s_ - frame_time_s) * sample_rate_));
    }
    in = const_cast<const uint8_t**>(decoded_->extended_data);
    in_samples = decoded_->nb_samples;
  } else {
    if (!decode_error.empty()) {
      Logger::Warn("[SegmentReader] AUDIO_DECODE_STOPPED err=" + decode_error);
    }
    eof_ = true;  // Drain the resampler below.
  }

  const int out_count = swr_get_out_samples(swr_.get(), in_samples);
  if (out_count <= 0) return true;

  av_frame_unref(scratch_.get());
  scratch_->format = AV_SAMPLE_FMT_FLTP;
  av_channel_layout_default(&scratch_->ch_layout, channels_);
  scratch_->sample_rate = sample_rate_;
  scratch_->nb_samples = out_count;
  int ret = av_frame_get_buffer(scratch_.get(), 0);
  if (ret < 0) {
    *error = "failed to allocate resample buffer: " + AvErrorString(ret);
    return false;
  }

  const int converted = swr_convert(swr_.get(), scratch_->extended_data, out_count,
                                    in, in_samples);
  if (!eof_) av_frame_unref(decoded_.get());
  if (converted < 0) {
    *error = "audio resampling failed: " + AvErrorString(converted);
    return false;
  }

  // Drop samples before the source offset (the seek lands on a packet
  // boundary at or before it).
  const int skip = static_cast<int>(std::min<int64_t>(std::max<int64_t>(pending_skip_, 0), converted));
  if (pending_skip_ > 0) pending_skip_ -= skip;

  const int keep = converted - skip;
  if (keep > 0) {
    void* planes[AV_NUM_DATA_POINTERS] = {};
    for (int c = 0; c < channels_ && c < AV_NUM_DATA_POINTERS; ++c) {
      planes[c] = scratch_->extended_data[c] + static_cast<size_t>(skip) * sizeof(float);
    }
    if (av_audio_fifo_write(buffer_.get(), planes, keep) < keep) {
      *error = "audio fifo write failed";
      return false;
    }
  }
  return true;
}

}  // namespace segweave::compile
