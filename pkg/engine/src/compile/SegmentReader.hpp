// Repository: Segweave
// Component: Segment Readers
// Purpose: Decode one cached segment from a source offset into the output
//          format (scaled YUV420P frames or resampled planar float audio).
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_COMPILE_SEGMENT_READER_HPP_
#define SEGWEAVE_COMPILE_SEGMENT_READER_HPP_

#include <cstdint>
#include <memory>
#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/audio_fifo.h>
#include <libavutil/frame.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

namespace segweave::compile {

// =============================================================================
// Owning handles
// =============================================================================

struct FrameDeleter {
  void operator()(AVFrame* f) const { av_frame_free(&f); }
};
struct PacketDeleter {
  void operator()(AVPacket* p) const { av_packet_free(&p); }
};
struct CodecContextDeleter {
  void operator()(AVCodecContext* c) const { avcodec_free_context(&c); }
};
struct InputFormatDeleter {
  void operator()(AVFormatContext* f) const { avformat_close_input(&f); }
};
struct SwsDeleter {
  void operator()(SwsContext* s) const { sws_freeContext(s); }
};
struct SwrDeleter {
  void operator()(SwrContext* s) const { swr_free(&s); }
};
struct AudioFifoDeleter {
  void operator()(AVAudioFifo* f) const { av_audio_fifo_free(f); }
};

using FramePtr = std::unique_ptr<AVFrame, FrameDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextDeleter>;
using InputFormatPtr = std::unique_ptr<AVFormatContext, InputFormatDeleter>;
using SwsPtr = std::unique_ptr<SwsContext, SwsDeleter>;
using SwrPtr = std::unique_ptr<SwrContext, SwrDeleter>;
using AudioFifoPtr = std::unique_ptr<AVAudioFifo, AudioFifoDeleter>;

std::string AvErrorString(int ret);

// =============================================================================
// StreamDecoder: demux + decode of the best stream of one type
// =============================================================================

class StreamDecoder {
 public:
  // Opens path, selects the best stream of `type` and seeks (backward, to
  // the preceding keyframe) to start_s when start_s > 0.
  bool Open(const std::string& path, AVMediaType type, double start_s, std::string* error);

  // Decodes the next frame into out. frame_time_s is relative to the stream
  // start. Returns false at end of stream; error is set on decode failure.
  bool Next(AVFrame* out, double* frame_time_s, std::string* error);

  AVCodecContext* codec() const { return codec_.get(); }

 private:
  InputFormatPtr fmt_;
  CodecContextPtr codec_;
  PacketPtr packet_;
  int stream_index_ = -1;
  double time_base_ = 0.0;
  int64_t start_pts_ = 0;
  bool draining_ = false;
};

// =============================================================================
// VideoSegmentReader
// =============================================================================

class VideoSegmentReader {
 public:
  VideoSegmentReader(int width, int height);

  bool Open(const std::string& path, double source_offset_s, std::string* error);

  // Latest decoded frame whose time is at or before t_s (source time),
  // scaled to width x height YUV420P. Past end of media the last frame is
  // held. nullptr only when the file has produced no frame at all.
  const AVFrame* FrameAt(double t_s, std::string* error);

 private:
  bool Promote(std::string* error);

  int width_;
  int height_;
  StreamDecoder decoder_;
  SwsPtr sws_;
  FramePtr next_;       // Decoded, not yet shown
  FramePtr current_;    // Scaled, held
  double next_time_s_ = 0.0;
  bool has_next_ = false;
  bool has_current_ = false;
  bool eof_ = false;
};

// =============================================================================
// AudioSegmentReader
// =============================================================================

class AudioSegmentReader {
 public:
  // Output format: planar float, sample_rate, `channels` (default layout).
  AudioSegmentReader(int sample_rate, int channels);

  bool Open(const std::string& path, double source_offset_s, std::string* error);

  // Moves up to n samples into out. Returns the number moved; fewer than n
  // means the media ran out. Negative on error.
  int64_t ReadInto(AVAudioFifo* out, int64_t n, std::string* error);

 private:
  bool DecodeMore(std::string* error);

  int sample_rate_;
  int channels_;
  double source_offset_s_ = 0.0;
  StreamDecoder decoder_;
  SwrPtr swr_;
  AudioFifoPtr buffer_;
  FramePtr decoded_;
  FramePtr scratch_;
  int64_t pending_skip_ = -1;  // -1 until the first decoded frame fixes it
  bool eof_ = false;
};

}  // namespace segweave::compile

#endif  // SEGWEAVE_COMPILE_SEGMENT_READER_HPP_
