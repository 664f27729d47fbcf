// Repository: Segweave
// Component: FFmpeg Track Compiler Implementation
// Copyright (c) 2025 Segweave

#include "segweave/compile/FFmpegTrackCompiler.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <memory>
#include <sstream>
#include <system_error>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/audio_fifo.h>
#include <libavutil/channel_layout.h>
#include <libavutil/dict.h>
#include <libavutil/imgutils.h>
#include <libavutil/log.h>
}

#include "compile/SegmentReader.hpp"
#include "segweave/compile/FillerSource.hpp"
#include "segweave/util/Logger.hpp"

namespace segweave::compile {

namespace fs = std::filesystem;
using segweave::timeline::SlotList;
using segweave::timeline::TimelineSlot;
using segweave::util::Logger;

namespace {

void RemoveQuietly(const std::string& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    Logger::Warn("[FFmpegTrackCompiler] CLEANUP_FAILED path=" + path + " err=" + ec.message());
  }
}

// =============================================================================
// Mp4Writer: encoder contexts, output streams, muxer
// =============================================================================

class Mp4Writer {
 public:
  Mp4Writer() = default;
  ~Mp4Writer() { Close(); }

  Mp4Writer(const Mp4Writer&) = delete;
  Mp4Writer& operator=(const Mp4Writer&) = delete;

  bool Open(const std::string& path, const CompilerConfig& config, std::string* error) {
    av_log_set_level(AV_LOG_ERROR);

    // All-or-nothing: both encoders must exist before anything is allocated.
    const AVCodec* video_codec = avcodec_find_encoder_by_name(config.video_encoder.c_str());
    if (!video_codec) {
      *error = config.video_encoder + " encoder not found";
      return false;
    }
    const AVCodec* audio_codec = avcodec_find_encoder_by_name(config.audio_encoder.c_str());
    if (!audio_codec) {
      *error = config.audio_encoder + " encoder not found";
      return false;
    }

    int ret = avformat_alloc_output_context2(&fmt_, nullptr, "mp4", path.c_str());
    if (ret < 0 || !fmt_) {
      *error = "failed to allocate output context: " + AvErrorString(ret);
      return false;
    }
    const bool global_header = (fmt_->oformat->flags & AVFMT_GLOBALHEADER) != 0;

    // --- Video: H.264, YUV420P, CFR ---
    video_stream_ = avformat_new_stream(fmt_, nullptr);
    video_ctx_.reset(avcodec_alloc_context3(video_codec));
    if (!video_stream_ || !video_ctx_) {
      *error = "failed to create video stream";
      return false;
    }
    video_ctx_->width = config.width;
    video_ctx_->height = config.height;
    video_ctx_->pix_fmt = AV_PIX_FMT_YUV420P;
    video_ctx_->time_base = AVRational{1, config.fps};
    video_ctx_->framerate = AVRational{config.fps, 1};
    video_ctx_->gop_size = config.gop_size;
    if (global_header) video_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    AVDictionary* opts = nullptr;
    av_dict_set(&opts, "preset", config.x264_preset.c_str(), 0);
    av_dict_set(&opts, "crf", std::to_string(config.crf).c_str(), 0);
    ret = avcodec_open2(video_ctx_.get(), video_codec, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
      *error = "failed to open video encoder: " + AvErrorString(ret);
      return false;
    }
    ret = avcodec_parameters_from_context(video_stream_->codecpar, video_ctx_.get());
    if (ret < 0) {
      *error = "failed to copy video codec parameters: " + AvErrorString(ret);
      return false;
    }
    video_stream_->time_base = video_ctx_->time_base;

    // --- Audio: AAC, planar float, stereo ---
    audio_stream_ = avformat_new_stream(fmt_, nullptr);
    audio_ctx_.reset(avcodec_alloc_context3(audio_codec));
    if (!audio_stream_ || !audio_ctx_) {
      *error = "failed to create audio stream";
      return false;
    }
    audio_ctx_->sample_fmt = AV_SAMPLE_FMT_FLTP;
    audio_ctx_->sample_rate = config.sample_rate;
    av_channel_layout_default(&audio_ctx_->ch_layout, config.channels);
    audio_ctx_->bit_rate = config.audio_bitrate;
    audio_ctx_->time_base = AVRational{1, config.sample_rate};
    if (global_header) audio_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    ret = avcodec_open2(audio_ctx_.get(), audio_codec, nullptr);
    if (ret < 0) {
      *error = "failed to open audio encoder: " + AvErrorString(ret);
      return false;
    }
    // After avcodec_open2 so extradata (AudioSpecificConfig) is included.
    ret = avcodec_parameters_from_context(audio_stream_->codecpar, audio_ctx_.get());
    if (ret < 0) {
      *error = "failed to copy audio codec parameters: " + AvErrorString(ret);
      return false;
    }
    audio_stream_->time_base = audio_ctx_->time_base;

    packet_.reset(av_packet_alloc());
    if (!packet_) {
      *error = "failed to allocate packet";
      return false;
    }

    ret = avio_open(&fmt_->pb, path.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
      *error = "failed to open " + path + ": " + AvErrorString(ret);
      return false;
    }
    ret = avformat_write_header(fmt_, nullptr);
    if (ret < 0) {
      *error = "failed to write header: " + AvErrorString(ret);
      return false;
    }
    return true;
  }

  bool EncodeVideo(AVFrame* frame, std::string* error) {
    return Encode(video_ctx_.get(), video_stream_, frame, error);
  }

  bool EncodeAudio(AVFrame* frame, std::string* error) {
    return Encode(audio_ctx_.get(), audio_stream_, frame, error);
  }

  // Flushes both encoders and writes the trailer.
  bool Finish(std::string* error) {
    if (!EncodeVideo(nullptr, error)) return false;
    if (!EncodeAudio(nullptr, error)) return false;
    int ret = av_write_trailer(fmt_);
    if (ret < 0) {
      *error = "failed to write trailer: " + AvErrorString(ret);
      return false;
    }
    ret = avio_closep(&fmt_->pb);
    if (ret < 0) {
      *error = "failed to close output: " + AvErrorString(ret);
      return false;
    }
    return true;
  }

  int AudioFrameSize() const {
    return audio_ctx_ && audio_ctx_->frame_size > 0 ? audio_ctx_->frame_size : 1024;
  }

 private:
  bool Encode(AVCodecContext* enc, AVStream* stream, AVFrame* frame, std::string* error) {
    int ret = avcodec_send_frame(enc, frame);
    if (ret < 0 && !(frame == nullptr && ret == AVERROR_EOF)) {
      *error = "avcodec_send_frame failed: " + AvErrorString(ret);
      return false;
    }
    while (true) {
      ret = avcodec_receive_packet(enc, packet_.get());
      if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
      if (ret < 0) {
        *error = "avcodec_receive_packet failed: " + AvErrorString(ret);
        return false;
      }
      av_packet_rescale_ts(packet_.get(), enc->time_base, stream->time_base);
      packet_->stream_index = stream->index;
      // av_interleaved_write_frame takes ownership and unrefs the packet.
      ret = av_interleaved_write_frame(fmt_, packet_.get());
      if (ret < 0) {
        *error = "av_interleaved_write_frame failed: " + AvErrorString(ret);
        return false;
      }
    }
  }

  void Close() {
    if (!fmt_) return;
    if (fmt_->pb) avio_closep(&fmt_->pb);
    avformat_free_context(fmt_);
    fmt_ = nullptr;
  }

  AVFormatContext* fmt_ = nullptr;
  AVStream* video_stream_ = nullptr;
  AVStream* audio_stream_ = nullptr;
  CodecContextPtr video_ctx_;
  CodecContextPtr audio_ctx_;
  PacketPtr packet_;
};

// =============================================================================
// Slot spans: slot boundaries on an integer frame/sample grid
// =============================================================================

struct SlotSpan {
  const TimelineSlot* slot;
  int64_t begin;
  int64_t end;
};

std::vector<SlotSpan> BuildSpans(const SlotList& slots, int rate, int64_t total_units) {
  std::vector<SlotSpan> spans;
  spans.reserve(slots.size());
  for (const auto& slot : slots) {
    int64_t begin = FillerSource::UnitIndex(slot.start_s, rate);
    int64_t end = std::min(FillerSource::UnitIndex(slot.end_s, rate), total_units);
    if (end > begin) spans.push_back({&slot, begin, end});
  }
  return spans;
}

// =============================================================================
// VideoTrackWriter
// =============================================================================

class VideoTrackWriter {
 public:
  VideoTrackWriter(const SlotList& slots, int64_t total_frames,
                   const CompilerConfig& config, const FillerSource& filler,
                   Mp4Writer& out)
      : spans_(BuildSpans(slots, config.fps, total_frames)),
        config_(config), filler_(filler), out_(out) {}

  bool Open(std::string* error) {
    frame_.reset(av_frame_alloc());
    if (!frame_) {
      *error = "failed to allocate video frame";
      return false;
    }
    frame_->format = AV_PIX_FMT_YUV420P;
    frame_->width = config_.width;
    frame_->height = config_.height;
    int ret = av_frame_get_buffer(frame_.get(), 32);
    if (ret < 0) {
      *error = "failed to allocate video frame buffer: " + AvErrorString(ret);
      return false;
    }
    return true;
  }

  bool EncodeFrame(int64_t k, std::string* error) {
    while (span_index_ < spans_.size() && spans_[span_index_].end <= k) ++span_index_;

    const AVFrame* source = nullptr;
    if (span_index_ < spans_.size() && spans_[span_index_].begin <= k) {
      const SlotSpan& span = spans_[span_index_];
      if (span_index_ != open_span_) {
        if (!EnterSpan(span, error)) return false;
        open_span_ = span_index_;
      }
      if (reader_) {
        const double t = span.slot->source_offset_s +
                         static_cast<double>(k - span.begin) / config_.fps;
        std::string read_error;
        source = reader_->FrameAt(t, &read_error);
        if (!read_error.empty()) {
          *error = read_error;
          return false;
        }
      }
    }

    int ret = av_frame_make_writable(frame_.get());
    if (ret < 0) {
      *error = "av_frame_make_writable failed: " + AvErrorString(ret);
      return false;
    }
    if (source) {
      ret = av_frame_copy(frame_.get(), source);
      if (ret < 0) {
        *error = "av_frame_copy failed: " + AvErrorString(ret);
        return false;
      }
    } else {
      const uint8_t* planes[4] = {filler_.LumaPlane(), filler_.CbPlane(), filler_.CrPlane(), nullptr};
      const int linesizes[4] = {filler_.width(), filler_.width() / 2, filler_.width() / 2, 0};
      av_image_copy(frame_->data, frame_->linesize, planes, linesizes,
                    AV_PIX_FMT_YUV420P, config_.width, config_.height);
    }

    frame_->pts = k;
    return out_.EncodeVideo(frame_.get(), error);
  }

 private:
  bool EnterSpan(const SlotSpan& span, std::string* error) {
    reader_.reset();
    if (!span.slot->is_content()) return true;
    if (!span.slot->segment) {
      *error = "content slot without segment";
      return false;
    }
    const FetchedSegment& seg = *span.slot->segment;
    reader_ = std::make_unique<VideoSegmentReader>(config_.width, config_.height);
    std::string open_error;
    if (!reader_->Open(seg.local_path, span.slot->source_offset_s, &open_error)) {
      *error = "cannot open video segment " + seg.ref.cache_filename + ": " + open_error;
      return false;
    }
    std::ostringstream oss;
    oss << "[FFmpegTrackCompiler] VIDEO_SLOT file=" << seg.ref.cache_filename
        << " frames=[" << span.begin << "," << span.end << ")"
        << " source_offset_s=" << span.slot->source_offset_s;
    Logger::Debug(oss.str());
    return true;
  }

  std::vector<SlotSpan> spans_;
  const CompilerConfig& config_;
  const FillerSource& filler_;
  Mp4Writer& out_;
  FramePtr frame_;
  std::unique_ptr<VideoSegmentReader> reader_;
  size_t span_index_ = 0;
  size_t open_span_ = static_cast<size_t>(-1);
};

// =============================================================================
// AudioTrackWriter
// =============================================================================

class AudioTrackWriter {
 public:
  AudioTrackWriter(const SlotList& slots, int64_t total_samples,
                   const CompilerConfig& config, const FillerSource& filler,
                   Mp4Writer& out)
      : spans_(BuildSpans(slots, config.sample_rate, total_samples)),
        total_samples_(total_samples), config_(config), filler_(filler), out_(out) {}

  bool Open(std::string* error) {
    frame_size_ = out_.AudioFrameSize();
    fifo_.reset(av_audio_fifo_alloc(AV_SAMPLE_FMT_FLTP, config_.channels, frame_size_ * 4));
    frame_.reset(av_frame_alloc());
    if (!fifo_ || !frame_) {
      *error = "failed to allocate audio buffers";
      return false;
    }
    frame_->format = AV_SAMPLE_FMT_FLTP;
    av_channel_layout_default(&frame_->ch_layout, config_.channels);
    frame_->sample_rate = config_.sample_rate;
    frame_->nb_samples = frame_size_;
    int ret = av_frame_get_buffer(frame_.get(), 0);
    if (ret < 0) {
      *error = "failed to allocate audio frame buffer: " + AvErrorString(ret);
      return false;
    }
    return true;
  }

  // Renders the timeline up to (not including) sample `target`.
  bool EncodeUntil(int64_t target, std::string* error) {
    target = std::min(target, total_samples_);
    while (produced_ < target) {
      while (span_index_ < spans_.size() && spans_[span_index_].end <= produced_) ++span_index_;

      int64_t n = target - produced_;
      if (span_index_ < spans_.size() && spans_[span_index_].begin <= produced_) {
        const SlotSpan& span = spans_[span_index_];
        n = std::min(target, span.end) - produced_;
        if (span_index_ != open_span_) {
          if (!EnterSpan(span, error)) return false;
          open_span_ = span_index_;
        }
        if (reader_) {
          std::string read_error;
          int64_t got = reader_->ReadInto(fifo_.get(), n, &read_error);
          if (got < 0) {
            *error = read_error;
            return false;
          }
          if (got < n && !WriteSilence(n - got, error)) return false;
        } else if (!WriteSilence(n, error)) {
          return false;
        }
      } else {
        if (span_index_ < spans_.size()) n = std::min(n, spans_[span_index_].begin - produced_);
        if (!WriteSilence(n, error)) return false;
      }
      produced_ += n;
      if (!Drain(/*final=*/false, error)) return false;
    }
    return true;
  }

  // Encodes whatever remains in the FIFO, including a short last frame.
  bool Flush(std::string* error) { return Drain(/*final=*/true, error); }

 private:
  bool EnterSpan(const SlotSpan& span, std::string* error) {
    reader_.reset();
    if (!span.slot->is_content()) return true;
    if (!span.slot->segment) {
      *error = "content slot without segment";
      return false;
    }
    const FetchedSegment& seg = *span.slot->segment;
    reader_ = std::make_unique<AudioSegmentReader>(config_.sample_rate, config_.channels);
    std::string open_error;
    if (!reader_->Open(seg.local_path, span.slot->source_offset_s, &open_error)) {
      *error = "cannot open audio segment " + seg.ref.cache_filename + ": " + open_error;
      return false;
    }
    std::ostringstream oss;
    oss << "[FFmpegTrackCompiler] AUDIO_SLOT file=" << seg.ref.cache_filename
        << " samples=[" << span.begin << "," << span.end << ")"
        << " source_offset_s=" << span.slot->source_offset_s;
    Logger::Debug(oss.str());
    return true;
  }

  bool WriteSilence(int64_t n, std::string* error) {
    void* planes[AV_NUM_DATA_POINTERS] = {};
    for (int c = 0; c < config_.channels && c < AV_NUM_DATA_POINTERS; ++c) {
      planes[c] = const_cast<float*>(filler_.Silence());
    }
    while (n > 0) {
      const int chunk = static_cast<int>(std::min<int64_t>(n, FillerSource::kSilenceBlockSamples));
      if (av_audio_fifo_write(fifo_.get(), planes, chunk) < chunk) {
        *error = "audio fifo write failed";
        return false;
      }
      n -= chunk;
    }
    return true;
  }

  bool Drain(bool final, std::string* error) {
    while (true) {
      const int available = av_audio_fifo_size(fifo_.get());
      if (available <= 0) return true;
      if (available < frame_size_ && !final) return true;

      const int count = std::min(available, frame_size_);
      int ret = av_frame_make_writable(frame_.get());
      if (ret < 0) {
        *error = "av_frame_make_writable failed: " + AvErrorString(ret);
        return false;
      }
      frame_->nb_samples = count;
      if (av_audio_fifo_read(fifo_.get(), reinterpret_cast<void**>(frame_->extended_data), count) < count) {
        *error = "audio fifo read failed";
        return false;
      }
      frame_->pts = encoded_samples_;
      encoded_samples_ += count;
      if (!out_.EncodeAudio(frame_.get(), error)) return false;
    }
  }

  std::vector<SlotSpan> spans_;
  int64_t total_samples_;
  const CompilerConfig& config_;
  const FillerSource& filler_;
  Mp4Writer& out_;
  AudioFifoPtr fifo_;
  FramePtr frame_;
  std::unique_ptr<AudioSegmentReader> reader_;
  int frame_size_ = 1024;
  int64_t produced_ = 0;
  int64_t encoded_samples_ = 0;
  size_t span_index_ = 0;
  size_t open_span_ = static_cast<size_t>(-1);
};

}  // namespace

// =============================================================================
// FFmpegTrackCompiler
// =============================================================================

FFmpegTrackCompiler::FFmpegTrackCompiler(CompilerConfig config)
    : config_(std::move(config)) {}

CompileResult FFmpegTrackCompiler::Compile(const CompileRequest& request,
                                           const std::atomic<bool>* cancel) {
  const double duration_s = request.OutputDuration();
  if (!(duration_s > 0.0)) {
    return CompileResult::Failure(SessionError::kCompileError, "output duration must be > 0");
  }
  if (request.output_path.empty()) {
    return CompileResult::Failure(SessionError::kCompileError, "output path is empty");
  }

  const std::string part_path = request.output_path + ".part";
  std::error_code ec;
  const fs::path parent = fs::path(request.output_path).parent_path();
  if (!parent.empty()) fs::create_directories(parent, ec);
  RemoveQuietly(part_path);

  const int64_t total_frames = std::max<int64_t>(1, FillerSource::UnitIndex(duration_s, config_.fps));
  const int64_t total_samples = FillerSource::UnitIndex(duration_s, config_.sample_rate);

  {
    std::ostringstream oss;
    oss << "[FFmpegTrackCompiler] COMPILE_START output=" << request.output_path
        << " duration_s=" << duration_s
        << " video_slots=" << request.video_slots.size()
        << " audio_slots=" << request.audio_slots.size()
        << " frames=" << total_frames;
    Logger::Info(oss.str());
  }

  FillerSource filler(config_.width, config_.height);
  auto writer = std::make_unique<Mp4Writer>();

  auto fail = [&](SessionError err, const std::string& detail) {
    writer.reset();
    RemoveQuietly(part_path);
    if (err == SessionError::kCancelled) {
      Logger::Info("[FFmpegTrackCompiler] COMPILE_CANCELLED output=" + request.output_path);
    } else {
      Logger::Error("[FFmpegTrackCompiler] COMPILE_FAILED output=" + request.output_path +
                    " err=" + detail);
    }
    return CompileResult::Failure(err, detail);
  };

  std::string error;
  if (!writer->Open(part_path, config_, &error)) {
    return fail(SessionError::kCompileError, error);
  }

  VideoTrackWriter video(request.video_slots, total_frames, config_, filler, *writer);
  AudioTrackWriter audio(request.audio_slots, total_samples, config_, filler, *writer);
  if (!video.Open(&error) || !audio.Open(&error)) {
    return fail(SessionError::kCompileError, error);
  }

  const int64_t progress_step = static_cast<int64_t>(config_.fps) * 60;
  for (int64_t k = 0; k < total_frames; ++k) {
    if (cancel && cancel->load(std::memory_order_acquire)) {
      return fail(SessionError::kCancelled, "cancelled");
    }
    if (!video.EncodeFrame(k, &error)) {
      return fail(SessionError::kCompileError, error);
    }
    const int64_t audio_target = static_cast<int64_t>(std::llround(
        static_cast<double>(k + 1) * config_.sample_rate / config_.fps));
    if (!audio.EncodeUntil(audio_target, &error)) {
      return fail(SessionError::kCompileError, error);
    }
    if ((k + 1) % progress_step == 0) {
      std::ostringstream oss;
      oss << "[FFmpegTrackCompiler] PROGRESS frames=" << (k + 1) << "/" << total_frames;
      Logger::Debug(oss.str());
    }
  }

  if (!audio.EncodeUntil(total_samples, &error) || !audio.Flush(&error) ||
      !writer->Finish(&error)) {
    return fail(SessionError::kCompileError, error);
  }
  writer.reset();

  fs::rename(part_path, request.output_path, ec);
  if (ec) {
    RemoveQuietly(part_path);
    return CompileResult::Failure(SessionError::kCompileError,
                                  "rename failed: " + ec.message());
  }

  const auto bytes = static_cast<int64_t>(fs::file_size(request.output_path, ec));
  std::ostringstream oss;
  oss << "[FFmpegTrackCompiler] COMPILE_OK output=" << request.output_path
      << " bytes=" << (ec ? 0 : bytes);
  Logger::Info(oss.str());
  return CompileResult::Success(request.output_path, ec ? 0 : bytes);
}

}  // namespace segweave::compile
