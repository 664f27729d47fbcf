// Repository: Segweave
// Component: Media Probe (libavformat)
// Copyright (c) 2025 Segweave

#include "segweave/fetch/MediaProbe.hpp"

#include <memory>
#include <sstream>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
}

#include "segweave/util/Logger.hpp"

namespace segweave::fetch {

using segweave::util::Logger;

namespace {

struct FormatCloser {
  void operator()(AVFormatContext* ctx) const {
    if (ctx) avformat_close_input(&ctx);
  }
};
using FormatPtr = std::unique_ptr<AVFormatContext, FormatCloser>;

std::string AvErr(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

// Stream duration when the container records one, else the container's.
double StreamDurationSeconds(const AVFormatContext* fmt, const AVStream* st) {
  if (st->duration != AV_NOPTS_VALUE && st->duration > 0) {
    return static_cast<double>(st->duration) * av_q2d(st->time_base);
  }
  if (fmt->duration != AV_NOPTS_VALUE && fmt->duration > 0) {
    return static_cast<double>(fmt->duration) / AV_TIME_BASE;
  }
  return 0.0;
}

// Index of a decodable stream of the given type, or -1.
int FindDecodableStream(AVFormatContext* fmt, AVMediaType type) {
  int idx = av_find_best_stream(fmt, type, -1, -1, nullptr, 0);
  if (idx < 0) return -1;
  const AVStream* st = fmt->streams[idx];
  if (type == AVMEDIA_TYPE_VIDEO &&
      (st->disposition & AV_DISPOSITION_ATTACHED_PIC)) {
    return -1;
  }
  if (!avcodec_find_decoder(st->codecpar->codec_id)) return -1;
  return idx;
}

}  // namespace

ProbeResult FFmpegMediaProbe::Probe(const std::string& path) {
  av_log_set_level(AV_LOG_ERROR);

  AVFormatContext* raw = nullptr;
  int ret = avformat_open_input(&raw, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    return ProbeResult::Failure("open_input failed: " + AvErr(ret));
  }
  FormatPtr fmt(raw);

  ret = avformat_find_stream_info(fmt.get(), nullptr);
  if (ret < 0) {
    return ProbeResult::Failure("find_stream_info failed: " + AvErr(ret));
  }

  const int audio_idx = FindDecodableStream(fmt.get(), AVMEDIA_TYPE_AUDIO);

  // Try as video first.
  int video_idx = FindDecodableStream(fmt.get(), AVMEDIA_TYPE_VIDEO);
  if (video_idx >= 0) {
    double d = StreamDurationSeconds(fmt.get(), fmt->streams[video_idx]);
    if (d > 0.0) {
      const bool has_audio = audio_idx >= 0;
      std::ostringstream oss;
      oss << "[MediaProbe] PROBE_OK path=" << path << " kind=VIDEO duration_s=" << d
          << " has_audio=" << (has_audio ? "true" : "false");
      Logger::Debug(oss.str());
      return ProbeResult::Success(MediaKind::kVideo, d, has_audio);
    }
  }

  // Fall back to audio.
  if (audio_idx >= 0) {
    double d = StreamDurationSeconds(fmt.get(), fmt->streams[audio_idx]);
    if (d > 0.0) {
      std::ostringstream oss;
      oss << "[MediaProbe] PROBE_OK path=" << path << " kind=AUDIO duration_s=" << d;
      Logger::Debug(oss.str());
      return ProbeResult::Success(MediaKind::kAudio, d);
    }
    return ProbeResult::Failure("audio stream has no discoverable duration");
  }

  if (video_idx >= 0) {
    return ProbeResult::Failure("video stream has no discoverable duration");
  }
  return ProbeResult::Failure("no decodable video or audio stream");
}

}  // namespace segweave::fetch
