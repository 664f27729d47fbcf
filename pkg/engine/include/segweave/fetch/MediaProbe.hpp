// Repository: Segweave
// Component: Media Probe
// Purpose: Classify a cached segment file as video or audio and read its
//          duration using libavformat.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_FETCH_MEDIA_PROBE_HPP_
#define SEGWEAVE_FETCH_MEDIA_PROBE_HPP_

#include <string>

#include "segweave/manifest/SegmentTypes.hpp"

namespace segweave::fetch {

struct ProbeResult {
  bool ok;
  MediaKind kind;
  double duration_s;
  std::string error;

  // Video only: the file also carries a decodable audio stream.
  bool has_audio;

  static ProbeResult Success(MediaKind kind, double duration_s, bool has_audio = false) {
    return {true, kind, duration_s, "", has_audio};
  }

  static ProbeResult Failure(const std::string& error) {
    return {false, MediaKind::kUnknown, 0.0, error, false};
  }
};

class IMediaProbe {
 public:
  virtual ~IMediaProbe() = default;

  // Video is tried first; audio only when the file has no decodable video.
  // Must be callable concurrently for distinct paths.
  virtual ProbeResult Probe(const std::string& path) = 0;
};

// FFmpegMediaProbe opens the container, looks for a decodable video stream
// (cover-art attachments do not count), then for a decodable audio stream.
// A video result also reports whether an audio stream rides along with it.
// A stream without a discoverable positive duration is a probe failure.
class FFmpegMediaProbe : public IMediaProbe {
 public:
  FFmpegMediaProbe() = default;
  ProbeResult Probe(const std::string& path) override;
};

}  // namespace segweave::fetch

#endif  // SEGWEAVE_FETCH_MEDIA_PROBE_HPP_
