// Repository: Segweave
// Component: FFmpeg Track Compiler
// Purpose: Render reconstructed video and audio timelines into one MP4
//          (H.264 + AAC) using libavformat/libavcodec.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_COMPILE_FFMPEG_TRACK_COMPILER_HPP_
#define SEGWEAVE_COMPILE_FFMPEG_TRACK_COMPILER_HPP_

#include <string>

#include "segweave/compile/TrackCompiler.hpp"

namespace segweave::compile {

struct CompilerConfig {
  int width = 1920;
  int height = 1080;
  int fps = 24;
  int gop_size = 48;
  std::string video_encoder = "libx264";
  std::string x264_preset = "medium";
  int crf = 23;

  int sample_rate = 44100;
  int channels = 2;
  std::string audio_encoder = "aac";
  int64_t audio_bitrate = 128000;
};

// FFmpegTrackCompiler
//
// Both channels are rendered in lockstep: after each video frame k, audio is
// encoded up to sample round((k + 1) * sample_rate / fps). Slot boundaries
// map to frame/sample indices through FillerSource::UnitIndex, so the two
// channels agree on every boundary regardless of floating-point slot times.
//
// Content slots decode from source_offset_s for the slot length; media that
// runs short is padded (last frame held / silence). Filler slots get black
// frames / silence. The muxer writes <output>.part; the file is renamed to
// output_path only after the trailer is written.
class FFmpegTrackCompiler : public ITrackCompiler {
 public:
  explicit FFmpegTrackCompiler(CompilerConfig config = CompilerConfig());

  CompileResult Compile(const CompileRequest& request,
                        const std::atomic<bool>* cancel) override;

  const CompilerConfig& config() const { return config_; }

 private:
  CompilerConfig config_;
};

}  // namespace segweave::compile

#endif  // SEGWEAVE_COMPILE_FFMPEG_TRACK_COMPILER_HPP_
