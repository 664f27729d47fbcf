// Repository: Segweave
// Component: FillerSource
// Purpose: Pre-allocated inert media for filler slots: one black YUV420P
//          frame and a block of float silence. Also owns the seconds →
//          frame/sample index mapping shared by both output channels.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_COMPILE_FILLER_SOURCE_HPP_
#define SEGWEAVE_COMPILE_FILLER_SOURCE_HPP_

#include <cmath>
#include <cstdint>
#include <cstring>
#include <vector>

namespace segweave::compile {

class FillerSource {
 public:
  // Silence is handed out in blocks of at most this many samples per channel.
  static constexpr int kSilenceBlockSamples = 4096;

  // Y = 0x10 (broadcast black), U/V = 0x80 (neutral chroma)
  static constexpr uint8_t kBlackLuma = 0x10;
  static constexpr uint8_t kNeutralChroma = 0x80;

  FillerSource(int width, int height)
      : width_(width), height_(height) {
    const size_t y_size = static_cast<size_t>(width) * static_cast<size_t>(height);
    const size_t uv_size = static_cast<size_t>(width / 2) * static_cast<size_t>(height / 2);

    video_frame_.resize(y_size + 2 * uv_size);
    std::memset(video_frame_.data(), kBlackLuma, y_size);
    std::memset(video_frame_.data() + y_size, kNeutralChroma, 2 * uv_size);

    silence_.assign(static_cast<size_t>(kSilenceBlockSamples), 0.0f);
  }

  // Tightly packed Y, U, V planes. Immutable.
  const std::vector<uint8_t>& VideoFrame() const { return video_frame_; }
  const uint8_t* LumaPlane() const { return video_frame_.data(); }
  const uint8_t* CbPlane() const { return video_frame_.data() + LumaSize(); }
  const uint8_t* CrPlane() const { return CbPlane() + ChromaSize(); }

  // One channel of zero float samples; the same block serves every plane.
  const float* Silence() const { return silence_.data(); }

  int width() const { return width_; }
  int height() const { return height_; }

  // Index of the first frame/sample at or after t on a grid of `rate`
  // units per second. Slot boundaries map through this so adjacent slots
  // share their boundary index and channel lengths never drift.
  static int64_t UnitIndex(double t_s, int rate) {
    return static_cast<int64_t>(std::llround(t_s * static_cast<double>(rate)));
  }

  static int64_t UnitsBetween(double start_s, double end_s, int rate) {
    return UnitIndex(end_s, rate) - UnitIndex(start_s, rate);
  }

 private:
  size_t LumaSize() const {
    return static_cast<size_t>(width_) * static_cast<size_t>(height_);
  }
  size_t ChromaSize() const {
    return static_cast<size_t>(width_ / 2) * static_cast<size_t>(height_ / 2);
  }

  int width_;
  int height_;
  std::vector<uint8_t> video_frame_;
  std::vector<float> silence_;
};

}  // namespace segweave::compile

#endif  // SEGWEAVE_COMPILE_FILLER_SOURCE_HPP_
