// Repository: Segweave
// Component: FillerSource Tests
// Copyright (c) 2025 Segweave

#include <gtest/gtest.h>

#include <cstddef>

#include "segweave/compile/FillerSource.hpp"

namespace segweave::compile::testing {
namespace {

TEST(FillerSourceTest, BlackFrameIsBroadcastBlack) {
  FillerSource filler(64, 36);
  const size_t y = 64 * 36;
  const size_t uv = 32 * 18;
  ASSERT_EQ(filler.VideoFrame().size(), y + 2 * uv);

  EXPECT_EQ(filler.LumaPlane()[0], FillerSource::kBlackLuma);
  EXPECT_EQ(filler.LumaPlane()[y - 1], FillerSource::kBlackLuma);
  EXPECT_EQ(filler.CbPlane()[0], FillerSource::kNeutralChroma);
  EXPECT_EQ(filler.CrPlane()[uv - 1], FillerSource::kNeutralChroma);
  EXPECT_EQ(filler.CrPlane() - filler.CbPlane(), static_cast<std::ptrdiff_t>(uv));
}

TEST(FillerSourceTest, SilenceIsZero) {
  FillerSource filler(2, 2);
  for (int i = 0; i < FillerSource::kSilenceBlockSamples; ++i) {
    ASSERT_EQ(filler.Silence()[i], 0.0f) << i;
  }
}

TEST(FillerSourceTest, AdjacentSlotsShareBoundaryIndex) {
  // 10.02 s at 24 fps sits between frames 240 and 241.
  EXPECT_EQ(FillerSource::UnitIndex(10.02, 24), 240);
  EXPECT_EQ(FillerSource::UnitIndex(10.03, 24), 241);
  EXPECT_EQ(FillerSource::UnitsBetween(0.0, 10.03, 24) + FillerSource::UnitsBetween(10.03, 25.0, 24),
            FillerSource::UnitIndex(25.0, 24));
  EXPECT_EQ(FillerSource::UnitIndex(1.5, 44100), 66150);
}

}  // namespace
}  // namespace segweave::compile::testing
