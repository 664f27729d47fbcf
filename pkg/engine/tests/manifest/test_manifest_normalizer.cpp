// Repository: Segweave
// Component: Manifest Normalizer Tests
// Purpose: Duration validation, per-entry tolerance, start-offset precedence
//          and cache filename derivation.
// Copyright (c) 2025 Segweave

#include <gtest/gtest.h>

#include <cctype>
#include <string>

#include <nlohmann/json.hpp>

#include "segweave/manifest/ManifestNormalizer.hpp"

namespace segweave::manifest::testing {
namespace {

using nlohmann::json;

// =============================================================================
// Whole-manifest validation
// =============================================================================

TEST(ManifestNormalizerTest, ZeroDurationIsInvalid) {
  json doc = json::parse(R"({
    "duration": 0,
    "name": "Talk",
    "eventLogs": [ { "data": { "url": "https://cdn.example.com/a.mp4" } } ]
  })");

  auto result = ManifestNormalizer::Normalize(doc);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, SessionError::kInvalidManifest);
  EXPECT_TRUE(result.manifest.segments.empty());
}

TEST(ManifestNormalizerTest, MissingOrNonNumericDurationIsInvalid) {
  EXPECT_EQ(ManifestNormalizer::Normalize(json::parse(R"({"name": "x"})")).error,
            SessionError::kInvalidManifest);
  EXPECT_EQ(ManifestNormalizer::Normalize(json::parse(R"({"duration": "soon"})")).error,
            SessionError::kInvalidManifest);
  EXPECT_EQ(ManifestNormalizer::Normalize(json::parse(R"({"duration": -5})")).error,
            SessionError::kInvalidManifest);
  EXPECT_EQ(ManifestNormalizer::Normalize(json::parse("[1, 2, 3]")).error,
            SessionError::kInvalidManifest);
}

TEST(ManifestNormalizerTest, NumericStringDurationIsAccepted) {
  auto result = ManifestNormalizer::Normalize(json::parse(R"({"duration": "90.5"})"));
  ASSERT_TRUE(result.valid) << result.detail;
  EXPECT_DOUBLE_EQ(result.manifest.total_duration_s, 90.5);
}

TEST(ManifestNormalizerTest, NormalizeTextRejectsNonJson) {
  auto result = ManifestNormalizer::NormalizeText("<html>502 Bad Gateway</html>");
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, SessionError::kInvalidManifest);
}

TEST(ManifestNormalizerTest, MissingNameUsesDefault) {
  auto result = ManifestNormalizer::Normalize(json::parse(R"({"duration": 10})"));
  ASSERT_TRUE(result.valid);
  EXPECT_EQ(result.manifest.name, Manifest::kDefaultName);
  EXPECT_TRUE(result.manifest.segments.empty());
  EXPECT_EQ(result.manifest.skipped_entries, 0);
}

// =============================================================================
// Entry extraction
// =============================================================================

TEST(ManifestNormalizerTest, MalformedEntriesAreSkippedIndividually) {
  json doc = json::parse(R"({
    "duration": 120,
    "name": "Weekly sync",
    "eventLogs": [
      { "relativeTime": 0, "data": { "url": "https://cdn.example.com/rec/v1.mp4" } },
      "not an object",
      { "relativeTime": 5 },
      { "relativeTime": 6, "data": {} },
      { "relativeTime": 7, "data": { "url": 42 } },
      { "relativeTime": 8, "data": { "url": "" } },
      { "relativeTime": 30, "data": { "url": "https://cdn.example.com/rec/a1.m4a" } }
    ]
  })");

  auto result = ManifestNormalizer::Normalize(doc);
  ASSERT_TRUE(result.valid);
  const Manifest& m = result.manifest;
  EXPECT_EQ(m.name, "Weekly sync");
  EXPECT_DOUBLE_EQ(m.total_duration_s, 120.0);
  EXPECT_EQ(m.skipped_entries, 5);
  ASSERT_EQ(m.segments.size(), 2u);

  EXPECT_EQ(m.segments[0].url, "https://cdn.example.com/rec/v1.mp4");
  EXPECT_EQ(m.segments[0].manifest_index, 0);
  EXPECT_EQ(m.segments[0].kind_hint, MediaKind::kVideo);
  EXPECT_EQ(m.segments[0].cache_filename, "v1.mp4");

  EXPECT_DOUBLE_EQ(m.segments[1].start_offset_s, 30.0);
  EXPECT_EQ(m.segments[1].manifest_index, 1);  // Dense among accepted entries
  EXPECT_EQ(m.segments[1].kind_hint, MediaKind::kAudio);
  EXPECT_EQ(m.segments[1].cache_filename, "a1.m4a");
}

TEST(ManifestNormalizerTest, EntryRelativeTimeTakesPrecedenceOverData) {
  json doc = json::parse(R"({
    "duration": 60,
    "eventLogs": [
      { "relativeTime": 12, "data": { "url": "https://x/a.mp4", "relativeTime": 99 } },
      { "data": { "url": "https://x/b.mp4", "relativeTime": 20 } },
      { "data": { "url": "https://x/c.mp4" } }
    ]
  })");

  auto result = ManifestNormalizer::Normalize(doc);
  ASSERT_TRUE(result.valid);
  ASSERT_EQ(result.manifest.segments.size(), 3u);
  EXPECT_DOUBLE_EQ(result.manifest.segments[0].start_offset_s, 12.0);
  EXPECT_DOUBLE_EQ(result.manifest.segments[1].start_offset_s, 20.0);
  EXPECT_DOUBLE_EQ(result.manifest.segments[2].start_offset_s, 0.0);
}

TEST(ManifestNormalizerTest, NegativeStartOffsetClampsToZero) {
  json doc = json::parse(R"({
    "duration": 60,
    "eventLogs": [ { "relativeTime": -4.5, "data": { "url": "https://x/a.mp4" } } ]
  })");

  auto result = ManifestNormalizer::Normalize(doc);
  ASSERT_TRUE(result.valid);
  ASSERT_EQ(result.manifest.segments.size(), 1u);
  EXPECT_DOUBLE_EQ(result.manifest.segments[0].start_offset_s, 0.0);
}

TEST(ManifestNormalizerTest, RawDocumentIsKept) {
  json doc = json::parse(R"({"duration": 10, "extra": {"k": [1, 2]}})");
  auto result = ManifestNormalizer::Normalize(doc);
  ASSERT_TRUE(result.valid);
  EXPECT_EQ(result.manifest.raw, doc);
}

// =============================================================================
// Filenames
// =============================================================================

TEST(ManifestNormalizerTest, CacheFilenameIsUrlBasenameWithoutQuery) {
  EXPECT_EQ(ManifestNormalizer::DeriveCacheFilename(
                "https://cdn.example.com/rec/2024/part_01.webm?token=abc#t=3"),
            "part_01.webm");
  EXPECT_EQ(ManifestNormalizer::DeriveCacheFilename("https://cdn.example.com/stream"), "stream");
}

TEST(ManifestNormalizerTest, CacheFilenameFallsBackToUrlHash) {
  const std::string a = ManifestNormalizer::DeriveCacheFilename("https://cdn.example.com/");
  const std::string b = ManifestNormalizer::DeriveCacheFilename("https://cdn.example.com");
  const std::string a_again = ManifestNormalizer::DeriveCacheFilename("https://cdn.example.com/");

  for (const std::string& name : {a, b}) {
    ASSERT_EQ(name.size(), std::string("segment_").size() + 16 + std::string(".mp4").size()) << name;
    EXPECT_EQ(name.rfind("segment_", 0), 0u) << name;
    EXPECT_EQ(name.substr(name.size() - 4), ".mp4");
    for (char c : name.substr(8, 16)) {
      EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)) && !std::isupper(static_cast<unsigned char>(c)))
          << name;
    }
  }
  EXPECT_EQ(a, a_again);
  EXPECT_NE(a, b);
}

TEST(ManifestNormalizerTest, KindHintFollowsExtension) {
  EXPECT_EQ(ManifestNormalizer::KindHintFromUrl("https://x/a.MP4"), MediaKind::kVideo);
  EXPECT_EQ(ManifestNormalizer::KindHintFromUrl("https://x/a.webm?x=1"), MediaKind::kVideo);
  EXPECT_EQ(ManifestNormalizer::KindHintFromUrl("https://x/a.mp3"), MediaKind::kAudio);
  EXPECT_EQ(ManifestNormalizer::KindHintFromUrl("https://x/a.opus"), MediaKind::kAudio);
  EXPECT_EQ(ManifestNormalizer::KindHintFromUrl("https://x/blob"), MediaKind::kUnknown);
}

TEST(ManifestNormalizerTest, SanitizeFilenameCollapsesUnsafeRuns) {
  EXPECT_EQ(ManifestNormalizer::SanitizeFilename("Q3 Review: Plans/Goals?"), "Q3_Review_Plans_Goals");
  EXPECT_EQ(ManifestNormalizer::SanitizeFilename("  <<a>>  "), "a");
  EXPECT_EQ(ManifestNormalizer::SanitizeFilename("already_fine"), "already_fine");
  EXPECT_EQ(ManifestNormalizer::SanitizeFilename("???"), Manifest::kDefaultName);
  EXPECT_EQ(ManifestNormalizer::SanitizeFilename(""), Manifest::kDefaultName);
}

}  // namespace
}  // namespace segweave::manifest::testing
