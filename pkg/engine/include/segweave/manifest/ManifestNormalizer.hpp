// Repository: Segweave
// Component: Manifest Normalizer
// Purpose: Tolerant extraction of typed SegmentRefs from a loosely-typed
//          session manifest document.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_MANIFEST_MANIFEST_NORMALIZER_HPP_
#define SEGWEAVE_MANIFEST_MANIFEST_NORMALIZER_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "segweave/manifest/SegmentTypes.hpp"

namespace segweave::manifest {

// Normalized manifest. segments are in manifest order.
struct Manifest {
  static constexpr const char* kDefaultName = "Unnamed_Webinar";

  std::string name = kDefaultName;
  double total_duration_s = 0.0;
  std::vector<SegmentRef> segments;

  // eventLogs entries rejected individually (not a record, no data, no url).
  int32_t skipped_entries = 0;

  // Raw document, kept for the debug dump on a no-content session.
  nlohmann::json raw;
};

// ManifestNormalizer performs no I/O. The only whole-manifest failure is an
// unusable total duration (or, for NormalizeText, a body that is not JSON);
// malformed eventLogs entries are skipped one by one.
class ManifestNormalizer {
 public:
  struct NormalizeResult {
    bool valid;
    SessionError error;
    std::string detail;
    Manifest manifest;

    static NormalizeResult Success(Manifest m) {
      return {true, SessionError::kNone, "", std::move(m)};
    }

    static NormalizeResult Failure(SessionError err, const std::string& detail = "") {
      return {false, err, detail, {}};
    }
  };

  static NormalizeResult Normalize(const nlohmann::json& doc);

  // Parses body as JSON, then Normalize().
  static NormalizeResult NormalizeText(const std::string& body);

  // URL path basename (query and fragment dropped). When the path has no
  // filename: "segment_" + first 16 hex chars of MD5(url) + ".mp4".
  static std::string DeriveCacheFilename(const std::string& url);

  // Extension-based hint; probing decides the real kind.
  static MediaKind KindHintFromUrl(const std::string& url);

  // Runs of <>:"/\|?* and whitespace become '_', leading/trailing '_'
  // trimmed. Empty result → Manifest::kDefaultName.
  static std::string SanitizeFilename(const std::string& name);

  // obj[key] as a number: a JSON number or a numeric string. Anything else,
  // or a missing key, is nullopt.
  static std::optional<double> ReadNumber(const nlohmann::json& obj, const char* key);

 private:
  static std::optional<SegmentRef> ExtractEntry(const nlohmann::json& entry, int32_t index);
  static std::string UrlPathBasename(const std::string& url);
};

}  // namespace segweave::manifest

#endif  // SEGWEAVE_MANIFEST_MANIFEST_NORMALIZER_HPP_
