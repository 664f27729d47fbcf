// Repository: Segweave
// Component: Manifest Normalizer Implementation
// Copyright (c) 2025 Segweave

#include "segweave/manifest/ManifestNormalizer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>

extern "C" {
#include <libavutil/md5.h>
}

#include "segweave/util/Logger.hpp"

namespace segweave::manifest {

using segweave::util::Logger;
using nlohmann::json;

namespace {

constexpr size_t kHashPrefixChars = 16;

bool HasSuffix(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool IsUnsafeFilenameChar(unsigned char c) {
  switch (c) {
    case '<': case '>': case ':': case '"': case '/':
    case '\\': case '|': case '?': case '*':
      return true;
    default:
      return std::isspace(c) != 0;
  }
}

}  // namespace

// =============================================================================
// Normalize
// =============================================================================

ManifestNormalizer::NormalizeResult ManifestNormalizer::Normalize(const json& doc) {
  if (!doc.is_object()) {
    return NormalizeResult::Failure(
        SessionError::kInvalidManifest, "manifest is not a JSON object");
  }

  // Fail fast on duration before looking at any entry.
  std::optional<double> duration = ReadNumber(doc, "duration");
  if (!duration) {
    return NormalizeResult::Failure(
        SessionError::kInvalidManifest, "duration missing or not a number");
  }
  if (!(*duration > 0.0) || !std::isfinite(*duration)) {
    std::ostringstream detail;
    detail << "duration must be > 0 (got " << *duration << ")";
    return NormalizeResult::Failure(SessionError::kInvalidManifest, detail.str());
  }

  Manifest m;
  m.total_duration_s = *duration;
  m.raw = doc;

  auto name_it = doc.find("name");
  if (name_it != doc.end() && name_it->is_string() &&
      !name_it->get<std::string>().empty()) {
    m.name = name_it->get<std::string>();
  }

  auto logs_it = doc.find("eventLogs");
  if (logs_it == doc.end() || !logs_it->is_array()) {
    Logger::Debug("[ManifestNormalizer] NO_EVENT_LOGS name=" + m.name);
    return NormalizeResult::Success(std::move(m));
  }

  const json& logs = *logs_it;
  if (!logs.empty()) {
    std::ostringstream oss;
    oss << "[ManifestNormalizer] FIRST_ENTRY type=" << logs.front().type_name();
    if (logs.front().is_object()) {
      oss << " keys=";
      bool first = true;
      for (auto it = logs.front().begin(); it != logs.front().end(); ++it) {
        oss << (first ? "" : ",") << it.key();
        first = false;
      }
    }
    Logger::Debug(oss.str());
  }

  int32_t next_index = 0;
  for (const auto& entry : logs) {
    auto ref = ExtractEntry(entry, next_index);
    if (!ref) {
      ++m.skipped_entries;
      continue;
    }
    m.segments.push_back(std::move(*ref));
    ++next_index;
  }

  std::ostringstream oss;
  oss << "[ManifestNormalizer] NORMALIZED name=" << m.name
      << " duration_s=" << m.total_duration_s
      << " segments=" << m.segments.size()
      << " skipped=" << m.skipped_entries;
  Logger::Debug(oss.str());

  return NormalizeResult::Success(std::move(m));
}

ManifestNormalizer::NormalizeResult ManifestNormalizer::NormalizeText(
    const std::string& body) {
  json doc = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    return NormalizeResult::Failure(
        SessionError::kInvalidManifest, "manifest body is not valid JSON");
  }
  return Normalize(doc);
}

// =============================================================================
// Field extraction
// =============================================================================

// Numbers, or strings holding a number. Booleans and everything else → nullopt.
std::optional<double> ManifestNormalizer::ReadNumber(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  if (it->is_number()) {
    return it->get<double>();
  }
  if (it->is_string()) {
    const std::string& s = it->get_ref<const std::string&>();
    try {
      size_t consumed = 0;
      double v = std::stod(s, &consumed);
      while (consumed < s.size() && std::isspace(static_cast<unsigned char>(s[consumed]))) {
        ++consumed;
      }
      if (consumed != s.size()) return std::nullopt;
      return v;
    } catch (const std::exception&) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

std::optional<SegmentRef> ManifestNormalizer::ExtractEntry(const json& entry,
                                                           int32_t index) {
  if (!entry.is_object()) return std::nullopt;

  auto data_it = entry.find("data");
  if (data_it == entry.end() || !data_it->is_object() || data_it->empty()) {
    return std::nullopt;
  }
  const json& data = *data_it;

  auto url_it = data.find("url");
  if (url_it == data.end() || !url_it->is_string()) return std::nullopt;
  std::string url = url_it->get<std::string>();
  if (url.empty()) return std::nullopt;

  // Entry-level relativeTime takes precedence over data.relativeTime.
  std::optional<double> start = ReadNumber(entry, "relativeTime");
  if (!start) start = ReadNumber(data, "relativeTime");

  SegmentRef ref;
  ref.url = std::move(url);
  ref.start_offset_s = start.value_or(0.0);
  if (!(ref.start_offset_s > 0.0) || !std::isfinite(ref.start_offset_s)) {
    ref.start_offset_s = 0.0;
  }
  ref.kind_hint = KindHintFromUrl(ref.url);
  ref.manifest_index = index;
  ref.cache_filename = DeriveCacheFilename(ref.url);
  return ref;
}

// =============================================================================
// URL helpers
// =============================================================================

std::string ManifestNormalizer::UrlPathBasename(const std::string& url) {
  std::string s = url.substr(0, url.find_first_of("?#"));

  // Drop scheme://authority so a bare host never becomes a filename.
  size_t scheme = s.find("://");
  if (scheme != std::string::npos) {
    size_t path_start = s.find('/', scheme + 3);
    if (path_start == std::string::npos) return "";
    s = s.substr(path_start);
  }

  size_t slash = s.find_last_of('/');
  std::string base = (slash == std::string::npos) ? s : s.substr(slash + 1);
  if (base == "." || base == "..") return "";
  return base;
}

std::string ManifestNormalizer::DeriveCacheFilename(const std::string& url) {
  std::string base = UrlPathBasename(url);
  if (!base.empty()) return base;

  uint8_t digest[16];
  av_md5_sum(digest, reinterpret_cast<const uint8_t*>(url.data()), url.size());

  std::string hex;
  hex.reserve(32);
  char buf[3];
  for (uint8_t b : digest) {
    std::snprintf(buf, sizeof(buf), "%02x", b);
    hex += buf;
  }
  return "segment_" + hex.substr(0, kHashPrefixChars) + ".mp4";
}

MediaKind ManifestNormalizer::KindHintFromUrl(const std::string& url) {
  std::string base = Lower(UrlPathBasename(url));
  static const char* kVideoExt[] = {".mp4", ".webm", ".mkv", ".mov",
                                    ".m4v", ".ts", ".flv", ".avi"};
  static const char* kAudioExt[] = {".mp3", ".m4a", ".aac", ".ogg", ".oga",
                                    ".opus", ".wav", ".flac", ".weba"};
  for (const char* ext : kVideoExt) {
    if (HasSuffix(base, ext)) return MediaKind::kVideo;
  }
  for (const char* ext : kAudioExt) {
    if (HasSuffix(base, ext)) return MediaKind::kAudio;
  }
  return MediaKind::kUnknown;
}

std::string ManifestNormalizer::SanitizeFilename(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  bool in_run = false;
  for (char ch : name) {
    if (IsUnsafeFilenameChar(static_cast<unsigned char>(ch))) {
      if (!in_run) out += '_';
      in_run = true;
    } else {
      out += ch;
      in_run = false;
    }
  }

  size_t first = out.find_first_not_of('_');
  if (first == std::string::npos) return Manifest::kDefaultName;
  size_t last = out.find_last_not_of('_');
  return out.substr(first, last - first + 1);
}

}  // namespace segweave::manifest
