// Repository: Segweave
// Component: Manifest Client
// Purpose: Recognize recording-page URLs, build the manifest API URL and
//          download the manifest document.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_MANIFEST_MANIFEST_CLIENT_HPP_
#define SEGWEAVE_MANIFEST_MANIFEST_CLIENT_HPP_

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "segweave/fetch/HttpClient.hpp"
#include "segweave/manifest/SegmentTypes.hpp"

namespace segweave::manifest {

struct RecordIds {
  std::string event_session_id;
  std::optional<std::string> record_id;
};

class ManifestClient {
 public:
  struct FetchResult {
    bool ok;
    SessionError error;  // kManifestUnavailable on failure
    std::string detail;
    nlohmann::json document;

    static FetchResult Success(nlohmann::json doc) {
      return {true, SessionError::kNone, "", std::move(doc)};
    }

    static FetchResult Failure(const std::string& detail) {
      return {false, SessionError::kManifestUnavailable, detail, nullptr};
    }
  };

  // Accepts
  //   https://my.mts-link.ru/[<slug>/]<n>/<n>/record-new/<session>[/record-file/<record>]
  // Anything else → nullopt.
  static std::optional<RecordIds> ParseRecordUrl(const std::string& url);

  static bool IsRecordUrl(const std::string& url) { return ParseRecordUrl(url).has_value(); }

  static std::string BuildManifestUrl(const RecordIds& ids);

  explicit ManifestClient(fetch::IHttpClient& http);

  // GET url; session_token (if non-empty) is sent as cookie sessionId.
  // Non-2xx, transport error, invalid JSON or an error.code == 403 body fail.
  FetchResult FetchManifest(const std::string& url, const std::string& session_token) const;

 private:
  fetch::IHttpClient& http_;
};

}  // namespace segweave::manifest

#endif  // SEGWEAVE_MANIFEST_MANIFEST_CLIENT_HPP_
