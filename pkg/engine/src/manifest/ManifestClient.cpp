// Repository: Segweave
// Component: Manifest Client Implementation
// Copyright (c) 2025 Segweave

#include "segweave/manifest/ManifestClient.hpp"

#include <regex>
#include <sstream>

#include "segweave/manifest/ManifestNormalizer.hpp"
#include "segweave/util/Logger.hpp"

namespace segweave::manifest {

using segweave::util::Logger;

namespace {

constexpr const char* kApiBase = "https://my.mts-link.ru/api/";

const std::regex& RecordUrlPattern() {
  static const std::regex pattern(
      R"(^https://my\.mts-link\.ru/(?:[^/]+/)?\d+/\d+/record-new/(\d+)(?:/record-file/(\d+))?$)");
  return pattern;
}

}  // namespace

std::optional<RecordIds> ManifestClient::ParseRecordUrl(const std::string& url) {
  std::smatch match;
  if (!std::regex_match(url, match, RecordUrlPattern())) {
    return std::nullopt;
  }
  RecordIds ids;
  ids.event_session_id = match[1].str();
  if (match[2].matched) {
    ids.record_id = match[2].str();
  }
  return ids;
}

std::string ManifestClient::BuildManifestUrl(const RecordIds& ids) {
  std::ostringstream oss;
  oss << kApiBase;
  if (ids.record_id) {
    oss << "event-sessions/" << ids.event_session_id
        << "/record-files/" << *ids.record_id << "/flow?withoutCuts=false";
  } else {
    oss << "eventsessions/" << ids.event_session_id << "/record?withoutCuts=false";
  }
  return oss.str();
}

ManifestClient::ManifestClient(fetch::IHttpClient& http) : http_(http) {}

ManifestClient::FetchResult ManifestClient::FetchManifest(
    const std::string& url, const std::string& session_token) const {
  fetch::HttpRequest req;
  req.url = url;
  req.headers = {
      "Accept: application/json, text/plain, */*",
      "Accept-Language: en-US,en;q=0.9",
  };
  if (!session_token.empty()) {
    req.cookie = "sessionId=" + session_token;
  }

  Logger::Info("[ManifestClient] FETCH url=" + url);
  fetch::HttpResponse resp = http_.Get(req);

  if (!resp.ok) {
    std::ostringstream oss;
    if (!resp.error.empty()) {
      oss << "transport error: " << resp.error;
    } else {
      oss << "HTTP status " << resp.status;
    }
    Logger::Error("[ManifestClient] FETCH_FAILED url=" + url + " err=" + oss.str());
    return FetchResult::Failure(oss.str());
  }

  nlohmann::json doc = nlohmann::json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    Logger::Error("[ManifestClient] INVALID_JSON url=" + url);
    return FetchResult::Failure("invalid JSON response from server");
  }

  if (doc.is_object()) {
    auto err = doc.find("error");
    if (err != doc.end() && err->is_object()) {
      // Servers send the code as 403, 403.0 or "403".
      std::optional<double> code = ManifestNormalizer::ReadNumber(*err, "code");
      if (code && *code == 403.0) {
        Logger::Error("[ManifestClient] ACCESS_DENIED url=" + url +
                      " (session id may be required or invalid)");
        return FetchResult::Failure("access denied (403); session id may be required or invalid");
      }
    }
  }

  Logger::Debug("[ManifestClient] FETCH_OK url=" + url +
                " bytes=" + std::to_string(resp.body.size()));
  return FetchResult::Success(std::move(doc));
}

}  // namespace segweave::manifest
