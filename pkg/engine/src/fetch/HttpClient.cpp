// Repository: Segweave
// Component: HTTP Client (libcurl)
// Copyright (c) 2025 Segweave

#include "segweave/fetch/HttpClient.hpp"

#include <mutex>
#include <sstream>

#include <curl/curl.h>

#include "segweave/util/Logger.hpp"

namespace segweave::fetch {

using segweave::util::Logger;

namespace {

std::once_flag g_curl_init_once;

struct CurlHandle {
  CURL* h = nullptr;
  CurlHandle() { h = curl_easy_init(); }
  ~CurlHandle() {
    if (h) curl_easy_cleanup(h);
  }
  CurlHandle(const CurlHandle&) = delete;
  CurlHandle& operator=(const CurlHandle&) = delete;
};

struct CurlHeaders {
  curl_slist* list = nullptr;
  ~CurlHeaders() {
    if (list) curl_slist_free_all(list);
  }
};

size_t WriteToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

// Per-transfer state for Stream().
struct StreamState {
  CURL* curl = nullptr;
  const StreamCallbacks* callbacks = nullptr;
  const std::atomic<bool>* cancel = nullptr;
  bool response_reported = false;
  bool aborted_by_consumer = false;
  int64_t bytes = 0;
};

void ReportResponse(StreamState* st) {
  if (st->response_reported) return;
  st->response_reported = true;
  long status = 0;
  curl_easy_getinfo(st->curl, CURLINFO_RESPONSE_CODE, &status);
  curl_off_t len = -1;
  curl_easy_getinfo(st->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &len);
  if (st->callbacks->on_response) {
    std::optional<int64_t> content_length;
    if (len >= 0) content_length = static_cast<int64_t>(len);
    st->callbacks->on_response(status, content_length);
  }
}

size_t StreamWrite(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* st = static_cast<StreamState*>(userdata);
  const size_t n = size * nmemb;
  ReportResponse(st);
  if (st->callbacks->on_data && !st->callbacks->on_data(ptr, n)) {
    st->aborted_by_consumer = true;
    return 0;  // CURLE_WRITE_ERROR
  }
  st->bytes += static_cast<int64_t>(n);
  return n;
}

int StreamProgress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto* st = static_cast<StreamState*>(userdata);
  if (st->cancel && st->cancel->load(std::memory_order_acquire)) {
    return 1;  // CURLE_ABORTED_BY_CALLBACK
  }
  return 0;
}

void ApplyCommonOptions(CURL* curl, const HttpRequest& request, CurlHeaders& hdr) {
  for (const auto& h : request.headers) {
    hdr.list = curl_slist_append(hdr.list, h.c_str());
  }
  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 8L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, CurlHttpClient::kDefaultUserAgent);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, request.connect_timeout_ms);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  if (hdr.list) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdr.list);
  if (!request.cookie.empty()) curl_easy_setopt(curl, CURLOPT_COOKIE, request.cookie.c_str());
}

}  // namespace

CurlHttpClient::CurlHttpClient() {
  std::call_once(g_curl_init_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlHttpClient::Get(const HttpRequest& request) {
  HttpResponse resp;
  CurlHandle ch;
  if (!ch.h) {
    resp.error = "curl init failed";
    return resp;
  }

  CurlHeaders hdr;
  ApplyCommonOptions(ch.h, request, hdr);
  curl_easy_setopt(ch.h, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(ch.h, CURLOPT_TIMEOUT_MS, request.timeout_ms);
  curl_easy_setopt(ch.h, CURLOPT_WRITEFUNCTION, WriteToString);
  curl_easy_setopt(ch.h, CURLOPT_WRITEDATA, &resp.body);

  CURLcode rc = curl_easy_perform(ch.h);
  curl_easy_getinfo(ch.h, CURLINFO_RESPONSE_CODE, &resp.status);
  if (rc != CURLE_OK) {
    resp.error = curl_easy_strerror(rc);
    std::ostringstream oss;
    oss << "[HttpClient] GET_FAILED url=" << request.url << " err=" << resp.error;
    Logger::Debug(oss.str());
    return resp;
  }
  resp.ok = resp.status >= 200 && resp.status < 300;
  return resp;
}

StreamResult CurlHttpClient::Stream(const HttpRequest& request,
                                    int64_t range_start,
                                    const StreamCallbacks& callbacks,
                                    const std::atomic<bool>* cancel) {
  StreamResult result;
  CurlHandle ch;
  if (!ch.h) {
    result.error = "curl init failed";
    return result;
  }

  StreamState st;
  st.curl = ch.h;
  st.callbacks = &callbacks;
  st.cancel = cancel;

  CurlHeaders hdr;
  ApplyCommonOptions(ch.h, request, hdr);
  const std::string range = std::to_string(range_start < 0 ? 0 : range_start) + "-";
  curl_easy_setopt(ch.h, CURLOPT_RANGE, range.c_str());
  // Range offsets count bytes on the wire; a content-coded body would not
  // line up with the bytes already on disk.
  curl_easy_setopt(ch.h, CURLOPT_ACCEPT_ENCODING, "identity");
  curl_easy_setopt(ch.h, CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(ch.h, CURLOPT_WRITEFUNCTION, StreamWrite);
  curl_easy_setopt(ch.h, CURLOPT_WRITEDATA, &st);
  curl_easy_setopt(ch.h, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(ch.h, CURLOPT_XFERINFOFUNCTION, StreamProgress);
  curl_easy_setopt(ch.h, CURLOPT_XFERINFODATA, &st);
  // Stall detection rather than a whole-transfer cap: segments can be large.
  curl_easy_setopt(ch.h, CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(ch.h, CURLOPT_LOW_SPEED_TIME, request.timeout_ms / 1000 > 0
                                                     ? request.timeout_ms / 1000
                                                     : 1L);

  CURLcode rc = curl_easy_perform(ch.h);
  curl_easy_getinfo(ch.h, CURLINFO_RESPONSE_CODE, &result.status);
  result.bytes_received = st.bytes;

  if (rc == CURLE_OK) {
    ReportResponse(&st);
    result.completed = result.status >= 200 && result.status < 300;
    if (!result.completed) {
      result.error = "unexpected HTTP status " + std::to_string(result.status);
    }
    return result;
  }

  if (rc == CURLE_ABORTED_BY_CALLBACK) {
    result.cancelled = true;
    result.error = "cancelled";
  } else if (st.aborted_by_consumer) {
    result.error = "write aborted by consumer";
  } else if (rc == CURLE_HTTP_RETURNED_ERROR) {
    result.error = "HTTP status " + std::to_string(result.status);
  } else {
    result.error = curl_easy_strerror(rc);
  }
  return result;
}

}  // namespace segweave::fetch
