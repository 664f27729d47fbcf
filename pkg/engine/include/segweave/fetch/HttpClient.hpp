// Repository: Segweave
// Component: HTTP Client
// Purpose: Narrow HTTP interface used by the manifest client and segment
//          fetcher, with a libcurl implementation.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_FETCH_HTTP_CLIENT_HPP_
#define SEGWEAVE_FETCH_HTTP_CLIENT_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace segweave::fetch {

struct HttpRequest {
  std::string url;
  std::vector<std::string> headers;  // "Name: value"
  std::string cookie;                // "name=value; ..." (empty = none)
  long connect_timeout_ms = 15000;
  long timeout_ms = 60000;           // Whole request for Get(); stall window for Stream()
};

struct HttpResponse {
  bool ok = false;       // Transport succeeded and status is 2xx
  long status = 0;
  std::string body;
  std::string error;     // Transport error text (empty when the server answered)
};

struct StreamCallbacks {
  // Called once before the first body byte (or after completion for an
  // empty body). content_length is the length of THIS response body.
  std::function<void(long status, std::optional<int64_t> content_length)> on_response;

  // Called per received chunk. Return false to abort the transfer.
  std::function<bool(const char* data, size_t len)> on_data;
};

struct StreamResult {
  bool completed = false;  // Body fully received with a 2xx status
  bool cancelled = false;  // Aborted via the cancel flag
  long status = 0;
  int64_t bytes_received = 0;
  std::string error;
};

// IHttpClient implementations must be safe to call from several fetch
// workers at once (one transfer per call, no shared handles).
class IHttpClient {
 public:
  virtual ~IHttpClient() = default;

  // Buffered GET.
  virtual HttpResponse Get(const HttpRequest& request) = 0;

  // Streaming GET with "Range: bytes=<range_start>-". cancel (may be null)
  // is polled during the transfer; when it becomes true the transfer aborts
  // promptly and the result has cancelled=true.
  virtual StreamResult Stream(const HttpRequest& request,
                              int64_t range_start,
                              const StreamCallbacks& callbacks,
                              const std::atomic<bool>* cancel) = 0;
};

// libcurl-backed client. Each call owns its own easy handle.
class CurlHttpClient : public IHttpClient {
 public:
  static constexpr const char* kDefaultUserAgent =
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
      "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

  CurlHttpClient();
  ~CurlHttpClient() override = default;

  CurlHttpClient(const CurlHttpClient&) = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;

  HttpResponse Get(const HttpRequest& request) override;
  StreamResult Stream(const HttpRequest& request,
                      int64_t range_start,
                      const StreamCallbacks& callbacks,
                      const std::atomic<bool>* cancel) override;
};

}  // namespace segweave::fetch

#endif  // SEGWEAVE_FETCH_HTTP_CLIENT_HPP_
