// Repository: Segweave
// Component: CurlHttpClient Tests
// Purpose: Request shape of the libcurl client against a loopback server:
//          ranged streams stay byte-exact, manifest GETs carry the cookie.
// Copyright (c) 2025 Segweave

#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "segweave/fetch/HttpClient.hpp"
#include "../fixtures/LoopbackHttpServer.h"

namespace segweave::fetch::testing {
namespace {

using segweave::tests::fixtures::LoopbackHttpServer;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

TEST(CurlHttpClientTest, StreamRequestsIdentityEncodingForResume) {
  LoopbackHttpServer server({LoopbackHttpServer::Response(206, "Partial Content", "hello")});
  ASSERT_TRUE(server.ok());

  CurlHttpClient client;
  HttpRequest request;
  request.url = server.Url("/rec/part1.mp4");

  std::string body;
  long seen_status = 0;
  std::optional<int64_t> seen_length;
  StreamCallbacks callbacks;
  callbacks.on_response = [&](long status, std::optional<int64_t> length) {
    seen_status = status;
    seen_length = length;
  };
  callbacks.on_data = [&body](const char* data, size_t len) {
    body.append(data, len);
    return true;
  };

  StreamResult r = client.Stream(request, 7, callbacks, nullptr);
  ASSERT_TRUE(r.completed) << r.error;
  EXPECT_EQ(r.status, 206);
  EXPECT_EQ(seen_status, 206);
  ASSERT_TRUE(seen_length.has_value());
  EXPECT_EQ(*seen_length, 5);
  EXPECT_EQ(body, "hello");

  auto requests = server.Requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_TRUE(Contains(requests[0], "Range: bytes=7-")) << requests[0];
  EXPECT_TRUE(Contains(requests[0], "Accept-Encoding: identity")) << requests[0];
}

TEST(CurlHttpClientTest, GetSendsCookieWithoutPinningEncoding) {
  LoopbackHttpServer server({LoopbackHttpServer::Response(200, "OK", R"({"duration":1})")});
  ASSERT_TRUE(server.ok());

  CurlHttpClient client;
  HttpRequest request;
  request.url = server.Url("/api/recording");
  request.cookie = "sessionId=abc123";

  HttpResponse resp = client.Get(request);
  ASSERT_TRUE(resp.ok) << resp.error;
  EXPECT_EQ(resp.status, 200);
  EXPECT_EQ(resp.body, R"({"duration":1})");

  auto requests = server.Requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_TRUE(Contains(requests[0], "Cookie: sessionId=abc123")) << requests[0];
  EXPECT_FALSE(Contains(requests[0], "Accept-Encoding: identity")) << requests[0];
  EXPECT_FALSE(Contains(requests[0], "Range:")) << requests[0];
}

TEST(CurlHttpClientTest, StreamReportsHttpErrorStatus) {
  LoopbackHttpServer server({LoopbackHttpServer::Response(404, "Not Found", "")});
  ASSERT_TRUE(server.ok());

  CurlHttpClient client;
  HttpRequest request;
  request.url = server.Url("/rec/missing.mp4");

  StreamCallbacks callbacks;
  callbacks.on_data = [](const char*, size_t) { return true; };

  StreamResult r = client.Stream(request, 0, callbacks, nullptr);
  EXPECT_FALSE(r.completed);
  EXPECT_FALSE(r.cancelled);
  EXPECT_EQ(r.status, 404);
}

}  // namespace
}  // namespace segweave::fetch::testing
