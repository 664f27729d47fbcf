// Repository: Segweave
// Component: Logger Tests
// Purpose: Sink hooks and log-file mirroring.
// Copyright (c) 2025 Segweave

#include <gtest/gtest.h>

#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "segweave/util/Logger.hpp"
#include "../fixtures/TempDir.h"

namespace segweave::util::testing {
namespace {

using segweave::tests::fixtures::TempDir;

TEST(LoggerTest, WarnAndErrorReachSinks) {
  std::vector<std::string> warns;
  std::vector<std::string> errors;
  Logger::SetWarnSink([&warns](const std::string& l) { warns.push_back(l); });
  Logger::SetErrorSink([&errors](const std::string& l) { errors.push_back(l); });

  Logger::Warn("[Test] W1");
  Logger::Error("[Test] E1");
  Logger::Info("[Test] I1");

  Logger::SetWarnSink(nullptr);
  Logger::SetErrorSink(nullptr);
  Logger::Warn("[Test] W2");

  ASSERT_EQ(warns.size(), 1u);
  EXPECT_EQ(warns[0], "[Test] W1");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0], "[Test] E1");
}

TEST(LoggerTest, LogFileMirrorsLinesWithLevel) {
  TempDir dir("segweave_logger");
  const std::string path = dir.Join("logs/run.log");
  ASSERT_TRUE(Logger::SetLogFile(path));

  Logger::SetQuiet(true);
  Logger::Info("[Test] quiet info still lands in the file");
  Logger::SetQuiet(false);
  Logger::Warn("[Test] a warning");
  Logger::SetDebugEnabled(false);
  Logger::Debug("[Test] suppressed debug");
  ASSERT_TRUE(Logger::SetLogFile(""));

  const std::string contents = TempDir::ReadFile(path);
  EXPECT_NE(contents.find("[INFO] [Test] quiet info still lands in the file"), std::string::npos);
  EXPECT_NE(contents.find("[WARNING] [Test] a warning"), std::string::npos);
  if (!Logger::DebugEnabled()) {
    EXPECT_EQ(contents.find("suppressed debug"), std::string::npos);
  }
}

TEST(LoggerTest, ConcurrentLinesAreNotInterleaved) {
  std::mutex m;
  std::vector<std::string> lines;
  Logger::SetWarnSink([&](const std::string& l) {
    std::lock_guard<std::mutex> lock(m);
    lines.push_back(l);
  });

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([t] {
      for (int i = 0; i < 50; ++i) {
        Logger::Warn("[Test] thread=" + std::to_string(t) + " line=" + std::to_string(i));
      }
    });
  }
  for (auto& th : threads) th.join();
  Logger::SetWarnSink(nullptr);

  ASSERT_EQ(lines.size(), 200u);
  for (const auto& l : lines) {
    EXPECT_EQ(l.rfind("[Test] thread=", 0), 0u) << l;
  }
}

}  // namespace
}  // namespace segweave::util::testing
