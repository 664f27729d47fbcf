// Repository: Segweave
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission without multi-thread interleave.
// Copyright (c) 2025 Segweave

#include "segweave/util/Logger.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace segweave::util {

std::mutex Logger::mutex_;
bool Logger::quiet_ = false;
bool Logger::debug_enabled_ = false;
std::ofstream Logger::file_;
std::function<void(const std::string&)> Logger::error_sink_;
std::function<void(const std::string&)> Logger::warn_sink_;

namespace {

// "2025-01-31 14:02:11"
std::string NowLocalTimestamp() {
  std::time_t now = std::chrono::system_clock::to_time_t(
      std::chrono::system_clock::now());
  struct tm tm;
  if (localtime_r(&now, &tm) == nullptr) return "";
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

}  // namespace

void Logger::SetQuiet(bool quiet) {
  std::lock_guard<std::mutex> lock(mutex_);
  quiet_ = quiet;
}

void Logger::SetDebugEnabled(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  debug_enabled_ = enabled;
}

bool Logger::DebugEnabled() {
  std::lock_guard<std::mutex> lock(mutex_);
  return debug_enabled_ || std::getenv("SEGWEAVE_DEBUG") != nullptr;
}

bool Logger::SetLogFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) file_.close();
  if (path.empty()) return true;

  std::error_code ec;
  std::filesystem::path p(path);
  if (p.has_parent_path()) {
    std::filesystem::create_directories(p.parent_path(), ec);
  }
  file_.open(path, std::ios::out | std::ios::app);
  return file_.is_open();
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetWarnSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::WriteFileLocked(const char* level, const std::string& line) {
  if (!file_.is_open()) return;
  file_ << NowLocalTimestamp() << " [" << level << "] " << line << '\n';
  file_.flush();
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  WriteFileLocked("INFO", line);
  if (quiet_) return;
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Debug(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!debug_enabled_ && std::getenv("SEGWEAVE_DEBUG") == nullptr) return;
  WriteFileLocked("DEBUG", line);
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (warn_sink_) {
    warn_sink_(line);
  }
  WriteFileLocked("WARNING", line);
  std::cerr << line << '\n';
  std::cerr.flush();
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  WriteFileLocked("ERROR", line);
  std::cerr << line << '\n';
  std::cerr.flush();
}

}  // namespace segweave::util
