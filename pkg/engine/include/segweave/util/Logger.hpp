// Repository: Segweave
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission without multi-thread interleave.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_UTIL_LOGGER_HPP_
#define SEGWEAVE_UTIL_LOGGER_HPP_

#include <fstream>
#include <functional>
#include <mutex>
#include <string>

namespace segweave::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so fetch worker and session thread lines never interleave.
//
// Info  → stdout (suppressed when quiet)
// Debug → stdout only when SEGWEAVE_DEBUG env is set or debug is enabled
// Warn  → stderr (degraded but recoverable: lost segment, discarded slot)
// Error → stderr (session failures)
//
// When a log file is configured every emitted line is mirrored there with a
// timestamp and level prefix, regardless of quiet.
//
// Test-only: SetErrorSink / SetWarnSink install callbacks invoked for every
// Error() / Warn() line. Call with nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetQuiet(bool quiet);
  static void SetDebugEnabled(bool enabled);
  static bool DebugEnabled();

  // Opens (append mode) and mirrors all lines to path. Creates the parent
  // directory. Returns false if the file cannot be opened. Empty path closes.
  static bool SetLogFile(const std::string& path);

  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);

 private:
  static void WriteFileLocked(const char* level, const std::string& line);

  static std::mutex mutex_;
  static bool quiet_;
  static bool debug_enabled_;
  static std::ofstream file_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> warn_sink_;
};

}  // namespace segweave::util

#endif  // SEGWEAVE_UTIL_LOGGER_HPP_
