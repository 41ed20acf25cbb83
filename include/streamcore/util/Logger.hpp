// Repository: streamcore
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by every core component.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_UTIL_LOGGER_HPP_
#define STREAMCORE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace streamcore::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from the ingest path and the scheduler thread never
// interleave.
//
// Info  → stdout (stream lifecycle, decisions)
// Debug → stdout only when STREAMCORE_DEBUG env is set (per-chunk tracing)
// Warn  → stderr (underruns, desyncs, rejected admissions)
// Error → stderr (invariant violations)
//
// Test-only: the sinks receive every line of their level in addition to the
// console. Call with nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace streamcore::util

#endif  // STREAMCORE_UTIL_LOGGER_HPP_
