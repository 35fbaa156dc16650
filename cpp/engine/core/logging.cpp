/*
===========================================================
Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
Purpose:
  - Implements the noexcept logging API.
  - Stream line: "2024-05-01T12:00:00.123Z [WARN ] RecordSet: message".
===========================================================
*/

#include "engine/core/logging.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace floodfreq {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};

// Guards g_sink and the stream writes (sinks themselves run unlocked).
std::mutex g_mu;
LogSink g_sink;

// Set while this thread is inside a sink call.
thread_local bool t_in_sink = false;

struct SinkScope {
  SinkScope() noexcept { t_in_sink = true; }
  ~SinkScope() { t_in_sink = false; }
  SinkScope(const SinkScope&) = delete;
  SinkScope& operator=(const SinkScope&) = delete;
};

// UTC, millisecond resolution.
std::string utc_timestamp_ms() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
  const std::time_t tt = clock::to_time_t(now);

  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
  return oss.str();
}

std::string format_line(LogLevel lvl, const std::string& component, const std::string& msg) {
  std::ostringstream oss;
  oss << utc_timestamp_ms() << " [" << std::left << std::setw(5) << to_string(lvl) << "] ";
  if (!component.empty()) oss << component << ": ";
  oss << msg << '\n';
  return oss.str();
}

} // namespace

const char* to_string(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::OFF:   return "OFF";
  }
  return "?";
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

void set_log_sink(LogSink sink) noexcept {
  std::lock_guard<std::mutex> lk(g_mu);
  g_sink = std::move(sink);
}

void log(LogLevel lvl, const std::string& component, const std::string& msg) noexcept {
  if (lvl == LogLevel::OFF) return;
  if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;

  try {
    // Sinks run outside the lock on a copy; a sink that logs re-enters here
    // and its record goes to the streams instead of recursing.
    LogSink sink;
    if (!t_in_sink) {
      std::lock_guard<std::mutex> lk(g_mu);
      sink = g_sink;
    }
    if (sink) {
      SinkScope scope;
      sink(lvl, component, msg);
      return;
    }

    std::lock_guard<std::mutex> lk(g_mu);
    std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
    out << format_line(lvl, component, msg);
    out.flush();
  } catch (...) {
    // log() is noexcept: the record is dropped, but not silently.
    std::fputs("[floodfreq] log record dropped: sink or stream threw\n", stderr);
  }
}

} // namespace floodfreq
