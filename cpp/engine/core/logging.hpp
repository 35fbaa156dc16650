#pragma once
/*
===========================================================
Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by all engine modules.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - WARN/ERROR go to stderr unless a sink is installed.

Notes:
  - A sink replaces the stream output entirely; selftests use it to
    capture what the engine reports.
  - A sink may call log(); that nested record goes to the streams.
    A sink that throws loses its record (reported on stderr).
===========================================================
*/

#include <functional>
#include <string>

namespace floodfreq {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, OFF = 4 };

// Receives already-filtered records (level, component, message).
using LogSink = std::function<void(LogLevel, const std::string&, const std::string&)>;

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

LogLevel get_log_level() noexcept;

// Install a sink; an empty function restores stdout/stderr output.
void set_log_sink(LogSink sink) noexcept;

const char* to_string(LogLevel lvl) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& component, const std::string& msg) noexcept;

} // namespace floodfreq
