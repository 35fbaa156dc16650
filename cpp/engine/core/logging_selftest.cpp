/*
===============================================================================
Core: Logging Selftest
File: cpp/engine/core/logging_selftest.cpp

Checks:
  - level filtering in front of the sink
  - a sink that throws (std or not) never escapes log()
  - a sink that logs from inside itself neither recurses nor deadlocks
===============================================================================
*/

#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace floodfreq;
using namespace floodfreq::selftest;

static void test_level_filter() {
  std::vector<std::string> seen;
  set_log_sink([&](LogLevel, const std::string& component, const std::string& msg) {
    seen.push_back(component + ":" + msg);
  });

  set_log_level(LogLevel::WARN);
  log(LogLevel::INFO, "Test", "dropped");
  log(LogLevel::WARN, "Test", "kept");
  log(LogLevel::ERROR, "Test", "also kept");
  log(LogLevel::OFF, "Test", "never");

  set_log_level(LogLevel::OFF);
  log(LogLevel::ERROR, "Test", "silenced");

  set_log_sink(LogSink());
  expect_true(seen.size() == 2, "only WARN and above reach the sink");
  expect_true(!seen.empty() && seen[0] == "Test:kept", "sink receives component and message");
  expect_true(get_log_level() == LogLevel::OFF, "level reads back");
}

static void test_throwing_sinks() {
  set_log_level(LogLevel::DEBUG);

  set_log_sink([](LogLevel, const std::string&, const std::string&) { throw 42; });
  log(LogLevel::WARN, "Test", "non-std throw");
  pass("non-std exception from sink contained");

  set_log_sink([](LogLevel, const std::string&, const std::string&) {
    throw std::runtime_error("sink failure");
  });
  log(LogLevel::WARN, "Test", "std throw");
  pass("std exception from sink contained");

  // Logging keeps working after a failed record.
  int after = 0;
  set_log_sink([&](LogLevel, const std::string&, const std::string&) { ++after; });
  log(LogLevel::INFO, "Test", "after");
  expect_true(after == 1, "sink works after an earlier sink threw");

  set_log_sink(LogSink());
  set_log_level(LogLevel::OFF);
}

static void test_reentrant_sink() {
  set_log_level(LogLevel::DEBUG);

  int calls = 0;
  set_log_sink([&](LogLevel, const std::string&, const std::string&) {
    ++calls;
    // Nested record bypasses the sink (goes to stdout) instead of recursing.
    log(LogLevel::DEBUG, "Nested", "from inside the sink");
  });
  log(LogLevel::INFO, "Test", "outer");
  log(LogLevel::INFO, "Test", "outer again");

  set_log_sink(LogSink());
  set_log_level(LogLevel::OFF);

  expect_true(calls == 2, "sink called once per outer record");
}

int main() {
  test_level_filter();
  test_throwing_sinks();
  test_reentrant_sink();

  return finish("logging");
}
