#pragma once
/*
================================================================================
Core: Error Types
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Uniform exception types for the frequency-analysis engine so failures are:
      * catchable by category (bad input vs degenerate statistics vs solver)
      * reportable by the CLI with a stable exit code

Taxonomy:
  - ValidationError  : malformed caller input (lengths, ranges, periods)
  - IndexError       : rank outside the record range (a ValidationError)
  - ArithmeticError  : degenerate statistics (mean <= 0, cv == 0, n too small)
  - FitError         : least-squares solver did not converge / non-finite fit
  - IOError          : export files could not be written
================================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>

namespace floodfreq {

// Base error for the engine.
class FloodFreqError : public std::runtime_error {
 public:
  explicit FloodFreqError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Thrown when caller input fails validation.
class ValidationError : public FloodFreqError {
 public:
  explicit ValidationError(std::string msg) : FloodFreqError(std::move(msg)) {}
};

// Thrown when a 1-based (or caller-based) rank falls outside the records.
class IndexError : public ValidationError {
 public:
  explicit IndexError(std::string msg) : ValidationError(std::move(msg)) {}
};

// Thrown when the statistics of a record set are degenerate.
class ArithmeticError : public FloodFreqError {
 public:
  explicit ArithmeticError(std::string msg) : FloodFreqError(std::move(msg)) {}
};

// Thrown when the curve fit fails. Carries the solver diagnostic.
class FitError : public FloodFreqError {
 public:
  FitError(std::string msg, int status, std::string status_text, long function_evals)
      : FloodFreqError(std::move(msg)),
        status_(status),
        status_text_(std::move(status_text)),
        function_evals_(function_evals) {}

  int status() const noexcept { return status_; }
  const std::string& status_text() const noexcept { return status_text_; }
  long function_evals() const noexcept { return function_evals_; }

 private:
  int status_;
  std::string status_text_;
  long function_evals_;
};

// Thrown for I/O or filesystem related issues.
class IOError : public FloodFreqError {
 public:
  explicit IOError(std::string msg) : FloodFreqError(std::move(msg)) {}
};

}  // namespace floodfreq
