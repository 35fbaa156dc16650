#pragma once
/*
===============================================================================
Core: Finite Checks + Require Glue
File: cpp/engine/core/require.hpp
===============================================================================
*/

#include "engine/core/errors.hpp"

#include <cmath>
#include <string>
#include <vector>

namespace floodfreq {

inline bool is_finite(double x) noexcept {
    return std::isfinite(x) != 0;
}

inline bool all_finite(const std::vector<double>& xs) noexcept {
    for (double x : xs) {
        if (!is_finite(x)) return false;
    }
    return true;
}

// Closed unit interval; NaN is rejected.
inline bool in_unit_interval(double p) noexcept {
    return p >= 0.0 && p <= 1.0;
}

inline std::string site_message(const char* func, const std::string& msg) {
    std::string out = (func && *func) ? func : "floodfreq";
    out += ": ";
    out += msg;
    return out;
}

} // namespace floodfreq

// Throws ERROR_TYPE("<function>: MSG") when COND is false.
#define FLOODFREQ_REQUIRE(cond, ERROR_TYPE, msg)                          \
  do {                                                                    \
    if (!(cond)) {                                                        \
      throw ERROR_TYPE(::floodfreq::site_message(__func__, (msg)));       \
    }                                                                     \
  } while (0)
