// ============================================================================
// Frequency Analysis: Probability Axis Limits + Dense Evaluation Grid
// File: frequency_grid.hpp
// ============================================================================
//
// Purpose:
// - Everything a probability-paper plot needs from the engine, without any
//   rendering: axis limits (percent) that bracket the empirical points, and a
//   dense exceedance grid (percent) that is log-spaced in both tails and
//   linear in the body.
//
// Limits (percent, f a fraction):
//   lim(f) = 1                          if f > 1
//          = 10^(ceil(log10(100 f)) - 1) otherwise
//   lo = lim(p_first), hi = 100 - lim(1 - p_last)
//
// Grid (ascending percent):
//   lo < 1 : logspace(lo, 1, n_tail) ++ logspace(1, 10, n_decade)
//   lo >= 1: logspace(lo, 10, n_tail + n_decade)
//   ++ linspace(10, 90, n_body)
//   ++ mirrored upper tail built from 100 - hi
// Endpoints 1, 10 and 90 are excluded from the log segments (no duplicates).
//
// ============================================================================

#pragma once

#include "engine/core/settings.hpp"
#include "pearson3_curve.hpp"
#include "record_set.hpp"

#include <cstddef>
#include <vector>

namespace floodfreq::freq {

struct ProbabilityLimits final {
    double lo_pct = 0.1;
    double hi_pct = 99.9;
};

ProbabilityLimits probability_limits(const RecordSet& records);

std::vector<double> probability_grid(const ProbabilityLimits& limits,
                                     const GridSettings& settings = GridSettings());

struct CurveSample final {
    std::vector<double> exceedance_pct;
    std::vector<double> value;
};

// Evaluate a curve at each grid point (percent). NaN samples are kept.
CurveSample sample_curve(const Pearson3Curve& curve, const std::vector<double>& grid_pct);

} // namespace floodfreq::freq
