/*
===============================================================================
Frequency Analysis: Probability Axis Limits + Dense Evaluation Grid
File: frequency_grid.cpp
===============================================================================
*/

#include "frequency_grid.hpp"

#include "engine/core/require.hpp"

#include <algorithm>
#include <cmath>

namespace floodfreq::freq {

namespace {

// Percent limit bracketing a tail probability f (fraction).
double tail_limit_pct(double f) {
    if (f > 1.0) return 1.0;
    return std::pow(10.0, std::ceil(std::log10(f * 100.0)) - 1.0);
}

// n points from a to b (percent), log-spaced, b excluded.
void append_logspace(std::vector<double>& out, double a, double b, std::size_t n) {
    const double la = std::log10(a);
    const double lb = std::log10(b);
    for (std::size_t k = 0; k < n; ++k) {
        out.push_back(std::pow(10.0, la + (lb - la) * static_cast<double>(k) / static_cast<double>(n)));
    }
}

// Tail segment from lim up to (not including) 10 percent.
std::vector<double> tail_space(double lim, const GridSettings& s) {
    std::vector<double> out;
    if (lim < 1.0) {
        append_logspace(out, lim, 1.0, s.lower_tail_points);
        append_logspace(out, 1.0, 10.0, s.decade_points);
    } else if (lim < 10.0) {
        append_logspace(out, lim, 10.0, s.lower_tail_points + s.decade_points);
    }
    return out;
}

} // namespace

ProbabilityLimits probability_limits(const RecordSet& records) {
    const std::vector<double> p = records.empirical_probabilities();
    const double first = p.front();
    const double last = p.back();
    FLOODFREQ_REQUIRE(first > 0.0 && first < 1.0, ValidationError,
                      "first empirical probability must lie in (0, 1)");
    FLOODFREQ_REQUIRE(last > 0.0 && last < 1.0, ValidationError,
                      "last empirical probability must lie in (0, 1)");

    ProbabilityLimits lim;
    lim.lo_pct = tail_limit_pct(first);
    lim.hi_pct = 100.0 - tail_limit_pct(1.0 - last);
    return lim;
}

std::vector<double> probability_grid(const ProbabilityLimits& limits, const GridSettings& settings) {
    settings.validate_or_throw();
    FLOODFREQ_REQUIRE(is_finite(limits.lo_pct) && limits.lo_pct > 0.0 && limits.lo_pct <= 10.0,
                      ValidationError, "lower limit must lie in (0, 10] percent");
    FLOODFREQ_REQUIRE(is_finite(limits.hi_pct) && limits.hi_pct >= 90.0 && limits.hi_pct < 100.0,
                      ValidationError, "upper limit must lie in [90, 100) percent");

    std::vector<double> grid = tail_space(limits.lo_pct, settings);

    const std::size_t nb = settings.body_points;
    for (std::size_t k = 0; k < nb; ++k) {
        grid.push_back(10.0 + 80.0 * static_cast<double>(k) / static_cast<double>(nb - 1));
    }

    std::vector<double> upper = tail_space(100.0 - limits.hi_pct, settings);
    std::reverse(upper.begin(), upper.end());
    for (double u : upper) grid.push_back(100.0 - u);

    return grid;
}

CurveSample sample_curve(const Pearson3Curve& curve, const std::vector<double>& grid_pct) {
    CurveSample s;
    s.exceedance_pct = grid_pct;
    s.value.reserve(grid_pct.size());
    for (double pct : grid_pct) {
        s.value.push_back(curve.value_from_prob(pct / 100.0));
    }
    return s;
}

} // namespace floodfreq::freq
