// ============================================================================
// Frequency Analysis: P-III Moment Estimator
// File: moments.hpp
// ============================================================================
//
// Product-moment estimates (ex, cv, cs) of a record set.
//
// Without extreme records (n = record count, d = x - ex):
//   ex = sum(x)/n
//   cv = sqrt(sum(d^2)/(n-1)) / ex
//   cs = n*sum(d^3) / ((n-1)(n-2) * ex^3 * cv^3)
//
// With extreme records (N = period length, a = extreme, l = ordinary):
//   r  = (N - a) / l
//   ex = (sum_a(x) + r*sum_l(x)) / N
//   cv = sqrt((sum_a(d^2) + r*sum_l(d^2)) / (N-1)) / ex
//   cs = N*(sum_a(d^3) + r*sum_l(d^3)) / ((N-1)(N-2) * ex^3 * cv^3)
//
// Degenerate inputs throw ArithmeticError rather than returning NaN/Inf.
//
// ============================================================================

#pragma once

#include "record_set.hpp"

namespace floodfreq::freq {

struct Moments final {
    double ex = 0.0;  // mean
    double cv = 0.0;  // coefficient of variation
    double cs = 0.0;  // coefficient of skewness

    bool finite() const noexcept;

    // cs / cv; NaN when cv == 0.
    double skew_ratio() const noexcept;
};

Moments estimate_moments(const RecordSet& records);

} // namespace floodfreq::freq
