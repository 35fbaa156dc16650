// ============================================================================
// Frequency Analysis: Pearson Type III Curve
// File: pearson3_curve.hpp
// ============================================================================
//
// Purpose:
// - P-III distribution parameterized by its moments (ex, cv, cs).
// - value <-> exceedance probability conversion:
//     value_from_prob(p) = (Q(1-p; cs) * cv + 1) * ex
//     prob_from_value(x) = 1 - F((x/ex - 1)/cv; cs)
//   where Q/F are the quantile/CDF of the standardized P-III variate
//   (zero mean, unit standard deviation, skewness cs).
//
// Standardized variate (skew g != 0):
//   alpha = 4/g^2, beta = 2/g, zeta = -2/g
//   X = zeta + G/beta,  G ~ Gamma(alpha, 1)
// For |g| < kNormalSkewTransition the variate is taken as standard normal.
//
// Notes:
// - Out-of-range probabilities return NaN (no throw): curves are evaluated
//   over dense grids where the odd bad sample is tolerable.
// - Special functions: Boost.Math, with a policy that maps domain/overflow
//   errors to NaN/inf instead of exceptions.
//
// ============================================================================

#pragma once

#include "moments.hpp"

namespace floodfreq::freq {

// Below this |skew| the P-III variate is evaluated as a normal variate.
inline constexpr double kNormalSkewTransition = 1.6e-5;

// Standardized P-III quantile for non-exceedance probability q.
double standard_pearson3_quantile(double q, double skew) noexcept;

// Standardized P-III CDF P(X <= x).
double standard_pearson3_cdf(double x, double skew) noexcept;

class Pearson3Curve final {
public:
    Pearson3Curve(double ex, double cv, double cs) noexcept : m_{ex, cv, cs} {}
    explicit Pearson3Curve(const Moments& m) noexcept : m_(m) {}

    double ex() const noexcept { return m_.ex; }
    double cv() const noexcept { return m_.cv; }
    double cs() const noexcept { return m_.cs; }
    const Moments& moments() const noexcept { return m_; }

    // Value exceeded with probability p. NaN if p is outside [0,1].
    double value_from_prob(double p) const noexcept;

    // Exceedance probability of value x.
    double prob_from_value(double x) const noexcept;

private:
    Moments m_;
};

} // namespace floodfreq::freq
