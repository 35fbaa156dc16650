/*
===============================================================================
Frequency Analysis: Pearson Type III Curve
File: pearson3_curve.cpp
===============================================================================
*/

#include "pearson3_curve.hpp"

#include "engine/core/require.hpp"

#include <boost/math/distributions/normal.hpp>
#include <boost/math/policies/policy.hpp>
#include <boost/math/special_functions/gamma.hpp>

#include <cmath>
#include <limits>

namespace floodfreq::freq {

namespace {

namespace bmp = boost::math::policies;

// NaN / inf on bad input instead of exceptions.
using QuietPolicy = bmp::policy<bmp::domain_error<bmp::ignore_error>,
                                bmp::overflow_error<bmp::ignore_error>,
                                bmp::evaluation_error<bmp::ignore_error>>;

using QuietNormal = boost::math::normal_distribution<double, QuietPolicy>;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();

bool near_normal(double skew) noexcept {
    return std::fabs(skew) < kNormalSkewTransition;
}

} // namespace

double standard_pearson3_quantile(double q, double skew) noexcept {
    if (!in_unit_interval(q) || std::isnan(skew)) return kNaN;

    if (near_normal(skew)) {
        if (q == 0.0) return -kInf;
        if (q == 1.0) return kInf;
        return boost::math::quantile(QuietNormal(), q);
    }

    const double alpha = 4.0 / (skew * skew);
    const double beta = 2.0 / skew;
    const double zeta = -2.0 / skew;

    // Negative skew mirrors the gamma variate.
    const double qg = (skew < 0.0) ? 1.0 - q : q;
    if (qg == 1.0) return (skew > 0.0) ? kInf : -kInf;

    const double g = boost::math::gamma_p_inv(alpha, qg, QuietPolicy());
    return g / beta + zeta;
}

double standard_pearson3_cdf(double x, double skew) noexcept {
    if (std::isnan(x) || std::isnan(skew)) return kNaN;

    if (near_normal(skew)) {
        if (x == kInf) return 1.0;
        if (x == -kInf) return 0.0;
        return boost::math::cdf(QuietNormal(), x);
    }

    const double alpha = 4.0 / (skew * skew);
    const double beta = 2.0 / skew;
    const double zeta = -2.0 / skew;

    // Gamma argument; outside the support it is clamped to the bound.
    const double t = beta * (x - zeta);
    if (!(t > 0.0)) return (skew > 0.0) ? 0.0 : 1.0;
    if (t == kInf) return (skew > 0.0) ? 1.0 : 0.0;

    return (skew > 0.0) ? boost::math::gamma_p(alpha, t, QuietPolicy())
                        : boost::math::gamma_q(alpha, t, QuietPolicy());
}

double Pearson3Curve::value_from_prob(double p) const noexcept {
    if (!in_unit_interval(p)) return kNaN;
    const double k = standard_pearson3_quantile(1.0 - p, m_.cs);
    return (k * m_.cv + 1.0) * m_.ex;
}

double Pearson3Curve::prob_from_value(double x) const noexcept {
    const double z = (x / m_.ex - 1.0) / m_.cv;
    return 1.0 - standard_pearson3_cdf(z, m_.cs);
}

} // namespace floodfreq::freq
