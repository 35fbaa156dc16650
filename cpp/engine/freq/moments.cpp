/*
===============================================================================
Frequency Analysis: P-III Moment Estimator
File: moments.cpp
===============================================================================
*/

#include "moments.hpp"

#include "engine/core/require.hpp"

#include <cmath>
#include <limits>
#include <numeric>
#include <vector>

namespace floodfreq::freq {

bool Moments::finite() const noexcept {
    return is_finite(ex) && is_finite(cv) && is_finite(cs);
}

double Moments::skew_ratio() const noexcept {
    if (cv == 0.0) return std::numeric_limits<double>::quiet_NaN();
    return cs / cv;
}

namespace {

struct CentralSums final {
    double s2 = 0.0;
    double s3 = 0.0;
};

double sum_of(const std::vector<double>& xs) {
    return std::accumulate(xs.begin(), xs.end(), 0.0);
}

CentralSums central_sums(const std::vector<double>& xs, double mean) {
    CentralSums c;
    for (double x : xs) {
        const double d = x - mean;
        c.s2 += d * d;
        c.s3 += d * d * d;
    }
    return c;
}

// Shared tail of both estimators once the weighted sums are known.
Moments moments_from_sums(double mean, double s2, double s3, double n) {
    FLOODFREQ_REQUIRE(is_finite(mean) && mean > 0.0, ArithmeticError,
                      "mean must be positive and finite");

    const double sd = std::sqrt(s2 / (n - 1.0));
    const double cv = sd / mean;
    FLOODFREQ_REQUIRE(is_finite(cv) && cv > 0.0, ArithmeticError,
                      "coefficient of variation is zero (all records equal)");

    const double cs = n * s3 / ((n - 1.0) * (n - 2.0) * std::pow(mean, 3) * std::pow(cv, 3));
    FLOODFREQ_REQUIRE(is_finite(cs), ArithmeticError, "skewness is not finite");

    return Moments{mean, cv, cs};
}

} // namespace

Moments estimate_moments(const RecordSet& records) {
    if (!records.has_extreme()) {
        const std::vector<double>& xs = records.values();
        FLOODFREQ_REQUIRE(xs.size() > 2, ArithmeticError,
                          "at least 3 records are required for the skewness");

        const double n = static_cast<double>(xs.size());
        const double mean = sum_of(xs) / n;
        const CentralSums c = central_sums(xs, mean);
        return moments_from_sums(mean, c.s2, c.s3, n);
    }

    const std::vector<double> extreme = records.extreme_values();
    const std::vector<double> ordinary = records.ordinary_values();
    FLOODFREQ_REQUIRE(!ordinary.empty(), ArithmeticError,
                      "ordinary partition is empty; the period weight is undefined");
    FLOODFREQ_REQUIRE(records.period_length() > 2, ArithmeticError,
                      "period length must exceed 2 for the skewness");

    const double N = static_cast<double>(records.period_length());
    const double r = (N - static_cast<double>(extreme.size())) / static_cast<double>(ordinary.size());

    const double mean = (sum_of(extreme) + r * sum_of(ordinary)) / N;
    const CentralSums ce = central_sums(extreme, mean);
    const CentralSums co = central_sums(ordinary, mean);

    return moments_from_sums(mean, ce.s2 + r * co.s2, ce.s3 + r * co.s3, N);
}

} // namespace floodfreq::freq
