/*
===============================================================================
Frequency Analysis: Pearson Type III Curve Selftest
File: pearson3_curve_selftest.cpp

Checks:
  - skew 2 reduces to a shifted exponential (closed-form references)
  - value <-> probability round trips for positive, negative, ~zero skew
  - support bounds, endpoint probabilities, NaN outside [0,1]
  - mirror symmetry between +g and -g
===============================================================================
*/

#include "engine/core/selftest.hpp"
#include "engine/freq/pearson3_curve.hpp"

#include <cmath>
#include <limits>

using namespace floodfreq;
using namespace floodfreq::selftest;
using freq::Pearson3Curve;

static void test_exponential_case() {
  // cs = 2: X = G - 1 with G ~ Exp(1), so value = ex * (1 + cv * (G - 1)).
  const Pearson3Curve c(100.0, 1.0, 2.0);

  expect_near(c.value_from_prob(0.01), 460.517019, "P=1% design value");
  expect_near(c.value_from_prob(0.5), 69.314718, "median");
  expect_near(c.value_from_prob(0.99), 1.005034, "P=99% value");

  expect_near(c.prob_from_value(50.0), 0.60653066, "exceedance of 50");
  expect_near(c.prob_from_value(100.0), 0.36787944, "exceedance of the mean");
  expect_near(c.prob_from_value(200.0), 0.13533528, "exceedance of 200");
}

static void test_out_of_range_probabilities() {
  const Pearson3Curve c(100.0, 1.0, 2.0);
  expect_nan(c.value_from_prob(2.0), "p > 1 gives NaN");
  expect_nan(c.value_from_prob(-0.1), "p < 0 gives NaN");
  expect_nan(c.value_from_prob(std::numeric_limits<double>::quiet_NaN()), "NaN p gives NaN");

  expect_true(std::isinf(c.value_from_prob(0.0)) && c.value_from_prob(0.0) > 0.0,
              "p = 0 is unbounded above for positive skew");
  expect_near(c.value_from_prob(1.0), 0.0, "p = 1 hits the lower support bound");
}

static void test_support_bounds() {
  // Positive skew: lower bound ex * (1 - 2 cv / cs) = 0.
  const Pearson3Curve pos(100.0, 1.0, 2.0);
  expect_near(pos.prob_from_value(-10.0), 1.0, "below lower bound always exceeded");

  // Negative skew: upper bound ex * (1 - 2 cv / cs) = 200.
  const Pearson3Curve neg(100.0, 0.5, -1.0);
  expect_near(neg.prob_from_value(500.0), 0.0, "above upper bound never exceeded");
  expect_near(neg.value_from_prob(0.0), 200.0, "p = 0 hits the upper support bound");
}

static void test_round_trips() {
  const double probs[] = {0.001, 0.01, 0.1, 0.5, 0.9, 0.99};
  const Pearson3Curve curves[] = {
      Pearson3Curve(100.0, 0.5, 1.0),
      Pearson3Curve(1000.0, 0.3, -0.5),
      Pearson3Curve(50.0, 0.2, 1e-6),
      Pearson3Curve(800.0, 0.6, 3.5),
  };

  for (const auto& c : curves) {
    bool ok = true;
    for (double p : probs) {
      const double x = c.value_from_prob(p);
      ok = ok && near(c.prob_from_value(x), p, 1e-7);
    }
    expect_true(ok, "prob -> value -> prob round trip");
  }
}

static void test_monotone() {
  const Pearson3Curve c(1000.0, 0.3, -0.5);
  bool ok = true;
  double prev = c.value_from_prob(0.001);
  for (int i = 2; i <= 999; ++i) {
    const double v = c.value_from_prob(static_cast<double>(i) / 1000.0);
    ok = ok && v < prev;
    prev = v;
  }
  expect_true(ok, "values strictly decrease as exceedance grows");
}

static void test_normal_limit() {
  // |cs| below the transition is the normal distribution.
  const Pearson3Curve c(100.0, 0.2, 1e-6);
  expect_near(c.value_from_prob(0.5), 100.0, "normal median equals mean");
  expect_near(c.value_from_prob(0.05), 100.0 * (1.0 + 0.2 * 1.6448536269514722), "normal P=5%");

  // Both sides of the transition agree closely.
  const double below = freq::standard_pearson3_quantile(0.99, 0.9 * freq::kNormalSkewTransition);
  const double above = freq::standard_pearson3_quantile(0.99, 1.1 * freq::kNormalSkewTransition);
  expect_near(below, above, "quantile continuous across the normal transition", 1e-4);
}

static void test_mirror_symmetry() {
  bool ok = true;
  const double qs[] = {0.01, 0.2, 0.5, 0.8, 0.99};
  for (double q : qs) {
    const double a = freq::standard_pearson3_quantile(q, -0.8);
    const double b = freq::standard_pearson3_quantile(1.0 - q, 0.8);
    ok = ok && near(a, -b, 1e-9, 1e-12);
  }
  expect_true(ok, "Q(q, -g) == -Q(1 - q, g)");

  expect_near(freq::standard_pearson3_cdf(0.3, -0.8),
              1.0 - freq::standard_pearson3_cdf(-0.3, 0.8), "F(x, -g) == 1 - F(-x, g)", 1e-9);
}

int main() {
  test_exponential_case();
  test_out_of_range_probabilities();
  test_support_bounds();
  test_round_trips();
  test_monotone();
  test_normal_limit();
  test_mirror_symmetry();

  return finish("pearson3_curve");
}
