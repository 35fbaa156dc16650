/*
===============================================================================
Frequency Analysis: Moment Estimator Selftest
File: moments_selftest.cpp

Reference values computed by hand (exact rational arithmetic) from the
estimator formulas in moments.hpp.
===============================================================================
*/

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/freq/moments.hpp"
#include "engine/freq/record_set.hpp"

#include <cmath>

using namespace floodfreq;
using namespace floodfreq::selftest;
using freq::Moments;
using freq::RecordSet;

static void test_plain_sequence() {
  // mean 4, s2 = 50, s3 = 162
  RecordSet rs({1.0, 2.0, 3.0, 4.0, 10.0});
  const Moments m = freq::estimate_moments(rs);

  expect_near(m.ex, 4.0, "plain ex");
  expect_near(m.cv, 0.8838834764831844, "plain cv");
  expect_near(m.cs, 1.6970562748477143, "plain cs (bias-corrected)");
  expect_near(m.skew_ratio(), 1.6970562748477143 / 0.8838834764831844, "skew ratio cs/cv");
  expect_true(m.finite(), "plain moments finite");
}

static void test_weighted_with_history() {
  // extreme {10, 4}, ordinary {3, 2, 1}, N = 9 => r = 7/3, ex = 28/9
  RecordSet rs({1.0, 2.0, 3.0, 4.0});
  rs.attach_historical({10.0}, 9, 2);
  const Moments m = freq::estimate_moments(rs);

  expect_near(m.ex, 28.0 / 9.0, "weighted ex");
  expect_near(m.cv, 0.8916062666299949, "weighted cv");
  expect_near(m.cs, 2.2775590488534845, "weighted cs");
}

static void test_weighted_reduces_to_plain() {
  // Extreme count 1 with the period equal to the record count: r = 1, N = n.
  RecordSet plain({1.0, 2.0, 3.0, 4.0, 10.0});
  RecordSet weighted({1.0, 2.0, 3.0, 4.0});
  weighted.attach_historical({10.0}, 5);

  const Moments a = freq::estimate_moments(plain);
  const Moments b = freq::estimate_moments(weighted);
  expect_near(b.ex, a.ex, "r = 1 ex matches plain", 1e-10);
  expect_near(b.cv, a.cv, "r = 1 cv matches plain", 1e-10);
  expect_near(b.cs, a.cs, "r = 1 cs matches plain", 1e-10);
}

static void test_order_invariance() {
  const Moments a = freq::estimate_moments(RecordSet({5.0, 1.0, 9.0, 2.0}));
  const Moments b = freq::estimate_moments(RecordSet({9.0, 5.0, 2.0, 1.0}));
  expect_near(a.cs, b.cs, "input order does not matter", 1e-10);
}

static void test_degenerate_inputs() {
  expect_throws<ArithmeticError>([] { (void)freq::estimate_moments(RecordSet({1.0, 2.0})); },
                                 "two records cannot give a skewness");
  expect_throws<ArithmeticError>([] { (void)freq::estimate_moments(RecordSet({5.0, 5.0, 5.0})); },
                                 "equal records give zero cv");
  expect_throws<ArithmeticError>([] { (void)freq::estimate_moments(RecordSet({-1.0, -2.0, -3.0})); },
                                 "non-positive mean rejected");

  RecordSet all_extreme({1.0, 2.0});
  all_extreme.attach_historical({3.0}, 10, 3);
  expect_throws<ArithmeticError>([&] { (void)freq::estimate_moments(all_extreme); },
                                 "empty ordinary partition rejected");

  const Moments zero_cv{1.0, 0.0, 0.5};
  expect_true(std::isnan(zero_cv.skew_ratio()), "skew ratio NaN when cv is zero");
}

int main() {
  set_log_level(LogLevel::OFF);

  test_plain_sequence();
  test_weighted_with_history();
  test_weighted_reduces_to_plain();
  test_order_invariance();
  test_degenerate_inputs();

  return finish("moments");
}
