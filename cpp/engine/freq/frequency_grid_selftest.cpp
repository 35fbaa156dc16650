/*
===============================================================================
Frequency Analysis: Probability Limits + Grid Selftest
File: frequency_grid_selftest.cpp
===============================================================================
*/

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/freq/frequency_grid.hpp"

#include <cmath>
#include <vector>

using namespace floodfreq;
using namespace floodfreq::selftest;
using freq::ProbabilityLimits;
using freq::RecordSet;

static bool strictly_ascending(const std::vector<double>& v) {
  for (std::size_t i = 1; i < v.size(); ++i) {
    if (!(v[i] > v[i - 1])) return false;
  }
  return true;
}

static void test_limits() {
  // p = 0.25 .. 0.75 => both tails stop at 10%.
  const ProbabilityLimits a = freq::probability_limits(RecordSet({1.0, 2.0, 3.0}));
  expect_near(a.lo_pct, 10.0, "short record lower limit");
  expect_near(a.hi_pct, 90.0, "short record upper limit");

  // 21 records: p_first = 1/22 => 1%, 1 - p_last = 1/22 => 99%.
  std::vector<double> xs;
  for (int i = 1; i <= 21; ++i) xs.push_back(static_cast<double>(i));
  const ProbabilityLimits b = freq::probability_limits(RecordSet(xs));
  expect_near(b.lo_pct, 1.0, "21-record lower limit");
  expect_near(b.hi_pct, 99.0, "21-record upper limit");

  // Historical flood over 102 years: p_first = 1/103 => 0.1%.
  RecordSet h(xs);
  h.attach_historical({100.0}, 102);
  const ProbabilityLimits c = freq::probability_limits(h);
  expect_near(c.lo_pct, 0.1, "historical lower limit");
  expect_near(c.hi_pct, 99.0, "historical upper limit");

  RecordSet zero({1.0, 2.0, 3.0});
  zero.set_probability_at_rank(1, 0.0);
  expect_throws<ValidationError>([&] { (void)freq::probability_limits(zero); },
                                 "zero end probability rejected");
}

static void test_grid_shape() {
  const GridSettings gs;

  const std::vector<double> body = freq::probability_grid(ProbabilityLimits{10.0, 90.0}, gs);
  expect_true(body.size() == gs.body_points, "10..90 grid is the body only");
  expect_near(body.front(), 10.0, "body starts at 10%");
  expect_near(body.back(), 90.0, "body ends at 90%");
  expect_true(strictly_ascending(body), "body ascending");

  const std::vector<double> mid = freq::probability_grid(ProbabilityLimits{1.0, 99.0}, gs);
  expect_true(mid.size() == gs.body_points + 2 * (gs.lower_tail_points + gs.decade_points),
              "1..99 grid point count");
  expect_near(mid.front(), 1.0, "grid starts at lower limit");
  expect_near(mid.back(), 99.0, "grid ends at upper limit");
  expect_true(strictly_ascending(mid), "1..99 grid ascending without duplicates");

  const std::vector<double> wide = freq::probability_grid(ProbabilityLimits{0.01, 99.9}, gs);
  expect_near(wide.front(), 0.01, "wide grid lower limit");
  expect_near(wide.back(), 99.9, "wide grid upper limit");
  expect_true(strictly_ascending(wide), "wide grid ascending");
  expect_true(wide.size() == gs.body_points + 2 * (gs.lower_tail_points + gs.decade_points),
              "wide grid point count");
}

static void test_grid_validation() {
  expect_throws<ValidationError>([] { (void)freq::probability_grid(ProbabilityLimits{0.0, 99.0}); },
                                 "zero lower limit rejected");
  expect_throws<ValidationError>([] { (void)freq::probability_grid(ProbabilityLimits{20.0, 99.0}); },
                                 "lower limit above 10% rejected");
  expect_throws<ValidationError>([] { (void)freq::probability_grid(ProbabilityLimits{1.0, 100.0}); },
                                 "upper limit of 100% rejected");

  GridSettings bad;
  bad.body_points = 1;
  expect_throws<ValidationError>([&] { (void)freq::probability_grid(ProbabilityLimits{}, bad); },
                                 "single body point rejected");
}

static void test_sample_curve() {
  const freq::Pearson3Curve c(100.0, 1.0, 2.0);
  const freq::CurveSample s = freq::sample_curve(c, {1.0, 50.0, 150.0});

  expect_true(s.exceedance_pct.size() == 3 && s.value.size() == 3, "one sample per grid point");
  expect_near(s.value[0], 460.517019, "sample at 1%");
  expect_near(s.value[1], 69.314718, "sample at 50%");
  expect_nan(s.value[2], "out-of-range grid point kept as NaN");
}

int main() {
  set_log_level(LogLevel::OFF);

  test_limits();
  test_grid_shape();
  test_grid_validation();
  test_sample_curve();

  return finish("frequency_grid");
}
