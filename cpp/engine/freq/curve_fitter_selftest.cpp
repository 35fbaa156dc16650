/*
===============================================================================
Frequency Analysis: Curve Fitter Selftest
File: curve_fitter_selftest.cpp

Checks:
  - exact recovery when records lie on a known P-III curve
  - each fit mode keeps its fixed/tied parameters
  - refinement never worsens the moment-based residual (textbook records)
  - solver failures surface as FitError with the solver status
===============================================================================
*/

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/freq/curve_fitter.hpp"

#include <unsupported/Eigen/NonLinearOptimization>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace floodfreq;
using namespace floodfreq::selftest;
using freq::FitResult;
using freq::Moments;
using freq::Pearson3Curve;
using freq::RecordSet;

// Records placed exactly on `truth` at their own plotting positions.
static RecordSet records_on_curve(const Pearson3Curve& truth, int n) {
  std::vector<double> xs;
  for (int i = 0; i < n; ++i) {
    xs.push_back(truth.value_from_prob(static_cast<double>(i + 1) / static_cast<double>(n + 1)));
  }
  return RecordSet(xs);
}

static RecordSet textbook_historical() {
  RecordSet rs({1400, 1210, 960, 920, 890, 880, 790, 784, 670, 650,
                638, 590, 520, 510, 480, 470, 462, 440, 386, 368,
                346, 322, 300, 288, 262, 240, 220, 200, 186, 160});
  rs.attach_historical({2520, 2200}, 102);
  return rs;
}

static void test_recovers_known_curve() {
  const Pearson3Curve truth(100.0, 0.5, 1.0);
  const RecordSet rs = records_on_curve(truth, 20);

  expect_near(freq::sum_squared_residuals(rs, truth), 0.0, "true curve has zero residual");

  const FitResult r = freq::fit_moments(rs);
  expect_true(r.mode == FitMode::MeanCvCs, "default mode fits all three");
  expect_near(r.fitted.ex, 100.0, "recovered ex", 1e-4);
  expect_near(r.fitted.cv, 0.5, "recovered cv", 1e-4);
  expect_near(r.fitted.cs, 1.0, "recovered cs", 1e-4);
  expect_true(r.residual_norm < 1e-3, "recovered residual near zero");
  expect_true(r.function_evals > 0, "function evaluations reported");
  expect_true(r.solver_status >= 1 && r.solver_status <= 4, "converged status");

  const Pearson3Curve c = freq::fit_curve(rs);
  expect_near(c.cs(), r.fitted.cs, "fit_curve matches fit_moments", 1e-12);
}

static void test_fixed_mean() {
  const RecordSet rs = records_on_curve(Pearson3Curve(100.0, 0.5, 1.0), 20);
  const Moments start = freq::estimate_moments(rs);

  FitSettings s;
  s.fit_mean = false;
  const FitResult r = freq::fit_moments(rs, s);
  expect_true(r.mode == FitMode::CvCs, "fixed mean selects CvCs");
  expect_true(r.fitted.ex == start.ex, "mean untouched by the fit");
  expect_true(r.initial.ex == start.ex, "initial defaults to moment estimate");
}

static void test_tied_skew() {
  const RecordSet rs = textbook_historical();

  FitSettings s;
  s.skew_ratio = 3.0;
  const FitResult tied = freq::fit_moments(rs, s);
  expect_true(tied.mode == FitMode::MeanCv, "ratio selects MeanCv");
  expect_near(tied.fitted.cs, 3.0 * tied.fitted.cv, "cs tied to cv", 1e-12);

  s.fit_mean = false;
  const FitResult cv_only = freq::fit_moments(rs, s);
  expect_true(cv_only.mode == FitMode::Cv, "ratio + fixed mean selects Cv");
  expect_true(cv_only.fitted.ex == cv_only.initial.ex, "Cv mode keeps the mean");
  expect_near(cv_only.fitted.cs, 3.0 * cv_only.fitted.cv, "Cv mode ties cs", 1e-12);
}

static void test_refinement_improves_moment_fit() {
  const RecordSet rs = textbook_historical();
  const Moments start = freq::estimate_moments(rs);
  const FitResult r = freq::fit_moments(rs, FitSettings(), start);

  const double ssr_start = freq::sum_squared_residuals(rs, Pearson3Curve(start));
  const double ssr_fit = freq::sum_squared_residuals(rs, r.curve());
  expect_true(ssr_fit <= ssr_start, "fitted residual no worse than moment-based");
  expect_near(r.residual_norm, std::sqrt(ssr_fit), "residual norm is sqrt of SSR");
  expect_true(r.initial.ex == start.ex && r.initial.cs == start.cs, "explicit initial kept");
}

static void test_failures() {
  // Probability 0 sends the first quantile to infinity.
  RecordSet inf_rs = records_on_curve(Pearson3Curve(100.0, 0.5, 1.0), 10);
  inf_rs.set_probability_at_rank(1, 0.0);
  bool got_status = false;
  try {
    (void)freq::fit_moments(inf_rs);
    fail("infinite residual should throw FitError");
  } catch (const FitError& e) {
    got_status = e.status() == static_cast<int>(Eigen::LevenbergMarquardtSpace::UserAsked);
    pass("infinite residual throws FitError");
  } catch (const std::exception& e) {
    fail(std::string("infinite residual threw the wrong error: ") + e.what());
  }
  expect_true(got_status, "FitError carries UserAsked status");

  // Two points cannot determine three parameters.
  RecordSet two({5.0, 3.0});
  expect_throws<FitError>([&] { (void)freq::fit_moments(two, FitSettings(), Moments{4.0, 0.3, 0.5}); },
                          "fewer points than parameters throws FitError");

  // Evaluation budget too small to converge.
  FitSettings tight;
  tight.solver.max_function_evals = 1;
  expect_throws<FitError>([&] { (void)freq::fit_moments(textbook_historical(), tight); },
                          "exhausted evaluation budget throws FitError");

  FitSettings bad;
  bad.skew_ratio = std::numeric_limits<double>::quiet_NaN();
  expect_throws<ValidationError>([&] { (void)freq::fit_moments(textbook_historical(), bad); },
                                 "non-finite skew ratio rejected");

  const Moments nan_start{std::numeric_limits<double>::quiet_NaN(), 0.3, 0.5};
  expect_throws<ValidationError>([&] { (void)freq::fit_moments(textbook_historical(), FitSettings(), nan_start); },
                                 "non-finite initial moments rejected");
}

static void test_status_text() {
  expect_true(std::string(freq::solver_status_text(
                  static_cast<int>(Eigen::LevenbergMarquardtSpace::UserAsked))) ==
                  "residuals became non-finite",
              "UserAsked status text");
  expect_true(std::string(freq::solver_status_text(-42)) == "unknown solver status",
              "unknown status text");
}

int main() {
  set_log_level(LogLevel::OFF);

  test_recovers_known_curve();
  test_fixed_mean();
  test_tied_skew();
  test_refinement_improves_moment_fit();
  test_failures();
  test_status_text();

  return finish("curve_fitter");
}
