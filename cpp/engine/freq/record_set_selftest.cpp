/*
===============================================================================
Frequency Analysis: Record Set Selftest
File: record_set_selftest.cpp

Checks:
  - descending sort and partitioning with/without historical floods
  - Weibull plotting positions per partition
  - whole-vector and per-rank probability overrides (1-based and 0-based)
  - validation failures (empty data, bad period, bad extreme count, bad rank)
===============================================================================
*/

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/freq/record_set.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

using namespace floodfreq;
using namespace floodfreq::selftest;
using freq::RecordSet;

static void test_sort_and_plain_probabilities() {
  RecordSet rs({2.0, 3.0, 1.0});

  expect_vec_near(rs.values(), {3.0, 2.0, 1.0}, "values sorted descending");
  expect_vec_near(rs.observed(), {2.0, 3.0, 1.0}, "observed keeps input order");
  expect_true(!rs.has_extreme(), "no extreme partition without history");
  expect_true(rs.period_length() == 3, "period defaults to record count");
  expect_vec_near(rs.ordinary_probabilities(), {0.25, 0.5, 0.75}, "ordinary probabilities i/(n+1)");
  expect_true(rs.extreme_probabilities().empty(), "extreme probabilities empty");
  expect_vec_near(rs.empirical_probabilities(), {0.25, 0.5, 0.75}, "empirical equals ordinary");
}

static void test_historical_default_extreme_count() {
  RecordSet rs({1.0, 2.0, 3.0});
  rs.attach_historical({10.0}, 9);

  expect_vec_near(rs.values(), {10.0, 3.0, 2.0, 1.0}, "historical merged and sorted");
  expect_true(rs.extreme_count() == 1, "extreme count defaults to historical size");
  expect_vec_near(rs.extreme_values(), {10.0}, "extreme partition");
  expect_vec_near(rs.ordinary_values(), {3.0, 2.0, 1.0}, "ordinary partition");
  expect_vec_near(rs.extreme_probabilities(), {0.1}, "extreme probability i/(N+1)");
  expect_vec_near(rs.ordinary_probabilities(), {0.325, 0.55, 0.775},
                  "ordinary probabilities rescaled after last extreme");

  RecordSet six({1.0, 2.0, 3.0});
  six.attach_historical({6.0}, 6);
  expect_vec_near(six.values(), {6.0, 3.0, 2.0, 1.0}, "period 6: merged values");
  expect_vec_near(six.extreme_values(), {6.0}, "period 6: extreme");
  expect_vec_near(six.ordinary_values(), {3.0, 2.0, 1.0}, "period 6: ordinary");

  // Period exactly covering every record is accepted.
  RecordSet tight({1.0, 2.0, 3.0});
  expect_no_throw([&] { tight.attach_historical({6.0}, 4); }, "period equal to record count accepted");
  const std::vector<double> p = tight.empirical_probabilities();
  bool ok = true;
  for (std::size_t i = 0; i < p.size(); ++i) {
    ok = ok && p[i] > 0.0 && p[i] < 1.0 && (i == 0 || p[i] >= p[i - 1]);
  }
  expect_true(ok, "probabilities non-decreasing inside (0, 1)");

  // Extreme count equal to the historical count is accepted.
  RecordSet equal({1.0, 2.0, 3.0});
  expect_no_throw([&] { equal.attach_historical({6.0}, 6, 1); }, "extreme count equal to historical count accepted");
  expect_vec_near(equal.extreme_values(), {6.0}, "equal count keeps only the historical flood extreme");
}

static void test_historical_explicit_extreme_count() {
  RecordSet rs({1.0, 2.0, 3.0, 4.0});
  rs.attach_historical({10.0}, 9, 2);

  expect_vec_near(rs.extreme_values(), {10.0, 4.0}, "largest observed joins extremes");
  expect_vec_near(rs.empirical_probabilities(), {0.1, 0.2, 0.4, 0.6, 0.8},
                  "probabilities with two extremes");

  RecordSet rs2({1.0, 2.0, 3.0});
  rs2.attach_historical({6.0}, 6, 2);
  expect_vec_near(rs2.extreme_values(), {6.0, 3.0}, "extreme values with extreme_count 2");
  expect_vec_near(rs2.ordinary_values(), {2.0, 1.0}, "ordinary values with extreme_count 2");
}

static void test_reattach_replaces_history() {
  RecordSet rs({1.0, 2.0, 3.0});
  rs.attach_historical({10.0}, 9);
  rs.attach_historical({8.0, 9.0}, 20);

  expect_vec_near(rs.values(), {9.0, 8.0, 3.0, 2.0, 1.0}, "second batch replaces the first");
  expect_true(rs.extreme_count() == 2, "extreme count follows the new batch");
  expect_true(rs.period_length() == 20, "period follows the new batch");
}

static void test_rank_overrides() {
  RecordSet rs({1.0, 2.0, 3.0});

  rs.set_probability_at_rank(2, 0.4);
  expect_vec_near(rs.empirical_probabilities(), {0.25, 0.4, 0.75}, "1-based rank override");
  expect_true(rs.probabilities_overridden(), "override flagged");

  rs.set_probability_at_rank(0, 0.2, 0);
  expect_vec_near(rs.empirical_probabilities(), {0.2, 0.4, 0.75}, "0-based rank override keeps earlier edit");

  expect_throws<IndexError>([&] { rs.set_probability_at_rank(0, 0.2); }, "rank 0 rejected with start 1");
  expect_throws<IndexError>([&] { rs.set_probability_at_rank(4, 0.2); }, "rank past end rejected");
  expect_throws<IndexError>([&] { rs.set_probability_at_rank(3, 0.2, 0); }, "rank 3 rejected with start 0");
  expect_throws<ValidationError>([&] { rs.set_probability_at_rank(1, 2.0); }, "probability above 1 rejected");
  expect_throws<ValidationError>(
      [&] { rs.set_probability_at_rank(1, std::numeric_limits<double>::quiet_NaN()); },
      "NaN probability rejected");

  expect_vec_near(rs.empirical_probabilities(), {0.2, 0.4, 0.75}, "failed overrides leave state intact");

  rs.reset_probabilities();
  expect_true(!rs.probabilities_overridden(), "reset clears override");
  expect_vec_near(rs.empirical_probabilities(), {0.25, 0.5, 0.75}, "reset restores derived probabilities");
}

static void test_rank_override_with_history() {
  RecordSet rs({1.0, 2.0, 3.0});
  rs.attach_historical({10.0}, 9);
  rs.set_probability_at_rank(2, 0.4);
  expect_vec_near(rs.empirical_probabilities(), {0.1, 0.4, 0.55, 0.775}, "rank override across partitions");
  expect_vec_near(rs.extreme_probabilities(), {0.1}, "extreme slice of override");
  expect_vec_near(rs.ordinary_probabilities(), {0.4, 0.55, 0.775}, "ordinary slice of override");

  RecordSet rs2({1.0, 2.0, 3.0, 4.0});
  rs2.attach_historical({10.0}, 9, 2);
  rs2.set_probability_at_rank(1, 0.05);
  expect_vec_near(rs2.empirical_probabilities(), {0.05, 0.2, 0.4, 0.6, 0.8}, "first rank override");

  // Attaching again discards the override and says so.
  int warnings = 0;
  set_log_level(LogLevel::WARN);
  set_log_sink([&](LogLevel lvl, const std::string& component, const std::string&) {
    if (lvl == LogLevel::WARN && component == "RecordSet") ++warnings;
  });
  rs.attach_historical({10.0}, 9);
  set_log_sink(LogSink());
  set_log_level(LogLevel::OFF);

  expect_true(warnings == 1, "discarded override logged once");
  expect_true(!rs.probabilities_overridden(), "attach discards override");
  expect_vec_near(rs.empirical_probabilities(), {0.1, 0.325, 0.55, 0.775}, "derived after re-attach");
}

static void test_whole_vector_override() {
  RecordSet rs({5.0, 4.0, 3.0});
  rs.set_probabilities({0.1, 0.5, 0.9});
  expect_vec_near(rs.empirical_probabilities(), {0.1, 0.5, 0.9}, "vector override");

  expect_throws<ValidationError>([&] { rs.set_probabilities({0.1, 0.5}); }, "length mismatch rejected");
  expect_throws<ValidationError>([&] { rs.set_probabilities({0.1, -0.5, 0.9}); }, "negative probability rejected");
  expect_vec_near(rs.empirical_probabilities(), {0.1, 0.5, 0.9}, "rejected vector leaves override");
}

static void test_error_messages() {
  RecordSet rs({1.0, 2.0, 3.0});

  std::string rank_msg;
  try {
    rs.set_probability_at_rank(0, 0.2);
  } catch (const IndexError& e) {
    rank_msg = e.what();
  }
  expect_true(rank_msg == "set_probability_at_rank: rank 0 outside [1, 3]", "rank error names site and range");

  std::string period_msg;
  try {
    rs.attach_historical({6.0}, 3);
  } catch (const ValidationError& e) {
    period_msg = e.what();
  }
  expect_true(period_msg == "attach_historical: period length 3 is less than observed + historical record count 4",
              "period error names site and counts");

  std::string size_msg;
  try {
    rs.set_probabilities({0.5});
  } catch (const ValidationError& e) {
    size_msg = e.what();
  }
  expect_true(size_msg == "set_probabilities: expected 3 probabilities, got 1", "length error names site and sizes");
}

static void test_validation() {
  expect_throws<ValidationError>([] { RecordSet rs(std::vector<double>{}); }, "empty data rejected");
  expect_throws<ValidationError>(
      [] { RecordSet rs({1.0, std::numeric_limits<double>::infinity()}); }, "non-finite data rejected");

  RecordSet rs({1.0, 2.0, 3.0});
  expect_throws<ValidationError>([&] { rs.attach_historical({6.0}, 3); }, "period shorter than records rejected");
  expect_throws<ValidationError>([&] { rs.attach_historical({4.0, 5.0, 6.0}, 6, 2); },
                                 "extreme count below historical count rejected");
  expect_throws<ValidationError>([&] { rs.attach_historical({6.0}, 10, 5); },
                                 "extreme count above record count rejected");
  expect_throws<ValidationError>(
      [&] { rs.attach_historical({std::numeric_limits<double>::quiet_NaN()}, 10); },
      "non-finite historical rejected");

  expect_true(!rs.has_extreme(), "failed attach leaves record set unchanged");
  expect_vec_near(rs.values(), {3.0, 2.0, 1.0}, "values unchanged after failed attach");
}

int main() {
  set_log_level(LogLevel::OFF);

  test_sort_and_plain_probabilities();
  test_historical_default_extreme_count();
  test_historical_explicit_extreme_count();
  test_reattach_replaces_history();
  test_rank_overrides();
  test_rank_override_with_history();
  test_whole_vector_override();
  test_error_messages();
  test_validation();

  return finish("record_set");
}
