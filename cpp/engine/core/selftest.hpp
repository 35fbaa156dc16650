#pragma once
/*
  Core: Selftest Helpers

  Framework-free expectations shared by the *_selftest executables.
  Each failed expectation is counted and printed; a selftest main returns
  finish() so a non-zero exit code marks the failure for CTest.
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace floodfreq::selftest {

inline int& fail_count() {
  static int n = 0;
  return n;
}

inline void fail(std::string_view msg) {
  ++fail_count();
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

// Relative-or-absolute closeness (pytest.approx style defaults).
inline bool near(double a, double b, double rel = 1e-6, double abs = 1e-12) noexcept {
  const double da = std::fabs(a - b);
  if (da <= abs) return true;
  const double sc = std::max(std::fabs(a), std::fabs(b));
  return da <= rel * sc;
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

inline void expect_near(double got, double exp, std::string_view msg, double rel = 1e-6) {
  if (!near(got, exp, rel)) {
    fail(msg);
    std::cerr << "  expected " << exp << ", got " << got << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_nan(double v, std::string_view msg) {
  if (!std::isnan(v)) {
    fail(msg);
    std::cerr << "  expected NaN, got " << v << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_vec_near(const std::vector<double>& got,
                            const std::vector<double>& exp,
                            std::string_view msg,
                            double rel = 1e-6) {
  bool ok = got.size() == exp.size();
  for (std::size_t i = 0; ok && i < got.size(); ++i) {
    ok = near(got[i], exp[i], rel);
  }
  if (!ok) {
    fail(msg);
    std::cerr << "  expected [";
    for (double x : exp) std::cerr << " " << x;
    std::cerr << " ], got [";
    for (double x : got) std::cerr << " " << x;
    std::cerr << " ]\n";
  } else {
    pass(msg);
  }
}

// Passes when fn throws exactly an E (or subclass).
template <typename E, typename Fn>
void expect_throws(Fn&& fn, std::string_view msg) {
  try {
    fn();
  } catch (const E&) {
    pass(msg);
    return;
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  wrong exception: " << e.what() << "\n";
    return;
  }
  fail(msg);
  std::cerr << "  no exception thrown\n";
}

template <typename Fn>
void expect_no_throw(Fn&& fn, std::string_view msg) {
  try {
    fn();
    pass(msg);
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  threw: " << e.what() << "\n";
  }
}

inline int finish(std::string_view suite) {
  if (fail_count() != 0) {
    std::cerr << "\n" << suite << " failures: " << fail_count() << "\n";
    return 1;
  }
  std::cerr << "\nAll " << suite << " selftests passed.\n";
  return 0;
}

}  // namespace floodfreq::selftest
