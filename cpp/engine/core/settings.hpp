#pragma once
/*
================================================================================
Core: Analysis Settings
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every knob that changes a frequency-analysis result (which
    moments are fitted, the skew/variation ratio, solver budget, plotting
    grid density) into validated plain structs.
  - Same inputs + same settings => same numbers.

Hardening:
  - validate_or_throw() rejects nonsensical values before any computation.
  - Defaults reproduce MINPACK lmdif / curve_fit defaults.
================================================================================
*/

#include <cmath>
#include <cstddef>
#include <optional>

#include "engine/core/errors.hpp"

namespace floodfreq {

// ----------------------------- Fit mode --------------------------------------
// Which parameters the least-squares refinement is free to move.
enum class FitMode : int {
  MeanCvCs = 0,  // ex, cv, cs all free
  CvCs     = 1,  // ex fixed at the initial guess
  MeanCv   = 2,  // cs = cv * skew_ratio
  Cv       = 3   // ex fixed, cs = cv * skew_ratio
};

inline const char* to_string(FitMode m) noexcept {
  switch (m) {
    case FitMode::MeanCvCs: return "MeanCvCs";
    case FitMode::CvCs:     return "CvCs";
    case FitMode::MeanCv:   return "MeanCv";
    case FitMode::Cv:       return "Cv";
    default:                return "Unknown";
  }
}

inline int free_parameter_count(FitMode m) noexcept {
  switch (m) {
    case FitMode::MeanCvCs: return 3;
    case FitMode::CvCs:     return 2;
    case FitMode::MeanCv:   return 2;
    case FitMode::Cv:       return 1;
    default:                return 0;
  }
}

// ----------------------------- Solver ----------------------------------------
struct SolverSettings {
  // Max residual evaluations. 0 => MINPACK default 200 * (free + 1).
  int max_function_evals = 0;

  // Relative reduction tolerance of the sum of squares.
  double ftol = 1.49012e-8;

  // Relative change tolerance of the parameters.
  double xtol = 1.49012e-8;

  // Orthogonality tolerance between residuals and Jacobian columns.
  double gtol = 0.0;

  // Forward-difference step control (0 => machine epsilon).
  double epsfcn = 0.0;

  // Initial step bound factor.
  double step_bound_factor = 100.0;

  void validate_or_throw() const {
    if (max_function_evals < 0 || max_function_evals > 10000000) {
      throw ValidationError("SolverSettings: max_function_evals outside sane bounds");
    }
    if (!(ftol >= 0.0) || ftol > 1e-1) {
      throw ValidationError("SolverSettings: ftol outside sane bounds");
    }
    if (!(xtol >= 0.0) || xtol > 1e-1) {
      throw ValidationError("SolverSettings: xtol outside sane bounds");
    }
    if (!(gtol >= 0.0) || gtol > 1.0) {
      throw ValidationError("SolverSettings: gtol outside sane bounds");
    }
    if (!(epsfcn >= 0.0) || epsfcn > 1e-2) {
      throw ValidationError("SolverSettings: epsfcn outside sane bounds");
    }
    if (!(step_bound_factor > 0.0) || step_bound_factor > 1e4) {
      throw ValidationError("SolverSettings: step_bound_factor outside sane bounds");
    }
  }

  int effective_max_function_evals(int free_params) const noexcept {
    return max_function_evals > 0 ? max_function_evals : 200 * (free_params + 1);
  }
};

// ----------------------------- Fit -------------------------------------------
struct FitSettings {
  // Fit the mean; false keeps ex at the initial guess.
  bool fit_mean = true;

  // When set, cs is tied to cv (cs = cv * skew_ratio) instead of fitted.
  std::optional<double> skew_ratio;

  SolverSettings solver;

  void validate_or_throw() const {
    if (skew_ratio && !std::isfinite(*skew_ratio)) {
      throw ValidationError("FitSettings: skew_ratio must be finite");
    }
    solver.validate_or_throw();
  }

  FitMode mode() const noexcept {
    if (skew_ratio) return fit_mean ? FitMode::MeanCv : FitMode::Cv;
    return fit_mean ? FitMode::MeanCvCs : FitMode::CvCs;
  }
};

// ----------------------------- Grid ------------------------------------------
// Dense exceedance-probability grid (percent) for evaluating curves.
struct GridSettings {
  std::size_t lower_tail_points = 200;  // lo% .. 1%
  std::size_t decade_points = 150;      // 1% .. 10%
  std::size_t body_points = 300;        // 10% .. 90%

  void validate_or_throw() const {
    if (lower_tail_points < 1 || lower_tail_points > 100000) {
      throw ValidationError("GridSettings: lower_tail_points outside sane bounds");
    }
    if (decade_points < 1 || decade_points > 100000) {
      throw ValidationError("GridSettings: decade_points outside sane bounds");
    }
    if (body_points < 2 || body_points > 100000) {
      throw ValidationError("GridSettings: body_points outside sane bounds");
    }
  }
};

// ----------------------------- AnalysisSettings ------------------------------
struct AnalysisSettings {
  FitSettings fit;
  GridSettings grid;

  void validate_or_throw() const {
    fit.validate_or_throw();
    grid.validate_or_throw();
  }

  static AnalysisSettings defaults() {
    AnalysisSettings s;
    return s;
  }
};

}  // namespace floodfreq
