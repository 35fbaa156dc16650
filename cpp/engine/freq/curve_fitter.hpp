// ============================================================================
// Frequency Analysis: P-III Curve Fitting (Nonlinear Least Squares)
// File: curve_fitter.hpp
// ============================================================================
//
// Purpose:
// - Refine product-moment estimates so the P-III quantile curve passes as
//   close as possible (least squares in value space) to the empirical
//   (probability, value) points of a record set.
//
// Objective:
//   min sum_i ( value_from_prob(p_i; ex, cv, cs) - x_i )^2
//   over the free subset selected by FitSettings::mode():
//     MeanCvCs : ex, cv, cs
//     CvCs     : cv, cs          (ex fixed)
//     MeanCv   : ex, cv          (cs = cv * skew_ratio)
//     Cv       : cv              (ex fixed, cs = cv * skew_ratio)
//
// Solver:
// - Eigen's MINPACK port of Levenberg-Marquardt (lmdif) with a forward
//   difference Jacobian. Status codes 1..4 are convergence; anything else
//   throws FitError with the solver diagnostic.
// - Inputs are never mutated; the result is a new set of moments.
//
// ============================================================================

#pragma once

#include "engine/core/settings.hpp"
#include "moments.hpp"
#include "pearson3_curve.hpp"
#include "record_set.hpp"

#include <optional>
#include <string>

namespace floodfreq::freq {

struct FitResult final {
    Moments initial{};
    Moments fitted{};
    FitMode mode = FitMode::MeanCvCs;

    int solver_status = 0;
    std::string solver_status_text;
    long function_evals = 0;
    long iterations = 0;

    // Euclidean norm of the final residual vector (value units).
    double residual_norm = 0.0;

    Pearson3Curve curve() const noexcept { return Pearson3Curve(fitted); }
};

// Text for an Eigen LevenbergMarquardtSpace::Status code.
const char* solver_status_text(int status) noexcept;

// Sum of squared value residuals of a curve against the record set.
double sum_squared_residuals(const RecordSet& records, const Pearson3Curve& curve);

// Fit moments. The initial guess defaults to estimate_moments(records).
FitResult fit_moments(const RecordSet& records,
                      const FitSettings& settings = FitSettings(),
                      std::optional<Moments> initial = std::nullopt);

// Convenience: fitted curve only.
Pearson3Curve fit_curve(const RecordSet& records,
                        const FitSettings& settings = FitSettings(),
                        std::optional<Moments> initial = std::nullopt);

} // namespace floodfreq::freq
