/*
===============================================================================
Frequency Analysis: P-III Curve Fitting (Nonlinear Least Squares)
File: curve_fitter.cpp
===============================================================================
*/

#include "curve_fitter.hpp"

#include "engine/core/logging.hpp"
#include "engine/core/require.hpp"

#include <Eigen/Dense>
#include <unsupported/Eigen/NonLinearOptimization>
#include <unsupported/Eigen/NumericalDiff>

#include <cmath>
#include <sstream>
#include <utility>
#include <vector>

namespace floodfreq::freq {

namespace {

// Residual functor in the shape Eigen::NumericalDiff / LevenbergMarquardt
// expect. Maps the free-parameter vector onto full moments.
struct QuantileResidual {
    typedef double Scalar;
    enum { InputsAtCompileTime = Eigen::Dynamic, ValuesAtCompileTime = Eigen::Dynamic };
    typedef Eigen::VectorXd InputType;
    typedef Eigen::VectorXd ValueType;
    typedef Eigen::MatrixXd JacobianType;

    QuantileResidual(FitMode mode,
                     const Moments& fixed,
                     double skew_ratio,
                     const std::vector<double>& probs,
                     const std::vector<double>& values)
        : mode_(mode), fixed_(fixed), skew_ratio_(skew_ratio), probs_(&probs), values_(&values) {}

    int inputs() const noexcept { return free_parameter_count(mode_); }
    int values() const noexcept { return static_cast<int>(values_->size()); }

    Eigen::VectorXd pack(const Moments& m) const {
        Eigen::VectorXd x(inputs());
        switch (mode_) {
            case FitMode::MeanCvCs: x << m.ex, m.cv, m.cs; break;
            case FitMode::CvCs:     x << m.cv, m.cs; break;
            case FitMode::MeanCv:   x << m.ex, m.cv; break;
            case FitMode::Cv:       x << m.cv; break;
        }
        return x;
    }

    Moments unpack(const Eigen::VectorXd& x) const noexcept {
        switch (mode_) {
            case FitMode::MeanCvCs: return Moments{x[0], x[1], x[2]};
            case FitMode::CvCs:     return Moments{fixed_.ex, x[0], x[1]};
            case FitMode::MeanCv:   return Moments{x[0], x[1], x[1] * skew_ratio_};
            case FitMode::Cv:       return Moments{fixed_.ex, x[0], x[0] * skew_ratio_};
        }
        return fixed_;
    }

    // Negative return aborts the solver (UserAsked): residuals went non-finite.
    int operator()(const Eigen::VectorXd& x, Eigen::VectorXd& fvec) const {
        const Pearson3Curve curve(unpack(x));
        const std::vector<double>& p = *probs_;
        const std::vector<double>& v = *values_;
        bool finite = true;
        for (std::size_t i = 0; i < v.size(); ++i) {
            const double r = curve.value_from_prob(p[i]) - v[i];
            finite = finite && is_finite(r);
            fvec[static_cast<Eigen::Index>(i)] = r;
        }
        return finite ? 0 : -1;
    }

private:
    FitMode mode_;
    Moments fixed_;
    double skew_ratio_;
    const std::vector<double>* probs_;
    const std::vector<double>* values_;
};

bool is_converged(Eigen::LevenbergMarquardtSpace::Status s) noexcept {
    using namespace Eigen::LevenbergMarquardtSpace;
    return s == RelativeReductionTooSmall || s == RelativeErrorTooSmall ||
           s == RelativeErrorAndReductionTooSmall || s == CosinusTooSmall;
}

std::string describe(const Moments& m) {
    std::ostringstream oss;
    oss << "ex=" << m.ex << " cv=" << m.cv << " cs=" << m.cs;
    return oss.str();
}

} // namespace

const char* solver_status_text(int status) noexcept {
    using namespace Eigen::LevenbergMarquardtSpace;
    switch (status) {
        case NotStarted:                        return "solver not started";
        case Running:                           return "solver still running";
        case ImproperInputParameters:           return "improper input parameters (fewer points than free parameters or bad tolerances)";
        case RelativeReductionTooSmall:         return "relative reduction of the sum of squares is at most ftol";
        case RelativeErrorTooSmall:             return "relative error between two iterates is at most xtol";
        case RelativeErrorAndReductionTooSmall: return "both ftol and xtol criteria satisfied";
        case CosinusTooSmall:                   return "residuals orthogonal to the Jacobian columns within gtol";
        case TooManyFunctionEvaluation:         return "maximum number of function evaluations reached";
        case FtolTooSmall:                      return "ftol too small; no further reduction possible";
        case XtolTooSmall:                      return "xtol too small; no further improvement possible";
        case GtolTooSmall:                      return "gtol too small; residuals already orthogonal to machine precision";
        case UserAsked:                         return "residuals became non-finite";
        default:                                return "unknown solver status";
    }
}

double sum_squared_residuals(const RecordSet& records, const Pearson3Curve& curve) {
    const std::vector<double> p = records.empirical_probabilities();
    const std::vector<double>& v = records.values();
    double ssr = 0.0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        const double r = curve.value_from_prob(p[i]) - v[i];
        ssr += r * r;
    }
    return ssr;
}

FitResult fit_moments(const RecordSet& records,
                      const FitSettings& settings,
                      std::optional<Moments> initial) {
    settings.validate_or_throw();

    FitResult out;
    out.mode = settings.mode();
    out.initial = initial ? *initial : estimate_moments(records);
    FLOODFREQ_REQUIRE(out.initial.finite(), ValidationError, "initial moments must be finite");

    const std::vector<double> probs = records.empirical_probabilities();
    const std::vector<double>& values = records.values();
    const double ratio = settings.skew_ratio.value_or(0.0);

    QuantileResidual residual(out.mode, out.initial, ratio, probs, values);
    Eigen::NumericalDiff<QuantileResidual> numdiff(residual, settings.solver.epsfcn);
    Eigen::LevenbergMarquardt<Eigen::NumericalDiff<QuantileResidual>, double> lm(numdiff);

    const int n_free = free_parameter_count(out.mode);
    lm.parameters.maxfev = settings.solver.effective_max_function_evals(n_free);
    lm.parameters.ftol = settings.solver.ftol;
    lm.parameters.xtol = settings.solver.xtol;
    lm.parameters.gtol = settings.solver.gtol;
    lm.parameters.epsfcn = settings.solver.epsfcn;
    lm.parameters.factor = settings.solver.step_bound_factor;

    {
        std::ostringstream oss;
        oss << "fitting mode=" << to_string(out.mode) << " points=" << values.size()
            << " initial " << describe(out.initial);
        log(LogLevel::DEBUG, "CurveFitter", oss.str());
    }

    // minimize() does not stop on a UserAsked from its first evaluation.
    Eigen::VectorXd x = residual.pack(out.initial);
    Eigen::LevenbergMarquardtSpace::Status status = lm.minimizeInit(x);
    if (status == Eigen::LevenbergMarquardtSpace::NotStarted) {
        do {
            status = lm.minimizeOneStep(x);
        } while (status == Eigen::LevenbergMarquardtSpace::Running);
    }

    out.solver_status = static_cast<int>(status);
    out.solver_status_text = solver_status_text(out.solver_status);
    out.function_evals = static_cast<long>(lm.nfev);
    out.iterations = static_cast<long>(lm.iter);
    out.fitted = residual.unpack(x);

    if (!is_converged(status) || !out.fitted.finite()) {
        std::ostringstream oss;
        oss << "fit_moments: least squares did not converge (status " << out.solver_status
            << ": " << out.solver_status_text << ", nfev=" << out.function_evals
            << ") last " << describe(out.fitted);
        log(LogLevel::ERROR, "CurveFitter", oss.str());
        throw FitError(oss.str(), out.solver_status, out.solver_status_text, out.function_evals);
    }

    out.residual_norm = std::sqrt(sum_squared_residuals(records, out.curve()));

    {
        std::ostringstream oss;
        oss << "converged (" << out.solver_status_text << ") nfev=" << out.function_evals
            << " fitted " << describe(out.fitted) << " residual_norm=" << out.residual_norm;
        log(LogLevel::INFO, "CurveFitter", oss.str());
    }
    return out;
}

Pearson3Curve fit_curve(const RecordSet& records,
                        const FitSettings& settings,
                        std::optional<Moments> initial) {
    return fit_moments(records, settings, std::move(initial)).curve();
}

} // namespace floodfreq::freq
