#pragma once
#include "Types.hpp"
#include "ObservationSeries.hpp"
#include "DoubleSigmoidModel.hpp"
#include "LevenbergMarquardt.hpp"
#include "WeightedResidualFunctor.hpp"
#include <vector>

namespace seasonfit {

struct FitOptions {
    int            max_iterations    = 20;
    double         tolerance         = 1e-3;     // absolute |Δχ²|
    Precision      precision         = Precision::Double;
    DerivativeMode derivatives       = DerivativeMode::Analytic;
    double         initial_lambda    = 1e-3;
    int            max_damping_steps = 10;

    /* kNParams flags, true == keep at the prior value.  Empty: all free. */
    std::vector<bool> fixed;

    bool           verbose           = false;    // per-iteration [LM] lines
};

struct FitResult {
    ModelKind           model        = ModelKind::Logistic;
    Vector              params;                  // posterior
    Vector              prior;
    int                 iterations   = 0;
    double              initial_chi2 = 0.0;
    double              chi2         = 0.0;
    double              std_error    = 0.0;
    int                 n_effective  = 0;
    FitStatus           status       = FitStatus::MaxIterationsReached;
    std::vector<double> chi2_history;            // after each accepted step
    Vector              param_uncertainties;     // 1-σ, 0 for fixed

    bool converged() const { return status == FitStatus::Converged; }
};

/* throws InputValidationError on bad iteration counts, tolerances or
 * fixed-mask sizes                                                        */
void validate(const FitOptions& opt);

/*
 * Weighted damped Gauss–Newton fit of one double-S model.
 *
 * Input problems (series, parameter vector, options) are reported as
 * InputValidationError before any evaluation.  Convergence problems are
 * reported through FitResult::status with the best parameters reached.
 */
FitResult fit_series(const ObservationSeries& series,
                     ModelKind                kind,
                     const Vector&            prior,
                     const FitOptions&        opt = {});

} // namespace seasonfit
