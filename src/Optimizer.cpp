#include "seasonfit/Optimizer.hpp"
#include "seasonfit/ModelRegistry.hpp"
#include "seasonfit/Chi2Utils.hpp"
#include "seasonfit/Errors.hpp"
#include <algorithm>
#include <iostream>

namespace seasonfit {

std::string to_string(FitStatus s)
{
    switch (s) {
        case FitStatus::Converged:            return "converged";
        case FitStatus::Diverged:             return "diverged";
        case FitStatus::MaxIterationsReached: return "max_iterations_reached";
    }
    throw UnknownSolverStatus("to_string(FitStatus)", static_cast<int>(s));
}

FitStatus fit_status_from_string(const std::string& s)
{
    if (s == "converged")              return FitStatus::Converged;
    if (s == "diverged")               return FitStatus::Diverged;
    if (s == "max_iterations_reached") return FitStatus::MaxIterationsReached;
    throw InputValidationError("unknown fit status '" + s + "'");
}

std::string to_string(DerivativeMode m)
{
    return m == DerivativeMode::Analytic ? "analytic" : "numeric";
}

DerivativeMode derivative_mode_from_string(const std::string& s)
{
    if (s == "analytic") return DerivativeMode::Analytic;
    if (s == "numeric")  return DerivativeMode::Numeric;
    throw InputValidationError("unknown derivative mode '" + s + "'");
}

void validate(const FitOptions& opt)
{
    if (opt.max_iterations < 1)
        throw InputValidationError("fit: max_iterations must be >= 1");
    if (!(opt.tolerance > 0.0))
        throw InputValidationError("fit: tolerance must be positive");
    if (opt.max_damping_steps < 1)
        throw InputValidationError("fit: max_damping_steps must be >= 1");
    if (!opt.fixed.empty() && opt.fixed.size() != kNParams)
        throw InputValidationError(
            "fit: fixed mask has " + std::to_string(opt.fixed.size()) +
            " entries, expected " + std::to_string(kNParams));
}

FitResult fit_series(const ObservationSeries& input,
                     ModelKind                kind,
                     const Vector&            prior,
                     const FitOptions&        opt)
{
    /* ---- everything that can be wrong with the input, up front ------- */
    const DoubleSigmoidModel& model = ModelRegistry::instance().get(kind);
    DoubleSigmoidModel::check_parameters(prior);
    validate(opt);
    input.validate();

    if (!prior.allFinite())
        throw InputValidationError("fit: prior contains non-finite values");

    const ObservationSeries series = input.with_precision(opt.precision);

    FitResult res;
    res.model       = kind;
    res.prior       = prior;
    res.params      = prior;
    res.n_effective = series.n_effective();

    /* free mask is the complement of `fixed` */
    std::vector<bool> free_mask;
    int n_free = kNParams;
    if (!opt.fixed.empty()) {
        free_mask.resize(kNParams);
        for (int j = 0; j < kNParams; ++j) free_mask[j] = !opt.fixed[j];
        n_free = static_cast<int>(std::count(free_mask.begin(), free_mask.end(), true));
    }

    LMSolverOptions lm;
    lm.max_iterations     = opt.max_iterations;
    lm.chi2_tolerance     = opt.tolerance;
    lm.initial_lambda     = opt.initial_lambda;
    lm.max_damping_steps  = opt.max_damping_steps;
    lm.degrees_of_freedom = std::max(1, res.n_effective - n_free);
    lm.verbose            = opt.verbose;

    WeightedResidualFunctor functor(model, series, opt.derivatives);
    LMSolverSummary summ =
        levenberg_marquardt(functor, res.params, free_mask, lm);

    res.iterations   = summ.iterations;
    res.initial_chi2 = summ.initial_chi2;
    res.chi2         = summ.final_chi2;
    res.status       = summ.status;
    res.chi2_history = std::move(summ.chi2_history);
    res.std_error    = standard_error(res.chi2, res.n_effective, n_free);
    res.param_uncertainties =
        Eigen::Map<const Vector>(summ.param_uncertainties.data(),
                                 static_cast<Eigen::Index>(summ.param_uncertainties.size()));

    if (opt.verbose)
        std::cout << "[fit]  " << model_name(kind) << ": "
                  << to_string(res.status) << ", " << res.iterations
                  << " iterations, chi2 " << res.initial_chi2 << " -> "
                  << res.chi2 << '\n';
    return res;
}

} // namespace seasonfit
