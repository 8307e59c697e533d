#include "seasonfit/SeasonFitWorkflow.hpp"
#include "seasonfit/PriorEstimator.hpp"
#include "seasonfit/ModelRegistry.hpp"
#include "seasonfit/ThreadPool.hpp"
#include "seasonfit/Errors.hpp"
#include <future>
#include <iostream>
#include <thread>

namespace seasonfit {

SeasonFitWorkflow::SeasonFitWorkflow(const ObservationSeries& series,
                                     const Config&            config)
    : series_(series)
    , config_(config)
{}

const FitResult& SeasonFitWorkflow::run()
{
    /* ---- a) starting point -------------------------------------------- */
    if (config_.prior) {
        prior_ = *config_.prior;
    } else {
        prior_ = estimate_prior(series_, config_.model);
        if (config_.verbose) {
            std::cout << "[prior]  " << model_name(config_.model) << ": ";
            for (Eigen::Index j = 0; j < prior_.size(); ++j)
                std::cout << (j ? ", " : "") << prior_[j];
            std::cout << '\n';
        }
    }

    /* ---- b) refinement ------------------------------------------------- */
    result_ = fit_series(series_, config_.model, prior_, config_.options);
    done_   = true;

    if (config_.verbose && !result_.converged())
        std::cout << "[fit]  Warning: " << to_string(result_.status)
                  << " – consider another prior, a laxer tolerance or more iterations\n";
    return result_;
}

CurveSamples SeasonFitWorkflow::curves(int n_points) const
{
    if (!done_)
        throw std::logic_error("SeasonFitWorkflow::curves() before run()");
    return sample_curves(result_, series_, n_points);
}

std::vector<BatchItem>
fit_batch(const std::vector<ObservationSeries>& series,
          const std::vector<std::string>&       names,
          const SeasonFitWorkflow::Config&      config,
          unsigned                              nthreads)
{
    if (!names.empty() && names.size() != series.size())
        throw InputValidationError("fit_batch: one name per series expected");

    if (nthreads == 0) nthreads = std::thread::hardware_concurrency();

    std::vector<std::future<FitResult>> futures;
    futures.reserve(series.size());
    {
        ThreadPool pool(nthreads);
        for (const auto& s : series) {
            futures.push_back(pool.submit([&s, &config]() {
                SeasonFitWorkflow wf(s, config);
                return wf.run();
            }));
        }
    }   // pool drains and joins here

    std::vector<BatchItem> out(series.size());
    for (std::size_t i = 0; i < series.size(); ++i) {
        out[i].name = names.empty() ? "series_" + std::to_string(i) : names[i];
        try {
            out[i].result = futures[i].get();
        } catch (const InputValidationError& e) {
            out[i].error = e.what();
            std::cerr << "[batch]  " << out[i].name << " rejected: " << e.what() << '\n';
        }
    }
    return out;
}

} // namespace seasonfit
