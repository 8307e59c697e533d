#pragma once
#include "Types.hpp"
#include "ObservationSeries.hpp"
#include "Optimizer.hpp"
#include "ReportUtils.hpp"
#include <optional>
#include <string>
#include <vector>

namespace seasonfit {

/*
 * Prior estimation followed by the optimizer for one series.
 *
 *     SeasonFitWorkflow wf(series, cfg);
 *     const FitResult& r = wf.run();
 *
 * If cfg.prior is set the estimator is skipped.
 */
class SeasonFitWorkflow {
public:
    struct Config
    {
        ModelKind             model   = ModelKind::Logistic;
        FitOptions            options;
        std::optional<Vector> prior;              // skip the estimator
        bool                  verbose = false;    // [prior] / [fit] lines
    };

    SeasonFitWorkflow(const ObservationSeries& series, const Config& config);

    const FitResult& run();

    const Vector&    prior()  const { return prior_; }
    const FitResult& result() const { return result_; }
    bool             done()   const { return done_; }

    /* posterior curves for an external renderer */
    CurveSamples curves(int n_points = 0) const;

private:
    const ObservationSeries& series_;
    Config                   config_;
    Vector                   prior_;
    FitResult                result_;
    bool                     done_ = false;
};

/* outcome of one series in a batch; error is set instead of result when
 * the series was rejected                                                 */
struct BatchItem {
    std::string              name;
    std::optional<FitResult> result;
    std::string              error;
};

/*  Fits every series independently on a ThreadPool of nthreads workers
 *  (0 → hardware concurrency).  Output order follows the input order.  */
std::vector<BatchItem>
fit_batch(const std::vector<ObservationSeries>& series,
          const std::vector<std::string>&       names,
          const SeasonFitWorkflow::Config&      config,
          unsigned                              nthreads = 0);

} // namespace seasonfit
