#pragma once
#include "Types.hpp"
#include "ObservationSeries.hpp"
#include "DoubleSigmoidModel.hpp"
#include <string>

namespace seasonfit {

/*
 * Split of a series into pre-season / growing season / post-season.
 *
 * All indices are positions in the input arrays.  Means are taken over
 * the *contiguous* index range first … last of each partition, so an
 * interior sample failing the partition test still enters the mean.
 */
struct SeasonSegmentation {
    double       min_y       = 0.0;
    double       max_y       = 0.0;
    double       midpoint    = 0.0;   // (max_y - min_y) / 2

    Eigen::Index before_first = -1, before_last = -1;
    Eigen::Index during_first = -1, during_last = -1;
    Eigen::Index peak_first   = -1, peak_last   = -1;   // max y in season
    Eigen::Index after_first  = -1, after_last  = -1;

    /* an empty pre- or post-season takes the growing-season mean */
    double       mean_before = 0.0;
    double       mean_during = 0.0;
    double       mean_after  = 0.0;

    bool has_before() const { return before_first >= 0; }
    bool has_after()  const { return after_first  >= 0; }
};

/* throws InputValidationError if no sample reaches the midpoint or if
 * both the pre- and the post-season are empty                          */
SeasonSegmentation segment_season(const Vector& x, const Vector& y);

/* heuristic 7-parameter starting point for the optimizer */
Vector estimate_prior(const Vector& x, const Vector& y, ModelKind kind);
Vector estimate_prior(const ObservationSeries& series, ModelKind kind);

/* the model name is resolved before the data are looked at */
Vector estimate_prior(const ObservationSeries& series,
                      const std::string&       model);

} // namespace seasonfit
