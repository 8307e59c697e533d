#pragma once
#include "Types.hpp"
#include <string>

namespace seasonfit {

/* smallest series the prior estimator and optimizer accept */
constexpr int kMinSamples = 10;

enum class Precision { Single, Double };

// Container for one time-ordered measurement series
struct ObservationSeries {
    Vector               x;          // time (e.g. day of year)
    Vector               y;          // signal (e.g. NDVI)

    /* per-sample weight, same size as x.  0 == ignore the sample in the
     * objective.  Empty means "all ones".                                */
    Vector               w;

    ObservationSeries() = default;
    ObservationSeries(Vector x_, Vector y_, Vector w_ = Vector());

    Eigen::Index size() const { return x.size(); }

    /* weights with the default (all ones) filled in */
    Vector weights() const;

    /* number of samples that carry a positive weight */
    int n_effective() const;

    /* throws InputValidationError on size mismatch, n < kMinSamples,
     * non-finite abscissae, negative / non-finite weights or a
     * non-finite value carrying a positive weight.                      */
    void validate() const;

    /* explicit copy, rounded through float in single precision mode */
    ObservationSeries with_precision(Precision p) const;

    /* copy without sample i (used to compare against zero weights) */
    ObservationSeries without(Eigen::Index i) const;
};

std::string to_string(Precision p);
Precision   precision_from_string(const std::string& s);

} // namespace seasonfit
