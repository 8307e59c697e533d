#include "seasonfit/PriorEstimator.hpp"
#include "seasonfit/ModelRegistry.hpp"
#include "seasonfit/Errors.hpp"
#include <cmath>

namespace seasonfit {
namespace {

double range_mean(const Vector& y, Eigen::Index first, Eigen::Index last)
{
    return y.segment(first, last - first + 1).mean();
}

/* slope magnitude between two samples */
double edge_slope(const Vector& x, const Vector& y,
                  Eigen::Index lo, Eigen::Index hi)
{
    return std::abs(y[hi] - y[lo]) / (x[hi] - x[lo]);
}

void require_known(ModelKind kind)
{
    switch (kind) {
        case ModelKind::Gaussian:
        case ModelKind::HyperbolicTangent:
        case ModelKind::Logistic:
        case ModelKind::Sine:
            return;
    }
    throw InputValidationError("prior: unknown model id " +
                               std::to_string(static_cast<int>(kind)));
}

} // namespace

SeasonSegmentation segment_season(const Vector& x, const Vector& y)
{
    if (x.size() != y.size())
        throw InputValidationError("prior: x and y differ in length");
    if (x.size() < kMinSamples)
        throw InputValidationError("prior: series too short");
    if (!x.allFinite() || !y.allFinite())
        throw InputValidationError("prior: series contains non-finite values");

    const Eigen::Index n = x.size();
    SeasonSegmentation s;

    /* ---------------- 1. level statistics ----------------------------- */
    s.min_y    = y.minCoeff();
    s.max_y    = y.maxCoeff();
    s.midpoint = (s.max_y - s.min_y) / 2.0;      // half the range, on purpose

    /* ---------------- 2. growing season ------------------------------- */
    for (Eigen::Index i = 0; i < n; ++i) {
        if (y[i] >= s.midpoint) {
            if (s.during_first < 0) s.during_first = i;
            s.during_last = i;
        }
    }
    if (s.during_first < 0)
        throw InputValidationError("prior: no sample reaches the season midpoint");

    /* ---------------- 3. pre- / post-season --------------------------- */
    const double x_start = x[s.during_first];
    const double x_end   = x[s.during_last];
    for (Eigen::Index i = 0; i < n; ++i) {
        if (y[i] > s.midpoint) continue;
        if (x[i] < x_start) {
            if (s.before_first < 0) s.before_first = i;
            s.before_last = i;
        }
        if (x[i] > x_end) {
            if (s.after_first < 0) s.after_first = i;
            s.after_last = i;
        }
    }
    if (!s.has_before() && !s.has_after())
        throw InputValidationError(
            "prior: series has neither pre- nor post-season samples");

    /* ---------------- 4. peak inside the season ----------------------- */
    for (Eigen::Index i = s.during_first; i <= s.during_last; ++i) {
        if (y[i] >= s.midpoint && y[i] == s.max_y) {
            if (s.peak_first < 0) s.peak_first = i;
            s.peak_last = i;
        }
    }

    /* ---------------- 5. plateau levels ------------------------------- */
    /* a season cut off by the series end has no edge there */
    s.mean_during = range_mean(y, s.during_first, s.during_last);
    s.mean_before = s.has_before() ? range_mean(y, s.before_first, s.before_last)
                                   : s.mean_during;
    s.mean_after  = s.has_after()  ? range_mean(y, s.after_first,  s.after_last)
                                   : s.mean_during;

    return s;
}

Vector estimate_prior(const Vector& x, const Vector& y, ModelKind kind)
{
    require_known(kind);
    const SeasonSegmentation s = segment_season(x, y);

    Vector p(kNParams);
    p[BASE]     = s.mean_before;
    p[AMP_RISE] = s.mean_during - s.mean_before;
    p[AMP_FALL] = s.mean_after  - s.mean_during;

    /* a missing edge is anchored on the outermost season sample */
    const Eigen::Index fd = s.during_first;
    const Eigen::Index ld = s.during_last;
    const Eigen::Index lb = s.has_before() ? s.before_last : fd;
    const Eigen::Index fa = s.has_after()  ? s.after_first : ld;

    switch (kind) {
        case ModelKind::Gaussian: {
            const double rise = (x[s.peak_first] - x[lb]) / 3.0;
            const double fall = (x[fa] - x[s.peak_last]) / 3.0;
            p[RISE_A] = x[fd];
            p[RISE_B] = s.has_before() ? rise : fall;
            p[FALL_A] = x[ld];
            p[FALL_B] = s.has_after()  ? fall : rise;
            break;
        }

        case ModelKind::HyperbolicTangent:
        case ModelKind::Logistic: {
            /* logistic steepness is twice the tanh one for the same edge */
            const double k    = (kind == ModelKind::Logistic) ? 2.0 : 1.0;
            const double rise = s.has_before() ? edge_slope(x, y, lb, fd) : 0.0;
            const double fall = s.has_after()  ? edge_slope(x, y, ld, fa) : 0.0;
            p[RISE_A] = 0.5 * (x[lb] + x[fd]);
            p[RISE_B] = k * (s.has_before() ? rise : fall);
            p[FALL_A] = 0.5 * (x[ld] + x[fa]);
            p[FALL_B] = k * (s.has_after()  ? fall : rise);
            break;
        }

        case ModelKind::Sine:
            p[RISE_A] = x[lb];
            p[RISE_B] = x[s.peak_first];
            p[FALL_A] = x[s.peak_last];
            p[FALL_B] = x[fa];
            break;
    }
    return p;
}

Vector estimate_prior(const ObservationSeries& series, ModelKind kind)
{
    require_known(kind);
    series.validate();
    return estimate_prior(series.x, series.y, kind);
}

Vector estimate_prior(const ObservationSeries& series,
                      const std::string&       model)
{
    return estimate_prior(series, model_kind_from_string(model));
}

} // namespace seasonfit
