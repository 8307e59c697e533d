#pragma once
#include "seasonfit/ModelRegistry.hpp"
#include "seasonfit/ObservationSeries.hpp"
#include <initializer_list>

namespace seasonfit {
namespace test {

inline Vector params(std::initializer_list<double> v)
{
    Vector p(static_cast<Eigen::Index>(v.size()));
    Eigen::Index i = 0;
    for (double d : v) p[i++] = d;
    return p;
}

/* noiseless samples of `kind` on x */
inline ObservationSeries synthetic(ModelKind kind, const Vector& p, const Vector& x)
{
    ObservationSeries s;
    s.x = x;
    s.y = ModelRegistry::instance().get(kind).value(x, p);
    return s;
}

/* fixed zero-mean noise realisation, rms ≈ 0.047, alternating in sign so
 * that it is close to orthogonal to any smooth model column             */
inline Vector noise20()
{
    return params({ 0.04, -0.06,  0.03, -0.05,  0.02, -0.04,  0.05, -0.03,
                    0.06, -0.07,  0.05, -0.06,  0.03, -0.04,  0.05, -0.02,
                    0.06, -0.05,  0.04, -0.03 });
}

/* 20 samples, x = 0 … 19, two logistic transitions plus noise20() */
inline ObservationSeries noisy_logistic(const Vector& truth)
{
    ObservationSeries s = synthetic(ModelKind::Logistic, truth,
                                    Vector::LinSpaced(20, 0.0, 19.0));
    s.y += noise20();
    return s;
}

} // namespace test
} // namespace seasonfit
