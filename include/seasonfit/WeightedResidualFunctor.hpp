// WeightedResidualFunctor.hpp

#pragma once
#include <Eigen/Core>
#include "DoubleSigmoidModel.hpp"
#include "ObservationSeries.hpp"
#include <string>

namespace seasonfit {

enum class DerivativeMode { Analytic, Numeric };

std::string    to_string(DerivativeMode m);
DerivativeMode derivative_mode_from_string(const std::string& s);

/*
 *  Residual functor consumed by levenberg_marquardt():
 *
 *      r_i = √w_i · (y_i − f(x_i; p)),         J = ∂r/∂p = −√w · ∂f/∂p
 *
 *  so that |r|² is the weighted χ².  Samples with w_i = 0 get a zero row
 *  in both r and J whatever their y value is.
 */
class WeightedResidualFunctor {
private:
    const DoubleSigmoidModel& model;
    const Vector&             x;
    const Vector&             y;
    Vector                    sqrt_w;
    DerivativeMode            mode;

public:
    WeightedResidualFunctor(const DoubleSigmoidModel& m,
                            const ObservationSeries&  series,
                            DerivativeMode            derivatives)
        : model(m)
        , x(series.x)
        , y(series.y)
        , sqrt_w(series.weights().cwiseSqrt())
        , mode(derivatives)
    {}

    void operator()(const Vector& params,
                    Vector*       residuals,
                    Matrix*       jacobian) const
    {
        const Eigen::Index n = x.size();

        if (residuals) {
            const Vector f = model.value(x, params);
            residuals->resize(n);
            for (Eigen::Index i = 0; i < n; ++i)
                (*residuals)[i] = sqrt_w[i] > 0.0 ? sqrt_w[i] * (y[i] - f[i])
                                                  : 0.0;
        }

        if (jacobian) {
            *jacobian = (mode == DerivativeMode::Analytic)
                            ? model.jacobian(x, params)
                            : model.numeric_jacobian(x, params);
            for (Eigen::Index i = 0; i < n; ++i) {
                if (sqrt_w[i] > 0.0) jacobian->row(i) *= -sqrt_w[i];
                else                 jacobian->row(i).setZero();
            }
        }
    }
};

} // namespace seasonfit
