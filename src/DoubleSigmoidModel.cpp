#include "seasonfit/DoubleSigmoidModel.hpp"
#include "seasonfit/Errors.hpp"
#include <algorithm>
#include <cmath>

namespace seasonfit {

void DoubleSigmoidModel::check_parameters(const Vector& p)
{
    if (p.size() != kNParams)
        throw InputValidationError(
            "parameter vector has " + std::to_string(p.size()) +
            " entries, expected " + std::to_string(kNParams));
}

ModelEvaluation DoubleSigmoidModel::evaluate(const Vector& x,
                                             const Vector& p) const
{
    check_parameters(p);

    const Eigen::Index n = x.size();
    ModelEvaluation out;
    out.comp1.resize(n);
    out.comp2.resize(n);

    for (Eigen::Index i = 0; i < n; ++i) {
        out.comp1[i] = p[AMP_RISE] * ramp(x[i], p[RISE_A], p[RISE_B]);
        out.comp2[i] = p[AMP_FALL] * ramp(x[i], p[FALL_A], p[FALL_B]);
    }
    out.value = ((out.comp1 + out.comp2).array() + p[BASE]).matrix();
    return out;
}

Vector DoubleSigmoidModel::value(const Vector& x, const Vector& p) const
{
    return evaluate(x, p).value;
}

Matrix DoubleSigmoidModel::jacobian(const Vector& x, const Vector& p) const
{
    if (!has_analytic_jacobian()) return numeric_jacobian(x, p);

    check_parameters(p);

    const Eigen::Index n = x.size();
    Matrix J(n, kNParams);
    for (Eigen::Index i = 0; i < n; ++i) {
        Real d_a = 0.0, d_b = 0.0;

        J(i, BASE) = 1.0;

        J(i, AMP_RISE) = ramp(x[i], p[RISE_A], p[RISE_B]);
        ramp_gradient(x[i], p[RISE_A], p[RISE_B], d_a, d_b);
        J(i, RISE_A) = p[AMP_RISE] * d_a;
        J(i, RISE_B) = p[AMP_RISE] * d_b;

        J(i, AMP_FALL) = ramp(x[i], p[FALL_A], p[FALL_B]);
        ramp_gradient(x[i], p[FALL_A], p[FALL_B], d_a, d_b);
        J(i, FALL_A) = p[AMP_FALL] * d_a;
        J(i, FALL_B) = p[AMP_FALL] * d_b;
    }
    return J;
}

Matrix DoubleSigmoidModel::numeric_jacobian(const Vector& x,
                                            const Vector& p) const
{
    check_parameters(p);

    const double eps = 1e-6;
    Matrix J(x.size(), kNParams);

    for (int j = 0; j < kNParams; ++j) {
        Vector p_plus  = p;
        Vector p_minus = p;

        const double h = eps * std::max(1.0, std::abs(p[j]));
        p_plus[j]  += h;
        p_minus[j] -= h;

        J.col(j) = (value(x, p_plus) - value(x, p_minus)) / (2.0 * h);
    }
    return J;
}

} // namespace seasonfit
