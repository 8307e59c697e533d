#pragma once
#include "Types.hpp"
#include <string>

namespace seasonfit {

enum class ModelKind {
    Gaussian,
    HyperbolicTangent,
    Logistic,
    Sine
};

/* value = p0 + comp1 + comp2, all evaluated on the same abscissae */
struct ModelEvaluation {
    Vector value;
    Vector comp1;      // rising component, 0 … p1
    Vector comp2;      // falling component, 0 … p4
};

/*
 * Common part of the four double-S models.
 *
 *      f(x) = p0 + p1 · R(x; p2, p3) + p4 · R(x; p5, p6)
 *
 * A concrete model only supplies the unit ramp R (0 … 1) and its two
 * partial derivatives; evaluation over a whole series and assembly of
 * the n × 7 Jacobian live here.
 */
class DoubleSigmoidModel {
public:
    virtual ~DoubleSigmoidModel() = default;

    virtual ModelKind kind() const = 0;

    /* false → callers must use numeric_jacobian() */
    virtual bool has_analytic_jacobian() const { return true; }

    ModelEvaluation evaluate(const Vector& x, const Vector& p) const;
    Vector          value   (const Vector& x, const Vector& p) const;

    /* analytic if available, otherwise finite differences */
    Matrix jacobian(const Vector& x, const Vector& p) const;

    /* central differences of value(), one column per parameter */
    Matrix numeric_jacobian(const Vector& x, const Vector& p) const;

    /* throws InputValidationError unless p has kNParams entries */
    static void check_parameters(const Vector& p);

protected:
    virtual Real ramp(Real x, Real a, Real b) const = 0;

    /* ∂R/∂a and ∂R/∂b at x */
    virtual void ramp_gradient(Real x, Real a, Real b,
                               Real& d_a, Real& d_b) const = 0;
};

} // namespace seasonfit
