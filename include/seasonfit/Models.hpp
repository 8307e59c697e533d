#pragma once
#include "DoubleSigmoidModel.hpp"

namespace seasonfit {

/* R = Φ((x-a)/b), normal CDF ramp centred on a with spread b */
class GaussianModel final : public DoubleSigmoidModel {
public:
    ModelKind kind() const override { return ModelKind::Gaussian; }
protected:
    Real ramp(Real x, Real a, Real b) const override;
    void ramp_gradient(Real x, Real a, Real b,
                       Real& d_a, Real& d_b) const override;
};

/* R = (tanh((x-a)·b) + 1) / 2 */
class HyperbolicTangentModel final : public DoubleSigmoidModel {
public:
    ModelKind kind() const override { return ModelKind::HyperbolicTangent; }
protected:
    Real ramp(Real x, Real a, Real b) const override;
    void ramp_gradient(Real x, Real a, Real b,
                       Real& d_a, Real& d_b) const override;
};

/* R = 1 / (1 + exp(-(x-a)·b)) */
class LogisticModel final : public DoubleSigmoidModel {
public:
    ModelKind kind() const override { return ModelKind::Logistic; }
protected:
    Real ramp(Real x, Real a, Real b) const override;
    void ramp_gradient(Real x, Real a, Real b,
                       Real& d_a, Real& d_b) const override;
};

/* Raised-sine ramp, 0 for x <= a, 1 for x >= b, smooth in between */
class SineModel final : public DoubleSigmoidModel {
public:
    ModelKind kind() const override { return ModelKind::Sine; }
protected:
    Real ramp(Real x, Real a, Real b) const override;
    void ramp_gradient(Real x, Real a, Real b,
                       Real& d_a, Real& d_b) const override;
};

} // namespace seasonfit
