#include "seasonfit/Models.hpp"
#include <cmath>

namespace seasonfit {

Real HyperbolicTangentModel::ramp(Real x, Real a, Real b) const
{
    return 0.5 * (std::tanh((x - a) * b) + 1.0);
}

/* with c = cosh((x-a)·b):   ∂/∂a = -b / 2c²,   ∂/∂b = (x-a) / 2c² */
void HyperbolicTangentModel::ramp_gradient(Real x, Real a, Real b,
                                           Real& d_a, Real& d_b) const
{
    const Real c  = std::cosh((x - a) * b);
    const Real c2 = 2.0 * c * c;
    d_a = -b / c2;
    d_b = (x - a) / c2;
}

} // namespace seasonfit
