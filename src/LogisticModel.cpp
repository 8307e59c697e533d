#include "seasonfit/Models.hpp"
#include <cmath>

namespace seasonfit {

Real LogisticModel::ramp(Real x, Real a, Real b) const
{
    return 1.0 / (1.0 + std::exp(-(x - a) * b));
}

/* with e = exp(-(x-a)·b) and s = 1/(1+e):
 *      ∂/∂a = -b·e / (1+e)²       = -b·s·(1-s)
 *      ∂/∂b = -(a-x)·e / (1+e)²   = (x-a)·s·(1-s)
 * The s form stays finite when e overflows.                            */
void LogisticModel::ramp_gradient(Real x, Real a, Real b,
                                  Real& d_a, Real& d_b) const
{
    const Real s  = ramp(x, a, b);
    const Real ds = s * (1.0 - s);
    d_a = -b * ds;
    d_b = (x - a) * ds;
}

} // namespace seasonfit
