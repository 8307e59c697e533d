#include "seasonfit/Models.hpp"
#include <boost/math/constants/constants.hpp>
#include <boost/math/special_functions/erf.hpp>
#include <cmath>

namespace seasonfit {

namespace bmc = boost::math::constants;

/*  R(x) = Φ(z) = erfc(-z/√2) / 2,      z = (x - a) / b
 *
 *  ∂R/∂a = -φ(z) / b
 *  ∂R/∂b = -φ(z) · z / b                                               */

Real GaussianModel::ramp(Real x, Real a, Real b) const
{
    const Real z = (x - a) / b;
    return 0.5 * boost::math::erfc(-z * bmc::one_div_root_two<Real>());
}

void GaussianModel::ramp_gradient(Real x, Real a, Real b,
                                  Real& d_a, Real& d_b) const
{
    const Real z   = (x - a) / b;
    const Real phi = bmc::one_div_root_two_pi<Real>() * std::exp(-0.5 * z * z);
    d_a = -phi / b;
    d_b = -phi * z / b;
}

} // namespace seasonfit
