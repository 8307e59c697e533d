#include "seasonfit/Models.hpp"
#include <boost/math/constants/constants.hpp>
#include <cmath>

namespace seasonfit {

namespace {

const Real kPi = boost::math::constants::pi<Real>();

/* The ramp is defined piecewise on three disjoint intervals:
 *
 *      x <= a       :  0
 *      a <  x <  b  :  (sin(-π/2 + T) + 1) / 2 ,   T = π (x-a)/(b-a)
 *      x >= b       :  1
 *
 * Inside the window the sine form equals (1 - cos T) / 2.              */
enum class Window { Below, Inside, Above };

Window locate(Real x, Real a, Real b)
{
    if (x <= a) return Window::Below;
    if (x >= b) return Window::Above;
    return Window::Inside;
}

Real phase(Real x, Real a, Real b)
{
    return kPi * (x - a) / (b - a);
}

} // namespace

Real SineModel::ramp(Real x, Real a, Real b) const
{
    switch (locate(x, a, b)) {
        case Window::Below:  return 0.0;
        case Window::Above:  return 1.0;
        case Window::Inside: break;
    }
    return 0.5 * (std::sin(-0.5 * kPi + phase(x, a, b)) + 1.0);
}

/*  inside the window:
 *      ∂/∂a =  π (x-b) sin T / (2 (a-b)²)
 *      ∂/∂b = -π (x-a) sin T / (2 (b-a)²)
 *  and zero on both flat pieces.                                       */
void SineModel::ramp_gradient(Real x, Real a, Real b,
                              Real& d_a, Real& d_b) const
{
    if (locate(x, a, b) != Window::Inside) {
        d_a = 0.0;
        d_b = 0.0;
        return;
    }
    const Real s  = std::sin(phase(x, a, b));
    const Real w2 = 2.0 * (b - a) * (b - a);
    d_a =  kPi * (x - b) * s / w2;
    d_b = -kPi * (x - a) * s / w2;
}

} // namespace seasonfit
