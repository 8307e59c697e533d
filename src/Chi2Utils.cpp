#include "seasonfit/Chi2Utils.hpp"
#include "seasonfit/Errors.hpp"
#include <algorithm>
#include <cmath>

namespace seasonfit {

double weighted_chi2(const Vector& y,
                     const Vector& f,
                     const Vector& w)
{
    if (y.size() != f.size() || (w.size() != 0 && w.size() != y.size()))
        throw InputValidationError("weighted_chi2: size mismatch");

    double chi2 = 0.0;
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        const double wi = (w.size() == 0) ? 1.0 : w[i];
        if (wi <= 0.0) continue;
        const double d = y[i] - f[i];
        chi2 += wi * d * d;
    }
    return chi2;
}

double standard_error(double chi2, int n_effective, int n_free)
{
    const int dof = std::max(1, n_effective - n_free);
    return std::sqrt(chi2 / dof);
}

} // namespace seasonfit
