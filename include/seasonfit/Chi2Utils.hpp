#pragma once
#include "Types.hpp"

namespace seasonfit {

/*  χ² = Σ w_i (y_i − f_i)²  over the samples with w_i > 0.  An empty
 *  weight vector means unit weights.                                    */
double weighted_chi2(const Vector& y,
                     const Vector& model,
                     const Vector& w);

/*  Weighted RMS residual   √( χ² / max(1, n_eff − n_free) ).           */
double standard_error(double chi2,
                      int    n_effective,
                      int    n_free = kNParams);

} // namespace seasonfit
