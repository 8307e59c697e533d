#pragma once
#include "Types.hpp"
#include "Optimizer.hpp"
#include "FitConfig.hpp"
#include <iosfwd>
#include <string>

namespace seasonfit {

/* --------------------------------------------------------------------- */
/*      numbers an external renderer needs to draw one fit diagram       */
/* --------------------------------------------------------------------- */
struct CurveSamples {
    Vector  x;                  // abscissae of the curves
    Vector  comp1;              // rising component
    Vector  comp2;              // falling component
    Vector  model;              // p0 + comp1 + comp2
    Vector  raw_x, raw_y;       // optional data points (may be empty)
    int     iterations = 0;
    double  chi2       = 0.0;
};

/*  Curves of the posterior in `res` on n_points evenly spaced abscissae
 *  covering the series (n_points <= 0: on the series abscissae).        */
CurveSamples sample_curves(const FitResult&         res,
                           const ObservationSeries& series,
                           int                      n_points = 0);

/* x comp1 comp2 model, one row per abscissa */
void write_curve_table(const std::string& path, const CurveSamples& c);

/* one human readable line */
void print_summary(std::ostream& os, const std::string& name, const FitResult& r);

/*  Writes <stem>_fit.json and/or <stem>_curves.dat below out.directory
 *  (created on demand).                                                 */
void write_results(const OutputConfig&      out,
                   const std::string&       stem,
                   const FitResult&         res,
                   const ObservationSeries& series);

} // namespace seasonfit
