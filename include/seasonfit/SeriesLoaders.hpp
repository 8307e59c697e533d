// SeriesLoaders.hpp
#pragma once
#include "seasonfit/ObservationSeries.hpp"
#include <string>

namespace seasonfit {

/*  Whitespace separated ASCII table, one sample per line:
 *
 *      x  y        (unit weights)
 *      x  y  w
 *
 *  Lines starting with '#' and blank lines are skipped, rows are sorted
 *  by x.  The column count is taken from the first data row.           */
ObservationSeries load_series_ascii(const std::string& path);

void write_series_ascii(const std::string&       path,
                        const ObservationSeries& series,
                        const std::string&       header = "");

} // namespace seasonfit
