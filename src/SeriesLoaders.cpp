#include "seasonfit/SeriesLoaders.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace seasonfit {
namespace {

// ----------------------------------------------------------------------------
//  Read an ASCII table with 2 or 3 columns of doubles, skip comment lines
// ----------------------------------------------------------------------------
std::vector<std::array<double, 3>>
read_ascii_table(const std::string& path,
                 int&               ncols,
                 char               comment_char = '#')
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open '" + path + "'");

    ncols = 0;
    std::vector<std::array<double,3>> rows;
    std::string line;
    while (std::getline(in, line))
    {
        auto it = std::find_if_not(line.begin(), line.end(),
                                   [](unsigned char c) { return std::isspace(c); });
        if (it == line.end()) continue;           // blank line
        if (*it == comment_char) continue;        // comment

        std::istringstream ss(line);
        std::vector<double> values;
        double v;
        while (ss >> v) values.push_back(v);

        if (values.size() < 2) continue;
        if (ncols == 0) ncols = values.size() >= 3 ? 3 : 2;

        std::array<double,3> row{values[0], values[1], 1.0};
        if (ncols == 3) {
            if (values.size() < 3)
                throw std::runtime_error("File '" + path +
                                         "': missing weight column in '" + line + "'");
            row[2] = values[2];
        }
        rows.push_back(row);
    }
    if (rows.empty())
        throw std::runtime_error("File '" + path + "' contains no valid data");

    return rows;
}

} // namespace

ObservationSeries load_series_ascii(const std::string& path)
{
    int ncols = 0;
    const auto rows = read_ascii_table(path, ncols);

    const std::size_t n = rows.size();
    std::vector<std::size_t> idx(n);
    std::iota(idx.begin(), idx.end(), 0);
    std::stable_sort(idx.begin(), idx.end(),
                     [&](std::size_t i, std::size_t j)
                     { return rows[i][0] < rows[j][0]; });

    ObservationSeries s;
    s.x.resize(n);
    s.y.resize(n);
    if (ncols == 3) s.w.resize(n);

    for (std::size_t k = 0; k < n; ++k) {
        const auto& r = rows[idx[k]];
        s.x[k] = r[0];
        s.y[k] = r[1];
        if (ncols == 3) s.w[k] = r[2];
    }
    return s;
}

void write_series_ascii(const std::string&       path,
                        const ObservationSeries& series,
                        const std::string&       header)
{
    std::ofstream out(path);
    if (!out)
        throw std::runtime_error("Cannot write '" + path + "'");

    if (!header.empty()) out << "# " << header << '\n';
    out << "# x y w\n";

    const Vector w = series.weights();
    out << std::setprecision(10);
    for (Eigen::Index i = 0; i < series.size(); ++i)
        out << series.x[i] << ' ' << series.y[i] << ' ' << w[i] << '\n';
}

} // namespace seasonfit
